#ifndef FORMDATA_TRAVERSABLE_HPP
#define FORMDATA_TRAVERSABLE_HPP

#include <any>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <formdata/export.hpp>
#include <formdata/enums.hpp>

namespace formdata
{
    // Arbitrary caller supplied context, handed to the traversal layer untouched.
    using user_info_type = std::map<std::string, std::any>;

    // Payload of a value without further structure.
    struct FORMDATA_API Leaf
    {
        std::string bytes;
        // File-typed values get Content-Type and filename in their part headers.
        bool is_file = false;
        std::optional<std::string> content_type;
        std::optional<std::string> filename;

        static Leaf text(std::string value);
        static Leaf blob(std::string bytes);
        static Leaf file(std::string bytes,
                         std::optional<std::string> content_type = std::nullopt,
                         std::optional<std::string> filename = std::nullopt);

        [[nodiscard]] friend bool operator==(const Leaf& left, const Leaf& right)
        {
            return left.bytes == right.bytes && left.is_file == right.is_file
                   && left.content_type == right.content_type && left.filename == right.filename;
        }
        [[nodiscard]] friend bool operator!=(const Leaf& left, const Leaf& right)
        {
            return !(left == right);
        }
    };

    // Read-only view passed to every Traversable accessor.
    struct TraversalContext
    {
        const user_info_type& user_info;
        // Composite key of the value being visited, empty for the root.
        std::string_view coding_path;
    };

    // Shape discovery for values to encode.
    //
    // Implementations report fields and elements in a stable order and may throw
    // (anything derived from std::exception) when a value cannot be inspected; the
    // encoder reports such exceptions as ErrorCode::kTRAVERSAL_FAILURE.
    // Accessors which do not match `shape()` throw std::logic_error by default.
    class FORMDATA_API Traversable
    {
    public:
        // Return false to stop the iteration.
        using field_visitor_t = std::function<bool(std::string_view, const Traversable&)>;
        using element_visitor_t = std::function<bool(const Traversable&)>;

        virtual ~Traversable() = default;

        virtual Shape shape(const TraversalContext& ctx) const = 0;

        virtual void for_each_field(const TraversalContext& ctx,
                                    const field_visitor_t& visitor) const;
        virtual void for_each_element(const TraversalContext& ctx,
                                      const element_visitor_t& visitor) const;
        virtual Leaf leaf(const TraversalContext& ctx) const;

    protected:
        Traversable() = default;
        Traversable(const Traversable&) = default;
        Traversable& operator=(const Traversable&) = default;
        Traversable(Traversable&&) = default;
        Traversable& operator=(Traversable&&) = default;
    };
}

#endif
