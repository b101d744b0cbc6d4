#ifndef FORMDATA_PART_BUILDER_HPP
#define FORMDATA_PART_BUILDER_HPP

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <tl/expected.hpp>

#include <formdata/errors.hpp>
#include <formdata/part.hpp>
#include <formdata/traversable.hpp>

namespace formdata
{
    struct EncoderOptions;

    namespace details
    {
        struct Storage;

        using keyed_storage = std::vector<std::pair<std::string, Storage>>;
        using unkeyed_storage = std::vector<Storage>;

        // Intermediate tree of one encoded value: nothing (absent or empty container),
        // a single leaf, named children or indexed children.
        struct Storage
        {
            std::variant<std::monostate, Leaf, keyed_storage, unkeyed_storage> data;
        };

        class PartBuilder
        {
        public:
            PartBuilder(const user_info_type& user_info, const EncoderOptions& options);

            // Walks `root` depth-first. The root must be a record.
            tl::expected<Storage, EncodingError> build(const Traversable& root) const;

            // Flattens a built tree, children named after their parent path.
            std::vector<NamedPart> flatten(Storage storage) const;

        private:
            const user_info_type& m_user_info;
            const EncoderOptions& m_options;

            tl::expected<Storage, EncodingError> visit(const Traversable& value,
                                                       const std::string& path) const;
            tl::expected<Storage, EncodingError> visit_record(const Traversable& value,
                                                              const std::string& path) const;
            tl::expected<Storage, EncodingError> visit_sequence(const Traversable& value,
                                                                const std::string& path) const;

            void flatten_into(Storage& storage,
                              const std::string& path,
                              std::vector<NamedPart>& parts) const;
            NamedPart make_part(Leaf leaf, const std::string& path) const;
        };
    }
}

#endif
