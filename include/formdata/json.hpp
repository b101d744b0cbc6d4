#ifndef FORMDATA_JSON_HPP
#define FORMDATA_JSON_HPP

#include <string>

#include <nlohmann/json.hpp>

#include <formdata/traversable.hpp>

namespace formdata
{
    // Traversable view over a nlohmann::json document (not owned).
    //
    // Objects are records in the document's own key order (sorted for nlohmann::json,
    // insertion order for nlohmann::ordered_json), arrays are sequences, null is absent.
    // Strings are written verbatim, numbers and booleans as their JSON text and
    // binary values as file parts.
    template <class BasicJson>
    class basic_json_traversable : public Traversable
    {
    public:
        explicit basic_json_traversable(const BasicJson& document)
            : m_document(document)
        {
        }

        Shape shape(const TraversalContext&) const override
        {
            if (m_document.is_null())
                return Shape::kABSENT;
            if (m_document.is_object())
                return Shape::kRECORD;
            if (m_document.is_array())
                return Shape::kSEQUENCE;
            return Shape::kLEAF;
        }

        void for_each_field(const TraversalContext& ctx,
                            const field_visitor_t& visitor) const override
        {
            if (!m_document.is_object())
                return Traversable::for_each_field(ctx, visitor);

            for (const auto& [key, child] : m_document.items())
            {
                basic_json_traversable child_view(child);
                if (!visitor(key, child_view))
                    break;
            }
        }

        void for_each_element(const TraversalContext& ctx,
                              const element_visitor_t& visitor) const override
        {
            if (!m_document.is_array())
                return Traversable::for_each_element(ctx, visitor);

            for (const auto& child : m_document)
            {
                basic_json_traversable child_view(child);
                if (!visitor(child_view))
                    break;
            }
        }

        Leaf leaf(const TraversalContext& ctx) const override
        {
            if (m_document.is_string())
                return Leaf::text(m_document.template get<std::string>());
            if (m_document.is_binary())
            {
                const auto& binary = m_document.get_binary();
                return Leaf::file(std::string(binary.begin(), binary.end()));
            }
            if (m_document.is_primitive() && !m_document.is_null())
                return Leaf::text(m_document.dump());
            return Traversable::leaf(ctx);
        }

    private:
        const BasicJson& m_document;
    };

    using json_traversable = basic_json_traversable<nlohmann::json>;
    using ordered_json_traversable = basic_json_traversable<nlohmann::ordered_json>;
}

#endif
