#include <exception>
#include <optional>

#include <spdlog/spdlog.h>

#include <formdata/encoder.hpp>
#include <formdata/utils.hpp>

#include "./part_builder.hpp"

namespace formdata
{
    namespace details
    {
        namespace
        {
            std::string_view shape_name(Shape shape) noexcept
            {
                switch (shape)
                {
                    case Shape::kABSENT:
                        return "an absent value";
                    case Shape::kLEAF:
                        return "a leaf";
                    case Shape::kRECORD:
                        return "a record";
                    case Shape::kSEQUENCE:
                        return "a sequence";
                }
                return "an unknown shape";
            }

            EncodingError traversal_failure(const std::exception& e, const std::string& path)
            {
                return EncodingError{
                    ErrorCode::kTRAVERSAL_FAILURE, e.what(), path, std::current_exception()
                };
            }
        }

        PartBuilder::PartBuilder(const user_info_type& user_info, const EncoderOptions& options)
            : m_user_info(user_info)
            , m_options(options)
        {
        }

        tl::expected<Storage, EncodingError> PartBuilder::build(const Traversable& root) const
        {
            const TraversalContext ctx{ m_user_info, {} };
            Shape shape;
            try
            {
                shape = root.shape(ctx);
            }
            catch (const std::exception& e)
            {
                return tl::unexpected(traversal_failure(e, {}));
            }

            if (shape != Shape::kRECORD)
            {
                return tl::unexpected(EncodingError{
                    ErrorCode::kROOT_NOT_KEYED,
                    fmt::format("top-level value must be a record, got {}", shape_name(shape)),
                    {},
                    nullptr });
            }
            return visit_record(root, {});
        }

        tl::expected<Storage, EncodingError> PartBuilder::visit(const Traversable& value,
                                                                const std::string& path) const
        {
            const TraversalContext ctx{ m_user_info, path };
            Shape shape;
            try
            {
                shape = value.shape(ctx);
                if (shape == Shape::kLEAF)
                    return Storage{ value.leaf(ctx) };
            }
            catch (const std::exception& e)
            {
                return tl::unexpected(traversal_failure(e, path));
            }

            switch (shape)
            {
                case Shape::kRECORD:
                    return visit_record(value, path);
                case Shape::kSEQUENCE:
                    return visit_sequence(value, path);
                default:
                    return Storage{};
            }
        }

        tl::expected<Storage, EncodingError> PartBuilder::visit_record(
            const Traversable& value, const std::string& path) const
        {
            const TraversalContext ctx{ m_user_info, path };
            keyed_storage children;
            std::optional<EncodingError> failure;

            try
            {
                value.for_each_field(ctx,
                                     [&](std::string_view name, const Traversable& field)
                                     {
                                         auto child = visit(field, record_child_path(path, name));
                                         if (!child)
                                         {
                                             if (!failure)
                                                 failure = std::move(child.error());
                                             return false;
                                         }
                                         children.emplace_back(std::string(name),
                                                               std::move(child.value()));
                                         return true;
                                     });
            }
            catch (const std::exception& e)
            {
                return tl::unexpected(traversal_failure(e, path));
            }

            if (failure)
                return tl::unexpected(std::move(*failure));
            return Storage{ std::move(children) };
        }

        tl::expected<Storage, EncodingError> PartBuilder::visit_sequence(
            const Traversable& value, const std::string& path) const
        {
            const TraversalContext ctx{ m_user_info, path };
            unkeyed_storage children;
            std::optional<EncodingError> failure;

            try
            {
                value.for_each_element(ctx,
                                       [&](const Traversable& element)
                                       {
                                           auto child = visit(
                                               element, sequence_child_path(path, children.size()));
                                           if (!child)
                                           {
                                               if (!failure)
                                                   failure = std::move(child.error());
                                               return false;
                                           }
                                           children.push_back(std::move(child.value()));
                                           return true;
                                       });
            }
            catch (const std::exception& e)
            {
                return tl::unexpected(traversal_failure(e, path));
            }

            if (failure)
                return tl::unexpected(std::move(*failure));
            return Storage{ std::move(children) };
        }

        std::vector<NamedPart> PartBuilder::flatten(Storage storage) const
        {
            std::vector<NamedPart> parts;
            flatten_into(storage, {}, parts);
            return parts;
        }

        void PartBuilder::flatten_into(Storage& storage,
                                       const std::string& path,
                                       std::vector<NamedPart>& parts) const
        {
            if (auto* leaf = std::get_if<Leaf>(&storage.data))
            {
                parts.push_back(make_part(std::move(*leaf), path));
            }
            else if (auto* keyed = std::get_if<keyed_storage>(&storage.data))
            {
                for (auto& [name, child] : *keyed)
                    flatten_into(child, record_child_path(path, name), parts);
            }
            else if (auto* unkeyed = std::get_if<unkeyed_storage>(&storage.data))
            {
                for (std::size_t i = 0; i < unkeyed->size(); ++i)
                    flatten_into((*unkeyed)[i], sequence_child_path(path, i), parts);
            }
        }

        NamedPart PartBuilder::make_part(Leaf leaf, const std::string& path) const
        {
            NamedPart part;
            part.name = path;
            part.body = std::move(leaf.bytes);
            if (leaf.is_file)
            {
                part.content_type = leaf.content_type.value_or(m_options.default_content_type);
                part.filename = leaf.filename.value_or(m_options.default_filename);
            }
            spdlog::trace("Part '{}' ({} bytes)", part.name, part.body.size());
            return part;
        }
    }
}
