#include <formdata/serializer.hpp>

namespace formdata
{
    namespace details
    {
        namespace
        {
            tl::expected<void, EncodingError> validate_boundary(std::string_view boundary)
            {
                if (boundary.empty() || boundary.size() > FORMDATA_MAX_BOUNDARY_LENGTH)
                {
                    return tl::unexpected(EncodingError{
                        ErrorCode::kINVALID_BOUNDARY,
                        fmt::format("boundary must be 1 to {} characters long, got {}",
                                    FORMDATA_MAX_BOUNDARY_LENGTH,
                                    boundary.size()),
                        {},
                        nullptr });
                }
                if (has_line_break(boundary))
                {
                    return tl::unexpected(EncodingError{ ErrorCode::kINVALID_BOUNDARY,
                                                         "boundary contains a line break",
                                                         {},
                                                         nullptr });
                }
                return {};
            }

            tl::expected<void, EncodingError> validate_header_value(std::string_view what,
                                                                    const NamedPart& part,
                                                                    std::string_view value)
            {
                if (value.empty())
                {
                    return tl::unexpected(EncodingError{ ErrorCode::kINVALID_PART_NAME,
                                                         fmt::format("{} is empty", what),
                                                         part.name,
                                                         nullptr });
                }
                if (has_line_break(value))
                {
                    return tl::unexpected(EncodingError{
                        ErrorCode::kINVALID_PART_NAME,
                        fmt::format("{} contains a line break", what),
                        part.name,
                        nullptr });
                }
                return {};
            }
        }

        tl::expected<void, EncodingError> validate_parts(const std::vector<NamedPart>& parts,
                                                         std::string_view boundary)
        {
            if (auto valid = validate_boundary(boundary); !valid)
                return valid;

            const std::string delimiter = fmt::format("--{}", boundary);
            for (const auto& part : parts)
            {
                if (auto valid = validate_header_value("part name", part, part.name); !valid)
                    return valid;
                // filename="" is legal, browsers send it for an empty file input
                if (part.filename && has_line_break(*part.filename))
                {
                    return tl::unexpected(EncodingError{ ErrorCode::kINVALID_PART_NAME,
                                                         "filename contains a line break",
                                                         part.name,
                                                         nullptr });
                }
                if (part.content_type && has_line_break(*part.content_type))
                {
                    return tl::unexpected(EncodingError{ ErrorCode::kINVALID_PART_NAME,
                                                         "content type contains a line break",
                                                         part.name,
                                                         nullptr });
                }
                if (contains(part.body, delimiter))
                {
                    return tl::unexpected(EncodingError{
                        ErrorCode::kBOUNDARY_COLLISION,
                        fmt::format("body contains the delimiter '{}'", delimiter),
                        part.name,
                        nullptr });
                }
            }
            return {};
        }
    }

    tl::expected<std::string, EncodingError> MultipartSerializer::serialize(
        const std::vector<NamedPart>& parts, std::string_view boundary) const
    {
        std::string res;
        if (auto written = serialize_into(parts, boundary, res); !written)
            return tl::unexpected(written.error());
        return res;
    }

    tl::expected<std::vector<char>, EncodingError> MultipartSerializer::serialize_to_bytes(
        const std::vector<NamedPart>& parts, std::string_view boundary) const
    {
        std::vector<char> res;
        if (auto written = serialize_into(parts, boundary, res); !written)
            return tl::unexpected(written.error());
        return res;
    }
}
