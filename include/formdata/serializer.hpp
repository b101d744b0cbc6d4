#ifndef FORMDATA_SERIALIZER_HPP
#define FORMDATA_SERIALIZER_HPP

#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include <formdata/export.hpp>
#include <formdata/errors.hpp>
#include <formdata/part.hpp>
#include <formdata/utils.hpp>

namespace formdata
{
    namespace details
    {
        // Checks the boundary, every name, filename and body before anything is written.
        FORMDATA_API tl::expected<void, EncodingError> validate_parts(
            const std::vector<NamedPart>& parts, std::string_view boundary);

        template <class Sink>
        inline void append(Sink& sink, std::string_view bytes)
        {
            sink.insert(sink.end(), bytes.begin(), bytes.end());
        }

        template <class Sink>
        void write_part(Sink& sink, const NamedPart& part, std::string_view boundary)
        {
            append(sink, "--");
            append(sink, boundary);
            append(sink, "\r\n");

            append(sink, "Content-Disposition: form-data; name=\"");
            append(sink, escape_quoted(part.name));
            append(sink, "\"");
            if (part.filename)
            {
                append(sink, "; filename=\"");
                append(sink, escape_quoted(*part.filename));
                append(sink, "\"");
            }
            append(sink, "\r\n");

            if (part.content_type)
            {
                append(sink, "Content-Type: ");
                append(sink, *part.content_type);
                append(sink, "\r\n");
            }

            append(sink, "\r\n");
            append(sink, part.body);
            append(sink, "\r\n");
        }
    }

    // Writes named parts in multipart/form-data framing (RFC 2388).
    //
    //     --<boundary>\r\n
    //     Content-Disposition: form-data; name="<name>"[; filename="<filename>"]\r\n
    //     [Content-Type: <content type>\r\n]
    //     \r\n
    //     <body>\r\n
    //     ...
    //     --<boundary>--\r\n
    //
    // Fails without writing anything if the boundary is unusable, a name or filename
    // contains a line break, or a body contains "--" + boundary.
    class FORMDATA_API MultipartSerializer
    {
    public:
        tl::expected<std::string, EncodingError> serialize(const std::vector<NamedPart>& parts,
                                                           std::string_view boundary) const;

        tl::expected<std::vector<char>, EncodingError> serialize_to_bytes(
            const std::vector<NamedPart>& parts, std::string_view boundary) const;

        // Appends to any growable byte container (std::string, std::vector<char>,
        // std::vector<unsigned char>...). The sink is left untouched on failure.
        template <class Sink>
        tl::expected<void, EncodingError> serialize_into(const std::vector<NamedPart>& parts,
                                                         std::string_view boundary,
                                                         Sink& sink) const
        {
            if (auto valid = details::validate_parts(parts, boundary); !valid)
                return tl::unexpected(valid.error());

            for (const auto& part : parts)
            {
                spdlog::trace("Writing part '{}' ({} bytes)", part.name, part.body.size());
                details::write_part(sink, part, boundary);
            }

            details::append(sink, "--");
            details::append(sink, boundary);
            details::append(sink, "--\r\n");
            return {};
        }
    };
}

#endif
