#ifndef FORMDATA_ENCODER_HPP
#define FORMDATA_ENCODER_HPP

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include <formdata/export.hpp>
#include <formdata/enums.hpp>
#include <formdata/errors.hpp>
#include <formdata/part.hpp>
#include <formdata/traversable.hpp>
#include <formdata/convert.hpp>
#include <formdata/serializer.hpp>

namespace formdata
{
    // Headers used for file-typed leaves that do not declare their own.
    struct EncoderOptions
    {
        std::string default_content_type = FORMDATA_DEFAULT_CONTENT_TYPE;
        std::string default_filename = FORMDATA_DEFAULT_FILENAME;
    };

    // verbosity 0: logging off, 1-2: debug, > 2: warnings only
    FORMDATA_API void set_verbosity(int verbosity);
    FORMDATA_API void set_log_level(spdlog::level::level_enum log_level);

    // Encodes structured values to multipart/form-data (RFC 2388).
    //
    //     FormDataEncoder encoder;
    //     auto body = encoder.encode(Value::record({ { "a", "x" } }), "123");
    //     // *body == "--123\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nx\r\n--123--\r\n"
    //
    // The top-level value must be a record. Nested record fields are named `parent[field]`
    // and sequence elements `parent[index]`; absent values and empty containers produce
    // no part. All operations are const and may run concurrently on one encoder.
    class FORMDATA_API FormDataEncoder
    {
    public:
        // Passed as is to every Traversable accessor.
        user_info_type user_info;
        EncoderOptions options;

        FormDataEncoder() = default;
        explicit FormDataEncoder(EncoderOptions opts)
            : options(std::move(opts))
        {
        }

        tl::expected<std::vector<NamedPart>, EncodingError> parts(const Traversable& value) const;

        tl::expected<std::string, EncodingError> encode(const Traversable& value,
                                                        std::string_view boundary) const;

        tl::expected<std::vector<char>, EncodingError> encode_bytes(
            const Traversable& value, std::string_view boundary) const;

        // Appends the encoded message to `sink`, which is left untouched on failure.
        template <class Sink>
        tl::expected<void, EncodingError> encode_into(const Traversable& value,
                                                      std::string_view boundary,
                                                      Sink& sink) const
        {
            auto named_parts = parts(value);
            if (!named_parts)
                return tl::unexpected(named_parts.error());

            auto written = MultipartSerializer().serialize_into(named_parts.value(), boundary, sink);
            if (!written)
                written.error().log();
            return written;
        }

        // Overloads for anything `to_value` can convert.

        template <class T, std::enable_if_t<!std::is_base_of_v<Traversable, T>, int> = 0>
        tl::expected<std::vector<NamedPart>, EncodingError> parts(const T& object) const
        {
            return parts(to_value(object));
        }

        template <class T, std::enable_if_t<!std::is_base_of_v<Traversable, T>, int> = 0>
        tl::expected<std::string, EncodingError> encode(const T& object,
                                                        std::string_view boundary) const
        {
            return encode(to_value(object), boundary);
        }

        template <class T, std::enable_if_t<!std::is_base_of_v<Traversable, T>, int> = 0>
        tl::expected<std::vector<char>, EncodingError> encode_bytes(
            const T& object, std::string_view boundary) const
        {
            return encode_bytes(to_value(object), boundary);
        }

        template <class Sink,
                  class T,
                  std::enable_if_t<!std::is_base_of_v<Traversable, T>, int> = 0>
        tl::expected<void, EncodingError> encode_into(const T& object,
                                                      std::string_view boundary,
                                                      Sink& sink) const
        {
            return encode_into(to_value(object), boundary, sink);
        }
    };
}

#endif
