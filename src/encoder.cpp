#include <formdata/encoder.hpp>

#include "./part_builder.hpp"

namespace formdata
{
    void set_verbosity(int verbosity)
    {
        if (verbosity > 2)
        {
            spdlog::set_level(spdlog::level::warn);
        }
        else if (verbosity > 0)
        {
            spdlog::set_level(spdlog::level::debug);
        }
        else
        {
            spdlog::set_level(spdlog::level::off);
        }
    }

    void set_log_level(spdlog::level::level_enum log_level)
    {
        spdlog::set_level(log_level);
    }

    tl::expected<std::vector<NamedPart>, EncodingError> FormDataEncoder::parts(
        const Traversable& value) const
    {
        details::PartBuilder builder(user_info, options);
        auto storage = builder.build(value);
        if (!storage)
        {
            storage.error().log();
            return tl::unexpected(storage.error());
        }

        auto res = builder.flatten(std::move(storage.value()));
        spdlog::debug("Collected {} form-data parts", res.size());
        return res;
    }

    tl::expected<std::string, EncodingError> FormDataEncoder::encode(
        const Traversable& value, std::string_view boundary) const
    {
        std::string res;
        if (auto written = encode_into(value, boundary, res); !written)
            return tl::unexpected(written.error());
        spdlog::debug("Encoded multipart/form-data body of {} bytes", res.size());
        return res;
    }

    tl::expected<std::vector<char>, EncodingError> FormDataEncoder::encode_bytes(
        const Traversable& value, std::string_view boundary) const
    {
        std::vector<char> res;
        if (auto written = encode_into(value, boundary, res); !written)
            return tl::unexpected(written.error());
        spdlog::debug("Encoded multipart/form-data body of {} bytes", res.size());
        return res;
    }
}
