#ifndef FORMDATA_ERRORS_HPP
#define FORMDATA_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include <formdata/export.hpp>
#include <formdata/enums.hpp>

namespace formdata
{
    FORMDATA_API std::string_view to_string(ErrorCode code) noexcept;

    struct EncodingError
    {
        ErrorCode code;
        std::string reason;
        // Composite key being visited when the error was raised (may be empty).
        std::string path;
        // Original exception for kTRAVERSAL_FAILURE, null otherwise.
        std::exception_ptr cause;

        ErrorLevel level() const noexcept
        {
            return code == ErrorCode::kTRAVERSAL_FAILURE ? ErrorLevel::FATAL : ErrorLevel::SERIOUS;
        }

        bool has_cause() const noexcept
        {
            return static_cast<bool>(cause);
        }

        // Rethrows the exception raised by the traversal layer, unchanged.
        [[noreturn]] void rethrow_cause() const
        {
            if (cause)
                std::rethrow_exception(cause);
            throw std::logic_error("encoding error has no underlying exception");
        }

        std::string to_string() const
        {
            if (path.empty())
                return fmt::format("{}: {}", formdata::to_string(code), reason);
            return fmt::format("{} at '{}': {}", formdata::to_string(code), path, reason);
        }

        void log() const
        {
            switch (level())
            {
                case ErrorLevel::FATAL:
                    spdlog::critical(to_string());
                    break;
                case ErrorLevel::SERIOUS:
                    spdlog::error(to_string());
                    break;
                default:
                    spdlog::warn(to_string());
            }
        }
    };
}

#endif
