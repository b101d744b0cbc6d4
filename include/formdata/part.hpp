#ifndef FORMDATA_PART_HPP
#define FORMDATA_PART_HPP

#include <optional>
#include <string>

namespace formdata
{
    // One body part of a multipart/form-data message.
    // Several parts may share a name (multi-valued fields, sequence elements).
    struct NamedPart
    {
        std::string name;
        // Only set for file-like values, adds `; filename="..."` to the disposition.
        std::optional<std::string> filename;
        // Without a content type no Content-Type header line is written.
        std::optional<std::string> content_type;
        // Raw payload, written as is.
        std::string body;

        [[nodiscard]] friend bool operator==(const NamedPart& left, const NamedPart& right)
        {
            return left.name == right.name && left.filename == right.filename
                   && left.content_type == right.content_type && left.body == right.body;
        }
        [[nodiscard]] friend bool operator!=(const NamedPart& left, const NamedPart& right)
        {
            return !(left == right);
        }
    };
}

#endif
