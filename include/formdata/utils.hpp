#ifndef FORMDATA_UTILS_HPP
#define FORMDATA_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include <formdata/export.hpp>

namespace formdata
{
    FORMDATA_API bool contains(const std::string_view& str, const std::string_view& sub_str);

    // True if `value` holds a CR or LF, which would break a header line.
    FORMDATA_API bool has_line_break(const std::string_view& value) noexcept;

    // Escapes `"` and `\` for use inside a quoted header parameter.
    FORMDATA_API std::string escape_quoted(const std::string_view& value);

    // `field` at the root, `parent[field]` below it.
    FORMDATA_API std::string record_child_path(const std::string_view& parent,
                                               const std::string_view& field);

    // Always `parent[index]`, also for an empty parent.
    FORMDATA_API std::string sequence_child_path(const std::string_view& parent,
                                                 std::size_t index);

    // Value for the Content-Type header of a request carrying the encoded body.
    FORMDATA_API std::string content_type_header(const std::string_view& boundary);
}

#endif
