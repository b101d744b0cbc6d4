#include <formdata/utils.hpp>

#include <spdlog/fmt/fmt.h>

namespace formdata
{
    bool contains(const std::string_view& str, const std::string_view& sub_str)
    {
        return str.find(sub_str) != std::string::npos;
    }

    bool has_line_break(const std::string_view& value) noexcept
    {
        return value.find_first_of("\r\n") != std::string_view::npos;
    }

    std::string escape_quoted(const std::string_view& value)
    {
        std::string res;
        res.reserve(value.size());
        for (char c : value)
        {
            if (c == '"' || c == '\\')
                res.push_back('\\');
            res.push_back(c);
        }
        return res;
    }

    std::string record_child_path(const std::string_view& parent, const std::string_view& field)
    {
        if (parent.empty())
            return std::string(field);
        return fmt::format("{}[{}]", parent, field);
    }

    std::string sequence_child_path(const std::string_view& parent, std::size_t index)
    {
        return fmt::format("{}[{}]", parent, index);
    }

    std::string content_type_header(const std::string_view& boundary)
    {
        return fmt::format("multipart/form-data; boundary={}", boundary);
    }
}
