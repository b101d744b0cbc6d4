#include <stdexcept>
#include <utility>

#include <formdata/traversable.hpp>

namespace formdata
{
    Leaf Leaf::text(std::string value)
    {
        return Leaf{ std::move(value), false, std::nullopt, std::nullopt };
    }

    Leaf Leaf::blob(std::string bytes)
    {
        return Leaf{ std::move(bytes), false, std::nullopt, std::nullopt };
    }

    Leaf Leaf::file(std::string bytes,
                    std::optional<std::string> content_type,
                    std::optional<std::string> filename)
    {
        return Leaf{ std::move(bytes), true, std::move(content_type), std::move(filename) };
    }

    void Traversable::for_each_field(const TraversalContext&, const field_visitor_t&) const
    {
        throw std::logic_error("value does not expose named fields");
    }

    void Traversable::for_each_element(const TraversalContext&, const element_visitor_t&) const
    {
        throw std::logic_error("value does not expose elements");
    }

    Leaf Traversable::leaf(const TraversalContext&) const
    {
        throw std::logic_error("value is not a leaf");
    }
}
