#include <stdexcept>

#include <formdata/value.hpp>

namespace formdata
{
    Value Value::record(std::initializer_list<std::pair<std::string, Value>> fields)
    {
        return record(record_type(fields));
    }

    Value Value::record(record_type fields)
    {
        Value res;
        res.m_data = std::move(fields);
        return res;
    }

    Value Value::sequence(std::initializer_list<Value> elements)
    {
        return sequence(sequence_type(elements));
    }

    Value Value::sequence(sequence_type elements)
    {
        Value res;
        res.m_data = std::move(elements);
        return res;
    }

    Shape Value::shape(const TraversalContext&) const
    {
        switch (m_data.index())
        {
            case 1:
                return Shape::kLEAF;
            case 2:
                return Shape::kRECORD;
            case 3:
                return Shape::kSEQUENCE;
            default:
                return Shape::kABSENT;
        }
    }

    void Value::for_each_field(const TraversalContext& ctx, const field_visitor_t& visitor) const
    {
        if (!is_record())
            return Traversable::for_each_field(ctx, visitor);

        for (const auto& [name, field] : fields())
        {
            if (!visitor(name, field))
                break;
        }
    }

    void Value::for_each_element(const TraversalContext& ctx,
                                 const element_visitor_t& visitor) const
    {
        if (!is_sequence())
            return Traversable::for_each_element(ctx, visitor);

        for (const auto& element : elements())
        {
            if (!visitor(element))
                break;
        }
    }

    Leaf Value::leaf(const TraversalContext& ctx) const
    {
        if (!is_leaf())
            return Traversable::leaf(ctx);
        return as_leaf();
    }

    Value& Value::emplace(std::string name, Value value)
    {
        if (is_absent())
            m_data = record_type{};
        if (!is_record())
            throw std::logic_error("cannot add field '" + name + "' to a value that is not a record");

        std::get<record_type>(m_data).emplace_back(std::move(name), std::move(value));
        return *this;
    }

    Value& Value::push_back(Value value)
    {
        if (is_absent())
            m_data = sequence_type{};
        if (!is_sequence())
            throw std::logic_error("cannot add an element to a value that is not a sequence");

        std::get<sequence_type>(m_data).push_back(std::move(value));
        return *this;
    }

    std::size_t Value::size() const noexcept
    {
        if (auto* fields = std::get_if<record_type>(&m_data))
            return fields->size();
        if (auto* elements = std::get_if<sequence_type>(&m_data))
            return elements->size();
        return 0;
    }

    const Leaf& Value::as_leaf() const
    {
        if (!is_leaf())
            throw std::logic_error("value is not a leaf");
        return std::get<Leaf>(m_data);
    }

    const Value::record_type& Value::fields() const
    {
        if (!is_record())
            throw std::logic_error("value is not a record");
        return std::get<record_type>(m_data);
    }

    const Value::sequence_type& Value::elements() const
    {
        if (!is_sequence())
            throw std::logic_error("value is not a sequence");
        return std::get<sequence_type>(m_data);
    }
}
