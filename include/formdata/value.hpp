#ifndef FORMDATA_VALUE_HPP
#define FORMDATA_VALUE_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include <formdata/export.hpp>
#include <formdata/traversable.hpp>

namespace formdata
{
    // In-memory tree of records, sequences, leaves and absent values.
    //
    //     auto v = Value::record({ { "name", "Ada" },
    //                              { "tags", Value::sequence({ "x", "y" }) },
    //                              { "nickname", std::nullopt } });
    class FORMDATA_API Value : public Traversable
    {
    public:
        using record_type = std::vector<std::pair<std::string, Value>>;
        using sequence_type = std::vector<Value>;

        Value() = default;
        Value(std::nullopt_t)
        {
        }

        Value(Leaf leaf)
            : m_data(std::move(leaf))
        {
        }

        Value(std::string text)
            : m_data(Leaf::text(std::move(text)))
        {
        }

        Value(std::string_view text)
            : m_data(Leaf::text(std::string(text)))
        {
        }

        Value(const char* text)
            : m_data(Leaf::text(text))
        {
        }

        // Exactly bool and exactly char: no implicit conversion from pointers or unscoped enums.
        template <class B, std::enable_if_t<std::is_same_v<B, bool>, int> = 0>
        Value(B flag)
            : m_data(Leaf::text(flag ? "true" : "false"))
        {
        }

        // Plain char is a one character text; signed char and unsigned char
        // (std::uint8_t) are small integers written in decimal.
        template <class C, std::enable_if_t<std::is_same_v<C, char>, int> = 0>
        Value(C c)
            : m_data(Leaf::text(std::string(1, c)))
        {
        }

        template <class T,
                  std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>
                                       && !std::is_same_v<T, char>,
                                   int> = 0>
        Value(T number)
            : m_data(Leaf::text(fmt::format("{}", number)))
        {
        }

        static Value record(std::initializer_list<std::pair<std::string, Value>> fields = {});
        static Value record(record_type fields);
        static Value sequence(std::initializer_list<Value> elements = {});
        static Value sequence(sequence_type elements);

        Shape shape(const TraversalContext& ctx) const override;
        void for_each_field(const TraversalContext& ctx,
                            const field_visitor_t& visitor) const override;
        void for_each_element(const TraversalContext& ctx,
                              const element_visitor_t& visitor) const override;
        Leaf leaf(const TraversalContext& ctx) const override;

        bool is_absent() const noexcept
        {
            return std::holds_alternative<std::monostate>(m_data);
        }

        bool is_leaf() const noexcept
        {
            return std::holds_alternative<Leaf>(m_data);
        }

        bool is_record() const noexcept
        {
            return std::holds_alternative<record_type>(m_data);
        }

        bool is_sequence() const noexcept
        {
            return std::holds_alternative<sequence_type>(m_data);
        }

        // Appends a field; turns an absent value into a record first.
        // Throws std::logic_error if this value is not a record.
        Value& emplace(std::string name, Value value);

        // Appends an element; turns an absent value into a sequence first.
        // Throws std::logic_error if this value is not a sequence.
        Value& push_back(Value value);

        // Number of fields or elements, 0 for leaves and absent values.
        std::size_t size() const noexcept;
        bool empty() const noexcept
        {
            return size() == 0;
        }

        const Leaf& as_leaf() const;
        const record_type& fields() const;
        const sequence_type& elements() const;

    private:
        std::variant<std::monostate, Leaf, record_type, sequence_type> m_data;
    };
}

#endif
