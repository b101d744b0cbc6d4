#ifndef FORMDATA_CONVERT_HPP
#define FORMDATA_CONVERT_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <formdata/value.hpp>

namespace formdata
{
    namespace details
    {
        template <class T>
        struct is_optional : std::false_type
        {
        };

        template <class T>
        struct is_optional<std::optional<T>> : std::true_type
        {
        };

        template <class T>
        struct is_vector : std::false_type
        {
        };

        template <class T, class A>
        struct is_vector<std::vector<T, A>> : std::true_type
        {
        };

        // Byte vectors are binary payloads, not sequences of numbers.
        template <class T>
        struct is_byte_vector : std::false_type
        {
        };

        template <class A>
        struct is_byte_vector<std::vector<unsigned char, A>> : std::true_type
        {
        };

        template <class A>
        struct is_byte_vector<std::vector<std::byte, A>> : std::true_type
        {
        };

        template <class T>
        struct is_string_map : std::false_type
        {
        };

        template <class T, class C, class A>
        struct is_string_map<std::map<std::string, T, C, A>> : std::true_type
        {
        };

        // User types opt in with an ADL-visible `void to_form_value(formdata::Value&, const T&)`.
        template <class T, class = void>
        struct has_to_form_value : std::false_type
        {
        };

        template <class T>
        struct has_to_form_value<T,
                                 std::void_t<decltype(to_form_value(std::declval<Value&>(),
                                                                    std::declval<const T&>()))>>
            : std::true_type
        {
        };

        template <class T>
        struct dependent_false : std::false_type
        {
        };
    }

    // Builds the Value tree of `object`.
    //
    // Scalars become leaves, std::optional maps to an absent value when empty,
    // byte vectors (std::uint8_t, unsigned char, std::byte) to a binary leaf,
    // other std::vector to a sequence and std::map<std::string, T> to a record in key order.
    // Any other type needs a `to_form_value` overload in its own namespace:
    //
    //     void to_form_value(formdata::Value& v, const Person& p)
    //     {
    //         v.emplace("name", p.name);
    //         v.emplace("address", formdata::to_value(p.address));
    //     }
    template <class T>
    Value to_value(const T& object)
    {
        if constexpr (std::is_convertible_v<const T&, Value>)
        {
            return Value(object);
        }
        else if constexpr (details::is_optional<T>::value)
        {
            if (!object)
                return Value();
            return to_value(*object);
        }
        else if constexpr (details::is_byte_vector<T>::value)
        {
            std::string bytes;
            bytes.reserve(object.size());
            for (const auto& byte : object)
                bytes.push_back(static_cast<char>(byte));
            return Value(Leaf::blob(std::move(bytes)));
        }
        else if constexpr (details::is_vector<T>::value)
        {
            Value::sequence_type elements;
            elements.reserve(object.size());
            for (const auto& element : object)
                elements.push_back(to_value(element));
            return Value::sequence(std::move(elements));
        }
        else if constexpr (details::is_string_map<T>::value)
        {
            Value::record_type fields;
            for (const auto& [key, field] : object)
                fields.emplace_back(key, to_value(field));
            return Value::record(std::move(fields));
        }
        else if constexpr (details::has_to_form_value<T>::value)
        {
            Value result = Value::record();
            to_form_value(result, object);
            return result;
        }
        else
        {
            static_assert(details::dependent_false<T>::value,
                          "no conversion to formdata::Value, provide to_form_value(Value&, const T&)");
        }
    }
}

#endif
