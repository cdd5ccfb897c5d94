#pragma once

/// @file outliner.hpp
/// @author Aleksandr Loshkarev
/// @brief The stack machine shared by every serializer and deserializer.
///
/// An Outliner describes the *shape* of a value independently of its
/// payload. The machine holds a stack whose top slot is one of:
///
///   - an unopened value
///   - an opened string
///   - an opened struct   (fields pushed by name, in declaration order)
///   - an opened tuple    (elements pushed positionally)
///   - an opened list     (items pushed until the list is closed)
///
/// Serializer and Deserializer extend this with the payload operations.
/// Calling an operation in the wrong stack state is a protocol violation
/// (fatal, see SERDEX_ASSERT); malformed input is a DeserializeError and a
/// failed sink is a SerializeError.
///
/// Callers normally go through the checked handles in value.hpp instead of
/// using this interface directly.

#include <string_view>

namespace serdex {

class Outliner {
public:
    virtual ~Outliner() = default;

    /// @brief Whether the format has a native null literal, which allows
    /// optional values to use the niche representation.
    [[nodiscard]] virtual bool supports_null() const = 0;

    /// Top is a value: asserts it is null and pops it.
    virtual void pop_null() = 0;

    /// Top is a value: asserts it is a string and opens it.
    virtual void open_str() = 0;

    /// Top is an opened string: closes and pops it.
    virtual void close_str() = 0;

    /// Top is a value: asserts it is a struct and opens it. @p type_name
    /// may be empty.
    virtual void open_struct(std::string_view type_name) = 0;

    /// Top is an opened struct: pushes the value of field @p name. The name
    /// must stay valid for the lifetime of the outliner (a literal).
    virtual void push_field(std::string_view name) = 0;

    /// Top is an opened struct: closes and pops it.
    virtual void close_struct() = 0;

    /// Top is a value: asserts it is a tuple and opens it.
    virtual void open_tuple(std::string_view type_name) = 0;

    /// Top is an opened tuple: pushes the next element.
    virtual void push_element() = 0;

    /// Top is an opened tuple: asserts no elements remain, closes and pops it.
    virtual void close_tuple() = 0;

    /// Top is an opened list: pushes the next item.
    virtual void push_item() = 0;

    /// Top is an opened list: asserts no items remain, closes and pops it.
    virtual void close_list() = 0;
};

} // namespace serdex
