// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

//--------------------------------------------------------------------------------------------------

namespace gscope {

//--------------------------------------------------------------------------------------------------

enum class type_kind : std::uint8_t {
    invalid,
    boolean,
    sint,
    uint,
    floating,
    string, // runtime string header: data pointer, then length
    pointer,
    structure,
    array,
    slice, // runtime slice header: data pointer, length, capacity
    map, // pointer to a runtime hash map header
    function, // code address
};

const char* to_string(type_kind kind);

//--------------------------------------------------------------------------------------------------

struct type;

struct field {
    std::string _name;
    std::uint64_t _offset{0};
    const type* _type{nullptr};
};

//--------------------------------------------------------------------------------------------------
// A type descriptor as handed over by the type system. Descriptors are immutable once built and
// refer to each other by plain pointer; whoever builds them (e.g., a `type_arena`) owns them.
struct type {
    type_kind _kind{type_kind::invalid};
    std::string _name;
    std::uint64_t _size{0};
    const type* _elem{nullptr}; // pointee, array/slice element, or map value
    const type* _key{nullptr}; // map key
    const type* _map_header{nullptr}; // map header struct (`count`, `B`, `buckets`)
    std::uint64_t _count{0}; // array length

    const std::vector<field>& fields() const { return _fields; }

    // Sets the members of a struct type and indexes them by name. Call this once per type,
    // before the descriptor is shared.
    void set_fields(std::vector<field> fields);

    // returns nullptr if there is no member by that name.
    const field* field_named(std::string_view name) const;

    bool is_integral() const { return _kind == type_kind::sint || _kind == type_kind::uint; }

private:
    std::vector<field> _fields;
    std::unordered_map<std::string, std::size_t> _field_index;
};

//--------------------------------------------------------------------------------------------------
// Owns type descriptors. Addresses of the descriptors are stable for the life of the arena, so
// descriptors can refer to each other (including themselves, through pointers.)
class type_arena {
public:
    type& make(type_kind kind, std::string name, std::uint64_t size);

    const type& pointer_to(const type& elem, std::uint64_t ptr_size, std::string name = {});
    const type& array_of(const type& elem, std::uint64_t count, std::string name = {});
    const type& slice_of(const type& elem, std::uint64_t ptr_size, std::string name = {});

    std::size_t size() const { return _types.size(); }

private:
    std::deque<type> _types;
};

//--------------------------------------------------------------------------------------------------

} // namespace gscope

//--------------------------------------------------------------------------------------------------
