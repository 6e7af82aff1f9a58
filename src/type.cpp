// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/type.hpp"

// adobe contract checks
#include "adobe/contract_checks.hpp"

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

const char* to_string(type_kind kind) {
    // clang-format off
    switch (kind) {
        case type_kind::invalid:   return "invalid";
        case type_kind::boolean:   return "bool";
        case type_kind::sint:      return "int";
        case type_kind::uint:      return "uint";
        case type_kind::floating:  return "float";
        case type_kind::string:    return "string";
        case type_kind::pointer:   return "ptr";
        case type_kind::structure: return "struct";
        case type_kind::array:     return "array";
        case type_kind::slice:     return "slice";
        case type_kind::map:       return "map";
        case type_kind::function:  return "func";
    }
    // clang-format on
    return "unknown";
}

/**************************************************************************************************/

void type::set_fields(std::vector<field> fields) {
    ADOBE_PRECONDITION(_kind == type_kind::structure, "only structs have fields");
    ADOBE_PRECONDITION(_fields.empty(), "struct fields are set once");

    _fields = std::move(fields);
    _field_index.reserve(_fields.size());
    for (std::size_t i{0}; i < _fields.size(); ++i) {
        ADOBE_INVARIANT(_fields[i]._type, "struct field without a type");
        // first one wins, the same as a linear search would.
        _field_index.emplace(_fields[i]._name, i);
    }
}

/**************************************************************************************************/

const field* type::field_named(std::string_view name) const {
    auto found = _field_index.find(std::string(name));
    return found == _field_index.end() ? nullptr : &_fields[found->second];
}

/**************************************************************************************************/

type& type_arena::make(type_kind kind, std::string name, std::uint64_t size) {
    type& result = _types.emplace_back();
    result._kind = kind;
    result._name = std::move(name);
    result._size = size;
    return result;
}

/**************************************************************************************************/

const type& type_arena::pointer_to(const type& elem, std::uint64_t ptr_size, std::string name) {
    if (name.empty()) name = "*" + elem._name;
    type& result = make(type_kind::pointer, std::move(name), ptr_size);
    result._elem = &elem;
    return result;
}

/**************************************************************************************************/

const type& type_arena::array_of(const type& elem, std::uint64_t count, std::string name) {
    if (name.empty()) name = "[" + std::to_string(count) + "]" + elem._name;
    type& result = make(type_kind::array, std::move(name), elem._size * count);
    result._elem = &elem;
    result._count = count;
    return result;
}

/**************************************************************************************************/

const type& type_arena::slice_of(const type& elem, std::uint64_t ptr_size, std::string name) {
    if (name.empty()) name = "[]" + elem._name;
    type& result = make(type_kind::slice, std::move(name), ptr_size * 3);
    result._elem = &elem;
    return result;
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
