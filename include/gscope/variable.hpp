// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// application
#include "gscope/capabilities.hpp"
#include "gscope/type.hpp"

//--------------------------------------------------------------------------------------------------

namespace gscope {

//--------------------------------------------------------------------------------------------------
// Limits for a bounded load. Negative string, array, and struct limits mean "unlimited".
struct load_config {
    bool _follow_pointers{true};
    int _max_variable_recurse{1};
    int _max_string_len{64};
    int _max_array_values{64};
    int _max_struct_fields{-1};
};

using value_type = std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, std::string>;

//--------------------------------------------------------------------------------------------------
// A typed view of process memory: a type bound to an address. Loading it reads the memory and
// fills in the value and the children (struct fields, array/slice elements, the pointee of a
// pointer, or key/value pairs of a map.)
//
// A variable never throws from `load`. Failures are recorded on the node where they happened
// (`unreadable()`), and the rest of the tree keeps whatever was decoded.
class variable {
public:
    variable(std::string name,
             std::uint64_t addr,
             const type& t,
             memory_reader& mem,
             const binary_info& bi);

    // for synthetic types that nothing else owns.
    variable(std::string name,
             std::uint64_t addr,
             std::shared_ptr<const type> t,
             memory_reader& mem,
             const binary_info& bi);

    const std::string& name() const { return _name; }
    std::uint64_t addr() const { return _addr; }
    const type& real_type() const { return *_type; }
    type_kind kind() const { return _type->_kind; }

    const value_type& value() const { return _value; }
    bool has_value() const { return !std::holds_alternative<std::monostate>(_value); }

    // numeric views of the value. Empty if the value is not numeric.
    std::optional<std::int64_t> as_int() const;
    std::optional<std::uint64_t> as_uint() const;
    const std::string* as_string() const { return std::get_if<std::string>(&_value); }

    const std::vector<variable>& children() const { return _children; }
    std::uint64_t len() const { return _len; }
    std::uint64_t cap() const { return _cap; }
    bool loaded() const { return _loaded; }

    bool unreadable() const { return static_cast<bool>(_unreadable); }
    const std::exception_ptr& unreadable_error() const { return _unreadable; }
    std::string unreadable_message() const;

    memory_reader& mem() const { return *_mem; }
    const binary_info& bin_info() const { return *_bi; }

    // If this is a pointer, returns a variable bound to the pointee; otherwise a copy of this.
    variable maybe_dereference() const;

    // Binds the struct member `name` through the type. Returns nothing if this is not a struct or
    // the struct has no such member.
    std::optional<variable> struct_member(std::string_view name) const;

    // Finds a child by name among the already-loaded children.
    const variable* field(std::string_view name) const;

    void load(const load_config& cfg);

private:
    void load_value(const load_config& cfg, int level);
    void load_pointer(const load_config& cfg, int level);
    void load_struct(const load_config& cfg, int level);
    void load_string(const load_config& cfg);
    void load_slice(const load_config& cfg, int level);
    void load_map(const load_config& cfg, int level);
    void load_elements(std::uint64_t base, std::uint64_t count, const load_config& cfg, int level);

    std::uint64_t pointer_value() const;
    std::uint64_t ptr_size() const;

    std::string _name;
    std::uint64_t _addr{0};
    const type* _type{nullptr};
    std::shared_ptr<const type> _owned_type;
    value_type _value;
    std::vector<variable> _children;
    std::uint64_t _len{0};
    std::uint64_t _cap{0};
    bool _loaded{false};
    std::exception_ptr _unreadable;
    memory_reader* _mem{nullptr};
    const binary_info* _bi{nullptr};
};

//--------------------------------------------------------------------------------------------------
// Raw reads used by the decoders. Both throw `memory_error`.
std::uint64_t read_uint(memory_reader& mem, std::uint64_t addr, std::size_t size);
std::int64_t read_int(memory_reader& mem, std::uint64_t addr, std::size_t size);

//--------------------------------------------------------------------------------------------------

} // namespace gscope

//--------------------------------------------------------------------------------------------------
