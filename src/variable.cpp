// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/variable.hpp"

// stdc++
#include <algorithm>
#include <array>

// adobe contract checks
#include "adobe/contract_checks.hpp"

// application
#include "gscope/buffer_reader.hpp"
#include "gscope/errors.hpp"
#include "gscope/tracy.hpp"

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/**************************************************************************************************/
// Copies `size` bytes of target memory into a local buffer and hands back a reader over it.
struct scalar_bytes {
    scalar_bytes(memory_reader& mem, std::uint64_t addr, std::size_t size) : _size{size} {
        if (size == 0 || size > _raw.size()) {
            throw std::runtime_error("unsupported scalar size " + std::to_string(size));
        }
        mem.read_memory(std::span<std::byte>(_raw.data(), size), addr);
    }

    buffer_reader reader() const { return buffer_reader({_raw.data(), _size}); }

private:
    std::array<std::byte, 8> _raw{};
    std::size_t _size{0};
};

/**************************************************************************************************/

double read_float(memory_reader& mem, std::uint64_t addr, std::size_t size) {
    scalar_bytes bytes(mem, addr, size);
    auto s = bytes.reader();
    switch (size) {
        case 4:
            return read_le<float>(s);
        case 8:
            return read_le<double>(s);
        default:
            throw std::runtime_error("unsupported float size " + std::to_string(size));
    }
}

/**************************************************************************************************/

std::uint64_t clamp_count(std::uint64_t n, int limit) {
    return limit < 0 ? n : std::min<std::uint64_t>(n, static_cast<std::uint64_t>(limit));
}

void check_depth(const load_config& cfg, int level) {
    if (level > cfg._max_variable_recurse) {
        throw load_limit_error("maximum recursion depth reached");
    }
}

/**************************************************************************************************/
// Loads a scalar member and hands back its value, throwing whatever made it unreadable.
std::uint64_t scalar_value(variable v) {
    v.load(load_config{false, 0, 0, 0, 0});
    if (v.unreadable()) std::rethrow_exception(v.unreadable_error());
    auto result = v.as_uint();
    if (!result) throw std::runtime_error("expected a scalar value for " + v.name());
    return *result;
}

/**************************************************************************************************/
// runtime/map.go: every bucket holds 8 entries. A tophash below 5 marks an empty or evacuated
// slot.
constexpr std::uint64_t bucket_count_k{8};
constexpr std::uint64_t min_top_hash_k{5};
constexpr std::uint64_t max_bucket_shift_k{30};

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

std::uint64_t read_uint(memory_reader& mem, std::uint64_t addr, std::size_t size) {
    scalar_bytes bytes(mem, addr, size);
    auto s = bytes.reader();
    switch (size) {
        case 1:
            return read_le<std::uint8_t>(s);
        case 2:
            return read_le<std::uint16_t>(s);
        case 4:
            return read_le<std::uint32_t>(s);
        case 8:
            return read_le<std::uint64_t>(s);
        default:
            throw std::runtime_error("unsupported integer size " + std::to_string(size));
    }
}

/**************************************************************************************************/

std::int64_t read_int(memory_reader& mem, std::uint64_t addr, std::size_t size) {
    scalar_bytes bytes(mem, addr, size);
    auto s = bytes.reader();
    switch (size) {
        case 1:
            return read_le<std::int8_t>(s);
        case 2:
            return read_le<std::int16_t>(s);
        case 4:
            return read_le<std::int32_t>(s);
        case 8:
            return read_le<std::int64_t>(s);
        default:
            throw std::runtime_error("unsupported integer size " + std::to_string(size));
    }
}

/**************************************************************************************************/

variable::variable(std::string name,
                   std::uint64_t addr,
                   const type& t,
                   memory_reader& mem,
                   const binary_info& bi)
    : _name(std::move(name)), _addr(addr), _type(&t), _mem(&mem), _bi(&bi) {}

variable::variable(std::string name,
                   std::uint64_t addr,
                   std::shared_ptr<const type> t,
                   memory_reader& mem,
                   const binary_info& bi)
    : _name(std::move(name)), _addr(addr), _type(t.get()), _owned_type(std::move(t)), _mem(&mem),
      _bi(&bi) {
    ADOBE_PRECONDITION(_type);
}

/**************************************************************************************************/

std::optional<std::int64_t> variable::as_int() const {
    using result_type = std::optional<std::int64_t>;
    return std::visit(overloaded{
                          [](std::monostate) -> result_type { return std::nullopt; },
                          [](bool x) -> result_type { return x ? 1 : 0; },
                          [](std::int64_t x) -> result_type { return x; },
                          [](std::uint64_t x) -> result_type { return static_cast<std::int64_t>(x); },
                          [](double) -> result_type { return std::nullopt; },
                          [](const std::string&) -> result_type { return std::nullopt; },
                      },
                      _value);
}

std::optional<std::uint64_t> variable::as_uint() const {
    using result_type = std::optional<std::uint64_t>;
    return std::visit(overloaded{
                          [](std::monostate) -> result_type { return std::nullopt; },
                          [](bool x) -> result_type { return x ? 1 : 0; },
                          [](std::int64_t x) -> result_type { return static_cast<std::uint64_t>(x); },
                          [](std::uint64_t x) -> result_type { return x; },
                          [](double) -> result_type { return std::nullopt; },
                          [](const std::string&) -> result_type { return std::nullopt; },
                      },
                      _value);
}

/**************************************************************************************************/

std::string variable::unreadable_message() const {
    if (!_unreadable) return std::string();
    try {
        std::rethrow_exception(_unreadable);
    } catch (const std::exception& error) {
        return error.what();
    }
    return std::string();
}

/**************************************************************************************************/

std::uint64_t variable::ptr_size() const {
    return _bi->arch()._ptr_size;
}

/**************************************************************************************************/

std::uint64_t variable::pointer_value() const {
    if (_unreadable) std::rethrow_exception(_unreadable);
    if (_loaded) {
        if (auto p = std::get_if<std::uint64_t>(&_value)) return *p;
    }
    if (_addr == 0) throw nil_dereference(_name);
    return read_uint(*_mem, _addr, ptr_size());
}

/**************************************************************************************************/

variable variable::maybe_dereference() const {
    if (kind() != type_kind::pointer) return *this;

    ADOBE_INVARIANT(_type->_elem, "pointer type without a pointee");

    variable result(_name.empty() ? std::string() : "*" + _name, 0, *_type->_elem, *_mem, *_bi);
    result._owned_type = _owned_type;

    try {
        result._addr = pointer_value();
    } catch (const std::exception&) {
        result._unreadable = std::current_exception();
    }

    return result;
}

/**************************************************************************************************/

std::optional<variable> variable::struct_member(std::string_view name) const {
    if (kind() != type_kind::structure) return std::nullopt;

    const gscope::field* member = _type->field_named(name);
    if (!member) return std::nullopt;

    variable result(member->_name, _addr + member->_offset, *member->_type, *_mem, *_bi);
    result._owned_type = _owned_type;

    // a member of a struct that isn't there can't be read either.
    if (_addr == 0) {
        result._unreadable =
            _unreadable ? _unreadable : std::make_exception_ptr(nil_dereference(_name));
    }

    return result;
}

/**************************************************************************************************/

const variable* variable::field(std::string_view name) const {
    if (kind() != type_kind::structure) return nullptr;

    const gscope::field* member = _type->field_named(name);
    if (!member) return nullptr;

    // children of a struct are loaded in member order.
    const std::size_t index = member - _type->fields().data();
    return index < _children.size() ? &_children[index] : nullptr;
}

/**************************************************************************************************/

void variable::load(const load_config& cfg) {
    ZoneScoped;

    load_value(cfg, 0);
}

/**************************************************************************************************/

void variable::load_value(const load_config& cfg, int level) {
    if (_loaded || _unreadable) return;

    _loaded = true;

    try {
        if (_addr == 0 && _type->_size != 0) throw nil_dereference(_name);

        switch (_type->_kind) {
            case type_kind::boolean:
                _value = read_uint(*_mem, _addr, _type->_size) != 0;
                break;
            case type_kind::sint:
                _value = read_int(*_mem, _addr, _type->_size);
                break;
            case type_kind::uint:
            case type_kind::function:
                _value = read_uint(*_mem, _addr, _type->_size);
                break;
            case type_kind::floating:
                _value = read_float(*_mem, _addr, _type->_size);
                break;
            case type_kind::string:
                load_string(cfg);
                break;
            case type_kind::pointer:
                load_pointer(cfg, level);
                break;
            case type_kind::structure:
                load_struct(cfg, level);
                break;
            case type_kind::array:
                _len = _cap = _type->_count;
                check_depth(cfg, level);
                load_elements(_addr, _type->_count, cfg, level);
                break;
            case type_kind::slice:
                load_slice(cfg, level);
                break;
            case type_kind::map:
                load_map(cfg, level);
                break;
            case type_kind::invalid:
                throw std::runtime_error("invalid type " + _type->_name);
        }
    } catch (const std::exception&) {
        _unreadable = std::current_exception();
    }
}

/**************************************************************************************************/

void variable::load_pointer(const load_config& cfg, int level) {
    const auto target = read_uint(*_mem, _addr, ptr_size());
    _value = target;

    if (!cfg._follow_pointers || target == 0) return;

    variable pointee = maybe_dereference();

    if (level < cfg._max_variable_recurse) {
        pointee.load_value(cfg, level + 1);
    } else {
        pointee._unreadable =
            std::make_exception_ptr(load_limit_error("maximum recursion depth reached"));
    }

    _children.push_back(std::move(pointee));
}

/**************************************************************************************************/

void variable::load_struct(const load_config& cfg, int level) {
    check_depth(cfg, level);

    const auto& fields = _type->fields();
    _len = fields.size();

    const auto n = clamp_count(fields.size(), cfg._max_struct_fields);
    _children.reserve(n);

    for (std::size_t i{0}; i < n; ++i) {
        const auto& member = fields[i];
        variable child(member._name, _addr + member._offset, *member._type, *_mem, *_bi);
        child._owned_type = _owned_type;
        child.load_value(cfg, level + 1);
        _children.push_back(std::move(child));
    }
}

/**************************************************************************************************/

void variable::load_string(const load_config& cfg) {
    const auto ptr = ptr_size();
    const auto data = read_uint(*_mem, _addr, ptr);
    const auto len = read_int(*_mem, _addr + ptr, ptr);

    if (len < 0) throw std::runtime_error("invalid string length " + std::to_string(len));

    _len = len;

    const auto n = clamp_count(len, cfg._max_string_len);
    std::string result(n, '\0');

    if (n) {
        if (data == 0) throw nil_dereference(_name);
        _mem->read_memory(std::as_writable_bytes(std::span<char>(result.data(), n)), data);
    }

    _value = std::move(result);
}

/**************************************************************************************************/

void variable::load_slice(const load_config& cfg, int level) {
    const auto ptr = ptr_size();
    const auto base = read_uint(*_mem, _addr, ptr);
    const auto len = read_int(*_mem, _addr + ptr, ptr);
    const auto cap = read_int(*_mem, _addr + 2 * ptr, ptr);

    if (len < 0 || cap < 0 || len > cap) {
        throw std::runtime_error("invalid slice length " + std::to_string(len) + " or capacity " +
                                 std::to_string(cap));
    }

    _len = len;
    _cap = cap;

    check_depth(cfg, level);

    if (len != 0 && base == 0) throw nil_dereference(_name);

    load_elements(base, len, cfg, level);
}

/**************************************************************************************************/

void variable::load_elements(std::uint64_t base,
                             std::uint64_t count,
                             const load_config& cfg,
                             int level) {
    ADOBE_INVARIANT(_type->_elem, "collection type without an element type");

    const type& elem = *_type->_elem;
    const auto n = clamp_count(count, cfg._max_array_values);
    _children.reserve(n);

    for (std::uint64_t i{0}; i < n; ++i) {
        variable child(std::string(), base + i * elem._size, elem, *_mem, *_bi);
        child._owned_type = _owned_type;
        child.load_value(cfg, level + 1);
        _children.push_back(std::move(child));
    }
}

/**************************************************************************************************/
// Maps are a pointer to a runtime hash map header. The header has the entry `count`, the log2 of
// the bucket count `B`, and the `buckets` array. Each bucket has `tophash`, `keys`, `values`,
// and an `overflow` pointer to the next bucket in its chain. Children are emitted as alternating
// key/value pairs. A map in the middle of growing is only read from its new buckets.
void variable::load_map(const load_config& cfg, int level) {
    ADOBE_INVARIANT(_type->_map_header && _type->_key && _type->_elem, "incomplete map type");

    const auto header_addr = read_uint(*_mem, _addr, ptr_size());
    _value = header_addr;

    if (header_addr == 0) return; // nil map

    variable header(std::string(), header_addr, *_type->_map_header, *_mem, *_bi);
    auto count_var = header.struct_member("count");
    auto shift_var = header.struct_member("B");
    auto buckets_var = header.struct_member("buckets");

    if (!count_var || !shift_var || !buckets_var) {
        throw std::runtime_error("unsupported map header layout for " + _type->_name);
    }

    const type* bucket_type = buckets_var->real_type()._elem;

    if (buckets_var->kind() != type_kind::pointer || !bucket_type ||
        bucket_type->_kind != type_kind::structure) {
        throw std::runtime_error("unsupported map bucket layout for " + _type->_name);
    }

    const auto count = static_cast<std::int64_t>(scalar_value(*count_var));
    const auto shift = scalar_value(*shift_var);

    if (count < 0) throw std::runtime_error("invalid map length " + std::to_string(count));
    if (shift > max_bucket_shift_k) throw std::runtime_error("invalid map bucket count");

    _len = count;

    check_depth(cfg, level);

    const auto limit = clamp_count(count, cfg._max_array_values);
    if (limit == 0) return;

    const auto buckets_addr = scalar_value(*buckets_var);
    const std::uint64_t nbuckets = std::uint64_t(1) << shift;

    // In a sane map every overflow bucket holds at least one entry, so visiting more buckets than
    // this means the overflow chain is corrupt (or a cycle.)
    const std::uint64_t max_visits = nbuckets + limit;
    std::uint64_t visits{0};
    std::uint64_t entries{0};

    for (std::uint64_t i{0}; i < nbuckets && entries < limit; ++i) {
        std::uint64_t addr = buckets_addr + i * bucket_type->_size;

        while (addr != 0 && entries < limit) {
            if (++visits > max_visits) throw load_limit_error("map bucket chain too long");

            variable bucket(std::string(), addr, *bucket_type, *_mem, *_bi);
            auto tophash = bucket.struct_member("tophash");
            auto keys = bucket.struct_member("keys");
            auto values = bucket.struct_member("values");
            auto overflow = bucket.struct_member("overflow");

            if (!tophash || !keys || !values || !overflow) {
                throw std::runtime_error("unsupported map bucket layout for " + _type->_name);
            }

            const auto slots =
                tophash->kind() == type_kind::array ? tophash->real_type()._count : bucket_count_k;

            for (std::uint64_t j{0}; j < slots && entries < limit; ++j) {
                if (read_uint(*_mem, tophash->addr() + j, 1) < min_top_hash_k) continue;

                variable key(std::string(), keys->addr() + j * _type->_key->_size, *_type->_key,
                             *_mem, *_bi);
                variable value(std::string(), values->addr() + j * _type->_elem->_size,
                               *_type->_elem, *_mem, *_bi);
                key._owned_type = _owned_type;
                value._owned_type = _owned_type;
                key.load_value(cfg, level + 1);
                value.load_value(cfg, level + 1);
                _children.push_back(std::move(key));
                _children.push_back(std::move(value));
                ++entries;
            }

            addr = read_uint(*_mem, overflow->addr(), ptr_size());
        }
    }
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
