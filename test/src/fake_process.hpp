#pragma once

// stdc++
#include <cstring>
#include <deque>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// application
#include "gscope/capabilities.hpp"
#include "gscope/errors.hpp"
#include "gscope/goroutine.hpp"
#include "gscope/type.hpp"

//--------------------------------------------------------------------------------------------------
// In-memory stand-ins for the debugger capabilities, plus a miniature 64-bit Go runtime type
// layout to decode against.
namespace gscope_test {

//--------------------------------------------------------------------------------------------------
// Sparse byte-addressed memory. Reading any byte that was never written fails.
struct fake_memory : gscope::memory_reader {
    void read_memory(std::span<std::byte> buffer, std::uint64_t address) override {
        for (std::size_t i{0}; i < buffer.size(); ++i) {
            auto found = _bytes.find(address + i);
            if (found == _bytes.end()) throw gscope::memory_error(address, buffer.size());
            buffer[i] = found->second;
        }
    }

    void write(std::uint64_t address, const void* p, std::size_t n) {
        const auto* bytes = static_cast<const std::byte*>(p);
        for (std::size_t i{0}; i < n; ++i) {
            _bytes[address + i] = bytes[i];
        }
    }

    // little-endian hosts only, like the rest of the fixtures.
    template <typename T>
    void put(std::uint64_t address, T value) {
        write(address, &value, sizeof(T));
    }

    // a string header at `address` pointing at the bytes of `s` at `data`.
    void put_string(std::uint64_t address, std::uint64_t data, const std::string& s) {
        put<std::uint64_t>(address, data);
        put<std::int64_t>(address + 8, static_cast<std::int64_t>(s.size()));
        write(data, s.data(), s.size());
    }

    void put_slice(std::uint64_t address, std::uint64_t base, std::int64_t len, std::int64_t cap) {
        put<std::uint64_t>(address, base);
        put<std::int64_t>(address + 8, len);
        put<std::int64_t>(address + 16, cap);
    }

    void erase(std::uint64_t address, std::size_t n) {
        for (std::size_t i{0}; i < n; ++i) {
            _bytes.erase(address + i);
        }
    }

    std::map<std::uint64_t, std::byte> _bytes;
};

//--------------------------------------------------------------------------------------------------

struct fake_binary_info : gscope::binary_info {
    gscope::architecture arch() const override { return _arch; }

    const gscope::type& find_type(std::string_view name) const override {
        auto found = _named.find(std::string(name));
        if (found == _named.end()) throw gscope::type_not_found(std::string(name));
        return *found->second;
    }

    std::optional<gscope::global_variable> find_global(std::string_view name) const override {
        auto found = _globals.find(std::string(name));
        if (found == _globals.end()) return std::nullopt;
        return found->second;
    }

    gscope::source_line pc_to_line(std::uint64_t pc) const override {
        gscope::source_line result;
        result._fn = pc_to_func(pc);
        auto found = _lines.find(pc);
        if (found != _lines.end()) {
            result._file = found->second.first;
            result._line = found->second.second;
        }
        return result;
    }

    const gscope::function* pc_to_func(std::uint64_t pc) const override {
        for (const auto& fn : _functions) {
            if (pc >= fn._entry && pc < fn._end) return &fn;
        }
        return nullptr;
    }

    std::string const_description(const gscope::type& t, std::int64_t value) const override {
        auto found = _consts.find({&t, value});
        return found == _consts.end() ? std::string() : found->second;
    }

    std::uint64_t g_struct_offset() const override { return _g_struct_offset; }

    // makes a type and registers it under its name.
    gscope::type& add_type(gscope::type_kind kind, std::string name, std::uint64_t size) {
        gscope::type& result = _types.make(kind, name, size);
        _named[std::move(name)] = &result;
        return result;
    }

    const gscope::function& add_function(std::string name, std::uint64_t entry, std::uint64_t end) {
        return _functions.emplace_back(gscope::function{std::move(name), entry, end});
    }

    void add_line(std::uint64_t pc, std::string file, int line) {
        _lines[pc] = {std::move(file), line};
    }

    gscope::architecture _arch;
    gscope::type_arena _types;
    std::map<std::string, const gscope::type*> _named;
    std::deque<gscope::function> _functions;
    std::map<std::uint64_t, std::pair<std::string, int>> _lines;
    std::map<std::pair<const gscope::type*, std::int64_t>, std::string> _consts;
    std::map<std::string, gscope::global_variable> _globals;
    std::uint64_t _g_struct_offset{0};
};

//--------------------------------------------------------------------------------------------------

struct fake_thread : gscope::thread {
    fake_thread(std::uint32_t id, gscope::memory_reader& mem, const fake_binary_info& bi)
        : _id{id}, _mem{mem}, _bi{bi} {}

    void read_memory(std::span<std::byte> buffer, std::uint64_t address) override {
        _mem.read_memory(buffer, address);
    }

    std::uint32_t thread_id() const override { return _id; }

    gscope::registers read_registers() override { return _regs; }

    const gscope::binary_info& bin_info() const override { return _bi; }

    std::uint32_t _id{0};
    gscope::memory_reader& _mem;
    const fake_binary_info& _bi;
    gscope::registers _regs;
};

//--------------------------------------------------------------------------------------------------

struct fake_stack_iterator : gscope::stack_iterator {
    explicit fake_stack_iterator(const std::vector<gscope::stack_frame>& frames)
        : _frames{frames} {}

    bool next() override {
        if (_n >= _frames.size()) return false;
        _current = _frames[_n++];
        return true;
    }

    const gscope::stack_frame& frame() const override { return _current; }

    const std::vector<gscope::stack_frame>& _frames;
    std::size_t _n{0};
    gscope::stack_frame _current;
};

struct fake_stack_walker : gscope::stack_walker {
    std::unique_ptr<gscope::stack_iterator> frames(const gscope::goroutine&) const override {
        if (_broken) throw std::runtime_error("stack walk failed");
        return std::make_unique<fake_stack_iterator>(_frames);
    }

    // adds a frame whose call site is in `fn`.
    void add_call(const gscope::function& fn, std::uint64_t pc) {
        gscope::stack_frame frame;
        frame._call = gscope::location{pc, "", 0, &fn};
        frame._current = frame._call;
        _frames.push_back(frame);
    }

    std::vector<gscope::stack_frame> _frames;
    bool _broken{false};
};

//--------------------------------------------------------------------------------------------------
// Which optional members the runtime.g layout carries. The default is a modern runtime.
struct runtime_options {
    bool _with_bp{true};
    bool _string_wait_reason{false};
    bool _atomic_status_struct{false};
    bool _with_stack{true};
    bool _with_defer{true};
    bool _with_ancestors{true};
    bool _with_stkbar{false};
};

// Offsets into runtime.g
constexpr std::uint64_t g_stack_k{0};
constexpr std::uint64_t g_sched_k{16};
constexpr std::uint64_t g_defer_k{40};
constexpr std::uint64_t g_goid_k{48};
constexpr std::uint64_t g_gopc_k{56};
constexpr std::uint64_t g_startpc_k{64};
constexpr std::uint64_t g_waitreason_k{72};
constexpr std::uint64_t g_atomicstatus_k{88};
constexpr std::uint64_t g_ancestors_k{96};
constexpr std::uint64_t g_stkbar_k{104};
constexpr std::uint64_t g_stkbarpos_k{128};
constexpr std::uint64_t g_size_k{136};

// Offsets into runtime._defer
constexpr std::uint64_t defer_siz_k{0};
constexpr std::uint64_t defer_sp_k{8};
constexpr std::uint64_t defer_pc_k{16};
constexpr std::uint64_t defer_fn_k{24};
constexpr std::uint64_t defer_link_k{32};

// Offsets into runtime.ancestorInfo
constexpr std::uint64_t ancestor_pcs_k{0};
constexpr std::uint64_t ancestor_goid_k{24};
constexpr std::uint64_t ancestor_size_k{40};

struct runtime_types {
    const gscope::type* _uintptr{nullptr};
    const gscope::type* _int64{nullptr};
    const gscope::type* _uint8{nullptr};
    const gscope::type* _wait_reason{nullptr};
    const gscope::type* _g{nullptr};
};

inline runtime_types add_runtime_types(fake_binary_info& bi, const runtime_options& options = {}) {
    using gscope::field;
    using gscope::type_kind;

    runtime_types result;

    const auto& uintptr = bi.add_type(type_kind::uint, "uintptr", 8);
    const auto& int64 = bi.add_type(type_kind::sint, "int64", 8);
    const auto& int32 = bi.add_type(type_kind::sint, "int32", 4);
    const auto& uint32 = bi.add_type(type_kind::uint, "uint32", 4);
    const auto& uint8 = bi.add_type(type_kind::uint, "uint8", 1);
    const auto& boolean = bi.add_type(type_kind::boolean, "bool", 1);
    const auto& string = bi.add_type(type_kind::string, "string", 16);

    result._uintptr = &uintptr;
    result._int64 = &int64;
    result._uint8 = &uint8;

    auto& stack = bi.add_type(type_kind::structure, "runtime.stack", 16);
    stack.set_fields({{"lo", 0, &uintptr}, {"hi", 8, &uintptr}});

    auto& gobuf = bi.add_type(type_kind::structure, "runtime.gobuf", 24);
    std::vector<field> gobuf_fields{{"sp", 0, &uintptr}, {"pc", 8, &uintptr}};
    if (options._with_bp) gobuf_fields.push_back({"bp", 16, &uintptr});
    gobuf.set_fields(std::move(gobuf_fields));

    auto& funcval = bi.add_type(type_kind::structure, "runtime.funcval", 8);
    funcval.set_fields({{"fn", 0, &uintptr}});

    auto& defer = bi.add_type(type_kind::structure, "runtime._defer", 40);
    const auto& defer_ptr = bi._types.pointer_to(defer, 8);
    defer.set_fields({{"siz", defer_siz_k, &int32},
                      {"started", 4, &boolean},
                      {"sp", defer_sp_k, &uintptr},
                      {"pc", defer_pc_k, &uintptr},
                      {"fn", defer_fn_k, &bi._types.pointer_to(funcval, 8)},
                      {"link", defer_link_k, &defer_ptr}});

    auto& ancestor_info = bi.add_type(type_kind::structure, "runtime.ancestorInfo", ancestor_size_k);
    ancestor_info.set_fields({{"pcs", ancestor_pcs_k, &bi._types.slice_of(uintptr, 8)},
                              {"goid", ancestor_goid_k, &int64},
                              {"gopc", 32, &uintptr}});
    const auto& ancestors_ptr =
        bi._types.pointer_to(bi._types.slice_of(ancestor_info, 8), 8);

    auto& stkbar = bi.add_type(type_kind::structure, "runtime.stkbar", 16);
    stkbar.set_fields({{"savedLRPtr", 0, &uintptr}, {"savedLRVal", 8, &uintptr}});

    if (options._string_wait_reason) {
        result._wait_reason = &string;
    } else {
        result._wait_reason = &bi.add_type(type_kind::uint, "runtime.waitReason", 1);
    }

    const gscope::type* status = &uint32;
    if (options._atomic_status_struct) {
        auto& atomic = bi.add_type(type_kind::structure, "internal/runtime/atomic.Uint32", 4);
        atomic.set_fields({{"value", 0, &uint32}});
        status = &atomic;
    }

    auto& g = bi.add_type(type_kind::structure, "runtime.g", g_size_k);
    std::vector<field> g_fields;
    if (options._with_stack) g_fields.push_back({"stack", g_stack_k, &stack});
    g_fields.push_back({"sched", g_sched_k, &gobuf});
    if (options._with_defer) g_fields.push_back({"_defer", g_defer_k, &defer_ptr});
    g_fields.push_back({"goid", g_goid_k, &int64});
    g_fields.push_back({"gopc", g_gopc_k, &uintptr});
    g_fields.push_back({"startpc", g_startpc_k, &uintptr});
    g_fields.push_back({"waitreason", g_waitreason_k, result._wait_reason});
    g_fields.push_back({"atomicstatus", g_atomicstatus_k, status});
    if (options._with_ancestors) g_fields.push_back({"ancestors", g_ancestors_k, &ancestors_ptr});
    if (options._with_stkbar) {
        g_fields.push_back({"stkbar", g_stkbar_k, &bi._types.slice_of(stkbar, 8)});
        g_fields.push_back({"stkbarPos", g_stkbarpos_k, &uintptr});
    }
    g.set_fields(std::move(g_fields));

    result._g = &g;
    return result;
}

//--------------------------------------------------------------------------------------------------
// The values written into a runtime.g image.
struct g_image {
    std::int64_t _goid{1};
    std::uint64_t _pc{0};
    std::uint64_t _sp{0};
    std::uint64_t _bp{0};
    std::uint64_t _gopc{0};
    std::uint64_t _startpc{0};
    std::uint32_t _status{0};
    std::uint8_t _wait_reason{0};
    std::uint64_t _stack_lo{0};
    std::uint64_t _stack_hi{0};
    std::uint64_t _defer{0};
    std::uint64_t _ancestors{0};
};

// Writes every byte of a runtime.g at `address`; the optional members get zeros.
inline void put_g(fake_memory& mem, std::uint64_t address, const g_image& g) {
    mem.write(address, std::vector<std::byte>(g_size_k).data(), g_size_k);
    mem.put<std::uint64_t>(address + g_stack_k, g._stack_lo);
    mem.put<std::uint64_t>(address + g_stack_k + 8, g._stack_hi);
    mem.put<std::uint64_t>(address + g_sched_k, g._sp);
    mem.put<std::uint64_t>(address + g_sched_k + 8, g._pc);
    mem.put<std::uint64_t>(address + g_sched_k + 16, g._bp);
    mem.put<std::uint64_t>(address + g_defer_k, g._defer);
    mem.put<std::int64_t>(address + g_goid_k, g._goid);
    mem.put<std::uint64_t>(address + g_gopc_k, g._gopc);
    mem.put<std::uint64_t>(address + g_startpc_k, g._startpc);
    mem.put<std::uint8_t>(address + g_waitreason_k, g._wait_reason);
    mem.put<std::uint32_t>(address + g_atomicstatus_k, g._status);
    mem.put<std::uint64_t>(address + g_ancestors_k, g._ancestors);
}

//--------------------------------------------------------------------------------------------------

} // namespace gscope_test

//--------------------------------------------------------------------------------------------------
