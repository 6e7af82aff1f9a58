// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/goroutine.hpp"

// stdc++
#include <cctype>
#include <stdexcept>
#include <string_view>

// application
#include "gscope/errors.hpp"
#include "gscope/log.hpp"
#include "gscope/settings.hpp"
#include "gscope/tracy.hpp"

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/
// Follows a dotted path (e.g., "sched.pc") through the loaded children of `v`.
const variable* member_at(const variable& v, std::string_view path) {
    const variable* result = &v;

    while (result) {
        const auto dot = path.find('.');
        result = result->field(path.substr(0, dot));
        if (dot == std::string_view::npos) break;
        path.remove_prefix(dot + 1);
    }

    return result;
}

/**************************************************************************************************/

std::uint64_t mandatory_uint(const variable& g, std::string_view path) {
    const variable* member = member_at(g, path);

    if (!member) throw std::runtime_error("runtime.g has no member " + std::string(path));
    if (member->unreadable()) std::rethrow_exception(member->unreadable_error());

    auto result = member->as_uint();
    if (!result) throw std::runtime_error("unexpected type for runtime.g " + std::string(path));

    return *result;
}

std::optional<std::uint64_t> optional_uint(const variable& g, std::string_view path) {
    const variable* member = member_at(g, path);
    if (!member || member->unreadable()) return std::nullopt;
    return member->as_uint();
}

/**************************************************************************************************/

std::string wait_reason(const variable& g) {
    const variable* member = g.field("waitreason");

    if (!member || member->unreadable()) return std::string();

    // Before Go 1.11 the wait reason is a string. After that it is an enum whose names live in
    // the binary's constants.
    if (const std::string* reason = member->as_string()) return *reason;

    if (member->real_type().is_integral()) {
        return g.bin_info().const_description(member->real_type(), member->as_int().value_or(0));
    }

    return std::string();
}

/**************************************************************************************************/
// Newer runtimes wrap the status word in an atomic struct.
g_status status(const variable& g) {
    const variable* member = g.field("atomicstatus");

    if (member && member->kind() == type_kind::structure) member = member->field("value");

    if (!member || member->unreadable()) return g_status::idle;

    return static_cast<g_status>(member->as_uint().value_or(0));
}

/**************************************************************************************************/

bool exported_runtime(std::string_view name) {
    constexpr std::string_view prefix_k{"runtime."};
    return name.size() > prefix_k.size() && name.substr(0, prefix_k.size()) == prefix_k &&
           std::isupper(static_cast<unsigned char>(name[prefix_k.size()]));
}

bool user_function(std::string_view name) {
    return name.find('.') != std::string_view::npos &&
           (name.substr(0, 8) != "runtime." || exported_runtime(name));
}

/**************************************************************************************************/
// upper bound on the stack barriers a goroutine can have.
constexpr int max_stkbar_k{1024};

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

const char* to_string(g_status status) {
    switch (status) {
        case g_status::idle:
            return "idle";
        case g_status::runnable:
            return "runnable";
        case g_status::running:
            return "running";
        case g_status::syscall:
            return "syscall";
        case g_status::waiting:
            return "waiting";
        case g_status::moribund_unused:
            return "moribund_unused";
        case g_status::dead:
            return "dead";
        case g_status::enqueue:
            return "enqueue";
        case g_status::copy_stack:
            return "copy_stack";
    }

    return "unknown";
}

/**************************************************************************************************/

goroutine parse_g(variable v) {
    ZoneScoped;

    std::uint64_t gaddr = v.addr();

    if (v.kind() == type_kind::pointer) {
        try {
            gaddr = read_uint(v.mem(), v.addr(), v.bin_info().arch()._ptr_size);
        } catch (const memory_error& error) {
            throw memory_error(error, "error derefing *G");
        }
    }

    if (gaddr == 0) throw no_goroutine(v.mem().owning_thread_id().value_or(0));

    while (v.kind() == type_kind::pointer) {
        v = v.maybe_dereference();
    }

    v.load(load_config{false, 2, 64, 0, -1});

    if (v.unreadable()) std::rethrow_exception(v.unreadable_error());

    const binary_info& bi = v.bin_info();
    goroutine result;

    result._pc = mandatory_uint(v, "sched.pc");
    result._sp = mandatory_uint(v, "sched.sp");
    result._id = static_cast<std::int64_t>(mandatory_uint(v, "goid"));
    result._go_pc = mandatory_uint(v, "gopc");
    result._start_pc = mandatory_uint(v, "startpc");

    if (auto bp = optional_uint(v, "sched.bp")) {
        result._bp = *bp;
    } else if (log_level_at_least(settings::log_level::verbose)) {
        cout_safe([&](auto& s) {
            s << "verbose: goroutine " << result._id << " has no saved frame pointer\n";
        });
    }

    result._wait_reason = wait_reason(v);
    result._status = status(v);

    if (v.field("stack")) {
        result._stack_hi = optional_uint(v, "stack.hi");
        result._stack_lo = optional_uint(v, "stack.lo");
    }

    result._stkbar_var = v.struct_member("stkbar");

    if (const variable* pos = v.field("stkbarPos"); pos && !pos->unreadable()) {
        result._stkbar_pos = pos->as_int();
    }

    result._current_loc = pc_location(bi, result._pc);
    result._variable = std::move(v);

    return result;
}

/**************************************************************************************************/

std::optional<defer_record> goroutine::top_defer() const {
    if (!_variable) return std::nullopt;

    auto field = _variable->struct_member("_defer");
    if (!field) return std::nullopt;

    variable record = field->maybe_dereference();
    if (record.unreadable() || record.addr() == 0) return std::nullopt;

    return defer_record(std::move(record));
}

/**************************************************************************************************/

location goroutine::user_current(const stack_walker& walker) const {
    try {
        auto frames = walker.frames(*this);

        while (frames->next()) {
            const location& call = frames->frame()._call;
            if (call._fn && user_function(call._fn->_name)) return call;
        }
    } catch (const std::exception& error) {
        if (log_level_at_least(settings::log_level::verbose)) {
            cout_safe([&](auto& s) {
                s << "verbose: goroutine " << _id << " stack walk failed: " << error.what()
                  << '\n';
            });
        }
    }

    return _current_loc;
}

/**************************************************************************************************/

location goroutine::go_location() const {
    if (!_variable) return location{_go_pc};

    const binary_info& bi = _variable->bin_info();
    std::uint64_t pc = _go_pc;

    // `gopc` is the return address of the call to newproc; back up into the `go` statement.
    if (const function* fn = bi.pc_to_func(pc); fn && pc > fn->_entry) --pc;

    location result = pc_location(bi, pc);
    result._pc = _go_pc;
    return result;
}

/**************************************************************************************************/

location goroutine::start_location() const {
    if (!_variable) return location{_start_pc};
    return pc_location(_variable->bin_info(), _start_pc);
}

/**************************************************************************************************/

std::vector<saved_lr> goroutine::stkbar() const {
    if (!_stkbar_var) return {};

    variable bars = *_stkbar_var;
    bars.load(load_config{false, 1, 0, max_stkbar_k, 3});

    if (bars.unreadable()) {
        throw std::runtime_error("unreadable stkbar: " + bars.unreadable_message());
    }

    if (bars.len() > bars.children().size() && log_level_at_least(settings::log_level::warning)) {
        cout_safe([&](auto& s) {
            s << "warning: goroutine " << _id << " has " << bars.len()
              << " stack barriers; reading the first " << bars.children().size() << '\n';
        });
    }

    std::vector<saved_lr> result;
    result.reserve(bars.children().size());

    for (const auto& bar : bars.children()) {
        if (bar.unreadable()) {
            throw std::runtime_error("unreadable stkbar entry: " + bar.unreadable_message());
        }

        saved_lr entry;

        for (const auto& member : bar.children()) {
            if (member.unreadable()) {
                throw std::runtime_error("unreadable stkbar entry: " + member.unreadable_message());
            }

            if (member.name() == "savedLRPtr") {
                entry._ptr = member.as_uint().value_or(0);
            } else if (member.name() == "savedLRVal") {
                entry._val = member.as_uint().value_or(0);
            }
        }

        result.push_back(entry);
    }

    return result;
}

/**************************************************************************************************/

std::vector<ancestor> goroutine::ancestors(int n) const {
    if (!_variable) return {};

    auto field = _variable->struct_member("ancestors");
    if (!field) return {};

    variable infos = field->maybe_dereference();

    if (infos.unreadable()) std::rethrow_exception(infos.unreadable_error());
    if (infos.addr() == 0) return {}; // tracking is off

    infos.load(load_config{false, 1, 0, n, -1});

    if (infos.unreadable()) std::rethrow_exception(infos.unreadable_error());

    std::vector<ancestor> result(infos.children().size());

    for (std::size_t i{0}; i < result.size(); ++i) {
        const variable& info = infos.children()[i];
        ancestor& entry = result[i];

        if (info.unreadable()) {
            entry._unreadable = info.unreadable_error();
            continue;
        }

        const variable* goid = info.field("goid");

        if (!goid) {
            entry._unreadable = std::make_exception_ptr(
                std::runtime_error("ancestor " + std::to_string(i) + " has no goid"));
            continue;
        }

        if (goid->unreadable()) {
            entry._unreadable = goid->unreadable_error();
            continue;
        }

        entry._id = goid->as_int().value_or(0);
        entry._pcs_var = info.struct_member("pcs");
    }

    return result;
}

/**************************************************************************************************/

variable new_g_variable(thread& t, std::uint64_t gaddr, bool deref) {
    const binary_info& bi = t.bin_info();
    const type& g_type = bi.find_type("runtime.g");

    if (!deref) return variable("runtime.curg", gaddr, g_type, t, bi);

    auto g_pointer = std::make_shared<type>();
    g_pointer->_kind = type_kind::pointer;
    g_pointer->_name = "*runtime.g";
    g_pointer->_size = t.arch()._ptr_size;
    g_pointer->_elem = &g_type;

    return variable(std::string(), gaddr, std::move(g_pointer), t, bi);
}

/**************************************************************************************************/

variable g_variable(thread& t) {
    const registers regs = t.read_registers();
    const architecture arch = t.arch();

    std::uint64_t gaddr{0};

    if (regs._g_addr) {
        gaddr = *regs._g_addr;
    } else {
        gaddr = read_uint(t, regs._tls + t.bin_info().g_struct_offset(), arch._ptr_size);
    }

    return new_g_variable(t, gaddr, arch._deref_tls);
}

/**************************************************************************************************/

goroutine thread_goroutine(thread& t) {
    goroutine result = parse_g(g_variable(t));
    result._thread_id = t.thread_id();
    return result;
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
