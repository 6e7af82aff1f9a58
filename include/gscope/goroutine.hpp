// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

// application
#include "gscope/ancestor.hpp"
#include "gscope/capabilities.hpp"
#include "gscope/defer.hpp"
#include "gscope/variable.hpp"

//--------------------------------------------------------------------------------------------------

namespace gscope {

//--------------------------------------------------------------------------------------------------
// Goroutine states, as numbered by the runtime. Values outside the list are kept as-is and print
// as "unknown".
enum class g_status : std::uint64_t {
    idle = 0,
    runnable = 1, // on a run queue
    running = 2,
    syscall = 3,
    waiting = 4,
    moribund_unused = 5, // unused, but hardcoded in gdb scripts
    dead = 6,
    enqueue = 7,
    copy_stack = 8, // newstack is moving the stack
};

const char* to_string(g_status status);

//--------------------------------------------------------------------------------------------------
// a return address saved by a (pre Go 1.9) stack barrier.
struct saved_lr {
    std::uint64_t _ptr{0};
    std::uint64_t _val{0};
};

//--------------------------------------------------------------------------------------------------
// The parts of a runtime `g` struct we care about.
struct goroutine {
    std::int64_t _id{0};
    std::uint64_t _pc{0}; // when parked
    std::uint64_t _sp{0}; // when parked
    std::uint64_t _bp{0}; // when parked. 0 when the runtime doesn't save it.
    std::uint64_t _go_pc{0}; // the `go` statement that created this goroutine
    std::uint64_t _start_pc{0}; // the first function run on this goroutine
    std::string _wait_reason;
    g_status _status{g_status::idle};
    std::optional<std::uint64_t> _stack_hi;
    std::optional<std::uint64_t> _stack_lo;
    std::optional<variable> _stkbar_var; // removed in Go 1.9
    std::optional<std::int64_t> _stkbar_pos; // removed in Go 1.9
    location _current_loc;
    std::optional<std::uint32_t> _thread_id; // the thread running this goroutine, if known
    std::optional<variable> _variable;
    std::exception_ptr _unreadable;

    bool unreadable() const { return static_cast<bool>(_unreadable); }

    // the top-most deferred call, if there is one.
    std::optional<defer_record> top_defer() const;

    // The location the user's code is at, or was at before entering the runtime. Falls back to
    // `_current_loc`.
    location user_current(const stack_walker& walker) const;

    // the location of the `go` statement that spawned this goroutine.
    location go_location() const;

    location start_location() const;

    // Saved return addresses of the legacy stack barriers. Empty when the runtime has none. Throws
    // if they are present but cannot be decoded.
    std::vector<saved_lr> stkbar() const;

    // Up to `n` ancestors of this goroutine. Empty when the runtime doesn't track them.
    std::vector<ancestor> ancestors(int n) const;
};

//--------------------------------------------------------------------------------------------------
// Decodes the goroutine `v` is bound to (either the `g` struct or a pointer to it.) Throws
// `no_goroutine` for a null goroutine pointer; throws whatever made the `g` struct unreadable.
goroutine parse_g(variable v);

// Binds a variable to the goroutine the thread is currently running.
variable g_variable(thread& t);

// Binds `runtime.g` at `gaddr`. If `deref` is set, `gaddr` holds a pointer to the `g` and the
// variable gets a (synthetic) pointer type.
variable new_g_variable(thread& t, std::uint64_t gaddr, bool deref);

// `parse_g(g_variable(t))`, remembering the thread on the result.
goroutine thread_goroutine(thread& t);

//--------------------------------------------------------------------------------------------------

} // namespace gscope

//--------------------------------------------------------------------------------------------------
