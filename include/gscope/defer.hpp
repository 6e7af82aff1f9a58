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

// application
#include "gscope/capabilities.hpp"
#include "gscope/variable.hpp"

//--------------------------------------------------------------------------------------------------

namespace gscope {

//--------------------------------------------------------------------------------------------------
// One entry of a goroutine's deferred call chain (a `runtime._defer` record.) The chain is a
// linked list; `next()` loads the following record on demand.
struct defer_record {
    // Binds and loads the record. `v` must be bound to the `_defer` struct itself, not a pointer.
    explicit defer_record(variable v);

    std::uint64_t _deferred_pc{0}; // `fn.fn`: the deferred function, or a wrapper of it
    std::uint64_t _defer_pc{0}; // address of the instruction that registered the defer
    std::uint64_t _sp{0}; // stack pointer when the function was deferred
    std::optional<std::int64_t> _arg_size; // `siz`, gone from newer runtimes
    variable _variable;
    std::exception_ptr _unreadable;

    bool unreadable() const { return static_cast<bool>(_unreadable); }

    // the next record in the chain, if any.
    std::optional<defer_record> next() const;

    // where the defer statement is.
    location defer_location() const;

    // the deferred function, or nullptr if the binary doesn't know it.
    const function* deferred_function() const;

private:
    std::optional<variable> _link;
};

//--------------------------------------------------------------------------------------------------

} // namespace gscope

//--------------------------------------------------------------------------------------------------
