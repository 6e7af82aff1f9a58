// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>
#include <stdexcept>
#include <string>

//--------------------------------------------------------------------------------------------------

namespace gscope {

//--------------------------------------------------------------------------------------------------
// A read of the debugged process' memory failed.
struct memory_error : std::runtime_error {
    memory_error(std::uint64_t address, std::size_t size);

    // prefixes the message with what was being read.
    memory_error(const memory_error& error, const std::string& context);

    std::uint64_t _address{0};
    std::size_t _size{0};
};

// Something tried to read through a null pointer.
struct nil_dereference : std::runtime_error {
    explicit nil_dereference(const std::string& name);
};

// A bounded load stopped at this node.
struct load_limit_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The type system has no type by this name.
struct type_not_found : std::runtime_error {
    explicit type_not_found(const std::string& name);
};

// The goroutine pointer is null, e.g., the thread is not running Go code right now. `_thread_id`
// is 0 when the memory being read does not belong to a known thread.
struct no_goroutine : std::runtime_error {
    explicit no_goroutine(std::uint32_t thread_id);

    std::uint32_t _thread_id{0};
};

//--------------------------------------------------------------------------------------------------

} // namespace gscope

//--------------------------------------------------------------------------------------------------
