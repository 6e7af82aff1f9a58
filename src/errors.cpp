// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/errors.hpp"

// stdc++
#include <sstream>

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/

std::string memory_error_message(std::uint64_t address, std::size_t size) {
    std::stringstream s;
    s << "could not read " << size << " byte(s) at 0x" << std::hex << address;
    return s.str();
}

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

memory_error::memory_error(std::uint64_t address, std::size_t size)
    : std::runtime_error(memory_error_message(address, size)), _address{address}, _size{size} {}

memory_error::memory_error(const memory_error& error, const std::string& context)
    : std::runtime_error(context + ": " + error.what()), _address{error._address},
      _size{error._size} {}

nil_dereference::nil_dereference(const std::string& name)
    : std::runtime_error("nil pointer dereference" + (name.empty() ? "" : " (" + name + ")")) {}

type_not_found::type_not_found(const std::string& name)
    : std::runtime_error("could not find type " + name) {}

no_goroutine::no_goroutine(std::uint32_t thread_id)
    : std::runtime_error("no G executing on thread " + std::to_string(thread_id)),
      _thread_id{thread_id} {}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
