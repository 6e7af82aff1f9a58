// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

// application
#include "gscope/type.hpp"

//--------------------------------------------------------------------------------------------------
// The interfaces below are supplied by the surrounding debugger. Nothing in gscope implements
// them for a real process; tests substitute in-memory fakes.
namespace gscope {

/**************************************************************************************************/

struct memory_reader {
    virtual ~memory_reader() = default;

    // Fills `buffer` with the bytes at `address`. Throws `memory_error` if the full range cannot
    // be read.
    virtual void read_memory(std::span<std::byte> buffer, std::uint64_t address) = 0;

    // The id of the thread this memory is read through, if any.
    virtual std::optional<std::uint32_t> owning_thread_id() const { return std::nullopt; }
};

//--------------------------------------------------------------------------------------------------
// Guards another reader with a mutex, for callers that want to decode from several threads at
// once against a reader that isn't safe for concurrent use.
class serialized_memory : public memory_reader {
public:
    explicit serialized_memory(memory_reader& base) : _base{base} {}

    void read_memory(std::span<std::byte> buffer, std::uint64_t address) override {
        std::lock_guard<std::mutex> lock{_m};
        _base.read_memory(buffer, address);
    }

    std::optional<std::uint32_t> owning_thread_id() const override {
        return _base.owning_thread_id();
    }

private:
    memory_reader& _base;
    std::mutex _m;
};

/**************************************************************************************************/

struct function {
    std::string _name;
    std::uint64_t _entry{0};
    std::uint64_t _end{0};
};

struct source_line {
    std::string _file;
    int _line{0};
    const function* _fn{nullptr};
};

struct location {
    std::uint64_t _pc{0};
    std::string _file;
    int _line{0};
    const function* _fn{nullptr}; // owned by the binary info
};

std::ostream& operator<<(std::ostream& s, const location& x);

/**************************************************************************************************/

struct architecture {
    std::size_t _ptr_size{8};
    // true when the TLS slot holds the address of the goroutine pointer rather than the pointer
    // itself.
    bool _deref_tls{false};
};

struct global_variable {
    std::uint64_t _addr{0};
    const type* _type{nullptr};
};

struct binary_info {
    virtual ~binary_info() = default;

    virtual architecture arch() const = 0;

    // Throws `type_not_found`.
    virtual const type& find_type(std::string_view name) const = 0;

    virtual std::optional<global_variable> find_global(std::string_view name) const = 0;

    virtual source_line pc_to_line(std::uint64_t pc) const = 0;

    // returns nullptr when no function covers `pc`.
    virtual const function* pc_to_func(std::uint64_t pc) const = 0;

    // Describes `value` using the named constants of type `t`. Empty if nothing matches.
    virtual std::string const_description(const type& t, std::int64_t value) const = 0;

    // offset of the goroutine pointer from the thread local storage base.
    virtual std::uint64_t g_struct_offset() const = 0;
};

// `pc` with the file, line and function the binary reports for it.
location pc_location(const binary_info& bi, std::uint64_t pc);

/**************************************************************************************************/

struct registers {
    std::uint64_t _pc{0};
    std::uint64_t _sp{0};
    std::uint64_t _tls{0};
    // set on architectures that keep the goroutine pointer in a dedicated register.
    std::optional<std::uint64_t> _g_addr;
};

struct thread : memory_reader {
    virtual std::uint32_t thread_id() const = 0;

    virtual registers read_registers() = 0;

    virtual const binary_info& bin_info() const = 0;

    architecture arch() const { return bin_info().arch(); }

    std::optional<std::uint32_t> owning_thread_id() const override { return thread_id(); }
};

/**************************************************************************************************/

struct stack_frame {
    location _current;
    location _call;
};

struct stack_iterator {
    virtual ~stack_iterator() = default;
    virtual bool next() = 0;
    virtual const stack_frame& frame() const = 0;
};

struct goroutine;

struct stack_walker {
    virtual ~stack_walker() = default;

    // Throws if the goroutine's stack cannot be walked.
    virtual std::unique_ptr<stack_iterator> frames(const goroutine& g) const = 0;
};

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
