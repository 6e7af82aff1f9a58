// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstddef>
#include <cstring>
#include <span>
#include <stdexcept>
#include <utility>

// application
#include "gscope/features.hpp"

//--------------------------------------------------------------------------------------------------

namespace gscope {

/**************************************************************************************************/
// very minimal reader over a borrowed byte buffer. The reader never owns the bytes; whoever hands
// them in must keep them alive for as long as the reader (and any view it returns) is in use.
// Unlike a file reader this one does check bounds, since the bytes usually come from a debugged
// process and can't be trusted.
struct buffer_reader {
    buffer_reader() = default;

    explicit buffer_reader(std::span<const std::byte> data)
        : _f{data.data()}, _p{data.data()}, _l{data.data() + data.size()} {}

    // `<=` here because reading the last entry leaves the read head one past the end.
    explicit operator bool() const { return _f != nullptr && _p <= _l; }

    std::size_t size() const { return _l - _p; }

    std::size_t extent() const { return _l - _f; }

    std::size_t tellg() const { return _p - _f; }

    void seekg(std::size_t offset) {
        if (offset > extent()) throw std::runtime_error("seek past end of buffer");
        _p = _f + offset;
    }

    void read(void* p, std::size_t n) {
        require(n);
        std::memcpy(p, _p, n);
        _p += n;
    }

    // returns a view of the next `n` bytes without copying them.
    std::span<const std::byte> read_view(std::size_t n) {
        require(n);
        std::span<const std::byte> result(_p, n);
        _p += n;
        return result;
    }

private:
    void require(std::size_t n) const {
        if (size() < n) throw std::runtime_error("read past end of buffer");
    }

    const std::byte* _f{nullptr};
    const std::byte* _p{nullptr};
    const std::byte* _l{nullptr};
};

/**************************************************************************************************/

template <typename T>
void endian_swap(T& c) {
    char* first = reinterpret_cast<char*>(&c);
    char* last = first + sizeof(T);
    while (first != last) {
        --last;
        std::swap(*first, *last);
        ++first;
    }
}

/**************************************************************************************************/

template <typename T>
T read_pod(buffer_reader& s) {
    T x;
    s.read(&x, sizeof(T));
    return x;
}

// reads a little-endian value regardless of the host byte order.
template <typename T>
T read_le(buffer_reader& s) {
    T x = read_pod<T>(s);
    if constexpr (!GSCOPE_FEATURE(LITTLE_ENDIAN_HOST)) {
        endian_swap(x);
    }
    return x;
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
