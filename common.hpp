#pragma once

#include <cstddef>

#define DISABLE_COPY(A)                                                                                                \
    A(const A &) = delete;                                                                                             \
    A &operator=(const A &) = delete;

#define DEFAULT_MOVE(A)                                                                                                \
    A(A &&) = default;                                                                                                 \
    A &operator=(A &&) = default;

namespace common
{
    // Bytes pulled from an input per read while sanitizing.
    constexpr size_t CHUNK_SIZE = 1 << 16;

    // Bytes sniffed from the head of a file for signature matching.
    constexpr size_t HEADER_SIZE = 64;

    template <typename... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };
}
