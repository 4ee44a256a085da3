// This file belongs to the core module: fundamental type definitions.
#pragma once
#include <cstddef>
#include <cstdint>

namespace RILL
{
    /// @brief Represents a 64-bit unsigned integer.
    using UInt64 = std::uint64_t;
    /// @brief Represents a 32-bit unsigned integer.
    using UInt32 = std::uint32_t;
    /// @brief Represents a 16-bit unsigned integer.
    using UInt16 = std::uint16_t;
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Represents a 64-bit signed integer.
    using Int64 = std::int64_t;
    /// @brief Represents a 32-bit signed integer.
    using Int32 = std::int32_t;

    /// @brief Represents a raw input unit.
    using Byte = std::byte;

    /// @brief Represents a 64-bit floating point number.
    using F64 = double;

    using UIntSize = std::size_t;
    using IntSize  = std::ptrdiff_t;

    /// @brief Represents a Unicode scalar value decoded from an escape sequence.
    using CodePoint = char32_t;
}// namespace RILL
