#pragma once

#include <RILL/Primitives.hpp>

#include <type_traits>

namespace RILL::Serialization
{
    /// @brief Lexer behaviour flags.
    enum class LexOptions : UInt8
    {
        None          = 0,
        /// @brief Maintain line and column for every token.
        TrackLocation = 1 << 0,
        /// @brief Report malformed input as a terminal `Error` token instead of throwing.
        NoThrow       = 1 << 1,
        /// @brief Represent integers outside the Int64 range as `Math::BigInt` instead of double.
        UseBigInt     = 1 << 2,
        Defaults      = TrackLocation,
    };

    [[nodiscard]] constexpr LexOptions operator|(LexOptions lhs, LexOptions rhs) noexcept
    {
        using U = std::underlying_type_t<LexOptions>;
        return static_cast<LexOptions>(static_cast<U>(lhs) | static_cast<U>(rhs));
    }

    [[nodiscard]] constexpr LexOptions operator&(LexOptions lhs, LexOptions rhs) noexcept
    {
        using U = std::underlying_type_t<LexOptions>;
        return static_cast<LexOptions>(static_cast<U>(lhs) & static_cast<U>(rhs));
    }

    constexpr LexOptions& operator|=(LexOptions& lhs, LexOptions rhs) noexcept
    {
        lhs = lhs | rhs;
        return lhs;
    }

    [[nodiscard]] constexpr bool HasFlag(LexOptions options, LexOptions flag) noexcept
    {
        return (options & flag) == flag;
    }

    /// @brief Streaming parser configuration.
    struct JsonParserOptions
    {
        LexOptions lexOptions {LexOptions::Defaults};
        /// @brief Maximum container nesting; 0 disables the limit.
        UIntSize   maxDepth {0};
    };
}// namespace RILL::Serialization
