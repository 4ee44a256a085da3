#pragma once

#include <RILL/Primitives.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace RILL::Serialization
{
    /// @brief Position of a token or error in the input.
    ///
    /// Line and column are zero-based; the column counts input bytes. `offset` is the number of
    /// bytes consumed before the position and is maintained even when line tracking is off.
    /// `file` is a non-owning view of the source identifier supplied to the lexer.
    struct Location
    {
        std::string_view file {};
        UIntSize         line {0};
        UIntSize         column {0};
        UIntSize         offset {0};

        /// @brief Renders `file(line:column)`.
        [[nodiscard]] std::string ToString() const
        {
            std::string result;
            result.reserve(file.size() + 24);
            result.append(file);
            result.push_back('(');
            result.append(std::to_string(line));
            result.push_back(':');
            result.append(std::to_string(column));
            result.push_back(')');
            return result;
        }

        [[nodiscard]] constexpr bool operator==(const Location& other) const noexcept = default;
    };

    inline std::ostream& operator<<(std::ostream& os, const Location& location)
    {
        return os << location.ToString();
    }
}// namespace RILL::Serialization
