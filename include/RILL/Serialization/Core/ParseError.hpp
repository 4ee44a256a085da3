#pragma once

#include <RILL/Primitives.hpp>
#include <RILL/Serialization/Core/Location.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace RILL::Serialization
{
    /// @brief Classification of lexical and structural failures.
    enum class ParseErrorCode : UInt8
    {
        None,
        UnexpectedEnd,
        UnexpectedCharacter,
        InvalidToken,
        InvalidNumber,
        InvalidStringEscape,
        InvalidUnicodeEscape,
        ControlCharacter,
        ExpectedValue,
        ExpectedFieldName,
        ExpectedColon,
        ExpectedSeparator,
        MissingClose,
        DepthExceeded,
        TrailingCharacters,
        TypeMismatch,
        InputError,
    };

    [[nodiscard]] constexpr std::string_view ToString(ParseErrorCode code) noexcept
    {
        switch (code)
        {
            case ParseErrorCode::None: return "None";
            case ParseErrorCode::UnexpectedEnd: return "UnexpectedEnd";
            case ParseErrorCode::UnexpectedCharacter: return "UnexpectedCharacter";
            case ParseErrorCode::InvalidToken: return "InvalidToken";
            case ParseErrorCode::InvalidNumber: return "InvalidNumber";
            case ParseErrorCode::InvalidStringEscape: return "InvalidStringEscape";
            case ParseErrorCode::InvalidUnicodeEscape: return "InvalidUnicodeEscape";
            case ParseErrorCode::ControlCharacter: return "ControlCharacter";
            case ParseErrorCode::ExpectedValue: return "ExpectedValue";
            case ParseErrorCode::ExpectedFieldName: return "ExpectedFieldName";
            case ParseErrorCode::ExpectedColon: return "ExpectedColon";
            case ParseErrorCode::ExpectedSeparator: return "ExpectedSeparator";
            case ParseErrorCode::MissingClose: return "MissingClose";
            case ParseErrorCode::DepthExceeded: return "DepthExceeded";
            case ParseErrorCode::TrailingCharacters: return "TrailingCharacters";
            case ParseErrorCode::TypeMismatch: return "TypeMismatch";
            case ParseErrorCode::InputError: return "InputError";
        }
        return "Unknown";
    }

    /// @brief Parsing error payload with code, location, and message.
    ///
    /// Unlike `Location`, the error owns its source identifier so it can outlive the lexer
    /// that produced it; `location.file` is left empty and `GetLocation` re-attaches `file`.
    struct ParseError
    {
        ParseErrorCode code {ParseErrorCode::None};
        Location       location {};
        std::string    file {};
        std::string    message {};

        [[nodiscard]] Location GetLocation() const noexcept
        {
            Location result = location;
            result.file     = file;
            return result;
        }

        /// @brief Renders `file(line:column): message`.
        [[nodiscard]] std::string ToString() const
        {
            return GetLocation().ToString() + ": " + message;
        }
    };

    inline std::ostream& operator<<(std::ostream& os, const ParseError& error)
    {
        return os << error.ToString();
    }
}// namespace RILL::Serialization
