#pragma once

#include <RILL/Defines.hpp>
#include <RILL/Exceptions/Exception.hpp>
#include <RILL/Serialization/Core/Location.hpp>
#include <RILL/Serialization/Core/ParseError.hpp>

#include <string>

namespace RILL::Serialization
{
    /// @brief Raised by the lexer, the parser and the node readers on malformed input.
    ///
    /// `what()` renders `file(line:column): message`. The exception owns a copy of the
    /// source identifier, so it stays valid after the lexer is gone.
    class RILL_BASE_API JsonException : public Exceptions::Exception
    {
    public:
        JsonException(std::string message, ParseErrorCode code, const Location& location);

        /// @brief Message without the location prefix.
        [[nodiscard]] const std::string& Message() const noexcept { return m_message; }
        [[nodiscard]] ParseErrorCode     GetCode() const noexcept { return m_code; }
        [[nodiscard]] Location           GetLocation() const noexcept;

        /// @brief Value form of the exception, for `Expected`-returning entry points.
        [[nodiscard]] ParseError ToParseError() const;

    private:
        std::string    m_message;
        std::string    m_file;
        Location       m_location;
        ParseErrorCode m_code;
    };
}// namespace RILL::Serialization
