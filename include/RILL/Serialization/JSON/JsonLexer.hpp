#pragma once

#include <RILL/Defines.hpp>
#include <RILL/IO/IByteReader.hpp>
#include <RILL/Primitives.hpp>
#include <RILL/Serialization/Core/InputCursor.hpp>
#include <RILL/Serialization/Core/Location.hpp>
#include <RILL/Serialization/Core/ParseError.hpp>
#include <RILL/Serialization/Core/PullIterator.hpp>
#include <RILL/Serialization/JSON/JsonOptions.hpp>
#include <RILL/Serialization/JSON/JsonToken.hpp>

#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace RILL::Serialization
{
    /// @brief Lazy tokenizer turning JSON text into a sequence of `JsonToken`s.
    ///
    /// @details
    /// The lexer is a pull source: `HasNext` skips whitespace and reports whether a token
    /// follows, `Peek` recognizes the current token (idempotent until `Advance`), and
    /// `Advance` discards it. Only one token is buffered at a time.
    ///
    /// For contiguous input, strings without escapes are returned as views into the input.
    /// Escaped strings, and all strings read from an `IO::IByteReader`, are decoded into a
    /// buffer owned by the lexer and remain valid until the next `Advance`.
    ///
    /// On malformed input the lexer throws `JsonException`. With `LexOptions::NoThrow` it
    /// instead yields one `JsonToken::Kind::Error` token and discards the remaining input.
    class RILL_BASE_API JsonLexer
    {
    public:
        using ValueType = JsonToken;

        explicit JsonLexer(std::string_view input, LexOptions options = LexOptions::Defaults, std::string_view file = {});
        explicit JsonLexer(std::span<const RILL::Byte> input, LexOptions options = LexOptions::Defaults, std::string_view file = {});

        /// @brief Streams from @p reader, which must outlive the lexer.
        explicit JsonLexer(IO::IByteReader& reader, LexOptions options = LexOptions::Defaults, std::string_view file = {},
                           UIntSize chunkSize = InputCursor::DefaultChunkSize);

        JsonLexer(const JsonLexer&)            = delete;
        JsonLexer& operator=(const JsonLexer&) = delete;

        /// @brief True while a token, possibly an `Error` token, remains.
        [[nodiscard]] bool HasNext();

        /// @brief Current token. Throws `JsonException` at end of input.
        [[nodiscard]] const JsonToken& Peek();

        /// @brief Discards the current token.
        void Advance();

        /// @brief Location of the next unread input byte.
        [[nodiscard]] Location GetLocation() const noexcept { return m_cursor.GetLocation(); }

        [[nodiscard]] LexOptions GetOptions() const noexcept { return m_options; }
        [[nodiscard]] bool       IsContiguous() const noexcept { return m_cursor.IsContiguous(); }

        /// @brief The error behind the terminal `Error` token, if one was produced.
        [[nodiscard]] const std::optional<ParseError>& GetLastError() const noexcept { return m_error; }

        [[nodiscard]] PullIterator<JsonLexer> begin() { return PullIterator<JsonLexer>(*this); }
        [[nodiscard]] std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

    private:
        void ReadToken();
        void Recognize();

        void ReadKeyword(std::string_view keyword, const Location& start);
        void ReadString(const Location& start);
        void ReadNumber(const Location& start);

        bool   ScanStringFast(const Location& start);
        void   DecodeString(const Location& start);
        void   DecodeEscape();
        UInt32 ReadHex4();

        [[noreturn]] void Fail(const char* message, ParseErrorCode code, const Location& location) const;
        [[noreturn]] void Fail(const char* message, ParseErrorCode code) const { Fail(message, code, m_cursor.GetLocation()); }

        [[nodiscard]] bool NoThrow() const noexcept { return HasFlag(m_options, LexOptions::NoThrow); }

        std::string               m_file;
        InputCursor               m_cursor;
        LexOptions                m_options;
        JsonToken                 m_front {};
        bool                      m_hasFront {false};
        bool                      m_failed {false};// terminal Error token consumed
        std::string               m_stringBuffer {};
        std::string               m_numberBuffer {};
        std::optional<ParseError> m_error {};
    };
}// namespace RILL::Serialization
