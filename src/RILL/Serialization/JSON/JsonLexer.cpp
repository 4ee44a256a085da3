#include <RILL/Serialization/JSON/JsonLexer.hpp>

#include <RILL/Serialization/JSON/JsonException.hpp>

#include <charconv>
#include <limits>
#include <string>
#include <string_view>

namespace RILL::Serialization
{
    namespace
    {
        [[nodiscard]] bool IsDigit(char c) noexcept
        {
            return c >= '0' && c <= '9';
        }

        [[nodiscard]] bool IsHexDigit(char c) noexcept
        {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        [[nodiscard]] UInt32 HexValue(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return static_cast<UInt32>(c - '0');
            if (c >= 'a' && c <= 'f')
                return static_cast<UInt32>(c - 'a' + 10);
            return static_cast<UInt32>(c - 'A' + 10);
        }

        [[nodiscard]] bool IsStringSpecial(char c) noexcept
        {
            return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
        }

        void AppendUtf8(std::string& out, UInt32 codepoint)
        {
            if (codepoint <= 0x7F)
            {
                out.push_back(static_cast<char>(codepoint));
                return;
            }
            if (codepoint <= 0x7FF)
            {
                out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
                return;
            }
            if (codepoint <= 0xFFFF)
            {
                out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
                out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
                return;
            }
            out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }

        /// @brief Result for a syntactically valid number that does not fit a double.
        ///
        /// Overflow and underflow are told apart by the decimal exponent of the first
        /// significant digit; only the sign of the text is carried over.
        [[nodiscard]] F64 OutOfRangeDouble(std::string_view text) noexcept
        {
            const bool negative = !text.empty() && text.front() == '-';
            Int64      scale    = 0;// decimal exponent of the first significant digit, plus one
            bool       seenDot  = false;
            bool       seenSignificant = false;
            UIntSize   i        = negative ? 1 : 0;
            for (; i < text.size() && text[i] != 'e' && text[i] != 'E'; ++i)
            {
                const char c = text[i];
                if (c == '.')
                    seenDot = true;
                else if (!seenSignificant && c == '0')
                    scale -= seenDot ? 1 : 0;
                else if (!seenSignificant)
                {
                    seenSignificant = true;
                    scale += seenDot ? 0 : 1;
                }
                else if (!seenDot)
                    ++scale;
            }

            Int64 exponent = 0;
            if (i < text.size())
            {
                ++i;
                const bool negativeExponent = i < text.size() && text[i] == '-';
                if (i < text.size() && (text[i] == '-' || text[i] == '+'))
                    ++i;
                for (; i < text.size(); ++i)
                {
                    if (exponent < 1000000)
                        exponent = exponent * 10 + (text[i] - '0');
                }
                if (negativeExponent)
                    exponent = -exponent;
            }

            const F64 magnitude = (seenSignificant && scale + exponent > 0) ? std::numeric_limits<F64>::infinity() : 0.0;
            return negative ? -magnitude : magnitude;
        }

        constexpr UInt64 kInt64Max          = static_cast<UInt64>(std::numeric_limits<Int64>::max());
        constexpr UInt64 kInt64MinMagnitude = kInt64Max + 1;
    }// namespace

    JsonLexer::JsonLexer(std::string_view input, LexOptions options, std::string_view file)
        : m_file(file), m_cursor(input, HasFlag(options, LexOptions::TrackLocation)), m_options(options)
    {
        m_cursor.SetFile(m_file);
    }

    JsonLexer::JsonLexer(std::span<const RILL::Byte> input, LexOptions options, std::string_view file)
        : m_file(file), m_cursor(input, HasFlag(options, LexOptions::TrackLocation)), m_options(options)
    {
        m_cursor.SetFile(m_file);
    }

    JsonLexer::JsonLexer(IO::IByteReader& reader, LexOptions options, std::string_view file, UIntSize chunkSize)
        : m_file(file), m_cursor(reader, HasFlag(options, LexOptions::TrackLocation), chunkSize), m_options(options)
    {
        m_cursor.SetFile(m_file);
    }

    bool JsonLexer::HasNext()
    {
        if (m_hasFront)
            return true;
        if (m_failed)
            return false;

        m_cursor.SkipWhitespace();
        if (!m_cursor.IsEof())
            return true;
        if (!m_cursor.HasInputError())
            return false;

        // surface the read failure as a token error
        ReadToken();
        return m_hasFront;
    }

    const JsonToken& JsonLexer::Peek()
    {
        if (!m_hasFront)
        {
            if (!HasNext())
                throw JsonException("unexpected end of input", ParseErrorCode::UnexpectedEnd, m_cursor.GetLocation());
            if (!m_hasFront)
                ReadToken();
        }
        return m_front;
    }

    void JsonLexer::Advance()
    {
        const JsonToken& current = Peek();
        if (current.GetKind() == JsonToken::Kind::Error)
            m_failed = true;
        m_hasFront = false;
    }

    void JsonLexer::ReadToken()
    {
        if (!NoThrow())
        {
            Recognize();
            m_hasFront = true;
            return;
        }

        try
        {
            Recognize();
        }
        catch (const JsonException& e)
        {
            m_cursor.Drain();
            m_error           = e.ToParseError();
            Location location = e.GetLocation();
            location.file     = m_file;
            m_front           = JsonToken::MakeError(e.Message(), location);
        }
        m_hasFront = true;
    }

    void JsonLexer::Recognize()
    {
        m_cursor.SkipWhitespace();
        const Location start = m_cursor.GetLocation();
        if (m_cursor.IsEof())
            Fail("unexpected end of input", ParseErrorCode::UnexpectedEnd, start);

        switch (m_cursor.Peek())
        {
            case '{':
                m_cursor.Advance();
                m_front = JsonToken::MakeObjectStart(start);
                return;
            case '}':
                m_cursor.Advance();
                m_front = JsonToken::MakeObjectEnd(start);
                return;
            case '[':
                m_cursor.Advance();
                m_front = JsonToken::MakeArrayStart(start);
                return;
            case ']':
                m_cursor.Advance();
                m_front = JsonToken::MakeArrayEnd(start);
                return;
            case ':':
                m_cursor.Advance();
                m_front = JsonToken::MakeColon(start);
                return;
            case ',':
                m_cursor.Advance();
                m_front = JsonToken::MakeComma(start);
                return;
            case 'n':
                ReadKeyword("null", start);
                m_front = JsonToken::MakeNull(start);
                return;
            case 't':
                ReadKeyword("true", start);
                m_front = JsonToken::MakeBoolean(true, start);
                return;
            case 'f':
                ReadKeyword("false", start);
                m_front = JsonToken::MakeBoolean(false, start);
                return;
            case '"':
                ReadString(start);
                return;
            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                ReadNumber(start);
                return;
            default:
                Fail("malformed token", ParseErrorCode::UnexpectedCharacter, start);
        }
    }

    void JsonLexer::ReadKeyword(std::string_view keyword, const Location& start)
    {
        for (const char expected : keyword)
        {
            if (m_cursor.IsEof() || m_cursor.Peek() != expected)
                Fail("malformed token", ParseErrorCode::InvalidToken, start);
            m_cursor.Advance();
        }
    }

    void JsonLexer::ReadString(const Location& start)
    {
        if (m_cursor.IsContiguous() && ScanStringFast(start))
            return;
        if (!m_cursor.IsContiguous())
        {
            m_stringBuffer.clear();
            m_cursor.Advance();
        }
        DecodeString(start);
    }

    bool JsonLexer::ScanStringFast(const Location& start)
    {
        const char* begin = m_cursor.CurrentPtr() + 1;
        const char* end   = m_cursor.EndPtr();
        const char* scan  = begin;
        while (scan < end && !IsStringSpecial(*scan))
            ++scan;

        const auto length = static_cast<UIntSize>(scan - begin);
        if (scan < end && *scan == '"')
        {
            m_cursor.AdvanceInLine(length + 2);
            m_front = JsonToken::MakeString(std::string_view(begin, length), start);
            return true;
        }

        // escape, control character or end of input: continue on the decoding path
        m_stringBuffer.assign(begin, length);
        m_cursor.AdvanceInLine(length + 1);
        return false;
    }

    void JsonLexer::DecodeString(const Location& start)
    {
        while (true)
        {
            if (m_cursor.IsEof())
                Fail("unterminated string literal", ParseErrorCode::UnexpectedEnd);

            // copy plain runs of the buffered chunk in one go
            const char* run = m_cursor.CurrentPtr();
            const char* end = m_cursor.EndPtr();
            const char* scan = run;
            while (scan < end && !IsStringSpecial(*scan))
                ++scan;
            if (scan != run)
            {
                m_stringBuffer.append(run, static_cast<UIntSize>(scan - run));
                m_cursor.AdvanceInLine(static_cast<UIntSize>(scan - run));
                continue;
            }

            const char c = m_cursor.Peek();
            if (c == '"')
            {
                m_cursor.Advance();
                m_front = JsonToken::MakeString(m_stringBuffer, start);
                return;
            }
            if (c == '\\')
            {
                m_cursor.Advance();
                DecodeEscape();
                continue;
            }
            Fail("control character in string literal", ParseErrorCode::ControlCharacter);
        }
    }

    void JsonLexer::DecodeEscape()
    {
        if (m_cursor.IsEof())
            Fail("unterminated string escape sequence", ParseErrorCode::UnexpectedEnd);

        const char c = m_cursor.Peek();
        switch (c)
        {
            case '"':
            case '\\':
            case '/':
                m_stringBuffer.push_back(c);
                m_cursor.Advance();
                return;
            case 'b':
                m_stringBuffer.push_back('\b');
                m_cursor.Advance();
                return;
            case 'f':
                m_stringBuffer.push_back('\f');
                m_cursor.Advance();
                return;
            case 'n':
                m_stringBuffer.push_back('\n');
                m_cursor.Advance();
                return;
            case 'r':
                m_stringBuffer.push_back('\r');
                m_cursor.Advance();
                return;
            case 't':
                m_stringBuffer.push_back('\t');
                m_cursor.Advance();
                return;
            case 'u':
                break;
            default:
                Fail("invalid string escape sequence", ParseErrorCode::InvalidStringEscape);
        }

        m_cursor.Advance();
        UInt32 codepoint = ReadHex4();
        if (codepoint >= 0xD800 && codepoint <= 0xDBFF)
        {
            if (m_cursor.IsEof() || m_cursor.Peek() != '\\')
                Fail("missing second UTF-16 surrogate", ParseErrorCode::InvalidUnicodeEscape);
            m_cursor.Advance();
            if (m_cursor.IsEof() || m_cursor.Peek() != 'u')
                Fail("missing second UTF-16 surrogate", ParseErrorCode::InvalidUnicodeEscape);
            m_cursor.Advance();

            const Location lowLocation = m_cursor.GetLocation();
            const UInt32   low         = ReadHex4();
            if (low < 0xDC00 || low > 0xDFFF)
                Fail("invalid UTF-16 surrogate sequence", ParseErrorCode::InvalidUnicodeEscape, lowLocation);
            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
        }
        else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF)
        {
            Fail("unpaired UTF-16 low surrogate", ParseErrorCode::InvalidUnicodeEscape);
        }
        AppendUtf8(m_stringBuffer, codepoint);
    }

    UInt32 JsonLexer::ReadHex4()
    {
        UInt32 value = 0;
        for (int i = 0; i < 4; ++i)
        {
            if (m_cursor.IsEof())
                Fail("premature end of unicode escape sequence", ParseErrorCode::UnexpectedEnd);
            const char c = m_cursor.Peek();
            if (!IsHexDigit(c))
                Fail("invalid character in unicode escape sequence", ParseErrorCode::InvalidUnicodeEscape);
            value = (value << 4) | HexValue(c);
            m_cursor.Advance();
        }
        return value;
    }

    void JsonLexer::ReadNumber(const Location& start)
    {
        m_numberBuffer.clear();

        const auto consumeDigit = [this]() {
            const char c = m_cursor.Peek();
            m_numberBuffer.push_back(c);
            m_cursor.Advance();
            return static_cast<UInt32>(c - '0');
        };
        const auto atDigit = [this]() {
            return !m_cursor.IsEof() && IsDigit(m_cursor.Peek());
        };

        bool negative = false;
        if (m_cursor.Peek() == '-')
        {
            negative = true;
            m_numberBuffer.push_back('-');
            m_cursor.Advance();
        }

        if (!atDigit())
            Fail("invalid number, expected digit", ParseErrorCode::InvalidNumber);

        UInt64 magnitude = 0;
        bool   overflow  = false;
        if (m_cursor.Peek() == '0')
        {
            consumeDigit();
            if (atDigit())
                Fail("invalid number, 0 must not be followed by another digit", ParseErrorCode::InvalidNumber);
        }
        else
        {
            while (atDigit())
            {
                const UInt32 digit = consumeDigit();
                if (overflow)
                    continue;
                if (magnitude > (std::numeric_limits<UInt64>::max() - digit) / 10)
                    overflow = true;
                else
                    magnitude = magnitude * 10 + digit;
            }
        }

        bool isInteger = true;
        if (!m_cursor.IsEof() && m_cursor.Peek() == '.')
        {
            isInteger = false;
            m_numberBuffer.push_back('.');
            m_cursor.Advance();
            if (!atDigit())
                Fail("missing fractional number part", ParseErrorCode::InvalidNumber);
            while (atDigit())
                consumeDigit();
        }

        if (!m_cursor.IsEof() && (m_cursor.Peek() == 'e' || m_cursor.Peek() == 'E'))
        {
            isInteger = false;
            m_numberBuffer.push_back('e');
            m_cursor.Advance();
            if (!m_cursor.IsEof() && (m_cursor.Peek() == '+' || m_cursor.Peek() == '-'))
            {
                m_numberBuffer.push_back(m_cursor.Peek());
                m_cursor.Advance();
            }
            if (!atDigit())
                Fail("missing exponent", ParseErrorCode::InvalidNumber);
            while (atDigit())
                consumeDigit();
        }

        if (isInteger && !overflow)
        {
            if (!negative && magnitude <= kInt64Max)
            {
                m_front = JsonToken::MakeNumber(JsonNumber::MakeInteger(static_cast<Int64>(magnitude)), start);
                return;
            }
            if (negative && magnitude <= kInt64MinMagnitude)
            {
                const Int64 value = magnitude == kInt64MinMagnitude
                                            ? std::numeric_limits<Int64>::min()
                                            : -static_cast<Int64>(magnitude);
                m_front = JsonToken::MakeNumber(JsonNumber::MakeInteger(value), start);
                return;
            }
        }

        if (isInteger && HasFlag(m_options, LexOptions::UseBigInt))
        {
            m_front = JsonToken::MakeNumber(JsonNumber::MakeBigInt(Math::BigInt(std::string_view(m_numberBuffer))), start);
            return;
        }

        const char* first = m_numberBuffer.data();
        const char* last  = first + m_numberBuffer.size();
        F64         value = 0.0;
        const auto  result = std::from_chars(first, last, value, std::chars_format::general);
        if (result.ec == std::errc::result_out_of_range)
        {
            value = OutOfRangeDouble(m_numberBuffer);
        }
        else if (result.ec != std::errc {} || result.ptr != last)
        {
            Fail("invalid number", ParseErrorCode::InvalidNumber, start);
        }
        m_front = JsonToken::MakeNumber(JsonNumber::MakeDouble(value), start);
    }

    void JsonLexer::Fail(const char* message, ParseErrorCode code, const Location& location) const
    {
        if (m_cursor.HasInputError())
        {
            throw JsonException("input read failed: " + m_cursor.InputError().message,
                                ParseErrorCode::InputError, m_cursor.GetLocation());
        }
        throw JsonException(message, code, location);
    }
}// namespace RILL::Serialization
