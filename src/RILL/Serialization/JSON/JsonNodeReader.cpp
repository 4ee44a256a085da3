#include <RILL/Serialization/JSON/JsonNodeReader.hpp>

#include <RILL/Serialization/JSON/JsonException.hpp>

#include <cmath>

namespace RILL::Serialization
{
    const JsonParserNode& JsonNodeReader::Current()
    {
        if (!m_parser.HasNext())
            throw JsonException("unexpected end of input", ParseErrorCode::UnexpectedEnd, m_parser.Tokens().GetLocation());
        return m_parser.Peek();
    }

    void JsonNodeReader::Expect(JsonParserNode::Kind kind, const char* message)
    {
        const JsonParserNode& node = Current();
        if (node.GetKind() != kind)
            throw JsonException(message, ParseErrorCode::TypeMismatch, node.GetLocation());
    }

    const JsonToken& JsonNodeReader::ExpectLiteral(JsonToken::Kind kind, const char* message)
    {
        const JsonParserNode& node = Current();
        if (node.GetKind() != JsonParserNode::Kind::Literal || node.AsLiteral().GetKind() != kind)
            throw JsonException(message, ParseErrorCode::TypeMismatch, node.GetLocation());
        return node.AsLiteral();
    }

    void JsonNodeReader::SkipValue()
    {
        const JsonParserNode::Kind kind = Current().GetKind();
        m_parser.Advance();
        if (kind != JsonParserNode::Kind::ArrayStart && kind != JsonParserNode::Kind::ObjectStart)
            return;

        UIntSize depth = 1;
        while (depth > 0)
        {
            const JsonParserNode::Kind nested = Current().GetKind();
            m_parser.Advance();
            if (nested == JsonParserNode::Kind::ArrayStart || nested == JsonParserNode::Kind::ObjectStart)
                ++depth;
            else if (nested == JsonParserNode::Kind::ArrayEnd || nested == JsonParserNode::Kind::ObjectEnd)
                --depth;
        }
    }

    bool JsonNodeReader::SkipToKey(std::string_view key)
    {
        const JsonParserNode& first = Current();
        if (first.GetKind() == JsonParserNode::Kind::ObjectStart)
            m_parser.Advance();
        else if (first.GetKind() != JsonParserNode::Kind::Key)
            throw JsonException("expected object or object key", ParseErrorCode::TypeMismatch, first.GetLocation());

        while (true)
        {
            const JsonParserNode& node = Current();
            if (node.GetKind() == JsonParserNode::Kind::ObjectEnd)
            {
                m_parser.Advance();
                return false;
            }

            const bool found = node.AsKey() == key;
            m_parser.Advance();
            if (found)
                return true;
            SkipValue();
        }
    }

    F64 JsonNodeReader::ReadDouble()
    {
        const F64 value = ExpectLiteral(JsonToken::Kind::Number, "expected numeric value").AsNumber().ToDouble();
        m_parser.Advance();
        return value;
    }

    Int64 JsonNodeReader::ReadInteger()
    {
        const JsonToken&  token  = ExpectLiteral(JsonToken::Kind::Number, "expected numeric value");
        const JsonNumber& number = token.AsNumber();
        Int64             value  = 0;
        if (number.GetType() == JsonNumber::Type::Integer)
        {
            value = number.AsInteger();
        }
        else if (number.GetType() == JsonNumber::Type::Double && std::trunc(number.AsDouble()) == number.AsDouble()
                 && number.AsDouble() >= -9223372036854775808.0 && number.AsDouble() < 9223372036854775808.0)
        {
            value = static_cast<Int64>(number.AsDouble());
        }
        else
        {
            throw JsonException("expected integral value", ParseErrorCode::TypeMismatch, token.GetLocation());
        }
        m_parser.Advance();
        return value;
    }

    std::string JsonNodeReader::ReadString()
    {
        std::string value(ExpectLiteral(JsonToken::Kind::String, "expected string value").AsString());
        m_parser.Advance();
        return value;
    }

    bool JsonNodeReader::ReadBool()
    {
        const bool value = ExpectLiteral(JsonToken::Kind::Boolean, "expected boolean value").AsBoolean();
        m_parser.Advance();
        return value;
    }

    void JsonNodeReader::RequireNull()
    {
        (void)ExpectLiteral(JsonToken::Kind::Null, "expected null value");
        m_parser.Advance();
    }

    void JsonNodeReader::ExpectEnd()
    {
        // HasNext has already skipped whitespace; the trailing bytes are never lexed
        if (m_parser.HasNext())
            throw JsonException("unexpected characters following JSON", ParseErrorCode::TrailingCharacters,
                                m_parser.Tokens().GetLocation());
    }
}// namespace RILL::Serialization
