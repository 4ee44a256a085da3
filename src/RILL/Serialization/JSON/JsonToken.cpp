#include <RILL/Serialization/JSON/JsonToken.hpp>

#include <charconv>
#include <sstream>

namespace RILL::Serialization
{
    F64 JsonNumber::ToDouble() const
    {
        switch (GetType())
        {
            case Type::Double:
                return AsDouble();
            case Type::Integer:
                return static_cast<F64>(AsInteger());
            case Type::BigInt:
                return AsBigInt().ToDouble();
        }
        RILL::Unreachable();
    }

    std::string JsonNumber::ToString() const
    {
        switch (GetType())
        {
            case Type::Double:
            {
                // shortest form that round-trips
                char buffer[32];
                const auto result = std::to_chars(buffer, buffer + sizeof(buffer), AsDouble());
                return std::string(buffer, result.ptr);
            }
            case Type::Integer:
                return std::to_string(AsInteger());
            case Type::BigInt:
                return AsBigInt().ToString();
        }
        RILL::Unreachable();
    }

    std::string_view ToString(JsonToken::Kind kind) noexcept
    {
        switch (kind)
        {
            case JsonToken::Kind::None: return "None";
            case JsonToken::Kind::Error: return "Error";
            case JsonToken::Kind::Null: return "Null";
            case JsonToken::Kind::Boolean: return "Boolean";
            case JsonToken::Kind::Number: return "Number";
            case JsonToken::Kind::String: return "String";
            case JsonToken::Kind::ObjectStart: return "ObjectStart";
            case JsonToken::Kind::ObjectEnd: return "ObjectEnd";
            case JsonToken::Kind::ArrayStart: return "ArrayStart";
            case JsonToken::Kind::ArrayEnd: return "ArrayEnd";
            case JsonToken::Kind::Colon: return "Colon";
            case JsonToken::Kind::Comma: return "Comma";
        }
        return "Unknown";
    }

    std::string JsonToken::ToString() const
    {
        std::ostringstream os;
        os << '[' << m_location << ' ';
        switch (m_kind)
        {
            case Kind::Boolean:
                os << (AsBoolean() ? "true" : "false");
                break;
            case Kind::Null:
                os << "null";
                break;
            case Kind::Number:
                os << AsNumber();
                break;
            case Kind::String:
                os << '"' << AsString() << '"';
                break;
            case Kind::Error:
                os << "Error: " << ErrorMessage();
                break;
            default:
                os << Serialization::ToString(m_kind);
                break;
        }
        os << ']';
        return os.str();
    }

    std::ostream& operator<<(std::ostream& os, const JsonNumber& number)
    {
        return os << number.ToString();
    }

    std::ostream& operator<<(std::ostream& os, const JsonToken& token)
    {
        return os << token.ToString();
    }
}// namespace RILL::Serialization
