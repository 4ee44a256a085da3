#include <RILL/Serialization/JSON/JsonParserNode.hpp>

namespace RILL::Serialization
{
    std::string_view ToString(JsonParserNode::Kind kind) noexcept
    {
        switch (kind)
        {
            case JsonParserNode::Kind::None: return "None";
            case JsonParserNode::Kind::Key: return "Key";
            case JsonParserNode::Kind::Literal: return "Literal";
            case JsonParserNode::Kind::ObjectStart: return "ObjectStart";
            case JsonParserNode::Kind::ObjectEnd: return "ObjectEnd";
            case JsonParserNode::Kind::ArrayStart: return "ArrayStart";
            case JsonParserNode::Kind::ArrayEnd: return "ArrayEnd";
        }
        return "Unknown";
    }

    std::string JsonParserNode::ToString() const
    {
        switch (m_kind)
        {
            case Kind::Key:
                return "[key \"" + std::string(AsKey()) + "\"]";
            case Kind::Literal:
                return AsLiteral().ToString();
            default:
                return std::string(Serialization::ToString(m_kind));
        }
    }

    std::ostream& operator<<(std::ostream& os, const JsonParserNode& node)
    {
        return os << node.ToString();
    }
}// namespace RILL::Serialization
