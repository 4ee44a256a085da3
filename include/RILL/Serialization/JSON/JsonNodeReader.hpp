#pragma once

#include <RILL/Defines.hpp>
#include <RILL/Primitives.hpp>
#include <RILL/Serialization/JSON/JsonParser.hpp>
#include <RILL/Serialization/JSON/JsonParserNode.hpp>

#include <string>
#include <string_view>

namespace RILL::Serialization
{
    /// @brief Typed reading helpers layered on a `JsonParser` node stream.
    ///
    /// @details
    /// Every helper consumes exactly the nodes of the value it reads and throws
    /// `JsonException` with `ParseErrorCode::TypeMismatch` when the current node is not of the
    /// requested kind, or `ParseErrorCode::UnexpectedEnd` when the stream is exhausted.
    ///
    /// @code
    /// JsonParser parser(R"({"name": "rill", "tags": ["a", "b"]})");
    /// JsonNodeReader reader(parser);
    /// reader.ReadObject([&](std::string_view key) {
    ///     if (key == "name")
    ///         name = reader.ReadString();
    ///     else
    ///         reader.SkipValue();
    /// });
    /// reader.ExpectEnd();
    /// @endcode
    class RILL_BASE_API JsonNodeReader
    {
    public:
        explicit JsonNodeReader(JsonParser& parser) noexcept
            : m_parser(parser)
        {
        }

        [[nodiscard]] JsonParser& Parser() noexcept { return m_parser; }

        /// @brief Skips one complete value, including all nested containers.
        void SkipValue();

        /// @brief Skips object members until @p key.
        ///
        /// The stream must be positioned at an object start or at a key inside an object.
        /// @return true with the stream positioned at the member value, or false with the
        ///         object end consumed when the key is absent.
        bool SkipToKey(std::string_view key);

        /// @brief Invokes @p onElement once per element; the callback must consume it.
        template <typename F>
        void ReadArray(F&& onElement)
        {
            Expect(JsonParserNode::Kind::ArrayStart, "expected array");
            m_parser.Advance();
            while (Current().GetKind() != JsonParserNode::Kind::ArrayEnd)
                onElement();
            m_parser.Advance();
        }

        /// @brief Invokes @p onMember with each key; the callback must consume the value.
        ///
        /// The key view is only valid until the callback starts consuming the value.
        template <typename F>
        void ReadObject(F&& onMember)
        {
            Expect(JsonParserNode::Kind::ObjectStart, "expected object");
            m_parser.Advance();
            while (Current().GetKind() != JsonParserNode::Kind::ObjectEnd)
            {
                const std::string_view key = Current().AsKey();
                m_parser.Advance();
                onMember(key);
            }
            m_parser.Advance();
        }

        [[nodiscard]] F64         ReadDouble();
        [[nodiscard]] Int64       ReadInteger();
        [[nodiscard]] std::string ReadString();
        [[nodiscard]] bool        ReadBool();
        void                      RequireNull();

        /// @brief Requires the node stream to be exhausted.
        void ExpectEnd();

    private:
        [[nodiscard]] const JsonParserNode& Current();
        [[nodiscard]] const JsonToken&      ExpectLiteral(JsonToken::Kind kind, const char* message);
        void                                Expect(JsonParserNode::Kind kind, const char* message);

        JsonParser& m_parser;
    };
}// namespace RILL::Serialization
