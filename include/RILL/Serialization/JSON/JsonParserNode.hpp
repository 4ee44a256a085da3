#pragma once

#include <RILL/Defines.hpp>
#include <RILL/Primitives.hpp>
#include <RILL/Serialization/Core/Location.hpp>
#include <RILL/Serialization/JSON/JsonToken.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace RILL::Serialization
{
    /// @brief Structural element of a streamed JSON document.
    ///
    /// Valid documents produce node sequences of the form
    /// `value := Literal | ArrayStart value* ArrayEnd | ObjectStart (Key value)* ObjectEnd`.
    class RILL_BASE_API JsonParserNode
    {
    public:
        enum class Kind : UInt8
        {
            None,
            Key,
            Literal,
            ObjectStart,
            ObjectEnd,
            ArrayStart,
            ArrayEnd,
        };

        JsonParserNode() noexcept = default;

        [[nodiscard]] static JsonParserNode MakeKey(std::string_view key, const Location& location) noexcept
        {
            return JsonParserNode(Kind::Key, Payload {std::in_place_index<1>, key}, location);
        }
        [[nodiscard]] static JsonParserNode MakeLiteral(const JsonToken& token)
        {
            return JsonParserNode(Kind::Literal, Payload {std::in_place_index<2>, token}, token.GetLocation());
        }
        [[nodiscard]] static JsonParserNode MakeObjectStart(const Location& location) noexcept { return JsonParserNode(Kind::ObjectStart, {}, location); }
        [[nodiscard]] static JsonParserNode MakeObjectEnd(const Location& location) noexcept { return JsonParserNode(Kind::ObjectEnd, {}, location); }
        [[nodiscard]] static JsonParserNode MakeArrayStart(const Location& location) noexcept { return JsonParserNode(Kind::ArrayStart, {}, location); }
        [[nodiscard]] static JsonParserNode MakeArrayEnd(const Location& location) noexcept { return JsonParserNode(Kind::ArrayEnd, {}, location); }

        [[nodiscard]] Kind            GetKind() const noexcept { return m_kind; }
        [[nodiscard]] const Location& GetLocation() const noexcept { return m_location; }

        /// @brief Field name; throws `std::bad_variant_access` unless the node is a `Key`.
        [[nodiscard]] std::string_view AsKey() const { return std::get<1>(m_payload); }

        /// @brief Literal token; throws `std::bad_variant_access` unless the node is a `Literal`.
        [[nodiscard]] const JsonToken& AsLiteral() const { return std::get<2>(m_payload); }

        [[nodiscard]] bool operator==(const JsonParserNode& other) const
        {
            return m_kind == other.m_kind && m_payload == other.m_payload;
        }

        [[nodiscard]] std::string ToString() const;

    private:
        using Payload = std::variant<std::monostate, std::string_view, JsonToken>;

        JsonParserNode(Kind kind, Payload payload, const Location& location) noexcept
            : m_kind(kind), m_payload(std::move(payload)), m_location(location)
        {
        }

        Kind     m_kind {Kind::None};
        Payload  m_payload {};
        Location m_location {};
    };

    [[nodiscard]] RILL_BASE_API std::string_view ToString(JsonParserNode::Kind kind) noexcept;

    RILL_BASE_API std::ostream& operator<<(std::ostream& os, const JsonParserNode& node);
}// namespace RILL::Serialization
