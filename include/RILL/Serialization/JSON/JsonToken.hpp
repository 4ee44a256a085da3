#pragma once

#include <RILL/Defines.hpp>
#include <RILL/Math/BigInt.hpp>
#include <RILL/Primitives.hpp>
#include <RILL/Serialization/Core/Location.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace RILL::Serialization
{
    /// @brief Numeric literal in its narrowest exact representation.
    class RILL_BASE_API JsonNumber
    {
    public:
        enum class Type : UInt8
        {
            Double,
            Integer,
            BigInt,
        };

        JsonNumber() noexcept = default;

        [[nodiscard]] static JsonNumber MakeDouble(F64 value) noexcept { return JsonNumber(Storage {std::in_place_index<0>, value}); }
        [[nodiscard]] static JsonNumber MakeInteger(Int64 value) noexcept { return JsonNumber(Storage {std::in_place_index<1>, value}); }
        [[nodiscard]] static JsonNumber MakeBigInt(Math::BigInt value)
        {
            return JsonNumber(Storage {std::in_place_index<2>, std::move(value)});
        }

        [[nodiscard]] Type GetType() const noexcept { return static_cast<Type>(m_value.index()); }

        /// @name Checked accessors
        /// Throw `std::bad_variant_access` when the number holds another representation.
        /// @{
        [[nodiscard]] F64                 AsDouble() const { return std::get<0>(m_value); }
        [[nodiscard]] Int64               AsInteger() const { return std::get<1>(m_value); }
        [[nodiscard]] const Math::BigInt& AsBigInt() const { return std::get<2>(m_value); }
        /// @}

        /// @brief Converts any representation to double.
        [[nodiscard]] F64 ToDouble() const;

        [[nodiscard]] std::string ToString() const;

        [[nodiscard]] bool operator==(const JsonNumber& other) const { return m_value == other.m_value; }

    private:
        using Storage = std::variant<F64, Int64, Math::BigInt>;

        explicit JsonNumber(Storage value) noexcept
            : m_value(std::move(value))
        {
        }

        Storage m_value {0.0};
    };

    /// @brief One lexical element of JSON text together with the location where it starts.
    ///
    /// String payloads are views that stay valid only until the lexer advances; copy them out
    /// to retain them.
    class RILL_BASE_API JsonToken
    {
    public:
        enum class Kind : UInt8
        {
            None,
            Error,
            Null,
            Boolean,
            Number,
            String,
            ObjectStart,
            ObjectEnd,
            ArrayStart,
            ArrayEnd,
            Colon,
            Comma,
        };

        JsonToken() noexcept = default;

        [[nodiscard]] static JsonToken MakeError(std::string message, const Location& location)
        {
            return JsonToken(Kind::Error, Payload {std::in_place_index<4>, std::move(message)}, location);
        }
        [[nodiscard]] static JsonToken MakeNull(const Location& location) noexcept { return JsonToken(Kind::Null, {}, location); }
        [[nodiscard]] static JsonToken MakeBoolean(bool value, const Location& location) noexcept
        {
            return JsonToken(Kind::Boolean, Payload {std::in_place_index<1>, value}, location);
        }
        [[nodiscard]] static JsonToken MakeNumber(JsonNumber value, const Location& location)
        {
            return JsonToken(Kind::Number, Payload {std::in_place_index<2>, std::move(value)}, location);
        }
        [[nodiscard]] static JsonToken MakeString(std::string_view value, const Location& location) noexcept
        {
            return JsonToken(Kind::String, Payload {std::in_place_index<3>, value}, location);
        }
        [[nodiscard]] static JsonToken MakeObjectStart(const Location& location) noexcept { return JsonToken(Kind::ObjectStart, {}, location); }
        [[nodiscard]] static JsonToken MakeObjectEnd(const Location& location) noexcept { return JsonToken(Kind::ObjectEnd, {}, location); }
        [[nodiscard]] static JsonToken MakeArrayStart(const Location& location) noexcept { return JsonToken(Kind::ArrayStart, {}, location); }
        [[nodiscard]] static JsonToken MakeArrayEnd(const Location& location) noexcept { return JsonToken(Kind::ArrayEnd, {}, location); }
        [[nodiscard]] static JsonToken MakeColon(const Location& location) noexcept { return JsonToken(Kind::Colon, {}, location); }
        [[nodiscard]] static JsonToken MakeComma(const Location& location) noexcept { return JsonToken(Kind::Comma, {}, location); }

        [[nodiscard]] Kind            GetKind() const noexcept { return m_kind; }
        [[nodiscard]] const Location& GetLocation() const noexcept { return m_location; }

        /// @name Checked accessors
        /// Throw `std::bad_variant_access` when the token is of another kind.
        /// @{
        [[nodiscard]] bool               AsBoolean() const { return std::get<1>(m_payload); }
        [[nodiscard]] const JsonNumber&  AsNumber() const { return std::get<2>(m_payload); }
        [[nodiscard]] std::string_view   AsString() const { return std::get<3>(m_payload); }
        [[nodiscard]] const std::string& ErrorMessage() const { return std::get<4>(m_payload); }
        /// @}

        /// @brief Compares kind and payload; locations are ignored.
        [[nodiscard]] bool operator==(const JsonToken& other) const
        {
            return m_kind == other.m_kind && m_payload == other.m_payload;
        }

        /// @brief Renders `[file(line:column) value]` for diagnostics.
        [[nodiscard]] std::string ToString() const;

    private:
        using Payload = std::variant<std::monostate, bool, JsonNumber, std::string_view, std::string>;

        JsonToken(Kind kind, Payload payload, const Location& location) noexcept
            : m_kind(kind), m_payload(std::move(payload)), m_location(location)
        {
        }

        Kind     m_kind {Kind::None};
        Payload  m_payload {};
        Location m_location {};
    };

    [[nodiscard]] RILL_BASE_API std::string_view ToString(JsonToken::Kind kind) noexcept;

    RILL_BASE_API std::ostream& operator<<(std::ostream& os, const JsonNumber& number);
    RILL_BASE_API std::ostream& operator<<(std::ostream& os, const JsonToken& token);
}// namespace RILL::Serialization
