#pragma once

#include <RILL/Defines.hpp>
#include <RILL/IO/IByteReader.hpp>
#include <RILL/Primitives.hpp>
#include <RILL/Serialization/Core/ParseError.hpp>
#include <RILL/Serialization/Core/PullIterator.hpp>
#include <RILL/Serialization/JSON/JsonLexer.hpp>
#include <RILL/Serialization/JSON/JsonOptions.hpp>
#include <RILL/Serialization/JSON/JsonParserNode.hpp>

#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace RILL::Serialization
{
    /// @brief Streaming pull-parser turning a `JsonLexer` token sequence into `JsonParserNode`s.
    ///
    /// @details
    /// Nesting is tracked on an explicit container stack, so memory grows with the nesting
    /// depth only and arbitrarily deep documents never recurse. The parser looks at most one
    /// token ahead. Several top-level values may follow each other; the parser is exhausted
    /// once the stack is empty and the lexer has no more tokens. Structural errors throw
    /// `JsonException`; the parser has no sentinel mode.
    ///
    /// Key and literal string payloads are views that stay valid until the next `Advance`.
    class RILL_BASE_API JsonParser
    {
    public:
        using ValueType = JsonParserNode;

        /// @brief Parses tokens pulled from @p tokens, which must outlive the parser.
        explicit JsonParser(JsonLexer& tokens, const JsonParserOptions& options = {});

        explicit JsonParser(std::string_view input, const JsonParserOptions& options = {}, std::string_view file = {});
        explicit JsonParser(std::span<const RILL::Byte> input, const JsonParserOptions& options = {}, std::string_view file = {});
        explicit JsonParser(IO::IByteReader& reader, const JsonParserOptions& options = {}, std::string_view file = {});

        JsonParser(const JsonParser&)            = delete;
        JsonParser& operator=(const JsonParser&) = delete;

        [[nodiscard]] bool                  HasNext();
        [[nodiscard]] const JsonParserNode& Peek();
        void                                Advance();

        /// @brief Number of currently open containers.
        [[nodiscard]] UIntSize Depth() const noexcept { return m_stack.size(); }

        /// @brief Largest number of simultaneously open containers seen so far.
        [[nodiscard]] UIntSize MaxDepthReached() const noexcept { return m_maxDepthReached; }

        [[nodiscard]] JsonLexer&               Tokens() noexcept { return *m_tokens; }
        [[nodiscard]] const JsonParserOptions& GetOptions() const noexcept { return m_options; }

        [[nodiscard]] PullIterator<JsonParser> begin() { return PullIterator<JsonParser>(*this); }
        [[nodiscard]] std::default_sentinel_t  end() const noexcept { return std::default_sentinel; }

    private:
        enum class Container : UInt8
        {
            Object,
            Array,
        };

        void ReadNext();
        void ReadObjectMember();
        void ReadArrayElement();
        void ReadValue();
        void ReadKey();
        void Open(Container container, const JsonToken& token);
        void Close(const JsonToken& token);

        /// @brief Next token, or nullptr at end of input. Raises on a lexer `Error` token.
        [[nodiscard]] const JsonToken* NextToken();
        [[nodiscard]] const JsonToken& RequireToken(const char* message, ParseErrorCode code);

        void Emit(JsonParserNode node);

        [[noreturn]] void Fail(const std::string& message, ParseErrorCode code, const Location& location) const;

        std::unique_ptr<JsonLexer> m_ownedTokens;
        JsonLexer*                 m_tokens;
        JsonParserOptions          m_options;
        std::vector<Container>     m_stack {};
        JsonParserNode             m_node {};
        bool                       m_hasNode {false};
        JsonParserNode::Kind       m_previousKind {JsonParserNode::Kind::None};
        UIntSize                   m_maxDepthReached {0};
    };
}// namespace RILL::Serialization
