#include <RILL/Serialization/JSON/JsonParser.hpp>

#include <RILL/Serialization/JSON/JsonException.hpp>

#include <utility>

namespace RILL::Serialization
{
    JsonParser::JsonParser(JsonLexer& tokens, const JsonParserOptions& options)
        : m_tokens(&tokens), m_options(options)
    {
    }

    JsonParser::JsonParser(std::string_view input, const JsonParserOptions& options, std::string_view file)
        : m_ownedTokens(std::make_unique<JsonLexer>(input, options.lexOptions, file)),
          m_tokens(m_ownedTokens.get()),
          m_options(options)
    {
    }

    JsonParser::JsonParser(std::span<const RILL::Byte> input, const JsonParserOptions& options, std::string_view file)
        : m_ownedTokens(std::make_unique<JsonLexer>(input, options.lexOptions, file)),
          m_tokens(m_ownedTokens.get()),
          m_options(options)
    {
    }

    JsonParser::JsonParser(IO::IByteReader& reader, const JsonParserOptions& options, std::string_view file)
        : m_ownedTokens(std::make_unique<JsonLexer>(reader, options.lexOptions, file)),
          m_tokens(m_ownedTokens.get()),
          m_options(options)
    {
    }

    bool JsonParser::HasNext()
    {
        if (m_hasNode || !m_stack.empty())
            return true;
        return m_tokens->HasNext();
    }

    const JsonParserNode& JsonParser::Peek()
    {
        if (!m_hasNode)
        {
            if (!HasNext())
                throw JsonException("unexpected end of input", ParseErrorCode::UnexpectedEnd, m_tokens->GetLocation());
            ReadNext();
        }
        return m_node;
    }

    void JsonParser::Advance()
    {
        (void)Peek();
        m_hasNode = false;
    }

    void JsonParser::ReadNext()
    {
        if (m_stack.empty())
        {
            ReadValue();
            return;
        }
        if (m_stack.back() == Container::Object)
            ReadObjectMember();
        else
            ReadArrayElement();
    }

    void JsonParser::ReadObjectMember()
    {
        switch (m_previousKind)
        {
            case JsonParserNode::Kind::ObjectStart:
            {
                const JsonToken& token = RequireToken("missing closing '}'", ParseErrorCode::MissingClose);
                if (token.GetKind() == JsonToken::Kind::ObjectEnd)
                    Close(token);
                else
                    ReadKey();
                return;
            }
            case JsonParserNode::Kind::Key:
            {
                const JsonToken& token = RequireToken("missing closing '}'", ParseErrorCode::MissingClose);
                if (token.GetKind() != JsonToken::Kind::Colon)
                    Fail("expected ':'", ParseErrorCode::ExpectedColon, token.GetLocation());
                m_tokens->Advance();
                ReadValue();
                return;
            }
            default:
            {
                // a member value was just completed
                const JsonToken& token = RequireToken("missing closing '}'", ParseErrorCode::MissingClose);
                if (token.GetKind() == JsonToken::Kind::ObjectEnd)
                {
                    Close(token);
                    return;
                }
                if (token.GetKind() != JsonToken::Kind::Comma)
                    Fail("expected ',' or '}'", ParseErrorCode::ExpectedSeparator, token.GetLocation());
                m_tokens->Advance();
                ReadKey();
                return;
            }
        }
    }

    void JsonParser::ReadArrayElement()
    {
        const JsonToken& token = RequireToken("missing closing ']'", ParseErrorCode::MissingClose);
        if (token.GetKind() == JsonToken::Kind::ArrayEnd)
        {
            Close(token);
            return;
        }
        if (m_previousKind != JsonParserNode::Kind::ArrayStart)
        {
            if (token.GetKind() != JsonToken::Kind::Comma)
                Fail("expected ',' or ']'", ParseErrorCode::ExpectedSeparator, token.GetLocation());
            m_tokens->Advance();
            if (!m_tokens->HasNext())
                Fail("missing closing ']'", ParseErrorCode::MissingClose, m_tokens->GetLocation());
        }
        ReadValue();
    }

    void JsonParser::ReadValue()
    {
        const JsonToken* token = NextToken();
        if (token == nullptr)
            Fail("expected JSON value", ParseErrorCode::ExpectedValue, m_tokens->GetLocation());

        switch (token->GetKind())
        {
            case JsonToken::Kind::Null:
            case JsonToken::Kind::Boolean:
            case JsonToken::Kind::Number:
            case JsonToken::Kind::String:
                Emit(JsonParserNode::MakeLiteral(*token));
                m_tokens->Advance();
                return;
            case JsonToken::Kind::ObjectStart:
                Open(Container::Object, *token);
                return;
            case JsonToken::Kind::ArrayStart:
                Open(Container::Array, *token);
                return;
            default:
                Fail("expected JSON value", ParseErrorCode::ExpectedValue, token->GetLocation());
        }
    }

    void JsonParser::ReadKey()
    {
        const JsonToken& token = RequireToken("expected field name string", ParseErrorCode::ExpectedFieldName);
        if (token.GetKind() != JsonToken::Kind::String)
            Fail("expected field name string", ParseErrorCode::ExpectedFieldName, token.GetLocation());
        Emit(JsonParserNode::MakeKey(token.AsString(), token.GetLocation()));
        m_tokens->Advance();
    }

    void JsonParser::Open(Container container, const JsonToken& token)
    {
        if (m_options.maxDepth != 0 && m_stack.size() >= m_options.maxDepth)
            Fail("nesting depth exceeded", ParseErrorCode::DepthExceeded, token.GetLocation());

        if (container == Container::Object)
            Emit(JsonParserNode::MakeObjectStart(token.GetLocation()));
        else
            Emit(JsonParserNode::MakeArrayStart(token.GetLocation()));
        m_stack.push_back(container);
        if (m_stack.size() > m_maxDepthReached)
            m_maxDepthReached = m_stack.size();
        m_tokens->Advance();
    }

    void JsonParser::Close(const JsonToken& token)
    {
        if (m_stack.back() == Container::Object)
            Emit(JsonParserNode::MakeObjectEnd(token.GetLocation()));
        else
            Emit(JsonParserNode::MakeArrayEnd(token.GetLocation()));
        m_stack.pop_back();
        m_tokens->Advance();
    }

    const JsonToken* JsonParser::NextToken()
    {
        if (!m_tokens->HasNext())
            return nullptr;

        const JsonToken& token = m_tokens->Peek();
        if (token.GetKind() == JsonToken::Kind::Error)
        {
            const auto& lexerError = m_tokens->GetLastError();
            Fail("invalid token encountered: " + token.ErrorMessage(),
                 lexerError ? lexerError->code : ParseErrorCode::InvalidToken, token.GetLocation());
        }
        return &token;
    }

    const JsonToken& JsonParser::RequireToken(const char* message, ParseErrorCode code)
    {
        const JsonToken* token = NextToken();
        if (token == nullptr)
            Fail(message, code, m_tokens->GetLocation());
        return *token;
    }

    void JsonParser::Emit(JsonParserNode node)
    {
        m_node         = std::move(node);
        m_previousKind = m_node.GetKind();
        m_hasNode      = true;
    }

    void JsonParser::Fail(const std::string& message, ParseErrorCode code, const Location& location) const
    {
        throw JsonException(message, code, location);
    }
}// namespace RILL::Serialization
