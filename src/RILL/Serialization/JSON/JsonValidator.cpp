#include <RILL/Serialization/JSON/JsonValidator.hpp>

#include <RILL/Serialization/JSON/JsonException.hpp>
#include <RILL/Serialization/JSON/JsonNodeReader.hpp>
#include <RILL/Serialization/JSON/JsonParser.hpp>

#include <utility>

namespace RILL::Serialization
{
    namespace
    {
        RILL::Utilities::Expected<void, ParseError> ValidateSingle(JsonParser& parser)
        {
            try
            {
                JsonNodeReader reader(parser);
                reader.SkipValue();
                reader.ExpectEnd();
            }
            catch (const JsonException& e)
            {
                return RILL::Utilities::Expected<void, ParseError>(RILL::Utilities::Unexpected<ParseError>(e.ToParseError()));
            }
            return {};
        }
    }// namespace

    RILL::Utilities::Expected<void, ParseError>
    JsonValidator::Validate(std::string_view input, const JsonParserOptions& options, std::string_view file)
    {
        JsonParser parser(input, options, file);
        return ValidateSingle(parser);
    }

    RILL::Utilities::Expected<void, ParseError>
    JsonValidator::Validate(IO::IByteReader& reader, const JsonParserOptions& options, std::string_view file)
    {
        JsonParser parser(reader, options, file);
        return ValidateSingle(parser);
    }

    RILL::Utilities::Expected<UIntSize, ParseError>
    JsonValidator::ValidateStream(std::string_view input, const JsonParserOptions& options, std::string_view file)
    {
        using Result = RILL::Utilities::Expected<UIntSize, ParseError>;
        JsonParser parser(input, options, file);
        UIntSize   count = 0;
        try
        {
            JsonNodeReader reader(parser);
            while (parser.HasNext())
            {
                reader.SkipValue();
                ++count;
            }
        }
        catch (const JsonException& e)
        {
            return Result(RILL::Utilities::Unexpected<ParseError>(e.ToParseError()));
        }
        return Result(count);
    }
}// namespace RILL::Serialization
