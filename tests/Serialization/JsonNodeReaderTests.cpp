#include <RILL/IO/MemoryReader.hpp>
#include <RILL/Serialization/JSON/JsonException.hpp>
#include <RILL/Serialization/JSON/JsonNodeReader.hpp>
#include <RILL/Serialization/JSON/JsonValidator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

using namespace RILL;
using namespace RILL::Serialization;

TEST_CASE("JsonNodeReader skips nested values", "[serialization][json][reader]")
{
    JsonParser     parser(std::string_view {R"(
        [
            [1, 2, 3],
            "foo"
        ]
    )"});
    JsonNodeReader reader(parser);

    REQUIRE(parser.Peek().GetKind() == JsonParserNode::Kind::ArrayStart);
    parser.Advance();
    reader.SkipValue();
    REQUIRE(reader.ReadString() == "foo");
    REQUIRE(parser.Peek().GetKind() == JsonParserNode::Kind::ArrayEnd);
    parser.Advance();
    REQUIRE_FALSE(parser.HasNext());
}

TEST_CASE("JsonNodeReader skips to a key", "[serialization][json][reader]")
{
    JsonParser     parser(std::string_view {R"({"foo": {"deep": [1, {"x": 2}]}, "bar": 3, "baz": true, "qux": "str"})"});
    JsonNodeReader reader(parser);

    REQUIRE(reader.SkipToKey("bar"));
    REQUIRE(reader.ReadDouble() == 3.0);

    REQUIRE(reader.SkipToKey("qux"));
    REQUIRE(reader.ReadString() == "str");

    REQUIRE(parser.Peek().GetKind() == JsonParserNode::Kind::ObjectEnd);
    parser.Advance();
    REQUIRE_FALSE(parser.HasNext());
}

TEST_CASE("JsonNodeReader reports a missing key and consumes the object", "[serialization][json][reader]")
{
    JsonParser     parser(std::string_view {R"({"a": [1, 2], "b": null} 7)"});
    JsonNodeReader reader(parser);

    REQUIRE_FALSE(reader.SkipToKey("missing"));
    REQUIRE(parser.Depth() == 0);
    REQUIRE(reader.ReadInteger() == 7);
    reader.ExpectEnd();
}

TEST_CASE("JsonNodeReader rejects SkipToKey outside an object", "[serialization][json][reader]")
{
    JsonParser     parser(std::string_view {"[1]"});
    JsonNodeReader reader(parser);
    try
    {
        (void) reader.SkipToKey("a");
        FAIL("expected JsonException");
    }
    catch (const JsonException& e)
    {
        REQUIRE(e.GetCode() == ParseErrorCode::TypeMismatch);
        REQUIRE(e.Message() == "expected object or object key");
    }
}

TEST_CASE("JsonNodeReader reads arrays element by element", "[serialization][json][reader]")
{
    JsonParser     parser(std::string_view {R"(["foo", "bar", "baz"])"});
    JsonNodeReader reader(parser);

    std::vector<std::string> values;
    reader.ReadArray([&] { values.push_back(reader.ReadString()); });

    REQUIRE(values == std::vector<std::string> {"foo", "bar", "baz"});
    REQUIRE_FALSE(parser.HasNext());
}

TEST_CASE("JsonNodeReader reads objects member by member", "[serialization][json][reader]")
{
    JsonParser     parser(std::string_view {R"({"foo": 1, "bar": 2.5, "nested": {"skip": [true]}, "flag": false, "none": null})"});
    JsonNodeReader reader(parser);

    std::map<std::string, double> numbers;
    bool                          flag     = true;
    bool                          sawNone  = false;
    reader.ReadObject([&](std::string_view key) {
        if (key == "flag")
            flag = reader.ReadBool();
        else if (key == "none")
        {
            reader.RequireNull();
            sawNone = true;
        }
        else if (key == "nested")
            reader.SkipValue();
        else
            numbers[std::string(key)] = reader.ReadDouble();
    });

    REQUIRE(numbers.size() == 2);
    REQUIRE(numbers["foo"] == 1.0);
    REQUIRE(numbers["bar"] == 2.5);
    REQUIRE_FALSE(flag);
    REQUIRE(sawNone);
    reader.ExpectEnd();
}

TEST_CASE("JsonNodeReader typed reads", "[serialization][json][reader]")
{
    SECTION("integers")
    {
        JsonParser     parser(std::string_view {"[42, -3.0, 1e2, 2.5]"});
        JsonNodeReader reader(parser);
        parser.Advance();
        REQUIRE(reader.ReadInteger() == 42);
        REQUIRE(reader.ReadInteger() == -3);
        REQUIRE(reader.ReadInteger() == 100);
        REQUIRE_THROWS_AS(reader.ReadInteger(), JsonException);
    }

    SECTION("big integers read as doubles")
    {
        JsonParserOptions options;
        options.lexOptions = LexOptions::Defaults | LexOptions::UseBigInt;
        JsonParser     parser(std::string_view {"100000000000000000000"}, options);
        JsonNodeReader reader(parser);
        REQUIRE(reader.ReadDouble() == 1e20);
    }

    SECTION("type mismatches")
    {
        JsonParser     parser(std::string_view {R"(["text", 1])"});
        JsonNodeReader reader(parser);
        parser.Advance();
        try
        {
            (void) reader.ReadDouble();
            FAIL("expected JsonException");
        }
        catch (const JsonException& e)
        {
            REQUIRE(e.GetCode() == ParseErrorCode::TypeMismatch);
            REQUIRE(e.Message() == "expected numeric value");
            REQUIRE(e.GetLocation().column == 1);
        }
        REQUIRE(reader.ReadString() == "text");
        REQUIRE_THROWS_AS(reader.ReadBool(), JsonException);
        REQUIRE_THROWS_AS(reader.RequireNull(), JsonException);
        REQUIRE_THROWS_AS(reader.ReadArray([] {}), JsonException);
    }

    SECTION("reads past the end")
    {
        JsonParser     parser(std::string_view {""});
        JsonNodeReader reader(parser);
        try
        {
            (void) reader.ReadString();
            FAIL("expected JsonException");
        }
        catch (const JsonException& e)
        {
            REQUIRE(e.GetCode() == ParseErrorCode::UnexpectedEnd);
        }
    }
}

TEST_CASE("JsonNodeReader read strings outlive the parser", "[serialization][json][reader]")
{
    std::string value;
    {
        IO::MemoryReader source(std::string_view {R"("streamed \"value\"")"});
        JsonParser       parser(source);
        JsonNodeReader   reader(parser);
        value = reader.ReadString();
    }
    REQUIRE(value == "streamed \"value\"");
}

TEST_CASE("JsonNodeReader requires a single document", "[serialization][json][reader]")
{
    JsonParser     parser(std::string_view {"{} []"});
    JsonNodeReader reader(parser);
    reader.SkipValue();
    try
    {
        reader.ExpectEnd();
        FAIL("expected JsonException");
    }
    catch (const JsonException& e)
    {
        REQUIRE(e.GetCode() == ParseErrorCode::TrailingCharacters);
        REQUIRE(e.Message() == "unexpected characters following JSON");
        REQUIRE(e.GetLocation().column == 3);
    }
}

TEST_CASE("JsonNodeReader does not lex trailing input", "[serialization][json][reader]")
{
    JsonParser     parser(std::string_view {"{} @"});
    JsonNodeReader reader(parser);
    reader.SkipValue();
    try
    {
        reader.ExpectEnd();
        FAIL("expected JsonException");
    }
    catch (const JsonException& e)
    {
        REQUIRE(e.GetCode() == ParseErrorCode::TrailingCharacters);
        REQUIRE(e.Message() == "unexpected characters following JSON");
        REQUIRE(e.GetLocation().column == 3);
    }
}

TEST_CASE("JsonValidator validates single documents", "[serialization][json][validator]")
{
    REQUIRE(JsonValidator::Validate(R"({"a": [1, 2, {"b": null}]})").HasValue());
    REQUIRE(JsonValidator::Validate("  42  ").HasValue());

    const auto trailing = JsonValidator::Validate("1 2");
    REQUIRE_FALSE(trailing.HasValue());
    REQUIRE(trailing.ErrorUnsafe().code == ParseErrorCode::TrailingCharacters);

    const auto garbage = JsonValidator::Validate("1 x");
    REQUIRE_FALSE(garbage.HasValue());
    REQUIRE(garbage.ErrorUnsafe().code == ParseErrorCode::TrailingCharacters);
    REQUIRE(garbage.ErrorUnsafe().message == "unexpected characters following JSON");
    REQUIRE(garbage.ErrorUnsafe().location.column == 2);

    const auto unterminated = JsonValidator::Validate(R"({"a": 1} "open)");
    REQUIRE_FALSE(unterminated.HasValue());
    REQUIRE(unterminated.ErrorUnsafe().code == ParseErrorCode::TrailingCharacters);

    const auto empty = JsonValidator::Validate("");
    REQUIRE_FALSE(empty.HasValue());
    REQUIRE(empty.ErrorUnsafe().code == ParseErrorCode::UnexpectedEnd);

    const auto broken = JsonValidator::Validate("[1,]", {}, "broken.json");
    REQUIRE_FALSE(broken.HasValue());
    const ParseError& error = broken.ErrorUnsafe();
    REQUIRE(error.code == ParseErrorCode::ExpectedValue);
    REQUIRE(error.message == "expected JSON value");
    REQUIRE(error.file == "broken.json");
    REQUIRE(error.location.column == 3);
    REQUIRE(error.ToString() == "broken.json(0:3): expected JSON value");
}

TEST_CASE("JsonValidator validates reader input and streams", "[serialization][json][validator]")
{
    IO::MemoryReader valid(std::string_view {R"({"key": "value"})"});
    REQUIRE(JsonValidator::Validate(valid).HasValue());

    IO::MemoryReader invalid(std::string_view {R"({"key" "value"})"});
    const auto       result = JsonValidator::Validate(invalid);
    REQUIRE_FALSE(result.HasValue());
    REQUIRE(result.ErrorUnsafe().code == ParseErrorCode::ExpectedColon);

    const auto count = JsonValidator::ValidateStream(R"(1 {"a": 2} null [3])");
    REQUIRE(count.HasValue());
    REQUIRE(count.ValueUnsafe() == 4);

    REQUIRE(JsonValidator::ValidateStream("").ValueUnsafe() == 0);
    REQUIRE_FALSE(JsonValidator::ValidateStream("1 }").HasValue());
}
