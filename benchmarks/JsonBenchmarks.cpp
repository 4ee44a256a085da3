#include <RILL/Benchmark.hpp>
#include <RILL/IO/MemoryReader.hpp>
#include <RILL/Serialization/JSON/JsonLexer.hpp>
#include <RILL/Serialization/JSON/JsonParser.hpp>
#include <RILL/Serialization/JSON/JsonValidator.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>

#if defined(RILL_HAVE_SIMDJSON)
#include <simdjson.h>
#endif

#if defined(RILL_HAVE_RAPIDJSON)
#include <rapidjson/document.h>
#endif

namespace
{
    std::string MakeLargeDocument(int items)
    {
        std::string json = R"({"items":[)";
        for (int i = 0; i < items; ++i)
        {
            if (i != 0)
                json += ',';
            json += R"({"id":)" + std::to_string(i) +
                    R"(,"name":"item )" + std::to_string(i) +
                    R"(","score":)" + std::to_string(i * 0.25) +
                    R"(,"tags":["alpha","beta","gamma"],"active":)" + (i % 2 == 0 ? "true" : "false") + "}";
        }
        json += R"(],"meta":{"version":"1.0","build":42}})";
        return json;
    }
}// namespace

int main()
{
    using namespace RILL;
    using namespace RILL::Serialization;

    const std::string smallJson = R"({"name":"Rill","count":3,"active":true,"tags":["a","b","c"],"child":{"x":1}})";
    const std::string largeJson = MakeLargeDocument(2000);

    Benchmark::Register([&](BenchmarkContext& ctx) {
        ctx.start();
        UIntSize count = 0;
        JsonLexer lexer(std::string_view {smallJson});
        for (const JsonToken& token: lexer)
        {
            ctx.doNotOptimize(token.GetKind());
            ++count;
        }
        ctx.doNotOptimize(count);
        ctx.stop();
    },
                        "JsonLexer small document");

    Benchmark::Register([&](BenchmarkContext& ctx) {
        ctx.start();
        UIntSize count = 0;
        JsonLexer lexer(std::string_view {largeJson}, LexOptions::None);
        for (const JsonToken& token: lexer)
        {
            ctx.doNotOptimize(token.GetKind());
            ++count;
        }
        ctx.doNotOptimize(count);
        ctx.stop();
    },
                        "JsonLexer large document, no locations");

    Benchmark::Register([&](BenchmarkContext& ctx) {
        ctx.start();
        UIntSize count = 0;
        JsonParser parser(std::string_view {largeJson});
        for (const JsonParserNode& node: parser)
        {
            ctx.doNotOptimize(node.GetKind());
            ++count;
        }
        ctx.doNotOptimize(count);
        ctx.stop();
    },
                        "JsonParser large document");

    Benchmark::Register([&](BenchmarkContext& ctx) {
        ctx.start();
        IO::MemoryReader reader(std::string_view {largeJson});
        auto result = JsonValidator::Validate(reader);
        ctx.doNotOptimize(result.HasValue());
        ctx.stop();
    },
                        "JsonValidator large document, chunked reader");

#if defined(RILL_HAVE_SIMDJSON)
    const simdjson::padded_string largePadded(std::string_view {largeJson});
    simdjson::dom::parser domParser;

    Benchmark::Register([&](BenchmarkContext& ctx) {
        ctx.start();
        auto doc = domParser.parse(largePadded);
        ctx.doNotOptimize(doc.error());
        ctx.stop();
    },
                        "simdjson large document");
#endif

#if defined(RILL_HAVE_RAPIDJSON)
    Benchmark::Register([&](BenchmarkContext& ctx) {
        ctx.start();
        rapidjson::Document doc;
        doc.Parse(largeJson.c_str());
        ctx.doNotOptimize(!doc.HasParseError());
        ctx.stop();
    },
                        "RapidJSON large document");
#endif

    auto results = Benchmark::RunAll<std::chrono::milliseconds>();
    Benchmark::PrintSummaryTable(std::cout, results);

    return 0;
}
