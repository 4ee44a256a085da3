// main.cpp
// Streams a JSON file from disk and prints its tokens or parser nodes.
//
//   JsonStreamDump [--tokens] [--max-depth N] <file.json>
#include <charconv>
#include <iostream>
#include <string>
#include <string_view>

#include <RILL/RILL.hpp>

using namespace RILL;
using namespace RILL::Serialization;

namespace
{
    int Usage()
    {
        std::cerr << "usage: JsonStreamDump [--tokens] [--max-depth N] <file.json>\n";
        return 2;
    }

    void DumpTokens(IO::IByteReader& reader, std::string_view file)
    {
        JsonLexer lexer(reader, LexOptions::Defaults | LexOptions::UseBigInt, file);
        for (const JsonToken& token: lexer)
            std::cout << token << '\n';
    }

    void DumpNodes(IO::IByteReader& reader, std::string_view file, UIntSize maxDepth)
    {
        JsonParserOptions options;
        options.lexOptions = LexOptions::Defaults | LexOptions::UseBigInt;
        options.maxDepth   = maxDepth;

        JsonParser parser(reader, options, file);
        for (const JsonParserNode& node: parser)
        {
            // close nodes are printed one level up
            const bool closing = node.GetKind() == JsonParserNode::Kind::ObjectEnd ||
                                 node.GetKind() == JsonParserNode::Kind::ArrayEnd;
            const UIntSize indent = parser.Depth() - (closing ? 1 : 0);
            std::cout << std::string(indent * 2, ' ') << node << '\n';
        }
        std::cout << "max depth: " << parser.MaxDepthReached() << '\n';
    }
}// namespace

int main(int argc, char** argv)
{
    bool             tokens   = false;
    UIntSize         maxDepth = 0;
    std::string_view path;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--tokens")
            tokens = true;
        else if (arg == "--max-depth" && i + 1 < argc)
        {
            const std::string_view value = argv[++i];
            const auto result = std::from_chars(value.data(), value.data() + value.size(), maxDepth);
            if (result.ec != std::errc {} || result.ptr != value.data() + value.size())
                return Usage();
        }
        else if (path.empty())
            path = arg;
        else
            return Usage();
    }
    if (path.empty())
        return Usage();

    IO::FileReader file;
    auto opened = file.Open(path);
    if (!opened.HasValue())
    {
        std::cerr << path << ": " << opened.ErrorUnsafe().message << " (" << opened.ErrorUnsafe().systemCode << ")\n";
        return 1;
    }

    try
    {
        if (tokens)
            DumpTokens(file, path);
        else
            DumpNodes(file, path, maxDepth);
    }
    catch (const JsonException& e)
    {
        std::cerr << e.what() << " [" << ToString(e.GetCode()) << "]\n";
        return 1;
    }
    return 0;
}
