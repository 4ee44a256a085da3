#include <RILL/IO/FileReader.hpp>
#include <RILL/IO/MemoryReader.hpp>
#include <RILL/Serialization/JSON/JsonLexer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

using namespace RILL;

namespace
{
    std::string AsString(std::span<const Byte> bytes)
    {
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    class TempFile
    {
    public:
        TempFile(std::string_view name, std::string_view contents)
            : m_path(std::filesystem::temp_directory_path() / name)
        {
            std::ofstream out(m_path, std::ios::binary | std::ios::trunc);
            out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        }

        ~TempFile()
        {
            std::error_code ec;
            std::filesystem::remove(m_path, ec);
        }

        [[nodiscard]] std::string Path() const { return m_path.string(); }

    private:
        std::filesystem::path m_path;
    };
}// namespace

TEST_CASE("MemoryReader reads in chunks", "[IO][MemoryReader]")
{
    IO::MemoryReader reader(std::string_view {"hello world"});
    std::array<Byte, 4> buffer {};

    auto first = reader.Read(buffer);
    REQUIRE(first.HasValue());
    REQUIRE(first.ValueUnsafe() == 4);
    REQUIRE(AsString(std::span<const Byte>(buffer.data(), 4)) == "hell");
    REQUIRE(reader.Tell().ValueUnsafe() == 4);
    REQUIRE(reader.Remaining() == 7);

    (void)reader.Read(buffer);
    auto last = reader.Read(buffer);
    REQUIRE(last.ValueUnsafe() == 3);
    REQUIRE(AsString(std::span<const Byte>(buffer.data(), 3)) == "rld");

    auto end = reader.Read(buffer);
    REQUIRE(end.HasValue());
    REQUIRE(end.ValueUnsafe() == 0);
    REQUIRE(reader.Remaining() == 0);
}

TEST_CASE("FileReader reads a whole file", "[IO][FileReader]")
{
    const std::string contents = "{\"name\": \"rill\", \"values\": [1, 2, 3]}\n";
    TempFile          file("rill_file_reader_test.json", contents);

    IO::FileReader reader;
    REQUIRE_FALSE(reader.IsOpen());
    REQUIRE(reader.Open(file.Path()).HasValue());
    REQUIRE(reader.IsOpen());

    STATIC_REQUIRE_FALSE(noexcept(reader.ReadAll()));
    auto all = reader.ReadAll();
    REQUIRE(all.HasValue());
    REQUIRE(AsString(all.ValueUnsafe()) == contents);
    REQUIRE(reader.Tell().ValueUnsafe() == contents.size());

    IO::FileReader moved(std::move(reader));
    REQUIRE(moved.IsOpen());
    REQUIRE_FALSE(reader.IsOpen());

    moved.Close();
    REQUIRE_FALSE(moved.IsOpen());
}

TEST_CASE("FileReader feeds the lexer", "[IO][FileReader]")
{
    TempFile file("rill_file_reader_lexer.json", "[true, \"text\"]");

    IO::FileReader reader;
    REQUIRE(reader.Open(file.Path()).HasValue());

    Serialization::JsonLexer lexer(reader, Serialization::LexOptions::Defaults, "input.json", 3);
    UIntSize                 count = 0;
    for (const auto& token : lexer)
    {
        if (token.GetKind() == Serialization::JsonToken::Kind::String)
            REQUIRE(token.AsString() == "text");
        ++count;
    }
    REQUIRE(count == 5);
}

TEST_CASE("FileReader reports failures", "[IO][FileReader]")
{
    IO::FileReader reader;

    auto empty = reader.Open("");
    REQUIRE_FALSE(empty.HasValue());
    REQUIRE(empty.ErrorUnsafe().code == IO::IOErrorCode::InvalidArgument);

    auto missing = reader.Open((std::filesystem::temp_directory_path() / "rill_missing_dir" / "none.json").string());
    REQUIRE_FALSE(missing.HasValue());
    REQUIRE(missing.ErrorUnsafe().code == IO::IOErrorCode::SystemError);
    REQUIRE(missing.ErrorUnsafe().systemCode != 0);

    std::array<Byte, 8> buffer {};
    auto                closed = reader.Read(buffer);
    REQUIRE_FALSE(closed.HasValue());
    REQUIRE(closed.ErrorUnsafe().message == "file not open");
}
