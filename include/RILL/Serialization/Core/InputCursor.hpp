#pragma once

#include <RILL/Defines.hpp>
#include <RILL/IO/IByteReader.hpp>
#include <RILL/IO/IOError.hpp>
#include <RILL/Primitives.hpp>
#include <RILL/Serialization/Core/Location.hpp>

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace RILL::Serialization
{
    /// @brief Byte cursor over a contiguous buffer or a chunked `IO::IByteReader`.
    ///
    /// @details
    /// Tracks the byte offset always and line/column when requested. `\r`, `\n` and the pair
    /// `\r\n` each count as one line break. For contiguous input `CurrentPtr`/`EndPtr` expose
    /// the remaining bytes so scanners can work on slices without copying; for reader input
    /// they only cover the currently buffered chunk.
    class RILL_BASE_API InputCursor
    {
    public:
        static constexpr UIntSize DefaultChunkSize = 64 * 1024;

        explicit InputCursor(std::string_view data, bool trackLocation = true) noexcept;
        explicit InputCursor(std::span<const RILL::Byte> data, bool trackLocation = true) noexcept;

        /// @brief Streams from @p reader, which must outlive the cursor.
        explicit InputCursor(IO::IByteReader& reader, bool trackLocation = true, UIntSize chunkSize = DefaultChunkSize);

        InputCursor(const InputCursor&)            = delete;
        InputCursor& operator=(const InputCursor&) = delete;

        /// @brief True when the whole input is addressable through `CurrentPtr`/`EndPtr`.
        [[nodiscard]] bool IsContiguous() const noexcept { return m_reader == nullptr; }

        /// @brief True when no byte is left. Pulls the next chunk from the reader if needed.
        [[nodiscard]] bool IsEof()
        {
            if (m_current < m_end)
                return false;
            return !Refill();
        }

        /// @brief Current byte, or '\0' at end of input.
        [[nodiscard]] char Peek()
        {
            if (IsEof())
                return '\0';
            return *m_current;
        }

        void Advance(UIntSize count = 1);

        /// @brief Advances over bytes known to contain no line break.
        void AdvanceInLine(UIntSize count) noexcept
        {
            m_current += count;
            m_offset += count;
            m_column += count;
            m_afterCarriageReturn = false;
        }

        void SkipWhitespace();

        /// @brief Discards all remaining input.
        void Drain();

        [[nodiscard]] UIntSize Offset() const noexcept { return m_offset; }
        [[nodiscard]] bool     TracksLocation() const noexcept { return m_trackLocation; }

        [[nodiscard]] Location GetLocation() const noexcept
        {
            if (!m_trackLocation)
                return Location {m_file, 0, 0, m_offset};
            return Location {m_file, m_line, m_column, m_offset};
        }

        void SetFile(std::string_view file) noexcept { m_file = file; }

        [[nodiscard]] const char* CurrentPtr() const noexcept { return m_current; }
        [[nodiscard]] const char* EndPtr() const noexcept { return m_end; }

        [[nodiscard]] bool                HasInputError() const noexcept { return m_inputError.has_value(); }
        [[nodiscard]] const IO::IOError&  InputError() const noexcept { return *m_inputError; }

    private:
        bool Refill();

        const char*                m_current {nullptr};
        const char*                m_end {nullptr};
        IO::IByteReader*           m_reader {nullptr};
        std::vector<RILL::Byte>    m_chunk {};
        bool                       m_readerExhausted {false};
        std::optional<IO::IOError> m_inputError {};
        std::string_view           m_file {};
        bool                       m_trackLocation {true};
        bool                       m_afterCarriageReturn {false};
        UIntSize                   m_offset {0};
        UIntSize                   m_line {0};
        UIntSize                   m_column {0};
    };
}// namespace RILL::Serialization
