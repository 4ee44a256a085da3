#include <RILL/Serialization/Core/InputCursor.hpp>

#include <utility>

namespace RILL::Serialization
{
    InputCursor::InputCursor(std::string_view data, bool trackLocation) noexcept
        : m_current(data.data()), m_end(data.data() + data.size()), m_trackLocation(trackLocation)
    {
    }

    InputCursor::InputCursor(std::span<const RILL::Byte> data, bool trackLocation) noexcept
        : m_current(reinterpret_cast<const char*>(data.data())),
          m_end(reinterpret_cast<const char*>(data.data()) + data.size()),
          m_trackLocation(trackLocation)
    {
    }

    InputCursor::InputCursor(IO::IByteReader& reader, bool trackLocation, UIntSize chunkSize)
        : m_reader(&reader), m_chunk(chunkSize == 0 ? DefaultChunkSize : chunkSize), m_trackLocation(trackLocation)
    {
    }

    bool InputCursor::Refill()
    {
        if (m_reader == nullptr || m_readerExhausted)
            return false;

        auto result = m_reader->Read(std::span<RILL::Byte>(m_chunk.data(), m_chunk.size()));
        if (!result.HasValue())
        {
            m_inputError      = std::move(result.ErrorUnsafe());
            m_readerExhausted = true;
            m_current = m_end = nullptr;
            return false;
        }

        const UIntSize count = result.ValueUnsafe();
        if (count == 0)
        {
            m_readerExhausted = true;
            m_current = m_end = nullptr;
            return false;
        }
        m_current = reinterpret_cast<const char*>(m_chunk.data());
        m_end     = m_current + count;
        return true;
    }

    void InputCursor::Advance(UIntSize count)
    {
        while (count-- > 0 && !IsEof())
        {
            const char c = *m_current++;
            ++m_offset;
            if (!m_trackLocation)
                continue;

            if (c == '\r')
            {
                ++m_line;
                m_column              = 0;
                m_afterCarriageReturn = true;
                continue;
            }
            if (c == '\n')
            {
                // second half of "\r\n" was already counted
                if (!m_afterCarriageReturn)
                {
                    ++m_line;
                    m_column = 0;
                }
            }
            else
            {
                ++m_column;
            }
            m_afterCarriageReturn = false;
        }
    }

    void InputCursor::SkipWhitespace()
    {
        while (true)
        {
            const char c = Peek();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
            {
                Advance();
                continue;
            }
            return;
        }
    }

    void InputCursor::Drain()
    {
        while (!IsEof())
        {
            const auto remaining = static_cast<UIntSize>(m_end - m_current);
            m_offset += remaining;
            m_current = m_end;
        }
    }
}// namespace RILL::Serialization
