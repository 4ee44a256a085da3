#pragma once

#include <RILL/Defines.hpp>
#include <RILL/IO/IByteReader.hpp>
#include <RILL/IO/IOError.hpp>

#include <cstring>
#include <string_view>

namespace RILL::IO
{
    /// @brief In-memory implementation of IByteReader.
    ///
    /// The reader does not own the bytes; they must outlive it.
    class RILL_BASE_API MemoryReader final : public IByteReader
    {
    public:
        explicit MemoryReader(std::span<const RILL::Byte> data) noexcept
            : m_data(data.data()), m_size(data.size())
        {
        }

        explicit MemoryReader(std::string_view text) noexcept
            : m_data(reinterpret_cast<const RILL::Byte*>(text.data())), m_size(text.size())
        {
        }

        RILL::Utilities::Expected<UIntSize, IOError> Read(std::span<RILL::Byte> destination) noexcept override
        {
            const UIntSize remaining = Remaining();
            const UIntSize toRead    = (destination.size() < remaining) ? destination.size() : remaining;
            if (toRead == 0)
                return RILL::Utilities::Expected<UIntSize, IOError>(UIntSize {0});
            std::memcpy(destination.data(), m_data + m_offset, toRead);
            m_offset += toRead;
            return RILL::Utilities::Expected<UIntSize, IOError>(toRead);
        }

        RILL::Utilities::Expected<UIntSize, IOError> Tell() const noexcept override
        {
            return RILL::Utilities::Expected<UIntSize, IOError>(m_offset);
        }

        [[nodiscard]] UIntSize Remaining() const noexcept
        {
            return (m_offset < m_size) ? (m_size - m_offset) : 0;
        }

    private:
        const RILL::Byte* m_data {nullptr};
        UIntSize          m_size {0};
        UIntSize          m_offset {0};
    };
}// namespace RILL::IO
