#pragma once

#include <RILL/Defines.hpp>
#include <RILL/IO/IByteReader.hpp>
#include <RILL/IO/IOError.hpp>
#include <RILL/Primitives.hpp>
#include <RILL/Utilities/Expected.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace RILL::IO
{
    /// @brief Read-only file handle exposed as an IByteReader.
    ///
    /// Wraps the platform file API directly so JSON can be lexed from disk in chunks
    /// without loading the whole file.
    class RILL_BASE_API FileReader final : public IByteReader
    {
    public:
        FileReader() noexcept                    = default;
        FileReader(const FileReader&)            = delete;
        FileReader& operator=(const FileReader&) = delete;
        FileReader(FileReader&& other) noexcept;
        FileReader& operator=(FileReader&& other) noexcept;
        ~FileReader() override;

        RILL::Utilities::Expected<void, IOError> Open(std::string_view path) noexcept;
        void                                     Close() noexcept;

        [[nodiscard]] bool IsOpen() const noexcept;

        RILL::Utilities::Expected<UIntSize, IOError> Read(std::span<RILL::Byte> destination) noexcept override;
        RILL::Utilities::Expected<UIntSize, IOError> Tell() const noexcept override;

        /// @brief Reads from the current position to the end of the file.
        /// @throws std::bad_alloc when the contents do not fit in memory.
        RILL::Utilities::Expected<std::vector<RILL::Byte>, IOError> ReadAll();

    private:
#if defined(_WIN32)
        void* m_handle {nullptr};
#else
        int m_handle {-1};
#endif
    };
}// namespace RILL::IO
