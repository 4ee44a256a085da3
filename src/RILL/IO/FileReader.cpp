#include <RILL/IO/FileReader.hpp>

#include <cerrno>
#include <cstring>
#include <string>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace RILL::IO
{
    namespace
    {
        [[nodiscard]] IOError MakeSystemError(const char* message, int code) noexcept
        {
            IOError err;
            err.code       = IOErrorCode::SystemError;
            err.systemCode = code;
            err.message    = message ? message : "system error";
            return err;
        }

        [[nodiscard]] IOError MakeNotOpenError() noexcept
        {
            IOError err;
            err.code    = IOErrorCode::InvalidArgument;
            err.message = "file not open";
            return err;
        }
    }// namespace

    FileReader::FileReader(FileReader&& other) noexcept
    {
        *this = std::move(other);
    }

    FileReader& FileReader::operator=(FileReader&& other) noexcept
    {
        if (this != &other)
        {
            Close();
#if defined(_WIN32)
            m_handle       = other.m_handle;
            other.m_handle = nullptr;
#else
            m_handle       = other.m_handle;
            other.m_handle = -1;
#endif
        }
        return *this;
    }

    FileReader::~FileReader()
    {
        Close();
    }

    RILL::Utilities::Expected<void, IOError> FileReader::Open(std::string_view path) noexcept
    {
        Close();
        if (path.empty())
        {
            IOError err;
            err.code    = IOErrorCode::InvalidArgument;
            err.message = "empty path";
            return RILL::Utilities::Expected<void, IOError>(RILL::Utilities::Unexpected<IOError>(std::move(err)));
        }
        const std::string nativePath(path);
#if defined(_WIN32)
        HANDLE handle = CreateFileA(nativePath.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle == INVALID_HANDLE_VALUE)
        {
            return RILL::Utilities::Expected<void, IOError>(RILL::Utilities::Unexpected<IOError>(
                    MakeSystemError("CreateFileA failed", static_cast<int>(GetLastError()))));
        }
        m_handle = handle;
#else
        const int fd = ::open(nativePath.c_str(), O_RDONLY);
        if (fd < 0)
        {
            return RILL::Utilities::Expected<void, IOError>(RILL::Utilities::Unexpected<IOError>(
                    MakeSystemError("open failed", errno)));
        }
        m_handle = fd;
#endif
        return {};
    }

    void FileReader::Close() noexcept
    {
#if defined(_WIN32)
        if (m_handle)
        {
            CloseHandle(static_cast<HANDLE>(m_handle));
            m_handle = nullptr;
        }
#else
        if (m_handle >= 0)
        {
            ::close(m_handle);
            m_handle = -1;
        }
#endif
    }

    bool FileReader::IsOpen() const noexcept
    {
#if defined(_WIN32)
        return m_handle != nullptr;
#else
        return m_handle >= 0;
#endif
    }

    RILL::Utilities::Expected<UIntSize, IOError> FileReader::Read(std::span<RILL::Byte> destination) noexcept
    {
        if (!IsOpen())
            return RILL::Utilities::Expected<UIntSize, IOError>(RILL::Utilities::Unexpected<IOError>(MakeNotOpenError()));
        if (destination.empty())
            return RILL::Utilities::Expected<UIntSize, IOError>(UIntSize {0});
#if defined(_WIN32)
        DWORD bytesRead = 0;
        if (!ReadFile(static_cast<HANDLE>(m_handle), destination.data(), static_cast<DWORD>(destination.size()), &bytesRead, nullptr))
        {
            return RILL::Utilities::Expected<UIntSize, IOError>(RILL::Utilities::Unexpected<IOError>(
                    MakeSystemError("ReadFile failed", static_cast<int>(GetLastError()))));
        }
        return RILL::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(bytesRead));
#else
        ssize_t result = 0;
        do
        {
            result = ::read(m_handle, destination.data(), destination.size());
        } while (result < 0 && errno == EINTR);
        if (result < 0)
        {
            return RILL::Utilities::Expected<UIntSize, IOError>(RILL::Utilities::Unexpected<IOError>(
                    MakeSystemError("read failed", errno)));
        }
        return RILL::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(result));
#endif
    }

    RILL::Utilities::Expected<UIntSize, IOError> FileReader::Tell() const noexcept
    {
        if (!IsOpen())
            return RILL::Utilities::Expected<UIntSize, IOError>(RILL::Utilities::Unexpected<IOError>(MakeNotOpenError()));
#if defined(_WIN32)
        LARGE_INTEGER zero {};
        LARGE_INTEGER pos {};
        if (!SetFilePointerEx(static_cast<HANDLE>(m_handle), zero, &pos, FILE_CURRENT))
        {
            return RILL::Utilities::Expected<UIntSize, IOError>(RILL::Utilities::Unexpected<IOError>(
                    MakeSystemError("SetFilePointerEx failed", static_cast<int>(GetLastError()))));
        }
        return RILL::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(pos.QuadPart));
#else
        const off_t pos = lseek(m_handle, 0, SEEK_CUR);
        if (pos == static_cast<off_t>(-1))
        {
            return RILL::Utilities::Expected<UIntSize, IOError>(RILL::Utilities::Unexpected<IOError>(
                    MakeSystemError("lseek failed", errno)));
        }
        return RILL::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(pos));
#endif
    }

    RILL::Utilities::Expected<std::vector<RILL::Byte>, IOError> FileReader::ReadAll()
    {
        using Result = RILL::Utilities::Expected<std::vector<RILL::Byte>, IOError>;
        if (!IsOpen())
            return Result(RILL::Utilities::Unexpected<IOError>(MakeNotOpenError()));

        std::vector<RILL::Byte> data;
        static constexpr UIntSize chunkSize = 64 * 1024;
        for (;;)
        {
            const UIntSize used = data.size();
            data.resize(used + chunkSize);
            auto readResult = Read(std::span<RILL::Byte>(data.data() + used, chunkSize));
            if (!readResult.HasValue())
                return Result(RILL::Utilities::Unexpected<IOError>(std::move(readResult.ErrorUnsafe())));
            data.resize(used + readResult.ValueUnsafe());
            if (readResult.ValueUnsafe() == 0)
                break;
        }
        return Result(std::move(data));
    }
}// namespace RILL::IO
