#pragma once

#include <RILL/Defines.hpp>
#include <RILL/IO/IOError.hpp>
#include <RILL/Primitives.hpp>
#include <RILL/Utilities/Expected.hpp>

#include <span>

namespace RILL::IO
{
    /// @brief Minimal byte reader interface for streaming inputs.
    ///
    /// A successful `Read` returning zero bytes signals the end of the stream.
    class RILL_BASE_API IByteReader
    {
    public:
        virtual ~IByteReader() = default;

        /// @brief Read up to destination.size() bytes into destination.
        virtual RILL::Utilities::Expected<UIntSize, IOError> Read(std::span<RILL::Byte> destination) noexcept = 0;

        /// @brief Current stream position if known.
        virtual RILL::Utilities::Expected<UIntSize, IOError> Tell() const noexcept = 0;
    };
}// namespace RILL::IO
