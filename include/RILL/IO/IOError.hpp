#pragma once

#include <RILL/Primitives.hpp>

#include <string>

namespace RILL::IO
{
    /// @brief Error codes for low-level IO operations.
    enum class IOErrorCode : UInt8
    {
        None,
        EndOfStream,
        InvalidArgument,
        SystemError,
    };

    /// @brief IO error payload with optional system code.
    struct IOError
    {
        IOErrorCode code {IOErrorCode::None};
        Int32       systemCode {0};
        std::string message {};
    };
}// namespace RILL::IO
