#pragma once

#include <stdexcept>
#include <string>

namespace RILL::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions in RILL.
    ///
    /// @details
    /// `Exception` is the base class for all exceptions thrown by RILL. It provides a common
    /// interface for exception handling so callers can catch every library failure with a
    /// single handler and retrieve the message through `GetMessage`.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor.
        explicit Exception(const char* message)
            : std::runtime_error(message)
        {
        }

        /// @brief Constructor with an owned message.
        explicit Exception(const std::string& message)
            : std::runtime_error(message)
        {
        }

        /// @brief Destructor.
        ~Exception() noexcept override = default;

        /// @brief Returns the exception message.
        /// @return A string containing the exception message.
        const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace RILL::Exceptions
