#include <RILL/Serialization/JSON/JsonException.hpp>

#include <utility>

namespace RILL::Serialization
{
    JsonException::JsonException(std::string message, ParseErrorCode code, const Location& location)
        : Exceptions::Exception(location.ToString() + ": " + message),
          m_message(std::move(message)),
          m_file(location.file),
          m_location(location),
          m_code(code)
    {
        m_location.file = {};
    }

    Location JsonException::GetLocation() const noexcept
    {
        Location result = m_location;
        result.file     = m_file;
        return result;
    }

    ParseError JsonException::ToParseError() const
    {
        ParseError error;
        error.code     = m_code;
        error.location = m_location;
        error.file     = m_file;
        error.message  = m_message;
        return error;
    }
}// namespace RILL::Serialization
