#pragma once

#include <RILL/Defines.hpp>
#include <RILL/IO/IByteReader.hpp>
#include <RILL/Primitives.hpp>
#include <RILL/Serialization/Core/ParseError.hpp>
#include <RILL/Serialization/JSON/JsonOptions.hpp>
#include <RILL/Utilities/Expected.hpp>

#include <string_view>

namespace RILL::Serialization
{
    /// @brief Non-throwing validation entry points.
    ///
    /// Streams the input through `JsonParser` without retaining any node and reports the first
    /// failure as a `ParseError` value.
    class RILL_BASE_API JsonValidator
    {
    public:
        /// @brief Validates a single JSON document; trailing values are rejected.
        static RILL::Utilities::Expected<void, ParseError>
        Validate(std::string_view input, const JsonParserOptions& options = {}, std::string_view file = {});

        static RILL::Utilities::Expected<void, ParseError>
        Validate(IO::IByteReader& reader, const JsonParserOptions& options = {}, std::string_view file = {});

        /// @brief Validates a sequence of concatenated documents.
        /// @return The number of top-level values.
        static RILL::Utilities::Expected<UIntSize, ParseError>
        ValidateStream(std::string_view input, const JsonParserOptions& options = {}, std::string_view file = {});
    };
}// namespace RILL::Serialization
