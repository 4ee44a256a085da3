#pragma once

#include <RILL/Defines.hpp>
#include <RILL/Primitives.hpp>

#include <RILL/Exceptions/Exception.hpp>
#include <RILL/Utilities/Expected.hpp>
#include <RILL/Math/BigInt.hpp>

#include <RILL/IO/IOError.hpp>
#include <RILL/IO/IByteReader.hpp>
#include <RILL/IO/MemoryReader.hpp>
#include <RILL/IO/FileReader.hpp>

#include <RILL/Serialization/Core/Location.hpp>
#include <RILL/Serialization/Core/ParseError.hpp>
#include <RILL/Serialization/Core/InputCursor.hpp>
#include <RILL/Serialization/Core/PullIterator.hpp>

#include <RILL/Serialization/JSON/JsonOptions.hpp>
#include <RILL/Serialization/JSON/JsonException.hpp>
#include <RILL/Serialization/JSON/JsonToken.hpp>
#include <RILL/Serialization/JSON/JsonLexer.hpp>
#include <RILL/Serialization/JSON/JsonParserNode.hpp>
#include <RILL/Serialization/JSON/JsonParser.hpp>
#include <RILL/Serialization/JSON/JsonNodeReader.hpp>
#include <RILL/Serialization/JSON/JsonValidator.hpp>
