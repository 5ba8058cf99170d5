#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "memocache/adapter/CacheError.hpp"

namespace memocache {
namespace serialization {

// JSON text codec for cached values.
// serialize() fails with JsonStringifyFailed (e.g. a string holding invalid
// UTF-8), deserialize() fails with JsonParsingFailed; the failure message is
// the nlohmann::json exception text.
class JsonCodec {
public:
    static adapter::Result<std::string> serialize(const nlohmann::json& value);
    static adapter::Result<nlohmann::json> deserialize(const std::string& text);
};

} // namespace serialization
} // namespace memocache
