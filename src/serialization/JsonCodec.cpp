#include "memocache/serialization/JsonCodec.hpp"

namespace memocache {
namespace serialization {

using adapter::CacheErrorKind;
using adapter::Result;

Result<std::string> JsonCodec::serialize(const nlohmann::json& value) {
    if (value.is_discarded()) {
        return Result<std::string>::failure(CacheErrorKind::JsonStringifyFailed,
                                            "discarded value cannot be serialized");
    }
    try {
        return Result<std::string>::success(value.dump());
    } catch (const nlohmann::json::exception& e) {
        return Result<std::string>::failure(CacheErrorKind::JsonStringifyFailed, e.what());
    }
}

Result<nlohmann::json> JsonCodec::deserialize(const std::string& text) {
    try {
        return Result<nlohmann::json>::success(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& e) {
        return Result<nlohmann::json>::failure(CacheErrorKind::JsonParsingFailed, e.what());
    }
}

} // namespace serialization
} // namespace memocache
