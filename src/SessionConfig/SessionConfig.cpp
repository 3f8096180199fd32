#include "SessionConfig.hpp"
#include "../common/AudioUnit.hpp"

#include <fstream>

using json = nlohmann::json;

namespace noiselink {

namespace {

template <typename T>
T ReadField(const json& j, const char* key, T fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

SessionConfig SessionConfig::FromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    SessionConfig config;
    config.apiKey = ReadField<std::string>(j, "api_key", config.apiKey);
    config.baseUrl = ReadField<std::string>(j, "base_url", config.baseUrl);
    config.accumulationWindowSeconds =
        ReadField<double>(j, "accumulation_window_s", config.accumulationWindowSeconds);
    config.passthrough = ReadField<bool>(j, "passthrough", config.passthrough);
    config.fallbackPassthrough = ReadField<bool>(j, "fallback_passthrough", config.fallbackPassthrough);

    // Signed reads so that negative values are rejected instead of wrapping.
    const auto frameRate = ReadField<long long>(j, "output_frame_rate", config.outputFrameRate);
    const auto timeout = ReadField<long long>(j, "connect_timeout_ms", config.connectTimeoutMs);

    if (config.accumulationWindowSeconds <= 0.0) {
        throw ConfigError("accumulation_window_s must be positive");
    }
    if (frameRate <= 0) {
        throw ConfigError("output_frame_rate must be positive");
    }
    if (timeout <= 0) {
        throw ConfigError("connect_timeout_ms must be positive");
    }
    if (config.baseUrl.empty()) {
        throw ConfigError("base_url must not be empty");
    }
    config.outputFrameRate = static_cast<unsigned int>(frameRate);
    config.connectTimeoutMs = static_cast<unsigned int>(timeout);
    return config;
}

SessionConfig SessionConfig::LoadFromFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("could not open config file: " + path);
    }

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("could not parse " + path + ": " + e.what());
    }
    return FromJson(j);
}

json SessionConfig::ToJson() const {
    return {
        {"api_key", apiKey},
        {"base_url", baseUrl},
        {"accumulation_window_s", accumulationWindowSeconds},
        {"output_frame_rate", outputFrameRate},
        {"passthrough", passthrough},
        {"fallback_passthrough", fallbackPassthrough},
        {"connect_timeout_ms", connectTimeoutMs}
    };
}

std::string BuildEndpointUrl(const SessionConfig& config, unsigned int sampleRate) {
    std::string ws_pref = config.baseUrl.find("://") == std::string::npos ? "wss://" : "";
    std::string base = ws_pref + config.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    return base + "/" + config.apiKey + "/denoise/" + std::to_string(kBytesPerSample) + "/" +
           std::to_string(sampleRate) + "/" + std::to_string(config.outputFrameRate);
}

} // namespace noiselink
