#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace noiselink {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct SessionConfig {
    std::string apiKey;
    std::string baseUrl = "wss://api.noiselink.dev";
    double accumulationWindowSeconds = 0.14;
    unsigned int outputFrameRate = 16000;
    bool passthrough = false;
    // Emit the original window when it cannot be delivered to the endpoint.
    bool fallbackPassthrough = false;
    unsigned int connectTimeoutMs = 5000;

    static SessionConfig FromJson(const nlohmann::json& j);
    static SessionConfig LoadFromFile(const std::string& path);

    nlohmann::json ToJson() const;
};

// <base_url>/<api_key>/denoise/<bytes_per_sample>/<sample_rate>/<output_frame_rate>
std::string BuildEndpointUrl(const SessionConfig& config, unsigned int sampleRate);

} // namespace noiselink
