#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "AudioSink.hpp"

namespace noiselink {

class CollectingSink : public AudioSink {
public:
    void PushAudio(OutputUnit unit) override;
    void PushError(const std::string& message) override;

    std::vector<OutputUnit> GetUnits() const;
    std::vector<std::string> GetErrors() const;
    size_t GetUnitCount() const;

    // All received PCM in arrival order.
    Bytes GetConcatenated() const;
    std::vector<int16_t> GetSamples() const;

    void Clear();

private:
    mutable std::mutex _mutex;
    std::vector<OutputUnit> _units;
    std::vector<std::string> _errors;
};

} // namespace noiselink
