#include "CollectingSink.hpp"

#include <cstring>

namespace noiselink {

void CollectingSink::PushAudio(OutputUnit unit) {
    std::lock_guard<std::mutex> lock(_mutex);
    _units.push_back(std::move(unit));
}

void CollectingSink::PushError(const std::string& message) {
    std::lock_guard<std::mutex> lock(_mutex);
    _errors.push_back(message);
}

std::vector<OutputUnit> CollectingSink::GetUnits() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _units;
}

std::vector<std::string> CollectingSink::GetErrors() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _errors;
}

size_t CollectingSink::GetUnitCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _units.size();
}

Bytes CollectingSink::GetConcatenated() const {
    std::lock_guard<std::mutex> lock(_mutex);
    Bytes all;
    for (const auto& unit : _units) {
        all.insert(all.end(), unit.data.begin(), unit.data.end());
    }
    return all;
}

std::vector<int16_t> CollectingSink::GetSamples() const {
    Bytes all = GetConcatenated();
    // A trailing odd byte cannot form a sample and is dropped.
    std::vector<int16_t> samples(all.size() / sizeof(int16_t));
    std::memcpy(samples.data(), all.data(), samples.size() * sizeof(int16_t));
    return samples;
}

void CollectingSink::Clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _units.clear();
    _errors.clear();
}

} // namespace noiselink
