#pragma once

#include <atomic>
#include <stdexcept>
#include <string>

namespace noiselink {

// A mismatch between the session format and an incoming unit is a usage error
// of the integrating pipeline and is never handled inside the library.
class ConfigurationViolation : public std::logic_error {
public:
    explicit ConfigurationViolation(const std::string& what) : std::logic_error(what) {}
};

class StateTracker {
public:
    explicit StateTracker(bool passthrough = false);

    // Fixes the session format. Throws ConfigurationViolation on non-positive
    // values or when called again with a different format.
    void Configure(unsigned int sampleRate, unsigned int channels);

    // Throws ConfigurationViolation unless the unit matches the session format.
    void Validate(unsigned int sampleRate, unsigned int channels) const;

    bool IsConfigured() const { return _configured; }
    unsigned int GetSampleRate() const { return _sampleRate; }
    unsigned int GetChannels() const { return _channels; }

    void SetMuted(bool muted) { _muted = muted; }
    bool IsMuted() const { return _muted; }

    void SetPassthrough(bool passthrough) { _passthrough = passthrough; }
    bool IsPassthrough() const { return _passthrough; }


private:
    bool _configured;
    unsigned int _sampleRate;
    unsigned int _channels;
    std::atomic<bool> _muted;
    std::atomic<bool> _passthrough;
};

} // namespace noiselink
