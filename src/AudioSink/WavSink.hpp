#pragma once

#include <stdexcept>
#include <string>

#include "CollectingSink.hpp"

namespace noiselink {

class WavSinkException : public std::runtime_error {
public:
    explicit WavSinkException(const std::string& what) : std::runtime_error(what) {}
};

// Collects denoised units and writes them as a 16-bit PCM WAV file.
class WavSink : public CollectingSink {
public:
    explicit WavSink(std::string filename);

    bool Save();

    const std::string& GetFilename() const { return _filename; }

private:
    std::string _filename;
};

} // namespace noiselink
