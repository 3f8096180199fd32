#include "WavSink.hpp"
#include "../common/debug_log.hpp"

#include <sndfile.h>

namespace noiselink {

WavSink::WavSink(std::string filename)
    : _filename(std::move(filename)) {
}

bool WavSink::Save() {
    const auto units = GetUnits();
    if (units.empty()) {
        NOISELINK_LOG("No audio data to save!" << NOISELINK_LOG_ENDL);
        return false;
    }

    const unsigned int sampleRate = units.front().sampleRate;
    const unsigned int channels = units.front().channels;
    if (sampleRate == 0 || channels == 0) {
        throw WavSinkException("Sample rate and channel count must be specified");
    }

    std::vector<int16_t> samples = GetSamples();
    const sf_count_t frames = static_cast<sf_count_t>(samples.size() / channels);

    SF_INFO sfinfo = {};
    sfinfo.samplerate = static_cast<int>(sampleRate);
    sfinfo.channels = static_cast<int>(channels);
    sfinfo.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SNDFILE* outfile = sf_open(_filename.c_str(), SFM_WRITE, &sfinfo);
    if (!outfile) {
        NOISELINK_ERROR("Error: could not open output file: " << _filename << " (" << sf_strerror(nullptr) << ")");
        return false;
    }

    sf_count_t framesWritten = sf_writef_short(outfile, samples.data(), frames);
    sf_close(outfile);

    if (framesWritten != frames) {
        NOISELINK_ERROR("Error: wrote " << framesWritten << " frames, expected " << frames);
        return false;
    }

    NOISELINK_LOG("Saved " << frames << " frames to " << _filename << NOISELINK_LOG_ENDL);
    return true;
}

} // namespace noiselink
