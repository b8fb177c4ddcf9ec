#include "AudioAsset.hpp"
#include <sndfile.h>
#include <algorithm>
#include <stdexcept>

AudioAsset::AudioAsset(int channels, double sampleRate,
                       std::vector<std::vector<float>> samples,
                       std::string path)
    : mChannels(channels),
      mFrames(0),
      mSampleRate(sampleRate),
      mSamples(std::move(samples)),
      mPath(std::move(path))
{
    if (mChannels <= 0 || static_cast<int>(mSamples.size()) != mChannels)
        throw std::runtime_error("AudioAsset: channel count does not match sample data");

    mFrames = mSamples[0].size();
    for (const auto &ch : mSamples) {
        if (ch.size() != mFrames)
            throw std::runtime_error("AudioAsset: channels have different lengths");
    }
}

std::shared_ptr<const AudioAsset> AudioAsset::load(const std::string &path) {
    SF_INFO info = {};
    SNDFILE *snd = sf_open(path.c_str(), SFM_READ, &info);
    if (!snd)
        throw std::runtime_error("Failed to open audio file: " + path + " (" + sf_strerror(nullptr) + ")");

    if (info.channels <= 0 || info.frames < 0) {
        sf_close(snd);
        throw std::runtime_error("Invalid audio header: " + path);
    }

    const int channels = info.channels;
    const size_t frames = static_cast<size_t>(info.frames);

    std::vector<float> interleaved(frames * static_cast<size_t>(channels));
    sf_count_t read = sf_readf_float(snd, interleaved.data(), static_cast<sf_count_t>(frames));
    sf_close(snd);

    if (read < 0 || static_cast<size_t>(read) != frames)
        throw std::runtime_error("Short read from audio file: " + path);

    std::vector<std::vector<float>> samples(channels, std::vector<float>(frames));
    for (size_t i = 0; i < frames; i++) {
        for (int ch = 0; ch < channels; ch++) {
            samples[ch][i] = interleaved[i * channels + ch];
        }
    }

    return std::make_shared<const AudioAsset>(channels, static_cast<double>(info.samplerate),
                                              std::move(samples), path);
}

std::vector<StereoFrame> captureFrames(const AudioAsset &asset, size_t start, size_t count) {
    std::vector<StereoFrame> frames;
    frames.reserve(count);
    for (size_t i = 0; i < count; i++) {
        size_t idx = start + i;
        if (idx < asset.len())
            frames.push_back(asset.frame(idx));
        else
            frames.push_back(StereoFrame{});
    }
    return frames;
}
