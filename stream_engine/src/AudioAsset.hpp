#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "StreamTypes.hpp"

// Immutable decoded audio, shared by reference count between the asset cache
// and whoever is currently reading it. Samples are stored de-interleaved.
class AudioAsset {
public:
    AudioAsset(int channels, double sampleRate,
               std::vector<std::vector<float>> samples,
               std::string path = std::string());

    /// Decode a whole file into memory with libsndfile.
    /// Throws std::runtime_error if the file cannot be opened or read.
    static std::shared_ptr<const AudioAsset> load(const std::string &path);

    int    channels() const { return mChannels; }
    size_t len() const { return mFrames; }
    double sampleRate() const { return mSampleRate; }
    const std::string &path() const { return mPath; }

    float at(int channel, size_t index) const { return mSamples[channel][index]; }

    /// Stereo view of frame i. Mono assets are duplicated to both sides.
    StereoFrame frame(size_t index) const {
        float left = mSamples[0][index];
        float right = (mChannels > 1) ? mSamples[1][index] : left;
        return StereoFrame{left, right};
    }

    /// Decoded footprint: len * channels * sizeof(float).
    uint64_t sizeBytes() const {
        return static_cast<uint64_t>(mFrames) * static_cast<uint64_t>(mChannels) * 4u;
    }

private:
    int    mChannels;
    size_t mFrames;
    double mSampleRate;
    std::vector<std::vector<float>> mSamples;
    std::string mPath;
};

using AssetHandle = std::shared_ptr<const AudioAsset>;

/// Copy `count` stereo frames starting at `start`. Frames past the end of the
/// asset are zero.
std::vector<StereoFrame> captureFrames(const AudioAsset &asset, size_t start, size_t count);
