#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <sndfile.h>

#include "StreamTypes.hpp"

// Streams captured frames to a 32-bit float WAV file through libsndfile.
// Owned by the butler thread; never touched by the audio callback.
class CaptureWriter {
public:
    CaptureWriter() = default;
    ~CaptureWriter();

    CaptureWriter(const CaptureWriter &) = delete;
    CaptureWriter &operator=(const CaptureWriter &) = delete;

    /// Create (truncate) the file. Throws std::runtime_error on failure.
    void open(const std::string &path, double sampleRate, int channels);

    /// Write frames. One-channel files take the left side only.
    /// Returns the number of frames that reached libsndfile.
    size_t writeFrames(const StereoFrame *frames, size_t count);

    /// Flush the header and close. Safe to call more than once.
    void close();

    bool isOpen() const { return mFile != nullptr; }
    int channels() const { return mChannels; }
    const std::string &path() const { return mPath; }
    size_t framesWritten() const { return mFramesWritten; }

private:
    SNDFILE    *mFile = nullptr;
    int         mChannels = 0;
    std::string mPath;
    size_t      mFramesWritten = 0;
    std::vector<float> mInterleaved;
};
