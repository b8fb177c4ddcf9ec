#include "CaptureWriter.hpp"
#include <sndfile.h>
#include <iostream>
#include <stdexcept>

CaptureWriter::~CaptureWriter() {
    close();
}

void CaptureWriter::open(const std::string &path, double sampleRate, int channels) {
    close();

    if (channels < 1 || channels > 2)
        throw std::runtime_error("Capture channels must be 1 or 2: " + path);

    SF_INFO info = {};
    info.channels = channels;
    info.samplerate = static_cast<int>(sampleRate);
    info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;

    mFile = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!mFile)
        throw std::runtime_error("Cannot create capture file: " + path + " (" + sf_strerror(nullptr) + ")");

    mChannels = channels;
    mPath = path;
    mFramesWritten = 0;
}

size_t CaptureWriter::writeFrames(const StereoFrame *frames, size_t count) {
    if (!mFile || count == 0) return 0;

    mInterleaved.resize(count * static_cast<size_t>(mChannels));
    for (size_t i = 0; i < count; i++) {
        if (mChannels == 1) {
            mInterleaved[i] = frames[i].left;
        } else {
            mInterleaved[i * 2]     = frames[i].left;
            mInterleaved[i * 2 + 1] = frames[i].right;
        }
    }

    sf_count_t written = sf_writef_float(mFile, mInterleaved.data(), static_cast<sf_count_t>(count));
    if (written != static_cast<sf_count_t>(count)) {
        std::cerr << "[Capture] ERROR: short write to " << mPath << ": " << sf_strerror(mFile) << std::endl;
    }
    if (written < 0) written = 0;

    mFramesWritten += static_cast<size_t>(written);
    return static_cast<size_t>(written);
}

void CaptureWriter::close() {
    if (mFile) {
        sf_write_sync(mFile);
        sf_close(mFile);
        mFile = nullptr;
    }
}
