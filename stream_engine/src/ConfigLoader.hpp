#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "StreamTypes.hpp"

// One StreamAudioFile request (plus optional varispeed / loop) from a session.
struct StreamSpec {
    size_t      channel = 0;
    std::string file;
    uint64_t    offset = 0;         // Start position in file frames
    float       speed = 1.0f;
    bool        reverse = false;

    bool        hasLoop = false;
    uint64_t    loopStart = 0;
    uint64_t    loopEnd = 0;
    size_t      loopCrossfade = 0;
};

struct PdcSpec {
    bool                enabled = true;
    size_t              maxLatency = kDefaultMaxLatencySamples;
    std::vector<size_t> channelLatencies;
    std::vector<size_t> returnLatencies;
};

struct CaptureSpec {
    bool        enabled = false;    // True when the session names a capture file
    std::string file;
    int         channels = 2;
    float       bufferMs = 2000.0f;
};

struct SessionConfig {
    int    sampleRate = 48000;
    int    bufferSize = 512;
    int    outputChannels = 2;
    double bufferMargin = 1.0;

    BufferConfig butler;
    PdcSpec      pdc;
    CaptureSpec  capture;
    std::vector<StreamSpec> streams;
};

class ConfigLoader {
public:
    /// Load a session JSON file. Missing keys keep their defaults.
    /// Throws std::runtime_error if the file is missing, unparsable, or holds
    /// an invalid value.
    static SessionConfig loadSession(const std::string &path);

    /// Same as loadSession() but from JSON text already in memory.
    static SessionConfig parseSession(const std::string &jsonText);
};
