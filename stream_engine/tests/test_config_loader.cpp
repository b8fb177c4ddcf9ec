// Session JSON parsing: defaults, full sessions, rejected values.

#include <fstream>
#include <stdexcept>
#include <string>

#include "ConfigLoader.hpp"
#include "TestSupport.hpp"

static bool rejects(const std::string& text) {
    try {
        ConfigLoader::parseSession(text);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main() {
    TestRunner t("config_loader");

    t.scenario("empty object keeps every default", [&] {
        SessionConfig cfg = ConfigLoader::parseSession("{}");
        t.check(cfg.sampleRate == 48000 && cfg.bufferSize == 512 && cfg.outputChannels == 2, "device defaults");
        t.check(cfg.butler.bufferSeconds == 10.0 && cfg.butler.chunkSize == 16384, "butler defaults");
        t.check(cfg.butler.parallelIo, "parallel I/O on by default");
        t.check(cfg.pdc.enabled && cfg.pdc.maxLatency == kDefaultMaxLatencySamples, "pdc defaults");
        t.check(!cfg.capture.enabled && cfg.streams.empty(), "no capture, no streams");
        t.check(cfg.bufferMargin == 1.0, "margin");
    });

    t.scenario("full session", [&] {
        SessionConfig cfg = ConfigLoader::parseSession(R"({
            "sampleRate": 44100,
            "bufferSize": 256,
            "outputChannels": 4,
            "butler": {
                "bufferSeconds": 4.0,
                "chunkSize": 8192,
                "flushThreshold": 2048,
                "cacheMaxEntries": 8,
                "cacheMaxBytes": 1000000,
                "seekCrossfadeSamples": 128,
                "speedRampSamples": 64,
                "parallelIo": false,
                "bufferMargin": 1.5
            },
            "pdc": { "enabled": false, "maxLatency": 9600,
                     "channelLatencies": [0, 128], "returnLatencies": [64] },
            "streams": [
                { "file": "drums.wav" },
                { "channel": 3, "file": "bass.wav", "offset": 4800, "speed": 0.5, "reverse": true,
                  "loop": { "start": 1000, "end": 5000, "crossfade": 256 } }
            ],
            "capture": { "file": "mix.wav", "channels": 1, "bufferMs": 500 }
        })");

        t.check(cfg.sampleRate == 44100 && cfg.bufferSize == 256 && cfg.outputChannels == 4, "device");
        t.check(cfg.butler.bufferSeconds == 4.0 && cfg.butler.chunkSize == 8192, "buffer sizing");
        t.check(cfg.butler.flushThreshold == 2048, "flush threshold");
        t.check(cfg.butler.cacheMaxEntries == 8 && cfg.butler.cacheMaxBytes == 1000000, "cache limits");
        t.check(cfg.butler.seekCrossfadeSamples == 128 && cfg.butler.speedRampSamples == 64, "fades");
        t.check(!cfg.butler.parallelIo && cfg.bufferMargin == 1.5, "parallel I/O and margin");
        t.check(!cfg.pdc.enabled && cfg.pdc.maxLatency == 9600, "pdc switches");
        t.check(cfg.pdc.channelLatencies.size() == 2 && cfg.pdc.channelLatencies[1] == 128, "channel latencies");
        t.check(cfg.pdc.returnLatencies.size() == 1 && cfg.pdc.returnLatencies[0] == 64, "return latencies");

        t.check(cfg.streams.size() == 2, "two streams");
        t.check(cfg.streams[0].channel == 0 && cfg.streams[0].file == "drums.wav", "channel defaults to index");
        t.check(!cfg.streams[0].hasLoop && cfg.streams[0].speed == 1.0f, "stream defaults");
        const StreamSpec& s = cfg.streams[1];
        t.check(s.channel == 3 && s.offset == 4800 && s.speed == 0.5f && s.reverse, "stream fields");
        t.check(s.hasLoop && s.loopStart == 1000 && s.loopEnd == 5000 && s.loopCrossfade == 256, "loop");

        t.check(cfg.capture.enabled && cfg.capture.file == "mix.wav", "capture enabled by its file");
        t.check(cfg.capture.channels == 1 && cfg.capture.bufferMs == 500.0f, "capture format");
    });

    t.scenario("buffer seconds floor at 1", [&] {
        SessionConfig cfg = ConfigLoader::parseSession(R"({"butler": {"bufferSeconds": 0.2}})");
        t.check(cfg.butler.bufferSeconds == 1.0, "clamped");
    });

    t.scenario("invalid values are rejected", [&] {
        t.check(rejects("{ not json"), "parse error");
        t.check(rejects(R"({"sampleRate": 0})"), "zero sample rate");
        t.check(rejects(R"({"bufferSize": -1})"), "negative buffer size");
        t.check(rejects(R"({"sampleRate": "fast"})"), "wrong type");
        t.check(rejects(R"({"butler": {"chunkSize": 0}})"), "zero chunk");
        t.check(rejects(R"({"butler": {"flushThreshold": -5}})"), "negative threshold");
        t.check(rejects(R"({"pdc": {"channelLatencies": [10, -1]}})"), "negative latency");
        t.check(rejects(R"({"pdc": {"channelLatencies": 5}})"), "latencies not an array");
        t.check(rejects(R"({"streams": {}})"), "streams not an array");
        t.check(rejects(R"({"streams": [{"channel": 0}]})"), "stream without a file");
        t.check(rejects(R"({"streams": [{"file": "a.wav", "loop": {"start": 10, "end": 10}}]})"), "empty loop");
        t.check(rejects(R"({"capture": {"file": "x.wav", "channels": 3}})"), "three capture channels");
    });

    t.scenario("load from disk", [&] {
        auto dir = testDir("config_loader");
        const std::string path = (dir / "session.json").string();
        {
            std::ofstream out(path);
            out << R"({"streams": [{"file": "a.wav", "offset": 12}]})";
        }
        SessionConfig cfg = ConfigLoader::loadSession(path);
        t.check(cfg.streams.size() == 1 && cfg.streams[0].offset == 12, "parsed from file");

        bool threw = false;
        try {
            ConfigLoader::loadSession((dir / "missing.json").string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        t.check(threw, "missing file throws");
    });

    return t.finish();
}
