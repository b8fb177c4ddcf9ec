#include "ConfigLoader.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Helper: read a non-negative integer field, rejecting negative values
static uint64_t getUnsigned(const json &j, const char *key, uint64_t defaultVal, const std::string &where) {
    if (!j.contains(key)) return defaultVal;
    const json &v = j.at(key);
    if (!v.is_number())
        throw std::runtime_error(where + "." + key + " must be a number");
    if (v.is_number_integer() && v.get<int64_t>() < 0)
        throw std::runtime_error(where + "." + key + " must not be negative");
    if (v.is_number_float() && v.get<double>() < 0.0)
        throw std::runtime_error(where + "." + key + " must not be negative");
    return v.get<uint64_t>();
}

static std::vector<size_t> getLatencyList(const json &j, const char *key) {
    std::vector<size_t> out;
    if (!j.contains(key)) return out;
    if (!j.at(key).is_array())
        throw std::runtime_error(std::string("pdc.") + key + " must be an array");
    for (const auto &v : j.at(key)) {
        if (!v.is_number_integer() || v.get<int64_t>() < 0)
            throw std::runtime_error(std::string("pdc.") + key + " entries must be non-negative integers");
        out.push_back(v.get<size_t>());
    }
    return out;
}

static void parseButler(const json &b, SessionConfig &cfg) {
    BufferConfig &bc = cfg.butler;
    bc.bufferSeconds        = std::max(b.value("bufferSeconds", bc.bufferSeconds), 1.0);
    bc.chunkSize            = static_cast<size_t>(getUnsigned(b, "chunkSize", bc.chunkSize, "butler"));
    bc.flushThreshold       = static_cast<size_t>(getUnsigned(b, "flushThreshold", bc.flushThreshold, "butler"));
    bc.cacheMaxEntries      = static_cast<size_t>(getUnsigned(b, "cacheMaxEntries", bc.cacheMaxEntries, "butler"));
    bc.cacheMaxBytes        = getUnsigned(b, "cacheMaxBytes", bc.cacheMaxBytes, "butler");
    bc.seekCrossfadeSamples = static_cast<size_t>(getUnsigned(b, "seekCrossfadeSamples", bc.seekCrossfadeSamples, "butler"));
    bc.speedRampSamples     = static_cast<uint32_t>(getUnsigned(b, "speedRampSamples", bc.speedRampSamples, "butler"));
    bc.parallelIo           = b.value("parallelIo", bc.parallelIo);
    cfg.bufferMargin        = b.value("bufferMargin", cfg.bufferMargin);

    if (bc.chunkSize == 0)
        throw std::runtime_error("butler.chunkSize must be positive");
    if (bc.flushThreshold == 0)
        throw std::runtime_error("butler.flushThreshold must be positive");
}

static StreamSpec parseStream(const json &s, size_t index) {
    std::string where = "streams[" + std::to_string(index) + "]";
    StreamSpec spec;

    if (!s.contains("file") || !s["file"].is_string())
        throw std::runtime_error(where + ".file is required");

    spec.channel = static_cast<size_t>(getUnsigned(s, "channel", index, where));
    spec.file    = s["file"].get<std::string>();
    spec.offset  = getUnsigned(s, "offset", 0, where);
    spec.speed   = s.value("speed", 1.0f);
    spec.reverse = s.value("reverse", false);

    if (s.contains("loop")) {
        const json &l = s["loop"];
        spec.hasLoop       = true;
        spec.loopStart     = getUnsigned(l, "start", 0, where + ".loop");
        spec.loopEnd       = getUnsigned(l, "end", 0, where + ".loop");
        spec.loopCrossfade = static_cast<size_t>(getUnsigned(l, "crossfade", 0, where + ".loop"));
        if (spec.loopEnd <= spec.loopStart)
            throw std::runtime_error(where + ".loop.end must be greater than loop.start");
    }

    return spec;
}

static SessionConfig parseSessionJson(const json &j) {
    SessionConfig cfg;

    cfg.sampleRate     = j.value("sampleRate", cfg.sampleRate);
    cfg.bufferSize     = j.value("bufferSize", cfg.bufferSize);
    cfg.outputChannels = j.value("outputChannels", cfg.outputChannels);

    if (cfg.sampleRate <= 0)
        throw std::runtime_error("sampleRate must be positive");
    if (cfg.bufferSize <= 0)
        throw std::runtime_error("bufferSize must be positive");
    if (cfg.outputChannels <= 0)
        throw std::runtime_error("outputChannels must be positive");

    if (j.contains("butler")) parseButler(j["butler"], cfg);

    if (j.contains("pdc")) {
        const json &p = j["pdc"];
        cfg.pdc.enabled          = p.value("enabled", cfg.pdc.enabled);
        cfg.pdc.maxLatency       = static_cast<size_t>(getUnsigned(p, "maxLatency", cfg.pdc.maxLatency, "pdc"));
        cfg.pdc.channelLatencies = getLatencyList(p, "channelLatencies");
        cfg.pdc.returnLatencies  = getLatencyList(p, "returnLatencies");
    }

    if (j.contains("streams")) {
        if (!j["streams"].is_array())
            throw std::runtime_error("streams must be an array");
        size_t i = 0;
        for (const auto &s : j["streams"]) {
            cfg.streams.push_back(parseStream(s, i++));
        }
    }

    if (j.contains("capture")) {
        const json &c = j["capture"];
        cfg.capture.file     = c.value("file", std::string());
        cfg.capture.channels = c.value("channels", cfg.capture.channels);
        cfg.capture.bufferMs = c.value("bufferMs", cfg.capture.bufferMs);
        cfg.capture.enabled  = !cfg.capture.file.empty();
        if (cfg.capture.channels < 1 || cfg.capture.channels > 2)
            throw std::runtime_error("capture.channels must be 1 or 2");
    }

    return cfg;
}

SessionConfig ConfigLoader::parseSession(const std::string &jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error &e) {
        throw std::runtime_error(std::string("Session JSON parse error: ") + e.what());
    }
    try {
        return parseSessionJson(j);
    } catch (const json::type_error &e) {
        throw std::runtime_error(std::string("Session JSON has a field of the wrong type: ") + e.what());
    }
}

SessionConfig ConfigLoader::loadSession(const std::string &path) {
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("Cannot open session JSON: " + path);

    std::stringstream buffer;
    buffer << f.rdbuf();

    SessionConfig cfg = parseSession(buffer.str());

    std::cout << "[Config] Loaded session " << path << ": "
              << cfg.streams.size() << " stream(s), "
              << cfg.sampleRate << " Hz, PDC "
              << (cfg.pdc.enabled ? "enabled" : "disabled") << std::endl;

    return cfg;
}
