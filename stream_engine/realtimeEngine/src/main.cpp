// main.cpp: sonoStream player entry point
//
// This is the CLI entry point for the streaming engine. It:
//   1. Parses command-line arguments (session, device overrides, capture)
//   2. Loads the session JSON
//   3. Publishes the session's PDC latencies
//   4. Starts the butler thread and wires each channel into the player
//   5. Issues the configured stream / varispeed / loop commands
//   6. Registers the capture bus (if any)
//   7. Initializes and starts the Backend Adapter (AlloLib AudioIO)
//   8. Runs a monitoring loop until interrupted (Ctrl+C / SIGTERM)
//   9. Shuts down cleanly (backend → capture removal → butler)
//
// Usage:
//   ./sonoStream_player \
//       --config session.json \
//       [--samplerate 48000] \
//       [--buffersize 512] \
//       [--gain 0.8] \
//       [--capture take.wav]

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "Butler.hpp"
#include "ConfigLoader.hpp"
#include "PdcManager.hpp"
#include "RealtimeBackend.hpp"
#include "RealtimeTypes.hpp"
#include "RingBuffers.hpp"
#include "StreamPlayer.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// Signal handling for clean shutdown on Ctrl+C
// ─────────────────────────────────────────────────────────────────────────────

static RealtimeConfig* g_config = nullptr;

void signalHandler(int signum) {
    (void)signum;
    if (g_config) {
        g_config->shouldExit.store(true);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Argument parsing helpers
// ─────────────────────────────────────────────────────────────────────────────

/// Look up a string argument by name. Returns empty string if not found.
static std::string getArgString(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == flag) {
            return std::string(argv[i + 1]);
        }
    }
    return "";
}

/// Look up an integer argument by name. Returns defaultVal if absent or invalid.
static int getArgInt(int argc, char* argv[], const std::string& flag, int defaultVal) {
    std::string val = getArgString(argc, argv, flag);
    if (!val.empty()) {
        try { return std::stoi(val); }
        catch (const std::exception&) {
            std::cerr << "[Main] WARNING: ignoring invalid " << flag << " '" << val << "'" << std::endl;
        }
    }
    return defaultVal;
}

/// Look up a float argument by name. Returns defaultVal if absent or invalid.
static float getArgFloat(int argc, char* argv[], const std::string& flag, float defaultVal) {
    std::string val = getArgString(argc, argv, flag);
    if (!val.empty()) {
        try { return std::stof(val); }
        catch (const std::exception&) {
            std::cerr << "[Main] WARNING: ignoring invalid " << flag << " '" << val << "'" << std::endl;
        }
    }
    return defaultVal;
}

/// Check if a flag is present (no value).
static bool hasArg(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Usage / help
// ─────────────────────────────────────────────────────────────────────────────

static void printUsage(const char* progName) {
    std::cout << "\nsonoStream Disk Streaming Player\n"
              << "────────────────────────────────\n"
              << "Usage: " << progName << " [options]\n\n"
              << "Required:\n"
              << "  --config <path>     Session JSON (streams, butler, PDC, capture)\n\n"
              << "Optional:\n"
              << "  --samplerate <int>  Override the session sample rate in Hz\n"
              << "  --buffersize <int>  Override frames per audio callback\n"
              << "  --gain <float>      Master gain 0.0–1.0 (default: 1.0)\n"
              << "  --capture <path>    Record the output mix to a float WAV\n"
              << "                      (overrides the session's capture file)\n"
              << "  --help              Show this message\n"
              << std::endl;
}

// ─────────────────────────────────────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {

    if (hasArg(argc, argv, "--help") || hasArg(argc, argv, "-h")) {
        printUsage(argv[0]);
        return 0;
    }

    std::cout << "\n╔══════════════════════════════════════════╗" << std::endl;
    std::cout << "║  sonoStream Disk Streaming Player        ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════╝\n" << std::endl;

    // ── Parse arguments ──────────────────────────────────────────────────

    RealtimeConfig config;
    EngineState    state;

    config.sessionPath = getArgString(argc, argv, "--config");
    if (config.sessionPath.empty()) {
        std::cerr << "[Main] ERROR: --config is required." << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    // ── Load session ─────────────────────────────────────────────────────

    std::cout << "[Main] Loading session: " << config.sessionPath << std::endl;
    SessionConfig session;
    try {
        session = ConfigLoader::loadSession(config.sessionPath);
    } catch (const std::exception& e) {
        std::cerr << "[Main] FATAL: Failed to load session: " << e.what() << std::endl;
        return 1;
    }

    config.sampleRate     = getArgInt(argc, argv, "--samplerate", session.sampleRate);
    config.bufferSize     = getArgInt(argc, argv, "--buffersize", session.bufferSize);
    config.outputChannels = session.outputChannels;
    config.masterGain.store(getArgFloat(argc, argv, "--gain", 1.0f));
    config.capturePath    = getArgString(argc, argv, "--capture");
    if (config.capturePath.empty() && session.capture.enabled) config.capturePath = session.capture.file;

    if (config.sampleRate <= 0 || config.bufferSize <= 0) {
        std::cerr << "[Main] ERROR: sample rate and buffer size must be positive." << std::endl;
        return 1;
    }

    std::cout << "[Main] Configuration:" << std::endl;
    std::cout << "  Sample rate:  " << config.sampleRate << " Hz" << std::endl;
    std::cout << "  Buffer size:  " << config.bufferSize << " frames" << std::endl;
    std::cout << "  Outputs:      " << config.outputChannels << std::endl;
    std::cout << "  Master gain:  " << config.masterGain.load() << std::endl;
    std::cout << "  Streams:      " << session.streams.size() << std::endl;
    std::cout << "  PDC:          " << (session.pdc.enabled ? "enabled" : "disabled") << std::endl;
    std::cout << "  Capture:      " << (config.capturePath.empty() ? "(none)" : config.capturePath) << std::endl;
    std::cout << std::endl;

    g_config = &config;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // ── Plugin delay compensation ────────────────────────────────────────

    auto pdc = std::make_shared<PdcManager>(session.pdc.channelLatencies.size(),
                                            session.pdc.returnLatencies.size());
    pdc->setEnabled(session.pdc.enabled);
    pdc->setMaxAllowedLatency(session.pdc.maxLatency);
    try {
        for (size_t i = 0; i < session.pdc.channelLatencies.size(); ++i)
            pdc->setChannelLatency(i, session.pdc.channelLatencies[i]);
        for (size_t i = 0; i < session.pdc.returnLatencies.size(); ++i)
            pdc->setReturnLatency(i, session.pdc.returnLatencies[i]);
    } catch (const LatencyCeilingError& e) {
        std::cerr << "[Main] FATAL: " << e.what() << std::endl;
        return 1;
    }
    if (session.pdc.enabled) {
        std::cout << "[Main] PDC: max latency " << pdc->maxLatency() << " samples." << std::endl;
    }

    // ── Butler + player wiring ───────────────────────────────────────────

    ButlerThread butler(session.butler, static_cast<double>(config.sampleRate));
    butler.setPdc(pdc);

    StreamPlayer player;
    for (const StreamSpec& s : session.streams) {
        player.addChannel(s.channel, butler.sharedState(s.channel));
    }
    state.numStreams.store(static_cast<int>(session.streams.size()));

    butler.start();
    butler.send(ButlerCommand::setBufferMargin(session.bufferMargin));

    for (const StreamSpec& s : session.streams) {
        const PlayDirection dir = s.reverse ? PlayDirection::Reverse : PlayDirection::Forward;
        butler.send(ButlerCommand::setVarispeed(s.channel, dir, s.speed));
        butler.send(ButlerCommand::streamAudioFile(s.channel, s.file, s.offset));
        if (s.hasLoop) {
            butler.send(ButlerCommand::setLoopRange(s.channel, s.loopStart, s.loopEnd, s.loopCrossfade));
        }
    }

    // ── Capture bus ──────────────────────────────────────────────────────

    std::optional<CaptureBufferProducer> captureProducer;
    CaptureId captureId;
    if (!config.capturePath.empty()) {
        captureId = CaptureId::generate();
        auto capture = CaptureBuffer::create(captureId, config.capturePath,
                                             static_cast<double>(config.sampleRate),
                                             session.capture.channels, session.capture.bufferMs);
        captureProducer.emplace(std::move(capture.first));
        butler.send(ButlerCommand::registerCapture(captureId, std::move(capture.second), config.capturePath,
                                                   static_cast<double>(config.sampleRate),
                                                   session.capture.channels));
        player.setCapture(&*captureProducer);
    }

    // Give the butler a moment to fill the first buffers before audio starts.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // ── Initialize the Backend Adapter ───────────────────────────────────

    RealtimeBackend backend(config, state);
    backend.setPlayer(&player);

    if (!backend.init()) {
        std::cerr << "[Main] FATAL: Backend initialization failed." << std::endl;
        butler.stop();
        return 1;
    }

    if (!backend.start()) {
        std::cerr << "[Main] FATAL: Backend failed to start." << std::endl;
        butler.stop();
        return 1;
    }

    // ── Monitoring loop ──────────────────────────────────────────────────

    std::cout << "[Main] Streaming " << session.streams.size()
              << " channel(s). Press Ctrl+C to stop.\n" << std::endl;

    while (!config.shouldExit.load()) {

        double timeSec = state.playbackTimeSec.load(std::memory_order_relaxed);
        float  cpu     = state.cpuLoad.load(std::memory_order_relaxed);
        IOMetricsSnapshot io = butler.metrics().snapshot();

        std::cout << "\r  Time: " << std::fixed;
        std::cout.precision(1);
        std::cout << timeSec << "s"
                  << "  |  CPU: " << (cpu * 100.0f) << "%"
                  << "  |  Streams: " << butler.activeStreams()
                  << "  |  Read: " << (io.readRate / (1024.0 * 1024.0)) << " MB/s"
                  << "  |  Cache hit: " << (io.cacheHitRate * 100.0) << "%"
                  << "  |  Xruns: " << state.xrunCount.load(std::memory_order_relaxed)
                  << "     " << std::flush;

        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    std::cout << std::endl;

    // ── Clean shutdown ───────────────────────────────────────────────────
    // Stop audio first so the callback no longer touches the player or the
    // capture producer, then let the butler drain the capture and exit.

    std::cout << "\n[Main] Shutting down..." << std::endl;
    backend.shutdown();
    if (captureProducer) {
        player.setCapture(nullptr);
        butler.send(ButlerCommand::removeCapture(captureId));
    }
    butler.stop();

    IOMetricsSnapshot io = butler.metrics().snapshot();
    std::cout << "[Main] Final stats:" << std::endl;
    std::cout << "  Total frames:  " << state.frameCounter.load() << std::endl;
    std::cout << "  Total time:    " << state.playbackTimeSec.load() << " seconds" << std::endl;
    std::cout << "  Bytes read:    " << io.bytesRead << std::endl;
    std::cout << "  Bytes written: " << io.bytesWritten << std::endl;
    std::cout << "  Low-buffer:    " << io.lowBufferEvents << std::endl;
    std::cout << "[Main] Goodbye." << std::endl;

    return 0;
}
