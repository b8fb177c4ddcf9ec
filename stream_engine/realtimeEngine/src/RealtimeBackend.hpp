// RealtimeBackend.hpp: Audio Backend Adapter
//
// Wraps AlloLib's AudioIO to provide the interface between the streaming
// player and the audio hardware. This is the ONLY file that touches AudioIO;
// everything else interacts through StreamPlayer and the shared types.
//
// RESPONSIBILITIES:
// 1. Initialize the audio device with the sample rate, buffer size and
//    channel count from RealtimeConfig.
// 2. Register the top-level audio callback.
// 3. Start / stop the audio stream.
// 4. Report CPU load and count underrun frames (EngineState::xrunCount).
//
// BLOCK PROCESSING:
// 5. Read the runtime-control atomics ONCE per block. No atomic read of
//    RealtimeConfig occurs inside the per-frame loops.
// 6. Master gain is exponentially smoothed per block (tau = 50 ms).
// 7. Pause/resume uses a per-sample linear fade (kPauseFadeMs = 8 ms). While
//    fully paused the player is not pulled, so streams hold their position.
//
// DESIGN NOTES:
// - The callback function is static (required by AlloLib's C-style callback).
//   It receives `this` via the userData pointer and dispatches to the member
//   function `processBlock()`.
// - The callback must NEVER allocate, lock, or do I/O.
//
// REFERENCE: AlloLib AudioIO API (al/io/al_AudioIO.hpp)
//   AudioIO::init(callback, userData, framesPerBuf, framesPerSec, outChans, inChans)
//   AudioIO::open() / start() / stop() / close()
//   AudioIO::cpu() → current audio thread CPU load
//   AudioIOData::outBuffer(chan) → output channel buffer
//   AudioIOData::framesPerBuffer() → number of frames in current callback
//   AudioIOData::channelsOut() → number of output channels

#pragma once

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <vector>

#include "al/io/al_AudioIO.hpp"

#include "RealtimeTypes.hpp"
#include "StreamPlayer.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// RealtimeBackend: AlloLib AudioIO wrapper for the streaming player
// ─────────────────────────────────────────────────────────────────────────────

class RealtimeBackend {
public:

    RealtimeBackend(RealtimeConfig& config, EngineState& state)
        : mConfig(config), mState(state) {}

    ~RealtimeBackend() {
        shutdown();
    }

    // ── Lifecycle ────────────────────────────────────────────────────────

    /// Initialize the audio device. Must be called before start().
    /// Returns true on success.
    bool init() {
        std::cout << "[Backend] Initializing audio device..." << std::endl;
        std::cout << "  Sample rate:      " << mConfig.sampleRate << " Hz" << std::endl;
        std::cout << "  Buffer size:      " << mConfig.bufferSize << " frames" << std::endl;
        std::cout << "  Output channels:  " << mConfig.outputChannels << std::endl;

        mAudioIO.init(
            audioCallback,
            this,
            mConfig.bufferSize,
            (double)mConfig.sampleRate,
            mConfig.outputChannels,
            mConfig.inputChannels
        );

        if (!mAudioIO.open()) {
            std::cerr << "[Backend] ERROR: Failed to open audio device." << std::endl;
            return false;
        }

        mInitialized = true;
        std::cout << "[Backend] Audio device opened successfully." << std::endl;
        std::cout << "  Actual output channels: " << mAudioIO.channelsOut() << std::endl;
        std::cout << "  Actual buffer size:     " << mAudioIO.framesPerBuffer() << std::endl;

        // The device may grant a different block size or channel count.
        const size_t maxFrames = std::max<size_t>(mConfig.bufferSize, mAudioIO.framesPerBuffer());
        if (mPlayer) mPlayer->prepare(maxFrames);
        mOutputPtrs.assign(std::max<int>(mAudioIO.channelsOut(), mConfig.outputChannels), nullptr);
        return true;
    }

    /// Start audio streaming. Returns true on success.
    bool start() {
        if (!mInitialized) {
            std::cerr << "[Backend] ERROR: Cannot start: not initialized." << std::endl;
            return false;
        }
        std::cout << "[Backend] Starting audio stream..." << std::endl;

        if (!mAudioIO.start()) {
            std::cerr << "[Backend] ERROR: Failed to start audio stream." << std::endl;
            return false;
        }

        mConfig.playing.store(true);
        std::cout << "[Backend] Audio stream started." << std::endl;
        return true;
    }

    /// Stop audio streaming.
    void stop() {
        if (mAudioIO.isRunning()) {
            std::cout << "[Backend] Stopping audio stream..." << std::endl;
            mAudioIO.stop();
            mConfig.playing.store(false);
            std::cout << "[Backend] Audio stream stopped." << std::endl;
        }
    }

    /// Full shutdown: stop stream and close device.
    void shutdown() {
        stop();
        if (mInitialized) {
            mAudioIO.close();
            mInitialized = false;
            std::cout << "[Backend] Audio device closed." << std::endl;
        }
    }

    // ── Status queries ───────────────────────────────────────────────────

    /// Current CPU load of the audio thread (0.0–1.0).
    double cpuLoad() const { return mAudioIO.cpu(); }

    bool isRunning() { return mAudioIO.isRunning(); }
    bool isInitialized() const { return mInitialized; }

    // ── Wiring ───────────────────────────────────────────────────────────
    //
    // The backend holds a raw pointer to the player. Ownership stays with
    // main(). Set once before init() and never changed while streaming.

    void setPlayer(StreamPlayer* player) { mPlayer = player; }

private:

    // ── Static audio callback (C-style, required by AlloLib) ─────────────

    static void audioCallback(al::AudioIOData& io) {
        RealtimeBackend* self = static_cast<RealtimeBackend*>(io.user());
        if (self) {
            self->processBlock(io);
        }
    }

    // ── Per-block processing (called on audio thread) ────────────────────
    //
    //   1. Snapshot control atomics, smooth master gain, detect pause edges
    //   2. Zero output buffers
    //   3. Pull every channel through the player (mix + capture)
    //   4. Apply pause fade
    //   5. Update EngineState

    void processBlock(al::AudioIOData& io) {

        const unsigned int numFrames   = static_cast<unsigned int>(io.framesPerBuffer());
        const unsigned int numChannels = static_cast<unsigned int>(io.channelsOut());
        const double sampleRate        = static_cast<double>(mConfig.sampleRate);
        const double blockDurSec       = static_cast<double>(numFrames) / sampleRate;

        // ── A) Snapshot + smoothing ──────────────────────────────────────
        const float targetGain = mConfig.masterGain.load(std::memory_order_relaxed);
        {
            const double alpha = (mGainTauSec > 0.0)
                ? 1.0 - std::exp(-blockDurSec / mGainTauSec)
                : 1.0;
            mSmoothedGain += static_cast<float>(alpha * (targetGain - mSmoothedGain));
        }

        // ── B) Pause-fade edge detection ─────────────────────────────────
        const bool pausedNow = mConfig.paused.load(std::memory_order_relaxed);
        if (pausedNow != mPrevPaused) {
            const unsigned int fadeFrames = std::max(1u,
                static_cast<unsigned int>((kPauseFadeMs / 1000.0) * sampleRate));
            if (pausedNow) {
                mPauseFadeFramesLeft = fadeFrames;
                mPauseFadeStep       = -(mPauseFade / static_cast<float>(fadeFrames));
            } else {
                mPauseFade           = 0.0f;
                mPauseFadeFramesLeft = fadeFrames;
                mPauseFadeStep       = 1.0f / static_cast<float>(fadeFrames);
            }
            mPrevPaused = pausedNow;
        }

        // ── Step 1: Zero all output channels ─────────────────────────────
        for (unsigned int ch = 0; ch < numChannels; ++ch)
            std::memset(io.outBuffer(ch), 0, numFrames * sizeof(float));

        // Fully paused: keep outputs silent and do not pull the player, so
        // stream positions stay where the fade-out left them.
        if (pausedNow && mPauseFadeFramesLeft == 0 && mPauseFade <= 0.0f) {
            mState.cpuLoad.store(
                std::max(0.0f, std::min(1.0f, static_cast<float>(mAudioIO.cpu()))),
                std::memory_order_relaxed);
            return;
        }

        // ── Step 2: Render streams ───────────────────────────────────────
        if (mPlayer && numChannels <= mOutputPtrs.size()) {
            for (unsigned int ch = 0; ch < numChannels; ++ch) mOutputPtrs[ch] = io.outBuffer(ch);
            const uint64_t silent = mPlayer->renderBlock(mOutputPtrs.data(), numChannels,
                                                         numFrames, mSmoothedGain);
            if (silent > 0) mState.xrunCount.fetch_add(silent, std::memory_order_relaxed);
        }

        // ── Step 3: Apply pause fade per-sample ──────────────────────────
        if (mPauseFadeFramesLeft > 0 || mPauseFade < 1.0f) {
            for (unsigned int f = 0; f < numFrames; ++f) {
                if (mPauseFadeFramesLeft > 0) {
                    mPauseFade += mPauseFadeStep;
                    mPauseFade  = std::max(0.0f, std::min(1.0f, mPauseFade));
                    --mPauseFadeFramesLeft;
                }
                for (unsigned int ch = 0; ch < numChannels; ++ch)
                    io.outBuffer(ch)[f] *= mPauseFade;
            }
        }

        // ── Step 4: Update engine state ──────────────────────────────────
        const uint64_t newFrames = mState.frameCounter.load(std::memory_order_relaxed) + numFrames;
        mState.frameCounter.store(newFrames, std::memory_order_relaxed);
        mState.playbackTimeSec.store(
            static_cast<double>(newFrames) / sampleRate, std::memory_order_relaxed);
        mState.cpuLoad.store(
            std::max(0.0f, std::min(1.0f, static_cast<float>(mAudioIO.cpu()))),
            std::memory_order_relaxed);
    }

    // ── Member data ──────────────────────────────────────────────────────

    RealtimeConfig& mConfig;
    EngineState&    mState;
    al::AudioIO     mAudioIO;
    bool            mInitialized = false;

    // THREADING: set on the MAIN thread before init(); read-only on the
    // AUDIO thread afterwards. start() provides the happens-before.
    StreamPlayer*       mPlayer = nullptr;
    std::vector<float*> mOutputPtrs;   // Sized in init(), filled per block

    // ── Audio-thread-only state ──────────────────────────────────────────

    float  mSmoothedGain = 1.0f;
    double mGainTauSec   = 0.050;

    static constexpr double kPauseFadeMs = 8.0;

    bool         mPrevPaused          = false;
    float        mPauseFade           = 1.0f;
    float        mPauseFadeStep       = 0.0f;
    unsigned int mPauseFadeFramesLeft = 0;
};
