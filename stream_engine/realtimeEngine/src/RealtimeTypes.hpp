// RealtimeTypes.hpp: device settings and monitoring state for the player
//
// ─────────────────────────────────────────────────────────────────────────────
// THREADING MODEL
// ─────────────────────────────────────────────────────────────────────────────
//
// The engine uses THREE kinds of thread:
//
//  ┌────────────────┬──────────────────────────────────────────────────────┐
//  │ Thread         │ Role                                                 │
//  ├────────────────┼──────────────────────────────────────────────────────┤
//  │ MAIN thread    │ Setup, command submission, monitoring loop, clean    │
//  │                │ shutdown. Owns ButlerThread, PdcManager, backend.    │
//  ├────────────────┼──────────────────────────────────────────────────────┤
//  │ AUDIO thread   │ AlloLib AudioIO callback at real-time priority.      │
//  │                │ Pops region consumers, pushes the capture producer.  │
//  │                │ MUST NOT allocate, lock, or do I/O.                  │
//  ├────────────────┼──────────────────────────────────────────────────────┤
//  │ BUTLER thread  │ ButlerThread::run(). Commands, PDC realignment,      │
//  │                │ varifill refill, capture flushing. May block, lock,  │
//  │                │ allocate, and touch the disk.                        │
//  ├────────────────┼──────────────────────────────────────────────────────┤
//  │ REFILL workers │ Short-lived std::threads spawned by the butler when  │
//  │                │ three or more channels need data in one cycle. Each  │
//  │                │ owns one channel's producer for the cycle only.      │
//  └────────────────┴──────────────────────────────────────────────────────┘
//
// MEMORY ORDERING RULES:
//
//  ┌─────────────────────────────┬────────────────────────────────────────┐
//  │ Atomic                      │ Ordering used                          │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ RealtimeConfig::masterGain  │ relaxed (stale value for one buffer is │
//  │ ::playing, ::paused         │ inaudible and guards no other data)    │
//  │ ::shouldExit                │                                        │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ EngineState::*              │ relaxed (single writer per field,      │
//  │                             │ readers only display the value)        │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ FrameRing write/read index  │ release on publish, acquire on observe │
//  │                             │ (see RingBuffers.hpp)                  │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ SharedStreamState consumer  │ seq_cst hazard hand-off                │
//  │ pointer + in-use slot       │ (see SharedStreamState.hpp)            │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ PdcManager snapshot         │ std::atomic_load / std::atomic_store   │
//  │                             │ on shared_ptr<const PdcState>          │
//  └─────────────────────────────┴────────────────────────────────────────┘
//
// INVARIANTS THAT MUST NEVER BE VIOLATED:
//
//  1. SharedStreamState objects for every configured channel are created
//     (ButlerThread::sharedState) before RealtimeBackend::start() and are
//     never destroyed while audio runs.
//
//  2. The butler is stopped only AFTER RealtimeBackend::stop() returns, so
//     no callback can be holding a region consumer when the butler tears its
//     channel table down.
//
//  3. The capture producer handed to the backend is set before start() and
//     its consumer is registered with the butler before start().

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// RealtimeConfig: global configuration for the player
// ─────────────────────────────────────────────────────────────────────────────
// Set once at startup; the atomics may be changed from the main thread while
// audio runs.

struct RealtimeConfig {
    // ── Audio device settings ────────────────────────────────────────────
    int    sampleRate       = 48000;   // Audio sample rate in Hz
    int    bufferSize       = 512;     // Frames per audio callback buffer
    int    outputChannels   = 2;       // Device output channels
    int    inputChannels    = 0;       // Input channels (0 = output only)

    // ── Gain ─────────────────────────────────────────────────────────────
    std::atomic<float> masterGain{1.0f};   // Global output gain (0.0 to 1.0)

    // ── File paths (set at startup, read-only after) ─────────────────────
    std::string sessionPath;    // Session JSON
    std::string capturePath;    // Output WAV for the capture bus ("" = none)

    // ── Playback control ─────────────────────────────────────────────────
    std::atomic<bool> playing{false};    // True when audio should be output
    std::atomic<bool> shouldExit{false}; // True when engine should shut down
    std::atomic<bool> paused{false};     // True = audio callback outputs silence
};


// ─────────────────────────────────────────────────────────────────────────────
// EngineState: runtime state for monitoring (read-mostly)
// ─────────────────────────────────────────────────────────────────────────────

struct EngineState {
    // ── Playback position ────────────────────────────────────────────────
    std::atomic<uint64_t> frameCounter{0};      // Frames rendered since start
    std::atomic<double>   playbackTimeSec{0.0}; // frameCounter / sampleRate

    // ── Performance monitoring ───────────────────────────────────────────
    std::atomic<float>    cpuLoad{0.0f};    // Audio thread CPU usage (0.0 to 1.0)
    std::atomic<uint64_t> xrunCount{0};     // Frames rendered as underrun silence

    // ── Session info (set once at load time) ─────────────────────────────
    std::atomic<int>      numStreams{0};    // Streams requested by the session
};
