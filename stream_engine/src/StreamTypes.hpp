// StreamTypes.hpp: Shared value types for the sonoStream engine
//
// Used by both the offline helpers in stream_engine/src/ (asset decode,
// capture writer, config loader, PDC graph analysis) and the real-time
// engine headers in stream_engine/realtimeEngine/src/.
//
// CONTENTS:
// - RegionId / CaptureId: process-wide monotonically increasing ids
// - StereoFrame: one interleaved (left, right) frame
// - PlayDirection / Varispeed: per-channel playback direction and speed
// - ButlerState: butler thread run state
// - BufferConfig: butler tuning (ring sizes, chunk sizes, cache bounds)
// - LatencyCeilingError / LockPoisonedError: distinct error types
//
// DESIGN NOTES:
// - StereoFrame is 8 bytes and trivially copyable so it can live inside a
//   std::atomic<> slot (lock-free on every 64-bit target we build for).
// - Ids never get reused: the counters only ever go up.

#pragma once

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// Identifiers
// ─────────────────────────────────────────────────────────────────────────────

struct RegionId {
    uint64_t value = 0;

    static RegionId generate() {
        static std::atomic<uint64_t> counter{1};
        return RegionId{counter.fetch_add(1, std::memory_order_relaxed)};
    }

    bool operator==(const RegionId& other) const { return value == other.value; }
    bool operator!=(const RegionId& other) const { return value != other.value; }
    bool operator<(const RegionId& other) const { return value < other.value; }
};

struct CaptureId {
    uint64_t value = 0;

    static CaptureId generate() {
        static std::atomic<uint64_t> counter{1};
        return CaptureId{counter.fetch_add(1, std::memory_order_relaxed)};
    }

    bool operator==(const CaptureId& other) const { return value == other.value; }
    bool operator!=(const CaptureId& other) const { return value != other.value; }
    bool operator<(const CaptureId& other) const { return value < other.value; }
};

namespace std {
template <> struct hash<RegionId> {
    size_t operator()(const RegionId& id) const noexcept { return hash<uint64_t>()(id.value); }
};
template <> struct hash<CaptureId> {
    size_t operator()(const CaptureId& id) const noexcept { return hash<uint64_t>()(id.value); }
};
}

// ─────────────────────────────────────────────────────────────────────────────
// StereoFrame
// ─────────────────────────────────────────────────────────────────────────────

struct StereoFrame {
    float left  = 0.0f;
    float right = 0.0f;

    bool operator==(const StereoFrame& other) const {
        return left == other.left && right == other.right;
    }
    bool operator!=(const StereoFrame& other) const { return !(*this == other); }
};

// ─────────────────────────────────────────────────────────────────────────────
// Varispeed
// ─────────────────────────────────────────────────────────────────────────────

enum class PlayDirection : uint8_t {
    Forward = 0,
    Reverse = 1
};

struct Varispeed {
    PlayDirection direction = PlayDirection::Forward;
    float         speed     = 1.0f;

    static Varispeed reverse() { return Varispeed{PlayDirection::Reverse, 1.0f}; }

    bool isForward() const { return direction == PlayDirection::Forward; }
    bool isReverse() const { return direction == PlayDirection::Reverse; }

    /// Magnitude used for refill sizing. Never reaches zero.
    float effectiveSpeed() const { return std::max(std::fabs(speed), 0.01f); }

    /// Speed with direction folded into the sign.
    float signedSpeed() const {
        return isReverse() ? -std::fabs(speed) : std::fabs(speed);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// LoopRange
// ─────────────────────────────────────────────────────────────────────────────

/// Half-open loop region [start, end) in file frames, with an optional
/// crossfade length applied as the playhead approaches `end`.
struct LoopRange {
    uint64_t start     = 0;
    uint64_t end       = 0;
    size_t   crossfade = 0;

    uint64_t length() const { return end > start ? end - start : 0; }
    bool isValid() const { return end > start; }
};

// ─────────────────────────────────────────────────────────────────────────────
// ButlerState
// ─────────────────────────────────────────────────────────────────────────────

enum class ButlerState : uint8_t {
    Running  = 0,
    Paused   = 1,
    Shutdown = 2
};

// ─────────────────────────────────────────────────────────────────────────────
// BufferConfig: butler tuning
// ─────────────────────────────────────────────────────────────────────────────

static constexpr size_t kMinRingFrames = 4096;

// Default PDC latency ceiling: 10 seconds at 48 kHz.
static constexpr size_t kDefaultMaxLatencySamples = 48000 * 10;

struct BufferConfig {
    double   bufferSeconds        = 10.0;
    size_t   chunkSize            = 16384;       // Base varifill chunk (frames)
    size_t   flushThreshold       = 8192;        // Capture frames before a flush
    size_t   cacheMaxEntries      = 64;
    uint64_t cacheMaxBytes        = 1024ull * 1024ull * 1024ull;  // 1 GiB
    size_t   seekCrossfadeSamples = 512;
    uint32_t speedRampSamples     = 1024;
    bool     parallelIo           = true;

    static BufferConfig withBufferSeconds(double seconds) {
        BufferConfig c;
        c.bufferSeconds = std::max(seconds, 1.0);
        return c;
    }

    size_t bufferSamples(double sampleRate) const {
        return std::max(static_cast<size_t>(bufferSeconds * sampleRate), kMinRingFrames);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

/// A channel or return bus reported more latency than the configured ceiling.
/// Treated as a misconfiguration: never clamped, always raised.
class LatencyCeilingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The mutex guarding non-real-time shared state could not be taken.
class LockPoisonedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
