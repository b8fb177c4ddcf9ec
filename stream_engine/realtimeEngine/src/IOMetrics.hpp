// IOMetrics.hpp: butler I/O counters and read-throughput tracking
//
// Counters are plain atomics (relaxed): each is independent and only ever
// read for display or for refill sizing, so no ordering between them is
// needed. The sliding-window throughput tracker sits behind a mutex that is
// only ever try_lock()ed from recordRead(); if a refill worker already holds
// it the sample is dropped from the window (the byte counters still count it).
//
// The smoothed read rate feeds calculateVarifillChunk() in Varifill.hpp.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

// ─────────────────────────────────────────────────────────────────────────────
// ThroughputTracker: bytes per second over a sliding window
// ─────────────────────────────────────────────────────────────────────────────

class ThroughputTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ThroughputTracker(std::chrono::milliseconds window = std::chrono::milliseconds(1000))
        : mWindow(window) {}

    void record(uint64_t bytes) { record(bytes, Clock::now()); }

    void record(uint64_t bytes, Clock::time_point now) {
        mSamples.emplace_back(now, bytes);
        mTotal += bytes;
        while (!mSamples.empty() && now - mSamples.front().first > mWindow) {
            mTotal -= mSamples.front().second;
            mSamples.pop_front();
        }
    }

    /// Bytes/sec. Divides by the span between the oldest and newest sample
    /// when it exceeds 10 ms, otherwise by the full window.
    double rate() const {
        if (mSamples.empty()) return 0.0;
        const double span = std::chrono::duration<double>(mSamples.back().first - mSamples.front().first).count();
        const double window = std::chrono::duration<double>(mWindow).count();
        const double divisor = (span > 0.010) ? span : window;
        return static_cast<double>(mTotal) / divisor;
    }

    void clear() {
        mSamples.clear();
        mTotal = 0;
    }

private:
    std::chrono::milliseconds mWindow;
    std::deque<std::pair<Clock::time_point, uint64_t>> mSamples;
    uint64_t mTotal = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// IOMetricsSnapshot: plain copy for observers
// ─────────────────────────────────────────────────────────────────────────────

struct IOMetricsSnapshot {
    uint64_t bytesRead        = 0;
    uint64_t bytesWritten     = 0;
    uint64_t readOps          = 0;
    uint64_t writeOps         = 0;
    uint64_t cacheHits        = 0;
    uint64_t cacheMisses      = 0;
    uint64_t lowBufferEvents  = 0;
    double   readRate         = 0.0;   // Bytes/sec, smoothed
    double   cacheHitRate     = 1.0;

    double avgReadSize() const {
        return readOps == 0 ? 0.0 : static_cast<double>(bytesRead) / static_cast<double>(readOps);
    }
    double avgWriteSize() const {
        return writeOps == 0 ? 0.0 : static_cast<double>(bytesWritten) / static_cast<double>(writeOps);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// IOMetrics
// ─────────────────────────────────────────────────────────────────────────────

class IOMetrics {
public:
    IOMetrics() = default;
    IOMetrics(const IOMetrics&) = delete;
    IOMetrics& operator=(const IOMetrics&) = delete;

    void recordRead(uint64_t bytes) {
        mBytesRead.fetch_add(bytes, std::memory_order_relaxed);
        mReadOps.fetch_add(1, std::memory_order_relaxed);

        std::unique_lock<std::mutex> lock(mTrackerMutex, std::try_to_lock);
        if (lock.owns_lock()) {
            mTracker.record(bytes);
            mReadRate.store(mTracker.rate(), std::memory_order_relaxed);
        }
    }

    void recordWrite(uint64_t bytes) {
        mBytesWritten.fetch_add(bytes, std::memory_order_relaxed);
        mWriteOps.fetch_add(1, std::memory_order_relaxed);
    }

    void recordCacheHit()  { mCacheHits.fetch_add(1, std::memory_order_relaxed); }
    void recordCacheMiss() { mCacheMisses.fetch_add(1, std::memory_order_relaxed); }

    /// Near-empty refills, audio-thread underruns and capture overflows all
    /// count here, one event per occurrence or per lost frame.
    void recordLowBuffer(uint64_t count = 1) { mLowBufferEvents.fetch_add(count, std::memory_order_relaxed); }

    double readRate() const { return mReadRate.load(std::memory_order_relaxed); }

    /// hits / (hits + misses); 1.0 before any lookup.
    double cacheHitRate() const {
        const uint64_t hits = mCacheHits.load(std::memory_order_relaxed);
        const uint64_t total = hits + mCacheMisses.load(std::memory_order_relaxed);
        return total == 0 ? 1.0 : static_cast<double>(hits) / static_cast<double>(total);
    }

    IOMetricsSnapshot snapshot() const {
        IOMetricsSnapshot s;
        s.bytesRead       = mBytesRead.load(std::memory_order_relaxed);
        s.bytesWritten    = mBytesWritten.load(std::memory_order_relaxed);
        s.readOps         = mReadOps.load(std::memory_order_relaxed);
        s.writeOps        = mWriteOps.load(std::memory_order_relaxed);
        s.cacheHits       = mCacheHits.load(std::memory_order_relaxed);
        s.cacheMisses     = mCacheMisses.load(std::memory_order_relaxed);
        s.lowBufferEvents = mLowBufferEvents.load(std::memory_order_relaxed);
        s.readRate        = readRate();
        s.cacheHitRate    = cacheHitRate();
        return s;
    }

    void reset() {
        mBytesRead.store(0, std::memory_order_relaxed);
        mBytesWritten.store(0, std::memory_order_relaxed);
        mReadOps.store(0, std::memory_order_relaxed);
        mWriteOps.store(0, std::memory_order_relaxed);
        mCacheHits.store(0, std::memory_order_relaxed);
        mCacheMisses.store(0, std::memory_order_relaxed);
        mLowBufferEvents.store(0, std::memory_order_relaxed);
        mReadRate.store(0.0, std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(mTrackerMutex);
        mTracker.clear();
    }

private:
    std::atomic<uint64_t> mBytesRead{0};
    std::atomic<uint64_t> mBytesWritten{0};
    std::atomic<uint64_t> mReadOps{0};
    std::atomic<uint64_t> mWriteOps{0};
    std::atomic<uint64_t> mCacheHits{0};
    std::atomic<uint64_t> mCacheMisses{0};
    std::atomic<uint64_t> mLowBufferEvents{0};
    std::atomic<double>   mReadRate{0.0};

    std::mutex        mTrackerMutex;
    ThroughputTracker mTracker;
};
