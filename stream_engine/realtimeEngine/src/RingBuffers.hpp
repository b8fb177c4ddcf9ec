// RingBuffers.hpp: SPSC frame queues between the butler and the audio thread
//
// Two buffer pairs:
//   RegionBuffer: playback. Producer = butler (disk/cache → ring),
//                   consumer = audio thread (ring → output).
//   CaptureBuffer: recording. Producer = audio thread (input → ring),
//                   consumer = butler (ring → WAV file).
//
// Each ::create() returns exactly one producer half and one consumer half.
// Neither half is copyable, so the single-producer / single-consumer
// contract holds by construction.
//
// REAL-TIME SAFETY:
// - Storage is allocated once in create(); read/write never allocate.
// - write() stops at the first frame that does not fit and returns the count
//   accepted (back-pressure). read() returns false on underrun; the caller
//   substitutes silence.
// - Slots are std::atomic<StereoFrame> and the read index advances by CAS.
//   The butler may therefore clear() or drain a region consumer (seek,
//   realignment) while the audio thread is popping from it without tearing
//   a frame or handing the same frame out twice.
//
// MEMORY ORDERING:
//   producer: slot store (relaxed) → mWrite.store (release)
//   consumer: mWrite.load (acquire) → slot load (relaxed) → mRead CAS (acq_rel)
//   producer: mRead.load (acquire) before reusing a slot

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "StreamTypes.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// FrameRing: shared storage behind one producer/consumer pair
// ─────────────────────────────────────────────────────────────────────────────

class FrameRing {
public:
    explicit FrameRing(size_t capacity)
        : mCapacity(capacity), mSlots(capacity) {}

    size_t capacity() const { return mCapacity; }

    size_t occupied() const {
        uint64_t w = mWrite.load(std::memory_order_acquire);
        uint64_t r = mRead.load(std::memory_order_acquire);
        return static_cast<size_t>(w - r);
    }

    size_t vacant() const { return mCapacity - occupied(); }

    // ── Producer side ────────────────────────────────────────────────────

    bool push(const StereoFrame& frame) {
        uint64_t w = mWrite.load(std::memory_order_relaxed);
        uint64_t r = mRead.load(std::memory_order_acquire);
        if (w - r >= mCapacity) return false;
        mSlots[w % mCapacity].store(frame, std::memory_order_relaxed);
        mWrite.store(w + 1, std::memory_order_release);
        return true;
    }

    // ── Consumer side ────────────────────────────────────────────────────

    bool pop(StereoFrame& out) {
        uint64_t r = mRead.load(std::memory_order_acquire);
        for (;;) {
            uint64_t w = mWrite.load(std::memory_order_acquire);
            if (r >= w) return false;
            StereoFrame f = mSlots[r % mCapacity].load(std::memory_order_relaxed);
            if (mRead.compare_exchange_weak(r, r + 1, std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
                out = f;
                return true;
            }
        }
    }

    /// Drop everything currently buffered. Returns the number of frames dropped.
    size_t drain() {
        uint64_t r = mRead.load(std::memory_order_acquire);
        for (;;) {
            uint64_t w = mWrite.load(std::memory_order_acquire);
            if (r >= w) return 0;
            if (mRead.compare_exchange_weak(r, w, std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
                return static_cast<size_t>(w - r);
            }
        }
    }

private:
    const size_t mCapacity;
    std::vector<std::atomic<StereoFrame>> mSlots;
    std::atomic<uint64_t> mWrite{0};
    std::atomic<uint64_t> mRead{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// RegionBuffer: playback ring (butler → audio thread)
// ─────────────────────────────────────────────────────────────────────────────

struct RegionBufferMeta {
    std::string filePath;
    uint64_t    fileLength = 0;       // Frames in the source asset
    double      sampleRate = 0.0;     // Source asset sample rate
    int         channels   = 0;       // Source asset channel count
    std::atomic<uint64_t> filePosition{0};  // Next frame the producer will read
};

class RegionBufferProducer {
public:
    RegionBufferProducer(std::shared_ptr<FrameRing> ring, std::shared_ptr<RegionBufferMeta> meta)
        : mRing(std::move(ring)), mMeta(std::move(meta)) {}

    RegionBufferProducer(const RegionBufferProducer&) = delete;
    RegionBufferProducer& operator=(const RegionBufferProducer&) = delete;
    RegionBufferProducer(RegionBufferProducer&&) = default;
    RegionBufferProducer& operator=(RegionBufferProducer&&) = default;

    size_t capacity() const { return mRing->capacity(); }
    size_t writeSpace() const { return mRing->vacant(); }
    size_t buffered() const { return mRing->occupied(); }

    /// Push frames in order until the ring is full. Returns frames accepted.
    size_t write(const StereoFrame* frames, size_t count) {
        size_t written = 0;
        while (written < count && mRing->push(frames[written])) written++;
        return written;
    }
    size_t write(const std::vector<StereoFrame>& frames) { return write(frames.data(), frames.size()); }

    /// Push frames last-to-first (reverse playback). Returns frames accepted.
    size_t writeReversed(const StereoFrame* frames, size_t count) {
        size_t written = 0;
        while (written < count && mRing->push(frames[count - 1 - written])) written++;
        return written;
    }
    size_t writeReversed(const std::vector<StereoFrame>& frames) {
        return writeReversed(frames.data(), frames.size());
    }

    uint64_t filePosition() const { return mMeta->filePosition.load(std::memory_order_relaxed); }
    void setFilePosition(uint64_t pos) { mMeta->filePosition.store(pos, std::memory_order_relaxed); }

    const std::string& filePath() const { return mMeta->filePath; }
    uint64_t fileLength() const { return mMeta->fileLength; }
    double sampleRate() const { return mMeta->sampleRate; }
    int channels() const { return mMeta->channels; }

private:
    std::shared_ptr<FrameRing>        mRing;
    std::shared_ptr<RegionBufferMeta> mMeta;
};

class RegionBufferConsumer {
public:
    RegionBufferConsumer(std::shared_ptr<FrameRing> ring, RegionId id)
        : mRing(std::move(ring)), mRegionId(id) {}

    RegionBufferConsumer(const RegionBufferConsumer&) = delete;
    RegionBufferConsumer& operator=(const RegionBufferConsumer&) = delete;

    RegionId regionId() const { return mRegionId; }
    size_t capacity() const { return mRing->capacity(); }
    size_t available() const { return mRing->occupied(); }
    bool isEmpty() const { return available() == 0; }
    bool needsRefill(size_t threshold) const { return available() < threshold; }

    /// Pop one frame. False on underrun (caller outputs silence).
    bool read(StereoFrame& out) {
        if (!mRing->pop(out)) return false;
        mReadPosition.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    size_t readInto(StereoFrame* out, size_t count) {
        size_t n = 0;
        while (n < count && mRing->pop(out[n])) n++;
        mReadPosition.fetch_add(n, std::memory_order_relaxed);
        return n;
    }

    /// Drop all buffered frames. The paired producer sees full write space
    /// as soon as this returns.
    void clear() {
        size_t dropped = mRing->drain();
        mReadPosition.fetch_add(dropped, std::memory_order_relaxed);
    }

    /// File frame of the next frame to be played (forward playback).
    uint64_t readPosition() const { return mReadPosition.load(std::memory_order_relaxed); }

    /// Re-anchor the play position after the butler repositions the producer.
    void rebaseReadPosition(uint64_t pos) { mReadPosition.store(pos, std::memory_order_relaxed); }

private:
    std::shared_ptr<FrameRing> mRing;
    std::atomic<uint64_t>      mReadPosition{0};
    RegionId                   mRegionId;
};

struct RegionBuffer {
    static std::pair<RegionBufferProducer, std::shared_ptr<RegionBufferConsumer>>
    create(RegionId id, const std::string& filePath, uint64_t fileLength,
           double fileSampleRate, int channels, size_t capacity) {
        auto ring = std::make_shared<FrameRing>(std::max(capacity, kMinRingFrames));

        auto meta = std::make_shared<RegionBufferMeta>();
        meta->filePath   = filePath;
        meta->fileLength = fileLength;
        meta->sampleRate = fileSampleRate;
        meta->channels   = channels;

        RegionBufferProducer producer(ring, meta);
        auto consumer = std::make_shared<RegionBufferConsumer>(ring, id);
        return {std::move(producer), std::move(consumer)};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// CaptureBuffer: recording ring (audio thread → butler)
// ─────────────────────────────────────────────────────────────────────────────

struct CaptureBufferMeta {
    std::string filePath;
    double      sampleRate = 0.0;
    int         channels   = 0;
    std::atomic<uint64_t> framesWritten{0};   // Frames flushed to disk
    std::atomic<uint64_t> framesCaptured{0};  // Frames pushed by the audio thread
    std::atomic<uint64_t> framesDropped{0};   // Overflow since the butler last looked
};

class CaptureBufferProducer {
public:
    CaptureBufferProducer(std::shared_ptr<FrameRing> ring, std::shared_ptr<CaptureBufferMeta> meta, CaptureId id)
        : mRing(std::move(ring)), mMeta(std::move(meta)), mCaptureId(id) {}

    CaptureBufferProducer(const CaptureBufferProducer&) = delete;
    CaptureBufferProducer& operator=(const CaptureBufferProducer&) = delete;
    CaptureBufferProducer(CaptureBufferProducer&&) = default;
    CaptureBufferProducer& operator=(CaptureBufferProducer&&) = default;

    CaptureId captureId() const { return mCaptureId; }
    size_t writeSpace() const { return mRing->vacant(); }
    bool isNearlyFull(size_t threshold) const { return writeSpace() < threshold; }

    /// Frames that do not fit are dropped and counted in framesDropped().
    bool write(const StereoFrame& frame) {
        if (!mRing->push(frame)) {
            mMeta->framesDropped.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        mMeta->framesCaptured.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    size_t writeMany(const StereoFrame* frames, size_t count) {
        size_t written = 0;
        while (written < count && mRing->push(frames[written])) written++;
        mMeta->framesCaptured.fetch_add(written, std::memory_order_relaxed);
        if (written < count) mMeta->framesDropped.fetch_add(count - written, std::memory_order_relaxed);
        return written;
    }

    const std::string& filePath() const { return mMeta->filePath; }
    uint64_t framesCaptured() const { return mMeta->framesCaptured.load(std::memory_order_relaxed); }
    uint64_t framesDropped() const { return mMeta->framesDropped.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<FrameRing>         mRing;
    std::shared_ptr<CaptureBufferMeta> mMeta;
    CaptureId                          mCaptureId;
};

class CaptureBufferConsumer {
public:
    CaptureBufferConsumer(std::shared_ptr<FrameRing> ring, std::shared_ptr<CaptureBufferMeta> meta, CaptureId id)
        : mRing(std::move(ring)), mMeta(std::move(meta)), mCaptureId(id) {}

    CaptureBufferConsumer(const CaptureBufferConsumer&) = delete;
    CaptureBufferConsumer& operator=(const CaptureBufferConsumer&) = delete;

    CaptureId captureId() const { return mCaptureId; }
    size_t available() const { return mRing->occupied(); }
    bool needsFlush(size_t threshold) const { return available() >= threshold; }

    size_t readInto(StereoFrame* out, size_t count) {
        size_t n = 0;
        while (n < count && mRing->pop(out[n])) n++;
        return n;
    }

    const std::string& filePath() const { return mMeta->filePath; }
    double sampleRate() const { return mMeta->sampleRate; }
    int channels() const { return mMeta->channels; }

    uint64_t framesWritten() const { return mMeta->framesWritten.load(std::memory_order_relaxed); }
    void addFramesWritten(uint64_t count) { mMeta->framesWritten.fetch_add(count, std::memory_order_relaxed); }
    uint64_t framesCaptured() const { return mMeta->framesCaptured.load(std::memory_order_relaxed); }

    /// Overflowed frames since the previous call; resets the count.
    uint64_t takeFramesDropped() { return mMeta->framesDropped.exchange(0, std::memory_order_relaxed); }

private:
    std::shared_ptr<FrameRing>         mRing;
    std::shared_ptr<CaptureBufferMeta> mMeta;
    CaptureId                          mCaptureId;
};

struct CaptureBuffer {
    static std::pair<CaptureBufferProducer, std::unique_ptr<CaptureBufferConsumer>>
    create(CaptureId id, const std::string& filePath, double sampleRate, int channels, float bufferMs) {
        size_t capacity = static_cast<size_t>(bufferMs / 1000.0f * static_cast<float>(sampleRate));
        return withCapacity(id, filePath, sampleRate, channels, capacity);
    }

    static std::pair<CaptureBufferProducer, std::unique_ptr<CaptureBufferConsumer>>
    withCapacity(CaptureId id, const std::string& filePath, double sampleRate, int channels, size_t capacity) {
        auto ring = std::make_shared<FrameRing>(std::max(capacity, kMinRingFrames));

        auto meta = std::make_shared<CaptureBufferMeta>();
        meta->filePath   = filePath;
        meta->sampleRate = sampleRate;
        meta->channels   = channels;

        CaptureBufferProducer producer(ring, meta, id);
        auto consumer = std::make_unique<CaptureBufferConsumer>(ring, meta, id);
        return {std::move(producer), std::move(consumer)};
    }
};
