// Varifill.hpp: adaptive refill sizing and the forward/reverse fill routines
//
// Called only from the butler thread and its refill workers.
//
// CHUNK SIZING (calculateVarifillChunk):
//   urgency     = 1 - fill
//   bandwidth   = clamp(sqrt(readRate / 10 MB/s), 0.5, 2.0)   (1.0 with no data)
//   speedFactor = max(speed, 1)
//   multiplier  = clamp((0.5 + 1.5 * urgency) * bandwidth * speedFactor, 0.25, 4.0)
//   chunk       = max(baseChunk * multiplier, 1024)
//
// FILL ROUTINES:
// - refillForward() reads from the producer's file position, zero-pads past
//   the end of the asset and wraps at the loop end when a loop is set.
// - refillReverse() reads the `chunk` frames that END at the file position
//   and pushes them last-to-first. At position 0 it pushes silence.
// - The file position moves by the number of frames the ring accepted, not
//   by the number requested.
// - Both take a caller-owned scratch vector that is reused across cycles so
//   steady-state refills do not allocate.

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "AudioAsset.hpp"
#include "RingBuffers.hpp"
#include "StreamTypes.hpp"

static constexpr double kBaselineReadRate  = 10000000.0;   // 10 MB/s
static constexpr size_t kMinVarifillChunk  = 1024;
static constexpr float  kLowBufferFraction = 0.10f;
static constexpr float  kRefillThreshold   = 0.75f;

inline size_t calculateVarifillChunk(float bufferFill, size_t baseChunk,
                                     double readRateBytesPerSec, float playbackSpeed) {
    const double urgency = 1.0 - static_cast<double>(bufferFill);

    double bandwidthFactor = 1.0;
    if (readRateBytesPerSec > 0.0) {
        bandwidthFactor = std::min(std::max(std::sqrt(readRateBytesPerSec / kBaselineReadRate), 0.5), 2.0);
    }

    const double speedFactor = static_cast<double>(std::max(playbackSpeed, 1.0f));

    double multiplier = (0.5 + urgency * 1.5) * bandwidthFactor * speedFactor;
    multiplier = std::min(std::max(multiplier, 0.25), 4.0);

    const size_t chunk = static_cast<size_t>(static_cast<double>(baseChunk) * multiplier);
    return std::max(chunk, kMinVarifillChunk);
}

/// Ring capacity for a region: short files are buffered whole (up to 30 s),
/// longer files get progressively shorter buffers.
inline size_t calculateBufferSize(uint64_t fileLengthFrames, double sampleRate) {
    const double fileSizeMb = static_cast<double>(fileLengthFrames * 2 * 4) / (1024.0 * 1024.0);

    double bufferSeconds;
    if (fileSizeMb < 50.0) {
        bufferSeconds = std::min(static_cast<double>(fileLengthFrames) / sampleRate, 30.0);
    } else if (fileSizeMb < 200.0) {
        bufferSeconds = 10.0;
    } else if (fileSizeMb < 500.0) {
        bufferSeconds = 5.0;
    } else {
        bufferSeconds = 3.0;
    }

    return std::max(static_cast<size_t>(bufferSeconds * sampleRate), kMinRingFrames);
}

// ─────────────────────────────────────────────────────────────────────────────
// Fill routines
// ─────────────────────────────────────────────────────────────────────────────

inline size_t refillForward(RegionBufferProducer& producer, const AudioAsset& asset,
                            size_t chunkSize, const LoopRange* loop,
                            std::vector<StereoFrame>& scratch) {
    const bool looping = loop && loop->isValid();
    const uint64_t loopStart = looping ? loop->start : 0;
    const uint64_t loopEnd   = looping ? loop->end : 0;
    const uint64_t loopLen   = looping ? loop->length() : 0;

    // Nothing past writeSpace() would be accepted this cycle.
    const size_t count = std::min(chunkSize, producer.writeSpace());
    if (count == 0) return 0;

    scratch.clear();
    const uint64_t start = producer.filePosition();
    uint64_t pos = start;

    for (size_t i = 0; i < count; i++) {
        if (looping && pos >= loopEnd) {
            pos = loopStart + (pos - loopStart) % loopLen;
        }
        scratch.push_back(pos < asset.len() ? asset.frame(static_cast<size_t>(pos)) : StereoFrame{});
        pos++;
    }

    const size_t written = producer.write(scratch);

    uint64_t newPos = start + written;
    if (looping && newPos >= loopEnd) {
        newPos = loopStart + (newPos - loopStart) % loopLen;
    }
    producer.setFilePosition(newPos);
    return written;
}

inline size_t refillReverse(RegionBufferProducer& producer, const AudioAsset& asset,
                            size_t chunkSize, std::vector<StereoFrame>& scratch) {
    const size_t count = std::min(chunkSize, producer.writeSpace());
    if (count == 0) return 0;

    scratch.clear();
    const uint64_t pos = producer.filePosition();

    if (pos == 0) {
        // Already at the head of the file: keep the consumer fed with silence.
        scratch.assign(count, StereoFrame{});
        return producer.write(scratch);
    }

    const uint64_t readStart = (pos > count) ? pos - count : 0;
    for (uint64_t i = readStart; i < pos; i++) {
        scratch.push_back(i < asset.len() ? asset.frame(static_cast<size_t>(i)) : StereoFrame{});
    }

    const size_t written = producer.writeReversed(scratch);
    producer.setFilePosition(pos - written);
    return written;
}

// ─────────────────────────────────────────────────────────────────────────────
// Crossfade capture (seek / PDC realignment)
// ─────────────────────────────────────────────────────────────────────────────

/// Drain up to `count` buffered frames from `consumer` and pad to `count` with
/// the last frame drained. Empty when `count` is 0 or nothing was buffered.
inline std::vector<StereoFrame> captureFadeout(RegionBufferConsumer& consumer, size_t count) {
    std::vector<StereoFrame> out;
    if (count == 0) return out;

    out.resize(count);
    const size_t got = consumer.readInto(out.data(), count);
    if (got == 0) {
        out.clear();
        return out;
    }
    std::fill(out.begin() + static_cast<std::ptrdiff_t>(got), out.end(), out[got - 1]);
    return out;
}

/// `count` frames of `asset` starting at `position`, zero-padded.
inline std::vector<StereoFrame> captureFadein(const AudioAsset& asset, uint64_t position, size_t count) {
    if (count == 0) return {};
    return captureFrames(asset, static_cast<size_t>(position), count);
}

/// File position after the channel's compensation moves from `oldComp` to
/// `newComp`. More compensation reads earlier (saturating at 0).
inline uint64_t realignedPosition(uint64_t current, size_t oldComp, size_t newComp) {
    if (newComp > oldComp) {
        const uint64_t delta = newComp - oldComp;
        return current > delta ? current - delta : 0;
    }
    return current + (oldComp - newComp);
}
