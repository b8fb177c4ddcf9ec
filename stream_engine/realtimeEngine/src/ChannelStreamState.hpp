// ChannelStreamState.hpp: butler-side record for one playback channel
//
// Owned by ButlerThread (one per channel index, in its channel table) and
// only touched on the butler thread. The part the audio thread needs lives
// in the SharedStreamState it points to.
//
// Holds:
// - the region consumer currently streaming on this channel (the butler keeps
//   the owning shared_ptr; the audio thread sees a raw pointer published
//   through SharedStreamState::publishConsumer)
// - varispeed, loop range, pre-loop crossfade buffer, PDC preroll

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "RingBuffers.hpp"
#include "SharedStreamState.hpp"
#include "StreamTypes.hpp"

enum class LoopStatus {
    Normal,          // No loop, or playhead well inside it
    ApproachingEnd,  // Playhead within `crossfade` frames of the loop end
    AtEnd            // Playhead reached the loop end
};

class ChannelStreamState {
public:
    explicit ChannelStreamState(std::shared_ptr<SharedStreamState> shared)
        : mShared(std::move(shared)) {}

    ~ChannelStreamState() { stopStreaming(); }

    ChannelStreamState(const ChannelStreamState&) = delete;
    ChannelStreamState& operator=(const ChannelStreamState&) = delete;

    // ── Streaming lifecycle ──────────────────────────────────────────────

    /// Attach a new region. Any previous region is detached first.
    void startStreaming(std::shared_ptr<RegionBufferConsumer> consumer, std::string filePath) {
        mShared->publishConsumer(consumer.get());
        mConsumer = std::move(consumer);
        mFilePath = std::move(filePath);
    }

    /// Detach the region. Returns once the audio thread no longer reads it.
    void stopStreaming() {
        if (!mConsumer) return;
        mShared->publishConsumer(nullptr);
        mShared->clearSeekCrossfade();
        mShared->clearLoopCrossfade();
        mConsumer.reset();
        mFilePath.clear();
    }

    bool isStreaming() const { return mConsumer != nullptr; }

    std::optional<RegionId> regionId() const {
        if (!mConsumer) return std::nullopt;
        return mConsumer->regionId();
    }

    RegionBufferConsumer* consumer() const { return mConsumer.get(); }
    const std::string& filePath() const { return mFilePath; }

    /// Drop everything buffered for this channel.
    void flushBuffer() {
        if (mConsumer) mConsumer->clear();
    }

    /// File frame of the next frame to be played, in either direction.
    uint64_t playhead(const RegionBufferProducer& producer) const {
        if (!mConsumer) return producer.filePosition();
        if (mVarispeed.isReverse()) {
            // Reverse rings hold [filePosition, filePosition + available) and play downward.
            const uint64_t end = producer.filePosition() + mConsumer->available();
            return end > 0 ? end - 1 : 0;
        }
        return mConsumer->readPosition();
    }

    // ── Varispeed ────────────────────────────────────────────────────────

    void setVarispeed(const Varispeed& v, uint32_t rampSamples) {
        mVarispeed = v;
        mShared->setReverse(v.isReverse());
        mShared->setSpeedWithRamp(v.effectiveSpeed(), rampSamples);
    }

    const Varispeed& varispeed() const { return mVarispeed; }
    float speed() const { return mVarispeed.effectiveSpeed(); }
    bool isReverse() const { return mVarispeed.isReverse(); }

    // ── Loop ─────────────────────────────────────────────────────────────

    void setLoopRange(const LoopRange& range) {
        mLoop = range;
        mPreloop.clear();
    }

    void clearLoopRange() {
        mLoop.reset();
        mPreloop.clear();
        mShared->clearLoopCrossfade();
    }

    const std::optional<LoopRange>& loopRange() const { return mLoop; }
    size_t loopCrossfadeSamples() const { return mLoop ? mLoop->crossfade : 0; }

    void setPreloopBuffer(std::vector<StereoFrame> frames) { mPreloop = std::move(frames); }
    const std::vector<StereoFrame>& preloopBuffer() const { return mPreloop; }

    /// Where the playhead sits relative to the loop end (forward play only).
    LoopStatus checkLoopStatus() const {
        if (!mLoop || !mConsumer || !mLoop->isValid() || mVarispeed.isReverse()) return LoopStatus::Normal;

        const uint64_t readPos = mConsumer->readPosition();
        if (readPos >= mLoop->end) return LoopStatus::AtEnd;
        if (mLoop->crossfade > 0 && readPos + mLoop->crossfade >= mLoop->end) return LoopStatus::ApproachingEnd;
        return LoopStatus::Normal;
    }

    // ── PDC ──────────────────────────────────────────────────────────────

    uint64_t pdcPreroll() const { return mPdcPreroll; }
    void setPdcPreroll(uint64_t preroll) { mPdcPreroll = preroll; }

    // ── Shared (audio-visible) state ─────────────────────────────────────

    void setSeeking(bool seeking) { mShared->setSeeking(seeking); }

    SharedStreamState& shared() { return *mShared; }
    const std::shared_ptr<SharedStreamState>& sharedPtr() const { return mShared; }

private:
    std::shared_ptr<SharedStreamState>    mShared;
    std::shared_ptr<RegionBufferConsumer> mConsumer;
    std::string                           mFilePath;

    Varispeed                mVarispeed;
    std::optional<LoopRange> mLoop;
    std::vector<StereoFrame> mPreloop;
    uint64_t                 mPdcPreroll = 0;
};
