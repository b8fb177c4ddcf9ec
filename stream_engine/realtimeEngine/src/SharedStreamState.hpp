// SharedStreamState.hpp: per-channel state shared by the butler and the audio thread
//
// RESPONSIBILITIES:
// 1. Carry the control values the audio thread needs for one channel: speed
//    (with per-frame ramp), direction, seeking flag, buffer fill, SRC ratio.
// 2. Carry the two crossfades the butler schedules and the audio thread
//    plays out: the seek/realignment crossfade and the loop crossfade.
// 3. Hand the channel's region consumer to the audio thread without a lock.
//
// REAL-TIME SAFETY:
// - Every field is an atomic or lives in storage preallocated by the
//   constructor. Nothing the audio thread calls allocates, locks, or blocks.
// - Crossfade audio is copied into preallocated double-buffered slots (the
//   same inactive-slot-then-publish pattern as a streaming double buffer).
//   The butler fills the slot the audio thread is not playing, then
//   publishes a command word with release ordering.
// - Consumer hand-off is a single-reader hazard pointer. The audio thread
//   announces the consumer it is about to use in mInUse; the butler swaps
//   the pointer and waits until mInUse no longer names the old consumer
//   before it lets the old one be destroyed.
//
// OWNERSHIP:
// - Field writers: butler (speed target, direction, seeking, fill, SRC ratio,
//   crossfade start/clear, consumer publish); audio thread (ramp progress,
//   underruns, crossfade play position, in-use slot).

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>

#include "RingBuffers.hpp"
#include "StreamTypes.hpp"

// Upper bound on any crossfade handed to the audio thread.
static constexpr size_t kMaxCrossfadeFrames = 8192;

// ─────────────────────────────────────────────────────────────────────────────
// CrossfadeSlots: preallocated fade-out/fade-in pair, double-buffered
// ─────────────────────────────────────────────────────────────────────────────
//
// Command word layout (written only by the butler):
//   bit 0      : 1 = a crossfade is armed, 0 = cleared
//   bit 1      : slot index the crossfade lives in
//   bits 2..63 : sequence number, bumped on every start()/clear()
//
// The audio thread keeps its own play position and length. When it sees a
// command word it has not seen before, it adopts it and restarts at 0.

class CrossfadeSlots {
public:
    explicit CrossfadeSlots(size_t capacity)
        : mCapacity(std::max<size_t>(capacity, 1)) {
        for (auto& slot : mSlots) {
            slot.fadeOut = std::vector<std::atomic<StereoFrame>>(mCapacity);
            slot.fadeIn  = std::vector<std::atomic<StereoFrame>>(mCapacity);
        }
    }

    CrossfadeSlots(const CrossfadeSlots&) = delete;
    CrossfadeSlots& operator=(const CrossfadeSlots&) = delete;

    size_t capacity() const { return mCapacity; }

    /// Butler: arm a crossfade of min(fadeOut, fadeIn, capacity) frames.
    /// No-op when that length is 0.
    void start(const std::vector<StereoFrame>& fadeOut, const std::vector<StereoFrame>& fadeIn) {
        const size_t len = std::min({fadeOut.size(), fadeIn.size(), mCapacity});
        if (len == 0) return;

        const uint64_t slotIndex = mNextSlot;
        mNextSlot ^= 1u;

        Slot& slot = mSlots[slotIndex];
        for (size_t i = 0; i < len; i++) {
            slot.fadeOut[i].store(fadeOut[i], std::memory_order_relaxed);
            slot.fadeIn[i].store(fadeIn[i], std::memory_order_relaxed);
        }
        slot.length.store(len, std::memory_order_relaxed);

        publish((slotIndex << 1) | 1u);
    }

    /// Butler: cancel any armed or running crossfade.
    void clear() { publish(0); }

    /// Audio thread: next blended frame, or false when no crossfade is running.
    bool next(StereoFrame& out) {
        adoptPending();

        const size_t len = mPlayLength.load(std::memory_order_relaxed);
        if (len == 0) return false;

        const size_t pos = mPlayPos.load(std::memory_order_relaxed);
        if (pos >= len) {
            mPlayLength.store(0, std::memory_order_relaxed);
            return false;
        }

        const Slot& slot = mSlots[mPlaySlot];
        const StereoFrame a = slot.fadeOut[pos].load(std::memory_order_relaxed);
        const StereoFrame b = slot.fadeIn[pos].load(std::memory_order_relaxed);
        const float t = static_cast<float>(pos) / static_cast<float>(len);

        out.left  = a.left  * (1.0f - t) + b.left  * t;
        out.right = a.right * (1.0f - t) + b.right * t;
        mPlayPos.store(pos + 1, std::memory_order_relaxed);
        return true;
    }

    /// True from start() until the audio thread has played the last frame.
    bool isActive() const {
        const uint64_t cmd = mCommand.load(std::memory_order_acquire);
        if (cmd != mSeen.load(std::memory_order_acquire)) return (cmd & 1u) != 0;
        const size_t len = mPlayLength.load(std::memory_order_relaxed);
        return len > 0 && mPlayPos.load(std::memory_order_relaxed) < len;
    }

    /// Length of the running (or armed) crossfade; 0 when none.
    size_t length() const {
        const uint64_t cmd = mCommand.load(std::memory_order_acquire);
        if (cmd != mSeen.load(std::memory_order_acquire)) {
            return (cmd & 1u) ? mSlots[(cmd >> 1) & 1u].length.load(std::memory_order_relaxed) : 0;
        }
        return mPlayLength.load(std::memory_order_relaxed);
    }

private:
    struct Slot {
        std::vector<std::atomic<StereoFrame>> fadeOut;
        std::vector<std::atomic<StereoFrame>> fadeIn;
        std::atomic<size_t> length{0};
    };

    void publish(uint64_t flags) {
        mSequence++;
        mCommand.store((mSequence << 2) | flags, std::memory_order_release);
    }

    void adoptPending() {
        const uint64_t cmd = mCommand.load(std::memory_order_acquire);
        if (cmd == mSeen.load(std::memory_order_relaxed)) return;
        mSeen.store(cmd, std::memory_order_release);

        if (cmd & 1u) {
            mPlaySlot = static_cast<size_t>((cmd >> 1) & 1u);
            mPlayLength.store(mSlots[mPlaySlot].length.load(std::memory_order_relaxed),
                              std::memory_order_relaxed);
        } else {
            mPlayLength.store(0, std::memory_order_relaxed);
        }
        mPlayPos.store(0, std::memory_order_relaxed);
    }

    const size_t mCapacity;
    Slot         mSlots[2];

    // Butler-owned
    uint64_t mNextSlot = 0;
    uint64_t mSequence = 0;
    std::atomic<uint64_t> mCommand{0};

    // Audio-thread-owned
    std::atomic<uint64_t> mSeen{0};
    size_t                mPlaySlot = 0;
    std::atomic<size_t>   mPlayLength{0};
    std::atomic<size_t>   mPlayPos{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// SharedStreamState
// ─────────────────────────────────────────────────────────────────────────────

class SharedStreamState {
public:
    static constexpr float kMinSpeed = 0.25f;
    static constexpr float kMaxSpeed = 4.0f;

    explicit SharedStreamState(size_t crossfadeCapacity = kMaxCrossfadeFrames)
        : mSeekCrossfade(crossfadeCapacity), mLoopCrossfade(crossfadeCapacity) {}

    SharedStreamState(const SharedStreamState&) = delete;
    SharedStreamState& operator=(const SharedStreamState&) = delete;

    // ── Speed ────────────────────────────────────────────────────────────

    float speed() const { return mSpeed.load(std::memory_order_relaxed); }

    /// Jump to `speed` immediately, cancelling any ramp.
    void setSpeed(float speed) {
        const float clamped = clampSpeed(speed);
        mSpeed.store(clamped, std::memory_order_relaxed);
        mTargetSpeed.store(clamped, std::memory_order_relaxed);
        mRampProgress.store(1.0f, std::memory_order_release);
    }

    /// Ramp linearly from the current speed to `speed` over `rampSamples`
    /// calls to advanceSpeedRamp().
    void setSpeedWithRamp(float speed, uint32_t rampSamples) {
        if (rampSamples == 0) {
            setSpeed(speed);
            return;
        }
        mTargetSpeed.store(clampSpeed(speed), std::memory_order_relaxed);
        mRampSamples.store(rampSamples, std::memory_order_relaxed);
        mRampProgress.store(0.0f, std::memory_order_release);
    }

    float targetSpeed() const { return mTargetSpeed.load(std::memory_order_relaxed); }

    /// Current speed with any ramp applied.
    float effectiveSpeed() const {
        const float progress = mRampProgress.load(std::memory_order_acquire);
        if (progress >= 1.0f) return mTargetSpeed.load(std::memory_order_relaxed);
        const float current = mSpeed.load(std::memory_order_relaxed);
        const float target = mTargetSpeed.load(std::memory_order_relaxed);
        return current + (target - current) * progress;
    }

    /// Audio thread: advance the ramp by one output frame.
    void advanceSpeedRamp() {
        const uint32_t samples = mRampSamples.load(std::memory_order_relaxed);
        if (samples == 0) return;
        const float progress = mRampProgress.load(std::memory_order_acquire);
        if (progress >= 1.0f) return;

        const float next = std::min(progress + 1.0f / static_cast<float>(samples), 1.0f);
        mRampProgress.store(next, std::memory_order_release);
        if (next >= 1.0f) {
            mSpeed.store(mTargetSpeed.load(std::memory_order_relaxed), std::memory_order_relaxed);
        }
    }

    bool isRamping() const { return mRampProgress.load(std::memory_order_acquire) < 1.0f; }

    // ── Direction / seeking ──────────────────────────────────────────────

    bool isReverse() const {
        return mDirection.load(std::memory_order_acquire) == static_cast<uint8_t>(PlayDirection::Reverse);
    }
    void setReverse(bool reverse) {
        mDirection.store(static_cast<uint8_t>(reverse ? PlayDirection::Reverse : PlayDirection::Forward),
                         std::memory_order_release);
    }

    bool isSeeking() const { return mSeeking.load(std::memory_order_acquire); }
    void setSeeking(bool seeking) { mSeeking.store(seeking, std::memory_order_release); }

    // ── Sample-rate conversion ratio (file SR / session SR) ──────────────

    float srcRatio() const { return mSrcRatio.load(std::memory_order_relaxed); }
    void setSrcRatio(float ratio) { mSrcRatio.store(ratio, std::memory_order_relaxed); }

    // ── Underruns ────────────────────────────────────────────────────────

    void reportUnderrun() { mUnderruns.fetch_add(1, std::memory_order_relaxed); }
    uint64_t underrunCount() const { return mUnderruns.load(std::memory_order_relaxed); }
    uint64_t takeUnderrunCount() { return mUnderruns.exchange(0, std::memory_order_relaxed); }

    // ── Buffer fill (stored as 0..1000) ──────────────────────────────────

    void setBufferFill(float level) {
        const float clamped = std::min(std::max(level, 0.0f), 1.0f);
        mFillLevel.store(static_cast<uint32_t>(clamped * 1000.0f), std::memory_order_relaxed);
    }
    float bufferFill() const {
        return static_cast<float>(mFillLevel.load(std::memory_order_relaxed)) / 1000.0f;
    }

    // ── Seek crossfade ───────────────────────────────────────────────────

    void startSeekCrossfade(const std::vector<StereoFrame>& fadeOut, const std::vector<StereoFrame>& fadeIn) {
        mSeekCrossfade.start(fadeOut, fadeIn);
    }
    bool isSeekCrossfading() const { return mSeekCrossfade.isActive(); }
    size_t seekCrossfadeLength() const { return mSeekCrossfade.length(); }
    bool nextSeekCrossfadeFrame(StereoFrame& out) { return mSeekCrossfade.next(out); }
    void clearSeekCrossfade() { mSeekCrossfade.clear(); }

    // ── Loop crossfade ───────────────────────────────────────────────────

    void startLoopCrossfade(const std::vector<StereoFrame>& fadeOut, const std::vector<StereoFrame>& fadeIn) {
        mLoopCrossfade.start(fadeOut, fadeIn);
    }
    bool isLoopCrossfading() const { return mLoopCrossfade.isActive(); }
    size_t loopCrossfadeLength() const { return mLoopCrossfade.length(); }
    bool nextLoopCrossfadeFrame(StereoFrame& out) { return mLoopCrossfade.next(out); }
    void clearLoopCrossfade() { mLoopCrossfade.clear(); }

    // ── Consumer hand-off ────────────────────────────────────────────────

    /// RAII guard held by the audio thread while it reads from the consumer.
    class ConsumerGuard {
    public:
        explicit ConsumerGuard(SharedStreamState& state) : mState(&state) {
            RegionBufferConsumer* p = state.mConsumer.load(std::memory_order_seq_cst);
            for (;;) {
                state.mInUse.store(p, std::memory_order_seq_cst);
                RegionBufferConsumer* again = state.mConsumer.load(std::memory_order_seq_cst);
                if (again == p) break;
                p = again;
            }
            mConsumer = p;
        }
        ~ConsumerGuard() { mState->mInUse.store(nullptr, std::memory_order_release); }

        ConsumerGuard(const ConsumerGuard&) = delete;
        ConsumerGuard& operator=(const ConsumerGuard&) = delete;

        RegionBufferConsumer* get() const { return mConsumer; }
        explicit operator bool() const { return mConsumer != nullptr; }
        RegionBufferConsumer* operator->() const { return mConsumer; }

    private:
        SharedStreamState*    mState;
        RegionBufferConsumer* mConsumer = nullptr;
    };

    ConsumerGuard acquireConsumer() { return ConsumerGuard(*this); }

    /// Butler: make `consumer` (may be nullptr) the one the audio thread
    /// reads. Returns once the audio thread has let go of the previous one,
    /// so the caller may destroy it.
    void publishConsumer(RegionBufferConsumer* consumer) {
        RegionBufferConsumer* old = mConsumer.exchange(consumer, std::memory_order_seq_cst);
        if (!old || old == consumer) return;
        while (mInUse.load(std::memory_order_seq_cst) == old) {
            std::this_thread::yield();
        }
    }

    bool hasConsumer() const { return mConsumer.load(std::memory_order_acquire) != nullptr; }

private:
    static float clampSpeed(float s) { return std::min(std::max(s, kMinSpeed), kMaxSpeed); }

    std::atomic<float>    mSpeed{1.0f};
    std::atomic<float>    mTargetSpeed{1.0f};
    std::atomic<float>    mRampProgress{1.0f};
    std::atomic<uint32_t> mRampSamples{0};
    std::atomic<uint8_t>  mDirection{0};
    std::atomic<bool>     mSeeking{false};
    std::atomic<uint64_t> mUnderruns{0};
    std::atomic<uint32_t> mFillLevel{0};
    std::atomic<float>    mSrcRatio{1.0f};

    CrossfadeSlots mSeekCrossfade;
    CrossfadeSlots mLoopCrossfade;

    std::atomic<RegionBufferConsumer*> mConsumer{nullptr};
    std::atomic<RegionBufferConsumer*> mInUse{nullptr};
};
