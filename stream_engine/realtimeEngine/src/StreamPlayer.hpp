// StreamPlayer.hpp: audio-thread side of the streaming engine
//
// RESPONSIBILITIES:
// 1. Pull one frame per channel per output frame from the region consumer
//    published in that channel's SharedStreamState.
// 2. Substitute silence on underrun (counted, not an error) and while the
//    butler is repositioning the channel.
// 3. Play out the seek / loop crossfades the butler schedules, in place of
//    the buffered frames they overlap.
// 4. Mix channels onto device outputs and optionally feed the mix into a
//    capture buffer.
//
// REAL-TIME SAFETY:
// - addChannel() / setCapture() / prepare() run on the MAIN thread before
//   the audio stream starts. renderBlock() and readFrame() are the only
//   calls made on the AUDIO thread; they never allocate, lock, or do I/O.
// - A full capture ring drops frames (overflow truncates, never blocks).
//   The producer counts them; the butler reports them as low-buffer events.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "RingBuffers.hpp"
#include "SharedStreamState.hpp"
#include "StreamTypes.hpp"

class StreamPlayer {
public:
    struct Route {
        std::shared_ptr<SharedStreamState> shared;
        size_t channel    = 0;
        size_t outLeft    = 0;
        size_t outRight   = 1;
    };

    /// Produce the next output frame for one channel.
    /// Returns true when a buffered frame was consumed.
    static bool readFrame(SharedStreamState& shared, StereoFrame& out) {
        out = StereoFrame{};

        if (shared.isSeeking()) {
            shared.advanceSpeedRamp();
            return false;
        }

        bool consumed = false;
        {
            auto guard = shared.acquireConsumer();
            if (guard) consumed = guard->read(out);
        }

        // Crossfades replace the frame the buffer yielded at this position.
        StereoFrame blended;
        if (shared.nextSeekCrossfadeFrame(blended) || shared.nextLoopCrossfadeFrame(blended)) {
            out = blended;
        } else if (!consumed) {
            out = StereoFrame{};
            if (shared.hasConsumer()) shared.reportUnderrun();
        }

        shared.advanceSpeedRamp();
        return consumed;
    }

    // ── Setup (MAIN thread, before start) ────────────────────────────────

    /// Route `channel` to the output pair (2*channel, 2*channel + 1), folded
    /// onto the available device outputs.
    void addChannel(size_t channel, std::shared_ptr<SharedStreamState> shared) {
        Route r;
        r.shared  = std::move(shared);
        r.channel = channel;
        r.outLeft  = channel * 2;
        r.outRight = channel * 2 + 1;
        mRoutes.push_back(std::move(r));
    }

    void setCapture(CaptureBufferProducer* producer) { mCapture = producer; }

    /// Preallocate per-block scratch for up to `maxFrames`.
    void prepare(size_t maxFrames) { mMix.assign(maxFrames, StereoFrame{}); }

    size_t channelCount() const { return mRoutes.size(); }
    const std::vector<Route>& routes() const { return mRoutes; }

    // ── Rendering (AUDIO thread) ─────────────────────────────────────────

    /// Add every channel into `outputs` (which the caller zeroed), scaled by
    /// `gain`. Returns the number of channel-frames rendered as underrun
    /// silence.
    uint64_t renderBlock(float* const* outputs, size_t numOutputs, size_t numFrames, float gain) {
        const size_t frames = std::min(numFrames, mMix.size());
        std::fill(mMix.begin(), mMix.begin() + static_cast<std::ptrdiff_t>(frames), StereoFrame{});
        if (numOutputs == 0) return 0;

        uint64_t silent = 0;
        for (const Route& r : mRoutes) {
            SharedStreamState& shared = *r.shared;
            const bool live = shared.hasConsumer();
            float* outL = outputs[r.outLeft % numOutputs];
            float* outR = outputs[r.outRight % numOutputs];

            for (size_t f = 0; f < frames; ++f) {
                StereoFrame frame;
                if (!readFrame(shared, frame) && live) silent++;
                frame.left  *= gain;
                frame.right *= gain;
                outL[f] += frame.left;
                outR[f] += frame.right;
                mMix[f].left  += frame.left;
                mMix[f].right += frame.right;
            }
        }

        // Frames that do not fit are tallied in the capture's framesDropped().
        if (mCapture) mCapture->writeMany(mMix.data(), frames);
        return silent;
    }

private:
    std::vector<Route>     mRoutes;
    std::vector<StereoFrame> mMix;
    CaptureBufferProducer* mCapture = nullptr;
};
