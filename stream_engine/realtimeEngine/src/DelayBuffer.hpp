// DelayBuffer.hpp: stereo delay lines that apply PDC compensation
//
// DelayBuffer is a plain circular delay: each frame reads the sample written
// `delay` frames ago, then overwrites that slot. A delay of 0 passes input
// straight through. Storage is max(delay, 1) frames per side.
//
// PdcDelayUnit wraps a DelayBuffer with an atomic target delay so a control
// thread can change it while the audio thread processes. The new delay takes
// effect at the start of the next processed block. Resizing the line
// allocates, so a delay change is a one-block glitch on the audio thread;
// callers change compensation rarely (plugin insert/remove).
//
// buildCompensationDelays() turns a PdcAnalysis into one DelayBuffer per
// compensated input port and per compensated output channel.

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <map>
#include <utility>
#include <vector>

#include "PdcGraph.hpp"

class DelayBuffer {
public:
    explicit DelayBuffer(size_t delaySamples = 0)
        : mLeft(std::max<size_t>(delaySamples, 1), 0.0f),
          mRight(std::max<size_t>(delaySamples, 1), 0.0f),
          mDelay(delaySamples) {}

    size_t delaySamples() const { return mDelay; }

    void process(float left, float right, float& outLeft, float& outRight) {
        if (mDelay == 0) {
            outLeft = left;
            outRight = right;
            return;
        }
        const size_t readPos = readPosition();
        outLeft  = mLeft[readPos];
        outRight = mRight[readPos];
        mLeft[mWritePos]  = left;
        mRight[mWritePos] = right;
        mWritePos = (mWritePos + 1) % mLeft.size();
    }

    /// Process min(len) frames of the four buffers. Returns frames processed.
    size_t processBatch(const float* inL, size_t inLLen, const float* inR, size_t inRLen,
                        float* outL, size_t outLLen, float* outR, size_t outRLen) {
        const size_t frames = std::min(std::min(inLLen, inRLen), std::min(outLLen, outRLen));
        for (size_t i = 0; i < frames; i++) process(inL[i], inR[i], outL[i], outR[i]);
        return frames;
    }

    size_t processBatch(const std::vector<float>& inL, const std::vector<float>& inR,
                        std::vector<float>& outL, std::vector<float>& outR) {
        return processBatch(inL.data(), inL.size(), inR.data(), inR.size(),
                            outL.data(), outL.size(), outR.data(), outR.size());
    }

    /// Change the delay. A changed delay resizes the line and clears it.
    void setDelay(size_t delaySamples) {
        if (delaySamples == mDelay) return;
        mDelay = delaySamples;
        const size_t size = std::max<size_t>(delaySamples, 1);
        mLeft.resize(size);
        mRight.resize(size);
        clear();
    }

    void clear() {
        std::fill(mLeft.begin(), mLeft.end(), 0.0f);
        std::fill(mRight.begin(), mRight.end(), 0.0f);
        mWritePos = 0;
    }

private:
    size_t readPosition() const {
        const size_t len = mLeft.size();
        return (mWritePos >= mDelay) ? mWritePos - mDelay : len + mWritePos - mDelay;
    }

    std::vector<float> mLeft;
    std::vector<float> mRight;
    size_t mWritePos = 0;
    size_t mDelay;
};

// ─────────────────────────────────────────────────────────────────────────────
// PdcDelayUnit
// ─────────────────────────────────────────────────────────────────────────────

class PdcDelayUnit {
public:
    explicit PdcDelayUnit(size_t delaySamples = 0, double sampleRate = 48000.0)
        : mBuffer(delaySamples), mTarget(delaySamples), mSampleRate(sampleRate) {}

    size_t delaySamples() const { return mTarget.load(std::memory_order_relaxed); }
    void setDelaySamples(size_t samples) { mTarget.store(samples, std::memory_order_relaxed); }

    double delayMs() const { return static_cast<double>(delaySamples()) / mSampleRate * 1000.0; }
    void setDelayMs(double ms) { setDelaySamples(static_cast<size_t>(ms / 1000.0 * mSampleRate)); }

    void setSampleRate(double sampleRate) { mSampleRate = sampleRate; }
    void reset() { mBuffer.clear(); }

    /// Process one block of stereo audio (in-place safe).
    void processBlock(const float* inL, const float* inR, float* outL, float* outR, size_t frames) {
        applyPendingDelay();
        for (size_t i = 0; i < frames; i++) mBuffer.process(inL[i], inR[i], outL[i], outR[i]);
    }

    /// Delay currently applied by the line (lags setDelaySamples() by a block).
    size_t appliedDelay() const { return mBuffer.delaySamples(); }

private:
    void applyPendingDelay() {
        const size_t target = mTarget.load(std::memory_order_relaxed);
        if (target != mBuffer.delaySamples()) mBuffer.setDelay(target);
    }

    DelayBuffer         mBuffer;
    std::atomic<size_t> mTarget;
    double              mSampleRate;
};

// ─────────────────────────────────────────────────────────────────────────────
// buildCompensationDelays
// ─────────────────────────────────────────────────────────────────────────────

struct CompensationDelays {
    std::map<std::pair<PdcNodeId, size_t>, DelayBuffer> inputs;   // (node, port) → line
    std::map<size_t, DelayBuffer>                      outputs;  // output channel → line
};

inline CompensationDelays buildCompensationDelays(const PdcAnalysis& analysis) {
    CompensationDelays delays;
    for (const auto& c : analysis.compensations) {
        delays.inputs.emplace(std::make_pair(c.node, c.inputPort), DelayBuffer(c.delaySamples));
    }
    for (const auto& c : analysis.outputCompensations) {
        delays.outputs.emplace(c.outputChannel, DelayBuffer(c.delaySamples));
    }
    return delays;
}
