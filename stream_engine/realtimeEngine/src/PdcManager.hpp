// PdcManager.hpp: channel / return-bus latency table with published compensation
//
// Each channel and return bus reports its processing latency. recalculate()
// derives the global maximum and, per entry, compensation = max - latency.
//
// PUBLICATION (read-copy-update):
// - The current table is an immutable PdcState behind a
//   shared_ptr<const PdcState>. Readers take std::atomic_load() of it and
//   never block.
// - Writers clone the current state, mutate the clone, recalculate, and
//   std::atomic_store() the clone. Writers are serialized by mWriteMutex so
//   two concurrent updates cannot drop each other's change; readers never
//   touch that mutex.
//
// A reported latency above the ceiling throws LatencyCeilingError. The value
// is never clamped: a clamped latency would leave channels out of phase with
// nothing to show for it.

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

#include "StreamTypes.hpp"

struct PdcState {
    std::vector<size_t> channelLatencies;
    std::vector<size_t> returnLatencies;
    std::vector<size_t> channelCompensations;
    std::vector<size_t> returnCompensations;
    size_t maxLatency = 0;

    PdcState() = default;
    PdcState(size_t channelCount, size_t returnCount)
        : channelLatencies(channelCount, 0), returnLatencies(returnCount, 0),
          channelCompensations(channelCount, 0), returnCompensations(returnCount, 0) {}

    void recalculate() {
        size_t maxChannel = 0;
        for (size_t l : channelLatencies) maxChannel = std::max(maxChannel, l);
        size_t maxReturn = 0;
        for (size_t l : returnLatencies) maxReturn = std::max(maxReturn, l);
        maxLatency = std::max(maxChannel, maxReturn);

        channelCompensations.resize(channelLatencies.size());
        for (size_t i = 0; i < channelLatencies.size(); i++)
            channelCompensations[i] = maxLatency - channelLatencies[i];

        returnCompensations.resize(returnLatencies.size());
        for (size_t i = 0; i < returnLatencies.size(); i++)
            returnCompensations[i] = maxLatency - returnLatencies[i];
    }

    size_t channelCompensation(size_t i) const {
        return i < channelCompensations.size() ? channelCompensations[i] : 0;
    }
    size_t returnCompensation(size_t i) const {
        return i < returnCompensations.size() ? returnCompensations[i] : 0;
    }
};

using PdcSnapshot = std::shared_ptr<const PdcState>;

class PdcManager {
public:
    PdcManager(size_t channelCount, size_t returnCount)
        : mState(std::make_shared<const PdcState>(channelCount, returnCount)) {}

    PdcManager(const PdcManager&) = delete;
    PdcManager& operator=(const PdcManager&) = delete;

    // ── Enable / ceiling ─────────────────────────────────────────────────

    void setEnabled(bool enabled) { mEnabled.store(enabled, std::memory_order_release); }
    bool isEnabled() const { return mEnabled.load(std::memory_order_acquire); }

    void setMaxAllowedLatency(size_t samples) { mMaxAllowed.store(samples, std::memory_order_release); }
    size_t maxAllowedLatency() const { return mMaxAllowed.load(std::memory_order_acquire); }

    // ── Readers ──────────────────────────────────────────────────────────

    PdcSnapshot snapshot() const { return std::atomic_load(&mState); }

    size_t maxLatency() const { return snapshot()->maxLatency; }
    size_t channelCompensation(size_t i) const { return snapshot()->channelCompensation(i); }
    size_t returnCompensation(size_t i) const { return snapshot()->returnCompensation(i); }

    // ── Writers ──────────────────────────────────────────────────────────

    /// Record `latency` for channel `index` (growing the table if needed).
    /// Returns that channel's new compensation.
    /// Throws LatencyCeilingError if `latency` exceeds the ceiling.
    size_t setChannelLatency(size_t index, size_t latency) {
        checkCeiling("Channel", index, latency);
        return update([&](PdcState& s) {
            if (index >= s.channelLatencies.size()) s.channelLatencies.resize(index + 1, 0);
            s.channelLatencies[index] = latency;
            s.recalculate();
            return s.channelCompensations[index];
        });
    }

    /// Same as setChannelLatency() for return bus `index`.
    size_t setReturnLatency(size_t index, size_t latency) {
        checkCeiling("Return bus", index, latency);
        return update([&](PdcState& s) {
            if (index >= s.returnLatencies.size()) s.returnLatencies.resize(index + 1, 0);
            s.returnLatencies[index] = latency;
            s.recalculate();
            return s.returnCompensations[index];
        });
    }

    void removeChannel(size_t index) {
        update([&](PdcState& s) {
            if (index < s.channelLatencies.size()) s.channelLatencies[index] = 0;
            s.recalculate();
            return size_t{0};
        });
    }

    void removeReturn(size_t index) {
        update([&](PdcState& s) {
            if (index < s.returnLatencies.size()) s.returnLatencies[index] = 0;
            s.recalculate();
            return size_t{0};
        });
    }

    /// Resize both tables, keeping existing values.
    void resize(size_t channelCount, size_t returnCount) {
        update([&](PdcState& s) {
            s.channelLatencies.resize(channelCount, 0);
            s.returnLatencies.resize(returnCount, 0);
            s.recalculate();
            return size_t{0};
        });
    }

    /// Zero every latency and compensation, keeping the table sizes.
    void clear() {
        update([&](PdcState& s) {
            std::fill(s.channelLatencies.begin(), s.channelLatencies.end(), 0);
            std::fill(s.returnLatencies.begin(), s.returnLatencies.end(), 0);
            s.recalculate();
            return size_t{0};
        });
    }

private:
    void checkCeiling(const char* kind, size_t index, size_t latency) const {
        const size_t ceiling = maxAllowedLatency();
        if (latency <= ceiling) return;
        std::ostringstream msg;
        msg << kind << " " << index << " reported excessive latency: " << latency
            << " samples (" << static_cast<double>(latency) / 48000.0 << " s @ 48kHz). "
            << "Maximum allowed: " << ceiling << " samples ("
            << static_cast<double>(ceiling) / 48000.0 << " s).";
        throw LatencyCeilingError(msg.str());
    }

    template <typename Fn>
    size_t update(Fn&& mutate) {
        std::lock_guard<std::mutex> lock(mWriteMutex);
        auto next = std::make_shared<PdcState>(*std::atomic_load(&mState));
        const size_t result = mutate(*next);
        std::atomic_store(&mState, PdcSnapshot(std::move(next)));
        return result;
    }

    PdcSnapshot         mState;
    std::mutex          mWriteMutex;
    std::atomic<bool>   mEnabled{true};
    std::atomic<size_t> mMaxAllowed{kDefaultMaxLatencySamples};
};
