// Butler.hpp: background disk thread feeding and draining the real-time ring buffers
//
// RESPONSIBILITIES:
// 1. Apply commands from the CommandQueue (stream, stop, seek, loop,
//    varispeed, PDC preroll, capture registration, flush, margin, pause).
// 2. Poll the PdcManager snapshot and realign channels whose compensation
//    changed (reposition + seek crossfade).
// 3. Handle loop boundaries (loop crossfade, wrap-around prefill).
// 4. Refill every region buffer that dropped below the refill threshold,
//    sized by varifill. With parallel I/O on and three or more active
//    streams, the per-channel fills fan out across short-lived workers.
// 5. Drain capture buffers to their WAV files once they pass the flush
//    threshold (and unconditionally on FlushAll / Shutdown).
// 6. Report near-empty refills, audio-thread underruns and capture
//    overflow as low-buffer events in IOMetrics.
//
// THREADING:
// - run() is the thread body; runCycle() is one iteration of it and can be
//   driven directly (tests do this instead of calling start()).
// - The channel table, producers and captures are guarded by mChannelsMutex,
//   held for a whole cycle. Control threads take it only briefly through the
//   query accessors and sharedState(). The audio thread never takes it.
// - Producers are owned here. Region consumers are owned by the channel's
//   ChannelStreamState and lent to the audio thread via SharedStreamState.
//
// ERRORS:
// - Asset load failures are logged once per path and skipped; the refill is
//   retried next cycle.
// - A failure to take the channel table mutex surfaces as LockPoisonedError.
// - Nothing escapes run(): exceptions are logged and the loop carries on.
// - A refill worker that cannot be started is logged; its channels are
//   filled on the butler thread instead.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "AssetCache.hpp"
#include "AudioAsset.hpp"
#include "ButlerCommands.hpp"
#include "CaptureWriter.hpp"
#include "ChannelStreamState.hpp"
#include "IOMetrics.hpp"
#include "PdcManager.hpp"
#include "RingBuffers.hpp"
#include "SharedStreamState.hpp"
#include "StreamTypes.hpp"
#include "Varifill.hpp"

// Result of one butler iteration; run() decides how long to sleep from it.
enum class CycleOutcome {
    Worked,   // Streams or captures were serviced
    Paused,   // Paused: sleep 10 ms
    Idle,     // Nothing to do: sleep 1 ms
    Exit      // Shutdown flag observed
};

class ButlerThread {
public:
    static constexpr size_t kParallelRefillMinStreams = 3;

    ButlerThread(const BufferConfig& config, double sampleRate, size_t queueCapacity = 256)
        : mConfig(config),
          mSampleRate(sampleRate),
          mQueue(queueCapacity),
          mCache(config.cacheMaxEntries, config.cacheMaxBytes),
          mScratch(),
          mCrossfadeCapacity(std::max(config.seekCrossfadeSamples, kMaxCrossfadeFrames)) {
        mScratch.reserve(config.chunkSize * 4);
    }

    virtual ~ButlerThread() { stop(); }

    ButlerThread(const ButlerThread&) = delete;
    ButlerThread& operator=(const ButlerThread&) = delete;

    /// Attach the PDC aggregator. Call before start().
    void setPdc(std::shared_ptr<PdcManager> pdc) { mPdc = std::move(pdc); }

    // ── Lifecycle ────────────────────────────────────────────────────────

    /// Spawn the butler thread. Calling it again while running is a no-op.
    bool start() {
        if (mThread.joinable()) return true;
        mShutdown.store(false, std::memory_order_seq_cst);
        mState.store(ButlerState::Running, std::memory_order_release);
        mThread = std::thread([this]() { run(); });
        std::cout << "[Butler] Thread started (" << mSampleRate << " Hz, chunk "
                  << mConfig.chunkSize << ", parallel I/O "
                  << (mConfig.parallelIo ? "on" : "off") << ")." << std::endl;
        return true;
    }

    /// Set the shutdown flag, wake the loop with a Shutdown command, join.
    /// Remaining capture data is flushed before the thread exits.
    void stop() {
        mShutdown.store(true, std::memory_order_seq_cst);
        if (mThread.joinable()) {
            if (!mQueue.trySend(ButlerCommand::shutdown())) {
                std::cerr << "[Butler] WARNING: command queue full at shutdown; "
                          << "relying on the shutdown flag." << std::endl;
            }
            mThread.join();
            std::cout << "[Butler] Thread stopped." << std::endl;
        } else {
            auto lock = lockChannels();
            flushAllCaptures(true);
        }
        mState.store(ButlerState::Shutdown, std::memory_order_release);
    }

    bool isRunning() const { return mThread.joinable(); }

    // ── Command submission ───────────────────────────────────────────────

    CommandQueue& commandQueue() { return mQueue; }
    bool trySend(ButlerCommand cmd) { return mQueue.trySend(cmd); }
    void send(ButlerCommand cmd) { mQueue.send(std::move(cmd)); }

    // ── Accessors ────────────────────────────────────────────────────────

    /// Shared state for `channel`, creating the channel entry if needed.
    /// Wire these into the player before the audio stream starts.
    std::shared_ptr<SharedStreamState> sharedState(size_t channel) {
        auto lock = lockChannels();
        return channelLocked(channel).sharedPtr();
    }

    /// Butler-side state for `channel`, or nullptr. Only inspect it while the
    /// butler thread is not running (tests drive runCycle() themselves).
    std::shared_ptr<ChannelStreamState> streamState(size_t channel) const {
        auto lock = lockChannels();
        auto it = mChannels.find(channel);
        return it == mChannels.end() ? nullptr : it->second;
    }

    bool isStreaming(size_t channel) const {
        auto lock = lockChannels();
        auto it = mChannels.find(channel);
        return it != mChannels.end() && it->second->isStreaming();
    }

    size_t activeStreams() const {
        auto lock = lockChannels();
        return streamingCountLocked();
    }

    /// Frames the region ring on `channel` holds when full.
    std::optional<size_t> ringCapacity(size_t channel) const {
        auto lock = lockChannels();
        const RegionBufferProducer* p = producerForLocked(channel);
        if (!p) return std::nullopt;
        return p->capacity();
    }

    /// Next file frame the producer on `channel` will read.
    std::optional<uint64_t> producerPosition(size_t channel) const {
        auto lock = lockChannels();
        const RegionBufferProducer* p = producerForLocked(channel);
        if (!p) return std::nullopt;
        return p->filePosition();
    }

    uint64_t pdcPreroll(size_t channel) const {
        auto lock = lockChannels();
        auto it = mChannels.find(channel);
        return it == mChannels.end() ? 0 : it->second->pdcPreroll();
    }

    size_t captureCount() const {
        auto lock = lockChannels();
        return mCaptures.size();
    }

    IOMetrics& metrics() { return mMetrics; }
    AssetCache& cache() { return mCache; }
    const BufferConfig& config() const { return mConfig; }
    ButlerState state() const { return mState.load(std::memory_order_acquire); }
    double bufferMargin() const { return mBufferMargin.load(std::memory_order_relaxed); }

    // ── One loop iteration ───────────────────────────────────────────────

    CycleOutcome runCycle() {
        if (mShutdown.load(std::memory_order_seq_cst)) {
            auto lock = lockChannels();
            processCommands();
            flushAllCaptures(true);
            return CycleOutcome::Exit;
        }

        auto lock = lockChannels();
        processCommands();

        if (mPaused) return CycleOutcome::Paused;
        if (streamingCountLocked() == 0 && mCaptures.empty()) return CycleOutcome::Idle;

        checkPdcUpdates();
        checkLoops();

        if (mConfig.parallelIo && streamingCountLocked() >= kParallelRefillMinStreams) {
            refillAllParallel();
        } else {
            refillAll();
        }

        flushAllCaptures(false);
        return CycleOutcome::Worked;
    }

protected:
    /// Start one parallel refill worker. Throws std::system_error when the
    /// thread cannot be created; the caller then fills those channels itself.
    virtual std::thread launchWorker(std::function<void()> body) { return std::thread(std::move(body)); }

private:
    // Joins every worker on scope exit, including when a refill throws.
    struct WorkerJoin {
        std::vector<std::thread>& threads;
        ~WorkerJoin() {
            for (auto& t : threads) {
                if (t.joinable()) t.join();
            }
        }
    };

    struct CaptureState {
        std::unique_ptr<CaptureBufferConsumer> consumer;
        std::unique_ptr<CaptureWriter>         writer;
        int                                    channels = 2;
    };

    struct RefillItem {
        RegionBufferProducer* producer = nullptr;
        SharedStreamState*    shared   = nullptr;
        AssetHandle           asset;
        std::optional<LoopRange> loop;
        size_t                chunk    = 0;
        bool                  reverse  = false;
        float                 fill     = 0.0f;
    };

    // ── Thread body ──────────────────────────────────────────────────────

    void run() {
        for (;;) {
            CycleOutcome outcome = CycleOutcome::Idle;
            try {
                outcome = runCycle();
            } catch (const std::exception& e) {
                std::cerr << "[Butler] ERROR: cycle failed: " << e.what() << std::endl;
            }

            if (outcome == CycleOutcome::Exit) break;
            if (outcome == CycleOutcome::Paused) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            } else if (outcome == CycleOutcome::Idle) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
    }

    // ── Locking / lookup helpers ─────────────────────────────────────────

    std::unique_lock<std::mutex> lockChannels() const {
        try {
            return std::unique_lock<std::mutex>(mChannelsMutex);
        } catch (const std::system_error& e) {
            throw LockPoisonedError(std::string("butler channel table lock failed: ") + e.what());
        }
    }

    ChannelStreamState& channelLocked(size_t channel) {
        auto it = mChannels.find(channel);
        if (it == mChannels.end()) {
            auto shared = std::make_shared<SharedStreamState>(mCrossfadeCapacity);
            it = mChannels.emplace(channel, std::make_shared<ChannelStreamState>(std::move(shared))).first;
        }
        return *it->second;
    }

    ChannelStreamState* findChannelLocked(size_t channel) {
        auto it = mChannels.find(channel);
        return it == mChannels.end() ? nullptr : it->second.get();
    }

    RegionBufferProducer* producerFor(const ChannelStreamState& ch) {
        auto id = ch.regionId();
        if (!id) return nullptr;
        auto it = mProducers.find(*id);
        return it == mProducers.end() ? nullptr : it->second.get();
    }

    const RegionBufferProducer* producerForLocked(size_t channel) const {
        auto ch = mChannels.find(channel);
        if (ch == mChannels.end()) return nullptr;
        auto id = ch->second->regionId();
        if (!id) return nullptr;
        auto it = mProducers.find(*id);
        return it == mProducers.end() ? nullptr : it->second.get();
    }

    size_t streamingCountLocked() const {
        size_t n = 0;
        for (const auto& entry : mChannels) {
            if (entry.second->isStreaming()) n++;
        }
        return n;
    }

    /// Cache lookup; on a miss decode from disk, record the read and insert.
    AssetHandle assetFor(const std::string& path) {
        if (AssetHandle cached = mCache.get(path)) {
            mMetrics.recordCacheHit();
            return cached;
        }
        mMetrics.recordCacheMiss();

        AssetHandle asset;
        try {
            asset = AudioAsset::load(path);
        } catch (const std::runtime_error& e) {
            if (mFailedPaths.insert(path).second) {
                std::cerr << "[Butler] WARNING: " << e.what() << " (skipping, will retry)" << std::endl;
            }
            return nullptr;
        }

        mFailedPaths.erase(path);
        mMetrics.recordRead(static_cast<uint64_t>(asset->len()) * static_cast<uint64_t>(asset->channels()) * 4u);
        mCache.insert(path, asset);
        return asset;
    }

    // ── Commands ─────────────────────────────────────────────────────────

    void processCommands() {
        ButlerCommand cmd;
        while (mQueue.tryReceive(cmd)) {
            handleCommand(cmd);
        }
    }

    void handleCommand(ButlerCommand& cmd) {
        switch (cmd.type) {
            case ButlerCommandType::Run:
                mPaused = false;
                mState.store(ButlerState::Running, std::memory_order_release);
                break;

            case ButlerCommandType::Pause:
                mPaused = true;
                mState.store(ButlerState::Paused, std::memory_order_release);
                break;

            case ButlerCommandType::WaitForCompletion:
            case ButlerCommandType::FlushAll:
                flushAllCaptures(true);
                break;

            case ButlerCommandType::StreamAudioFile:
                handleStreamAudioFile(cmd.channel, cmd.path, cmd.position);
                break;

            case ButlerCommandType::StopStreaming:
                handleStopStreaming(cmd.channel);
                break;

            case ButlerCommandType::SeekStream:
                handleSeek(cmd.channel, cmd.position);
                break;

            case ButlerCommandType::SetLoopRange:
                handleSetLoopRange(cmd.channel, cmd.loop);
                break;

            case ButlerCommandType::ClearLoopRange:
                if (ChannelStreamState* ch = findChannelLocked(cmd.channel)) ch->clearLoopRange();
                break;

            case ButlerCommandType::SetVarispeed:
                handleSetVarispeed(cmd.channel, cmd.varispeed);
                break;

            case ButlerCommandType::UpdatePdcPreroll:
                handleUpdatePreroll(cmd.channel, cmd.position);
                break;

            case ButlerCommandType::RegisterCapture:
                handleRegisterCapture(cmd);
                break;

            case ButlerCommandType::RemoveCapture:
                handleRemoveCapture(cmd.captureId);
                break;

            case ButlerCommandType::Flush: {
                auto it = mCaptures.find(cmd.captureId);
                if (it != mCaptures.end()) flushCapture(it->second, std::numeric_limits<size_t>::max());
                break;
            }

            case ButlerCommandType::SetBufferMargin:
                mBufferMargin.store(std::min(std::max(cmd.margin, 0.5), 3.0), std::memory_order_relaxed);
                break;

            case ButlerCommandType::Shutdown:
                flushAllCaptures(true);
                mState.store(ButlerState::Shutdown, std::memory_order_release);
                break;
        }
    }

    void releaseRegion(ChannelStreamState& ch) {
        if (auto id = ch.regionId()) mProducers.erase(*id);
        ch.stopStreaming();
    }

    void handleStreamAudioFile(size_t channel, const std::string& path, uint64_t offset) {
        AssetHandle asset = assetFor(path);
        if (!asset) return;

        // bufferSeconds caps the size-scaled capacity.
        const size_t capacity = std::min(calculateBufferSize(asset->len(), mSampleRate),
                                         mConfig.bufferSamples(mSampleRate));
        const RegionId id = RegionId::generate();
        auto buffers = RegionBuffer::create(id, path, asset->len(), asset->sampleRate(),
                                            asset->channels(), capacity);

        uint64_t preroll = 0;
        if (mPdc && mPdc->isEnabled()) preroll = mPdc->channelCompensation(channel);
        const uint64_t start = offset > preroll ? offset - preroll : 0;

        buffers.first.setFilePosition(start);
        buffers.second->rebaseReadPosition(start);

        ChannelStreamState& ch = channelLocked(channel);
        releaseRegion(ch);
        // A loop and its pre-loop audio belong to the region being replaced.
        ch.clearLoopRange();
        ch.startStreaming(buffers.second, path);
        mProducers[id] = std::make_unique<RegionBufferProducer>(std::move(buffers.first));

        ch.setPdcPreroll(preroll);
        const double fileRate = asset->sampleRate();
        ch.shared().setSrcRatio(std::abs(fileRate - mSampleRate) < 0.01
                                    ? 1.0f
                                    : static_cast<float>(fileRate / mSampleRate));
        ch.shared().setBufferFill(0.0f);

        std::cout << "[Butler] Channel " << channel << ": streaming " << path
                  << " from frame " << start << " (ring " << buffers.first.capacity()
                  << " frames, preroll " << preroll << ")" << std::endl;
    }

    void handleStopStreaming(size_t channel) {
        ChannelStreamState* ch = findChannelLocked(channel);
        if (!ch || !ch->isStreaming()) return;
        releaseRegion(*ch);
        std::cout << "[Butler] Channel " << channel << ": stopped." << std::endl;
    }

    /// Flush the channel, move the producer to `newPos`, and schedule a seek
    /// crossfade from what was buffered to the audio at `newPos`.
    void realign(ChannelStreamState& ch, RegionBufferProducer& producer, uint64_t newPos) {
        const size_t xfade = mConfig.seekCrossfadeSamples;
        std::vector<StereoFrame> fadeOut = captureFadeout(*ch.consumer(), xfade);

        ch.setSeeking(true);
        ch.flushBuffer();
        producer.setFilePosition(newPos);
        ch.consumer()->rebaseReadPosition(newPos);

        std::vector<StereoFrame> fadeIn;
        if (AssetHandle asset = assetFor(producer.filePath())) {
            fadeIn = captureFadein(*asset, newPos, xfade);
        }

        if (!fadeOut.empty() && !fadeIn.empty()) {
            ch.shared().startSeekCrossfade(fadeOut, fadeIn);
        }
        ch.setSeeking(false);
    }

    void handleSeek(size_t channel, uint64_t position) {
        ChannelStreamState* ch = findChannelLocked(channel);
        if (!ch) return;
        RegionBufferProducer* producer = producerFor(*ch);
        if (!producer) return;

        const uint64_t preroll = ch->pdcPreroll();
        const uint64_t target = position > preroll ? position - preroll : 0;
        realign(*ch, *producer, target);

        std::cout << "[Butler] Channel " << channel << ": seek to frame " << target << std::endl;
    }

    void handleUpdatePreroll(size_t channel, uint64_t newPreroll) {
        ChannelStreamState* ch = findChannelLocked(channel);
        if (!ch) return;
        applyPreroll(channel, *ch, newPreroll);
    }

    void applyPreroll(size_t channel, ChannelStreamState& ch, uint64_t newPreroll) {
        const uint64_t oldPreroll = ch.pdcPreroll();
        if (newPreroll == oldPreroll) return;
        RegionBufferProducer* producer = producerFor(ch);
        if (!producer) return;

        const uint64_t newPos = realignedPosition(ch.playhead(*producer), oldPreroll, newPreroll);
        realign(ch, *producer, newPos);
        ch.setPdcPreroll(newPreroll);

        std::cout << "[Butler] Channel " << channel << ": PDC preroll " << oldPreroll
                  << " -> " << newPreroll << ", realigned to frame " << newPos << std::endl;
    }

    void handleSetLoopRange(size_t channel, const LoopRange& range) {
        if (!range.isValid()) {
            std::cerr << "[Butler] WARNING: channel " << channel << ": ignoring loop with end "
                      << range.end << " <= start " << range.start << std::endl;
            return;
        }

        ChannelStreamState& ch = channelLocked(channel);
        ch.setLoopRange(range);

        RegionBufferProducer* producer = producerFor(ch);
        if (!producer) return;

        if (producer->filePosition() > range.end) {
            ch.flushBuffer();
            producer->setFilePosition(range.start);
            ch.consumer()->rebaseReadPosition(range.start);
        }

        if (range.crossfade > 0) {
            if (AssetHandle asset = assetFor(producer->filePath())) {
                ch.setPreloopBuffer(captureFrames(*asset, static_cast<size_t>(range.start), range.crossfade));
            }
        }
    }

    void handleSetVarispeed(size_t channel, const Varispeed& v) {
        ChannelStreamState& ch = channelLocked(channel);
        const bool directionChanged = ch.isReverse() != v.isReverse();
        RegionBufferProducer* producer = producerFor(ch);
        const uint64_t playhead = producer ? ch.playhead(*producer) : 0;

        ch.setVarispeed(v, mConfig.speedRampSamples);

        // Buffered audio runs the old way; restart the ring from the playhead.
        if (directionChanged && producer) realign(ch, *producer, playhead);
    }

    void handleRegisterCapture(ButlerCommand& cmd) {
        if (!cmd.captureConsumer) {
            std::cerr << "[Butler] WARNING: RegisterCapture without a consumer ignored." << std::endl;
            return;
        }

        CaptureState st;
        st.consumer = std::move(cmd.captureConsumer);
        st.channels = cmd.channels;
        st.writer = std::make_unique<CaptureWriter>();
        try {
            st.writer->open(cmd.path, cmd.sampleRate, cmd.channels);
        } catch (const std::runtime_error& e) {
            std::cerr << "[Butler] ERROR: " << e.what() << std::endl;
            st.writer.reset();
        }

        std::cout << "[Butler] Capture " << cmd.captureId.value << " registered -> " << cmd.path
                  << " (" << cmd.channels << " ch, " << cmd.sampleRate << " Hz)" << std::endl;
        mCaptures[cmd.captureId] = std::move(st);
    }

    void handleRemoveCapture(CaptureId id) {
        auto it = mCaptures.find(id);
        if (it == mCaptures.end()) return;

        CaptureState& st = it->second;
        flushCapture(st, std::numeric_limits<size_t>::max());
        uint64_t frames = st.consumer->framesWritten();
        if (st.writer) st.writer->close();
        mCaptures.erase(it);

        std::cout << "[Butler] Capture " << id.value << " removed (" << frames
                  << " frames written)" << std::endl;
    }

    // ── PDC realignment ──────────────────────────────────────────────────

    void checkPdcUpdates() {
        if (!mPdc || !mPdc->isEnabled()) return;
        PdcSnapshot snap = mPdc->snapshot();

        for (auto& entry : mChannels) {
            ChannelStreamState& ch = *entry.second;
            if (!ch.isStreaming()) continue;
            applyPreroll(entry.first, ch, snap->channelCompensation(entry.first));
        }
    }

    // ── Loops ────────────────────────────────────────────────────────────

    void checkLoops() {
        for (auto& entry : mChannels) {
            ChannelStreamState& ch = *entry.second;
            switch (ch.checkLoopStatus()) {
                case LoopStatus::Normal:
                    break;
                case LoopStatus::ApproachingEnd:
                    startLoopCrossfade(ch);
                    break;
                case LoopStatus::AtEnd:
                    wrapLoop(ch);
                    break;
            }
        }
    }

    void startLoopCrossfade(ChannelStreamState& ch) {
        if (ch.shared().isLoopCrossfading()) return;
        const size_t fadeLen = ch.loopCrossfadeSamples();
        const RegionBufferProducer* producer = producerFor(ch);
        if (fadeLen == 0 || !producer || !ch.loopRange()) return;

        AssetHandle asset = assetFor(producer->filePath());
        if (!asset) return;

        const LoopRange& loop = *ch.loopRange();
        const uint64_t fadeStart = loop.end > fadeLen ? loop.end - fadeLen : 0;
        std::vector<StereoFrame> fadeOut = captureFrames(*asset, static_cast<size_t>(fadeStart), fadeLen);
        std::vector<StereoFrame> fadeIn = ch.preloopBuffer().empty()
            ? captureFrames(*asset, static_cast<size_t>(loop.start), fadeLen)
            : ch.preloopBuffer();

        ch.shared().startLoopCrossfade(fadeOut, fadeIn);
    }

    void wrapLoop(ChannelStreamState& ch) {
        ch.shared().clearLoopCrossfade();
        RegionBufferProducer* producer = producerFor(ch);
        if (!producer || !ch.loopRange()) return;

        const LoopRange loop = *ch.loopRange();
        const uint64_t overshoot = ch.consumer()->readPosition() - loop.end;
        const uint64_t pos = loop.start + overshoot % loop.length();

        ch.flushBuffer();
        producer->setFilePosition(pos);
        ch.consumer()->rebaseReadPosition(pos);

        // Prefill as much of the loop as fits so the audio thread does not
        // starve while the regular refill catches up.
        AssetHandle asset = assetFor(producer->filePath());
        if (!asset) return;

        const size_t prefill = static_cast<size_t>(std::min<uint64_t>(loop.end - pos, producer->writeSpace()));
        std::vector<StereoFrame> frames = captureFrames(*asset, static_cast<size_t>(pos), prefill);
        const size_t written = producer->write(frames);

        uint64_t next = pos + written;
        if (next >= loop.end) next = loop.start;
        producer->setFilePosition(next);
    }

    // ── Refill ───────────────────────────────────────────────────────────

    /// Decide whether `ch` needs data this cycle and, if so, how much.
    bool planRefill(ChannelStreamState& ch, RefillItem& item) {
        if (!ch.isStreaming()) return false;
        RegionBufferProducer* producer = producerFor(ch);
        if (!producer) return false;

        if (const uint64_t underruns = ch.shared().takeUnderrunCount()) mMetrics.recordLowBuffer(underruns);

        const double margin = bufferMargin();
        const float fill = static_cast<float>(producer->buffered()) / static_cast<float>(producer->capacity());
        ch.shared().setBufferFill(fill);

        if (fill >= static_cast<float>(kRefillThreshold / margin)) return false;
        if (fill < kLowBufferFraction) mMetrics.recordLowBuffer();

        const float adjustedSpeed = ch.speed() * ch.shared().srcRatio() * static_cast<float>(margin);

        item.asset = assetFor(producer->filePath());
        if (!item.asset) return false;

        item.producer = producer;
        item.shared   = &ch.shared();
        item.loop     = ch.loopRange();
        item.chunk    = calculateVarifillChunk(fill, mConfig.chunkSize, mMetrics.readRate(), adjustedSpeed);
        item.reverse  = ch.isReverse();
        item.fill     = fill;
        return true;
    }

    static void executeRefill(const RefillItem& item, std::vector<StereoFrame>& scratch) {
        if (item.reverse) {
            refillReverse(*item.producer, *item.asset, item.chunk, scratch);
        } else {
            refillForward(*item.producer, *item.asset, item.chunk,
                          item.loop ? &*item.loop : nullptr, scratch);
        }
    }

    void refillAll() {
        for (auto& entry : mChannels) {
            RefillItem item;
            if (planRefill(*entry.second, item)) executeRefill(item, mScratch);
        }
    }

    void refillAllParallel() {
        mWork.clear();
        for (auto& entry : mChannels) {
            RefillItem item;
            if (planRefill(*entry.second, item)) mWork.push_back(std::move(item));
        }
        if (mWork.empty()) return;

        const size_t hw = std::max<size_t>(std::thread::hardware_concurrency(), 1);
        const size_t workers = std::min(mWork.size(), hw);
        if (mWorkerScratch.size() < workers) {
            mWorkerScratch.resize(workers);
            for (auto& s : mWorkerScratch) s.reserve(mConfig.chunkSize * 4);
        }

        // Worker w takes items w, w + workers, ... Each producer appears once.
        std::vector<std::thread> pool;
        WorkerJoin join{pool};
        pool.reserve(workers - 1);

        size_t spawned = 1;
        try {
            for (; spawned < workers; spawned++) {
                const size_t w = spawned;
                pool.push_back(launchWorker([this, w, workers]() {
                    for (size_t i = w; i < mWork.size(); i += workers) executeRefill(mWork[i], mWorkerScratch[w]);
                }));
            }
        } catch (const std::system_error& e) {
            std::cerr << "[Butler] WARNING: refill worker " << spawned << " of " << workers
                      << " failed to start (" << e.what() << "); filling its channels here." << std::endl;
        }

        // Stripes whose worker never started run on this thread.
        for (size_t w = spawned; w < workers; w++) {
            for (size_t i = w; i < mWork.size(); i += workers) executeRefill(mWork[i], mWorkerScratch[0]);
        }
        for (size_t i = 0; i < mWork.size(); i += workers) executeRefill(mWork[i], mWorkerScratch[0]);
    }

    // ── Capture flushing ─────────────────────────────────────────────────

    void flushCapture(CaptureState& st, size_t maxFrames) {
        if (!st.writer || !st.writer->isOpen()) return;

        const size_t toRead = std::min(st.consumer->available(), maxFrames);
        if (toRead == 0) return;

        mFlushScratch.resize(toRead);
        const size_t read = st.consumer->readInto(mFlushScratch.data(), toRead);
        const size_t written = st.writer->writeFrames(mFlushScratch.data(), read);

        mMetrics.recordWrite(static_cast<uint64_t>(written) * static_cast<uint64_t>(st.channels) * 4u);
        st.consumer->addFramesWritten(written);
    }

    void flushAllCaptures(bool force) {
        for (auto& entry : mCaptures) {
            CaptureState& st = entry.second;
            if (const uint64_t dropped = st.consumer->takeFramesDropped()) {
                mMetrics.recordLowBuffer(dropped);
            }
            if (force) {
                flushCapture(st, std::numeric_limits<size_t>::max());
            } else if (st.consumer->needsFlush(mConfig.flushThreshold)) {
                flushCapture(st, mConfig.flushThreshold);
            }
        }
    }

    // ── Member data ──────────────────────────────────────────────────────

    const BufferConfig mConfig;
    const double       mSampleRate;

    CommandQueue mQueue;
    AssetCache   mCache;
    IOMetrics    mMetrics;
    std::shared_ptr<PdcManager> mPdc;

    std::thread              mThread;
    std::atomic<bool>        mShutdown{false};
    std::atomic<ButlerState> mState{ButlerState::Running};
    std::atomic<double>      mBufferMargin{1.0};
    bool                     mPaused = false;   // Butler thread only

    // Guarded by mChannelsMutex
    mutable std::mutex mChannelsMutex;
    std::map<size_t, std::shared_ptr<ChannelStreamState>> mChannels;
    std::unordered_map<RegionId, std::unique_ptr<RegionBufferProducer>> mProducers;
    std::unordered_map<CaptureId, CaptureState> mCaptures;
    std::unordered_set<std::string> mFailedPaths;

    // Reused across cycles
    std::vector<StereoFrame>              mScratch;
    std::vector<StereoFrame>              mFlushScratch;
    std::vector<RefillItem>               mWork;
    std::vector<std::vector<StereoFrame>> mWorkerScratch;
    const size_t                          mCrossfadeCapacity;
};
