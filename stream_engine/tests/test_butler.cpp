// Butler command handling, refill, repositioning and capture draining.
//
// Most scenarios drive runCycle() directly so every step is deterministic;
// the lifecycle scenario runs the real thread.

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <sndfile.h>

#include "Butler.hpp"
#include "PdcManager.hpp"
#include "StreamPlayer.hpp"
#include "TestSupport.hpp"

static const size_t kFixtureFrames = 20000;
static const size_t kLongFixtureFrames = 96000;

static BufferConfig testConfig(size_t seekCrossfade = 0) {
    BufferConfig c;
    c.chunkSize = 1024;
    c.seekCrossfadeSamples = seekCrossfade;
    c.speedRampSamples = 0;
    c.flushThreshold = 8192;
    return c;
}

/// Play one frame on `shared` and decode its ramp index.
static size_t nextIndex(SharedStreamState& shared) {
    StereoFrame f;
    StreamPlayer::readFrame(shared, f);
    return rampIndex(f.left);
}

static void skip(SharedStreamState& shared, size_t frames) {
    StereoFrame f;
    for (size_t i = 0; i < frames; ++i) StreamPlayer::readFrame(shared, f);
}

/// One second of ring at 48 kHz, small chunks.
static BufferConfig oneSecondConfig() {
    BufferConfig c = BufferConfig::withBufferSeconds(1.0);
    c.chunkSize = 1024;
    c.seekCrossfadeSamples = 0;
    c.speedRampSamples = 0;
    return c;
}

/// Run cycles until a cycle leaves the producer on `channel` where it was.
/// Returns the frames buffered past `start` at that point.
static uint64_t cycleUntilSkipped(ButlerThread& butler, size_t channel, uint64_t start) {
    uint64_t pos = butler.producerPosition(channel).value_or(start);
    for (int i = 0; i < 200; ++i) {
        butler.runCycle();
        const uint64_t next = butler.producerPosition(channel).value_or(start);
        if (next == pos) break;
        pos = next;
    }
    return pos - start;
}

/// Fails every refill worker launch after the first `allowed`.
class ThreadStarvedButler : public ButlerThread {
public:
    ThreadStarvedButler(const BufferConfig& config, double sampleRate, size_t allowed)
        : ButlerThread(config, sampleRate), mAllowed(allowed) {}

    size_t refused() const { return mRefused; }

protected:
    std::thread launchWorker(std::function<void()> body) override {
        if (mAllowed > 0) {
            mAllowed--;
            return std::thread(std::move(body));
        }
        mRefused++;
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                "thread limit reached");
    }

private:
    size_t mAllowed;
    size_t mRefused = 0;
};

int main() {
    TestRunner t("butler");
    const auto dir = testDir("butler");
    const std::string wav = writeRampWav(dir / "ramp.wav", kFixtureFrames, 2);
    const std::string longWav = writeRampWav(dir / "long.wav", kLongFixtureFrames, 2);

    t.scenario("idle and paused cycles", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        t.check(butler.runCycle() == CycleOutcome::Idle, "nothing to do");
        butler.trySend(ButlerCommand::pause());
        t.check(butler.runCycle() == CycleOutcome::Paused, "paused");
        t.check(butler.state() == ButlerState::Paused, "state reports pause");
        butler.trySend(ButlerCommand::run());
        t.check(butler.runCycle() == CycleOutcome::Idle, "running again");
        t.check(butler.state() == ButlerState::Running, "state reports running");
    });

    t.scenario("stream fills the ring from the requested offset", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 1000));
        t.check(butler.runCycle() == CycleOutcome::Worked, "worked");
        t.check(butler.isStreaming(0) && butler.activeStreams() == 1, "streaming");
        t.check(shared->hasConsumer(), "consumer published to the audio side");
        t.check(butler.producerPosition(0).value_or(0) >= 1000 + kMinVarifillChunk, "at least one chunk read");
        t.check(shared->srcRatio() == 1.0f, "no rate conversion at 48 kHz");

        t.check(nextIndex(*shared) == 1000, "first frame is the offset");
        t.check(nextIndex(*shared) == 1001, "then sequential");
        butler.runCycle();
        t.check(shared->bufferFill() > 0.0f, "fill published");
    });

    t.scenario("rate mismatch is reported as a src ratio", [&] {
        const std::string wav44 = writeRampWav(dir / "ramp44.wav", 4410, 2, 44100);
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav44, 0));
        butler.runCycle();
        t.check(near(shared->srcRatio(), 44100.0f / 48000.0f), "44.1 / 48");
    });

    t.scenario("missing file is skipped", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        const std::string missing = (dir / "missing.wav").string();
        butler.trySend(ButlerCommand::streamAudioFile(0, missing, 0));
        t.check(butler.runCycle() == CycleOutcome::Idle, "nothing streaming");
        t.check(!butler.isStreaming(0), "channel not streaming");
        butler.trySend(ButlerCommand::streamAudioFile(0, missing, 0));
        butler.runCycle();
        t.check(butler.metrics().snapshot().cacheMisses == 2, "retried on the next request");
    });

    t.scenario("assets are shared through the cache", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 0));
        butler.trySend(ButlerCommand::streamAudioFile(1, wav, 500));
        butler.runCycle();
        IOMetricsSnapshot s = butler.metrics().snapshot();
        t.check(s.cacheMisses == 1 && s.cacheHits >= 1, "decoded once");
        t.check(s.readOps == 1 && s.bytesRead == kFixtureFrames * 2 * 4, "one read of the whole file");
        t.check(butler.cache().contains(wav), "cached");
    });

    t.scenario("stop streaming detaches the channel", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 0));
        butler.runCycle();
        butler.trySend(ButlerCommand::stopStreaming(0));
        t.check(butler.runCycle() == CycleOutcome::Idle, "idle afterwards");
        t.check(!butler.isStreaming(0) && !shared->hasConsumer(), "detached");
        t.check(!butler.producerPosition(0), "producer released");
    });

    t.scenario("restreaming a channel replaces its region", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 0));
        butler.runCycle();
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 7000));
        butler.runCycle();
        t.check(butler.activeStreams() == 1, "still one stream");
        t.check(nextIndex(*shared) == 7000, "plays the new region");
    });

    t.scenario("restreaming drops the previous region's loop", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 1900));
        butler.trySend(ButlerCommand::setLoopRange(0, 1000, 2000, 32));
        butler.runCycle();
        t.check(butler.streamState(0)->preloopBuffer().size() == 32, "loop armed on the first region");

        butler.trySend(ButlerCommand::streamAudioFile(0, longWav, 1900));
        butler.runCycle();
        t.check(!butler.streamState(0)->loopRange(), "loop range cleared");
        t.check(butler.streamState(0)->preloopBuffer().empty(), "pre-loop audio discarded");
        t.check(!shared->isLoopCrossfading(), "no loop crossfade");

        skip(*shared, 150);
        t.check(nextIndex(*shared) == 2050, "plays straight through the old loop end");
    });

    t.scenario("ring capacity is capped by bufferSeconds", [&] {
        ButlerThread capped(oneSecondConfig(), 48000.0);
        capped.trySend(ButlerCommand::streamAudioFile(0, longWav, 0));
        capped.runCycle();
        t.check(capped.ringCapacity(0).value_or(0) == 48000, "one second at 48 kHz");

        ButlerThread roomy(testConfig(), 48000.0);
        roomy.trySend(ButlerCommand::streamAudioFile(0, longWav, 0));
        roomy.runCycle();
        t.check(roomy.ringCapacity(0).value_or(0) == kLongFixtureFrames, "short file buffered whole under 10 s");
        t.check(!roomy.ringCapacity(1), "no ring on an idle channel");
    });

    t.scenario("seek jumps to the new position", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 0));
        butler.runCycle();
        skip(*shared, 10);
        butler.trySend(ButlerCommand::seekStream(0, 5000));
        butler.runCycle();
        t.check(nextIndex(*shared) == 5000, "next frame comes from the seek target");
        t.check(!shared->isSeeking(), "seeking flag cleared");
    });

    t.scenario("seek crossfades from the old audio to the new", [&] {
        ButlerThread butler(testConfig(64), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 0));
        butler.runCycle();
        skip(*shared, 10);
        butler.trySend(ButlerCommand::seekStream(0, 5000));
        butler.runCycle();
        t.check(shared->isSeekCrossfading() && shared->seekCrossfadeLength() == 64, "64-frame crossfade armed");
        t.check(nextIndex(*shared) == 10, "crossfade starts on the old audio");
        skip(*shared, 63);
        t.check(nextIndex(*shared) == 5064, "new audio once the crossfade ends");
    });

    t.scenario("PDC preroll starts early and realigns on change", [&] {
        auto pdc = std::make_shared<PdcManager>(2, 0);
        pdc->setChannelLatency(0, 0);
        pdc->setChannelLatency(1, 300);

        ButlerThread butler(testConfig(), 48000.0);
        butler.setPdc(pdc);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 1000));
        butler.runCycle();
        t.check(butler.pdcPreroll(0) == 300, "preroll from compensation");
        t.check(nextIndex(*shared) == 700, "reads 300 frames early");

        pdc->setChannelLatency(1, 100);
        butler.runCycle();
        t.check(butler.pdcPreroll(0) == 100, "preroll follows the snapshot");
        t.check(nextIndex(*shared) == 901, "playhead 701 moved 200 frames later");

        butler.trySend(ButlerCommand::seekStream(0, 4000));
        butler.runCycle();
        t.check(nextIndex(*shared) == 3900, "seek subtracts the preroll");
    });

    t.scenario("disabled PDC leaves positions alone", [&] {
        auto pdc = std::make_shared<PdcManager>(2, 0);
        pdc->setChannelLatency(1, 300);
        pdc->setEnabled(false);
        ButlerThread butler(testConfig(), 48000.0);
        butler.setPdc(pdc);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 1000));
        butler.runCycle();
        t.check(butler.pdcPreroll(0) == 0, "no preroll");
        t.check(nextIndex(*shared) == 1000, "offset as requested");
    });

    t.scenario("explicit preroll update realigns", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 1000));
        butler.runCycle();
        butler.trySend(ButlerCommand::updatePdcPreroll(0, 200));
        butler.runCycle();
        t.check(butler.pdcPreroll(0) == 200, "preroll stored");
        t.check(nextIndex(*shared) == 800, "200 frames earlier");
    });

    t.scenario("loop wraps to the loop start", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 1900));
        butler.trySend(ButlerCommand::setLoopRange(0, 1000, 2000, 0));
        butler.runCycle();

        skip(*shared, 99);
        t.check(nextIndex(*shared) == 1999, "last frame of the loop");
        t.check(nextIndex(*shared) == 1000, "refill already wrapped");
        butler.runCycle();
        t.check(nextIndex(*shared) == 1001, "wrap keeps the playhead continuous");
        t.check(butler.producerPosition(0).value_or(0) >= 1000 &&
                butler.producerPosition(0).value_or(0) < 2000, "producer stays inside the loop");
    });

    t.scenario("loop crossfade starts near the loop end", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 1900));
        butler.trySend(ButlerCommand::setLoopRange(0, 1000, 2000, 32));
        butler.runCycle();
        t.check(!shared->isLoopCrossfading(), "too far from the end");
        t.check(butler.streamState(0)->preloopBuffer().size() == 32, "pre-loop audio captured");

        skip(*shared, 70);
        butler.runCycle();
        t.check(shared->isLoopCrossfading() && shared->loopCrossfadeLength() == 32, "crossfade armed");
        t.check(nextIndex(*shared) == 1968, "fades out from end - crossfade");
    });

    t.scenario("loop set past the producer rewinds it", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 6000));
        butler.runCycle();
        butler.trySend(ButlerCommand::setLoopRange(0, 100, 200, 0));
        butler.runCycle();
        t.check(nextIndex(*shared) == 100, "restarted at the loop start");
    });

    t.scenario("invalid loops are ignored and loops can be cleared", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 0));
        butler.trySend(ButlerCommand::setLoopRange(0, 10, 10, 0));
        butler.runCycle();
        t.check(!butler.streamState(0)->loopRange(), "end == start rejected");
        butler.trySend(ButlerCommand::setLoopRange(0, 10, 5000, 0));
        butler.runCycle();
        t.check(butler.streamState(0)->loopRange().has_value(), "valid loop stored");
        butler.trySend(ButlerCommand::clearLoopRange(0));
        butler.runCycle();
        t.check(!butler.streamState(0)->loopRange(), "cleared");
    });

    t.scenario("reverse play reads backwards from the playhead", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, wav, 5000));
        butler.trySend(ButlerCommand::setVarispeed(0, PlayDirection::Reverse, 1.0f));
        butler.runCycle();
        t.check(shared->isReverse(), "direction published");
        t.check(nextIndex(*shared) == 4999, "first reverse frame");
        t.check(nextIndex(*shared) == 4998, "second reverse frame");
        skip(*shared, 8);

        butler.trySend(ButlerCommand::setVarispeed(0, PlayDirection::Forward, 1.0f));
        butler.runCycle();
        t.check(!shared->isReverse(), "forward again");
        t.check(nextIndex(*shared) == 4989, "resumes forward from the next unplayed frame");
    });

    t.scenario("varispeed publishes the speed", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::setVarispeed(0, PlayDirection::Forward, 2.0f));
        butler.runCycle();
        t.check(shared->speed() == 2.0f, "speed applied");
        t.check(butler.streamState(0)->speed() == 2.0f, "butler side agrees");
    });

    t.scenario("buffer margin is clamped", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        butler.trySend(ButlerCommand::setBufferMargin(5.0));
        butler.runCycle();
        t.check(butler.bufferMargin() == 3.0, "upper clamp");
        butler.trySend(ButlerCommand::setBufferMargin(0.1));
        butler.runCycle();
        t.check(butler.bufferMargin() == 0.5, "lower clamp");
    });

    t.scenario("refill stops at the threshold and margin lowers it", [&] {
        ButlerThread butler(oneSecondConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, longWav, 0));
        const uint64_t buffered = cycleUntilSkipped(butler, 0, 0);
        t.check(buffered >= 36000 && buffered <= 48000, "margin 1 fills to 75 percent");
        t.check(shared->bufferFill() >= 0.74f, "fill published");

        const uint64_t pos = butler.producerPosition(0).value_or(0);
        butler.runCycle();
        t.check(butler.producerPosition(0).value_or(0) == pos, "full enough ring is skipped");

        butler.trySend(ButlerCommand::setBufferMargin(2.0));
        butler.runCycle();
        t.check(butler.producerPosition(0).value_or(0) == pos, "still skipped at margin 2");
    });

    t.scenario("margin 2 refills only below 37.5 percent", [&] {
        ButlerThread butler(oneSecondConfig(), 48000.0);
        butler.trySend(ButlerCommand::setBufferMargin(2.0));
        butler.trySend(ButlerCommand::streamAudioFile(0, longWav, 0));
        const uint64_t buffered = cycleUntilSkipped(butler, 0, 0);
        t.check(buffered >= 18000 && buffered < 24000, "stops one chunk past 37.5 percent");

        const uint64_t pos = butler.producerPosition(0).value_or(0);
        butler.runCycle();
        t.check(butler.producerPosition(0).value_or(0) == pos, "skipped at margin 2");

        butler.trySend(ButlerCommand::setBufferMargin(1.0));
        butler.runCycle();
        t.check(butler.producerPosition(0).value_or(0) > pos, "margin 1 resumes the refill");
    });

    t.scenario("near-empty refills count as low-buffer events", [&] {
        ButlerThread butler(oneSecondConfig(), 48000.0);
        butler.trySend(ButlerCommand::streamAudioFile(0, longWav, 0));
        butler.runCycle();
        t.check(butler.metrics().snapshot().lowBufferEvents == 1, "empty ring on the first refill");

        cycleUntilSkipped(butler, 0, 0);
        const uint64_t settled = butler.metrics().snapshot().lowBufferEvents;
        butler.runCycle();
        t.check(butler.metrics().snapshot().lowBufferEvents == settled, "full ring adds none");
    });

    t.scenario("audio-thread underruns reach the metrics", [&] {
        ButlerThread butler(oneSecondConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        butler.trySend(ButlerCommand::streamAudioFile(0, longWav, 0));
        butler.runCycle();
        const uint64_t buffered = butler.producerPosition(0).value_or(0);
        const uint64_t before = butler.metrics().snapshot().lowBufferEvents;

        skip(*shared, static_cast<size_t>(buffered) + 5);
        butler.runCycle();
        t.check(butler.metrics().snapshot().lowBufferEvents == before + 5 + 1,
                "five underruns plus the empty-ring refill");
        t.check(shared->underrunCount() == 0, "underrun count taken");
    });

    t.scenario("capture overflow reaches the metrics", [&] {
        const std::string out = (dir / "overflow.wav").string();
        ButlerThread butler(testConfig(), 48000.0);
        const CaptureId id = CaptureId::generate();
        auto capture = CaptureBuffer::withCapacity(id, out, 48000.0, 2, 4096);
        butler.trySend(ButlerCommand::registerCapture(id, std::move(capture.second), out, 48000.0, 2));
        butler.runCycle();

        std::vector<StereoFrame> frames(5000);
        t.check(capture.first.writeMany(frames.data(), frames.size()) == 4096, "ring takes 4096");
        butler.runCycle();
        t.check(butler.metrics().snapshot().lowBufferEvents == 904, "904 dropped frames recorded");
        t.check(capture.first.framesDropped() == 0, "drop count taken");

        butler.runCycle();
        t.check(butler.metrics().snapshot().lowBufferEvents == 904, "counted once");

        butler.trySend(ButlerCommand::removeCapture(id));
        butler.runCycle();
    });

    t.scenario("parallel refill serves every channel", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        std::vector<std::shared_ptr<SharedStreamState>> shared;
        for (size_t ch = 0; ch < 4; ++ch) {
            shared.push_back(butler.sharedState(ch));
            butler.trySend(ButlerCommand::streamAudioFile(ch, wav, ch * 3000));
        }
        butler.runCycle();
        bool aligned = true;
        for (size_t ch = 0; ch < 4; ++ch) {
            if (nextIndex(*shared[ch]) != ch * 3000) aligned = false;
            if (butler.producerPosition(ch).value_or(0) < ch * 3000 + kMinVarifillChunk) aligned = false;
        }
        t.check(aligned, "four channels filled from their own offsets");
    });

    t.scenario("parallel refill falls back when workers cannot start", [&] {
        const bool multicore = std::thread::hardware_concurrency() > 1;
        for (size_t allowed = 0; allowed < 2; ++allowed) {
            ThreadStarvedButler butler(testConfig(), 48000.0, allowed);
            std::vector<std::shared_ptr<SharedStreamState>> shared;
            for (size_t ch = 0; ch < 4; ++ch) {
                shared.push_back(butler.sharedState(ch));
                butler.trySend(ButlerCommand::streamAudioFile(ch, wav, ch * 3000));
            }
            t.check(butler.runCycle() == CycleOutcome::Worked, "cycle completes");
            bool aligned = true;
            for (size_t ch = 0; ch < 4; ++ch) {
                if (nextIndex(*shared[ch]) != ch * 3000) aligned = false;
                if (butler.producerPosition(ch).value_or(0) < ch * 3000 + kMinVarifillChunk) aligned = false;
            }
            t.check(aligned, "every channel filled on the remaining threads");
            if (allowed == 0) t.check(!multicore || butler.refused() > 0, "launch failure exercised");
        }
    });

    t.scenario("capture flushes on request and closes on removal", [&] {
        const std::string out = (dir / "capture.wav").string();
        ButlerThread butler(testConfig(), 48000.0);
        const CaptureId id = CaptureId::generate();
        auto capture = CaptureBuffer::withCapacity(id, out, 48000.0, 2, 8192);
        butler.trySend(ButlerCommand::registerCapture(id, std::move(capture.second), out, 48000.0, 2));
        butler.runCycle();
        t.check(butler.captureCount() == 1, "registered");

        std::vector<StereoFrame> frames(100, StereoFrame{0.25f, -0.5f});
        capture.first.writeMany(frames.data(), frames.size());
        t.check(butler.runCycle() == CycleOutcome::Worked, "captures keep the butler busy");
        t.check(butler.metrics().snapshot().bytesWritten == 0, "below the flush threshold");

        butler.trySend(ButlerCommand::flush(id));
        butler.runCycle();
        t.check(butler.metrics().snapshot().bytesWritten == 100 * 2 * 4, "flushed on request");

        butler.trySend(ButlerCommand::removeCapture(id));
        butler.runCycle();
        t.check(butler.captureCount() == 0, "removed");

        SF_INFO info{};
        SNDFILE* f = sf_open(out.c_str(), SFM_READ, &info);
        t.check(f != nullptr, "capture file readable");
        if (f) {
            std::vector<float> data(static_cast<size_t>(info.frames) * info.channels);
            sf_readf_float(f, data.data(), info.frames);
            sf_close(f);
            t.check(info.frames == 100 && info.channels == 2, "100 stereo frames");
            t.check(near(data[0], 0.25f, 1e-3f) && near(data[1], -0.5f, 1e-3f), "samples preserved");
        }
    });

    t.scenario("capture flushes automatically past the threshold", [&] {
        const std::string out = (dir / "auto.wav").string();
        BufferConfig cfg = testConfig();
        cfg.flushThreshold = 64;
        ButlerThread butler(cfg, 48000.0);
        const CaptureId id = CaptureId::generate();
        auto capture = CaptureBuffer::withCapacity(id, out, 48000.0, 2, 4096);
        butler.trySend(ButlerCommand::registerCapture(id, std::move(capture.second), out, 48000.0, 2));
        butler.runCycle();

        std::vector<StereoFrame> frames(100);
        capture.first.writeMany(frames.data(), frames.size());
        butler.runCycle();
        t.check(butler.metrics().snapshot().bytesWritten == 64 * 2 * 4, "one threshold's worth");

        butler.trySend(ButlerCommand::waitForCompletion());
        butler.runCycle();
        t.check(butler.metrics().snapshot().bytesWritten == 100 * 2 * 4, "rest forced out");
    });

    t.scenario("stop without a thread flushes captures", [&] {
        const std::string out = (dir / "stop.wav").string();
        ButlerThread butler(testConfig(), 48000.0);
        const CaptureId id = CaptureId::generate();
        auto capture = CaptureBuffer::withCapacity(id, out, 48000.0, 2, 4096);
        butler.trySend(ButlerCommand::registerCapture(id, std::move(capture.second), out, 48000.0, 2));
        butler.runCycle();
        std::vector<StereoFrame> frames(50);
        capture.first.writeMany(frames.data(), frames.size());
        butler.stop();
        t.check(butler.metrics().snapshot().bytesWritten == 50 * 2 * 4, "remaining frames flushed");
        t.check(butler.state() == ButlerState::Shutdown, "shut down");
        t.check(butler.runCycle() == CycleOutcome::Exit, "further cycles exit");
    });

    t.scenario("capture to an unwritable path is logged, not fatal", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        const std::string bad = (dir / "no_such_dir" / "x.wav").string();
        const CaptureId id = CaptureId::generate();
        auto capture = CaptureBuffer::withCapacity(id, bad, 48000.0, 2, 4096);
        butler.trySend(ButlerCommand::registerCapture(id, std::move(capture.second), bad, 48000.0, 2));
        butler.runCycle();
        std::vector<StereoFrame> frames(10);
        capture.first.writeMany(frames.data(), frames.size());
        butler.trySend(ButlerCommand::flushAll());
        butler.runCycle();
        t.check(butler.metrics().snapshot().bytesWritten == 0, "nothing written");
    });

    t.scenario("thread lifecycle", [&] {
        ButlerThread butler(testConfig(), 48000.0);
        auto shared = butler.sharedState(0);
        t.check(butler.start() && butler.isRunning(), "started");
        t.check(butler.start(), "second start is a no-op");

        butler.send(ButlerCommand::streamAudioFile(0, wav, 2000));
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline &&
               butler.producerPosition(0).value_or(0) < 2000 + kMinVarifillChunk) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        t.check(butler.isStreaming(0), "streaming from the thread");
        t.check(nextIndex(*shared) == 2000, "audio side reads the region");

        butler.stop();
        t.check(!butler.isRunning(), "joined");
        t.check(butler.state() == ButlerState::Shutdown, "shut down");
    });

    return t.finish();
}
