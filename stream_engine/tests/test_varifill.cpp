// Varifill chunk sizing, buffer sizing, refill routines, fade capture.

#include <memory>
#include <vector>

#include "AudioAsset.hpp"
#include "RingBuffers.hpp"
#include "TestSupport.hpp"
#include "Varifill.hpp"

// Left sample = frame index, right = -index.
static AudioAsset indexAsset(size_t frames) {
    std::vector<std::vector<float>> data(2, std::vector<float>(frames));
    for (size_t i = 0; i < frames; ++i) {
        data[0][i] = static_cast<float>(i);
        data[1][i] = -static_cast<float>(i);
    }
    return AudioAsset(2, 48000.0, std::move(data));
}

static std::vector<float> drainLeft(RegionBufferConsumer& c) {
    std::vector<float> out;
    StereoFrame f;
    while (c.read(f)) out.push_back(f.left);
    return out;
}

int main() {
    TestRunner t("varifill");

    t.scenario("chunk grows with urgency", [&] {
        t.check(calculateVarifillChunk(0.0f, 16384, 0.0, 1.0f) == 32768, "empty buffer doubles the chunk");
        t.check(calculateVarifillChunk(1.0f, 16384, 0.0, 1.0f) == 8192, "full buffer halves it");
        size_t prev = 0;
        bool monotonic = true;
        for (int i = 10; i >= 0; --i) {
            size_t c = calculateVarifillChunk(static_cast<float>(i) / 10.0f, 16384, 0.0, 1.0f);
            if (c < prev) monotonic = false;
            prev = c;
        }
        t.check(monotonic, "non-decreasing as the buffer drains");
    });

    t.scenario("chunk stays within bounds", [&] {
        const size_t base = 16384;
        bool bounded = true;
        for (float fill : {0.0f, 0.3f, 0.9f, 1.0f}) {
            for (double rate : {0.0, 1.0e5, 1.0e7, 1.0e9}) {
                for (float speed : {0.25f, 1.0f, 2.0f, 4.0f}) {
                    size_t c = calculateVarifillChunk(fill, base, rate, speed);
                    if (c < kMinVarifillChunk || c > 4 * base) bounded = false;
                }
            }
        }
        t.check(bounded, "always in [1024, 4 * base]");
        t.check(calculateVarifillChunk(0.0f, base, 4.0e7, 4.0f) == 4 * base, "fast disk + fast play hits the cap");
        t.check(calculateVarifillChunk(1.0f, 100, 0.0, 1.0f) == kMinVarifillChunk, "floor at 1024");
    });

    t.scenario("slow disks shrink the chunk and speed grows it", [&] {
        const size_t slow = calculateVarifillChunk(0.5f, 16384, 1.0e6, 1.0f);
        const size_t base = calculateVarifillChunk(0.5f, 16384, 0.0, 1.0f);
        const size_t fast = calculateVarifillChunk(0.5f, 16384, 0.0, 2.0f);
        t.check(slow < base, "low read rate reduces the chunk");
        t.check(fast == 2 * base, "double speed doubles it");
        t.check(calculateVarifillChunk(0.5f, 16384, 0.0, 0.5f) == base, "slow play never shrinks it");
    });

    t.scenario("buffer size tiers", [&] {
        t.check(calculateBufferSize(100, 48000.0) == kMinRingFrames, "tiny file gets the minimum");
        t.check(calculateBufferSize(480000, 48000.0) == 480000, "short file buffered whole");
        t.check(calculateBufferSize(48000ull * 60, 48000.0) == 48000u * 30u, "capped at 30 s");
        t.check(calculateBufferSize(10000000, 48000.0) == 480000, "50-200 MB: 10 s");
        t.check(calculateBufferSize(40000000, 48000.0) == 240000, "200-500 MB: 5 s");
        t.check(calculateBufferSize(100000000, 48000.0) == 144000, "above 500 MB: 3 s");
    });

    t.scenario("forward refill reads sequentially", [&] {
        AudioAsset asset = indexAsset(1000);
        auto pair = RegionBuffer::create(RegionId::generate(), "x", 1000, 48000.0, 2, 4096);
        std::vector<StereoFrame> scratch;
        pair.first.setFilePosition(100);
        t.check(refillForward(pair.first, asset, 50, nullptr, scratch) == 50, "chunk written");
        t.check(pair.first.filePosition() == 150, "position advanced");
        auto left = drainLeft(*pair.second);
        t.check(left.size() == 50 && left.front() == 100.0f && left.back() == 149.0f, "frames 100..149");
    });

    t.scenario("forward refill zero-pads past the end of the file", [&] {
        AudioAsset asset = indexAsset(10);
        auto pair = RegionBuffer::create(RegionId::generate(), "x", 10, 48000.0, 2, 4096);
        std::vector<StereoFrame> scratch;
        pair.first.setFilePosition(8);
        refillForward(pair.first, asset, 4, nullptr, scratch);
        auto left = drainLeft(*pair.second);
        t.check(left.size() == 4 && left[1] == 9.0f && left[2] == 0.0f && left[3] == 0.0f, "silence after the end");
    });

    t.scenario("forward refill is limited by write space", [&] {
        AudioAsset asset = indexAsset(10000);
        auto pair = RegionBuffer::create(RegionId::generate(), "x", 10000, 48000.0, 2, 4096);
        std::vector<StereoFrame> scratch;
        std::vector<StereoFrame> filler(4000);
        pair.first.write(filler);
        t.check(refillForward(pair.first, asset, 1000, nullptr, scratch) == 96, "only 96 frames fit");
        t.check(pair.first.filePosition() == 96, "position moves by frames written");
    });

    t.scenario("forward refill wraps at the loop end", [&] {
        AudioAsset asset = indexAsset(100);
        auto pair = RegionBuffer::create(RegionId::generate(), "x", 100, 48000.0, 2, 4096);
        std::vector<StereoFrame> scratch;
        LoopRange loop{10, 20, 0};
        pair.first.setFilePosition(15);
        refillForward(pair.first, asset, 12, &loop, scratch);
        auto left = drainLeft(*pair.second);
        const std::vector<float> expected{15, 16, 17, 18, 19, 10, 11, 12, 13, 14, 15, 16};
        t.check(left == expected, "reads wrap to loop start");
        t.check(pair.first.filePosition() == 17, "position wrapped inside the loop");
    });

    t.scenario("reverse refill writes backwards", [&] {
        AudioAsset asset = indexAsset(100);
        auto pair = RegionBuffer::create(RegionId::generate(), "x", 100, 48000.0, 2, 4096);
        std::vector<StereoFrame> scratch;
        pair.first.setFilePosition(50);
        t.check(refillReverse(pair.first, asset, 20, scratch) == 20, "chunk written");
        t.check(pair.first.filePosition() == 30, "position retreated");
        auto left = drainLeft(*pair.second);
        t.check(left.front() == 49.0f && left.back() == 30.0f, "49 down to 30");
    });

    t.scenario("reverse refill stops at the head of the file", [&] {
        AudioAsset asset = indexAsset(100);
        auto pair = RegionBuffer::create(RegionId::generate(), "x", 100, 48000.0, 2, 4096);
        std::vector<StereoFrame> scratch;
        pair.first.setFilePosition(5);
        t.check(refillReverse(pair.first, asset, 20, scratch) == 5, "only 5 frames before the head");
        t.check(pair.first.filePosition() == 0, "at the head");
        drainLeft(*pair.second);
        t.check(refillReverse(pair.first, asset, 20, scratch) == 20, "silence keeps the consumer fed");
        auto left = drainLeft(*pair.second);
        t.check(left.size() == 20 && left[0] == 0.0f && left[19] == 0.0f, "silent frames");
        t.check(pair.first.filePosition() == 0, "position pinned at 0");
    });

    t.scenario("fade-out capture pads with the last frame", [&] {
        auto pair = RegionBuffer::create(RegionId::generate(), "x", 0, 48000.0, 2, 4096);
        pair.first.write(std::vector<StereoFrame>{{1, 1}, {2, 2}, {3, 3}});
        auto fade = captureFadeout(*pair.second, 5);
        t.check(fade.size() == 5, "padded to count");
        t.check(fade[2].left == 3.0f && fade[4].left == 3.0f, "last frame repeated");
        t.check(captureFadeout(*pair.second, 5).empty(), "empty when nothing is buffered");
        t.check(captureFadeout(*pair.second, 0).empty(), "empty when count is 0");
    });

    t.scenario("fade-in capture reads from the asset", [&] {
        AudioAsset asset = indexAsset(100);
        auto fade = captureFadein(asset, 40, 4);
        t.check(fade.size() == 4 && fade[0].left == 40.0f && fade[3].left == 43.0f, "frames 40..43");
        t.check(captureFadein(asset, 40, 0).empty(), "count 0 is empty");
    });

    t.scenario("realigned position", [&] {
        t.check(realignedPosition(1000, 0, 300) == 700, "more compensation reads earlier");
        t.check(realignedPosition(1000, 300, 0) == 1300, "less compensation reads later");
        t.check(realignedPosition(100, 0, 300) == 0, "saturates at 0");
        t.check(realignedPosition(500, 200, 200) == 500, "unchanged");
    });

    return t.finish();
}
