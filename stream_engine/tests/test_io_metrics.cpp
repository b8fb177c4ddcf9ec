// I/O metrics counters and the sliding-window throughput tracker.

#include <chrono>

#include "IOMetrics.hpp"
#include "TestSupport.hpp"

int main() {
    TestRunner t("io_metrics");

    t.scenario("fresh metrics", [&] {
        IOMetrics m;
        IOMetricsSnapshot s = m.snapshot();
        t.check(s.bytesRead == 0 && s.bytesWritten == 0, "no bytes");
        t.check(s.cacheHitRate == 1.0, "hit rate is 1.0 before any lookup");
        t.check(s.avgReadSize() == 0.0 && s.avgWriteSize() == 0.0, "averages are 0 with no ops");
        t.check(m.readRate() == 0.0, "no read rate");
    });

    t.scenario("counters accumulate", [&] {
        IOMetrics m;
        m.recordRead(1000);
        m.recordRead(3000);
        m.recordWrite(512);
        m.recordLowBuffer();
        m.recordLowBuffer();
        IOMetricsSnapshot s = m.snapshot();
        t.check(s.bytesRead == 4000 && s.readOps == 2, "reads");
        t.check(s.bytesWritten == 512 && s.writeOps == 1, "writes");
        t.check(s.avgReadSize() == 2000.0, "average read");
        t.check(s.avgWriteSize() == 512.0, "average write");
        t.check(s.lowBufferEvents == 2, "low-buffer events");
        t.check(s.readRate > 0.0, "read rate updated");
    });

    t.scenario("cache hit rate", [&] {
        IOMetrics m;
        m.recordCacheHit();
        m.recordCacheHit();
        m.recordCacheHit();
        m.recordCacheMiss();
        t.check(std::fabs(m.cacheHitRate() - 0.75) < 1e-12, "3 hits of 4 lookups");
    });

    t.scenario("reset zeroes everything", [&] {
        IOMetrics m;
        m.recordRead(10);
        m.recordWrite(10);
        m.recordCacheMiss();
        m.recordLowBuffer();
        m.reset();
        IOMetricsSnapshot s = m.snapshot();
        t.check(s.bytesRead == 0 && s.readOps == 0 && s.bytesWritten == 0 && s.writeOps == 0, "io counters");
        t.check(s.cacheMisses == 0 && s.lowBufferEvents == 0, "event counters");
        t.check(s.readRate == 0.0, "read rate");
    });

    t.scenario("throughput divides by the window for bursts", [&] {
        using namespace std::chrono;
        ThroughputTracker tr(milliseconds(1000));
        const auto t0 = ThroughputTracker::Clock::now();
        tr.record(1000, t0);
        tr.record(1000, t0 + milliseconds(5));
        t.check(std::fabs(tr.rate() - 2000.0) < 1e-6, "2000 bytes over the 1 s window");
    });

    t.scenario("throughput divides by the sample span when it is wide enough", [&] {
        using namespace std::chrono;
        ThroughputTracker tr(milliseconds(1000));
        const auto t0 = ThroughputTracker::Clock::now();
        tr.record(1000, t0);
        tr.record(1000, t0 + milliseconds(500));
        t.check(std::fabs(tr.rate() - 4000.0) < 1.0, "2000 bytes over 0.5 s");
    });

    t.scenario("old samples fall out of the window", [&] {
        using namespace std::chrono;
        ThroughputTracker tr(milliseconds(1000));
        const auto t0 = ThroughputTracker::Clock::now();
        tr.record(1000000, t0);
        tr.record(100, t0 + milliseconds(2000));
        t.check(std::fabs(tr.rate() - 100.0) < 1e-6, "only the recent sample counts");
        tr.clear();
        t.check(tr.rate() == 0.0, "clear empties");
    });

    return t.finish();
}
