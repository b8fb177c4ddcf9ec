// PdcManager latency aggregation and snapshot publication.

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "PdcManager.hpp"
#include "TestSupport.hpp"

int main() {
    TestRunner t("pdc_manager");

    t.scenario("compensation aligns every channel to the slowest", [&] {
        PdcManager m(3, 0);
        m.setChannelLatency(0, 100);
        m.setChannelLatency(1, 300);
        m.setChannelLatency(2, 200);
        t.check(m.maxLatency() == 300, "max latency");
        t.check(m.channelCompensation(0) == 200, "channel 0");
        t.check(m.channelCompensation(1) == 0, "channel 1");
        t.check(m.channelCompensation(2) == 100, "channel 2");
    });

    t.scenario("setters return the new compensation", [&] {
        PdcManager m(2, 1);
        t.check(m.setChannelLatency(0, 64) == 0, "only latency is the max");
        t.check(m.setReturnLatency(0, 32) == 32, "return bus behind by 32");
        t.check(m.channelCompensation(1) == 64, "idle channel delayed fully");
    });

    t.scenario("returns take part in the maximum", [&] {
        PdcManager m(1, 1);
        m.setChannelLatency(0, 100);
        m.setReturnLatency(0, 400);
        t.check(m.maxLatency() == 400, "return sets the max");
        t.check(m.channelCompensation(0) == 300, "channel catches up");
        t.check(m.returnCompensation(0) == 0, "return needs nothing");
    });

    t.scenario("latency above the ceiling throws and changes nothing", [&] {
        PdcManager m(2, 0);
        m.setChannelLatency(0, 1000);
        bool threw = false;
        try {
            m.setChannelLatency(1, kDefaultMaxLatencySamples + 1);
        } catch (const LatencyCeilingError&) {
            threw = true;
        }
        t.check(threw, "480001 rejected");
        t.check(m.maxLatency() == 1000, "state untouched");
        t.check(m.setChannelLatency(1, kDefaultMaxLatencySamples) == 0, "exactly the ceiling is allowed");

        m.setMaxAllowedLatency(128);
        bool threwReturn = false;
        try {
            m.setReturnLatency(0, 129);
        } catch (const LatencyCeilingError&) {
            threwReturn = true;
        }
        t.check(threwReturn, "lowered ceiling applies to returns");
    });

    t.scenario("out-of-range queries are 0 and setters grow the table", [&] {
        PdcManager m(1, 0);
        t.check(m.channelCompensation(5) == 0, "unknown channel");
        t.check(m.returnCompensation(0) == 0, "unknown return");
        m.setChannelLatency(4, 50);
        t.check(m.snapshot()->channelLatencies.size() == 5, "grown to 5");
        t.check(m.channelCompensation(0) == 50, "existing channel compensated");
    });

    t.scenario("remove, resize and clear", [&] {
        PdcManager m(2, 2);
        m.setChannelLatency(0, 10);
        m.setChannelLatency(1, 90);
        m.setReturnLatency(1, 40);
        m.removeChannel(1);
        t.check(m.maxLatency() == 40, "max recomputed after removal");
        m.removeReturn(1);
        t.check(m.maxLatency() == 10, "return removed");

        m.resize(4, 1);
        PdcSnapshot s = m.snapshot();
        t.check(s->channelLatencies.size() == 4 && s->returnLatencies.size() == 1, "resized");
        t.check(s->channelLatencies[0] == 10, "existing value kept");

        m.clear();
        s = m.snapshot();
        t.check(s->maxLatency == 0 && s->channelLatencies.size() == 4, "cleared, sizes kept");
        t.check(m.channelCompensation(0) == 0, "compensation zero");
    });

    t.scenario("snapshots are immutable", [&] {
        PdcManager m(2, 0);
        m.setChannelLatency(0, 100);
        PdcSnapshot before = m.snapshot();
        m.setChannelLatency(1, 500);
        t.check(before->maxLatency == 100, "old snapshot unchanged");
        t.check(m.snapshot()->maxLatency == 500, "new snapshot published");
    });

    t.scenario("enable flag", [&] {
        PdcManager m(1, 0);
        t.check(m.isEnabled(), "enabled by default");
        m.setEnabled(false);
        t.check(!m.isEnabled(), "disabled");
    });

    t.scenario("concurrent writers never lose an update", [&] {
        PdcManager m(8, 0);
        std::vector<std::thread> writers;
        for (size_t w = 0; w < 8; ++w) {
            writers.emplace_back([&m, w] {
                for (size_t i = 1; i <= 200; ++i) m.setChannelLatency(w, i * (w + 1));
            });
        }
        std::atomic<bool> done{false};
        std::atomic<bool> consistent{true};
        std::thread reader([&] {
            while (!done.load()) {
                PdcSnapshot s = m.snapshot();
                for (size_t i = 0; i < s->channelLatencies.size(); ++i) {
                    if (s->channelLatencies[i] + s->channelCompensations[i] != s->maxLatency) consistent = false;
                }
            }
        });
        for (auto& th : writers) th.join();
        done = true;
        reader.join();

        PdcSnapshot s = m.snapshot();
        bool allFinal = true;
        for (size_t w = 0; w < 8; ++w) {
            if (s->channelLatencies[w] != 200 * (w + 1)) allFinal = false;
        }
        t.check(allFinal, "every writer's last value present");
        t.check(s->maxLatency == 1600, "max of the final values");
        t.check(consistent, "readers always saw a consistent table");
    });

    return t.finish();
}
