#include "PdcGraph.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

// ============================================================================
// Graph construction
// ============================================================================

PdcNodeId PdcGraph::addNode(const std::string &name, size_t numInputs, double latencySamples) {
    PdcNode n;
    n.id = mNextId++;
    n.name = name;
    n.latency = latencySamples;
    n.inputs.assign(numInputs, PdcSource::zero());

    mIndex[n.id] = mNodes.size();
    mNodes.push_back(std::move(n));
    return mNodes.back().id;
}

const PdcNode &PdcGraph::node(PdcNodeId id) const {
    auto it = mIndex.find(id);
    if (it == mIndex.end())
        throw std::out_of_range("PdcGraph: unknown node id " + std::to_string(id));
    return mNodes[it->second];
}

PdcNode &PdcGraph::nodeMut(PdcNodeId id) {
    auto it = mIndex.find(id);
    if (it == mIndex.end())
        throw std::out_of_range("PdcGraph: unknown node id " + std::to_string(id));
    return mNodes[it->second];
}

void PdcGraph::setLatency(PdcNodeId id, double latencySamples) {
    nodeMut(id).latency = latencySamples;
}

void PdcGraph::connect(const PdcSource &src, PdcNodeId dst, size_t port) {
    if (src.isLocal() && !contains(src.node))
        throw std::out_of_range("PdcGraph: source node " + std::to_string(src.node) + " not in graph");

    PdcNode &n = nodeMut(dst);
    if (port >= n.inputs.size())
        throw std::out_of_range("PdcGraph: node '" + n.name + "' has no input port " + std::to_string(port));
    n.inputs[port] = src;
}

void PdcGraph::setOutputCount(size_t count) {
    mOutputs.resize(count, PdcSource::zero());
}

void PdcGraph::connectOutput(const PdcSource &src, size_t channel) {
    if (src.isLocal() && !contains(src.node))
        throw std::out_of_range("PdcGraph: source node " + std::to_string(src.node) + " not in graph");
    if (channel >= mOutputs.size())
        throw std::out_of_range("PdcGraph: no output channel " + std::to_string(channel));
    mOutputs[channel] = src;
}

// ============================================================================
// Topological order (Kahn)
// ============================================================================

std::vector<PdcNodeId> topologicalOrder(const PdcGraph &graph, bool *cycleDetected) {
    const auto &nodes = graph.nodes();
    const size_t count = nodes.size();

    std::unordered_map<PdcNodeId, size_t> inDegree;
    std::unordered_map<PdcNodeId, std::vector<PdcNodeId>> dependents;
    inDegree.reserve(count);
    dependents.reserve(count);

    for (const auto &n : nodes) {
        inDegree[n.id] = 0;
        dependents[n.id];
    }

    for (const auto &n : nodes) {
        for (const auto &src : n.inputs) {
            if (src.isLocal() && graph.contains(src.node)) {
                dependents[src.node].push_back(n.id);
                inDegree[n.id] += 1;
            }
        }
    }

    // Seed in insertion order so the result is deterministic.
    std::deque<PdcNodeId> queue;
    for (const auto &n : nodes) {
        if (inDegree[n.id] == 0) queue.push_back(n.id);
    }

    std::vector<PdcNodeId> order;
    order.reserve(count);

    while (!queue.empty()) {
        PdcNodeId id = queue.front();
        queue.pop_front();
        order.push_back(id);

        for (PdcNodeId dep : dependents[id]) {
            size_t &deg = inDegree[dep];
            if (deg > 0) deg -= 1;
            if (deg == 0) queue.push_back(dep);
        }
    }

    bool cycle = order.size() < count;
    if (cycle) {
        std::unordered_set<PdcNodeId> placed(order.begin(), order.end());
        size_t appended = 0;
        for (const auto &n : nodes) {
            if (placed.count(n.id) == 0) {
                order.push_back(n.id);
                appended++;
            }
        }
        std::cerr << "[PDC] WARNING: signal graph contains a cycle: "
                  << appended << " node(s) appended in insertion order." << std::endl;
    }

    if (cycleDetected) *cycleDetected = cycle;
    return order;
}

// ============================================================================
// Arrival-time analysis
// ============================================================================

static size_t roundedLatency(double latency) {
    if (!std::isfinite(latency) || latency <= 0.0) return 0;
    return static_cast<size_t>(std::llround(latency));
}

PdcAnalysis analyzePdc(const PdcGraph &graph) {
    PdcAnalysis result;

    if (graph.nodes().empty()) return result;

    // Query every node once.
    bool anyLatency = false;
    for (const auto &n : graph.nodes()) {
        size_t lat = roundedLatency(n.latency);
        result.nodeLatencies[n.id] = lat;
        if (lat > 0) anyLatency = true;
    }

    if (!anyLatency) return result;

    std::vector<PdcNodeId> order = topologicalOrder(graph, &result.cycleDetected);

    std::unordered_map<PdcNodeId, size_t> arrival;
    arrival.reserve(order.size());

    auto sourceArrival = [&](PdcNodeId src) -> size_t {
        auto a = arrival.find(src);
        auto l = result.nodeLatencies.find(src);
        size_t at = (a != arrival.end()) ? a->second : 0;
        size_t lat = (l != result.nodeLatencies.end()) ? l->second : 0;
        return at + lat;
    };

    for (PdcNodeId id : order) {
        size_t maxArrival = 0;
        for (const auto &src : graph.node(id).inputs) {
            if (src.isLocal()) maxArrival = std::max(maxArrival, sourceArrival(src.node));
        }
        arrival[id] = maxArrival;
    }

    // Fan-in points: delay the early inputs up to the latest one.
    for (PdcNodeId id : order) {
        const auto &inputs = graph.node(id).inputs;
        if (inputs.size() < 2) continue;

        size_t maxInput = 0;
        for (const auto &src : inputs) {
            if (src.isLocal()) maxInput = std::max(maxInput, sourceArrival(src.node));
        }

        for (size_t port = 0; port < inputs.size(); port++) {
            const auto &src = inputs[port];
            if (!src.isLocal()) continue;
            size_t here = sourceArrival(src.node);
            if (here < maxInput) {
                result.compensations.push_back(PdcCompensation{id, port, maxInput - here});
            }
        }
    }

    const size_t numOutputs = graph.outputs();

    size_t maxOutput = 0;
    for (size_t ch = 0; ch < numOutputs; ch++) {
        const auto &src = graph.outputSource(ch);
        if (src.isLocal()) maxOutput = std::max(maxOutput, sourceArrival(src.node));
    }

    if (numOutputs > 1) {
        for (size_t ch = 0; ch < numOutputs; ch++) {
            const auto &src = graph.outputSource(ch);
            if (!src.isLocal()) continue;
            size_t here = sourceArrival(src.node);
            if (here < maxOutput) {
                result.outputCompensations.push_back(PdcOutputCompensation{ch, maxOutput - here});
            }
        }
    }

    result.totalLatency = maxOutput;
    return result;
}
