#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

// ─────────────────────────────────────────────────────────────────────────────
// Signal graph model used for plugin delay compensation (PDC)
// ─────────────────────────────────────────────────────────────────────────────
// Each node reports a processing latency in samples and has a fixed number of
// input ports. A port is fed either by another node in the graph (Local), by
// a graph-level input channel (GlobalInput), or by nothing (Zero). The latter
// two never need compensation: they arrive at time 0.

using PdcNodeId = uint64_t;

enum class PdcSourceKind {
    Local,        // Output `channel` of node `node`
    GlobalInput,  // Graph input channel `channel`
    Zero          // Unconnected / silent
};

struct PdcSource {
    PdcSourceKind kind = PdcSourceKind::Zero;
    PdcNodeId     node = 0;
    size_t        channel = 0;

    static PdcSource local(PdcNodeId node, size_t outputPort = 0) {
        return PdcSource{PdcSourceKind::Local, node, outputPort};
    }
    static PdcSource globalInput(size_t channel) {
        return PdcSource{PdcSourceKind::GlobalInput, 0, channel};
    }
    static PdcSource zero() { return PdcSource{}; }

    bool isLocal() const { return kind == PdcSourceKind::Local; }
};

struct PdcNode {
    PdcNodeId   id = 0;
    std::string name;
    double      latency = 0.0;           // Reported latency (samples, may be fractional)
    std::vector<PdcSource> inputs;       // One entry per input port
};

class PdcGraph {
public:
    /// Add a node with `numInputs` unconnected ports. Returns its id.
    PdcNodeId addNode(const std::string &name, size_t numInputs, double latencySamples = 0.0);

    /// Change the latency a node reports. Throws std::out_of_range on unknown id.
    void setLatency(PdcNodeId id, double latencySamples);

    /// Feed input `port` of `dst` from `src`. Throws std::out_of_range when the
    /// destination or a Local source is not part of this graph.
    void connect(const PdcSource &src, PdcNodeId dst, size_t port);

    void setOutputCount(size_t count);
    void connectOutput(const PdcSource &src, size_t channel);

    bool contains(PdcNodeId id) const { return mIndex.count(id) != 0; }
    const PdcNode &node(PdcNodeId id) const;
    const std::vector<PdcNode> &nodes() const { return mNodes; }

    size_t inputsIn(PdcNodeId id) const { return node(id).inputs.size(); }
    const PdcSource &source(PdcNodeId id, size_t port) const { return node(id).inputs.at(port); }

    size_t outputs() const { return mOutputs.size(); }
    const PdcSource &outputSource(size_t channel) const { return mOutputs.at(channel); }

private:
    PdcNode &nodeMut(PdcNodeId id);

    std::vector<PdcNode> mNodes;
    std::unordered_map<PdcNodeId, size_t> mIndex;
    std::vector<PdcSource> mOutputs;
    PdcNodeId mNextId = 1;
};

// ─────────────────────────────────────────────────────────────────────────────
// Analysis result
// ─────────────────────────────────────────────────────────────────────────────

struct PdcCompensation {
    PdcNodeId node = 0;
    size_t    inputPort = 0;
    size_t    delaySamples = 0;
};

struct PdcOutputCompensation {
    size_t outputChannel = 0;
    size_t delaySamples = 0;
};

struct PdcAnalysis {
    std::vector<PdcCompensation>       compensations;
    std::vector<PdcOutputCompensation> outputCompensations;
    size_t                             totalLatency = 0;
    std::map<PdcNodeId, size_t>        nodeLatencies;
    bool                               cycleDetected = false;
};

/// Kahn topological order over Local edges between nodes of this graph.
/// Nodes left over by a cycle are appended in insertion order and
/// `cycleDetected` (if given) is set.
std::vector<PdcNodeId> topologicalOrder(const PdcGraph &graph, bool *cycleDetected = nullptr);

/// Arrival-time analysis: per-input and per-output compensation delays plus
/// the total graph latency. Returns an empty result (latencies only) when no
/// node reports latency.
PdcAnalysis analyzePdc(const PdcGraph &graph);
