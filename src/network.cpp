#include "network.hpp"
#include "errors.hpp"

#include <cmath>
#include <queue>
#include <utility>

Network::Network(NetworkSpec spec) : spec_(std::move(spec)) {
    if (spec_.spiceNames.empty()) {
        for (int i = 0; i < spec_.numFixed + spec_.numFree; ++i) {
            spec_.spiceNames.push_back("n" + std::to_string(i));
        }
    }

    validate();
    checkConnectivity();

    // 展平成带标签的元件表：先权重（保持 W1..Wn 顺序），再二极管对
    elements_.reserve(spec_.connections.size() + spec_.diodes.size());
    for (std::size_t k = 0; k < spec_.connections.size(); ++k) {
        const Connection& c = spec_.connections[k];
        elements_.push_back({ElementKind::Weight, c.a, c.b, static_cast<int>(k), 0.0, DiodeParams{}});
    }
    for (const auto& kv : spec_.diodes) {
        elements_.push_back({ElementKind::DiodePair, spec_.numFixed + kv.first, -1, -1,
                             kv.second.anchor, kv.second.params});
    }
}

bool Network::isNonlinear() const {
    for (const auto& kv : spec_.diodes) {
        if (kv.second.params.enabled()) return true;
    }
    return false;
}

void Network::validate() const {
    const int n = numNodes();

    if (spec_.numFixed < 1) {
        throw InvalidTopologyError("network needs at least one fixed node");
    }
    if (spec_.numFree < 1) {
        throw InvalidTopologyError("network needs at least one free node");
    }

    for (std::size_t k = 0; k < spec_.connections.size(); ++k) {
        const Connection& c = spec_.connections[k];
        std::string label = "connection W" + std::to_string(k + 1);
        if (c.a < 0 || c.a >= n || c.b < 0 || c.b >= n) {
            throw InvalidTopologyError(label + " references node out of range [0, " +
                                       std::to_string(n) + ")");
        }
        if (c.a == c.b) {
            throw InvalidTopologyError(label + " connects node " + std::to_string(c.a) +
                                       " to itself");
        }
    }

    for (const auto& kv : spec_.diodes) {
        if (kv.first < 0 || kv.first >= spec_.numFree) {
            throw InvalidTopologyError("diode pair on free index " + std::to_string(kv.first) +
                                       " out of range");
        }
        const DiodeParams& p = kv.second.params;
        if (!(p.Is >= 0.0) || !(p.N > 0.0) || !(p.VT > 0.0) || !std::isfinite(kv.second.anchor)) {
            throw InvalidTopologyError("invalid diode parameters on free index " +
                                       std::to_string(kv.first));
        }
    }

    auto checkOutput = [&](int node, const char* which) {
        if (node < 0 || node >= n) {
            throw InvalidTopologyError(std::string("output node ") + which + " (" +
                                       std::to_string(node) + ") out of range");
        }
    };
    checkOutput(spec_.outputPos, "+");
    checkOutput(spec_.outputNeg, "-");
    if (spec_.outputPos == spec_.outputNeg) {
        throw InvalidTopologyError("output nodes must be distinct");
    }

    if (static_cast<int>(spec_.spiceNames.size()) != n) {
        throw InvalidTopologyError("expected " + std::to_string(n) + " node names, got " +
                                   std::to_string(spec_.spiceNames.size()));
    }
}

// 每个自由节点必须能经连接走到固定节点，或者自带启用的二极管对（接参考轨）
// 否则 KCL 矩阵奇异；Is = 0 的二极管对不算通路
void Network::checkConnectivity() const {
    const int n = numNodes();
    std::vector<std::vector<int>> adj(n);
    for (const auto& c : spec_.connections) {
        adj[c.a].push_back(c.b);
        adj[c.b].push_back(c.a);
    }

    std::vector<bool> anchored(n, false);
    std::queue<int> q;
    for (int i = 0; i < spec_.numFixed; ++i) {
        anchored[i] = true;
        q.push(i);
    }
    for (const auto& kv : spec_.diodes) {
        int node = spec_.numFixed + kv.first;
        if (!anchored[node] && kv.second.params.enabled()) {
            anchored[node] = true;
            q.push(node);
        }
    }

    while (!q.empty()) {
        int u = q.front();
        q.pop();
        for (int v : adj[u]) {
            if (!anchored[v]) {
                anchored[v] = true;
                q.push(v);
            }
        }
    }

    for (int i = spec_.numFixed; i < n; ++i) {
        if (!anchored[i]) {
            throw InvalidTopologyError("free node " + std::to_string(i) + " (" +
                                       spec_.spiceNames[i] +
                                       ") has no path to a fixed node");
        }
    }
}
