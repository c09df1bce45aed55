#pragma once

#include <map>
#include <string>
#include <vector>

#include "diode.hpp"
#include "weights.hpp"

// 一个权重连接（可变电阻），电流方向约定 a -> b
struct Connection {
    int a;
    int b;
};

// 自由节点到参考轨的反并联二极管对
struct DiodeShunt {
    double anchor = 2.5;         // 参考轨电压 (V)
    DiodeParams params = kBat42;
};

// 构建 Network 用的原始描述，字段可随意填写，校验在 Network 构造时做
struct NetworkSpec {
    int numFixed = 0;
    int numFree  = 0;
    std::vector<Connection> connections;
    std::map<int, DiodeShunt> diodes;    // key: 自由节点下标（0 起，指 free 数组）
    int outputPos = -1;                  // 全局节点号
    int outputNeg = -1;
    std::vector<std::string> spiceNames; // 为空时自动命名 n0, n1, ...
    WeightParams weightParams;
};

enum class ElementKind {
    Weight,
    DiodePair
};

// 扁平元件表中的一项；求解器按 kind 分派
struct NetworkElement {
    ElementKind kind;
    int nodeA;         // Weight: 端点 a；DiodePair: 节点（全局号）
    int nodeB;         // Weight: 端点 b；DiodePair: -1（参考轨）
    int weightIndex;   // Weight: 权重序号；DiodePair: -1
    double anchor;     // DiodePair 的参考轨电压
    DiodeParams diode;
};

// 不可变的网络拓扑
//   全局节点编号：[0, numFixed) 为钳位节点，[numFixed, numFixed+numFree) 为自由节点
class Network {
public:
    explicit Network(NetworkSpec spec);

    int numFixed() const { return spec_.numFixed; }
    int numFree() const { return spec_.numFree; }
    int numNodes() const { return spec_.numFixed + spec_.numFree; }
    int numWeights() const { return static_cast<int>(spec_.connections.size()); }

    const std::vector<Connection>& connections() const { return spec_.connections; }
    const std::map<int, DiodeShunt>& diodes() const { return spec_.diodes; }
    const std::vector<NetworkElement>& elements() const { return elements_; }

    int outputPos() const { return spec_.outputPos; }
    int outputNeg() const { return spec_.outputNeg; }

    const std::vector<std::string>& spiceNames() const { return spec_.spiceNames; }
    const std::string& nodeName(int node) const { return spec_.spiceNames[node]; }
    const WeightParams& weightParams() const { return spec_.weightParams; }

    bool isFixed(int node) const { return node < spec_.numFixed; }
    // 全局号 -> free 数组下标，固定节点返回 -1
    int freeIndex(int node) const { return isFixed(node) ? -1 : node - spec_.numFixed; }

    // 至少有一个 Is > 0 的二极管对时为非线性
    bool isNonlinear() const;

private:
    NetworkSpec spec_;
    std::vector<NetworkElement> elements_;

    void validate() const;
    void checkConnectivity() const;
};
