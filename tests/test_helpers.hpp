#pragma once

#include <Eigen/Dense>
#include <string>

#include "network.hpp"

namespace test_helpers {

// 旧版三输入网络：3 钳位 + h1 h2 yp yn，与 LTspice 的参考值对照
inline Network makeLegacyNetwork() {
    NetworkSpec s;
    s.numFixed = 3;
    s.numFree = 4;
    s.connections = {{0, 3}, {0, 4}, {1, 3}, {1, 4}, {2, 3},
                     {2, 4}, {3, 5}, {3, 6}, {4, 5}, {4, 6}};
    s.diodes[0] = DiodeShunt{};
    s.diodes[1] = DiodeShunt{};
    s.outputPos = 5;
    s.outputNeg = 6;
    return Network(s);
}

// 1 V 钳位节点经一个电阻接到带二极管对（参考轨 0 V）的自由节点
//   输出 = V(free) - V(fixed)
inline Network makeSingleWeightNetwork() {
    NetworkSpec s;
    s.numFixed = 1;
    s.numFree = 1;
    s.connections = {{0, 1}};
    DiodeShunt d;
    d.anchor = 0.0;
    s.diodes[0] = d;
    s.outputPos = 1;
    s.outputNeg = 0;
    return Network(s);
}

inline Eigen::VectorXd vec(std::initializer_list<double> values) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double x : values) v(i++) = x;
    return v;
}

inline Eigen::VectorXd uniformWeights(int n, double r) {
    return Eigen::VectorXd::Constant(n, r);
}

std::string tempPath(const std::string& name);

}  // namespace test_helpers
