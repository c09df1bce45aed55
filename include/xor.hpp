#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

#include "network.hpp"
#include "training.hpp"

// 偏置轨
constexpr double kVLow  = 1.0;   // 低偏置输入
constexpr double kVHigh = 4.0;   // 高偏置输入
constexpr double kVMid  = 2.5;   // 二极管参考轨

// 6 输入（互补对 + 两个偏置）、2 隐层、2 输出，16 个权重
//   全局节点：0=x1 1=x1c 2=x2 3=x2c 4=vlow 5=vhigh 6=h1 7=h2 8=yp 9=yn
Network makeXorNetwork();

// [x1, 5-x1, x2, 5-x2, V_LOW, V_HIGH]
Eigen::VectorXd makeXorInputs(double x1, double x2);

// (0,0)->0, (0,1)->0.3, (1,0)->0.3, (1,1)->0
Dataset xorDataset();

struct XorCheck {
    std::string label;
    double prediction = 0.0;
    double target = 0.0;
    bool pass = false;
};

struct XorReport {
    std::vector<XorCheck> patterns;
    bool pass = false;
};

// target > 0.1 的样本要求 pred > threshold，其余要求 |pred| < threshold
XorReport verifyXor(const Network& net, const Eigen::VectorXd& weights,
                    double threshold = 0.1);
