#pragma once

#include <Eigen/Dense>

#include "equilibrium.hpp"
#include "network.hpp"

enum class NudgeMode {
    OneSided,    // 一次 nudge 求解，按步数奇偶翻转 beta
    Symmetric    // +beta / -beta 两次求解，消掉一阶偏差
};

struct GradientOptions {
    NudgeMode mode = NudgeMode::OneSided;
    double maxBranchDeviation = 0.5;  // nudge 相偏离自由相超过它 (V) 视为跳到了另一个平衡分支
    NewtonOptions newton;
    Eigen::VectorXd freeGuess;        // 自由相初值，空 = 电阻网络预解
};

struct GradientResult {
    double prediction = 0.0;          // V(outputPos) - V(outputNeg)
    double loss = 0.0;                // 0.5 * (target - prediction)^2
    Eigen::VectorXd gradient;         // dLoss/dG，每个权重一项
    Eigen::VectorXd freeNodes;        // 自由相全部节点电压
    Eigen::VectorXd nudgeNodes;       // nudge 相（对称模式下为 +beta 相）全部节点电压

    bool   branchMismatch = false;
    double maxDeviation = 0.0;        // max |V_nudge - V_free|，只看自由节点

    int freeIterations = 0;
    int nudgeIterations = 0;          // 对称模式为两次之和
    double effectiveBeta = 0.0;       // 实际使用的 beta（单边模式下含奇偶符号）
};

// 在 outputPos 注入 +beta*error，在 outputNeg 注入 -beta*error；钳位节点不注入
Eigen::VectorXd nudgeCurrents(const Network& net, double beta, double error);

// 自由相的差分输出
double predict(const Network& net, const Eigen::VectorXd& inputs,
               const Eigen::VectorXd& weights,
               const NewtonOptions& newton = NewtonOptions());

// EqProp 梯度估计
//   单边：g_i = ((dV_nudge)^2 - (dV_free)^2) / (2 beta)，stepParity 为奇数时 beta 取反
//   对称：g_i = ((dV_+)^2 - (dV_-)^2) / (4 beta)
// 任一相不收敛时抛 ConvergenceError，phase() 指明阶段
GradientResult computeGradient(const Network& net,
                               const Eigen::VectorXd& inputs,
                               const Eigen::VectorXd& weights,
                               double target,
                               double beta,
                               long stepParity = 0,
                               const GradientOptions& opts = GradientOptions());

// 电导空间的中心差分 dLoss/dG，用来核对 EqProp 的估计
Eigen::VectorXd finiteDifferenceGradient(const Network& net,
                                         const Eigen::VectorXd& inputs,
                                         const Eigen::VectorXd& weights,
                                         double target,
                                         double eps = 1e-9,
                                         const NewtonOptions& newton = NewtonOptions());
