#pragma once

#include <Eigen/Dense>

#include "network.hpp"
#include "solver.hpp"

struct NewtonOptions {
    int    maxIterations = 100;     // Newton 迭代上限
    double absTol        = 1e-12;   // KCL 残差容差 ‖F‖∞ (A)
    Solver::LinearSolver linearSolver = Solver::LinearSolver::DirectLU;
};

struct SolveOptions {
    Eigen::VectorXd initialGuess;   // 空 = 用纯电阻网络的线性解作初值
    Eigen::VectorXd injected;       // 空 = 不注入；否则长度 numFree，流入节点为正
    NewtonOptions newton;
};

struct EquilibriumResult {
    Eigen::VectorXd freeVoltages;
    int    iterations = 0;          // Newton 迭代次数（纯线性网络为 0）
    double residual   = 0.0;        // 最终 ‖F‖∞
};

// 求 KCL 平衡点：对每个自由节点，流入电流之和为 0
// 不收敛时抛 ConvergenceError
EquilibriumResult solveEquilibrium(const Network& net,
                                   const Eigen::VectorXd& fixedVoltages,
                                   const Eigen::VectorXd& weights,
                                   const SolveOptions& opts = SolveOptions());

// 忽略二极管的线性预解（每个启用的二极管节点额外挂 gmin 到参考轨，保证非奇异）
Eigen::VectorXd resistiveInitialGuess(const Network& net,
                                      const Eigen::VectorXd& fixedVoltages,
                                      const Eigen::VectorXd& weights);

// 在 vFree 处组装残差 F（流入为正）和 G = -dF/dv
// Newton 步：G dv = F
void assembleKcl(const Network& net,
                 const Eigen::VectorXd& fixedVoltages,
                 const Eigen::VectorXd& weights,
                 const Eigen::VectorXd& vFree,
                 const Eigen::VectorXd& injected,
                 bool includeDiodes,
                 Eigen::MatrixXd& G,
                 Eigen::VectorXd& F);

// 拼出全部节点电压：[fixed..., free...]
Eigen::VectorXd fullNodeVoltages(const Network& net,
                                 const Eigen::VectorXd& fixedVoltages,
                                 const Eigen::VectorXd& freeVoltages);
