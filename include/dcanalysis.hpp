#pragma once

#include <Eigen/Dense>
#include <algorithm>

#include "solver.hpp"

class Circuit;

struct DcOptions {
    Solver::LinearSolver linearSolver = Solver::LinearSolver::DirectLU;
    int    rampSteps      = 10;     // 电源从 0 ~ 1 分几步 ramp
    int    maxNewtonIters = 100;    // 每个 ramp 步最多 Newton 迭代次数
    double tol            = 1e-9;   // 完整 Newton 步的 ‖dx‖∞ 阈值
};

// DC 工作点；线性电路直接解，非线性电路走 ramp + 阻尼 Newton
// 线性方程奇异或最后一个 ramp 步不收敛时抛 ConvergenceError
Eigen::VectorXd dcSolve(const Circuit& ckt, const DcOptions& opts = DcOptions());

struct ConvStatus {
    Eigen::VectorXd xNext;
    double alphaNext;
    double gminNext;
    double error;
    bool converged;
};

// 阻尼 + gmin 调度：每步限制节点电压变化，误差变差时收紧、变好时放开
class ConvController {
private:
    double alphaMin, alphaMax;
    double maxVoltageStep;
    double gminHighBase, gminLowBase, gminAbsMax;

    double fastConvRatio;
    double slowConvRatio;
public:
    ConvController();

    ConvStatus update(
        const Eigen::VectorXd& x,
        const Eigen::VectorXd& xRaw,
        int    numNodeEqs,
        double prevErr,
        int    iter,
        double alphaCurrent,
        double gminCurrent,
        double rampScale,
        double tol
    ) const;

    // 给定 ramp 进度，计算当前步的基础 gmin（对数插值）
    double baseGmin(double rampScale) const;

    double initialAlpha() const { return 1.0; }
    double maxGmin() const { return gminAbsMax; }
};
