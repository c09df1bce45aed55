#include "gradient.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

using Eigen::VectorXd;

namespace {

double outputOf(const Network& net, const VectorXd& nodes) {
    return nodes(net.outputPos()) - nodes(net.outputNeg());
}

void requireOutputs(const Network& net) {
    if (net.outputPos() < 0 || net.outputNeg() < 0) {
        throw std::invalid_argument("network has no output pair");
    }
}

// 求解并把异常标上阶段
EquilibriumResult solvePhase(const Network& net, const VectorXd& inputs,
                             const VectorXd& weights, const SolveOptions& so,
                             SolvePhase phase) {
    try {
        return solveEquilibrium(net, inputs, weights, so);
    } catch (const ConvergenceError& e) {
        throw e.withPhase(phase);
    }
}

double branchVoltage(const VectorXd& nodes, const Connection& c) {
    return nodes(c.a) - nodes(c.b);
}

}  // namespace

VectorXd nudgeCurrents(const Network& net, double beta, double error) {
    VectorXd inj = VectorXd::Zero(net.numFree());
    int p = net.freeIndex(net.outputPos());
    int m = net.freeIndex(net.outputNeg());
    if (p >= 0) inj(p) += beta * error;
    if (m >= 0) inj(m) -= beta * error;
    return inj;
}

double predict(const Network& net, const VectorXd& inputs, const VectorXd& weights,
               const NewtonOptions& newton) {
    requireOutputs(net);
    SolveOptions so;
    so.newton = newton;
    EquilibriumResult r = solvePhase(net, inputs, weights, so, SolvePhase::Free);
    return outputOf(net, fullNodeVoltages(net, inputs, r.freeVoltages));
}

GradientResult computeGradient(const Network& net, const VectorXd& inputs,
                               const VectorXd& weights, double target, double beta,
                               long stepParity, const GradientOptions& opts) {
    requireOutputs(net);
    if (!(beta > 0.0) || !std::isfinite(beta)) {
        throw std::invalid_argument("beta must be positive and finite");
    }

    GradientResult out;

    // 自由相
    SolveOptions so;
    so.newton = opts.newton;
    so.initialGuess = opts.freeGuess;
    EquilibriumResult free = solvePhase(net, inputs, weights, so, SolvePhase::Free);
    out.freeIterations = free.iterations;
    out.freeNodes = fullNodeVoltages(net, inputs, free.freeVoltages);
    out.prediction = outputOf(net, out.freeNodes);

    double error = target - out.prediction;
    out.loss = 0.5 * error * error;

    // nudge 相从自由相热启动
    auto nudged = [&](double b, SolvePhase phase) {
        SolveOptions ns;
        ns.newton = opts.newton;
        ns.initialGuess = free.freeVoltages;
        ns.injected = nudgeCurrents(net, b, error);
        EquilibriumResult r = solvePhase(net, inputs, weights, ns, phase);
        out.nudgeIterations += r.iterations;
        return r.freeVoltages;
    };

    auto deviation = [&](const VectorXd& vFree) {
        return (vFree - free.freeVoltages).lpNorm<Eigen::Infinity>();
    };

    const auto& conns = net.connections();
    out.gradient.resize(net.numWeights());

    if (opts.mode == NudgeMode::Symmetric) {
        out.effectiveBeta = beta;
        VectorXd plus  = nudged(beta, SolvePhase::NudgePositive);
        VectorXd minus = nudged(-beta, SolvePhase::NudgeNegative);
        out.maxDeviation = std::max(deviation(plus), deviation(minus));

        out.nudgeNodes = fullNodeVoltages(net, inputs, plus);
        VectorXd minusNodes = fullNodeVoltages(net, inputs, minus);
        for (int i = 0; i < net.numWeights(); ++i) {
            double dp = branchVoltage(out.nudgeNodes, conns[i]);
            double dm = branchVoltage(minusNodes, conns[i]);
            out.gradient(i) = (dp * dp - dm * dm) / (4.0 * beta);
        }
    } else {
        // 奇数步反向 nudge，相邻两步的一阶偏差互相抵消
        double b = (stepParity % 2 != 0) ? -beta : beta;
        out.effectiveBeta = b;
        VectorXd v = nudged(b, b > 0 ? SolvePhase::NudgePositive : SolvePhase::NudgeNegative);
        out.maxDeviation = deviation(v);

        out.nudgeNodes = fullNodeVoltages(net, inputs, v);
        for (int i = 0; i < net.numWeights(); ++i) {
            double dn = branchVoltage(out.nudgeNodes, conns[i]);
            double df = branchVoltage(out.freeNodes, conns[i]);
            out.gradient(i) = (dn * dn - df * df) / (2.0 * b);
        }
    }

    out.branchMismatch = out.maxDeviation > opts.maxBranchDeviation;
    return out;
}

VectorXd finiteDifferenceGradient(const Network& net, const VectorXd& inputs,
                                  const VectorXd& weights, double target, double eps,
                                  const NewtonOptions& newton) {
    if (!(eps > 0.0)) {
        throw std::invalid_argument("finite-difference step must be positive");
    }

    auto lossAt = [&](const VectorXd& w) {
        double e = target - predict(net, inputs, w, newton);
        return 0.5 * e * e;
    };

    VectorXd grad(net.numWeights());
    for (int i = 0; i < net.numWeights(); ++i) {
        double g = 1.0 / weights(i);
        if (g <= eps) {
            throw std::invalid_argument("finite-difference step exceeds conductance of W" +
                                        std::to_string(i + 1));
        }
        VectorXd wp = weights;
        VectorXd wm = weights;
        wp(i) = 1.0 / (g + eps);
        wm(i) = 1.0 / (g - eps);
        grad(i) = (lossAt(wp) - lossAt(wm)) / (2.0 * eps);
    }
    return grad;
}
