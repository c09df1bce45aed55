#include "equilibrium.hpp"
#include "diode.hpp"
#include "errors.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

using Eigen::MatrixXd;
using Eigen::VectorXd;

// 线性预解时挂在二极管节点上的对地（参考轨）电导
static const double kPresolveGmin = 1e-12;

static void checkInputs(const Network& net, const VectorXd& fixedVoltages,
                        const VectorXd& weights) {
    if (fixedVoltages.size() != net.numFixed()) {
        throw std::invalid_argument("expected " + std::to_string(net.numFixed()) +
                                    " fixed voltages, got " +
                                    std::to_string(fixedVoltages.size()));
    }
    if (!fixedVoltages.allFinite()) {
        throw std::invalid_argument("fixed node voltages must be finite");
    }
    if (weights.size() != net.numWeights()) {
        throw std::invalid_argument("expected " + std::to_string(net.numWeights()) +
                                    " weights, got " + std::to_string(weights.size()));
    }
    for (Eigen::Index i = 0; i < weights.size(); ++i) {
        if (!(weights(i) > 0.0) || !std::isfinite(weights(i))) {
            throw std::invalid_argument("weight W" + std::to_string(i + 1) +
                                        " must be a positive finite resistance");
        }
    }
}

VectorXd fullNodeVoltages(const Network& net, const VectorXd& fixedVoltages,
                          const VectorXd& freeVoltages) {
    VectorXd all(net.numNodes());
    all.head(net.numFixed()) = fixedVoltages;
    all.tail(net.numFree())  = freeVoltages;
    return all;
}

void assembleKcl(const Network& net, const VectorXd& fixedVoltages,
                 const VectorXd& weights, const VectorXd& vFree,
                 const VectorXd& injected, bool includeDiodes,
                 MatrixXd& G, VectorXd& F) {
    const int n = net.numFree();
    G = MatrixXd::Zero(n, n);
    F = VectorXd::Zero(n);

    auto voltage = [&](int node) -> double {
        return net.isFixed(node) ? fixedVoltages(node) : vFree(net.freeIndex(node));
    };

    for (const auto& e : net.elements()) {
        switch (e.kind) {
            case ElementKind::Weight: {
                double g = 1.0 / weights(e.weightIndex);
                double i = g * (voltage(e.nodeA) - voltage(e.nodeB));  // a -> b
                int fa = net.freeIndex(e.nodeA);
                int fb = net.freeIndex(e.nodeB);

                if (fa >= 0) { F(fa) -= i; G(fa, fa) += g; }
                if (fb >= 0) { F(fb) += i; G(fb, fb) += g; }
                if (fa >= 0 && fb >= 0) {
                    G(fa, fb) -= g;
                    G(fb, fa) -= g;
                }
                break;
            }
            case ElementKind::DiodePair: {
                if (!e.diode.enabled()) break;
                int k = net.freeIndex(e.nodeA);
                if (includeDiodes) {
                    DiodeEval d = diodePairCurrent(vFree(k) - e.anchor, e.diode);
                    F(k)    -= d.current;      // 从节点流向参考轨
                    G(k, k) += d.conductance;
                } else {
                    F(k)    -= kPresolveGmin * (vFree(k) - e.anchor);
                    G(k, k) += kPresolveGmin;
                }
                break;
            }
        }
    }

    if (injected.size() == n) {
        F += injected;
    }
}

VectorXd resistiveInitialGuess(const Network& net, const VectorXd& fixedVoltages,
                               const VectorXd& weights) {
    checkInputs(net, fixedVoltages, weights);

    // 线性系统：F(v) = b - G v，于是在 v = 0 处 F 就是 b
    MatrixXd G;
    VectorXd b;
    assembleKcl(net, fixedVoltages, weights, VectorXd::Zero(net.numFree()),
                VectorXd(), false, G, b);

    VectorXd v;
    if (!Solver::solveLinearSystemLU(G, b, v)) {
        throw ConvergenceError("resistive pre-solve: singular conductance matrix", 0,
                               std::numeric_limits<double>::infinity());
    }
    return v;
}

// 对每个二极管节点的结电压做 pnjlim 限幅
static void limitDiodeSteps(const Network& net, const VectorXd& vOld, VectorXd& vNew) {
    for (const auto& e : net.elements()) {
        if (e.kind != ElementKind::DiodePair || !e.diode.enabled()) continue;
        int k = net.freeIndex(e.nodeA);
        double vd = limitJunctionStep(vNew(k) - e.anchor, vOld(k) - e.anchor, e.diode);
        vNew(k) = e.anchor + vd;
    }
}

EquilibriumResult solveEquilibrium(const Network& net, const VectorXd& fixedVoltages,
                                   const VectorXd& weights, const SolveOptions& opts) {
    checkInputs(net, fixedVoltages, weights);

    const int n = net.numFree();
    if (opts.injected.size() != 0 && opts.injected.size() != n) {
        throw std::invalid_argument("injected current vector must have " +
                                    std::to_string(n) + " entries");
    }
    if (opts.initialGuess.size() != 0 && opts.initialGuess.size() != n) {
        throw std::invalid_argument("initial guess must have " + std::to_string(n) +
                                    " entries");
    }

    EquilibriumResult result;
    MatrixXd G;
    VectorXd F;

    // 纯线性网络：一次线性求解就是答案
    if (!net.isNonlinear()) {
        assembleKcl(net, fixedVoltages, weights, VectorXd::Zero(n), opts.injected,
                    false, G, F);
        if (!Solver::solveLinearSystem(opts.newton.linearSolver, G, F, result.freeVoltages)) {
            throw ConvergenceError("linear solve failed (singular conductance matrix)", 0,
                                   std::numeric_limits<double>::infinity());
        }
        assembleKcl(net, fixedVoltages, weights, result.freeVoltages, opts.injected,
                    false, G, F);
        result.residual = F.lpNorm<Eigen::Infinity>();
        return result;
    }

    // 没给初值时先解纯电阻网络：避开参考轨附近二极管电导接近 0 的退化点
    VectorXd v = (opts.initialGuess.size() == n)
                     ? VectorXd(opts.initialGuess)
                     : resistiveInitialGuess(net, fixedVoltages, weights);

    const NewtonOptions& no = opts.newton;
    double residual = std::numeric_limits<double>::infinity();

    for (int iter = 0; iter <= no.maxIterations; ++iter) {
        assembleKcl(net, fixedVoltages, weights, v, opts.injected, true, G, F);
        residual = F.lpNorm<Eigen::Infinity>();

        if (!std::isfinite(residual)) {
            throw ConvergenceError("non-finite KCL residual", iter, residual);
        }
        if (residual <= no.absTol) {
            result.freeVoltages = v;
            result.iterations   = iter;
            result.residual     = residual;
            return result;
        }
        if (iter == no.maxIterations) break;

        VectorXd dv;
        if (!Solver::solveLinearSystem(no.linearSolver, G, F, dv)) {
            throw ConvergenceError("singular Jacobian", iter, residual);
        }

        VectorXd vNext = v + dv;
        limitDiodeSteps(net, v, vNext);
        v = vNext;
    }

    throw ConvergenceError("Newton did not reach |F| <= " + std::to_string(no.absTol) +
                           " A in " + std::to_string(no.maxIterations) + " iterations",
                           no.maxIterations, residual);
}
