#include "dcanalysis.hpp"
#include "circuit.hpp"
#include "element.hpp"
#include "errors.hpp"
#include "sim.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

using Eigen::MatrixXd;
using Eigen::VectorXd;

// 小工具：构造一个 DC 用的 AnalysisContext
static AnalysisContext makeDcCtx(double sourceScale) {
    AnalysisContext ctx;
    ctx.type        = AnalysisType::OP;
    ctx.sourceScale = sourceScale;
    return ctx;
}

// 全局 gmin-to-ground，只加在节点方程上
static void stampGlobalGmin(const Circuit& ckt, MatrixXd& G, double gmin) {
    for (const auto& node : ckt.nodes) {
        int eq = node.eqIndex;
        if (eq >= 0 && eq < G.rows()) {
            G(eq, eq) += gmin;
        }
    }
}

static void assemble(const Circuit& ckt, const VectorXd& x, double scale,
                     MatrixXd& G, VectorXd& I) {
    int N = ckt.numUnknowns();
    G = MatrixXd::Zero(N, N);
    I = VectorXd::Zero(N);

    AnalysisContext ctx = makeDcCtx(scale);
    for (const auto& e : ckt.elements) {
        e->stamp(G, I, ckt, x, ctx);
    }
}

// 线性电路：G x = I 一次解出
static VectorXd dcSolveLinear(const Circuit& ckt, const DcOptions& opts) {
    MatrixXd G;
    VectorXd I;
    assemble(ckt, VectorXd::Zero(ckt.numUnknowns()), 1.0, G, I);

    VectorXd x;
    if (!Solver::solveLinearSystem(opts.linearSolver, G, I, x)) {
        throw ConvergenceError("DC solve: singular MNA matrix (floating node or voltage-source loop?)",
                               0, std::numeric_limits<double>::infinity());
    }
    return x;
}

// 非线性 DC：外层电源 ramp，内层阻尼 Newton
static VectorXd dcSolveNewton(const Circuit& ckt, const DcOptions& opts) {
    const int N = ckt.numUnknowns();
    const int nodeEqs = ckt.numNodeEquations();

    ConvController ctrl;
    VectorXd x = VectorXd::Zero(N);

    for (int step = 1; step <= opts.rampSteps; ++step) {
        double scale = static_cast<double>(step) / opts.rampSteps;
        bool lastStep = (step == opts.rampSteps);

        double alpha   = ctrl.initialAlpha();
        double gmin    = ctrl.baseGmin(scale);
        double prevErr = std::numeric_limits<double>::infinity();
        bool   converged = false;

        for (int iter = 0; iter < opts.maxNewtonIters; ++iter) {
            MatrixXd G;
            VectorXd I;
            assemble(ckt, x, scale, G, I);
            stampGlobalGmin(ckt, G, gmin);

            // 解 G x_new = I
            VectorXd xRaw;
            if (!Solver::solveLinearSystem(opts.linearSolver, G, I, xRaw)) {
                if (gmin >= ctrl.maxGmin()) {
                    throw ConvergenceError("DC solve: singular Jacobian at ramp step " +
                                           std::to_string(step), iter,
                                           std::numeric_limits<double>::infinity());
                }
                gmin = std::min(gmin * 10.0, ctrl.maxGmin());
                continue;
            }

            ConvStatus st = ctrl.update(x, xRaw, nodeEqs, prevErr, iter, alpha,
                                        gmin, scale, opts.tol);

            x       = st.xNext;
            alpha   = st.alphaNext;
            gmin    = st.gminNext;
            prevErr = st.error;

            if (st.converged) {
                converged = true;
                break;
            }
        }

        if (!converged) {
            if (lastStep) {
                throw ConvergenceError("DC Newton did not converge at full source value",
                                       opts.maxNewtonIters, prevErr);
            }
            std::cerr << "WARNING: Newton did not converge at ramp step " << step
                      << " (err=" << prevErr << ", gmin=" << gmin << ")\n";
        }
    }

    return x;
}

// ====================== 对外接口 ======================

VectorXd dcSolve(const Circuit& ckt, const DcOptions& opts) {
    if (ckt.numUnknowns() == 0) {
        return VectorXd();
    }
    if (opts.rampSteps < 1 || opts.maxNewtonIters < 1) {
        throw std::invalid_argument("rampSteps and maxNewtonIters must be >= 1");
    }
    if (ckt.hasNonlinearDevices()) {
        return dcSolveNewton(ckt, opts);
    }
    return dcSolveLinear(ckt, opts);
}

ConvController::ConvController()
    : alphaMin(0.1), alphaMax(1.0), maxVoltageStep(0.2),
      gminHighBase(1e-6), gminLowBase(1e-12), gminAbsMax(1e-2),
      fastConvRatio(0.7), slowConvRatio(1.05) {}

double ConvController::baseGmin(double rampScale) const {
    rampScale = std::clamp(rampScale, 0.0, 1.0);
    return gminHighBase * std::pow(gminLowBase / gminHighBase, rampScale);
}

ConvStatus ConvController::update(
    const Eigen::VectorXd& x, const Eigen::VectorXd& xRaw, int numNodeEqs,
    double prevErr, int iter, double alphaCurrent,
    double gminCurrent, double rampScale, double tol
) const {
    ConvStatus st;
    VectorXd dx = xRaw - x;
    double gminBase = baseGmin(rampScale);

    // 完整 Newton 步的节点电压变化
    double fullStep = dx.head(numNodeEqs).lpNorm<Eigen::Infinity>();

    double alpha = alphaCurrent;
    double gminNext = gminBase;

    if (iter > 0 && std::isfinite(prevErr)) {
        if (fullStep > prevErr * slowConvRatio) {
            // 收敛明显变差：减小 alpha、略微增大 gmin
            alpha    = std::max(alpha * 0.7, alphaMin);
            gminNext = std::min(gminCurrent * 2.0, gminAbsMax);
        } else if (fullStep < prevErr * fastConvRatio) {
            // 收敛不错：放开 alpha，gmin 往 base 拉
            alpha    = std::min(alpha * 1.5, alphaMax);
            gminNext = std::max(gminBase, 0.5 * gminCurrent);
        } else {
            gminNext = std::max(gminBase, 0.7 * gminCurrent);
        }
    }

    // 单步节点电压变化不超过 maxVoltageStep
    double scale = alpha;
    if (fullStep * scale > maxVoltageStep) {
        scale = maxVoltageStep / fullStep;
    }

    st.xNext     = x + scale * dx;
    st.alphaNext = alpha;
    st.gminNext  = gminNext;
    st.error     = fullStep;
    st.converged = (fullStep < tol) && (gminCurrent <= gminBase * 1.000001);

    return st;
}
