#include <gtest/gtest.h>
#include <cmath>
#include <string>

#include "errors.hpp"
#include "gradient.hpp"
#include "test_helpers.hpp"
#include "training.hpp"
#include "xor.hpp"

using namespace test_helpers;
using Eigen::VectorXd;

namespace {

double relErr(double a, double b) {
    return std::fabs(a - b) / std::fabs(b);
}

}  // namespace

TEST(NudgeCurrentsTest, InjectsOnlyIntoFreeOutputs) {
    Network xorNet = makeXorNetwork();
    VectorXd inj = nudgeCurrents(xorNet, 1e-5, 0.2);
    ASSERT_EQ(inj.size(), 4);
    EXPECT_EQ(inj(0), 0.0);
    EXPECT_EQ(inj(1), 0.0);
    EXPECT_DOUBLE_EQ(inj(2), 2e-6);
    EXPECT_DOUBLE_EQ(inj(3), -2e-6);

    // 负端是钳位节点时不注入
    Network single = makeSingleWeightNetwork();
    VectorXd one = nudgeCurrents(single, 1e-5, -0.5);
    ASSERT_EQ(one.size(), 1);
    EXPECT_DOUBLE_EQ(one(0), -5e-6);
}

TEST(GradientTest, SingleWeightSignAndMagnitude) {
    Network net = makeSingleWeightNetwork();
    VectorXd in = vec({1.0});
    VectorXd w = vec({10000.0});

    GradientResult g = computeGradient(net, in, w, 0.0, 1e-7);
    EXPECT_NEAR(g.freeNodes(1), 0.19042, 1e-4);
    EXPECT_NEAR(g.prediction, -0.8096, 1e-3);
    EXPECT_NEAR(g.loss, 0.5 * g.prediction * g.prediction, 1e-15);

    // 目标 0：增大电导把输出拉向 0，梯度为负
    EXPECT_LT(g.gradient(0), 0.0);
    VectorXd fd = finiteDifferenceGradient(net, in, w, 0.0);
    EXPECT_NEAR(fd(0), -222.39, 0.5);
    EXPECT_LT(relErr(g.gradient(0), fd(0)), 0.01);

    // 目标 -0.9 在预测下方：梯度为正
    GradientResult below = computeGradient(net, in, w, -0.9, 1e-7);
    EXPECT_GT(below.gradient(0), 0.0);
}

TEST(GradientTest, OneSidedBiasGrowsWithBeta) {
    Network net = makeSingleWeightNetwork();
    VectorXd in = vec({1.0});
    VectorXd w = vec({10000.0});
    double fd = finiteDifferenceGradient(net, in, w, 0.0)(0);

    double prevErr = 0.0;
    for (double beta : {1e-6, 1e-5, 1e-4}) {
        double g = computeGradient(net, in, w, 0.0, beta).gradient(0);
        double err = std::fabs(g - fd);
        EXPECT_LT(g, 0.0) << "beta=" << beta;
        EXPECT_GT(err, prevErr) << "beta=" << beta;
        prevErr = err;
    }
}

TEST(GradientTest, AlternatingParityCancelsFirstOrderBias) {
    Network net = makeSingleWeightNetwork();
    VectorXd in = vec({1.0});
    VectorXd w = vec({10000.0});
    const double beta = 1e-5;
    double fd = finiteDifferenceGradient(net, in, w, 0.0)(0);

    GradientResult even = computeGradient(net, in, w, 0.0, beta, 0);
    GradientResult odd = computeGradient(net, in, w, 0.0, beta, 1);
    EXPECT_DOUBLE_EQ(even.effectiveBeta, beta);
    EXPECT_DOUBLE_EQ(odd.effectiveBeta, -beta);

    double avg = 0.5 * (even.gradient(0) + odd.gradient(0));
    EXPECT_LT(std::fabs(avg - fd), std::fabs(even.gradient(0) - fd));
    EXPECT_LT(relErr(avg, fd), 0.01);
}

TEST(GradientTest, SymmetricNudgeMatchesFiniteDifference) {
    Network net = makeSingleWeightNetwork();
    VectorXd in = vec({1.0});
    VectorXd w = vec({10000.0});

    GradientOptions opts;
    opts.mode = NudgeMode::Symmetric;
    GradientResult g = computeGradient(net, in, w, 0.0, 1e-5, 0, opts);
    double fd = finiteDifferenceGradient(net, in, w, 0.0)(0);
    EXPECT_LT(relErr(g.gradient(0), fd), 0.01);
    EXPECT_DOUBLE_EQ(g.effectiveBeta, 1e-5);
}

TEST(GradientTest, XorSymmetricGradientMatchesFiniteDifference) {
    Network net = makeXorNetwork();
    VectorXd w = randomInitialWeights(16, net.weightParams(), 42);

    GradientOptions opts;
    opts.mode = NudgeMode::Symmetric;
    for (const Pattern& p : xorDataset()) {
        GradientResult g = computeGradient(net, p.inputs, w, p.target, 1e-5, 0, opts);
        VectorXd fd = finiteDifferenceGradient(net, p.inputs, w, p.target, 1e-8);

        double scale = fd.cwiseAbs().maxCoeff();
        for (int i = 0; i < 16; ++i) {
            EXPECT_NEAR(g.gradient(i), fd(i), 1e-2 * scale + 1e-3)
                << p.label << " W" << i + 1;
        }
        EXPECT_FALSE(g.branchMismatch);
    }
}

TEST(GradientTest, BalancedInputsSitAtReferenceRail) {
    Network net = makeXorNetwork();
    VectorXd w = uniformWeights(16, 50000.0);
    VectorXd in = makeXorInputs(1.0, 1.0);

    GradientResult g = computeGradient(net, in, w, 0.3, 1e-5);
    for (int k = 6; k < 10; ++k) {
        EXPECT_NEAR(g.freeNodes(k), kVMid, 1e-9);
    }
    EXPECT_NEAR(g.prediction, 0.0, 1e-9);
    EXPECT_NEAR(g.loss, 0.045, 1e-9);
    ASSERT_EQ(g.gradient.size(), 16);
    EXPECT_TRUE(g.gradient.allFinite());
    EXPECT_NEAR(predict(net, in, w), g.prediction, 1e-12);
}

TEST(GradientTest, FlagsLargeNudgeDeviation) {
    Network net = makeXorNetwork();
    VectorXd w = randomInitialWeights(16, net.weightParams(), 42);
    const Pattern p = xorDataset()[1];

    GradientOptions opts;
    opts.maxBranchDeviation = 1e-9;
    GradientResult g = computeGradient(net, p.inputs, w, p.target, 1e-5, 0, opts);
    EXPECT_TRUE(g.branchMismatch);
    EXPECT_GT(g.maxDeviation, 1e-9);

    GradientResult ok = computeGradient(net, p.inputs, w, p.target, 1e-5);
    EXPECT_FALSE(ok.branchMismatch);
    EXPECT_DOUBLE_EQ(ok.maxDeviation, g.maxDeviation);
}

TEST(GradientTest, FailureReportsPhase) {
    Network net = makeXorNetwork();
    VectorXd w = randomInitialWeights(16, net.weightParams(), 42);

    GradientOptions opts;
    opts.newton.maxIterations = 0;
    try {
        computeGradient(net, makeXorInputs(1.0, 4.0), w, 0.3, 1e-5, 0, opts);
        FAIL() << "expected ConvergenceError";
    } catch (const ConvergenceError& e) {
        EXPECT_EQ(e.phase(), SolvePhase::Free);
        EXPECT_NE(std::string(e.what()).find("free phase"), std::string::npos);
    }
}

TEST(GradientTest, RejectsNonPositiveBeta) {
    Network net = makeSingleWeightNetwork();
    EXPECT_THROW(computeGradient(net, vec({1.0}), vec({1e4}), 0.0, 0.0),
                 std::invalid_argument);
    EXPECT_THROW(computeGradient(net, vec({1.0}), vec({1e4}), 0.0, -1e-5),
                 std::invalid_argument);
    EXPECT_THROW(finiteDifferenceGradient(net, vec({1.0}), vec({1e4}), 0.0, 1e-3),
                 std::invalid_argument);
}
