#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "diode.hpp"

TEST(DiodeTest, SingleDiodeFollowsShockley) {
    DiodeParams p = kBat42;
    double v = 0.2;
    DiodeEval d = diodeCurrent(v, p);
    double expected = p.Is * (std::exp(v / p.nVt()) - 1.0);
    EXPECT_NEAR(d.current, expected, 1e-12 * std::fabs(expected));
    EXPECT_NEAR(d.conductance, p.Is / p.nVt() * std::exp(v / p.nVt()), 1e-12);
    EXPECT_DOUBLE_EQ(diodeCurrent(0.0, p).current, 0.0);
}

TEST(DiodeTest, PairIsOdd) {
    for (double v : {-0.3, -0.05, 0.0, 0.01, 0.2, 1.0, 5.0}) {
        DiodeEval pos = diodePairCurrent(v, kBat42);
        DiodeEval neg = diodePairCurrent(-v, kBat42);
        EXPECT_EQ(pos.current, -neg.current) << "v = " << v;
        EXPECT_EQ(pos.conductance, neg.conductance) << "v = " << v;
    }
}

TEST(DiodeTest, PairMatchesSinh) {
    const double nVt = kBat42.nVt();
    for (double v : {-0.4, -0.1, 0.03, 0.25, 0.6}) {
        double expected = 2.0 * kBat42.Is * std::sinh(v / nVt);
        EXPECT_NEAR(diodePairCurrent(v, kBat42).current, expected, 1e-9 * std::fabs(expected));
    }
}

TEST(DiodeTest, PairCurrentFlowsIntoRailAboveAnchor) {
    EXPECT_GT(diodePairCurrent(0.1, kBat42).current, 0.0);
    EXPECT_LT(diodePairCurrent(-0.1, kBat42).current, 0.0);
    EXPECT_GT(diodePairCurrent(0.0, kBat42).conductance, 0.0);
}

TEST(DiodeTest, CappedExponentStaysFinite) {
    for (double v : {3.0, 10.0, 100.0, 1e4}) {
        DiodeEval d = diodePairCurrent(v, kBat42);
        EXPECT_TRUE(std::isfinite(d.current)) << "v = " << v;
        EXPECT_TRUE(std::isfinite(d.conductance)) << "v = " << v;
        EXPECT_GT(d.conductance, 0.0);
    }
    EXPECT_LT(diodePairCurrent(100.0, kBat42).current, diodePairCurrent(101.0, kBat42).current);
    EXPECT_EQ(diodeCurrent(-100.0, kBat42).current, -kBat42.Is);
}

TEST(DiodeTest, CapIsContinuous) {
    const double vCap = kMaxExpArg * kBat42.nVt();
    DiodeEval below = diodeCurrent(vCap * (1.0 - 1e-12), kBat42);
    DiodeEval above = diodeCurrent(vCap * (1.0 + 1e-12), kBat42);
    EXPECT_NEAR(below.current, above.current, 1e-9 * below.current);
    EXPECT_NEAR(below.conductance, above.conductance, 1e-9 * below.conductance);
}

TEST(DiodeTest, DisabledDiodeCarriesNoCurrent) {
    DiodeParams off{0.0, 1.1, 0.02585};
    EXPECT_FALSE(off.enabled());
    EXPECT_EQ(diodePairCurrent(0.7, off).current, 0.0);
    EXPECT_EQ(diodePairCurrent(0.7, off).conductance, 0.0);
    EXPECT_EQ(diodeCriticalVoltage(off), std::numeric_limits<double>::infinity());
    EXPECT_EQ(limitJunctionStep(3.0, 0.0, off), 3.0);
}

TEST(DiodeTest, CriticalVoltageOfBat42) {
    EXPECT_NEAR(diodeCriticalVoltage(kBat42), 0.3472, 1e-3);
}

TEST(DiodeTest, JunctionLimitingCompressesLargeSteps) {
    const double nVt = kBat42.nVt();
    // 小步不动
    EXPECT_EQ(limitJunctionStep(0.1, 0.09, kBat42), 0.1);
    EXPECT_EQ(limitJunctionStep(0.5, 0.49, kBat42), 0.5);

    double limited = limitJunctionStep(2.0, 0.0, kBat42);
    EXPECT_NEAR(limited, nVt * std::log(2.0 / nVt), 1e-12);
    EXPECT_LT(limited, 0.2);

    double fromAbove = limitJunctionStep(2.0, 0.4, kBat42);
    EXPECT_NEAR(fromAbove, 0.4 + nVt * std::log(1.0 + 1.6 / nVt), 1e-12);

    EXPECT_EQ(limitJunctionStep(-2.0, 0.0, kBat42), -limited);
}
