#include <gtest/gtest.h>
#include <cmath>
#include <fstream>
#include <limits>

#include "errors.hpp"
#include "test_helpers.hpp"
#include "weights.hpp"

using namespace test_helpers;

TEST(WeightParamsTest, DefaultsDescribeMcp4251) {
    WeightParams wp;
    EXPECT_EQ(wp.R_series, 1200.0);
    EXPECT_EQ(wp.R_min, 1590.0);
    EXPECT_EQ(wp.R_max, 101200.0);
    EXPECT_EQ(wp.N_taps, 256);
    EXPECT_DOUBLE_EQ(wp.gMin(), 1.0 / 101200.0);
    EXPECT_DOUBLE_EQ(wp.gMax(), 1.0 / 1590.0);
}

TEST(WeightParamsTest, TapRoundTrip) {
    for (int tap = 1; tap <= kMcp4251.N_taps; ++tap) {
        EXPECT_EQ(kMcp4251.resistanceToTap(kMcp4251.tapToResistance(tap)), tap);
    }
    EXPECT_DOUBLE_EQ(kMcp4251.tapToResistance(256), 1200.0);
    EXPECT_DOUBLE_EQ(kMcp4251.tapToResistance(128), 51200.0);
}

TEST(WeightParamsTest, TapIsClamped) {
    EXPECT_EQ(kMcp4251.resistanceToTap(1e9), 1);
    EXPECT_EQ(kMcp4251.resistanceToTap(0.0), 256);
    EXPECT_EQ(kMcp4251.resistanceToTap(kMcp4251.R_max), 1);
}

TEST(WeightParamsTest, ClampLandsExactlyOnBound) {
    const WeightParams& wp = kMcp4251;
    // 电导被推到 gMin 以下 -> R_max
    EXPECT_EQ(wp.clampedConductanceUpdate(20000.0, 1e6, 1e-6), wp.R_max);
    // 电导被推到 gMax 以上 -> R_min
    EXPECT_EQ(wp.clampedConductanceUpdate(20000.0, -1e6, 1e-6), wp.R_min);
    // 已经在边界上继续往外推
    EXPECT_EQ(wp.clampedConductanceUpdate(wp.R_max, 1.0, 1e-3), wp.R_max);
    EXPECT_EQ(wp.clampedConductanceUpdate(wp.R_min, -1.0, 1e-3), wp.R_min);
    EXPECT_EQ(wp.clampedConductanceUpdate(20000.0, std::numeric_limits<double>::quiet_NaN(), 1.0),
              wp.R_max);
}

TEST(WeightParamsTest, InteriorUpdateIsInConductanceSpace) {
    double r = kMcp4251.clampedConductanceUpdate(10000.0, 1e3, 1e-9);
    EXPECT_NEAR(r, 1.0 / (1e-4 - 1e-6), 1e-6);
    EXPECT_DOUBLE_EQ(kMcp4251.clampedConductanceUpdate(10000.0, 0.0, 1e-9), 10000.0);
}

TEST(WeightParamsTest, CheckResistanceRejectsOutOfRange) {
    EXPECT_NO_THROW(kMcp4251.checkResistance(0, 1590.0));
    EXPECT_NO_THROW(kMcp4251.checkResistance(0, 101200.0));
    EXPECT_THROW(kMcp4251.checkResistance(0, 1000.0), WeightBoundsError);
    EXPECT_THROW(kMcp4251.checkResistance(0, 2e5), WeightBoundsError);
    EXPECT_THROW(kMcp4251.checkResistance(0, std::numeric_limits<double>::quiet_NaN()),
                 WeightBoundsError);

    try {
        kMcp4251.checkResistance(4, 500.0);
        FAIL() << "expected WeightBoundsError";
    } catch (const WeightBoundsError& e) {
        EXPECT_EQ(e.index(), 4);
        EXPECT_EQ(e.value(), 500.0);
        EXPECT_NE(std::string(e.what()).find("W5"), std::string::npos);
    }
}

TEST(WeightParamsTest, SetResistance) {
    Eigen::VectorXd w = uniformWeights(4, 20000.0);
    setResistance(w, 2, 5000.0, kMcp4251);
    EXPECT_EQ(w(2), 5000.0);
    EXPECT_THROW(setResistance(w, 4, 5000.0, kMcp4251), std::out_of_range);
    EXPECT_THROW(setResistance(w, 1, 200.0, kMcp4251), WeightBoundsError);
    EXPECT_EQ(w(1), 20000.0);
}

TEST(WeightParamsTest, QuantizeSnapsToTaps) {
    Eigen::VectorXd w = vec({1590.0, 21200.0, 50000.0, 101200.0});
    QuantizedWeights q = quantizeWeights(w, kMcp4251);
    ASSERT_EQ(q.taps.size(), 4u);
    for (int i = 0; i < 4; ++i) {
        EXPECT_GE(q.taps[i], 1);
        EXPECT_LE(q.taps[i], 256);
        EXPECT_DOUBLE_EQ(q.resistances(i), kMcp4251.tapToResistance(q.taps[i]));
        EXPECT_LE(std::fabs(q.resistances(i) - w(i)), kMcp4251.R_pot_full / kMcp4251.N_taps);
    }
    EXPECT_EQ(q.taps[3], 1);
}

TEST(WeightPersistenceTest, SaveThenLoad) {
    std::string path = tempPath("weights.csv");
    Eigen::VectorXd w = vec({1590.0, 12345.678901234, 101200.0});
    saveWeights(path, w, kMcp4251);

    Eigen::VectorXd back = loadWeights(path, kMcp4251);
    ASSERT_EQ(back.size(), 3);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(back(i), w(i));
    }

    std::ifstream in(path);
    std::string header;
    std::getline(in, header);
    EXPECT_EQ(header, "index,resistance,tap");
}

TEST(WeightPersistenceTest, LoadRejectsBadFiles) {
    std::string path = tempPath("bad.csv");
    {
        std::ofstream out(path);
        out << "index,resistance,tap\n0,5000,200\n1,100,256\n";
    }
    EXPECT_THROW(loadWeights(path, kMcp4251), WeightBoundsError);

    {
        std::ofstream out(path);
        out << "index,resistance,tap\n1,5000,200\n";
    }
    EXPECT_THROW(loadWeights(path, kMcp4251), std::runtime_error);

    {
        std::ofstream out(path);
        out << "index,resistance,tap\n0,abc,1\n";
    }
    EXPECT_THROW(loadWeights(path, kMcp4251), std::runtime_error);

    EXPECT_THROW(loadWeights(tempPath("missing.csv"), kMcp4251), std::runtime_error);
}
