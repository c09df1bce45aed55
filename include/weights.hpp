#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

// 权重电阻的物理约束（MCP4251-104 数字电位器 + 1.2k 串联保护电阻）
struct WeightParams {
    double R_series   = 1200.0;    // 串联保护电阻 (ohm)
    double R_min      = 1590.0;    // tap 256: 390 滑片 + 1200 串联
    double R_max      = 101200.0;  // tap 1: 100k + 1200 串联
    int    N_taps     = 256;
    double R_pot_full = 100000.0;  // 电位器满量程 (ohm)

    double gMin() const { return 1.0 / R_max; }
    double gMax() const { return 1.0 / R_min; }

    // 连续电阻 -> 最近的 tap (1..N_taps)
    int resistanceToTap(double r) const;
    double tapToResistance(int tap) const;

    // 电导空间的梯度下降一步，结果夹在 [1/R_max, 1/R_min]
    // 越界时精确返回 R_max / R_min
    double clampedConductanceUpdate(double r, double grad, double lr) const;

    // 显式设权重用：越界或非有限值抛 WeightBoundsError
    void checkResistance(int index, double r) const;
};

const WeightParams kMcp4251{};

struct QuantizedWeights {
    Eigen::VectorXd resistances;
    std::vector<int> taps;
};

// 把权重经过硬件 tap 位置往返一次
QuantizedWeights quantizeWeights(const Eigen::VectorXd& weights, const WeightParams& params);

void setResistance(Eigen::VectorXd& weights, int index, double r, const WeightParams& params);

// CSV: index,resistance,tap
void saveWeights(const std::string& path, const Eigen::VectorXd& weights,
                 const WeightParams& params);
Eigen::VectorXd loadWeights(const std::string& path, const WeightParams& params);
