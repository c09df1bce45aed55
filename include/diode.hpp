#pragma once

// BAT42 肖特基二极管模型，以及反并联二极管对（激活函数）

struct DiodeParams {
    double Is = 1e-7;     // 饱和电流 (A)，0 表示禁用
    double N  = 1.1;      // 理想因子
    double VT = 0.02585;  // 27C 热电压 (V)

    double nVt() const { return N * VT; }
    bool enabled() const { return Is > 0.0; }
};

// BAT42 数据手册参数
constexpr DiodeParams kBat42{1e-7, 1.1, 0.02585};

// 指数参数上限；超出后按上限处的斜率线性外推
constexpr double kMaxExpArg = 80.0;

struct DiodeEval {
    double current;      // A
    double conductance;  // dI/dV (S)
};

// 单个二极管：I = Is * (exp(v / (N*VT)) - 1)
DiodeEval diodeCurrent(double v, const DiodeParams& p);

// 反并联对：I(v) = I_d(v) - I_d(-v)，奇函数
// v = V_node - V_anchor > 0 时电流从节点流向参考轨
DiodeEval diodePairCurrent(double v, const DiodeParams& p);

// SPICE 的 vcrit = nVt * ln(nVt / (sqrt(2) * Is))
double diodeCriticalVoltage(const DiodeParams& p);

// pnjlim 结电压限幅，对二极管对按 |v| 对称处理
double limitJunctionStep(double vNew, double vOld, const DiodeParams& p);
