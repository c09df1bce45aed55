#pragma once

#include <stdexcept>
#include <string>

// 求解发生在哪个阶段（自由相 / 正向 nudge / 反向 nudge）
enum class SolvePhase {
    Unspecified,
    Free,
    NudgePositive,
    NudgeNegative
};

inline const char* phaseName(SolvePhase phase) {
    switch (phase) {
        case SolvePhase::Free:          return "free phase";
        case SolvePhase::NudgePositive: return "nudge phase (+beta)";
        case SolvePhase::NudgeNegative: return "nudge phase (-beta)";
        case SolvePhase::Unspecified:   break;
    }
    return "solve";
}

class EqPropError : public std::runtime_error {
public:
    explicit EqPropError(const std::string& what) : std::runtime_error(what) {}
};

// Newton 在迭代上限内没有把 KCL 残差压到容差以下
class ConvergenceError : public EqPropError {
    SolvePhase phase_;
    int iterations_;
    double residual_;
    std::string detail_;

public:
    ConvergenceError(const std::string& detail, int iterations, double residual,
                     SolvePhase phase = SolvePhase::Unspecified)
        : EqPropError(std::string(phaseName(phase)) + ": " + detail),
          phase_(phase), iterations_(iterations), residual_(residual),
          detail_(detail) {}

    SolvePhase phase() const { return phase_; }
    int iterations() const { return iterations_; }
    double residual() const { return residual_; }

    // 梯度引擎补上阶段信息后重新抛出
    ConvergenceError withPhase(SolvePhase phase) const {
        return ConvergenceError(detail_, iterations_, residual_, phase);
    }
};

// 拓扑非法：节点越界、自由节点悬空等，构造 Network 时检测
class InvalidTopologyError : public EqPropError {
public:
    explicit InvalidTopologyError(const std::string& what) : EqPropError(what) {}
};

// 显式设置的电阻超出电位器的物理范围
class WeightBoundsError : public EqPropError {
    int index_;
    double value_;

public:
    WeightBoundsError(int index, double value, double lo, double hi)
        : EqPropError("weight W" + std::to_string(index + 1) + " = " +
                      std::to_string(value) + " ohm outside [" +
                      std::to_string(lo) + ", " + std::to_string(hi) + "]"),
          index_(index), value_(value) {}

    int index() const { return index_; }
    double value() const { return value_; }
};
