#pragma once

#include <string>
#include <vector>

// 参考仿真器只做 DC 工作点
enum class AnalysisType {
    NONE,
    OP
};

enum class ProbeKind {
    NodeVoltage,
    DiffVoltage,
    BranchCurrent
};

struct AnalysisContext {
    AnalysisType type = AnalysisType::OP;
    double sourceScale = 1.0;   // 电源 ramp 比例 0..1
};

// .save 里的一项：v(n) / v(n1,n2) / i(vname)
struct ProbeSpec {
    ProbeKind kind = ProbeKind::NodeVoltage;
    std::string expr;

    std::string node1;
    std::string node2;

    std::string eleName;
};

class SimulationConfig {
public:
    std::string title;
    bool doOp = false;
    bool sawEnd = false;
    std::vector<ProbeSpec> saves;

    bool hasAnyAnalysis() const { return doOp; }

    void ensureDefaultOp() {
        if (!hasAnyAnalysis()) doOp = true;
    }
};
