#include "element.hpp"
#include "circuit.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// =============== 各元件 stamp 实现 ===============

static double voltageAt(const Eigen::VectorXd& x, int eq) {
    return (eq >= 0 && eq < x.size()) ? x(eq) : 0.0;
}

// 两端电压 V(nodeIds[0]) - V(nodeIds[1])
static double voltageAcross(const Circuit& ckt, const std::vector<int>& ids,
                            const Eigen::VectorXd& x) {
    return voltageAt(x, ckt.nodes[ids[0]].eqIndex) - voltageAt(x, ckt.nodes[ids[1]].eqIndex);
}

void Resistor::stamp(Eigen::MatrixXd& G, Eigen::VectorXd& /*I*/,
                     const Circuit& ckt,
                     const Eigen::VectorXd& /*x*/,
                     const AnalysisContext& ) const {
    int eq1 = ckt.nodes[nodeIds[0]].eqIndex;
    int eq2 = ckt.nodes[nodeIds[1]].eqIndex;

    double g = 1.0 / R;

    if (eq1 >= 0) G(eq1, eq1) += g;
    if (eq2 >= 0) G(eq2, eq2) += g;
    if (eq1 >= 0 && eq2 >= 0) {
        G(eq1, eq2) -= g;
        G(eq2, eq1) -= g;
    }
}

void CurrentSource::stamp(Eigen::MatrixXd& /*G*/, Eigen::VectorXd& I,
                          const Circuit& ckt,
                          const Eigen::VectorXd& /*x*/,
                          const AnalysisContext& ctx) const {
    int eqP = ckt.nodes[nodeIds[0]].eqIndex;
    int eqM = ckt.nodes[nodeIds[1]].eqIndex;

    double Ival = value * ctx.sourceScale;

    // I 向量存“注入节点的独立电流”：源从 p 抽走电流，注入 m
    if (eqP >= 0) I(eqP) -= Ival;
    if (eqM >= 0) I(eqM) += Ival;
}

void VoltageSource::stamp(Eigen::MatrixXd& G, Eigen::VectorXd& I,
                          const Circuit& ckt,
                          const Eigen::VectorXd& /*x*/,
                          const AnalysisContext& ctx) const {
    int eqP = ckt.nodes[nodeIds[0]].eqIndex;
    int eqM = ckt.nodes[nodeIds[1]].eqIndex;
    int k   = branchEqIndex;

    if (k < 0 || k >= G.rows()) {
        throw std::logic_error("voltage source " + name + " has no branch equation");
    }

    // 节点方程中的电压源电流 I_v（从 p 流入源）
    if (eqP >= 0) G(eqP, k) += 1.0;
    if (eqM >= 0) G(eqM, k) -= 1.0;

    // 电压源方程：V(p) - V(m) = V
    if (eqP >= 0) G(k, eqP) += 1.0;
    if (eqM >= 0) G(k, eqM) -= 1.0;

    I(k) += value * ctx.sourceScale;
}

// 牛顿线性化：id ≈ gd * vd + ieq，ieq 当作并联的独立电流源
void DiodeElement::stamp(Eigen::MatrixXd& G, Eigen::VectorXd& I,
                         const Circuit& ckt,
                         const Eigen::VectorXd& x,
                         const AnalysisContext& ) const {
    int eqA = ckt.nodes[nodeIds[0]].eqIndex;
    int eqK = ckt.nodes[nodeIds[1]].eqIndex;

    double vd = voltageAt(x, eqA) - voltageAt(x, eqK);
    DiodeEval d = diodeCurrent(vd, params);
    double gd  = d.conductance;
    double ieq = d.current - gd * vd;

    // 阳极：离开电流 +id；阴极：离开电流 -id
    if (eqA >= 0) {
        G(eqA, eqA) += gd;
        if (eqK >= 0) G(eqA, eqK) -= gd;
        I(eqA) -= ieq;
    }
    if (eqK >= 0) {
        G(eqK, eqK) += gd;
        if (eqA >= 0) G(eqK, eqA) -= gd;
        I(eqK) += ieq;
    }
}

// =============== 元件电流 ===============

double Resistor::current(const Circuit& ckt, const Eigen::VectorXd& x) const {
    return voltageAcross(ckt, nodeIds, x) / R;
}

double CurrentSource::current(const Circuit&, const Eigen::VectorXd&) const {
    return value;
}

// 支路未知量本身就是从 p 流进源的电流
double VoltageSource::current(const Circuit&, const Eigen::VectorXd& x) const {
    if (branchEqIndex < 0 || branchEqIndex >= x.size()) {
        throw std::logic_error("voltage source " + name + " has no branch equation");
    }
    return x(branchEqIndex);
}

double DiodeElement::current(const Circuit& ckt, const Eigen::VectorXd& x) const {
    return diodeCurrent(voltageAcross(ckt, nodeIds, x), params).current;
}
