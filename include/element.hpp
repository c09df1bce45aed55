#pragma once

#include <vector>
#include <string>
#include <memory>
#include <Eigen/Dense>

#include "diode.hpp"
#include "sim.hpp"

class Circuit;

class Element {
protected:
    std::string name;
    std::vector<int> nodeIds;  // 存储节点的索引

public:
    Element(const std::string& n, const std::vector<int>& nodes)
        : name(n), nodeIds(nodes) {}

    virtual ~Element() {}

    const std::string& getName() const { return name; }
    const std::vector<int>& getNodeIds() const { return nodeIds; }

    // 在 x 处线性化后写入 MNA 方程 G x = I
    virtual void stamp(
        Eigen::MatrixXd& G, Eigen::VectorXd& I, const Circuit& ckt,
        const Eigen::VectorXd& x, const AnalysisContext& ctx
    ) const = 0;

    // 从 nodeIds[0] 经元件流到 nodeIds[1] 的电流（x 为收敛后的解）
    virtual double current(const Circuit& ckt, const Eigen::VectorXd& x) const = 0;

    virtual bool isNonlinear() const { return false; }

    // 需要一个支路电流未知量（电压源）
    virtual bool hasBranchCurrent() const { return false; }
};

class Resistor : public Element {
private:
    double R;
public:
    Resistor(const std::string& n, int n1, int n2, double r)
        : Element(n, {n1, n2}), R(r) {}

    double getR() const { return R; }

    void stamp(Eigen::MatrixXd& G, Eigen::VectorXd& I,
               const Circuit& ckt,
               const Eigen::VectorXd& x,
               const AnalysisContext& ctx) const override;
    double current(const Circuit& ckt, const Eigen::VectorXd& x) const override;
};

// 电流源：SPICE 约定，电流从 nodeIds[0] 经源内部流到 nodeIds[1]
class CurrentSource : public Element {
    double value;
public:
    CurrentSource(const std::string& n, int np, int nm, double v)
        : Element(n, {np, nm}), value(v) {}

    double getValue() const { return value; }

    void stamp(Eigen::MatrixXd& G, Eigen::VectorXd& I,
               const Circuit& ckt,
               const Eigen::VectorXd& x,
               const AnalysisContext& ctx) const override;
    double current(const Circuit& ckt, const Eigen::VectorXd& x) const override;
};

class VoltageSource : public Element {
    double value;
    int branchEqIndex;
public:
    VoltageSource(const std::string& n, int np, int nm, double v)
        : Element(n, {np, nm}), value(v), branchEqIndex(-1) {}

    void setBranchEqIndex(int idx) { branchEqIndex = idx; }
    int  getBranchEqIndex() const { return branchEqIndex; }
    double getValue() const { return value; }

    bool hasBranchCurrent() const override { return true; }

    void stamp(Eigen::MatrixXd& G, Eigen::VectorXd& I,
               const Circuit& ckt,
               const Eigen::VectorXd& x,
               const AnalysisContext& ctx) const override;
    double current(const Circuit& ckt, const Eigen::VectorXd& x) const override;
};

// Shockley 二极管，阳极 nodeIds[0]，阴极 nodeIds[1]
// 有串联电阻时 Circuit 会插一个内部节点，这里只看结本身
class DiodeElement : public Element {
    DiodeParams params;
public:
    DiodeElement(const std::string& n, int na, int nk, const DiodeParams& p)
        : Element(n, {na, nk}), params(p) {}

    const DiodeParams& getParams() const { return params; }

    bool isNonlinear() const override { return params.enabled(); }

    void stamp(Eigen::MatrixXd& G, Eigen::VectorXd& I,
               const Circuit& ckt,
               const Eigen::VectorXd& x,
               const AnalysisContext& ctx) const override;
    double current(const Circuit& ckt, const Eigen::VectorXd& x) const override;
};
