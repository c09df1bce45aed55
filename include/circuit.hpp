#pragma once

#include <vector>
#include <unordered_map>
#include <memory>
#include <string>
#include <Eigen/Dense>
#include "element.hpp"
#include "utils.hpp"

struct Node {
    int id;
    std::string name;
    int eqIndex;                       // 对应 MNA 方程号（-1 为 GND）
    std::vector<int> attachedElements; // elements 中的下标

    Node(int i, const std::string& n)
        : id(i), name(n), eqIndex(-1) {}
};

// .model <name> D(...) 中 DC 相关的参数，其余（Cjo、Vj、M 等）忽略
struct DiodeModel {
    std::string name;
    double Is = 1e-14;
    double N  = 1.0;
    double Rs = 0.0;
    double VT = 0.02585;
};

class Circuit {
public:
    std::vector<Node> nodes;
    std::vector<std::shared_ptr<Element>> elements;
    std::unordered_map<std::string, int> nodeNameToId;

    std::unordered_map<std::string, DiodeModel> diodeModels;

    // 获取或创建节点（节点名不区分大小写）
    int getOrCreateNode(const std::string& name);
    int findNode(const std::string& name) const;

    int numNodeEquations() const;
    int numVoltageBranches() const;
    int numUnknowns() const;
    void assignEquationIndices();

    bool hasNonlinearDevices() const;

    // 添加元件的工厂方法；非法参数抛 std::invalid_argument
    void addResistor(const std::string& name, const std::string& n1, const std::string& n2, double value);
    void addCurrentSource(const std::string& name, const std::string& np,
                          const std::string& nm, double value);
    void addVoltageSource(const std::string& name, const std::string& np,
                          const std::string& nm, double value);
    void addDiode(const std::string& name, const std::string& na,
                  const std::string& nk, const std::string& modelId);

    void addDiodeModel(const DiodeModel& m);
    const DiodeModel* findDiodeModel(const std::string& id) const;

    // 从解向量中取节点电压 / 元件电流，名字不存在时抛 std::out_of_range
    double nodeVoltage(const Eigen::VectorXd& x, const std::string& node) const;
    double elementCurrent(const Eigen::VectorXd& x, const std::string& element) const;
    const Element* findElement(const std::string& name) const;

    // 打印电路连接信息
    void printConnectivity() const;

private:
    void attach(const std::shared_ptr<Element>& e);
};
