#include "circuit.hpp"
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

int Circuit::getOrCreateNode(const std::string& name) {
    std::string key = toLower(name);
    if (isGroundName(key)) key = "0";

    auto it = nodeNameToId.find(key);
    if (it != nodeNameToId.end()) {
        return it->second;
    }
    int id = static_cast<int>(nodes.size());
    nodes.emplace_back(id, key);
    nodeNameToId[key] = id;
    return id;
}

int Circuit::findNode(const std::string& name) const {
    std::string key = toLower(name);
    if (isGroundName(key)) key = "0";
    auto it = nodeNameToId.find(key);
    return (it == nodeNameToId.end()) ? -1 : it->second;
}

int Circuit::numNodeEquations() const {
    int count = 0;
    for (const auto& node : nodes) {
        if (!isGroundName(node.name)) {
            ++count;
        }
    }
    return count;
}

// 只有电压源引入支路电流未知量
int Circuit::numVoltageBranches() const {
    int count = 0;
    for (const auto& e : elements) {
        if (e->hasBranchCurrent()) ++count;
    }
    return count;
}

int Circuit::numUnknowns() const {
    return numNodeEquations() + numVoltageBranches();
}

void Circuit::assignEquationIndices() {
    int eq = 0;
    // 节点电压未知量
    for (auto& node : nodes) {
        if (isGroundName(node.name)) {
            node.eqIndex = -1;
        } else {
            node.eqIndex = eq++;
        }
    }

    // 电压源电流未知量
    for (auto& e : elements) {
        if (auto vs = std::dynamic_pointer_cast<VoltageSource>(e)) {
            vs->setBranchEqIndex(eq++);
        }
    }
}

bool Circuit::hasNonlinearDevices() const {
    for (const auto& e : elements) {
        if (e->isNonlinear()) return true;
    }
    return false;
}

void Circuit::attach(const std::shared_ptr<Element>& e) {
    int idx = static_cast<int>(elements.size());
    elements.push_back(e);
    for (int id : e->getNodeIds()) {
        nodes[id].attachedElements.push_back(idx);
    }
}

void Circuit::addResistor(const std::string& name,
                          const std::string& n1,
                          const std::string& n2,
                          double value) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw std::invalid_argument("resistor " + name + " must have positive resistance");
    }
    int id1 = getOrCreateNode(n1);
    int id2 = getOrCreateNode(n2);
    attach(std::make_shared<Resistor>(name, id1, id2, value));
}

void Circuit::addCurrentSource(const std::string& name,
                               const std::string& np,
                               const std::string& nm,
                               double value) {
    int idp = getOrCreateNode(np);
    int idm = getOrCreateNode(nm);
    attach(std::make_shared<CurrentSource>(name, idp, idm, value));
}

void Circuit::addVoltageSource(const std::string& name,
                               const std::string& np,
                               const std::string& nm,
                               double value) {
    int idp = getOrCreateNode(np);
    int idm = getOrCreateNode(nm);
    attach(std::make_shared<VoltageSource>(name, idp, idm, value));
}

// Rs > 0 时：阳极 -- Rs -- <name>#a -- 结 -- 阴极
void Circuit::addDiode(const std::string& name,
                       const std::string& na,
                       const std::string& nk,
                       const std::string& modelId) {
    const DiodeModel* m = findDiodeModel(modelId);
    if (!m) {
        throw std::invalid_argument("unknown diode model: " + modelId);
    }

    DiodeParams p;
    p.Is = m->Is;
    p.N  = m->N;
    p.VT = m->VT;

    std::string anode = na;
    if (m->Rs > 0.0) {
        anode = name + "#a";
        addResistor(name + "#rs", na, anode, m->Rs);
    }

    int ida = getOrCreateNode(anode);
    int idk = getOrCreateNode(nk);
    attach(std::make_shared<DiodeElement>(name, ida, idk, p));
}

void Circuit::addDiodeModel(const DiodeModel& m) {
    if (m.Is < 0.0 || !(m.N > 0.0) || !(m.VT > 0.0) || m.Rs < 0.0) {
        throw std::invalid_argument("invalid parameters in diode model " + m.name);
    }
    diodeModels[toLower(m.name)] = m;
}

const DiodeModel* Circuit::findDiodeModel(const std::string& id) const {
    auto it = diodeModels.find(toLower(id));
    if (it == diodeModels.end()) {
        return nullptr;
    }
    return &it->second;
}

double Circuit::nodeVoltage(const Eigen::VectorXd& x, const std::string& node) const {
    int id = findNode(node);
    if (id < 0) {
        throw std::out_of_range("no node named " + node);
    }
    int eq = nodes[id].eqIndex;
    return (eq >= 0) ? x(eq) : 0.0;
}

const Element* Circuit::findElement(const std::string& name) const {
    std::string key = toLower(name);
    for (const auto& e : elements) {
        if (toLower(e->getName()) == key) return e.get();
    }
    return nullptr;
}

double Circuit::elementCurrent(const Eigen::VectorXd& x, const std::string& element) const {
    const Element* e = findElement(element);
    if (!e) {
        throw std::out_of_range("no element named " + element);
    }
    return e->current(*this, x);
}

void Circuit::printConnectivity() const {
    std::cout << "========== 节点与连接关系 ==========\n";
    for (const auto& node : nodes) {
        std::cout << "Node " << node.name
                  << " (id=" << node.id
                  << ", eqIndex=" << node.eqIndex
                  << "): ";
        for (int ei : node.attachedElements) {
            std::cout << elements[ei]->getName() << " ";
        }
        std::cout << "\n";
    }
}
