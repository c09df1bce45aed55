#pragma once

#include <Eigen/Dense>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "network.hpp"
#include "training.hpp"

// 变量名 -> 电压；参考仿真器的键是节点名，ngspice raw 文件的键是 v(node)
using NodeVoltages = std::map<std::string, double>;

enum class SpiceBackend {
    Reference,   // 自带的 MNA 仿真器
    Ngspice      // 外部 ngspice 批处理
};

// 生成 .op 网表：每个权重拆成 R_s<i>（串联保护）+ R_W<i>（电位器）
// nudge 为空或全 0 时不生成电流源
std::string generateNetlist(const Network& net, const Eigen::VectorXd& weights,
                            const Eigen::VectorXd& inputs,
                            const Eigen::VectorXd& nudge = Eigen::VectorXd());

// 用 MNA 参考仿真器解网表；网表有错或不收敛时抛异常
NodeVoltages simulateReference(const std::string& netlist);

bool ngspiceAvailable();

// ngspice -b -r out.raw -o out.log circuit.cir，失败返回 nullopt
std::optional<NodeVoltages> runNgspice(const std::string& netlist);

// ngspice raw 输出：二进制（Binary:）或 ASCII（Values:）
std::optional<NodeVoltages> parseRawFile(const std::string& path);
std::optional<NodeVoltages> parseRawText(const std::string& content);

struct CrossCheckEntry {
    std::string pattern;
    std::string node;
    double solver = 0.0;
    double spice = 0.0;
    double errorPct = 0.0;
    bool pass = false;
};

struct CrossValidationReport {
    std::vector<CrossCheckEntry> entries;
    int backendFailures = 0;    // 后端没给出结果的样本数
    bool pass = false;
};

// |V| > 1e-6 时按相对误差，否则按绝对误差 * 100
CrossValidationReport crossValidate(const Network& net, const Eigen::VectorXd& weights,
                                    const Dataset& data, double tolerancePct = 1.0,
                                    SpiceBackend backend = SpiceBackend::Reference);
