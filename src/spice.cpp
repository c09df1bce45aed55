#include "spice.hpp"
#include "circuit.hpp"
#include "dcanalysis.hpp"
#include "equilibrium.hpp"
#include "errors.hpp"
#include "parser.hpp"
#include "utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string toUpper(const std::string& s) {
    std::string t = s;
    for (char& c : t) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return t;
}

std::string num(double v) {
    std::ostringstream os;
    os << std::setprecision(12) << v;
    return os.str();
}

// 先找 v(node)，再找裸节点名
std::optional<double> lookupNode(const NodeVoltages& v, const std::string& node) {
    std::string key = toLower(node);
    auto it = v.find("v(" + key + ")");
    if (it != v.end()) return it->second;
    it = v.find(key);
    if (it != v.end()) return it->second;
    return std::nullopt;
}

// 从 raw 文件头里取变量名（"Variables:" 之后每行 "idx name type"）
std::vector<std::string> rawVariables(const std::string& header) {
    std::vector<std::string> vars;
    std::istringstream in(header);
    std::string line;
    bool inVars = false;
    while (std::getline(in, line)) {
        line = rtrim(ltrim(line));
        if (line.rfind("Variables:", 0) == 0) {
            inVars = true;
            continue;
        }
        if (line.rfind("Values:", 0) == 0 || line.rfind("Binary:", 0) == 0) break;
        if (!inVars || line.empty()) continue;

        std::istringstream ls(line);
        std::string idx, name, type;
        if (ls >> idx >> name >> type) {
            vars.push_back(toLower(name));
        }
    }
    return vars;
}

double readLittleEndianDouble(const char* p) {
    std::uint64_t bits = 0;
    for (int i = 7; i >= 0; --i) {
        bits = (bits << 8) | static_cast<unsigned char>(p[i]);
    }
    double d;
    std::memcpy(&d, &bits, sizeof d);
    return d;
}

}  // namespace

std::string generateNetlist(const Network& net, const Eigen::VectorXd& weights,
                            const Eigen::VectorXd& inputs, const Eigen::VectorXd& nudge) {
    if (weights.size() != net.numWeights() || inputs.size() != net.numFixed()) {
        throw std::invalid_argument("netlist: weight or input vector has wrong size");
    }
    if (nudge.size() != 0 && nudge.size() != net.numFree()) {
        throw std::invalid_argument("netlist: nudge vector must have one entry per free node");
    }

    const double rSeries = net.weightParams().R_series;
    std::ostringstream out;

    out << "* Auto-generated EqProp network\n";

    for (const auto& kv : net.diodes()) {
        if (!kv.second.params.enabled()) continue;
        const std::string& node = net.nodeName(net.numFixed() + kv.first);
        out << ".model D_" << toUpper(node) << " D(Is=" << num(kv.second.params.Is)
            << " N=" << num(kv.second.params.N) << ")\n";
    }

    out << "\n* Input voltages\n";
    for (int i = 0; i < net.numFixed(); ++i) {
        out << "V_" << toUpper(net.nodeName(i)) << " " << net.nodeName(i) << " 0 "
            << num(inputs(i)) << "\n";
    }

    out << "\n* Reference voltages\n";
    for (const auto& kv : net.diodes()) {
        if (!kv.second.params.enabled()) continue;
        const std::string& node = net.nodeName(net.numFixed() + kv.first);
        out << "V_MID_" << toUpper(node) << " vmid_" << node << " 0 "
            << num(kv.second.anchor) << "\n";
    }

    out << "\n* Weight resistors (series protection + variable pot)\n";
    const auto& conns = net.connections();
    for (int i = 0; i < net.numWeights(); ++i) {
        const std::string& src = net.nodeName(conns[i].a);
        const std::string& dst = net.nodeName(conns[i].b);
        const int k = i + 1;
        if (weights(i) > rSeries) {
            std::string mid = "w" + std::to_string(k) + "m";
            out << "R_s" << k << " " << src << " " << mid << " " << num(rSeries) << "\n";
            out << "R_W" << k << " " << mid << " " << dst << " "
                << num(weights(i) - rSeries) << "\n";
        } else {
            out << "R_W" << k << " " << src << " " << dst << " " << num(weights(i)) << "\n";
        }
    }

    out << "\n* Activation functions (antiparallel diode pairs)\n";
    int d = 1;
    for (const auto& kv : net.diodes()) {
        if (!kv.second.params.enabled()) continue;
        const std::string& node = net.nodeName(net.numFixed() + kv.first);
        std::string model = "D_" + toUpper(node);
        out << "D" << d << "a " << node << " vmid_" << node << " " << model << "\n";
        out << "D" << d << "b vmid_" << node << " " << node << " " << model << "\n";
        ++d;
    }

    if (nudge.size() != 0 && (nudge.array().abs() > 0.0).any()) {
        out << "\n* Nudge current sources\n";
        for (int k = 0; k < net.numFree(); ++k) {
            if (nudge(k) == 0.0) continue;
            const std::string& node = net.nodeName(net.numFixed() + k);
            out << "I_nudge_" << node << " 0 " << node << " " << num(nudge(k)) << "\n";
        }
    }

    out << "\n.op\n\n.save";
    for (int k = 0; k < net.numFree(); ++k) {
        out << " v(" << net.nodeName(net.numFixed() + k) << ")";
    }
    out << "\n\n.end\n";
    return out.str();
}

NodeVoltages simulateReference(const std::string& netlist) {
    Circuit ckt;
    SimulationConfig sim;
    NetlistParser parser(ckt, sim);

    std::istringstream in(netlist);
    if (!parser.parseStream(in, "<netlist>")) {
        throw std::invalid_argument("netlist has " + std::to_string(parser.errorCount()) +
                                    " invalid statement(s)");
    }

    ckt.assignEquationIndices();
    Eigen::VectorXd x = dcSolve(ckt);

    NodeVoltages v;
    for (const auto& node : ckt.nodes) {
        v[node.name] = (node.eqIndex >= 0) ? x(node.eqIndex) : 0.0;
    }
    return v;
}

bool ngspiceAvailable() {
    return std::system("ngspice --version > /dev/null 2>&1") == 0;
}

std::optional<NodeVoltages> runNgspice(const std::string& netlist) {
    std::random_device rd;
    fs::path dir = fs::temp_directory_path() /
                   ("eqprop_ngspice_" + std::to_string(rd()));
    std::error_code ec;
    if (!fs::create_directories(dir, ec)) {
        std::cerr << "runNgspice: cannot create " << dir << ": " << ec.message() << "\n";
        return std::nullopt;
    }

    fs::path cir = dir / "circuit.cir";
    fs::path raw = dir / "output.raw";
    fs::path log = dir / "output.log";

    std::optional<NodeVoltages> result;
    {
        std::ofstream f(cir);
        f << netlist;
    }

    std::string cmd = "ngspice -b -r \"" + raw.string() + "\" -o \"" + log.string() +
                      "\" \"" + cir.string() + "\" > /dev/null 2>&1";
    if (std::system(cmd.c_str()) == 0) {
        result = parseRawFile(raw.string());
    } else {
        std::cerr << "runNgspice: ngspice exited with an error\n";
    }

    fs::remove_all(dir, ec);
    return result;
}

std::optional<NodeVoltages> parseRawFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return parseRawText(ss.str());
}

std::optional<NodeVoltages> parseRawText(const std::string& content) {
    const std::string marker = "Binary:\n";
    std::size_t pos = content.find(marker);

    if (pos != std::string::npos) {
        std::vector<std::string> vars = rawVariables(content.substr(0, pos));
        const std::size_t dataStart = pos + marker.size();
        if (vars.empty() || content.size() - dataStart < vars.size() * 8) {
            return std::nullopt;
        }

        NodeVoltages v;
        const char* data = content.data() + dataStart;
        for (std::size_t i = 0; i < vars.size(); ++i) {
            v[vars[i]] = readLittleEndianDouble(data + 8 * i);
        }
        return v;
    }

    // ASCII："Values:" 之后是 "idx value" 或单独一列 value
    std::vector<std::string> vars = rawVariables(content);
    NodeVoltages v;
    std::istringstream in(content);
    std::string line;
    bool inValues = false;
    std::size_t next = 0;

    while (std::getline(in, line)) {
        line = rtrim(ltrim(line));
        if (line.rfind("Values:", 0) == 0) {
            inValues = true;
            continue;
        }
        if (!inValues || line.empty()) continue;

        std::istringstream ls(line);
        std::vector<std::string> parts;
        std::string tok;
        while (ls >> tok) parts.push_back(tok);

        try {
            if (parts.size() == 2) {
                std::size_t idx = static_cast<std::size_t>(std::stoul(parts[0]));
                if (idx < vars.size()) v[vars[idx]] = std::stod(parts[1]);
                next = idx + 1;
            } else if (parts.size() == 1 && next < vars.size()) {
                v[vars[next++]] = std::stod(parts[0]);
            }
        } catch (const std::exception&) {
            std::cerr << "parseRawText: skipping malformed value line '" << line << "'\n";
        }
    }

    if (v.empty()) return std::nullopt;
    return v;
}

CrossValidationReport crossValidate(const Network& net, const Eigen::VectorXd& weights,
                                    const Dataset& data, double tolerancePct,
                                    SpiceBackend backend) {
    CrossValidationReport report;
    report.pass = true;

    for (const auto& p : data) {
        EquilibriumResult eq = solveEquilibrium(net, p.inputs, weights);
        std::string netlist = generateNetlist(net, weights, p.inputs);

        std::optional<NodeVoltages> sv;
        if (backend == SpiceBackend::Ngspice) {
            sv = runNgspice(netlist);
        } else {
            try {
                sv = simulateReference(netlist);
            } catch (const EqPropError& e) {
                std::cerr << "crossValidate: reference simulation of " << p.label
                          << " failed: " << e.what() << "\n";
            }
        }

        if (!sv) {
            ++report.backendFailures;
            report.pass = false;
            continue;
        }

        for (int k = 0; k < net.numFree(); ++k) {
            CrossCheckEntry e;
            e.pattern = p.label;
            e.node = net.nodeName(net.numFixed() + k);
            e.solver = eq.freeVoltages(k);

            std::optional<double> s = lookupNode(*sv, e.node);
            if (!s) {
                e.errorPct = std::numeric_limits<double>::infinity();
                e.pass = false;
            } else {
                e.spice = *s;
                double diff = std::fabs(e.solver - e.spice);
                e.errorPct = (std::fabs(e.solver) > 1e-6) ? diff / std::fabs(e.solver) * 100.0
                                                          : diff * 100.0;
                e.pass = e.errorPct < tolerancePct;
            }
            report.pass = report.pass && e.pass;
            report.entries.push_back(e);
        }
    }
    return report;
}
