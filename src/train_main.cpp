// train_main.cpp -- eqprop_xor：用平衡传播训练 XOR 电路并验证

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "spice.hpp"
#include "training.hpp"
#include "weights.hpp"
#include "xor.hpp"

static void usage() {
    std::cerr << "Usage: eqprop_xor [--lr X] [--beta X] [--epochs N] [--patience N]\n"
              << "                  [--min-delta X] [--seed N] [--online] [--one-sided]\n"
              << "                  [--log-interval N] [--save FILE] [--load FILE]\n"
              << "                  [--netlist FILE] [--quantize] [--crosscheck [ngspice]]\n";
}

// "(0,1)" -> "01"
static std::string labelBits(const std::string& label) {
    std::string bits;
    for (char c : label) {
        if (c == '0' || c == '1') bits += c;
    }
    return bits;
}

// xor.cir + (0,1) -> xor_01.cir
static std::string netlistPath(const std::string& base, const std::string& label) {
    std::size_t dot = base.rfind('.');
    std::size_t slash = base.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return base + "_" + labelBits(label);
    }
    return base.substr(0, dot) + "_" + labelBits(label) + base.substr(dot);
}

int main(int argc, char** argv) {
    TrainConfig cfg;
    cfg.verbose = true;

    std::string saveFile, loadFile, netlistFile;
    bool quantize = false;
    bool crossCheck = false;
    SpiceBackend backend = SpiceBackend::Reference;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " needs a value");
            }
            return argv[++i];
        };

        try {
            if      (arg == "--lr")           cfg.lr = std::stod(value());
            else if (arg == "--beta")         cfg.beta = std::stod(value());
            else if (arg == "--epochs")       cfg.maxEpochs = std::stoi(value());
            else if (arg == "--patience")     cfg.patience = std::stoi(value());
            else if (arg == "--min-delta")    cfg.minDelta = std::stod(value());
            else if (arg == "--seed")         cfg.seed = static_cast<unsigned>(std::stoul(value()));
            else if (arg == "--log-interval") cfg.logInterval = std::stoi(value());
            else if (arg == "--online")       cfg.update = UpdateMode::Online;
            else if (arg == "--one-sided")    cfg.nudge = NudgeMode::OneSided;
            else if (arg == "--save")         saveFile = value();
            else if (arg == "--load")         loadFile = value();
            else if (arg == "--netlist")      netlistFile = value();
            else if (arg == "--quantize")     quantize = true;
            else if (arg == "--crosscheck") {
                crossCheck = true;
                if (i + 1 < argc && std::string(argv[i + 1]) == "ngspice") {
                    backend = SpiceBackend::Ngspice;
                    ++i;
                }
            }
            else if (arg == "-h" || arg == "--help") {
                usage();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                usage();
                return 2;
            }
        } catch (const std::exception& e) {
            std::cerr << "Bad argument for " << arg << ": " << e.what() << "\n";
            return 2;
        }
    }

    try {
        Network net = makeXorNetwork();
        const WeightParams& wp = net.weightParams();
        Eigen::VectorXd weights;

        if (!loadFile.empty()) {
            std::cout << "Loading weights from " << loadFile << "\n";
            weights = loadWeights(loadFile, wp);
            if (weights.size() != net.numWeights()) {
                std::cerr << loadFile << " holds " << weights.size() << " weights, expected "
                          << net.numWeights() << "\n";
                return 1;
            }
        } else {
            std::cout << std::string(60, '=') << "\n"
                      << "TRAINING (complementary inputs + V_LOW/V_HIGH bias, "
                      << net.numWeights() << " weights)\n"
                      << std::string(60, '=') << "\n";

            TrainResult r = train(net, xorDataset(),
                                  randomInitialWeights(net.numWeights(), wp, cfg.seed), cfg);
            weights = r.weights;

            std::cout << "  *** " << trainStateName(r.state) << " after " << r.epochsRun
                      << " epochs (" << r.steps << " gradient steps, final loss "
                      << std::fixed << std::setprecision(6) << r.finalLoss << ") ***\n";
            if (r.skippedPatterns > 0 || r.branchMismatches > 0) {
                std::cout << "  skipped patterns: " << r.skippedPatterns
                          << ", branch mismatches: " << r.branchMismatches << "\n";
            }
        }

        if (quantize) {
            weights = quantizeWeights(weights, wp).resistances;
            std::cout << "  Weights snapped to " << wp.N_taps << " potentiometer taps\n";
        }

        XorReport report = verifyXor(net, weights);

        std::cout << "\n" << std::string(60, '=') << "\nXOR VERIFICATION\n"
                  << std::string(60, '=') << "\n";
        for (const auto& c : report.patterns) {
            std::cout << "  " << c.label << ": pred=" << std::showpos << std::fixed
                      << std::setprecision(4) << c.prediction << std::noshowpos
                      << "V  target=" << std::setprecision(1) << c.target << "V  ["
                      << (c.pass ? "PASS" : "FAIL") << "]\n";
        }

        std::cout << "\n  Final weights:\n";
        for (int i = 0; i < weights.size(); ++i) {
            std::cout << "    W" << std::setw(2) << i + 1 << ": R=" << std::setw(8)
                      << std::setprecision(0) << weights(i) << " ohm  (tap="
                      << std::setw(3) << wp.resistanceToTap(weights(i)) << ")\n";
        }
        std::cout << "\n  XOR test: " << (report.pass ? "PASS" : "FAIL") << "\n";

        if (!saveFile.empty()) {
            saveWeights(saveFile, weights, wp);
            std::cout << "  Weights written to " << saveFile << "\n";
        }

        if (!netlistFile.empty()) {
            for (const auto& p : xorDataset()) {
                std::string path = netlistPath(netlistFile, p.label);
                std::ofstream out(path);
                if (!out) {
                    std::cerr << "Cannot write " << path << "\n";
                    return 1;
                }
                out << generateNetlist(net, weights, p.inputs);
                std::cout << "  Netlist for " << p.label << " written to " << path << "\n";
            }
        }

        bool crossOk = true;
        if (crossCheck) {
            if (backend == SpiceBackend::Ngspice && !ngspiceAvailable()) {
                std::cerr << "ngspice not found in PATH, using the built-in simulator\n";
                backend = SpiceBackend::Reference;
            }
            CrossValidationReport cv = crossValidate(net, weights, xorDataset(), 1.0, backend);

            std::cout << "\n" << std::string(60, '=') << "\nSPICE CROSS-VALIDATION ("
                      << (backend == SpiceBackend::Ngspice ? "ngspice" : "MNA reference")
                      << ")\n" << std::string(60, '=') << "\n";
            for (const auto& e : cv.entries) {
                std::cout << "  " << e.pattern << " " << std::setw(3) << e.node
                          << ": solver=" << std::setprecision(6) << e.solver
                          << "  spice=" << e.spice << "  err=" << std::setprecision(4)
                          << e.errorPct << "%  [" << (e.pass ? "OK" : "MISMATCH") << "]\n";
            }
            if (cv.backendFailures > 0) {
                std::cout << "  " << cv.backendFailures << " pattern(s) not simulated\n";
            }
            std::cout << "  Cross-validation: " << (cv.pass ? "PASS" : "FAIL") << "\n";
            crossOk = cv.pass;
        }

        std::cout << "\n";
        if (report.pass) {
            std::cout << "SUCCESS: Network learned XOR via equilibrium propagation.\n";
        } else {
            std::cout << "FAILED: XOR not learned.\n";
        }
        return (report.pass && crossOk) ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
