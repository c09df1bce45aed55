// main.cpp -- mnasim：网表的 DC 工作点（MNA 参考仿真器）

#include <iostream>
#include <iomanip>
#include <string>

#include "parser.hpp"
#include "circuit.hpp"
#include "dcanalysis.hpp"
#include "element.hpp"
#include "sim.hpp"

static void printProbe(const Circuit& ckt, const Eigen::VectorXd& x, const ProbeSpec& p) {
    switch (p.kind) {
        case ProbeKind::NodeVoltage:
            std::cout << p.expr << " = " << ckt.nodeVoltage(x, p.node1) << " V\n";
            break;
        case ProbeKind::DiffVoltage:
            std::cout << p.expr << " = "
                      << ckt.nodeVoltage(x, p.node1) - ckt.nodeVoltage(x, p.node2) << " V\n";
            break;
        case ProbeKind::BranchCurrent:
            std::cout << p.expr << " = " << ckt.elementCurrent(x, p.eleName) << " A\n";
            break;
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: mnasim <netlist.cir> [--gs] [--connectivity]\n";
        return 1;
    }

    std::string netlistFile = argv[1];
    DcOptions opts;
    bool showConnectivity = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--gs") {
            opts.linearSolver = Solver::LinearSolver::GaussSeidel;
        } else if (arg == "--connectivity") {
            showConnectivity = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    Circuit ckt;
    SimulationConfig sim;

    std::cout << "Reading netlist: " << netlistFile << "\n";

    if (!parseNetlist(netlistFile, ckt, sim)) {
        std::cerr << "parseNetlist() failed.\n";
        return 1;
    }

    ckt.assignEquationIndices();

    if (!sim.title.empty()) {
        std::cout << "Title: " << sim.title << "\n";
    }
    std::cout << "\n==== Circuit summary ====\n";
    std::cout << "Node count   : " << ckt.nodes.size()    << "\n";
    std::cout << "Element count: " << ckt.elements.size() << "\n";
    std::cout << "Unknowns     : " << ckt.numUnknowns()
              << "  (nodeEq=" << ckt.numNodeEquations()
              << ", branchEq=" << ckt.numVoltageBranches() << ")\n";
    if (showConnectivity) {
        ckt.printConnectivity();
    }

    std::cout << "\nRunning DC operating point...\n";

    Eigen::VectorXd xdc;
    try {
        xdc = dcSolve(ckt, opts);
    } catch (const std::exception& e) {
        std::cerr << "DC solve failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << std::fixed << std::setprecision(6);

    std::cout << "\n==== DC node voltages ====\n";
    for (const auto& node : ckt.nodes) {
        if (node.eqIndex >= 0) {
            std::cout << "V(" << node.name << ") = " << xdc(node.eqIndex) << " V"
                      << "   [eqIndex=" << node.eqIndex << "]\n";
        } else {
            std::cout << "V(" << node.name << ") = 0.000000 V   [GND]\n";
        }
    }

    std::cout << "\n==== DC element currents ====\n";
    std::cout << std::scientific;
    for (const auto& e : ckt.elements) {
        const auto& ids = e->getNodeIds();
        std::cout << "I(" << e->getName() << ", " << ckt.nodes[ids[0]].name
                  << " -> " << ckt.nodes[ids[1]].name << ") = "
                  << e->current(ckt, xdc) << " A\n";
    }

    if (!sim.saves.empty()) {
        std::cout << "\n==== .save ====\n" << std::fixed;
        for (const auto& p : sim.saves) {
            try {
                printProbe(ckt, xdc, p);
            } catch (const std::out_of_range& e) {
                std::cerr << "Cannot evaluate " << p.expr << ": " << e.what() << "\n";
            }
        }
    }

    std::cout << "\nDC analysis finished.\n";
    return 0;
}
