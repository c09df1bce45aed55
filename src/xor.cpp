#include "xor.hpp"
#include "gradient.hpp"

#include <cmath>

Network makeXorNetwork() {
    NetworkSpec spec;
    spec.numFixed = 6;
    spec.numFree  = 4;

    // W1..W12：每个钳位节点分别连到 h1、h2
    for (int in = 0; in < 6; ++in) {
        spec.connections.push_back({in, 6});
        spec.connections.push_back({in, 7});
    }
    // W13..W16：隐层到输出
    spec.connections.push_back({6, 8});
    spec.connections.push_back({6, 9});
    spec.connections.push_back({7, 8});
    spec.connections.push_back({7, 9});

    DiodeShunt shunt;
    shunt.anchor = kVMid;
    spec.diodes[0] = shunt;   // h1
    spec.diodes[1] = shunt;   // h2

    spec.outputPos = 8;
    spec.outputNeg = 9;
    spec.spiceNames = {"x1", "x1c", "x2", "x2c", "vlow", "vhigh", "h1", "h2", "yp", "yn"};
    return Network(spec);
}

Eigen::VectorXd makeXorInputs(double x1, double x2) {
    Eigen::VectorXd v(6);
    v << x1, 5.0 - x1, x2, 5.0 - x2, kVLow, kVHigh;
    return v;
}

Dataset xorDataset() {
    return {
        {makeXorInputs(kVLow, kVLow),   0.0, "(0,0)"},
        {makeXorInputs(kVLow, kVHigh),  0.3, "(0,1)"},
        {makeXorInputs(kVHigh, kVLow),  0.3, "(1,0)"},
        {makeXorInputs(kVHigh, kVHigh), 0.0, "(1,1)"},
    };
}

XorReport verifyXor(const Network& net, const Eigen::VectorXd& weights, double threshold) {
    XorReport report;
    report.pass = true;

    for (const auto& p : xorDataset()) {
        XorCheck c;
        c.label = p.label;
        c.target = p.target;
        c.prediction = predict(net, p.inputs, weights);
        c.pass = (p.target > 0.1) ? (c.prediction > threshold)
                                  : (std::abs(c.prediction) < threshold);
        report.pass = report.pass && c.pass;
        report.patterns.push_back(c);
    }
    return report;
}
