#include "weights.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

int WeightParams::resistanceToTap(double r) const {
    double rPot = r - R_series;
    long tap = std::lround((R_pot_full - rPot) * N_taps / R_pot_full);
    return static_cast<int>(std::clamp<long>(tap, 1, N_taps));
}

double WeightParams::tapToResistance(int tap) const {
    double rPot = R_pot_full * (1.0 - static_cast<double>(tap) / N_taps);
    return rPot + R_series;
}

double WeightParams::clampedConductanceUpdate(double r, double grad, double lr) const {
    double G = 1.0 / r - lr * grad;
    if (!(G > gMin())) return R_max;   // 也覆盖 NaN
    if (G >= gMax())   return R_min;
    return std::clamp(1.0 / G, R_min, R_max);
}

void WeightParams::checkResistance(int index, double r) const {
    if (!std::isfinite(r) || r < R_min || r > R_max) {
        throw WeightBoundsError(index, r, R_min, R_max);
    }
}

QuantizedWeights quantizeWeights(const Eigen::VectorXd& weights, const WeightParams& params) {
    QuantizedWeights q;
    q.resistances.resize(weights.size());
    q.taps.reserve(weights.size());
    for (Eigen::Index i = 0; i < weights.size(); ++i) {
        int tap = params.resistanceToTap(weights(i));
        q.taps.push_back(tap);
        q.resistances(i) = params.tapToResistance(tap);
    }
    return q;
}

void setResistance(Eigen::VectorXd& weights, int index, double r, const WeightParams& params) {
    if (index < 0 || index >= weights.size()) {
        throw std::out_of_range("weight index " + std::to_string(index) + " out of range");
    }
    params.checkResistance(index, r);
    weights(index) = r;
}

void saveWeights(const std::string& path, const Eigen::VectorXd& weights,
                 const WeightParams& params) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot open weight file for writing: " + path);
    }

    out << "index,resistance,tap\n";
    out << std::setprecision(17);
    for (Eigen::Index i = 0; i < weights.size(); ++i) {
        out << i << "," << weights(i) << "," << params.resistanceToTap(weights(i)) << "\n";
    }
}

Eigen::VectorXd loadWeights(const std::string& path, const WeightParams& params) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open weight file: " + path);
    }

    std::vector<double> values;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || lineNo == 1) continue;  // 表头

        std::istringstream iss(line);
        std::string idxTok, rTok;
        if (!std::getline(iss, idxTok, ',') || !std::getline(iss, rTok, ',')) {
            throw std::runtime_error(path + ":" + std::to_string(lineNo) +
                                     ": expected 'index,resistance[,tap]'");
        }

        int idx = 0;
        double r = 0.0;
        try {
            idx = std::stoi(idxTok);
            r   = std::stod(rTok);
        } catch (const std::exception&) {
            throw std::runtime_error(path + ":" + std::to_string(lineNo) +
                                     ": cannot parse '" + line + "'");
        }
        if (idx != static_cast<int>(values.size())) {
            throw std::runtime_error(path + ":" + std::to_string(lineNo) +
                                     ": weights must be listed in order");
        }
        params.checkResistance(idx, r);
        values.push_back(r);
    }

    Eigen::VectorXd w(static_cast<Eigen::Index>(values.size()));
    for (std::size_t i = 0; i < values.size(); ++i) {
        w(static_cast<Eigen::Index>(i)) = values[i];
    }
    return w;
}
