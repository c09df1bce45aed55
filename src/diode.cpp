#include "diode.hpp"

#include <cmath>
#include <limits>

DiodeEval diodeCurrent(double v, const DiodeParams& p) {
    if (!p.enabled()) {
        return {0.0, 0.0};
    }

    const double nVt = p.nVt();
    const double x   = v / nVt;

    if (x > kMaxExpArg) {
        // 超过上限：沿上限处切线外推，保证连续且单调
        const double e = std::exp(kMaxExpArg);
        return {p.Is * (e * (1.0 + (x - kMaxExpArg)) - 1.0), p.Is / nVt * e};
    }
    if (x < -kMaxExpArg) {
        return {-p.Is, 0.0};
    }

    const double e = std::exp(x);
    return {p.Is * (e - 1.0), p.Is / nVt * e};
}

DiodeEval diodePairCurrent(double v, const DiodeParams& p) {
    DiodeEval fwd = diodeCurrent(v, p);
    DiodeEval rev = diodeCurrent(-v, p);
    return {fwd.current - rev.current, fwd.conductance + rev.conductance};
}

double diodeCriticalVoltage(const DiodeParams& p) {
    if (!p.enabled()) {
        return std::numeric_limits<double>::infinity();
    }
    const double nVt = p.nVt();
    return nVt * std::log(nVt / (std::sqrt(2.0) * p.Is));
}

// SPICE3 pnjlim: 结电压进入指数区时按对数压缩步长
static double pnjlim(double vNew, double vOld, double nVt, double vcrit) {
    if (vNew > vcrit && std::fabs(vNew - vOld) > 2.0 * nVt) {
        if (vOld > 0.0) {
            double arg = 1.0 + (vNew - vOld) / nVt;
            if (arg > 0.0) {
                vNew = vOld + nVt * std::log(arg);
            } else {
                vNew = vcrit;
            }
        } else {
            vNew = nVt * std::log(vNew / nVt);
        }
    }
    return vNew;
}

double limitJunctionStep(double vNew, double vOld, const DiodeParams& p) {
    if (!p.enabled()) return vNew;

    // 反并联对关于 0 对称：在 vNew 所在的一侧做限幅
    const double s = (vNew >= 0.0) ? 1.0 : -1.0;
    return s * pnjlim(s * vNew, s * vOld, p.nVt(), diodeCriticalVoltage(p));
}
