#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

// 线性方程 G x = I 的求解算法（Newton 每步的线性化方程）
// - 直接法：自写 LU 分解（部分主元）
// - 迭代法：Gauss-Seidel
// 失败时返回 false，由调用方决定如何报错

namespace Solver {

using Eigen::MatrixXd;
using Eigen::VectorXd;

enum class LinearSolver {
    DirectLU,
    GaussSeidel
};

// ================ LU 分解（Doolittle + 部分主元） =================
//
// P * A = L * U，LU 同时存 L（对角线下方，对角隐含为 1）和 U
// perm 记录行置换：b_perm[i] = b[perm[i]]
inline bool luDecompose(const MatrixXd& A, MatrixXd& LU, std::vector<int>& perm) {
    int n = static_cast<int>(A.rows());
    if (n == 0 || A.cols() != n) return false;

    // 主元阈值相对矩阵最大元：电导矩阵的元素可以小到 1e-6 S 量级
    const double eps = 1e-14 * A.cwiseAbs().maxCoeff();

    LU = A;
    perm.resize(n);
    for (int i = 0; i < n; ++i) {
        perm[i] = i;
    }

    for (int k = 0; k < n; ++k) {
        int pivot = k;
        double maxAbs = std::fabs(LU(k, k));
        for (int i = k + 1; i < n; ++i) {
            double val = std::fabs(LU(i, k));
            if (val > maxAbs) {
                maxAbs = val;
                pivot = i;
            }
        }

        if (!(maxAbs > eps)) {
            return false;
        }

        if (pivot != k) {
            LU.row(k).swap(LU.row(pivot));
            std::swap(perm[k], perm[pivot]);
        }

        for (int i = k + 1; i < n; ++i) {
            double factor = LU(i, k) / LU(k, k);
            LU(i, k) = factor;
            for (int j = k + 1; j < n; ++j) {
                LU(i, j) -= factor * LU(k, j);
            }
        }
    }

    return true;
}

// 利用 LU 分解求解 A x = b
inline bool solveLinearSystemLU(const MatrixXd& A, const VectorXd& b, VectorXd& x) {
    int n = static_cast<int>(A.rows());
    if (A.cols() != n || b.size() != n) return false;
    x = VectorXd::Zero(n);
    if (n == 0) return true;

    MatrixXd LU;
    std::vector<int> perm;
    if (!luDecompose(A, LU, perm)) {
        return false;
    }

    // 前代：L y = P b
    VectorXd y(n);
    for (int i = 0; i < n; ++i) {
        double sum = b(perm[i]);
        for (int j = 0; j < i; ++j) {
            sum -= LU(i, j) * y(j);
        }
        y(i) = sum;
    }

    // 回代：U x = y
    for (int i = n - 1; i >= 0; --i) {
        double sum = y(i);
        for (int j = i + 1; j < n; ++j) {
            sum -= LU(i, j) * x(j);
        }
        x(i) = sum / LU(i, i);
    }

    return x.allFinite();
}

// ================ Gauss-Seidel 迭代法 =================
//
// x0 为初值（Newton 上一步的增量可作 warm start）
// KCL 的 Jacobian 是对角占优的 M 矩阵，GS 必然收敛；没收敛到 tol 时返回 false
inline bool solveLinearSystemGaussSeidel(const MatrixXd& A, const VectorXd& b,
                                         const VectorXd& x0, VectorXd& x,
                                         int maxIters = 5000, double tol = 1e-14) {
    int n = static_cast<int>(A.rows());
    if (A.cols() != n || b.size() != n) return false;

    x = (x0.size() == n) ? x0 : VectorXd::Zero(n);
    if (n == 0) return true;

    for (int i = 0; i < n; ++i) {
        if (A(i, i) == 0.0) return false;
    }

    for (int iter = 0; iter < maxIters; ++iter) {
        double maxDelta = 0.0;
        double maxAbs   = 0.0;

        for (int i = 0; i < n; ++i) {
            double sum = b(i);
            for (int j = 0; j < n; ++j) {
                if (j != i) sum -= A(i, j) * x(j);
            }
            double xi = sum / A(i, i);
            maxDelta = std::max(maxDelta, std::fabs(xi - x(i)));
            maxAbs   = std::max(maxAbs, std::fabs(xi));
            x(i) = xi;
        }

        if (!x.allFinite()) return false;
        if (maxDelta <= tol * std::max(1.0, maxAbs)) {
            return true;
        }
    }

    return false;
}

inline bool solveLinearSystem(LinearSolver kind, const MatrixXd& A, const VectorXd& b,
                              VectorXd& x) {
    if (kind == LinearSolver::GaussSeidel) {
        return solveLinearSystemGaussSeidel(A, b, VectorXd::Zero(b.size()), x);
    }
    return solveLinearSystemLU(A, b, x);
}

} // namespace Solver
