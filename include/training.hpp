#pragma once

#include <Eigen/Dense>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "gradient.hpp"
#include "network.hpp"
#include "weights.hpp"

struct Pattern {
    Eigen::VectorXd inputs;   // 钳位节点电压
    double target = 0.0;      // 目标差分输出 (V)
    std::string label;
};

using Dataset = std::vector<Pattern>;

enum class UpdateMode {
    Batch,    // 一个 epoch 累加所有样本的梯度，更新一次
    Online    // 每个样本更新一次
};

enum class TrainState {
    Running,
    Converged,   // 所有样本都成功且 loss < lossThreshold
    Plateaued,   // patience 个 epoch 内 loss 没有改善 minDelta
    Failed,      // 某个 epoch 的所有样本重试后仍不收敛
    Exhausted    // 跑满 maxEpochs
};

const char* trainStateName(TrainState state);

struct TrainConfig {
    double lr            = 5e-9;
    double beta          = 1e-5;
    int    maxEpochs     = 50000;
    int    patience      = 500;
    double minDelta      = 1e-6;
    double lossThreshold = 0.005;
    unsigned seed        = 42;      // 重试扰动用

    UpdateMode update = UpdateMode::Batch;
    NudgeMode  nudge  = NudgeMode::Symmetric;

    int    maxRetries  = 3;         // 每次重试 newton.maxIterations 乘 4
    double retryJitter = 0.05;      // 重试初值的均匀扰动幅度 (V)

    double maxBranchDeviation = 0.5;
    NewtonOptions newton;

    int  logInterval = 5000;
    bool verbose     = false;       // 进度打印到 std::cout
};

// (epoch, loss, 当前权重下各样本的预测)
using TrainLogger = std::function<void(int, double, const std::vector<double>&)>;

struct TrainHistory {
    std::vector<double> epochLoss;
    std::vector<std::vector<double>> patternLoss;   // 被跳过的样本记 NaN
    std::vector<std::vector<double>> patternBeta;   // 各样本实际使用的 beta，跳过记 NaN
};

struct TrainResult {
    Eigen::VectorXd weights;
    Eigen::VectorXd bestWeights;
    double finalLoss = 0.0;
    double bestLoss  = 0.0;
    int    bestEpoch = -1;
    int    epochsRun = 0;
    long   steps     = 0;
    TrainState state = TrainState::Running;
    int skippedPatterns  = 0;
    int branchMismatches = 0;
    TrainHistory history;

    bool converged() const { return state == TrainState::Converged; }
};

class Trainer {
public:
    Trainer(const Network& net, Dataset data, const Eigen::VectorXd& initialWeights,
            TrainConfig config = TrainConfig());

    void setLogger(TrainLogger logger) { logger_ = std::move(logger); }

    // 回到初始状态（计数、历史、最佳记录全部清零）
    void reset(const Eigen::VectorXd& weights);

    // 跑一个 epoch，返回之后的状态；已终止时直接返回
    TrainState runEpoch();
    TrainResult run();

    const Eigen::VectorXd& weights() const { return weights_; }
    int epoch() const { return epoch_; }
    long steps() const { return steps_; }
    TrainState state() const { return state_; }
    const TrainHistory& history() const { return history_; }

    TrainResult result() const;

private:
    const Network& net_;
    Dataset data_;
    TrainConfig cfg_;
    TrainLogger logger_;
    std::mt19937 rng_;

    Eigen::VectorXd weights_;
    Eigen::VectorXd bestWeights_;
    double bestLoss_  = 0.0;
    double lastLoss_  = 0.0;
    int    bestEpoch_ = -1;
    int    stall_     = 0;
    int    epoch_     = 0;
    long   steps_     = 0;
    int    skipped_   = 0;
    int    mismatches_ = 0;
    TrainState state_ = TrainState::Running;
    TrainHistory history_;

    bool gradientWithRetry(const Pattern& p, long parity, GradientResult& out);
    void applyUpdate(const Eigen::VectorXd& grad);
    std::vector<double> currentPredictions() const;
    void log(int epoch, double loss) const;
};

TrainResult train(const Network& net, const Dataset& data,
                  const Eigen::VectorXd& initialWeights,
                  const TrainConfig& config = TrainConfig(),
                  TrainLogger logger = TrainLogger());

// 电导在 [gMin, gMax] 上均匀采样，再换回电阻
Eigen::VectorXd randomInitialWeights(int n, const WeightParams& params, unsigned seed);
