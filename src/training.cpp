#include "training.hpp"
#include "equilibrium.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

using Eigen::VectorXd;

const char* trainStateName(TrainState state) {
    switch (state) {
        case TrainState::Running:   return "running";
        case TrainState::Converged: return "converged";
        case TrainState::Plateaued: return "plateaued";
        case TrainState::Failed:    return "failed";
        case TrainState::Exhausted: return "exhausted";
    }
    return "unknown";
}

VectorXd randomInitialWeights(int n, const WeightParams& params, unsigned seed) {
    if (n < 0) {
        throw std::invalid_argument("weight count must be non-negative");
    }
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> dist(params.gMin(), params.gMax());

    VectorXd w(n);
    for (int i = 0; i < n; ++i) {
        w(i) = std::clamp(1.0 / dist(gen), params.R_min, params.R_max);
    }
    return w;
}

Trainer::Trainer(const Network& net, Dataset data, const VectorXd& initialWeights,
                 TrainConfig config)
    : net_(net), data_(std::move(data)), cfg_(std::move(config)) {
    if (data_.empty()) {
        throw std::invalid_argument("training dataset is empty");
    }
    for (const auto& p : data_) {
        if (p.inputs.size() != net_.numFixed()) {
            throw std::invalid_argument("pattern " + p.label + " has " +
                                        std::to_string(p.inputs.size()) +
                                        " inputs, network has " +
                                        std::to_string(net_.numFixed()) + " fixed nodes");
        }
    }
    if (!(cfg_.lr > 0.0) || !(cfg_.beta > 0.0)) {
        throw std::invalid_argument("learning rate and beta must be positive");
    }
    if (cfg_.maxEpochs < 1 || cfg_.patience < 1 || cfg_.logInterval < 1 ||
        cfg_.maxRetries < 0) {
        throw std::invalid_argument(
            "maxEpochs, patience and logInterval must be >= 1, maxRetries >= 0");
    }
    reset(initialWeights);
}

void Trainer::reset(const VectorXd& weights) {
    if (weights.size() != net_.numWeights()) {
        throw std::invalid_argument("expected " + std::to_string(net_.numWeights()) +
                                    " initial weights, got " +
                                    std::to_string(weights.size()));
    }
    const WeightParams& wp = net_.weightParams();
    for (int i = 0; i < weights.size(); ++i) {
        wp.checkResistance(i, weights(i));
    }

    weights_     = weights;
    bestWeights_ = weights;
    bestLoss_    = std::numeric_limits<double>::infinity();
    lastLoss_    = std::numeric_limits<double>::infinity();
    bestEpoch_   = -1;
    stall_       = 0;
    epoch_       = 0;
    steps_       = 0;
    skipped_     = 0;
    mismatches_  = 0;
    state_       = TrainState::Running;
    history_     = TrainHistory();
    rng_.seed(cfg_.seed);
}

// 第一次用默认初值；之后在电阻网络预解上加均匀扰动重试，
// 每次重试 Newton 迭代上限乘 4
bool Trainer::gradientWithRetry(const Pattern& p, long parity, GradientResult& out) {
    GradientOptions go;
    go.mode = cfg_.nudge;
    go.maxBranchDeviation = cfg_.maxBranchDeviation;
    go.newton = cfg_.newton;

    std::uniform_real_distribution<double> jitter(-cfg_.retryJitter, cfg_.retryJitter);

    for (int attempt = 0; attempt <= cfg_.maxRetries; ++attempt) {
        try {
            if (attempt > 0) {
                VectorXd guess = resistiveInitialGuess(net_, p.inputs, weights_);
                for (int k = 0; k < guess.size(); ++k) {
                    guess(k) += jitter(rng_);
                }
                go.freeGuess = guess;
                if (go.newton.maxIterations <= std::numeric_limits<int>::max() / 4) {
                    go.newton.maxIterations *= 4;
                }
            }
            out = computeGradient(net_, p.inputs, weights_, p.target, cfg_.beta, parity, go);
            return true;
        } catch (const ConvergenceError& e) {
            if (attempt == cfg_.maxRetries) {
                std::cerr << "Warning: epoch " << epoch_ << ", pattern " << p.label
                          << ": " << e.what() << " (" << e.iterations()
                          << " iterations, |F| = " << e.residual()
                          << "), skipped after " << cfg_.maxRetries << " retries\n";
            }
        }
    }
    return false;
}

void Trainer::applyUpdate(const VectorXd& grad) {
    const WeightParams& wp = net_.weightParams();
    for (int i = 0; i < weights_.size(); ++i) {
        weights_(i) = wp.clampedConductanceUpdate(weights_(i), grad(i), cfg_.lr);
    }
}

std::vector<double> Trainer::currentPredictions() const {
    std::vector<double> preds;
    preds.reserve(data_.size());
    for (const auto& p : data_) {
        try {
            preds.push_back(predict(net_, p.inputs, weights_, cfg_.newton));
        } catch (const ConvergenceError& e) {
            std::cerr << "Warning: prediction for " << p.label << " failed: "
                      << e.what() << "\n";
            preds.push_back(std::numeric_limits<double>::quiet_NaN());
        }
    }
    return preds;
}

void Trainer::log(int epoch, double loss) const {
    if (!logger_ && !cfg_.verbose) return;

    std::vector<double> preds = currentPredictions();
    if (logger_) logger_(epoch, loss, preds);

    if (cfg_.verbose) {
        std::ostringstream line;
        line << "  Epoch " << std::setw(5) << epoch
             << "  loss=" << std::fixed << std::setprecision(6) << loss << "  preds=[";
        line << std::showpos << std::setprecision(3);
        for (std::size_t k = 0; k < preds.size(); ++k) {
            if (k) line << " ";
            line << preds[k];
        }
        line << "]";
        std::cout << line.str() << "\n";
    }
}

TrainState Trainer::runEpoch() {
    if (state_ != TrainState::Running) return state_;

    const VectorXd epochStartWeights = weights_;
    VectorXd acc = VectorXd::Zero(net_.numWeights());
    std::vector<double> patternLoss(data_.size(), std::numeric_limits<double>::quiet_NaN());
    std::vector<double> patternBeta(data_.size(), std::numeric_limits<double>::quiet_NaN());

    double loss = 0.0;
    int failures = 0;

    for (std::size_t k = 0; k < data_.size(); ++k) {
        const Pattern& p = data_[k];
        GradientResult g;
        // 单边模式下同一样本逐 epoch 交替 +beta / -beta
        bool ok = gradientWithRetry(p, epoch_ + static_cast<long>(k), g);
        ++steps_;

        if (!ok) {
            ++failures;
            ++skipped_;
            continue;
        }
        if (g.branchMismatch) {
            ++mismatches_;
            if (cfg_.verbose) {
                std::cerr << "Warning: epoch " << epoch_ << ", pattern " << p.label
                          << ": nudged state moved " << g.maxDeviation
                          << " V from the free state\n";
            }
        }

        patternLoss[k] = g.loss;
        patternBeta[k] = g.effectiveBeta;
        loss += g.loss;

        if (cfg_.update == UpdateMode::Online) {
            applyUpdate(g.gradient);
        } else {
            acc += g.gradient;
        }
    }

    const int ep = epoch_;
    ++epoch_;
    history_.patternLoss.push_back(patternLoss);
    history_.patternBeta.push_back(patternBeta);

    if (failures == static_cast<int>(data_.size())) {
        history_.epochLoss.push_back(std::numeric_limits<double>::quiet_NaN());
        state_ = TrainState::Failed;
        std::cerr << "Training failed at epoch " << ep
                  << ": no pattern reached equilibrium\n";
        return state_;
    }

    if (cfg_.update == UpdateMode::Batch) {
        applyUpdate(acc);
    }

    history_.epochLoss.push_back(loss);
    lastLoss_ = loss;

    // 有样本被跳过的 epoch 只是部分和，不参与最佳记录，算作没有改善
    if (failures == 0 && loss < bestLoss_ - cfg_.minDelta) {
        bestLoss_    = loss;
        bestEpoch_   = ep;
        bestWeights_ = epochStartWeights;
        stall_ = 0;
    } else {
        ++stall_;
    }

    if (failures == 0 && loss < cfg_.lossThreshold) {
        state_ = TrainState::Converged;
    } else if (stall_ >= cfg_.patience) {
        state_ = TrainState::Plateaued;
    } else if (epoch_ >= cfg_.maxEpochs) {
        state_ = TrainState::Exhausted;
    }

    if (state_ != TrainState::Running || ep % cfg_.logInterval == 0) {
        log(ep, loss);
    }
    if (cfg_.verbose && state_ == TrainState::Plateaued) {
        std::cout << "  *** Plateau detected at epoch " << ep << " (no improvement for "
                  << cfg_.patience << " epochs, best_loss=" << std::fixed
                  << std::setprecision(6) << bestLoss_ << ") ***\n";
    }
    return state_;
}

TrainResult Trainer::result() const {
    TrainResult r;
    r.weights          = weights_;
    r.bestWeights      = bestWeights_;
    r.finalLoss        = lastLoss_;
    r.bestLoss         = bestLoss_;
    r.bestEpoch        = bestEpoch_;
    r.epochsRun        = epoch_;
    r.steps            = steps_;
    r.state            = state_;
    r.skippedPatterns  = skipped_;
    r.branchMismatches = mismatches_;
    r.history          = history_;
    return r;
}

TrainResult Trainer::run() {
    if (cfg_.verbose) {
        std::cout << "  lr=" << std::scientific << std::setprecision(0) << cfg_.lr
                  << "  beta=" << cfg_.beta << std::defaultfloat
                  << "  epochs=" << cfg_.maxEpochs << "  patience=" << cfg_.patience
                  << "\n";
    }
    while (runEpoch() == TrainState::Running) {
    }
    return result();
}

TrainResult train(const Network& net, const Dataset& data, const VectorXd& initialWeights,
                  const TrainConfig& config, TrainLogger logger) {
    Trainer trainer(net, data, initialWeights, config);
    trainer.setLogger(std::move(logger));
    return trainer.run();
}
