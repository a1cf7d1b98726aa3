// include/mlp/trainer.hpp
#pragma once
#include <mlp/dataset.hpp>
#include <mlp/network.hpp>
#include <mlp/snapshot.hpp>
#include <mlp/update_rules.hpp>
#include <functional>
#include <optional>

namespace mlp {

// Callbacks driven by the early-stopping loop. Batch indices are relative
// to the split being iterated.
struct TrainingHooks {
    std::function<void(int batch_index)> train_step;
    std::function<double(int batch_index)> validate;  // misclassification rate
    std::function<double(int batch_index)> test;      // misclassification rate
    std::function<void(long iteration)> on_best;      // optional
};

// Validate every min(n_train_batches, patience / 2) mini-batches.
long validation_frequency(const TrainingConfig& config, int n_train_batches);

// Mini-batch training with patience-based early stopping. Stops once
// patience <= iteration, or after config.n_epochs epochs.
TrainingResult run_training(TrainingConfig config,
                            int n_train_batches,
                            int n_valid_batches,
                            int n_test_batches,
                            const TrainingHooks& hooks);

// Binds a network, an update rule and data splits into a training run.
// All three are held by reference and must outlive the Trainer.
class Trainer {
public:
    Trainer(Network& network,
            UpdateRule& rule,
            const DataSplits& data,
            float l1_reg = DEFAULT_L1_REG,
            float l2_reg = DEFAULT_L2_REG);
    Trainer(Network& network,
            UpdateRule& rule,
            DataSplits&& data,
            float l1_reg = DEFAULT_L1_REG,
            float l2_reg = DEFAULT_L2_REG) = delete;

    // Write the best parameters to snapshot.path() during fit().
    void set_snapshot(const SnapshotConfig& snapshot) { snapshot_ = snapshot; }

    // One gradient update on a single batch.
    void train_step(const Batch& batch);

    // Mean per-batch misclassification rate over a split.
    double evaluate(const DataSplit& split, int batch_size) const;

    TrainingResult fit(const TrainingConfig& config);

private:
    Network& network_;
    UpdateRule& rule_;
    const DataSplits& data_;
    float l1_reg_;
    float l2_reg_;
    std::optional<SnapshotConfig> snapshot_;
};

} // namespace mlp
