#include "mlp/trainer.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace mlp {

namespace {

double mean_over_batches(const std::function<double(int)>& score, int n_batches) {
    double total = 0.0;
    for (int i = 0; i < n_batches; ++i) {
        total += score(i);
    }
    return total / n_batches;
}

} // namespace

long validation_frequency(const TrainingConfig& config, int n_train_batches) {
    return std::max(1L, std::min(static_cast<long>(n_train_batches), config.patience / 2));
}

TrainingResult run_training(TrainingConfig config,
                            int n_train_batches,
                            int n_valid_batches,
                            int n_test_batches,
                            const TrainingHooks& hooks) {
    if (n_train_batches <= 0 || n_valid_batches <= 0 || n_test_batches <= 0) {
        throw std::invalid_argument("Every split needs at least one mini-batch (train=" +
                                    std::to_string(n_train_batches) + ", valid=" +
                                    std::to_string(n_valid_batches) + ", test=" +
                                    std::to_string(n_test_batches) + ")");
    }
    if (!hooks.train_step || !hooks.validate || !hooks.test) {
        throw std::invalid_argument("train_step, validate and test hooks are required");
    }

    const long frequency = validation_frequency(config, n_train_batches);
    long patience = config.patience;

    TrainingResult result;
    bool done_looping = false;
    int epoch = 0;

    std::cout << "... training" << std::endl;
    auto start = std::chrono::steady_clock::now();

    while (epoch < config.n_epochs && !done_looping) {
        ++epoch;
        for (int minibatch_index = 0; minibatch_index < n_train_batches; ++minibatch_index) {
            hooks.train_step(minibatch_index);

            const long iter = static_cast<long>(epoch - 1) * n_train_batches + minibatch_index;
            result.iterations = iter + 1;

            if ((iter + 1) % frequency == 0) {
                double this_validation_loss = mean_over_batches(hooks.validate, n_valid_batches);

                std::cout << "epoch " << epoch << ", minibatch " << (minibatch_index + 1) << "/"
                          << n_train_batches << ", validation error " << std::fixed
                          << std::setprecision(6) << this_validation_loss * 100.0 << " %"
                          << std::defaultfloat << std::endl;

                if (this_validation_loss < result.best_validation_loss) {
                    // Extend patience only on a significant improvement
                    if (this_validation_loss <
                        result.best_validation_loss * config.improvement_threshold) {
                        patience = std::max(patience, iter * config.patience_increase);
                    }

                    result.best_validation_loss = this_validation_loss;
                    result.best_iteration = iter;
                    result.test_score = mean_over_batches(hooks.test, n_test_batches);

                    std::cout << "     epoch " << epoch << ", minibatch " << (minibatch_index + 1)
                              << "/" << n_train_batches << ", test error of best model "
                              << std::fixed << std::setprecision(6) << result.test_score * 100.0
                              << " %" << std::defaultfloat << std::endl;

                    if (hooks.on_best) {
                        hooks.on_best(iter);
                    }
                }
            }

            if (patience <= iter) {
                done_looping = true;
                break;
            }
        }
    }

    auto end = std::chrono::steady_clock::now();
    result.elapsed_seconds = std::chrono::duration<double>(end - start).count();
    result.epochs_run = epoch;
    result.final_patience = patience;
    result.stopped_early = done_looping;

    std::cout << std::fixed << std::setprecision(6)
              << "Optimization complete. Best validation score of "
              << result.best_validation_loss * 100.0 << " % obtained at iteration "
              << (result.best_iteration + 1) << ", with test performance "
              << result.test_score * 100.0 << " %" << std::endl;
    std::cout << "The code ran for " << epoch << " epochs, with "
              << (result.elapsed_seconds > 0.0 ? epoch / result.elapsed_seconds : 0.0)
              << " epochs/sec" << std::defaultfloat << std::endl;
    std::cerr << "The code ran for " << std::fixed << std::setprecision(1)
              << result.elapsed_seconds << "s" << std::defaultfloat << std::endl;

    return result;
}

Trainer::Trainer(Network& network,
                 UpdateRule& rule,
                 const DataSplits& data,
                 float l1_reg,
                 float l2_reg)
    : network_(network),
      rule_(rule),
      data_(data),
      l1_reg_(l1_reg),
      l2_reg_(l2_reg) {}

void Trainer::train_step(const Batch& batch) {
    std::vector<Matrix> grads = network_.gradients(batch, l1_reg_, l2_reg_);
    rule_.apply(network_.parameters(), grads);
}

double Trainer::evaluate(const DataSplit& split, int batch_size) const {
    const int n_batches = split.n_batches(batch_size);
    if (n_batches == 0) {
        throw std::invalid_argument("Split of size " + std::to_string(split.size()) +
                                    " has no full batch of " + std::to_string(batch_size));
    }
    return mean_over_batches(
        [&](int i) { return network_.errors(split.batch(i, batch_size)); }, n_batches);
}

TrainingResult Trainer::fit(const TrainingConfig& config) {
    const int batch_size = config.batch_size;
    const Network& model = network_;

    std::cout << "... building the model (" << network_.num_hidden_layers()
              << " hidden layers, " << rule_.name() << ")" << std::endl;
    for (const auto& layer : network_.hidden_layers()) {
        std::cout << "  hidden " << layer.input_size() << " -> " << layer.output_size()
                  << " (" << activation_name(layer.activation()) << ")" << std::endl;
    }
    std::cout << "  softmax " << network_.output_layer().input_size() << " -> "
              << network_.output_size() << std::endl;
    rule_.reset(network_.parameters());

    TrainingHooks hooks;
    hooks.train_step = [&](int i) { train_step(data_.train.batch(i, batch_size)); };
    hooks.validate = [&](int i) { return model.errors(data_.valid.batch(i, batch_size)); };
    hooks.test = [&](int i) { return model.errors(data_.test.batch(i, batch_size)); };
    if (snapshot_) {
        const std::string path = snapshot_->path();
        hooks.on_best = [&model, path](long) { save_snapshot(path, model.parameters()); };
    }

    return run_training(config,
                        data_.train.n_batches(batch_size),
                        data_.valid.n_batches(batch_size),
                        data_.test.n_batches(batch_size),
                        hooks);
}

} // namespace mlp
