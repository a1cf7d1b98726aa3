// include/mlp/types.hpp
#pragma once
#include <mlp/matrix.hpp>
#include <cstdint>
#include <cstddef>  // for size_t
#include <limits>
#include <string>
#include <vector>

namespace mlp {

// Defaults of the MNIST tutorial run
constexpr int MNIST_IMAGE_SIZE = 28 * 28;
constexpr int MNIST_NUM_CLASSES = 10;
constexpr float DEFAULT_LEARNING_RATE = 0.01f;
constexpr float DEFAULT_L1_REG = 0.0f;
constexpr float DEFAULT_L2_REG = 0.0001f;
constexpr int DEFAULT_N_EPOCHS = 1000;
constexpr int DEFAULT_BATCH_SIZE = 20;
constexpr int DEFAULT_N_HIDDEN = 500;
constexpr uint32_t DEFAULT_SEED = 1234;

enum class Activation {
    Tanh,
    Sigmoid,
    ReLU
};

const char* activation_name(Activation activation);
Activation parse_activation(const std::string& name);

// A named trainable array. Weight matrices are regularized, biases are not.
struct Parameter {
    std::string name;
    Matrix value;
    bool regularized;
};

struct Batch {
    Matrix features;          // (batch, n_in)
    std::vector<int> labels;  // batch class indices
};

struct TrainingConfig {
    int n_epochs = DEFAULT_N_EPOCHS;
    int batch_size = DEFAULT_BATCH_SIZE;
    // Look at this many mini-batches regardless
    long patience = 10000;
    // Wait this much longer when a new best is found
    long patience_increase = 2;
    // Relative improvement considered significant
    double improvement_threshold = 0.995;
};

struct TrainingResult {
    double best_validation_loss = std::numeric_limits<double>::infinity();
    long best_iteration = 0;
    double test_score = 0.0;
    int epochs_run = 0;
    long iterations = 0;
    long final_patience = 0;
    double elapsed_seconds = 0.0;
    bool stopped_early = false;
};

} // namespace mlp
