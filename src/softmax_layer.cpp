#include "mlp/layers.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace mlp {

namespace {

void check_labels(const Matrix& probabilities, const std::vector<int>& labels) {
    if (labels.size() != static_cast<size_t>(probabilities.rows())) {
        throw std::runtime_error("Label count mismatch. Expected: " +
                                 std::to_string(probabilities.rows()) + " Got: " +
                                 std::to_string(labels.size()));
    }
    for (int label : labels) {
        if (label < 0 || label >= probabilities.cols()) {
            throw std::out_of_range("Label " + std::to_string(label) +
                                    " outside [0, " + std::to_string(probabilities.cols()) + ")");
        }
    }
}

} // namespace

SoftmaxLayer::SoftmaxLayer(int index, int n_in, int n_out)
    : n_in_(n_in),
      n_out_(n_out),
      weights_{parameter_name(index, 'W'), Matrix(n_in, n_out), true},
      biases_{parameter_name(index, 'b'), Matrix(1, n_out), false} {

    if (n_in <= 0 || n_out <= 0) {
        throw std::invalid_argument("Layer sizes must be positive, got " +
                                    std::to_string(n_in) + " -> " + std::to_string(n_out));
    }
}

Matrix SoftmaxLayer::forward(const Matrix& input) const {
    if (input.cols() != n_in_) {
        throw std::runtime_error("Softmax layer input dimension mismatch. Expected: " +
                                 std::to_string(n_in_) + " Got: " +
                                 std::to_string(input.cols()));
    }

    Matrix scores = input.matmul(weights_.value);
    scores.add_row_vector(biases_.value);

    // Apply softmax row by row
    for (int i = 0; i < scores.rows(); ++i) {
        float max_score = -std::numeric_limits<float>::infinity();
        for (int j = 0; j < n_out_; ++j) {
            max_score = std::max(max_score, scores(i, j));
        }

        float sum = 0.0f;
        for (int j = 0; j < n_out_; ++j) {
            scores(i, j) = std::exp(scores(i, j) - max_score);
            sum += scores(i, j);
        }

        for (int j = 0; j < n_out_; ++j) {
            scores(i, j) /= sum;
        }
    }
    return scores;
}

std::vector<int> SoftmaxLayer::predict(const Matrix& probabilities) {
    std::vector<int> predicted(probabilities.rows(), 0);
    for (int i = 0; i < probabilities.rows(); ++i) {
        int imax = 0;
        for (int j = 1; j < probabilities.cols(); ++j) {
            if (probabilities(i, j) > probabilities(i, imax)) {
                imax = j;
            }
        }
        predicted[i] = imax;
    }
    return predicted;
}

Matrix SoftmaxLayer::backward(const Matrix& input,
                              const Matrix& probabilities,
                              const std::vector<int>& labels,
                              Matrix& weight_gradient,
                              Matrix& bias_gradient) const {
    check_labels(probabilities, labels);

    // d(mean NLL)/d(scores) = (P - onehot(y)) / batch
    Matrix delta = probabilities;
    const float scale = 1.0f / static_cast<float>(probabilities.rows());
    for (int i = 0; i < delta.rows(); ++i) {
        delta(i, labels[i]) -= 1.0f;
        for (int j = 0; j < delta.cols(); ++j) {
            delta(i, j) *= scale;
        }
    }

    weight_gradient = input.transpose_matmul(delta);
    bias_gradient = delta.column_sums();
    return delta.matmul_transpose(weights_.value);
}

double negative_log_likelihood(const Matrix& probabilities, const std::vector<int>& labels) {
    check_labels(probabilities, labels);

    double total = 0.0;
    for (int i = 0; i < probabilities.rows(); ++i) {
        total -= std::log(static_cast<double>(probabilities(i, labels[i])));
    }
    return total / probabilities.rows();
}

double errors(const std::vector<int>& predicted, const std::vector<int>& labels) {
    if (predicted.size() != labels.size()) {
        throw std::runtime_error("Prediction count mismatch. Expected: " +
                                 std::to_string(labels.size()) + " Got: " +
                                 std::to_string(predicted.size()));
    }
    if (labels.empty()) {
        return 0.0;
    }

    size_t wrong = 0;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (predicted[i] != labels[i]) {
            ++wrong;
        }
    }
    return static_cast<double>(wrong) / labels.size();
}

} // namespace mlp
