#include "mlp/layers.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mlp {

const char* activation_name(Activation activation) {
    switch (activation) {
        case Activation::Tanh: return "tanh";
        case Activation::Sigmoid: return "sigmoid";
        case Activation::ReLU: return "relu";
    }
    return "unknown";
}

Activation parse_activation(const std::string& name) {
    if (name == "tanh") return Activation::Tanh;
    if (name == "sigmoid") return Activation::Sigmoid;
    if (name == "relu") return Activation::ReLU;
    throw std::invalid_argument("Unknown activation: " + name);
}

std::string parameter_name(int index, char kind) {
    return "layer" + std::to_string(index) + "." + kind;
}

HiddenLayer::HiddenLayer(int index, int n_in, int n_out, Activation activation, std::mt19937& gen)
    : n_in_(n_in),
      n_out_(n_out),
      activation_(activation),
      weights_{parameter_name(index, 'W'), Matrix(n_in, n_out), true},
      biases_{parameter_name(index, 'b'), Matrix(1, n_out), false} {

    if (n_in <= 0 || n_out <= 0) {
        throw std::invalid_argument("Layer sizes must be positive, got " +
                                    std::to_string(n_in) + " -> " + std::to_string(n_out));
    }

    weights_.value.uniform_init(init_limit(n_in, n_out, activation), gen);
}

float HiddenLayer::init_limit(int n_in, int n_out, Activation activation) {
    float limit = std::sqrt(6.0f / (n_in + n_out));
    if (activation == Activation::Sigmoid) {
        limit *= 4.0f;
    }
    return limit;
}

Matrix HiddenLayer::forward(const Matrix& input) const {
    if (input.cols() != n_in_) {
        throw std::runtime_error("Hidden layer input dimension mismatch. Expected: " +
                                 std::to_string(n_in_) + " Got: " +
                                 std::to_string(input.cols()));
    }

    Matrix output = input.matmul(weights_.value);
    output.add_row_vector(biases_.value);
    for (auto& val : output.data_) {
        val = activate(val);
    }
    return output;
}

Matrix HiddenLayer::backward(const Matrix& input,
                             const Matrix& output,
                             const Matrix& output_gradient,
                             Matrix& weight_gradient,
                             Matrix& bias_gradient) const {
    if (!output.same_shape(output_gradient)) {
        throw std::runtime_error("Gradient shape " + output_gradient.shape_str() +
                                 " does not match layer output " + output.shape_str());
    }

    // Gradient w.r.t. the pre-activation
    Matrix delta(output.rows(), output.cols());
    for (size_t i = 0; i < delta.data_.size(); ++i) {
        delta.data_[i] = output_gradient.data_[i] * derivative(output.data_[i]);
    }

    weight_gradient = input.transpose_matmul(delta);
    bias_gradient = delta.column_sums();
    return delta.matmul_transpose(weights_.value);
}

float HiddenLayer::activate(float x) const {
    switch (activation_) {
        case Activation::Tanh: return std::tanh(x);
        case Activation::Sigmoid: return 1.0f / (1.0f + std::exp(-x));
        case Activation::ReLU: return std::max(0.0f, x);
    }
    return x;
}

float HiddenLayer::derivative(float y) const {
    switch (activation_) {
        case Activation::Tanh: return 1.0f - y * y;
        case Activation::Sigmoid: return y * (1.0f - y);
        case Activation::ReLU: return y > 0.0f ? 1.0f : 0.0f;
    }
    return 1.0f;
}

} // namespace mlp
