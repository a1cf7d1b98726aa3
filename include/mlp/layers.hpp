// include/mlp/layers.hpp
#pragma once
#include <mlp/types.hpp>
#include <random>
#include <vector>

namespace mlp {

// Parameter name of layer `index`: "layer{index}.W" or "layer{index}.b".
std::string parameter_name(int index, char kind);

// Fully connected layer followed by an elementwise nonlinearity.
class HiddenLayer {
public:
    HiddenLayer(int index, int n_in, int n_out, Activation activation, std::mt19937& gen);

    // act(input * W + b), shape (batch, n_out)
    Matrix forward(const Matrix& input) const;

    // Given the layer input, its forward output and dCost/dOutput, writes the
    // weight and bias gradients and returns dCost/dInput.
    Matrix backward(const Matrix& input,
                    const Matrix& output,
                    const Matrix& output_gradient,
                    Matrix& weight_gradient,
                    Matrix& bias_gradient) const;

    int input_size() const { return n_in_; }
    int output_size() const { return n_out_; }
    Activation activation() const { return activation_; }

    Parameter& weights() { return weights_; }
    const Parameter& weights() const { return weights_; }
    Parameter& biases() { return biases_; }
    const Parameter& biases() const { return biases_; }

    static float init_limit(int n_in, int n_out, Activation activation);

private:
    int n_in_;
    int n_out_;
    Activation activation_;
    Parameter weights_;  // (n_in, n_out)
    Parameter biases_;   // (1, n_out)

    float activate(float x) const;
    // Derivative expressed through the activation output y = act(x).
    float derivative(float y) const;
};

// Multi-class logistic regression: affine transform followed by softmax.
class SoftmaxLayer {
public:
    SoftmaxLayer(int index, int n_in, int n_out);

    // Row-wise class probabilities, shape (batch, n_out)
    Matrix forward(const Matrix& input) const;

    // Arg-max class of every row of a probability matrix.
    static std::vector<int> predict(const Matrix& probabilities);

    // Gradients of the mean negative log-likelihood. Returns dCost/dInput.
    Matrix backward(const Matrix& input,
                    const Matrix& probabilities,
                    const std::vector<int>& labels,
                    Matrix& weight_gradient,
                    Matrix& bias_gradient) const;

    int input_size() const { return n_in_; }
    int output_size() const { return n_out_; }

    Parameter& weights() { return weights_; }
    const Parameter& weights() const { return weights_; }
    Parameter& biases() { return biases_; }
    const Parameter& biases() const { return biases_; }

private:
    int n_in_;
    int n_out_;
    Parameter weights_;
    Parameter biases_;
};

// Mean over the batch of -log P[i, labels[i]].
double negative_log_likelihood(const Matrix& probabilities, const std::vector<int>& labels);

// Fraction of predictions that differ from the labels.
double errors(const std::vector<int>& predicted, const std::vector<int>& labels);

} // namespace mlp
