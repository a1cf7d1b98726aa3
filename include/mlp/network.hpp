// include/mlp/network.hpp
#pragma once
#include <mlp/layers.hpp>
#include <map>
#include <string>
#include <vector>

namespace mlp {

// Hidden layers followed by a softmax output layer. Parameters are named
// "layer{i}.W" / "layer{i}.b" in construction order.
class Network {
public:
    Network(int n_in,
            const std::vector<int>& hidden_sizes,
            int n_out,
            Activation activation = Activation::Tanh,
            uint32_t seed = DEFAULT_SEED);

    // Class probabilities, shape (batch, n_out)
    Matrix forward(const Matrix& features) const;
    std::vector<int> predict(const Matrix& features) const;

    double negative_log_likelihood(const Batch& batch) const;
    double errors(const Batch& batch) const;

    // Sums over weight matrices only, biases are not regularized.
    double l1_penalty() const;
    double l2_penalty() const;

    double cost(const Batch& batch, float l1_reg, float l2_reg) const;

    // dCost/dParameter for every entry of parameters(), in the same order.
    std::vector<Matrix> gradients(const Batch& batch, float l1_reg, float l2_reg) const;

    std::vector<Parameter*> parameters();
    std::vector<const Parameter*> parameters() const;

    // Restores values saved from a network of identical shape.
    void load_parameters(const std::map<std::string, Matrix>& values);

    int input_size() const { return n_in_; }
    int output_size() const { return output_layer_.output_size(); }
    size_t num_hidden_layers() const { return hidden_layers_.size(); }
    const std::vector<HiddenLayer>& hidden_layers() const { return hidden_layers_; }
    const SoftmaxLayer& output_layer() const { return output_layer_; }

private:
    int n_in_;
    std::vector<HiddenLayer> hidden_layers_;
    SoftmaxLayer output_layer_;

    static int output_layer_input(int n_in, const std::vector<int>& hidden_sizes);
    static std::vector<HiddenLayer> build_hidden_layers(int n_in,
                                                        const std::vector<int>& hidden_sizes,
                                                        Activation activation,
                                                        uint32_t seed);
};

} // namespace mlp
