#include "mlp/network.hpp"
#include <cmath>
#include <stdexcept>

namespace mlp {

Network::Network(int n_in,
                 const std::vector<int>& hidden_sizes,
                 int n_out,
                 Activation activation,
                 uint32_t seed)
    : n_in_(n_in),
      hidden_layers_(build_hidden_layers(n_in, hidden_sizes, activation, seed)),
      output_layer_(static_cast<int>(hidden_sizes.size()),
                    output_layer_input(n_in, hidden_sizes),
                    n_out) {}

int Network::output_layer_input(int n_in, const std::vector<int>& hidden_sizes) {
    return hidden_sizes.empty() ? n_in : hidden_sizes.back();
}

std::vector<HiddenLayer> Network::build_hidden_layers(int n_in,
                                                      const std::vector<int>& hidden_sizes,
                                                      Activation activation,
                                                      uint32_t seed) {
    std::mt19937 gen(seed);
    std::vector<HiddenLayer> layers;
    layers.reserve(hidden_sizes.size());

    int layer_input = n_in;
    for (size_t i = 0; i < hidden_sizes.size(); ++i) {
        layers.emplace_back(static_cast<int>(i), layer_input, hidden_sizes[i], activation, gen);
        layer_input = hidden_sizes[i];
    }
    return layers;
}

Matrix Network::forward(const Matrix& features) const {
    Matrix activations = features;
    for (const auto& layer : hidden_layers_) {
        activations = layer.forward(activations);
    }
    return output_layer_.forward(activations);
}

std::vector<int> Network::predict(const Matrix& features) const {
    return SoftmaxLayer::predict(forward(features));
}

double Network::negative_log_likelihood(const Batch& batch) const {
    return mlp::negative_log_likelihood(forward(batch.features), batch.labels);
}

double Network::errors(const Batch& batch) const {
    return mlp::errors(predict(batch.features), batch.labels);
}

double Network::l1_penalty() const {
    double total = 0.0;
    for (const Parameter* param : parameters()) {
        if (!param->regularized) continue;
        for (float val : param->value.data_) {
            total += std::fabs(val);
        }
    }
    return total;
}

double Network::l2_penalty() const {
    double total = 0.0;
    for (const Parameter* param : parameters()) {
        if (!param->regularized) continue;
        for (float val : param->value.data_) {
            total += static_cast<double>(val) * val;
        }
    }
    return total;
}

double Network::cost(const Batch& batch, float l1_reg, float l2_reg) const {
    double total = negative_log_likelihood(batch);
    if (l1_reg != 0.0f) {
        total += l1_reg * l1_penalty();
    }
    if (l2_reg != 0.0f) {
        total += l2_reg * l2_penalty();
    }
    return total;
}

std::vector<Matrix> Network::gradients(const Batch& batch, float l1_reg, float l2_reg) const {
    // Forward pass, keeping every layer input
    std::vector<Matrix> activations;
    activations.reserve(hidden_layers_.size() + 1);
    activations.push_back(batch.features);
    for (const auto& layer : hidden_layers_) {
        activations.push_back(layer.forward(activations.back()));
    }
    Matrix probabilities = output_layer_.forward(activations.back());

    std::vector<Matrix> grads(2 * (hidden_layers_.size() + 1));
    const size_t out_idx = 2 * hidden_layers_.size();
    Matrix upstream = output_layer_.backward(activations.back(), probabilities, batch.labels,
                                             grads[out_idx], grads[out_idx + 1]);

    for (size_t l = hidden_layers_.size(); l-- > 0;) {
        upstream = hidden_layers_[l].backward(activations[l], activations[l + 1], upstream,
                                              grads[2 * l], grads[2 * l + 1]);
    }

    if (l1_reg != 0.0f || l2_reg != 0.0f) {
        auto params = parameters();
        for (size_t p = 0; p < params.size(); ++p) {
            if (!params[p]->regularized) continue;
            const auto& w = params[p]->value.data_;
            auto& g = grads[p].data_;
            for (size_t i = 0; i < w.size(); ++i) {
                float sign = (w[i] > 0.0f) ? 1.0f : (w[i] < 0.0f ? -1.0f : 0.0f);
                g[i] += l1_reg * sign + 2.0f * l2_reg * w[i];
            }
        }
    }
    return grads;
}

std::vector<Parameter*> Network::parameters() {
    std::vector<Parameter*> params;
    params.reserve(2 * (hidden_layers_.size() + 1));
    for (auto& layer : hidden_layers_) {
        params.push_back(&layer.weights());
        params.push_back(&layer.biases());
    }
    params.push_back(&output_layer_.weights());
    params.push_back(&output_layer_.biases());
    return params;
}

std::vector<const Parameter*> Network::parameters() const {
    std::vector<const Parameter*> params;
    params.reserve(2 * (hidden_layers_.size() + 1));
    for (const auto& layer : hidden_layers_) {
        params.push_back(&layer.weights());
        params.push_back(&layer.biases());
    }
    params.push_back(&output_layer_.weights());
    params.push_back(&output_layer_.biases());
    return params;
}

void Network::load_parameters(const std::map<std::string, Matrix>& values) {
    for (Parameter* param : parameters()) {
        auto it = values.find(param->name);
        if (it == values.end()) {
            throw std::runtime_error("Missing parameter in snapshot: " + param->name);
        }
        if (!it->second.same_shape(param->value)) {
            throw std::runtime_error("Parameter " + param->name + " shape mismatch. Expected: " +
                                     param->value.shape_str() + " Got: " +
                                     it->second.shape_str());
        }
        param->value = it->second;
    }
}

} // namespace mlp
