#include "mlp/update_rules.hpp"
#include <cmath>
#include <stdexcept>

namespace mlp {

namespace {

// Zero matrices shaped like the parameters, built once per run.
void ensure_state(std::vector<Matrix>& state, const std::vector<Parameter*>& params) {
    if (state.size() == params.size()) {
        return;
    }
    state.clear();
    state.reserve(params.size());
    for (const Parameter* param : params) {
        state.emplace_back(param->value.rows(), param->value.cols(), 0.0f);
    }
}

} // namespace

void UpdateRule::apply(const std::vector<Parameter*>& params, const std::vector<Matrix>& grads) {
    if (params.size() != grads.size()) {
        throw std::invalid_argument("Gradient count mismatch. Expected: " +
                                    std::to_string(params.size()) + " Got: " +
                                    std::to_string(grads.size()));
    }
    for (size_t p = 0; p < params.size(); ++p) {
        if (!params[p]->value.same_shape(grads[p])) {
            throw std::invalid_argument("Gradient shape mismatch for " + params[p]->name +
                                        ". Expected: " + params[p]->value.shape_str() +
                                        " Got: " + grads[p].shape_str());
        }
    }
    update(params, grads);
}

Sgd::Sgd(float learning_rate) : learning_rate_(learning_rate) {}

void Sgd::update(const std::vector<Parameter*>& params, const std::vector<Matrix>& grads) {
    for (size_t p = 0; p < params.size(); ++p) {
        auto& w = params[p]->value.data_;
        const auto& g = grads[p].data_;
        for (size_t i = 0; i < w.size(); ++i) {
            w[i] -= learning_rate_ * g[i];
        }
    }
}

Momentum::Momentum(float learning_rate, float rho)
    : learning_rate_(learning_rate), rho_(rho) {}

void Momentum::reset(const std::vector<Parameter*>& params) {
    velocities_.clear();
    ensure_state(velocities_, params);
}

void Momentum::update(const std::vector<Parameter*>& params, const std::vector<Matrix>& grads) {
    ensure_state(velocities_, params);

    for (size_t p = 0; p < params.size(); ++p) {
        auto& w = params[p]->value.data_;
        auto& v = velocities_[p].data_;
        const auto& g = grads[p].data_;
        for (size_t i = 0; i < w.size(); ++i) {
            v[i] = rho_ * v[i] + (1.0f - rho_) * g[i];
            w[i] -= learning_rate_ * v[i];
        }
    }
}

Adadelta::Adadelta(float rho, float epsilon) : rho_(rho), epsilon_(epsilon) {}

void Adadelta::reset(const std::vector<Parameter*>& params) {
    grad_accumulators_.clear();
    update_accumulators_.clear();
    ensure_state(grad_accumulators_, params);
    ensure_state(update_accumulators_, params);
}

void Adadelta::update(const std::vector<Parameter*>& params, const std::vector<Matrix>& grads) {
    ensure_state(grad_accumulators_, params);
    ensure_state(update_accumulators_, params);

    for (size_t p = 0; p < params.size(); ++p) {
        auto& w = params[p]->value.data_;
        auto& g2 = grad_accumulators_[p].data_;
        auto& u2 = update_accumulators_[p].data_;
        const auto& g = grads[p].data_;
        for (size_t i = 0; i < w.size(); ++i) {
            g2[i] = rho_ * g2[i] + (1.0f - rho_) * g[i] * g[i];
            float step = -std::sqrt(u2[i] + epsilon_) / std::sqrt(g2[i] + epsilon_) * g[i];
            u2[i] = rho_ * u2[i] + (1.0f - rho_) * step * step;
            w[i] += step;
        }
    }
}

std::unique_ptr<UpdateRule> make_update_rule(const std::string& name, float learning_rate) {
    if (name == "sgd") {
        return std::make_unique<Sgd>(learning_rate);
    }
    if (name == "momentum") {
        return std::make_unique<Momentum>(learning_rate);
    }
    if (name == "adadelta") {
        return std::make_unique<Adadelta>();
    }
    throw std::invalid_argument("Unknown update rule: " + name +
                                " (expected sgd, momentum or adadelta)");
}

} // namespace mlp
