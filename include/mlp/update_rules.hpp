// include/mlp/update_rules.hpp
#pragma once
#include <mlp/types.hpp>
#include <memory>
#include <string>
#include <vector>

namespace mlp {

// Applies one gradient step to a flat list of parameters. Stateful rules
// keep one zero-initialised accumulator per parameter, created by reset()
// or on the first apply().
class UpdateRule {
public:
    virtual ~UpdateRule() = default;

    void apply(const std::vector<Parameter*>& params, const std::vector<Matrix>& grads);
    // Drops any accumulated state and starts again from zero.
    virtual void reset(const std::vector<Parameter*>& params) { (void)params; }
    virtual std::string name() const = 0;

protected:
    virtual void update(const std::vector<Parameter*>& params, const std::vector<Matrix>& grads) = 0;
};

class Sgd : public UpdateRule {
public:
    explicit Sgd(float learning_rate = DEFAULT_LEARNING_RATE);

    std::string name() const override { return "sgd"; }
    float learning_rate() const { return learning_rate_; }

protected:
    void update(const std::vector<Parameter*>& params, const std::vector<Matrix>& grads) override;

private:
    float learning_rate_;
};

class Momentum : public UpdateRule {
public:
    explicit Momentum(float learning_rate = DEFAULT_LEARNING_RATE, float rho = 0.9f);

    void reset(const std::vector<Parameter*>& params) override;
    std::string name() const override { return "momentum"; }
    const std::vector<Matrix>& velocities() const { return velocities_; }

protected:
    void update(const std::vector<Parameter*>& params, const std::vector<Matrix>& grads) override;

private:
    float learning_rate_;
    float rho_;
    std::vector<Matrix> velocities_;
};

// Per-dimension step sizes from running averages of squared gradients and
// squared updates (Zeiler, 2012). Needs no learning rate.
class Adadelta : public UpdateRule {
public:
    explicit Adadelta(float rho = 0.95f, float epsilon = 1e-6f);

    void reset(const std::vector<Parameter*>& params) override;
    std::string name() const override { return "adadelta"; }
    const std::vector<Matrix>& grad_accumulators() const { return grad_accumulators_; }
    const std::vector<Matrix>& update_accumulators() const { return update_accumulators_; }

protected:
    void update(const std::vector<Parameter*>& params, const std::vector<Matrix>& grads) override;

private:
    float rho_;
    float epsilon_;
    std::vector<Matrix> grad_accumulators_;
    std::vector<Matrix> update_accumulators_;
};

// "sgd", "momentum" or "adadelta"
std::unique_ptr<UpdateRule> make_update_rule(const std::string& name,
                                             float learning_rate = DEFAULT_LEARNING_RATE);

} // namespace mlp
