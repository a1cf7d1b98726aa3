// examples/synthetic_example.cpp
#include <mlp/trainer.hpp>
#include <iostream>
#include <random>

namespace {

// Noisy copies of one random prototype per class.
mlp::DataSplit make_split(const mlp::Matrix& prototypes, int n_examples, std::mt19937& gen) {
    std::normal_distribution<float> noise(0.0f, 0.3f);
    std::uniform_int_distribution<int> pick(0, prototypes.rows() - 1);

    mlp::DataSplit split;
    split.features = mlp::Matrix(n_examples, prototypes.cols());
    split.labels.resize(n_examples);
    for (int i = 0; i < n_examples; ++i) {
        int label = pick(gen);
        split.labels[i] = label;
        for (int j = 0; j < prototypes.cols(); ++j) {
            split.features(i, j) = prototypes(label, j) + noise(gen);
        }
    }
    return split;
}

} // namespace

int main() {
    constexpr int n_in = 64;
    constexpr int n_classes = 10;

    std::mt19937 gen(42);
    mlp::Matrix prototypes(n_classes, n_in);
    prototypes.uniform_init(1.0f, gen);

    mlp::DataSplits data;
    data.train = make_split(prototypes, 2000, gen);
    data.valid = make_split(prototypes, 400, gen);
    data.test = make_split(prototypes, 400, gen);

    mlp::TrainingConfig config;
    config.n_epochs = 20;
    config.batch_size = 20;
    config.patience = 1000;

    for (const char* rule_name : {"sgd", "momentum", "adadelta"}) {
        mlp::Network network(n_in, {32}, n_classes, mlp::Activation::Tanh);
        auto rule = mlp::make_update_rule(rule_name, 0.1f);
        mlp::Trainer trainer(network, *rule, data, 0.0f, 0.0001f);

        std::cout << "\n=== " << rule->name() << " ===" << std::endl;
        mlp::TrainingResult result = trainer.fit(config);
        std::cout << rule->name() << ": best validation error " << (result.best_validation_loss * 100.0)
                  << " %, test error " << (result.test_score * 100.0) << " %" << std::endl;
    }

    return 0;
}
