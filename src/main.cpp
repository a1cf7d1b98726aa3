#include "mlp/trainer.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 5) {
        std::cerr << "Usage: " << argv[0]
                  << " <mnist_directory> [sgd|momentum|adadelta] [model_name] [n_hidden]"
                  << std::endl;
        return 1;
    }

    const std::string data_dir = argv[1];
    const std::string rule_name = (argc > 2) ? argv[2] : "sgd";
    const std::string model_name = (argc > 3) ? argv[3] : "mlp_" + rule_name;

    try {
        const int n_hidden = (argc > 4) ? std::stoi(argv[4]) : mlp::DEFAULT_N_HIDDEN;

        std::cout << "Loading MNIST from " << data_dir << "..." << std::endl;
        mlp::DataSplits data = mlp::MnistLoader::load(data_dir);

        mlp::Network network(mlp::MNIST_IMAGE_SIZE, {n_hidden}, mlp::MNIST_NUM_CLASSES,
                             mlp::Activation::Tanh, mlp::DEFAULT_SEED);
        auto rule = mlp::make_update_rule(rule_name, mlp::DEFAULT_LEARNING_RATE);

        mlp::Trainer trainer(network, *rule, data, mlp::DEFAULT_L1_REG, mlp::DEFAULT_L2_REG);
        mlp::SnapshotConfig snapshot;
        snapshot.model_name = model_name;
        trainer.set_snapshot(snapshot);

        mlp::TrainingConfig config;
        mlp::TrainingResult result = trainer.fit(config);

        if (std::filesystem::exists(snapshot.path())) {
            // Reload the best model and check it against the test set
            network.load_parameters(mlp::load_snapshot(snapshot.path()));
            double test_error = trainer.evaluate(data.test, config.batch_size);
            std::cout << "Best model restored from " << snapshot.path()
                      << ", test error " << std::fixed << std::setprecision(2)
                      << test_error * 100.0 << " %" << std::endl;
        }

        std::cout << "Stopped " << (result.stopped_early ? "early" : "at the epoch budget")
                  << " after " << result.iterations << " mini-batches" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
