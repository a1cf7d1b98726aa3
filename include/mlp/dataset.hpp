// include/mlp/dataset.hpp
#pragma once
#include <mlp/types.hpp>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace mlp {

// One split of examples, iterated in fixed-size mini-batches.
struct DataSplit {
    Matrix features;          // (n_examples, n_in)
    std::vector<int> labels;  // n_examples

    int size() const { return features.rows(); }
    // Throws std::runtime_error unless there is one label per feature row.
    void check_consistent() const;
    // Number of full mini-batches; a trailing partial batch is dropped.
    int n_batches(int batch_size) const;
    Batch batch(int index, int batch_size) const;
};

struct DataSplits {
    DataSplit train;
    DataSplit valid;
    DataSplit test;
};

// Reads the MNIST IDX files (http://yann.lecun.com/exdb/mnist/).
class MnistLoader {
public:
    static constexpr uint32_t IMAGES_MAGIC = 2051;
    static constexpr uint32_t LABELS_MAGIC = 2049;
    static constexpr int DEFAULT_VALIDATION_SIZE = 10000;

    // Pixels scaled to [0, 1], one image per row.
    static Matrix load_images(const std::string& path);
    static std::vector<int> load_labels(const std::string& path);
    static DataSplit load_split(const std::string& images_path, const std::string& labels_path);

    // train/valid come from the 60000 training images (the last
    // `validation_size` become the validation split), test from t10k.
    static DataSplits load(const std::string& directory,
                           int validation_size = DEFAULT_VALIDATION_SIZE);

private:
    static uint32_t read_big_endian_uint(std::istream& in, const std::string& path);
};

// Copies rows [begin, end) of a split.
DataSplit slice(const DataSplit& split, int begin, int end);

} // namespace mlp
