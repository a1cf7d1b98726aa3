#include "mlp/dataset.hpp"
#include <algorithm>
#include <stdexcept>

namespace mlp {

void DataSplit::check_consistent() const {
    if (labels.size() != static_cast<size_t>(features.rows())) {
        throw std::runtime_error("Image/label count mismatch: " +
                                 std::to_string(features.rows()) + " images, " +
                                 std::to_string(labels.size()) + " labels");
    }
}

int DataSplit::n_batches(int batch_size) const {
    check_consistent();
    if (batch_size <= 0) {
        throw std::invalid_argument("Batch size must be positive, got " +
                                    std::to_string(batch_size));
    }
    return size() / batch_size;
}

Batch DataSplit::batch(int index, int batch_size) const {
    if (index < 0 || index >= n_batches(batch_size)) {
        throw std::out_of_range("Batch index " + std::to_string(index) + " out of range [0, " +
                                std::to_string(n_batches(batch_size)) + ")");
    }

    Batch out;
    out.features = Matrix(batch_size, features.cols());
    const auto first = features.data_.begin() +
                       static_cast<std::ptrdiff_t>(index) * batch_size * features.cols();
    std::copy(first, first + out.features.data_.size(), out.features.data_.begin());
    out.labels.assign(labels.begin() + static_cast<std::ptrdiff_t>(index) * batch_size,
                      labels.begin() + static_cast<std::ptrdiff_t>(index + 1) * batch_size);
    return out;
}

DataSplit slice(const DataSplit& split, int begin, int end) {
    split.check_consistent();
    if (begin < 0 || end > split.size() || begin > end) {
        throw std::out_of_range("Slice [" + std::to_string(begin) + ", " + std::to_string(end) +
                                ") outside split of size " + std::to_string(split.size()));
    }

    DataSplit out;
    const int cols = split.features.cols();
    out.features = Matrix(end - begin, cols);
    std::copy(split.features.data_.begin() + static_cast<std::ptrdiff_t>(begin) * cols,
              split.features.data_.begin() + static_cast<std::ptrdiff_t>(end) * cols,
              out.features.data_.begin());
    out.labels.assign(split.labels.begin() + begin, split.labels.begin() + end);
    return out;
}

} // namespace mlp
