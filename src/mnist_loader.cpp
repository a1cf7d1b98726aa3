#include "mlp/dataset.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace mlp {

namespace {

// Bytes between the read position and the end of the stream.
uint64_t remaining_bytes(std::istream& in) {
    const std::streampos here = in.tellg();
    in.seekg(0, std::ios::end);
    const std::streampos end = in.tellg();
    in.seekg(here);
    if (here < 0 || end < here) {
        return 0;
    }
    return static_cast<uint64_t>(end - here);
}

} // namespace

uint32_t MnistLoader::read_big_endian_uint(std::istream& in, const std::string& path) {
    unsigned char buff[4];
    in.read(reinterpret_cast<char*>(buff), 4);
    if (in.gcount() != 4) {
        throw std::runtime_error("Truncated IDX header in " + path);
    }
    return (static_cast<uint32_t>(buff[0]) << 24) |
           (static_cast<uint32_t>(buff[1]) << 16) |
           (static_cast<uint32_t>(buff[2]) << 8) |
           static_cast<uint32_t>(buff[3]);
}

std::vector<int> MnistLoader::load_labels(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Could not open label file: " + path);
    }
    std::cout << "loading labels " << path << "..." << std::endl;

    uint32_t magic = read_big_endian_uint(file, path);
    if (magic != LABELS_MAGIC) {
        throw std::runtime_error("Bad label file magic number in " + path + ": " +
                                 std::to_string(magic));
    }
    uint32_t size = read_big_endian_uint(file, path);
    const uint64_t available = remaining_bytes(file);
    if (size > available) {
        throw std::runtime_error("Label file " + path + " is truncated. Expected: " +
                                 std::to_string(size) + " Got: " + std::to_string(available));
    }

    std::vector<unsigned char> raw(size);
    file.read(reinterpret_cast<char*>(raw.data()), size);
    if (file.gcount() != static_cast<std::streamsize>(size)) {
        throw std::runtime_error("Label file " + path + " is truncated. Expected: " +
                                 std::to_string(size) + " Got: " +
                                 std::to_string(file.gcount()));
    }

    return std::vector<int>(raw.begin(), raw.end());
}

Matrix MnistLoader::load_images(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Could not open image file: " + path);
    }
    std::cout << "loading images " << path << "..." << std::endl;

    uint32_t magic = read_big_endian_uint(file, path);
    if (magic != IMAGES_MAGIC) {
        throw std::runtime_error("Bad image file magic number in " + path + ": " +
                                 std::to_string(magic));
    }
    uint32_t size = read_big_endian_uint(file, path);
    uint32_t rows = read_big_endian_uint(file, path);
    uint32_t cols = read_big_endian_uint(file, path);

    std::cout << "size = " << size << "; rows & cols = " << rows << "x" << cols << std::endl;

    const uint64_t pixels = static_cast<uint64_t>(rows) * cols;
    constexpr uint64_t int_max = static_cast<uint64_t>(std::numeric_limits<int>::max());
    if (size > int_max || pixels > int_max) {
        throw std::runtime_error("Corrupt IDX header in " + path + ": " + std::to_string(size) +
                                 " images of " + std::to_string(rows) + "x" +
                                 std::to_string(cols));
    }
    const uint64_t available = remaining_bytes(file);
    if (static_cast<uint64_t>(size) * pixels > available) {
        throw std::runtime_error("Image file " + path + " is truncated. Expected: " +
                                 std::to_string(static_cast<uint64_t>(size) * pixels) +
                                 " Got: " + std::to_string(available));
    }

    Matrix images(static_cast<int>(size), static_cast<int>(pixels));
    std::vector<unsigned char> raw(pixels);

    for (uint32_t i = 0; i < size; ++i) {
        file.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(pixels));
        if (file.gcount() != static_cast<std::streamsize>(pixels)) {
            throw std::runtime_error("Image file " + path + " is truncated at image " +
                                     std::to_string(i));
        }
        for (uint64_t px = 0; px < pixels; ++px) {
            images(static_cast<int>(i), static_cast<int>(px)) = raw[px] / 255.0f;
        }
    }
    return images;
}

DataSplit MnistLoader::load_split(const std::string& images_path, const std::string& labels_path) {
    DataSplit split;
    split.features = load_images(images_path);
    split.labels = load_labels(labels_path);
    split.check_consistent();
    return split;
}

DataSplits MnistLoader::load(const std::string& directory, int validation_size) {
    namespace fs = std::filesystem;
    fs::path dir(directory);

    DataSplit full_train = load_split((dir / "train-images-idx3-ubyte").string(),
                                      (dir / "train-labels-idx1-ubyte").string());
    if (validation_size < 0 || validation_size >= full_train.size()) {
        throw std::invalid_argument("Validation size " + std::to_string(validation_size) +
                                    " must be in [0, " + std::to_string(full_train.size()) + ")");
    }

    const int n_train = full_train.size() - validation_size;
    DataSplits splits;
    splits.train = slice(full_train, 0, n_train);
    splits.valid = slice(full_train, n_train, full_train.size());
    splits.test = load_split((dir / "t10k-images-idx3-ubyte").string(),
                             (dir / "t10k-labels-idx1-ubyte").string());
    return splits;
}

} // namespace mlp
