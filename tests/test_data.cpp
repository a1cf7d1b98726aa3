// tests/test_data.cpp
#include <gtest/gtest.h>
#include <mlp/dataset.hpp>
#include <mlp/network.hpp>
#include <mlp/snapshot.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              (std::string("mlp_data_test_") +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    std::string file(const std::string& name) const { return (dir / name).string(); }

    fs::path dir;
};

namespace {

void write_host(std::ofstream& out, uint32_t value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

// Snapshot with a single entry "x" whose header claims rows x cols and
// carries only `payload_floats` values.
void write_single_entry_snapshot(const std::string& path, uint32_t rows, uint32_t cols,
                                 int payload_floats) {
    std::ofstream out(path, std::ios::binary);
    write_host(out, mlp::SNAPSHOT_MAGIC);
    write_host(out, 1);
    write_host(out, 1);
    out.put('x');
    write_host(out, rows);
    write_host(out, cols);
    const float value = 0.5f;
    for (int i = 0; i < payload_floats; ++i) {
        out.write(reinterpret_cast<const char*>(&value), sizeof(value));
    }
}

void write_be(std::ofstream& out, uint32_t value) {
    const unsigned char bytes[4] = {
        static_cast<unsigned char>(value >> 24), static_cast<unsigned char>(value >> 16),
        static_cast<unsigned char>(value >> 8), static_cast<unsigned char>(value)};
    out.write(reinterpret_cast<const char*>(bytes), 4);
}

// Image i has every pixel equal to 10 * i; label i is i % 10.
void write_idx_pair(const std::string& images, const std::string& labels, uint32_t count) {
    std::ofstream img(images, std::ios::binary);
    write_be(img, mlp::MnistLoader::IMAGES_MAGIC);
    write_be(img, count);
    write_be(img, 2);
    write_be(img, 3);
    for (uint32_t i = 0; i < count; ++i) {
        for (int px = 0; px < 6; ++px) {
            img.put(static_cast<char>(10 * i));
        }
    }

    std::ofstream lbl(labels, std::ios::binary);
    write_be(lbl, mlp::MnistLoader::LABELS_MAGIC);
    write_be(lbl, count);
    for (uint32_t i = 0; i < count; ++i) {
        lbl.put(static_cast<char>(i % 10));
    }
}

mlp::DataSplit counting_split(int n, int cols) {
    mlp::DataSplit split;
    split.features = mlp::Matrix(n, cols);
    split.labels.resize(n);
    for (int i = 0; i < n; ++i) {
        split.labels[i] = i;
        for (int j = 0; j < cols; ++j) split.features(i, j) = static_cast<float>(i);
    }
    return split;
}

} // namespace

TEST(DataSplitTest, BatchesAreSequentialAndFullOnly) {
    mlp::DataSplit split = counting_split(23, 3);
    ASSERT_EQ(split.n_batches(5), 4);

    mlp::Batch b = split.batch(2, 5);
    ASSERT_EQ(b.features.rows(), 5);
    ASSERT_EQ(b.features.cols(), 3);
    EXPECT_EQ(b.labels, (std::vector<int>{10, 11, 12, 13, 14}));
    EXPECT_FLOAT_EQ(b.features(0, 0), 10.0f);
    EXPECT_FLOAT_EQ(b.features(4, 2), 14.0f);

    EXPECT_THROW(split.batch(4, 5), std::out_of_range);
    EXPECT_THROW(split.batch(-1, 5), std::out_of_range);
    EXPECT_THROW(split.n_batches(0), std::invalid_argument);
}

TEST(DataSplitTest, LabelCountMustMatchFeatureRows) {
    mlp::DataSplit split = counting_split(10, 3);
    split.labels.resize(5);

    EXPECT_THROW(split.n_batches(5), std::runtime_error);
    EXPECT_THROW(split.batch(1, 5), std::runtime_error);
    EXPECT_THROW(mlp::slice(split, 0, 10), std::runtime_error);

    split.labels.resize(12);
    EXPECT_THROW(split.batch(0, 5), std::runtime_error);
}

TEST(DataSplitTest, SliceCopiesRows) {
    mlp::DataSplit part = mlp::slice(counting_split(10, 2), 3, 7);
    ASSERT_EQ(part.size(), 4);
    EXPECT_EQ(part.labels.front(), 3);
    EXPECT_FLOAT_EQ(part.features(3, 1), 6.0f);
    EXPECT_THROW(mlp::slice(part, 2, 9), std::out_of_range);
}

TEST_F(TempDirTest, MnistLoaderReadsIdxFiles) {
    write_idx_pair(file("train-images-idx3-ubyte"), file("train-labels-idx1-ubyte"), 12);
    write_idx_pair(file("t10k-images-idx3-ubyte"), file("t10k-labels-idx1-ubyte"), 5);

    mlp::DataSplits data = mlp::MnistLoader::load(dir.string(), 4);

    ASSERT_EQ(data.train.size(), 8);
    ASSERT_EQ(data.valid.size(), 4);
    ASSERT_EQ(data.test.size(), 5);
    EXPECT_EQ(data.train.features.cols(), 6);

    // Validation split is the tail of the training file
    EXPECT_EQ(data.valid.labels.front(), 8);
    EXPECT_NEAR(data.valid.features(0, 0), 80.0f / 255.0f, 1e-6f);
    EXPECT_NEAR(data.test.features(4, 5), 40.0f / 255.0f, 1e-6f);
    EXPECT_EQ(data.test.labels.back(), 4);
}

TEST_F(TempDirTest, MnistLoaderRejectsBadFiles) {
    EXPECT_THROW(mlp::MnistLoader::load_images(file("missing")), std::runtime_error);

    write_idx_pair(file("images"), file("labels"), 3);
    // Labels file passed as images
    EXPECT_THROW(mlp::MnistLoader::load_images(file("labels")), std::runtime_error);

    write_idx_pair(file("more-images"), file("more-labels"), 4);
    EXPECT_THROW(mlp::MnistLoader::load_split(file("more-images"), file("labels")),
                 std::runtime_error);

    {
        std::ofstream truncated(file("truncated"), std::ios::binary);
        write_be(truncated, mlp::MnistLoader::LABELS_MAGIC);
        write_be(truncated, 100);
        truncated.put(1);
    }
    EXPECT_THROW(mlp::MnistLoader::load_labels(file("truncated")), std::runtime_error);
}

TEST_F(TempDirTest, SnapshotRestoresNetwork) {
    mlp::Network trained(5, {4}, 3, mlp::Activation::Sigmoid, 1);
    std::mt19937 gen(2);
    for (mlp::Parameter* param : trained.parameters()) {
        param->value.uniform_init(1.0f, gen);
    }

    const mlp::Network& model = trained;
    mlp::save_snapshot(file("model.snapshot"), model.parameters());
    // Overwrites the previous archive
    mlp::save_snapshot(file("model.snapshot"), model.parameters());
    EXPECT_FALSE(fs::exists(file("model.snapshot.tmp")));

    mlp::Network restored(5, {4}, 3, mlp::Activation::Sigmoid, 99);
    restored.load_parameters(mlp::load_snapshot(file("model.snapshot")));

    mlp::Matrix x(2, 5, 0.3f);
    EXPECT_EQ(restored.forward(x).data_, trained.forward(x).data_);

    mlp::Network wrong_shape(5, {6}, 3);
    EXPECT_THROW(wrong_shape.load_parameters(mlp::load_snapshot(file("model.snapshot"))),
                 std::runtime_error);
}

TEST_F(TempDirTest, CorruptSnapshotThrows) {
    {
        std::ofstream out(file("bad.snapshot"), std::ios::binary);
        out << "not a snapshot";
    }
    EXPECT_THROW(mlp::load_snapshot(file("bad.snapshot")), std::runtime_error);
    EXPECT_THROW(mlp::load_snapshot(file("absent.snapshot")), std::runtime_error);

    mlp::Network network(2, {}, 2);
    const mlp::Network& model = network;
    mlp::save_snapshot(file("cut.snapshot"), model.parameters());
    fs::resize_file(file("cut.snapshot"), fs::file_size(file("cut.snapshot")) - 4);
    EXPECT_THROW(mlp::load_snapshot(file("cut.snapshot")), std::runtime_error);
}

TEST_F(TempDirTest, OversizedSnapshotHeaderThrowsRuntimeError) {
    // Shape does not fit in an int
    write_single_entry_snapshot(file("negative.snapshot"), 0x80000000u, 4, 4);
    EXPECT_THROW(mlp::load_snapshot(file("negative.snapshot")), std::runtime_error);

    // Shape fits but the payload would be far larger than the file
    write_single_entry_snapshot(file("huge.snapshot"), 65535, 65535, 4);
    EXPECT_THROW(mlp::load_snapshot(file("huge.snapshot")), std::runtime_error);

    write_single_entry_snapshot(file("ok.snapshot"), 2, 2, 4);
    auto values = mlp::load_snapshot(file("ok.snapshot"));
    ASSERT_EQ(values.count("x"), 1u);
    EXPECT_FLOAT_EQ(values.at("x")(1, 1), 0.5f);
}

TEST_F(TempDirTest, OversizedIdxHeaderThrowsRuntimeError) {
    {
        std::ofstream img(file("huge-images"), std::ios::binary);
        write_be(img, mlp::MnistLoader::IMAGES_MAGIC);
        write_be(img, 60000);
        write_be(img, 65535);
        write_be(img, 65535);
        img.put(0);
    }
    EXPECT_THROW(mlp::MnistLoader::load_images(file("huge-images")), std::runtime_error);

    {
        std::ofstream lbl(file("huge-labels"), std::ios::binary);
        write_be(lbl, mlp::MnistLoader::LABELS_MAGIC);
        write_be(lbl, 0xFFFFFFF0u);
        lbl.put(3);
    }
    EXPECT_THROW(mlp::MnistLoader::load_labels(file("huge-labels")), std::runtime_error);
}

TEST_F(TempDirTest, MatrixFileRoundTrip) {
    std::mt19937 gen(4);
    mlp::Matrix m(3, 7);
    m.uniform_init(2.0f, gen);
    m.save_to_file(file("m.bin"));

    mlp::Matrix loaded(3, 7);
    loaded.load_from_file(file("m.bin"));
    EXPECT_EQ(loaded.data_, m.data_);

    mlp::Matrix too_big(4, 7);
    EXPECT_THROW(too_big.load_from_file(file("m.bin")), std::runtime_error);
    EXPECT_THROW(loaded.load_from_file(file("missing.bin")), std::runtime_error);
}
