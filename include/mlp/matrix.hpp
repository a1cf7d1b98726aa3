// include/mlp/matrix.hpp
#pragma once

#include <vector>
#include <string>
#include <random>
#include <cstdint>
#include <iosfwd>

namespace mlp {

// Row-major float matrix. Vectors are stored as 1 x n matrices.
class Matrix {
public:
    Matrix();
    Matrix(int rows, int cols);
    Matrix(int rows, int cols, float init_val);

    float& operator()(int i, int j);
    const float& operator()(int i, int j) const;

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    bool same_shape(const Matrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_;
    }
    std::string shape_str() const;

    void fill(float value);
    void uniform_init(float limit, std::mt19937& gen);

    // this * other
    Matrix matmul(const Matrix& other) const;
    // this^T * other
    Matrix transpose_matmul(const Matrix& other) const;
    // this * other^T
    Matrix matmul_transpose(const Matrix& other) const;
    // Adds a 1 x cols row vector to every row.
    void add_row_vector(const Matrix& row);
    // Column sums as a 1 x cols matrix.
    Matrix column_sums() const;

    void save_to_file(const std::string& filename) const;
    void load_from_file(const std::string& filename);
    // Raw float payload, no header.
    void write_to(std::ostream& out) const;
    void read_from(std::istream& in);

    std::vector<float> data_;
    int rows_, cols_;
};

} // namespace mlp
