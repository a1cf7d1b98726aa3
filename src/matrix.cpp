#include "mlp/matrix.hpp"
#include <fstream>
#include <stdexcept>
#include <cmath>
#include <algorithm>

namespace mlp {

Matrix::Matrix() : rows_(0), cols_(0) {}

Matrix::Matrix(int rows, int cols)
    : data_(static_cast<size_t>(rows) * cols, 0.0f), rows_(rows), cols_(cols) {}

Matrix::Matrix(int rows, int cols, float init_val)
    : data_(static_cast<size_t>(rows) * cols, init_val), rows_(rows), cols_(cols) {}

float& Matrix::operator()(int i, int j) {
    return data_[static_cast<size_t>(i) * cols_ + j];
}

const float& Matrix::operator()(int i, int j) const {
    return data_[static_cast<size_t>(i) * cols_ + j];
}

std::string Matrix::shape_str() const {
    return "(" + std::to_string(rows_) + ", " + std::to_string(cols_) + ")";
}

void Matrix::fill(float value) {
    std::fill(data_.begin(), data_.end(), value);
}

void Matrix::uniform_init(float limit, std::mt19937& gen) {
    std::uniform_real_distribution<float> dist(-limit, limit);

    for (auto& val : data_) {
        val = dist(gen);
    }
}

Matrix Matrix::matmul(const Matrix& other) const {
    if (cols_ != other.rows_) {
        throw std::runtime_error("matmul dimension mismatch: " + shape_str() +
                                 " x " + other.shape_str());
    }

    Matrix out(rows_, other.cols_);
    #pragma omp parallel for
    for (int i = 0; i < rows_; ++i) {
        for (int k = 0; k < cols_; ++k) {
            const float a = (*this)(i, k);
            if (a == 0.0f) continue;
            for (int j = 0; j < other.cols_; ++j) {
                out(i, j) += a * other(k, j);
            }
        }
    }
    return out;
}

Matrix Matrix::transpose_matmul(const Matrix& other) const {
    if (rows_ != other.rows_) {
        throw std::runtime_error("transpose_matmul dimension mismatch: " +
                                 shape_str() + "^T x " + other.shape_str());
    }

    Matrix out(cols_, other.cols_);
    #pragma omp parallel for
    for (int i = 0; i < cols_; ++i) {
        for (int k = 0; k < rows_; ++k) {
            const float a = (*this)(k, i);
            if (a == 0.0f) continue;
            for (int j = 0; j < other.cols_; ++j) {
                out(i, j) += a * other(k, j);
            }
        }
    }
    return out;
}

Matrix Matrix::matmul_transpose(const Matrix& other) const {
    if (cols_ != other.cols_) {
        throw std::runtime_error("matmul_transpose dimension mismatch: " +
                                 shape_str() + " x " + other.shape_str() + "^T");
    }

    Matrix out(rows_, other.rows_);
    #pragma omp parallel for
    for (int i = 0; i < rows_; ++i) {
        for (int j = 0; j < other.rows_; ++j) {
            float sum = 0.0f;
            for (int k = 0; k < cols_; ++k) {
                sum += (*this)(i, k) * other(j, k);
            }
            out(i, j) = sum;
        }
    }
    return out;
}

void Matrix::add_row_vector(const Matrix& row) {
    if (row.rows_ != 1 || row.cols_ != cols_) {
        throw std::runtime_error("Row vector shape mismatch. Expected: (1, " +
                                 std::to_string(cols_) + ") Got: " + row.shape_str());
    }

    for (int i = 0; i < rows_; ++i) {
        for (int j = 0; j < cols_; ++j) {
            (*this)(i, j) += row(0, j);
        }
    }
}

Matrix Matrix::column_sums() const {
    Matrix out(1, cols_);
    for (int i = 0; i < rows_; ++i) {
        for (int j = 0; j < cols_; ++j) {
            out(0, j) += (*this)(i, j);
        }
    }
    return out;
}

void Matrix::write_to(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(data_.data()),
              data_.size() * sizeof(float));
}

void Matrix::read_from(std::istream& in) {
    in.read(reinterpret_cast<char*>(data_.data()),
            data_.size() * sizeof(float));

    if (in.gcount() != static_cast<std::streamsize>(data_.size() * sizeof(float))) {
        throw std::runtime_error("Unexpected end of data while reading " +
                                 shape_str() + " matrix");
    }
}

void Matrix::save_to_file(const std::string& filename) const {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }

    write_to(file);
}

void Matrix::load_from_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Could not open file for reading: " + filename);
    }

    read_from(file);
}

} // namespace mlp
