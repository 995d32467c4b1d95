#include "matrix.hpp"

#include "errors.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace bbpssw {

namespace {

std::string shape_of(std::size_t rows, std::size_t cols) {
    std::ostringstream oss;
    oss << rows << "x" << cols;
    return oss.str();
}

}  // namespace

Matrix::Matrix(std::size_t rows, std::size_t cols, std::vector<Complex> data)
    : rows_(rows), cols_(cols), data_(std::move(data)) {
    if (rows_ == 0 || cols_ == 0) {
        throw DimensionMismatch("matrix dimensions must be positive");
    }
    if (data_.size() != rows_ * cols_) {
        throw DimensionMismatch(
            "matrix data size " + std::to_string(data_.size()) +
            " does not match shape " + shape_of(rows_, cols_));
    }
}

Matrix Matrix::from_rows(const std::vector<std::vector<Complex>>& rows) {
    if (rows.empty() || rows.front().empty()) {
        throw DimensionMismatch("matrix dimensions must be positive");
    }
    const std::size_t cols = rows.front().size();
    std::vector<Complex> data;
    data.reserve(rows.size() * cols);
    for (const auto& row : rows) {
        if (row.size() != cols) {
            throw DimensionMismatch("all matrix rows must have the same length");
        }
        data.insert(data.end(), row.begin(), row.end());
    }
    return Matrix(rows.size(), cols, std::move(data));
}

Matrix Matrix::zeros(std::size_t rows, std::size_t cols) {
    return Matrix(rows, cols, std::vector<Complex>(rows * cols, kZero));
}

Matrix Matrix::identity(std::size_t n) {
    std::vector<Complex> data(n * n, kZero);
    for (std::size_t i = 0; i < n; ++i) {
        data[i * n + i] = kOne;
    }
    return Matrix(n, n, std::move(data));
}

Matrix Matrix::column(const std::vector<Complex>& values) {
    return Matrix(values.size(), 1, values);
}

const Complex& Matrix::at(std::size_t row, std::size_t col) const {
    if (row >= rows_ || col >= cols_) {
        throw std::out_of_range(
            "matrix index (" + std::to_string(row) + "," + std::to_string(col) +
            ") outside " + shape_of(rows_, cols_));
    }
    return data_[index(row, col)];
}

Matrix Matrix::add(const Matrix& other) const {
    return zip(other, [](const Complex& a, const Complex& b) { return a + b; });
}

Matrix Matrix::subtract(const Matrix& other) const {
    return zip(other, [](const Complex& a, const Complex& b) { return a - b; });
}

Matrix Matrix::scale(const Complex& factor) const {
    return map([&factor](const Complex& z) { return z * factor; });
}

Matrix Matrix::map(const std::function<Complex(const Complex&)>& fn) const {
    std::vector<Complex> out;
    out.reserve(data_.size());
    for (const auto& z : data_) {
        out.push_back(fn(z));
    }
    return Matrix(rows_, cols_, std::move(out));
}

Matrix Matrix::zip(
    const Matrix& other,
    const std::function<Complex(const Complex&, const Complex&)>& fn
) const {
    if (rows_ != other.rows_ || cols_ != other.cols_) {
        throw DimensionMismatch(
            "element-wise operation on " + shape_of(rows_, cols_) + " and " +
            shape_of(other.rows_, other.cols_));
    }
    std::vector<Complex> out;
    out.reserve(data_.size());
    for (std::size_t i = 0; i < data_.size(); ++i) {
        out.push_back(fn(data_[i], other.data_[i]));
    }
    return Matrix(rows_, cols_, std::move(out));
}

Matrix Matrix::multiply(const Matrix& other) const {
    if (cols_ != other.rows_) {
        throw DimensionMismatch(
            "cannot multiply " + shape_of(rows_, cols_) + " by " +
            shape_of(other.rows_, other.cols_));
    }
    std::vector<Complex> out(rows_ * other.cols_, kZero);
    for (std::size_t i = 0; i < rows_; ++i) {
        for (std::size_t k = 0; k < cols_; ++k) {
            const Complex a = data_[index(i, k)];
            if (a == kZero) {
                continue;
            }
            for (std::size_t j = 0; j < other.cols_; ++j) {
                out[i * other.cols_ + j] += a * other.data_[other.index(k, j)];
            }
        }
    }
    return Matrix(rows_, other.cols_, std::move(out));
}

Matrix Matrix::dagger() const {
    std::vector<Complex> out(data_.size());
    for (std::size_t i = 0; i < rows_; ++i) {
        for (std::size_t j = 0; j < cols_; ++j) {
            out[j * rows_ + i] = std::conj(data_[index(i, j)]);
        }
    }
    return Matrix(cols_, rows_, std::move(out));
}

Matrix Matrix::tensor(const Matrix& other) const {
    const std::size_t out_rows = rows_ * other.rows_;
    const std::size_t out_cols = cols_ * other.cols_;
    std::vector<Complex> out(out_rows * out_cols, kZero);
    for (std::size_t i = 0; i < rows_; ++i) {
        for (std::size_t j = 0; j < cols_; ++j) {
            const Complex a = data_[index(i, j)];
            if (a == kZero) {
                continue;
            }
            for (std::size_t k = 0; k < other.rows_; ++k) {
                for (std::size_t l = 0; l < other.cols_; ++l) {
                    const std::size_t row = i * other.rows_ + k;
                    const std::size_t col = j * other.cols_ + l;
                    out[row * out_cols + col] = a * other.data_[other.index(k, l)];
                }
            }
        }
    }
    return Matrix(out_rows, out_cols, std::move(out));
}

Complex Matrix::trace() const {
    if (!is_square()) {
        throw NotSquare("trace requires a square matrix, got " + shape_of(rows_, cols_));
    }
    Complex sum = kZero;
    for (std::size_t i = 0; i < rows_; ++i) {
        sum += data_[index(i, i)];
    }
    return sum;
}

bool Matrix::equals(const Matrix& other, double tolerance) const {
    if (rows_ != other.rows_ || cols_ != other.cols_) {
        return false;
    }
    for (std::size_t i = 0; i < data_.size(); ++i) {
        if (std::abs(data_[i] - other.data_[i]) > tolerance) {
            return false;
        }
    }
    return true;
}

bool Matrix::equals_up_to_global_phase(const Matrix& other, double tolerance) const {
    if (rows_ != other.rows_ || cols_ != other.cols_) {
        return false;
    }
    std::size_t pivot = 0;
    double best = -1.0;
    for (std::size_t i = 0; i < other.data_.size(); ++i) {
        const double magnitude = std::abs(other.data_[i]);
        if (magnitude > best) {
            best = magnitude;
            pivot = i;
        }
    }
    if (best <= tolerance) {
        return equals(other, tolerance);
    }
    if (std::abs(data_[pivot]) <= tolerance) {
        return false;
    }
    const Complex phase =
        std::polar(1.0, std::arg(other.data_[pivot]) - std::arg(data_[pivot]));
    return scale(phase).equals(other, tolerance);
}

std::string Matrix::to_string(int precision) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision);
    for (std::size_t i = 0; i < rows_; ++i) {
        oss << "[";
        for (std::size_t j = 0; j < cols_; ++j) {
            if (j > 0) {
                oss << ", ";
            }
            const Complex z = canonical(data_[index(i, j)]);
            oss << z.real() << (z.imag() < 0.0 ? "-" : "+") << std::abs(z.imag()) << "i";
        }
        oss << "]\n";
    }
    return oss.str();
}

Matrix operator*(const Matrix& lhs, const Matrix& rhs) {
    return lhs.multiply(rhs);
}

Matrix operator+(const Matrix& lhs, const Matrix& rhs) {
    return lhs.add(rhs);
}

}  // namespace bbpssw
