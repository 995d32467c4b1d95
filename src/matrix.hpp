#pragma once

#include "complex_utils.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace bbpssw {

// Dense row-major complex matrix. Instances are immutable: every operation
// returns a new matrix.
class Matrix {
  public:
    Matrix(std::size_t rows, std::size_t cols, std::vector<Complex> data);

    // Builds a matrix from nested rows. All rows must have the same length.
    static Matrix from_rows(const std::vector<std::vector<Complex>>& rows);
    static Matrix zeros(std::size_t rows, std::size_t cols);
    static Matrix identity(std::size_t n);
    // Column vector (n x 1).
    static Matrix column(const std::vector<Complex>& values);

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }
    bool is_square() const { return rows_ == cols_; }
    const std::vector<Complex>& data() const { return data_; }

    const Complex& at(std::size_t row, std::size_t col) const;

    Matrix add(const Matrix& other) const;
    Matrix subtract(const Matrix& other) const;
    Matrix scale(const Complex& factor) const;
    Matrix map(const std::function<Complex(const Complex&)>& fn) const;
    Matrix zip(
        const Matrix& other,
        const std::function<Complex(const Complex&, const Complex&)>& fn
    ) const;
    Matrix multiply(const Matrix& other) const;
    Matrix dagger() const;
    Matrix tensor(const Matrix& other) const;
    Complex trace() const;

    bool equals(const Matrix& other, double tolerance = 1e-10) const;
    // Compares after rotating this matrix onto the global phase of `other`,
    // taken from its largest-magnitude entry.
    bool equals_up_to_global_phase(const Matrix& other, double tolerance = 1e-10) const;

    std::string to_string(int precision = 4) const;

  private:
    std::size_t index(std::size_t row, std::size_t col) const {
        return row * cols_ + col;
    }

    std::size_t rows_;
    std::size_t cols_;
    std::vector<Complex> data_;
};

Matrix operator*(const Matrix& lhs, const Matrix& rhs);
Matrix operator+(const Matrix& lhs, const Matrix& rhs);

}  // namespace bbpssw
