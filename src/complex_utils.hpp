#pragma once

#include <complex>

namespace bbpssw {

using Complex = std::complex<double>;

inline constexpr Complex kZero{0.0, 0.0};
inline constexpr Complex kOne{1.0, 0.0};
inline constexpr Complex kImaginaryUnit{0.0, 1.0};
inline constexpr double kPi = 3.14159265358979323846;

// Below this squared magnitude a denominator is treated as zero.
inline constexpr double kDivisionEpsilon = 1e-300;

inline Complex complex_real(double re) {
    return Complex{re, 0.0};
}

inline double squared_magnitude(const Complex& z) {
    return std::norm(z);
}

// Replaces -0.0 components with +0.0 so that printed and compared values
// do not depend on the sign of zero.
Complex canonical(const Complex& z);

// a / b, throwing DivisionByZero when |b|^2 is below kDivisionEpsilon.
Complex divide(const Complex& a, const Complex& b);

}  // namespace bbpssw
