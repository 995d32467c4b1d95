#include "complex_utils.hpp"

#include "errors.hpp"

namespace bbpssw {

namespace {

double canonical_zero(double value) {
    return value == 0.0 ? 0.0 : value;
}

}  // namespace

Complex canonical(const Complex& z) {
    return Complex{canonical_zero(z.real()), canonical_zero(z.imag())};
}

Complex divide(const Complex& a, const Complex& b) {
    const double denom = squared_magnitude(b);
    if (denom < kDivisionEpsilon) {
        throw DivisionByZero("complex division by zero");
    }
    const Complex num = a * std::conj(b);
    return canonical(Complex{num.real() / denom, num.imag() / denom});
}

}  // namespace bbpssw
