#include "dsp/QuadraticSpline.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace SynthScan {
namespace DSP {

namespace {
constexpr int kDegree = 2;
}

QuadraticSpline::QuadraticSpline(std::vector<double> x, std::vector<double> y)
    : x_(std::move(x)), y_(std::move(y)) {
    if (x_.empty() || x_.size() != y_.size()) {
        throw std::invalid_argument("Spline needs matching, non-empty x and y");
    }
    for (size_t i = 1; i < x_.size(); ++i) {
        if (!(x_[i] > x_[i - 1])) {
            throw std::invalid_argument("Spline x values must be strictly increasing");
        }
    }

    if (x_.size() > 2) {
        const size_t m = x_.size();
        knots_.reserve(m + kDegree + 1);
        knots_.insert(knots_.end(), kDegree + 1, x_.front());
        for (size_t i = 1; i + 2 < m; ++i) {
            knots_.push_back(0.5 * (x_[i] + x_[i + 1]));
        }
        knots_.insert(knots_.end(), kDegree + 1, x_.back());
        solveCoefficients();
    }
}

int QuadraticSpline::findSpan(double x) const {
    // Valid spans are [degree, m - 1]; anything outside is extrapolated
    const int m = static_cast<int>(x_.size());
    auto first = knots_.begin() + kDegree;
    auto last = knots_.begin() + m;
    int span = static_cast<int>(std::upper_bound(first, last, x) - knots_.begin()) - 1;
    return std::clamp(span, kDegree, m - 1);
}

void QuadraticSpline::basisFunctions(int span, double x, double* basis) const {
    double left[kDegree + 1];
    double right[kDegree + 1];

    basis[0] = 1.0;
    for (int j = 1; j <= kDegree; ++j) {
        left[j] = x - knots_[span + 1 - j];
        right[j] = knots_[span + j] - x;
        double saved = 0.0;
        for (int r = 0; r < j; ++r) {
            const double temp = basis[r] / (right[r + 1] + left[j - r]);
            basis[r] = saved + right[r + 1] * temp;
            saved = left[j - r] * temp;
        }
        basis[j] = saved;
    }
}

void QuadraticSpline::solveCoefficients() {
    const size_t m = x_.size();
    coefficients_.assign(m, 0.0);

    // End rows are identity: the spline passes through the end samples
    coefficients_[0] = y_[0];
    coefficients_[m - 1] = y_[m - 1];

    const size_t n = m - 2;
    std::vector<double> lower(n), diag(n), upper(n), rhs(n);

    // Interior sample i lies in span i + 1, touching basis i - 1, i, i + 1
    for (size_t row = 0; row < n; ++row) {
        const size_t i = row + 1;
        double basis[kDegree + 1];
        basisFunctions(static_cast<int>(i) + 1, x_[i], basis);

        lower[row] = basis[0];
        diag[row] = basis[1];
        upper[row] = basis[2];
        rhs[row] = y_[i];
    }
    rhs[0] -= lower[0] * coefficients_[0];
    rhs[n - 1] -= upper[n - 1] * coefficients_[m - 1];

    // Thomas algorithm; the collocation matrix is totally positive, no pivoting needed
    for (size_t row = 1; row < n; ++row) {
        const double factor = lower[row] / diag[row - 1];
        diag[row] -= factor * upper[row - 1];
        rhs[row] -= factor * rhs[row - 1];
    }

    coefficients_[n] = rhs[n - 1] / diag[n - 1];
    for (size_t row = n - 1; row-- > 0;) {
        coefficients_[row + 1] = (rhs[row] - upper[row] * coefficients_[row + 2]) / diag[row];
    }
}

double QuadraticSpline::operator()(double x) const {
    const size_t m = x_.size();
    if (m == 1) {
        return y_[0];
    }
    if (m == 2) {
        const double t = (x - x_[0]) / (x_[1] - x_[0]);
        return y_[0] + t * (y_[1] - y_[0]);
    }

    const int span = findSpan(x);
    double basis[kDegree + 1];
    basisFunctions(span, x, basis);

    double value = 0.0;
    for (int r = 0; r <= kDegree; ++r) {
        value += basis[r] * coefficients_[span - kDegree + r];
    }
    return value;
}

std::vector<double> QuadraticSpline::evaluate(const std::vector<double>& x) const {
    std::vector<double> out(x.size());
    std::transform(x.begin(), x.end(), out.begin(), [this](double v) { return (*this)(v); });
    return out;
}

} // namespace DSP
} // namespace SynthScan
