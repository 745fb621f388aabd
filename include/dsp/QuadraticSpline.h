#pragma once

#include <cstddef>
#include <vector>

namespace SynthScan {
namespace DSP {

/**
 * @brief Interpolating quadratic B-spline
 *
 * Knots sit at the data ends (multiplicity 3) and at the midpoints between
 * interior samples, skipping the first and last midpoint, which makes the
 * collocation system square and tridiagonal. Evaluation outside [x0, xn]
 * extends the end polynomials.
 *
 * One sample interpolates as a constant, two samples linearly.
 */
class QuadraticSpline {
public:
    /**
     * @throws std::invalid_argument if x is empty, sizes differ, or x is not strictly increasing
     */
    QuadraticSpline(std::vector<double> x, std::vector<double> y);

    double operator()(double x) const;
    std::vector<double> evaluate(const std::vector<double>& x) const;

    size_t getNumPoints() const { return x_.size(); }

private:
    std::vector<double> x_;
    std::vector<double> y_;
    std::vector<double> knots_;
    std::vector<double> coefficients_;

    int findSpan(double x) const;
    void basisFunctions(int span, double x, double* basis) const;
    void solveCoefficients();
};

} // namespace DSP
} // namespace SynthScan
