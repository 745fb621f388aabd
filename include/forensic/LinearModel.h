#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace SynthScan {
namespace Forensic {

/**
 * @brief Raised when a persisted model is missing, truncated or malformed
 */
class ModelLoadError : public std::runtime_error {
public:
    explicit ModelLoadError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Binary logistic model over the raw fakeprint vector
 *
 * decision(x) = intercept + sum(coef[i] * x[i]); class 1 (AI) when decision > 0.
 */
class LinearModel {
public:
    LinearModel(std::vector<double> coefficients, double intercept);

    double decisionFunction(const std::vector<double>& x) const;

    /**
     * @brief Class probabilities {human, ai}
     */
    std::array<double, 2> predictProbability(const std::vector<double>& x) const;

    bool predict(const std::vector<double>& x) const;

    size_t getNumFeatures() const { return coefficients_.size(); }
    const std::vector<double>& getCoefficients() const { return coefficients_; }
    double getIntercept() const { return intercept_; }

private:
    std::vector<double> coefficients_;
    double intercept_;
};

/**
 * @brief Binary persistence of LinearModel weights
 *
 * Layout (little-endian): "SSLM", uint32 version, uint32 numFeatures,
 * float64 intercept, float64 coefficients[numFeatures].
 */
class ModelStore {
public:
    static constexpr uint32_t kVersion = 1;

    /**
     * @throws ModelLoadError
     */
    static LinearModel load(const std::string& filepath);

    static bool save(const std::string& filepath, const LinearModel& model);
};

} // namespace Forensic
} // namespace SynthScan
