#include "forensic/LinearModel.h"
#include "core/ByteOrder.h"
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <utility>

namespace SynthScan {
namespace Forensic {

namespace {

constexpr char kMagic[4] = {'S', 'S', 'L', 'M'};

// Upper bound on the stored vector so a corrupt count cannot trigger a huge allocation
constexpr uint32_t kMaxFeatures = 1u << 20;

// magic[4], version u32, numFeatures u32
constexpr size_t kHeaderSize = 12;

} // namespace

// ============================================================================
// LinearModel
// ============================================================================

LinearModel::LinearModel(std::vector<double> coefficients, double intercept)
    : coefficients_(std::move(coefficients)), intercept_(intercept) {
    if (coefficients_.empty()) {
        throw std::invalid_argument("Linear model needs at least one coefficient");
    }
}

double LinearModel::decisionFunction(const std::vector<double>& x) const {
    if (x.size() != coefficients_.size()) {
        throw std::invalid_argument("Feature count " + std::to_string(x.size()) +
                                    " does not match model (" +
                                    std::to_string(coefficients_.size()) + ")");
    }

    double decision = intercept_;
    for (size_t i = 0; i < x.size(); ++i) {
        decision += coefficients_[i] * x[i];
    }
    return decision;
}

std::array<double, 2> LinearModel::predictProbability(const std::vector<double>& x) const {
    const double ai = 1.0 / (1.0 + std::exp(-decisionFunction(x)));
    return {1.0 - ai, ai};
}

bool LinearModel::predict(const std::vector<double>& x) const {
    return decisionFunction(x) > 0.0;
}

// ============================================================================
// ModelStore
// ============================================================================

LinearModel ModelStore::load(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw ModelLoadError("Failed to open model: " + filepath);
    }

    uint8_t header[kHeaderSize];
    file.read(reinterpret_cast<char*>(header), sizeof(header));
    if (file.gcount() != static_cast<std::streamsize>(sizeof(header)) ||
        std::memcmp(header, kMagic, 4) != 0) {
        throw ModelLoadError("Not a model file: " + filepath);
    }
    const uint32_t version = Core::ByteOrder::readLE32(header + 4);
    const uint32_t numFeatures = Core::ByteOrder::readLE32(header + 8);
    if (version != kVersion) {
        throw ModelLoadError("Unsupported model version " + std::to_string(version) +
                             ": " + filepath);
    }
    if (numFeatures == 0 || numFeatures > kMaxFeatures) {
        throw ModelLoadError("Invalid feature count in model: " + filepath);
    }

    // Intercept followed by the coefficients, all little-endian doubles
    std::vector<uint8_t> raw((static_cast<size_t>(numFeatures) + 1) * sizeof(double));
    file.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    if (!file) {
        throw ModelLoadError("Truncated model file: " + filepath);
    }

    const double intercept = Core::ByteOrder::readLEDouble(raw.data());
    std::vector<double> coefficients(numFeatures);
    for (size_t i = 0; i < coefficients.size(); ++i) {
        coefficients[i] = Core::ByteOrder::readLEDouble(raw.data() + (i + 1) * sizeof(double));
    }

    if (!std::isfinite(intercept)) {
        throw ModelLoadError("Non-finite intercept in model: " + filepath);
    }
    for (double c : coefficients) {
        if (!std::isfinite(c)) {
            throw ModelLoadError("Non-finite coefficient in model: " + filepath);
        }
    }

    std::cout << "[ModelStore] Loaded: " << filepath << " (" << numFeatures
              << " features)" << std::endl;

    return LinearModel(std::move(coefficients), intercept);
}

bool ModelStore::save(const std::string& filepath, const LinearModel& model) {
    std::ofstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[ModelStore] Failed to create file: " << filepath << std::endl;
        return false;
    }

    const std::vector<double>& coefficients = model.getCoefficients();
    std::vector<uint8_t> raw(kHeaderSize + (coefficients.size() + 1) * sizeof(double));
    std::memcpy(raw.data(), kMagic, 4);
    Core::ByteOrder::writeLE32(raw.data() + 4, kVersion);
    Core::ByteOrder::writeLE32(raw.data() + 8, static_cast<uint32_t>(coefficients.size()));
    Core::ByteOrder::writeLEDouble(raw.data() + kHeaderSize, model.getIntercept());
    for (size_t i = 0; i < coefficients.size(); ++i) {
        Core::ByteOrder::writeLEDouble(raw.data() + kHeaderSize + (i + 1) * sizeof(double),
                                       coefficients[i]);
    }

    file.write(reinterpret_cast<const char*>(raw.data()), static_cast<std::streamsize>(raw.size()));

    if (!file) {
        std::cerr << "[ModelStore] Write failed: " << filepath << std::endl;
        return false;
    }

    std::cout << "[ModelStore] Saved: " << filepath << std::endl;
    return true;
}

} // namespace Forensic
} // namespace SynthScan
