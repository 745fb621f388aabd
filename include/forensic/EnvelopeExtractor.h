#pragma once

#include <cstddef>
#include <vector>

namespace SynthScan {
namespace Forensic {

struct HullPoint {
    int index;
    double value;
};

/**
 * Strictly increasing indices; holds index 0 and the last index of its curve.
 */
using Hull = std::vector<HullPoint>;

struct EnvelopeResult {
    Hull hull;
    std::vector<double> floor;      ///< Interpolated hull, clipped from below
    std::vector<double> residual;   ///< max(0, curve - floor)
};

/**
 * @brief Lower-envelope (noise floor) estimation for spectral curves
 *
 * A window of `area` bins slides over the curve and the position of each
 * window's minimum becomes a hull point. The hull is interpolated with a
 * quadratic spline back onto the curve grid and clipped at `floorDb`.
 *
 * Curves shorter than `area` are scanned with one window spanning the whole
 * curve. An empty curve gives an empty hull and residual.
 */
class EnvelopeExtractor {
public:
    static constexpr int kDefaultArea = 10;
    static constexpr double kDefaultFloorDb = -45.0;

    explicit EnvelopeExtractor(int area = kDefaultArea, double floorDb = kDefaultFloorDb);

    Hull lowerHull(const std::vector<double>& curve) const;

    /**
     * @brief Interpolated hull over indices [0, length), clipped at the floor
     */
    std::vector<double> noiseFloor(const Hull& hull, size_t length) const;

    EnvelopeResult extract(const std::vector<double>& curve) const;

    int getArea() const { return area_; }
    double getFloorDb() const { return floorDb_; }

private:
    int area_;
    double floorDb_;
};

} // namespace Forensic
} // namespace SynthScan
