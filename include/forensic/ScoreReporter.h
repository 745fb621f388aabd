#pragma once

#include "forensic/HeuristicScorer.h"
#include <ostream>
#include <string>

namespace SynthScan {
namespace Forensic {

/**
 * @brief Human-readable breakdown of a ScoreDetail
 */
class ScoreReporter {
public:
    explicit ScoreReporter(std::ostream& out) : out_(out) {}

    void print(const ScoreDetail& detail) const;

    /**
     * @brief Four-level verdict: >70, >50, >30, otherwise human
     */
    static std::string conclusion(double score);

private:
    std::ostream& out_;

    void printRule() const;
};

} // namespace Forensic
} // namespace SynthScan
