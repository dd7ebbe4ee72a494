#ifndef SAFETY_CLASSIFIER_H
#define SAFETY_CLASSIFIER_H

#include "spin_core.hpp"
#include <vector>

/// @brief One band of the classification table: applies while stress < upper_bound_pct.
struct SafetyBand {
    double upper_bound_pct;
    SafetyAssessment assessment;
};

/**
 * @class SafetyClassifier
 * @brief Maps material stress to a discrete safety level.
 *
 * Bands are checked in ascending order of their upper bound; the first band
 * whose bound exceeds the stress wins. Stress at or above the last bound
 * falls into the last band.
 */
class SafetyClassifier {
public:
    /// @brief NOMINAL < 40% <= ELEVATED < 70% <= HIGH < 90% <= CRITICAL.
    SafetyClassifier();

    /// @throw std::invalid_argument if the table is empty or not ascending.
    explicit SafetyClassifier(std::vector<SafetyBand> bands);

    SafetyAssessment classify(double material_stress_pct) const;

    static std::vector<SafetyBand> defaultBands();

private:
    std::vector<SafetyBand> bands;
};

/**
 * @brief Material stress in percent of the design limit.
 *
 * 100 * (rpm / max_rpm)^exponent, clamped to [0, 100]. Monotonically
 * increasing in rpm for any exponent >= 1.
 */
double materialStressPct(double rpm, double max_rpm, double exponent);

#endif // SAFETY_CLASSIFIER_H
