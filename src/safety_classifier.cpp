#include "safety_classifier.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

SafetyClassifier::SafetyClassifier() : SafetyClassifier(defaultBands()) {}

SafetyClassifier::SafetyClassifier(std::vector<SafetyBand> table) : bands(std::move(table)) {
    if (bands.empty()) {
        throw std::invalid_argument("Safety table must contain at least one band");
    }
    for (size_t i = 1; i < bands.size(); ++i) {
        if (bands[i].upper_bound_pct <= bands[i - 1].upper_bound_pct) {
            throw std::invalid_argument("Safety bands must have ascending upper bounds");
        }
    }
}

std::vector<SafetyBand> SafetyClassifier::defaultBands() {
    return {
        {40.0, {SafetyLevel::GREEN, "NOMINAL", "Core stress within design margin"}},
        {70.0, {SafetyLevel::YELLOW, "ELEVATED", "Elevated stress - monitoring required"}},
        {90.0, {SafetyLevel::ORANGE, "HIGH", "High stress - full safety protocols active"}},
        {std::numeric_limits<double>::infinity(),
         {SafetyLevel::RED, "CRITICAL", "Critical stress - prepare emergency shutdown"}},
    };
}

SafetyAssessment SafetyClassifier::classify(double material_stress_pct) const {
    for (const auto& band : bands) {
        if (material_stress_pct < band.upper_bound_pct) {
            return band.assessment;
        }
    }
    return bands.back().assessment;
}

double materialStressPct(double rpm, double max_rpm, double exponent) {
    if (max_rpm <= 0.0 || rpm <= 0.0) {
        return 0.0;
    }
    double ratio = std::min(rpm / max_rpm, 1.0);
    return std::clamp(100.0 * std::pow(ratio, exponent), 0.0, 100.0);
}
