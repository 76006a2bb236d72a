#ifndef TARGET_RESOLVER_HPP
#define TARGET_RESOLVER_HPP

#include "Catalog/SeparatorProfile.hpp"
#include "Planning/DoseTarget.hpp"
#include "ProtocolConstants.hpp"

/// @brief Clinically valid weight window
struct WeightBounds {
    realtype min_kg = protocol::min_weight_adult;
    realtype max_kg = protocol::max_weight;

    static WeightBounds adult() { return {protocol::min_weight_adult, protocol::max_weight}; }
    static WeightBounds pediatric() { return {protocol::min_weight_pediatric, protocol::max_weight}; }
};

/**
 * @brief Converts weight and dose per weight into a DoseTarget
 *
 * cells = weight · dose · 10⁶; collection volume = max(separator floor, cells / yield).
 * Out-of-range weight or dose throws std::invalid_argument, a separator
 * with non-positive yield throws ConfigurationError.
 */
class TargetResolver {
   public:
    explicit TargetResolver(WeightBounds weightBounds = WeightBounds::adult(),
                            realtype min_dose = protocol::min_dose_per_weight,
                            realtype max_dose = protocol::max_dose_per_weight);

    DoseTarget resolve(realtype weight_kg, realtype dose_per_kg, const SeparatorProfile& separator) const;

    const WeightBounds& getWeightBounds() const { return weightBounds; }

   private:
    WeightBounds weightBounds;
    realtype min_dose;
    realtype max_dose;
};

#endif  // TARGET_RESOLVER_HPP
