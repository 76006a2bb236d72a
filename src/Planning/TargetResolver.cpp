#include "Planning/TargetResolver.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "Logger.hpp"

TargetResolver::TargetResolver(WeightBounds weightBounds, realtype min_dose, realtype max_dose)
    : weightBounds(weightBounds), min_dose(min_dose), max_dose(max_dose) {
    if (!(weightBounds.min_kg > 0.0 && weightBounds.max_kg >= weightBounds.min_kg)) {
        throw ConfigurationError("Weight bounds must satisfy 0 < min <= max.");
    }
    if (!(min_dose > 0.0 && max_dose >= min_dose)) {
        throw ConfigurationError("Dose bounds must satisfy 0 < min <= max.");
    }
}

DoseTarget TargetResolver::resolve(realtype weight_kg, realtype dose_per_kg, const SeparatorProfile& separator) const {
    if (!(weight_kg >= weightBounds.min_kg && weight_kg <= weightBounds.max_kg)) {
        throw std::invalid_argument("Weight " + std::to_string(weight_kg) + " kg outside [" +
                                    std::to_string(weightBounds.min_kg) + ", " + std::to_string(weightBounds.max_kg) +
                                    "] kg.");
    }
    if (!(dose_per_kg >= min_dose && dose_per_kg <= max_dose)) {
        throw std::invalid_argument("Dose " + std::to_string(dose_per_kg) + " x10^6 cells/kg outside [" +
                                    std::to_string(min_dose) + ", " + std::to_string(max_dose) + "].");
    }
    separator.validate();

    const realtype cells = weight_kg * dose_per_kg * protocol::cells_per_dose_unit;
    const realtype volume = std::max(separator.min_volume_mL, cells / separator.cells_per_mL);

    LOG("target_resolver.log", "weight=" << weight_kg << " kg, dose=" << dose_per_kg << " -> target " << cells
                                         << " cells, collect " << volume << " mL from '" << separator.name << "'\n");

    return DoseTarget{weight_kg, dose_per_kg, cells, volume};
}
