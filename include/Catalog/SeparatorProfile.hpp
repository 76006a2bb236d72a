#ifndef SEPARATOR_PROFILE_HPP
#define SEPARATOR_PROFILE_HPP

#include <string>

#include "ConfigurationError.hpp"
#include "ProtocolConstants.hpp"
#include "sundials/sundials_types.h"

/**
 * @brief Cell yield of a separator (apheresis) run
 *
 * Cells obtainable per mL of collected source material and the minimum
 * volume that is drawn regardless of the required cell count.
 */
struct SeparatorProfile {
    std::string name;
    realtype cells_per_mL = protocol::pbsc_yield;
    realtype min_volume_mL = protocol::min_collection_volume;

    SeparatorProfile(const std::string& name,
                     realtype cells_per_mL = protocol::pbsc_yield,
                     realtype min_volume_mL = protocol::min_collection_volume)
        : name(name), cells_per_mL(cells_per_mL), min_volume_mL(min_volume_mL) {}

    void validate() const {
        if (!(cells_per_mL > 0.0)) {
            throw ConfigurationError("Separator '" + name + "' must have a positive cell yield per mL!");
        }
        if (!(min_volume_mL >= 0.0)) {
            throw ConfigurationError("Separator '" + name + "' must have a non-negative minimum volume!");
        }
    }
};

#endif  // SEPARATOR_PROFILE_HPP
