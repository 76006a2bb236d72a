#ifndef VESSEL_TYPE_HPP
#define VESSEL_TYPE_HPP

#include <string>

#include "ConfigurationError.hpp"
#include "sundials/sundials_types.h"

/**
 * @brief Culture vessel metadata
 *
 * Surface area, seeded and confluent cell counts per vessel and the medium
 * volume used per vessel and medium change. Provides a fluent builder-style
 * API; every setter checks its value and throws ConfigurationError.
 */
class VesselType {
   public:
    std::string name;
    realtype surface_area = 0;       // cm²
    realtype seeding_cells = 0;      // cells seeded into one vessel
    realtype confluent_cells = 0;    // cells harvested from one vessel at confluency
    realtype medium_volume = 0;      // mL per vessel per medium change
    realtype min_medium_volume = 0;  // mL, lower bound for per-run overrides
    realtype max_medium_volume = 0;  // mL, upper bound for per-run overrides

    explicit VesselType(const std::string& name) : name(name) {}

    // Derives seeded/confluent counts from densities, default medium is the lower end of the range
    static VesselType fromSurfaceDensity(const std::string& name,
                                         realtype surface_area_cm2,
                                         realtype seeding_density_per_cm2,
                                         realtype confluency_density_per_cm2,
                                         realtype harvest_confluency,
                                         realtype min_medium_mL,
                                         realtype max_medium_mL);

    VesselType& setSurfaceArea(realtype area_cm2) {
        if (!(area_cm2 > 0.0)) {
            throw ConfigurationError("Surface area of vessel '" + name + "' must be positive!");
        }
        surface_area = area_cm2;
        return *this;
    }
    VesselType& setSeedingCells(realtype cells) {
        if (!(cells > 0.0)) {
            throw ConfigurationError("Seeding cell count of vessel '" + name + "' must be positive!");
        }
        seeding_cells = cells;
        return *this;
    }
    VesselType& setConfluentCells(realtype cells) {
        if (!(cells > 0.0)) {
            throw ConfigurationError("Confluent cell count of vessel '" + name + "' must be positive!");
        }
        confluent_cells = cells;
        return *this;
    }
    // Sets the default volume; widens the allowed range if it was not set yet
    VesselType& setMediumVolume(realtype volume_mL) {
        if (!(volume_mL > 0.0)) {
            throw ConfigurationError("Medium volume of vessel '" + name + "' must be positive!");
        }
        medium_volume = volume_mL;
        if (min_medium_volume <= 0.0 || min_medium_volume > volume_mL) min_medium_volume = volume_mL;
        if (max_medium_volume < volume_mL) max_medium_volume = volume_mL;
        return *this;
    }
    VesselType& setMediumVolumeRange(realtype min_mL, realtype max_mL) {
        if (!(min_mL > 0.0 && max_mL >= min_mL)) {
            throw ConfigurationError("Medium volume range of vessel '" + name + "' must satisfy 0 < min <= max!");
        }
        min_medium_volume = min_mL;
        max_medium_volume = max_mL;
        return *this;
    }

    // Checks all invariants, the fields are public and may have been changed after building
    void validate() const;

    // Growth factor of one passage (confluent / seeded)
    realtype expansionFactor() const { return confluent_cells / seeding_cells; }

    bool acceptsMediumVolume(realtype volume_mL) const {
        return volume_mL >= min_medium_volume && volume_mL <= max_medium_volume;
    }
};

#endif  // VESSEL_TYPE_HPP
