#include "Catalog/VesselType.hpp"

VesselType VesselType::fromSurfaceDensity(const std::string& name,
                                          realtype surface_area_cm2,
                                          realtype seeding_density_per_cm2,
                                          realtype confluency_density_per_cm2,
                                          realtype harvest_confluency,
                                          realtype min_medium_mL,
                                          realtype max_medium_mL) {
    if (!(harvest_confluency > 0.0 && harvest_confluency <= 1.0)) {
        throw ConfigurationError("Harvest confluency of vessel '" + name + "' must be in (0, 1]!");
    }
    VesselType vessel(name);
    vessel.setSurfaceArea(surface_area_cm2)
        .setSeedingCells(surface_area_cm2 * seeding_density_per_cm2)
        .setConfluentCells(surface_area_cm2 * confluency_density_per_cm2 * harvest_confluency)
        .setMediumVolumeRange(min_medium_mL, max_medium_mL)
        .setMediumVolume(min_medium_mL);
    vessel.validate();
    return vessel;
}

void VesselType::validate() const {
    if (!(surface_area > 0.0)) {
        throw ConfigurationError("Vessel '" + name + "': surface area must be positive.");
    }
    if (!(seeding_cells > 0.0) || !(confluent_cells > 0.0)) {
        throw ConfigurationError("Vessel '" + name + "': seeding and confluent cell counts must be positive.");
    }
    if (!(confluent_cells > seeding_cells)) {
        throw ConfigurationError("Vessel '" + name + "': confluent cell count must exceed the seeding cell count.");
    }
    if (!(medium_volume > 0.0)) {
        throw ConfigurationError("Vessel '" + name + "': medium volume must be positive.");
    }
    if (!acceptsMediumVolume(medium_volume)) {
        throw ConfigurationError("Vessel '" + name + "': default medium volume lies outside its allowed range.");
    }
}
