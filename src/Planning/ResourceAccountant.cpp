#include "Planning/ResourceAccountant.hpp"

#include <stdexcept>
#include <string>

#include "Logger.hpp"

ResourceAccountant::ResourceAccountant(realtype priming_fraction) : priming_fraction(priming_fraction) {
    if (!(priming_fraction >= 0.0)) {
        throw std::invalid_argument("Priming fraction must not be negative.");
    }
}

realtype ResourceAccountant::mediumVolumeFor(const VesselType& vessel, std::optional<realtype> override_mL) const {
    if (!override_mL) return vessel.medium_volume;
    if (!vessel.acceptsMediumVolume(*override_mL)) {
        throw std::invalid_argument("Medium volume " + std::to_string(*override_mL) + " mL outside [" +
                                    std::to_string(vessel.min_medium_volume) + ", " +
                                    std::to_string(vessel.max_medium_volume) + "] mL for vessel '" + vessel.name +
                                    "'.");
    }
    return *override_mL;
}

ResourceSummary ResourceAccountant::summarize(const ExpansionPlan& plan,
                                              bool priming,
                                              std::optional<realtype> medium_volume_mL) const {
    const realtype volume = mediumVolumeFor(plan.getVessel(), medium_volume_mL);

    realtype days = 0.0;
    realtype medium = 0.0;
    for (const auto& passage : plan.getPassages()) {
        if (passage.duration_days < 0.0 || passage.medium_changes < 0) {
            throw ConfigurationError("Passage " + std::to_string(passage.index) +
                                     " has a negative duration or medium change count.");
        }
        days += passage.duration_days;
        medium += passage.vessel_count * volume * passage.medium_changes;
    }

    const realtype priming_volume = priming ? priming_fraction * plan.initialVesselCount() * volume : 0.0;

    LOG("resource_accountant.log", "days=" << days << ", medium=" << medium << " mL, priming=" << priming_volume
                                           << " mL (" << volume << " mL per vessel)\n");

    return ResourceSummary{days, medium, priming_volume};
}
