#ifndef RESOURCE_ACCOUNTANT_HPP
#define RESOURCE_ACCOUNTANT_HPP

#include <optional>

#include "Planning/ExpansionPlan.hpp"
#include "ProtocolConstants.hpp"

/// @brief Consumables and duration of a plan
struct ResourceSummary {
    const realtype total_days;
    const realtype total_medium_mL;
    const realtype priming_volume_mL;  // 0 if no priming was requested
};

/**
 * @brief Derives culture duration, medium and priming volume from a plan
 *
 * total medium = Σ vessel_count · medium volume · medium changes over all passages,
 * priming = fraction · initial vessel count · medium volume.
 * The medium volume defaults to the vessel's one and can be overridden
 * within the vessel's allowed range.
 */
class ResourceAccountant {
   public:
    explicit ResourceAccountant(realtype priming_fraction = protocol::priming_fraction);

    ResourceSummary summarize(const ExpansionPlan& plan,
                              bool priming,
                              std::optional<realtype> medium_volume_mL = std::nullopt) const;

    realtype mediumVolumeFor(const VesselType& vessel, std::optional<realtype> override_mL) const;

    realtype getPrimingFraction() const { return priming_fraction; }

   private:
    realtype priming_fraction;
};

#endif  // RESOURCE_ACCOUNTANT_HPP
