#include "ProtocolPlanner.hpp"

#include <stdexcept>
#include <utility>

#include "Logger.hpp"

ProtocolPlanner::ProtocolPlanner(const EquipmentCatalog& catalog, const PlanningConfig& config)
    : catalog(catalog),
      config(config),
      expansionPlanner(config.max_passages,
                       config.safety_factor,
                       config.max_initial_vessels,
                       config.objective,
                       config.schedule),
      resourceAccountant(config.priming_fraction) {
    if (config.samples_per_passage < 2) {
        throw std::invalid_argument("At least 2 trajectory samples per passage are required.");
    }
}

PlanningResult ProtocolPlanner::plan(const PlanningRequest& request) const {
    LOG("protocol_planner.log", "Request: weight=" << request.weight_kg << " kg, dose=" << request.dose_per_kg
                                                   << ", vessel=" << request.vessel << ", separator="
                                                   << request.separator << ", grade=" << request.grade
                                                   << ", priming=" << request.priming << "\n");

    const VesselType& vessel = catalog.vesselOrFallback(request.vessel);
    const SeparatorProfile& separator = catalog.separatorOrFallback(request.separator);
    const DoseResponseRange& doseResponse = catalog.doseResponseOrFallback(request.grade);

    const TargetResolver resolver(request.pediatric ? WeightBounds::pediatric() : WeightBounds::adult());
    DoseTarget target = resolver.resolve(request.weight_kg, request.dose_per_kg, separator);

    ExpansionPlan plan = expansionPlanner.plan(vessel, target.cells);

    ResourceSummary resources = resourceAccountant.summarize(plan, request.priming, request.medium_volume_mL);
    TrajectorySimulator trajectory(plan, config.samples_per_passage);

    LOG("protocol_planner.log", "Result: N0=" << plan.initialVesselCount() << ", re-seedings=" << plan.passagesUsed()
                                              << ", target_met=" << plan.targetMet() << ", days="
                                              << resources.total_days << ", medium=" << resources.total_medium_mL
                                              << " mL\n");

    return PlanningResult{target,
                          std::move(plan),
                          resources,
                          std::move(trajectory),
                          doseResponse,
                          doseResponse.responseAt(request.dose_per_kg),
                          doseResponse.contains(request.dose_per_kg)};
}
