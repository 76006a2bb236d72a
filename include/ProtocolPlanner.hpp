#ifndef PROTOCOL_PLANNER_HPP
#define PROTOCOL_PLANNER_HPP

#include <optional>
#include <string>

#include "Catalog/EquipmentCatalog.hpp"
#include "Observers/TrajectorySimulator.hpp"
#include "Planning/DoseTarget.hpp"
#include "Planning/ExpansionPlan.hpp"
#include "Planning/ExpansionPlanner.hpp"
#include "Planning/PassageSchedule.hpp"
#include "Planning/ResourceAccountant.hpp"
#include "Planning/TargetResolver.hpp"

/// @brief Protocol constants of a planner instance
struct PlanningConfig {
    sunindextype max_passages = protocol::max_passages;
    realtype safety_factor = protocol::safety_factor;
    sunindextype max_initial_vessels = protocol::max_initial_vessels;
    PlanningObjective objective = PlanningObjective::MinimizeVessels;
    PassageSchedule schedule;
    realtype priming_fraction = protocol::priming_fraction;
    std::size_t samples_per_passage = protocol::samples_per_passage;
};

/// @brief Inputs of one planning run as supplied by the presentation layer
struct PlanningRequest {
    realtype weight_kg = 70.0;
    realtype dose_per_kg = 1.0;  // 10⁶ cells/kg
    std::string vessel = "T75";
    std::string separator = "PBSC";
    std::string grade = "Grade I";  // reporting only
    bool priming = false;
    bool pediatric = false;  // extends the weight window down to 8 kg
    std::optional<realtype> medium_volume_mL = std::nullopt;
};

/// @brief Everything one planning run produces
struct PlanningResult {
    DoseTarget target;
    ExpansionPlan plan;
    ResourceSummary resources;
    TrajectorySimulator trajectory;
    DoseResponseRange dose_response;
    realtype expected_response_pct;  // dose_response evaluated at the requested dose
    bool dose_in_recommended_range;
};

/**
 * @brief Runs target resolution, expansion search, resource accounting and
 * trajectory generation for one request
 *
 * Holds only read-only state (catalog reference and constants); each call to
 * plan() builds fresh results, so one instance can serve concurrent requests.
 */
class ProtocolPlanner {
   public:
    ProtocolPlanner(const EquipmentCatalog& catalog, const PlanningConfig& config = PlanningConfig());

    PlanningResult plan(const PlanningRequest& request) const;

    const EquipmentCatalog& getCatalog() const { return catalog; }
    const PlanningConfig& getConfig() const { return config; }
    const ExpansionPlanner& getExpansionPlanner() const { return expansionPlanner; }

   private:
    const EquipmentCatalog& catalog;
    const PlanningConfig config;
    const ExpansionPlanner expansionPlanner;
    const ResourceAccountant resourceAccountant;
};

#endif  // PROTOCOL_PLANNER_HPP
