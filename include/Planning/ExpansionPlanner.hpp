#ifndef EXPANSION_PLANNER_HPP
#define EXPANSION_PLANNER_HPP

#include <vector>

#include "Catalog/VesselType.hpp"
#include "Planning/ExpansionPlan.hpp"
#include "Planning/PassageSchedule.hpp"
#include "ProtocolConstants.hpp"

/// @brief Order in which candidate plans are compared
enum class PlanningObjective {
    MinimizeVessels,  // smallest initial vessel count, then fewest passages
    MinimizePassages  // fewest passages, then smallest initial vessel count
};

/**
 * @brief Bounded search for the smallest feasible initial vessel count
 *
 * Every candidate N0 in [1, max_initial_vessels] is simulated directly:
 * passage 0 yields N0 · confluent cells, each re-seeding uses
 * ceil(previous output / seeded cells · safety factor) vessels. The search
 * stops at the first candidate (according to the objective) whose output
 * reaches the target (>=). If no candidate does, the plan of the largest
 * candidate over all passages is returned with target_met = false.
 * Simulation of a candidate ends early if the next re-seeding would need
 * more vessels than sunindextype can count.
 */
class ExpansionPlanner {
   public:
    ExpansionPlanner(sunindextype max_passages = protocol::max_passages,
                     realtype safety_factor = protocol::safety_factor,
                     sunindextype max_initial_vessels = protocol::max_initial_vessels,
                     PlanningObjective objective = PlanningObjective::MinimizeVessels,
                     PassageSchedule schedule = PassageSchedule());

    ExpansionPlan plan(const VesselType& vessel, realtype target_cells) const;

    // Passages of one candidate, ending at the first passage that meets target_cells or at max_passages
    std::vector<PassageRecord> simulate(const VesselType& vessel, sunindextype initial_vessels, realtype target_cells) const;

    // Throws ConfigurationError if the count does not fit into sunindextype
    sunindextype reseedVesselCount(const VesselType& vessel, realtype previous_output) const;
    bool canReseed(const VesselType& vessel, realtype previous_output) const;

    sunindextype getMaxPassages() const { return max_passages; }
    realtype getSafetyFactor() const { return safety_factor; }
    sunindextype getMaxInitialVessels() const { return max_initial_vessels; }
    PlanningObjective getObjective() const { return objective; }
    const PassageSchedule& getSchedule() const { return schedule; }

   protected:
    std::vector<PassageRecord> searchMinimizeVessels(const VesselType& vessel, realtype target_cells) const;
    std::vector<PassageRecord> searchMinimizePassages(const VesselType& vessel, realtype target_cells) const;

    const sunindextype max_passages;
    const realtype safety_factor;
    const sunindextype max_initial_vessels;
    const PlanningObjective objective;
    const PassageSchedule schedule;
};

#endif  // EXPANSION_PLANNER_HPP
