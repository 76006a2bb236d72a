#include "Planning/ExpansionPlanner.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "Logger.hpp"

ExpansionPlanner::ExpansionPlanner(sunindextype max_passages,
                                   realtype safety_factor,
                                   sunindextype max_initial_vessels,
                                   PlanningObjective objective,
                                   PassageSchedule schedule)
    : max_passages(max_passages),
      safety_factor(safety_factor),
      max_initial_vessels(max_initial_vessels),
      objective(objective),
      schedule(schedule) {
    if (max_passages < 0) {
        throw ConfigurationError("Maximum number of passages must not be negative.");
    }
    if (!(safety_factor >= 1.0) || !std::isfinite(safety_factor)) {
        throw ConfigurationError("Safety factor must be a finite value >= 1.");
    }
    if (max_initial_vessels < 1) {
        throw ConfigurationError("Search range for the initial vessel count must contain at least 1.");
    }
    schedule.validate();
}

bool ExpansionPlanner::canReseed(const VesselType& vessel, realtype previous_output) const {
    const realtype exact = std::ceil(previous_output / vessel.seeding_cells * safety_factor - protocol::ceil_tolerance);
    return exact < static_cast<realtype>(std::numeric_limits<sunindextype>::max());
}

sunindextype ExpansionPlanner::reseedVesselCount(const VesselType& vessel, realtype previous_output) const {
    if (!canReseed(vessel, previous_output)) {
        throw ConfigurationError("Re-seeding " + std::to_string(previous_output) + " cells into '" + vessel.name +
                                 "' exceeds the representable vessel count.");
    }
    const realtype exact = previous_output / vessel.seeding_cells * safety_factor;
    const auto count = static_cast<sunindextype>(std::ceil(exact - protocol::ceil_tolerance));
    return std::max<sunindextype>(count, 1);
}

std::vector<PassageRecord> ExpansionPlanner::simulate(const VesselType& vessel,
                                                      sunindextype initial_vessels,
                                                      realtype target_cells) const {
    std::vector<PassageRecord> passages;
    passages.reserve(std::min<sunindextype>(max_passages, 64) + 1);

    sunindextype vessels = initial_vessels;
    realtype input = initial_vessels * vessel.seeding_cells;
    realtype start_day = 0.0;

    for (sunindextype idx = 0; idx <= max_passages; ++idx) {
        if (idx > 0) {
            input = passages.back().output_cells;  // all harvested cells are re-seeded
            if (!canReseed(vessel, input)) {
                LOG("expansion_planner.log", "Stopping after passage " << idx - 1 << ": re-seeding " << input
                                                                      << " cells exceeds the vessel count range\n");
                break;
            }
            vessels = reseedVesselCount(vessel, input);
            start_day = passages.back().end_day();
        }
        const realtype output = vessels * vessel.confluent_cells;
        passages.push_back(
            PassageRecord{idx, vessels, input, output, schedule.durationOf(idx), schedule.changesOf(idx), start_day});

        if (output >= target_cells) break;
    }
    return passages;
}

std::vector<PassageRecord> ExpansionPlanner::searchMinimizeVessels(const VesselType& vessel,
                                                                   realtype target_cells) const {
    for (sunindextype n0 = 1; n0 <= max_initial_vessels; ++n0) {
        auto passages = simulate(vessel, n0, target_cells);
        if (passages.back().output_cells >= target_cells) {
            return passages;
        }
    }
    return {};
}

std::vector<PassageRecord> ExpansionPlanner::searchMinimizePassages(const VesselType& vessel,
                                                                    realtype target_cells) const {
    for (sunindextype passage = 0; passage <= max_passages; ++passage) {
        for (sunindextype n0 = 1; n0 <= max_initial_vessels; ++n0) {
            auto passages = simulate(vessel, n0, target_cells);
            if (passages.back().output_cells >= target_cells &&
                static_cast<sunindextype>(passages.size()) - 1 == passage) {
                return passages;
            }
        }
    }
    return {};
}

ExpansionPlan ExpansionPlanner::plan(const VesselType& vessel, realtype target_cells) const {
    vessel.validate();
    if (std::isnan(target_cells) || target_cells < 0.0) {
        throw std::invalid_argument("Target cell count must be a non-negative number.");
    }

    std::vector<PassageRecord> passages;
    realtype search_time = 0;
    BENCHMARK(search_time, {
        passages = objective == PlanningObjective::MinimizeVessels ? searchMinimizeVessels(vessel, target_cells)
                                                                   : searchMinimizePassages(vessel, target_cells);
    });
    LOG_BENCHMARK("expansion_planner.log", "search for " << target_cells << " cells: " << search_time << " s\n");

    if (!passages.empty()) {
        LOG("expansion_planner.log", "Vessel '" << vessel.name << "': target " << target_cells << " met with N0="
                                                << passages.front().vessel_count << " after "
                                                << passages.size() - 1 << " re-seedings, output "
                                                << passages.back().output_cells << "\n");
        return ExpansionPlan(vessel, std::move(passages), target_cells, true);
    }

    // Unreachable within the bounds: best attainable plan with the largest candidate
    passages = simulate(vessel, max_initial_vessels, std::numeric_limits<realtype>::infinity());
    std::cerr << "Warning: target of " << target_cells << " cells not reachable with " << max_initial_vessels
              << " x " << vessel.name << " and " << max_passages << " passages; best attainable is "
              << passages.back().output_cells << " cells." << std::endl;
    LOG("expansion_planner.log", "Vessel '" << vessel.name << "': target " << target_cells
                                            << " NOT met, best attainable " << passages.back().output_cells
                                            << " with N0=" << max_initial_vessels << "\n");
    return ExpansionPlan(vessel, std::move(passages), target_cells, false);
}
