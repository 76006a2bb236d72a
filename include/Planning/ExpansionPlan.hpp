#ifndef EXPANSION_PLAN_HPP
#define EXPANSION_PLAN_HPP

#include <vector>

#include "Catalog/VesselType.hpp"
#include "EigenDataTypes.hpp"

/**
 * @brief One seeding/growth/harvest cycle
 *
 * index 0 is the initial seeding. input_cells of a re-seeded passage equals
 * the output of the previous one, output_cells = vessel_count · confluent cells.
 */
struct PassageRecord {
    sunindextype index;
    sunindextype vessel_count;
    realtype input_cells;
    realtype output_cells;
    realtype duration_days;
    sunindextype medium_changes;
    realtype start_day;

    realtype end_day() const { return start_day + duration_days; }
};

/**
 * @brief Ordered passage schedule produced by the ExpansionPlanner
 *
 * Immutable after construction. The last record is the passage at which the
 * target was met, or the last allowed passage if target_met is false.
 */
class ExpansionPlan {
   public:
    ExpansionPlan(const VesselType& vessel,
                  std::vector<PassageRecord> passages,
                  realtype target_cells,
                  bool target_met);

    const VesselType& getVessel() const { return vessel; }
    const std::vector<PassageRecord>& getPassages() const { return passages; }
    const PassageRecord& operator[](std::size_t idx) const { return passages.at(idx); }
    std::size_t size() const { return passages.size(); }

    realtype getTargetCells() const { return target_cells; }
    bool targetMet() const { return target_met; }

    sunindextype initialVesselCount() const { return passages.front().vessel_count; }
    // Number of re-seedings after the initial seeding
    sunindextype passagesUsed() const { return static_cast<sunindextype>(passages.size()) - 1; }
    realtype finalOutput() const { return passages.back().output_cells; }
    realtype totalDays() const { return passages.back().end_day(); }

    // Column views for reporting: one entry per passage
    IndexColVector vesselCounts() const;
    ColVector inputCells() const;
    ColVector outputCells() const;
    ColVector startDays() const;

   private:
    // copy, the plan must not depend on the lifetime of the catalog
    VesselType vessel;
    std::vector<PassageRecord> passages;
    realtype target_cells;
    bool target_met;
};

#endif  // EXPANSION_PLAN_HPP
