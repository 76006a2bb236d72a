#include "Planning/ExpansionPlan.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

constexpr realtype chronology_tolerance = 1e-12;

}  // namespace

ExpansionPlan::ExpansionPlan(const VesselType& vessel,
                             std::vector<PassageRecord> passages,
                             realtype target_cells,
                             bool target_met)
    : vessel(vessel), passages(std::move(passages)), target_cells(target_cells), target_met(target_met) {
    if (this->passages.empty()) {
        throw std::invalid_argument("ExpansionPlan must contain at least the initial passage.");
    }
    for (std::size_t i = 0; i < this->passages.size(); ++i) {
        const auto& p = this->passages[i];
        if (p.vessel_count < 1) {
            throw std::invalid_argument("Passage " + std::to_string(i) + " has no vessels.");
        }
        if (p.index != static_cast<sunindextype>(i)) {
            throw std::invalid_argument("Passage records must be indexed consecutively from 0.");
        }
        if (!(p.duration_days >= 0.0) || p.medium_changes < 0) {
            throw std::invalid_argument("Passage " + std::to_string(i) +
                                        " has a negative duration or medium change count.");
        }
        if (i == 0) continue;
        const auto& prev = this->passages[i - 1];
        if (!(p.output_cells >= p.input_cells)) {
            throw std::invalid_argument("Passage " + std::to_string(i) + " yields fewer cells than were seeded.");
        }
        if (std::abs(p.start_day - prev.end_day()) > chronology_tolerance * std::max<realtype>(1.0, prev.end_day())) {
            throw std::invalid_argument("Passage " + std::to_string(i) + " does not start when passage " +
                                        std::to_string(i - 1) + " ends.");
        }
    }
}

IndexColVector ExpansionPlan::vesselCounts() const {
    IndexColVector counts(passages.size());
    for (std::size_t i = 0; i < passages.size(); ++i) counts(i) = passages[i].vessel_count;
    return counts;
}

ColVector ExpansionPlan::inputCells() const {
    ColVector cells(passages.size());
    for (std::size_t i = 0; i < passages.size(); ++i) cells(i) = passages[i].input_cells;
    return cells;
}

ColVector ExpansionPlan::outputCells() const {
    ColVector cells(passages.size());
    for (std::size_t i = 0; i < passages.size(); ++i) cells(i) = passages[i].output_cells;
    return cells;
}

ColVector ExpansionPlan::startDays() const {
    ColVector days(passages.size());
    for (std::size_t i = 0; i < passages.size(); ++i) days(i) = passages[i].start_day;
    return days;
}
