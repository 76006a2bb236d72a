#include "Planning/PassageSchedule.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

sunindextype changesFor(realtype duration_days, realtype interval_days) {
    const realtype changes = std::floor(duration_days / interval_days);
    if (!(changes < static_cast<realtype>(std::numeric_limits<sunindextype>::max()))) {
        throw ConfigurationError("Medium change interval is too short for the passage duration.");
    }
    return std::max<sunindextype>(static_cast<sunindextype>(changes), 1);
}

}  // namespace

PassageSchedule PassageSchedule::fromChangeInterval(realtype first_days,
                                                    realtype subsequent_days,
                                                    realtype interval_days) {
    if (!(interval_days > 0.0)) {
        throw ConfigurationError("Medium change interval must be positive.");
    }
    PassageSchedule schedule;
    schedule.first_passage_days = first_days;
    schedule.subsequent_passage_days = subsequent_days;
    schedule.validate();
    // every passage gets at least its initial fill
    schedule.first_passage_changes = changesFor(first_days, interval_days);
    schedule.subsequent_passage_changes = changesFor(subsequent_days, interval_days);
    return schedule;
}

PassageSchedule PassageSchedule::fromGrowthKinetics(const VesselType& vessel,
                                                    realtype doublings_per_day,
                                                    realtype adherence_days,
                                                    realtype change_interval_days) {
    vessel.validate();
    if (!(doublings_per_day > 0.0)) {
        throw ConfigurationError("Growth rate must be positive.");
    }
    if (!(adherence_days >= 0.0)) {
        throw ConfigurationError("Adherence lag must not be negative.");
    }
    const realtype growth_days = std::log2(vessel.expansionFactor()) / doublings_per_day;
    return fromChangeInterval(growth_days + adherence_days, growth_days, change_interval_days);
}

void PassageSchedule::validate() const {
    if (!(first_passage_days > 0.0) || !(subsequent_passage_days > 0.0) || !std::isfinite(first_passage_days) ||
        !std::isfinite(subsequent_passage_days)) {
        throw ConfigurationError("Passage durations must be positive and finite.");
    }
    if (first_passage_changes < 1 || subsequent_passage_changes < 1) {
        throw ConfigurationError("Every passage needs at least one medium change.");
    }
}
