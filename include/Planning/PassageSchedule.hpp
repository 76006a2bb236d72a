#ifndef PASSAGE_SCHEDULE_HPP
#define PASSAGE_SCHEDULE_HPP

#include "Catalog/VesselType.hpp"
#include "ProtocolConstants.hpp"

/**
 * @brief Duration and medium-change policy per passage
 *
 * The first passage (primary cells, adherence) lasts longer than the
 * re-seeded ones. Medium changes are either fixed counts per passage or
 * derived from a change interval.
 */
struct PassageSchedule {
    realtype first_passage_days = protocol::first_passage_days;
    realtype subsequent_passage_days = protocol::subsequent_passage_days;
    sunindextype first_passage_changes = protocol::first_passage_medium_changes;
    sunindextype subsequent_passage_changes = protocol::subsequent_passage_medium_changes;

    // changes = floor(duration / interval_days) for each passage
    static PassageSchedule fromChangeInterval(realtype first_days, realtype subsequent_days, realtype interval_days);

    // duration = log2(confluent / seeded) / doublings_per_day (+ adherence lag for the first passage)
    static PassageSchedule fromGrowthKinetics(const VesselType& vessel,
                                              realtype doublings_per_day = protocol::growth_rate,
                                              realtype adherence_days = 1.0,
                                              realtype change_interval_days = 2.0);

    realtype durationOf(sunindextype passageIdx) const {
        return passageIdx == 0 ? first_passage_days : subsequent_passage_days;
    }
    sunindextype changesOf(sunindextype passageIdx) const {
        return passageIdx == 0 ? first_passage_changes : subsequent_passage_changes;
    }

    void validate() const;
};

#endif  // PASSAGE_SCHEDULE_HPP
