#ifndef PROTOCOL_CONSTANTS_HPP
#define PROTOCOL_CONSTANTS_HPP

#include <sundials/sundials_types.h>

#include <cstddef>

namespace protocol {

// Expansion search
constexpr sunindextype max_passages = 3;          // re-seeding cycles after the initial seeding
constexpr realtype safety_factor = 1.2;           // margin on re-seeding vessel counts (transfer losses)
constexpr sunindextype max_initial_vessels = 200;  // upper bound of the N0 search
constexpr realtype ceil_tolerance = 1e-9;         // absorbs floating noise before rounding vessel counts up

// Dose units
constexpr realtype cells_per_dose_unit = 1e6;  // dose is given in 10⁶ cells/kg

// Patient bounds
constexpr realtype min_weight_adult = 30.0;      // kg
constexpr realtype min_weight_pediatric = 8.0;   // kg
constexpr realtype max_weight = 120.0;           // kg
constexpr realtype min_dose_per_weight = 0.5;    // 10⁶ cells/kg
constexpr realtype max_dose_per_weight = 2.0;    // 10⁶ cells/kg

// Culture biology
constexpr realtype growth_rate = 0.5;             // doublings per day
constexpr realtype confluency_density = 15000.0;  // cells/cm² at full confluency
constexpr realtype harvest_confluency = 0.8;      // harvest at 80 % confluency

// Passage schedule
constexpr realtype first_passage_days = 7.0;       // includes adherence of primary cells
constexpr realtype subsequent_passage_days = 5.0;  // trypsinized cells re-attach faster
constexpr sunindextype first_passage_medium_changes = 3;
constexpr sunindextype subsequent_passage_medium_changes = 2;

// Separator
constexpr realtype min_collection_volume = 50.0;  // mL, minimum apheresis draw
constexpr realtype pbsc_yield = 2.0e4;            // MSCs per mL of PBSC (1×10⁶ per 50 mL)

// Priming
constexpr realtype priming_fraction = 0.1;  // share of one medium fill per initial vessel

// Trajectory
constexpr std::size_t samples_per_passage = 50;

}  // namespace protocol

#endif  // PROTOCOL_CONSTANTS_HPP
