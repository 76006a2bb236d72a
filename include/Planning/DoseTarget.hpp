#ifndef DOSE_TARGET_HPP
#define DOSE_TARGET_HPP

#include "sundials/sundials_types.h"

/**
 * @brief Resolved cell requirement of one planning run
 */
struct DoseTarget {
    const realtype weight_kg;
    const realtype dose_per_kg;           // 10⁶ cells/kg
    const realtype cells;                 // absolute cell count
    const realtype collection_volume_mL;  // source material to draw from the separator
};

#endif  // DOSE_TARGET_HPP
