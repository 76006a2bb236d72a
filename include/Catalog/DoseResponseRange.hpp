#ifndef DOSE_RESPONSE_RANGE_HPP
#define DOSE_RESPONSE_RANGE_HPP

#include <string>

#include "sundials/sundials_types.h"

/**
 * @brief Clinical reference dose window and response for one GVHD grade
 *
 * Only used for reporting, the planner never reads it.
 */
struct DoseResponseRange {
    std::string grade;
    realtype min_dose;          // 10⁶ cells/kg
    realtype max_dose;          // 10⁶ cells/kg
    realtype min_response_pct;  // response probability at min_dose
    realtype max_response_pct;  // response probability at max_dose

    DoseResponseRange(const std::string& grade,
                      realtype min_dose,
                      realtype max_dose,
                      realtype min_response_pct,
                      realtype max_response_pct);

    bool contains(realtype dose) const { return dose >= min_dose && dose <= max_dose; }

    // Linear between the range ends, constant outside
    realtype responseAt(realtype dose) const;
};

#endif  // DOSE_RESPONSE_RANGE_HPP
