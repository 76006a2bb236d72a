#include "Catalog/DoseResponseRange.hpp"

#include "ConfigurationError.hpp"

DoseResponseRange::DoseResponseRange(const std::string& grade,
                                     realtype min_dose,
                                     realtype max_dose,
                                     realtype min_response_pct,
                                     realtype max_response_pct)
    : grade(grade),
      min_dose(min_dose),
      max_dose(max_dose),
      min_response_pct(min_response_pct),
      max_response_pct(max_response_pct) {
    if (!(min_dose > 0.0 && max_dose >= min_dose)) {
        throw ConfigurationError("Dose range of grade '" + grade + "' must satisfy 0 < min <= max!");
    }
    if (!(min_response_pct >= 0.0 && min_response_pct <= 100.0 && max_response_pct >= 0.0 && max_response_pct <= 100.0)) {
        throw ConfigurationError("Response of grade '" + grade + "' must be a percentage in [0, 100]!");
    }
}

realtype DoseResponseRange::responseAt(realtype dose) const {
    if (dose <= min_dose) return min_response_pct;
    if (dose >= max_dose) return max_response_pct;
    const realtype fraction = (dose - min_dose) / (max_dose - min_dose);
    return min_response_pct + fraction * (max_response_pct - min_response_pct);
}
