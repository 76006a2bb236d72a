#ifndef CONFIGURATION_ERROR_HPP
#define CONFIGURATION_ERROR_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Catalog, profile or protocol data violating an invariant
 *
 * Raised for zero/negative capacities, yields or durations. Planning cannot
 * proceed until the configuration is fixed.
 */
class ConfigurationError : public std::runtime_error {
   public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

#endif  // CONFIGURATION_ERROR_HPP
