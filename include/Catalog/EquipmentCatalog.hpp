#ifndef EQUIPMENT_CATALOG_HPP
#define EQUIPMENT_CATALOG_HPP

#include <string>
#include <vector>

#include "Catalog/DoseResponseRange.hpp"
#include "Catalog/SeparatorProfile.hpp"
#include "Catalog/VesselType.hpp"

/**
 * @brief Registry of vessels, separators and dose-response references
 *
 * Replaces module-level lookup tables: each laboratory can hold its own
 * catalog and pass it to the planner. Entries are validated when added.
 * Lookups by unknown name either throw (operator-style accessors) or
 * resolve to the designated fallback entry (*OrFallback accessors).
 */
class EquipmentCatalog {
   public:
    EquipmentCatalog() = default;

    // Laboratory defaults: T25/T75/T175 flasks, PBSC separator, GVHD grades I to III-IV
    static EquipmentCatalog standard();

    EquipmentCatalog& addVessel(const VesselType& vessel);
    EquipmentCatalog& addSeparator(const SeparatorProfile& separator);
    EquipmentCatalog& addDoseResponse(const DoseResponseRange& range);

    // The first entry added of each kind is the fallback until one of these is called
    EquipmentCatalog& setFallbackVessel(const std::string& name);
    EquipmentCatalog& setFallbackSeparator(const std::string& name);
    EquipmentCatalog& setFallbackGrade(const std::string& grade);

    const VesselType& vessel(const std::string& name) const;
    const SeparatorProfile& separator(const std::string& name) const;
    const DoseResponseRange& doseResponse(const std::string& grade) const;

    const VesselType& vesselOrFallback(const std::string& name) const;
    const SeparatorProfile& separatorOrFallback(const std::string& name) const;
    const DoseResponseRange& doseResponseOrFallback(const std::string& grade) const;

    bool hasVessel(const std::string& name) const;
    bool hasSeparator(const std::string& name) const;
    bool hasGrade(const std::string& grade) const;

    std::vector<std::string> vesselNames() const;
    std::vector<std::string> separatorNames() const;
    std::vector<std::string> gradeNames() const;

    const std::vector<VesselType>& getVessels() const { return vessels; }
    const std::vector<SeparatorProfile>& getSeparators() const { return separators; }
    const std::vector<DoseResponseRange>& getDoseResponses() const { return doseResponses; }

   private:
    std::vector<VesselType> vessels;
    std::vector<SeparatorProfile> separators;
    std::vector<DoseResponseRange> doseResponses;

    std::size_t fallbackVesselIdx = 0;
    std::size_t fallbackSeparatorIdx = 0;
    std::size_t fallbackGradeIdx = 0;
};

#endif  // EQUIPMENT_CATALOG_HPP
