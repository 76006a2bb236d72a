#include "Catalog/EquipmentCatalog.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>

#include "Logger.hpp"
#include "ProtocolConstants.hpp"

namespace {

template <typename Entry, typename KeyFn>
std::ptrdiff_t findIdx(const std::vector<Entry>& entries, const std::string& key, KeyFn keyOf) {
    auto it = std::find_if(entries.begin(), entries.end(), [&](const Entry& e) { return keyOf(e) == key; });
    return it == entries.end() ? -1 : std::distance(entries.begin(), it);
}

const std::string& vesselKey(const VesselType& v) { return v.name; }
const std::string& separatorKey(const SeparatorProfile& s) { return s.name; }
const std::string& gradeKey(const DoseResponseRange& r) { return r.grade; }

}  // namespace

EquipmentCatalog EquipmentCatalog::standard() {
    using namespace protocol;

    EquipmentCatalog catalog;
    catalog.addVessel(VesselType::fromSurfaceDensity("T25", 25, 3000, confluency_density, harvest_confluency, 5, 10))
        .addVessel(VesselType::fromSurfaceDensity("T75", 75, 3000, confluency_density, harvest_confluency, 15, 20))
        .addVessel(VesselType::fromSurfaceDensity("T175", 175, 2500, confluency_density, harvest_confluency, 30, 40))
        .setFallbackVessel("T75");

    catalog.addSeparator(SeparatorProfile("PBSC", pbsc_yield, min_collection_volume));

    catalog.addDoseResponse(DoseResponseRange("Grade I", 0.5, 1.0, 60, 80))
        .addDoseResponse(DoseResponseRange("Grade II", 1.0, 1.5, 50, 70))
        .addDoseResponse(DoseResponseRange("Grade III-IV", 1.5, 2.0, 40, 60));

    return catalog;
}

EquipmentCatalog& EquipmentCatalog::addVessel(const VesselType& vessel) {
    vessel.validate();
    if (hasVessel(vessel.name)) {
        throw ConfigurationError("Vessel '" + vessel.name + "' is already in the catalog.");
    }
    vessels.push_back(vessel);
    return *this;
}

EquipmentCatalog& EquipmentCatalog::addSeparator(const SeparatorProfile& separator) {
    separator.validate();
    if (hasSeparator(separator.name)) {
        throw ConfigurationError("Separator '" + separator.name + "' is already in the catalog.");
    }
    separators.push_back(separator);
    return *this;
}

EquipmentCatalog& EquipmentCatalog::addDoseResponse(const DoseResponseRange& range) {
    if (hasGrade(range.grade)) {
        throw ConfigurationError("Grade '" + range.grade + "' is already in the catalog.");
    }
    doseResponses.push_back(range);
    return *this;
}

EquipmentCatalog& EquipmentCatalog::setFallbackVessel(const std::string& name) {
    auto idx = findIdx(vessels, name, vesselKey);
    if (idx < 0) throw std::runtime_error("Vessel not found: " + name);
    fallbackVesselIdx = static_cast<std::size_t>(idx);
    return *this;
}

EquipmentCatalog& EquipmentCatalog::setFallbackSeparator(const std::string& name) {
    auto idx = findIdx(separators, name, separatorKey);
    if (idx < 0) throw std::runtime_error("Separator not found: " + name);
    fallbackSeparatorIdx = static_cast<std::size_t>(idx);
    return *this;
}

EquipmentCatalog& EquipmentCatalog::setFallbackGrade(const std::string& grade) {
    auto idx = findIdx(doseResponses, grade, gradeKey);
    if (idx < 0) throw std::runtime_error("Grade not found: " + grade);
    fallbackGradeIdx = static_cast<std::size_t>(idx);
    return *this;
}

const VesselType& EquipmentCatalog::vessel(const std::string& name) const {
    auto idx = findIdx(vessels, name, vesselKey);
    if (idx < 0) throw std::runtime_error("Vessel not found: " + name);
    return vessels[idx];
}

const SeparatorProfile& EquipmentCatalog::separator(const std::string& name) const {
    auto idx = findIdx(separators, name, separatorKey);
    if (idx < 0) throw std::runtime_error("Separator not found: " + name);
    return separators[idx];
}

const DoseResponseRange& EquipmentCatalog::doseResponse(const std::string& grade) const {
    auto idx = findIdx(doseResponses, grade, gradeKey);
    if (idx < 0) throw std::runtime_error("Grade not found: " + grade);
    return doseResponses[idx];
}

const VesselType& EquipmentCatalog::vesselOrFallback(const std::string& name) const {
    auto idx = findIdx(vessels, name, vesselKey);
    if (idx >= 0) return vessels[idx];
    if (vessels.empty()) throw std::runtime_error("Catalog has no vessels to fall back to.");
    LOG("catalog.log", "Unknown vessel '" << name << "', using fallback '" << vessels[fallbackVesselIdx].name << "'\n");
    return vessels[fallbackVesselIdx];
}

const SeparatorProfile& EquipmentCatalog::separatorOrFallback(const std::string& name) const {
    auto idx = findIdx(separators, name, separatorKey);
    if (idx >= 0) return separators[idx];
    if (separators.empty()) throw std::runtime_error("Catalog has no separators to fall back to.");
    LOG("catalog.log",
        "Unknown separator '" << name << "', using fallback '" << separators[fallbackSeparatorIdx].name << "'\n");
    return separators[fallbackSeparatorIdx];
}

const DoseResponseRange& EquipmentCatalog::doseResponseOrFallback(const std::string& grade) const {
    auto idx = findIdx(doseResponses, grade, gradeKey);
    if (idx >= 0) return doseResponses[idx];
    if (doseResponses.empty()) throw std::runtime_error("Catalog has no dose-response ranges to fall back to.");
    LOG("catalog.log",
        "Unknown grade '" << grade << "', using fallback '" << doseResponses[fallbackGradeIdx].grade << "'\n");
    return doseResponses[fallbackGradeIdx];
}

bool EquipmentCatalog::hasVessel(const std::string& name) const { return findIdx(vessels, name, vesselKey) >= 0; }

bool EquipmentCatalog::hasSeparator(const std::string& name) const {
    return findIdx(separators, name, separatorKey) >= 0;
}

bool EquipmentCatalog::hasGrade(const std::string& grade) const {
    return findIdx(doseResponses, grade, gradeKey) >= 0;
}

std::vector<std::string> EquipmentCatalog::vesselNames() const {
    std::vector<std::string> names;
    names.reserve(vessels.size());
    for (const auto& v : vessels) names.push_back(v.name);
    return names;
}

std::vector<std::string> EquipmentCatalog::separatorNames() const {
    std::vector<std::string> names;
    names.reserve(separators.size());
    for (const auto& s : separators) names.push_back(s.name);
    return names;
}

std::vector<std::string> EquipmentCatalog::gradeNames() const {
    std::vector<std::string> names;
    names.reserve(doseResponses.size());
    for (const auto& r : doseResponses) names.push_back(r.grade);
    return names;
}
