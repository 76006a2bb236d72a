/**
 * @file bindings.cpp
 * @brief Python bindings for the cell expansion planner using nanobind
 *
 * This file provides Python bindings for:
 * - Catalog: VesselType, SeparatorProfile, DoseResponseRange, EquipmentCatalog
 * - Planning: DoseTarget, TargetResolver, PassageSchedule, PassageRecord,
 *   ExpansionPlan, ExpansionPlanner, ResourceSummary, ResourceAccountant
 * - TrajectorySimulator and the ProtocolPlanner facade
 */

#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include "Catalog/DoseResponseRange.hpp"
#include "Catalog/EquipmentCatalog.hpp"
#include "Catalog/SeparatorProfile.hpp"
#include "Catalog/VesselType.hpp"
#include "ConfigurationError.hpp"
#include "EigenDataTypes.hpp"
#include "Observers/TrajectorySimulator.hpp"
#include "Planning/DoseTarget.hpp"
#include "Planning/ExpansionPlan.hpp"
#include "Planning/ExpansionPlanner.hpp"
#include "Planning/PassageSchedule.hpp"
#include "Planning/ResourceAccountant.hpp"
#include "Planning/TargetResolver.hpp"
#include "ProtocolPlanner.hpp"

namespace nb = nanobind;
using namespace nb::literals;

NB_MODULE(cep, m) {
    m.doc() = "Cell expansion planner - vessel counts, passages, media and growth curves for MSC expansion";

    nb::exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

    // ==================== Enums ====================

    nb::enum_<PlanningObjective>(m, "PlanningObjective")
        .value("MinimizeVessels", PlanningObjective::MinimizeVessels)
        .value("MinimizePassages", PlanningObjective::MinimizePassages);

    // ==================== VesselType ====================

    nb::class_<VesselType>(m, "VesselType")
        .def(nb::init<const std::string&>(), "name"_a)
        // Keyword-argument friendly constructor
        .def("__init__", [](VesselType& self, const std::string& name, nb::kwargs kwargs) {
            new (&self) VesselType(name);
            if (kwargs.contains("surface_area_cm2"))
                self.setSurfaceArea(nb::cast<double>(kwargs["surface_area_cm2"]));
            if (kwargs.contains("seeding_cells"))
                self.setSeedingCells(nb::cast<double>(kwargs["seeding_cells"]));
            if (kwargs.contains("confluent_cells"))
                self.setConfluentCells(nb::cast<double>(kwargs["confluent_cells"]));
            if (kwargs.contains("min_medium_mL") && kwargs.contains("max_medium_mL"))
                self.setMediumVolumeRange(nb::cast<double>(kwargs["min_medium_mL"]),
                                          nb::cast<double>(kwargs["max_medium_mL"]));
            else if (kwargs.contains("min_medium_mL") || kwargs.contains("max_medium_mL"))
                throw std::invalid_argument("Both min_medium_mL and max_medium_mL must be provided together!");
            if (kwargs.contains("medium_volume_mL"))
                self.setMediumVolume(nb::cast<double>(kwargs["medium_volume_mL"]));
        }, "name"_a, "kwargs"_a)
        .def_static("from_surface_density", &VesselType::fromSurfaceDensity,
                    "name"_a, "surface_area_cm2"_a, "seeding_density_per_cm2"_a,
                    "confluency_density_per_cm2"_a, "harvest_confluency"_a,
                    "min_medium_mL"_a, "max_medium_mL"_a)
        .def_rw("name", &VesselType::name)
        .def_ro("surface_area", &VesselType::surface_area)
        .def_ro("seeding_cells", &VesselType::seeding_cells)
        .def_ro("confluent_cells", &VesselType::confluent_cells)
        .def_ro("medium_volume", &VesselType::medium_volume)
        .def_ro("min_medium_volume", &VesselType::min_medium_volume)
        .def_ro("max_medium_volume", &VesselType::max_medium_volume)
        .def("validate", &VesselType::validate)
        .def("expansion_factor", &VesselType::expansionFactor)
        .def("__repr__", [](const VesselType& v) {
            return "<VesselType '" + v.name + "' seeding=" + std::to_string(v.seeding_cells) +
                   " confluent=" + std::to_string(v.confluent_cells) + ">";
        });

    // ==================== SeparatorProfile ====================

    nb::class_<SeparatorProfile>(m, "SeparatorProfile")
        .def(nb::init<const std::string&, realtype, realtype>(),
             "name"_a, "cells_per_mL"_a = protocol::pbsc_yield, "min_volume_mL"_a = protocol::min_collection_volume)
        .def_rw("name", &SeparatorProfile::name)
        .def_rw("cells_per_mL", &SeparatorProfile::cells_per_mL)
        .def_rw("min_volume_mL", &SeparatorProfile::min_volume_mL)
        .def("validate", &SeparatorProfile::validate)
        .def("__repr__", [](const SeparatorProfile& s) {
            return "<SeparatorProfile '" + s.name + "' cells_per_mL=" + std::to_string(s.cells_per_mL) + ">";
        });

    // ==================== DoseResponseRange ====================

    nb::class_<DoseResponseRange>(m, "DoseResponseRange")
        .def(nb::init<const std::string&, realtype, realtype, realtype, realtype>(),
             "grade"_a, "min_dose"_a, "max_dose"_a, "min_response_pct"_a, "max_response_pct"_a)
        .def_ro("grade", &DoseResponseRange::grade)
        .def_ro("min_dose", &DoseResponseRange::min_dose)
        .def_ro("max_dose", &DoseResponseRange::max_dose)
        .def_ro("min_response_pct", &DoseResponseRange::min_response_pct)
        .def_ro("max_response_pct", &DoseResponseRange::max_response_pct)
        .def("contains", &DoseResponseRange::contains, "dose"_a)
        .def("response_at", &DoseResponseRange::responseAt, "dose"_a);

    // ==================== EquipmentCatalog ====================

    nb::class_<EquipmentCatalog>(m, "EquipmentCatalog")
        .def(nb::init<>())
        .def_static("standard", &EquipmentCatalog::standard)
        .def("add_vessel", &EquipmentCatalog::addVessel, "vessel"_a, nb::rv_policy::reference)
        .def("add_separator", &EquipmentCatalog::addSeparator, "separator"_a, nb::rv_policy::reference)
        .def("add_dose_response", &EquipmentCatalog::addDoseResponse, "range"_a, nb::rv_policy::reference)
        .def("set_fallback_vessel", &EquipmentCatalog::setFallbackVessel, "name"_a, nb::rv_policy::reference)
        .def("set_fallback_separator", &EquipmentCatalog::setFallbackSeparator, "name"_a, nb::rv_policy::reference)
        .def("set_fallback_grade", &EquipmentCatalog::setFallbackGrade, "grade"_a, nb::rv_policy::reference)
        .def("vessel", &EquipmentCatalog::vessel, "name"_a, nb::rv_policy::reference_internal)
        .def("separator", &EquipmentCatalog::separator, "name"_a, nb::rv_policy::reference_internal)
        .def("dose_response", &EquipmentCatalog::doseResponse, "grade"_a, nb::rv_policy::reference_internal)
        .def("vessel_names", &EquipmentCatalog::vesselNames)
        .def("separator_names", &EquipmentCatalog::separatorNames)
        .def("grade_names", &EquipmentCatalog::gradeNames)
        .def("__repr__", [](const EquipmentCatalog& c) {
            return "<EquipmentCatalog vessels=" + std::to_string(c.getVessels().size()) +
                   " separators=" + std::to_string(c.getSeparators().size()) + ">";
        });

    // ==================== Target resolution ====================

    nb::class_<DoseTarget>(m, "DoseTarget")
        .def_ro("weight_kg", &DoseTarget::weight_kg)
        .def_ro("dose_per_kg", &DoseTarget::dose_per_kg)
        .def_ro("cells", &DoseTarget::cells)
        .def_ro("collection_volume_mL", &DoseTarget::collection_volume_mL);

    nb::class_<WeightBounds>(m, "WeightBounds")
        .def(nb::init<>())
        .def_static("adult", &WeightBounds::adult)
        .def_static("pediatric", &WeightBounds::pediatric)
        .def_rw("min_kg", &WeightBounds::min_kg)
        .def_rw("max_kg", &WeightBounds::max_kg);

    nb::class_<TargetResolver>(m, "TargetResolver")
        .def(nb::init<WeightBounds, realtype, realtype>(),
             "weight_bounds"_a = WeightBounds::adult(),
             "min_dose"_a = protocol::min_dose_per_weight,
             "max_dose"_a = protocol::max_dose_per_weight)
        .def("resolve", &TargetResolver::resolve, "weight_kg"_a, "dose_per_kg"_a, "separator"_a);

    // ==================== Expansion planning ====================

    nb::class_<PassageSchedule>(m, "PassageSchedule")
        .def(nb::init<>())
        .def_static("from_change_interval", &PassageSchedule::fromChangeInterval,
                    "first_days"_a, "subsequent_days"_a, "interval_days"_a)
        .def_static("from_growth_kinetics", &PassageSchedule::fromGrowthKinetics,
                    "vessel"_a, "doublings_per_day"_a = protocol::growth_rate,
                    "adherence_days"_a = 1.0, "change_interval_days"_a = 2.0)
        .def_rw("first_passage_days", &PassageSchedule::first_passage_days)
        .def_rw("subsequent_passage_days", &PassageSchedule::subsequent_passage_days)
        .def_rw("first_passage_changes", &PassageSchedule::first_passage_changes)
        .def_rw("subsequent_passage_changes", &PassageSchedule::subsequent_passage_changes);

    nb::class_<PassageRecord>(m, "PassageRecord")
        .def_ro("index", &PassageRecord::index)
        .def_ro("vessel_count", &PassageRecord::vessel_count)
        .def_ro("input_cells", &PassageRecord::input_cells)
        .def_ro("output_cells", &PassageRecord::output_cells)
        .def_ro("duration_days", &PassageRecord::duration_days)
        .def_ro("medium_changes", &PassageRecord::medium_changes)
        .def_ro("start_day", &PassageRecord::start_day)
        .def("__repr__", [](const PassageRecord& p) {
            return "<PassageRecord " + std::to_string(p.index) + " vessels=" + std::to_string(p.vessel_count) +
                   " output=" + std::to_string(p.output_cells) + ">";
        });

    nb::class_<ExpansionPlan>(m, "ExpansionPlan")
        .def("get_vessel", &ExpansionPlan::getVessel, nb::rv_policy::reference_internal)
        .def("get_passages", &ExpansionPlan::getPassages, nb::rv_policy::reference_internal)
        .def("__len__", &ExpansionPlan::size)
        .def_prop_ro("target_cells", &ExpansionPlan::getTargetCells)
        .def_prop_ro("target_met", &ExpansionPlan::targetMet)
        .def_prop_ro("initial_vessel_count", &ExpansionPlan::initialVesselCount)
        .def_prop_ro("passages_used", &ExpansionPlan::passagesUsed)
        .def_prop_ro("final_output", &ExpansionPlan::finalOutput)
        .def_prop_ro("total_days", &ExpansionPlan::totalDays)
        .def("vessel_counts", &ExpansionPlan::vesselCounts)
        .def("input_cells", &ExpansionPlan::inputCells)
        .def("output_cells", &ExpansionPlan::outputCells)
        .def("start_days", &ExpansionPlan::startDays);

    nb::class_<ExpansionPlanner>(m, "ExpansionPlanner")
        .def(nb::init<sunindextype, realtype, sunindextype, PlanningObjective, PassageSchedule>(),
             "max_passages"_a = protocol::max_passages,
             "safety_factor"_a = protocol::safety_factor,
             "max_initial_vessels"_a = protocol::max_initial_vessels,
             "objective"_a = PlanningObjective::MinimizeVessels,
             "schedule"_a = PassageSchedule())
        .def("plan", &ExpansionPlanner::plan, "vessel"_a, "target_cells"_a)
        .def("simulate", &ExpansionPlanner::simulate, "vessel"_a, "initial_vessels"_a, "target_cells"_a)
        .def("reseed_vessel_count", &ExpansionPlanner::reseedVesselCount, "vessel"_a, "previous_output"_a)
        .def("can_reseed", &ExpansionPlanner::canReseed, "vessel"_a, "previous_output"_a);

    // ==================== Resources ====================

    nb::class_<ResourceSummary>(m, "ResourceSummary")
        .def_ro("total_days", &ResourceSummary::total_days)
        .def_ro("total_medium_mL", &ResourceSummary::total_medium_mL)
        .def_ro("priming_volume_mL", &ResourceSummary::priming_volume_mL);

    nb::class_<ResourceAccountant>(m, "ResourceAccountant")
        .def(nb::init<realtype>(), "priming_fraction"_a = protocol::priming_fraction)
        .def("summarize", &ResourceAccountant::summarize,
             "plan"_a, "priming"_a, "medium_volume_mL"_a = nb::none());

    // ==================== TrajectorySimulator ====================

    nb::class_<TrajectorySimulator>(m, "TrajectorySimulator")
        .def(nb::init<const ExpansionPlan&, std::size_t>(),
             "plan"_a, "samples_per_passage"_a = protocol::samples_per_passage)
        .def("__len__", &TrajectorySimulator::size)
        .def("cells_at", &TrajectorySimulator::cellsAt, "t"_a)
        .def("days_to_reach", &TrajectorySimulator::daysToReach, "cells"_a)
        .def("is_degenerate", &TrajectorySimulator::isDegenerate, "passage_idx"_a)
        .def("to_array", &TrajectorySimulator::toArray)
        .def("times", &TrajectorySimulator::times)
        .def("cells", &TrajectorySimulator::cells)
        .def("save_to_npy", &TrajectorySimulator::save_to_npy, "filename"_a)
        .def("save_to_npz", &TrajectorySimulator::save_to_npz, "zipname"_a, "varname"_a, "mode"_a = "w");

    // ==================== ProtocolPlanner ====================

    nb::class_<PlanningConfig>(m, "PlanningConfig")
        .def(nb::init<>())
        .def_rw("max_passages", &PlanningConfig::max_passages)
        .def_rw("safety_factor", &PlanningConfig::safety_factor)
        .def_rw("max_initial_vessels", &PlanningConfig::max_initial_vessels)
        .def_rw("objective", &PlanningConfig::objective)
        .def_rw("schedule", &PlanningConfig::schedule)
        .def_rw("priming_fraction", &PlanningConfig::priming_fraction)
        .def_rw("samples_per_passage", &PlanningConfig::samples_per_passage);

    nb::class_<PlanningRequest>(m, "PlanningRequest")
        .def(nb::init<>())
        .def_rw("weight_kg", &PlanningRequest::weight_kg)
        .def_rw("dose_per_kg", &PlanningRequest::dose_per_kg)
        .def_rw("vessel", &PlanningRequest::vessel)
        .def_rw("separator", &PlanningRequest::separator)
        .def_rw("grade", &PlanningRequest::grade)
        .def_rw("priming", &PlanningRequest::priming)
        .def_rw("pediatric", &PlanningRequest::pediatric)
        .def_rw("medium_volume_mL", &PlanningRequest::medium_volume_mL);

    nb::class_<PlanningResult>(m, "PlanningResult")
        .def_ro("target", &PlanningResult::target)
        .def_ro("plan", &PlanningResult::plan)
        .def_ro("resources", &PlanningResult::resources)
        .def_ro("trajectory", &PlanningResult::trajectory)
        .def_ro("dose_response", &PlanningResult::dose_response)
        .def_ro("expected_response_pct", &PlanningResult::expected_response_pct)
        .def_ro("dose_in_recommended_range", &PlanningResult::dose_in_recommended_range);

    nb::class_<ProtocolPlanner>(m, "ProtocolPlanner")
        .def(nb::init<const EquipmentCatalog&, const PlanningConfig&>(),
             "catalog"_a, "config"_a = PlanningConfig(),
             nb::keep_alive<1, 2>())
        .def("plan", &ProtocolPlanner::plan, "request"_a)
        .def("get_config", &ProtocolPlanner::getConfig, nb::rv_policy::reference_internal);
}
