#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include "Catalog/DoseResponseRange.hpp"
#include "Catalog/EquipmentCatalog.hpp"
#include "ConfigurationError.hpp"

TEST(EquipmentCatalogTest, StandardCatalogDerivesFlaskCapacities) {
    const auto catalog = EquipmentCatalog::standard();

    const auto& t75 = catalog.vessel("T75");
    EXPECT_DOUBLE_EQ(t75.surface_area, 75.0);
    EXPECT_DOUBLE_EQ(t75.seeding_cells, 225000.0);
    EXPECT_DOUBLE_EQ(t75.confluent_cells, 900000.0);
    EXPECT_DOUBLE_EQ(t75.medium_volume, 15.0);
    EXPECT_DOUBLE_EQ(t75.max_medium_volume, 20.0);

    const auto& t175 = catalog.vessel("T175");
    EXPECT_DOUBLE_EQ(t175.seeding_cells, 437500.0);
    EXPECT_DOUBLE_EQ(t175.confluent_cells, 2100000.0);

    EXPECT_EQ(catalog.vesselNames(), (std::vector<std::string>{"T25", "T75", "T175"}));
    EXPECT_EQ(catalog.gradeNames(), (std::vector<std::string>{"Grade I", "Grade II", "Grade III-IV"}));
    EXPECT_TRUE(catalog.hasSeparator("PBSC"));
}

TEST(EquipmentCatalogTest, UnknownKeysThrowOrFallBack) {
    const auto catalog = EquipmentCatalog::standard();

    EXPECT_THROW(catalog.vessel("T1000"), std::runtime_error);
    EXPECT_THROW(catalog.separator("Spectra"), std::runtime_error);
    EXPECT_THROW(catalog.doseResponse("Grade V"), std::runtime_error);

    EXPECT_EQ(catalog.vesselOrFallback("T1000").name, "T75");
    EXPECT_EQ(catalog.separatorOrFallback("Spectra").name, "PBSC");
    EXPECT_EQ(catalog.doseResponseOrFallback("Grade V").grade, "Grade I");
}

TEST(EquipmentCatalogTest, FallbackCanBeChosen) {
    auto catalog = EquipmentCatalog::standard();
    catalog.setFallbackVessel("T25").setFallbackGrade("Grade II");

    EXPECT_EQ(catalog.vesselOrFallback("unknown").name, "T25");
    EXPECT_EQ(catalog.doseResponseOrFallback("unknown").grade, "Grade II");
    EXPECT_THROW(catalog.setFallbackVessel("unknown"), std::runtime_error);
}

TEST(EquipmentCatalogTest, EmptyCatalogHasNoFallback) {
    const EquipmentCatalog catalog;
    EXPECT_THROW(catalog.vesselOrFallback("T75"), std::runtime_error);
}

TEST(EquipmentCatalogTest, RejectsInvalidEntries) {
    EquipmentCatalog catalog;

    EXPECT_THROW(VesselType("broken").setSeedingCells(0.0), ConfigurationError);
    EXPECT_THROW(VesselType("broken").setConfluentCells(-1.0), ConfigurationError);

    VesselType shrinking("shrinking");
    shrinking.setSurfaceArea(25).setSeedingCells(1e6).setConfluentCells(5e5).setMediumVolume(5);
    EXPECT_THROW(catalog.addVessel(shrinking), ConfigurationError);

    EXPECT_THROW(catalog.addSeparator(SeparatorProfile("dry", 0.0)), ConfigurationError);

    catalog.addSeparator(SeparatorProfile("PBSC"));
    EXPECT_THROW(catalog.addSeparator(SeparatorProfile("PBSC")), ConfigurationError);
}

TEST(EquipmentCatalogTest, CatalogsAreIndependent) {
    auto lab_a = EquipmentCatalog::standard();
    EquipmentCatalog lab_b;

    VesselType flask("standard-medium");
    flask.setSurfaceArea(75).setSeedingCells(2.1e6).setConfluentCells(8.4e6).setMediumVolume(15);
    lab_b.addVessel(flask);

    EXPECT_FALSE(lab_a.hasVessel("standard-medium"));
    EXPECT_TRUE(lab_b.hasVessel("standard-medium"));
    EXPECT_EQ(lab_b.vesselOrFallback("T75").name, "standard-medium");
}

TEST(DoseResponseRangeTest, InterpolatesAndClamps) {
    const DoseResponseRange grade2("Grade II", 1.0, 1.5, 50, 70);

    EXPECT_DOUBLE_EQ(grade2.responseAt(1.0), 50.0);
    EXPECT_NEAR(grade2.responseAt(1.25), 60.0, 1e-12);
    EXPECT_DOUBLE_EQ(grade2.responseAt(1.5), 70.0);
    EXPECT_DOUBLE_EQ(grade2.responseAt(0.5), 50.0);
    EXPECT_DOUBLE_EQ(grade2.responseAt(2.0), 70.0);

    EXPECT_TRUE(grade2.contains(1.2));
    EXPECT_FALSE(grade2.contains(1.6));

    EXPECT_THROW(DoseResponseRange("bad", 1.5, 1.0, 50, 70), ConfigurationError);
    EXPECT_THROW(DoseResponseRange("bad", 1.0, 1.5, 50, 120), ConfigurationError);
}

TEST(EquipmentCatalogTest, RejectsNaNValues) {
    const realtype nan = std::numeric_limits<realtype>::quiet_NaN();

    EXPECT_THROW(VesselType("nan").setSeedingCells(nan), ConfigurationError);
    EXPECT_THROW(VesselType("nan").setMediumVolumeRange(nan, 10), ConfigurationError);
    EXPECT_THROW(VesselType::fromSurfaceDensity("nan", 75, 3000, 15000, nan, 15, 20), ConfigurationError);

    // fields are public and may be changed after building
    VesselType vessel("edited");
    vessel.setSurfaceArea(75).setSeedingCells(2.1e6).setConfluentCells(8.4e6).setMediumVolume(15);
    vessel.seeding_cells = nan;
    EXPECT_THROW(vessel.validate(), ConfigurationError);
    EquipmentCatalog catalog;
    EXPECT_THROW(catalog.addVessel(vessel), ConfigurationError);

    EXPECT_THROW(SeparatorProfile("nan", nan).validate(), ConfigurationError);
    EXPECT_THROW(SeparatorProfile("nan", 2e4, nan).validate(), ConfigurationError);
    EXPECT_THROW(DoseResponseRange("nan", nan, 1.0, 60, 80), ConfigurationError);
    EXPECT_THROW(DoseResponseRange("nan", 0.5, 1.0, 60, nan), ConfigurationError);
}
