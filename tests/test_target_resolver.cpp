#include <gtest/gtest.h>

#include <stdexcept>

#include "ConfigurationError.hpp"
#include "Planning/TargetResolver.hpp"

TEST(TargetResolverTest, ResolvesCellsAndCollectionVolume) {
    const TargetResolver resolver;
    const SeparatorProfile separator("lab", 1e6, 50.0);

    const DoseTarget target = resolver.resolve(70.0, 1.0, separator);
    EXPECT_DOUBLE_EQ(target.cells, 70e6);
    EXPECT_DOUBLE_EQ(target.collection_volume_mL, 70.0);
    EXPECT_DOUBLE_EQ(target.weight_kg, 70.0);
    EXPECT_DOUBLE_EQ(target.dose_per_kg, 1.0);
}

TEST(TargetResolverTest, StandardPbscYield) {
    const TargetResolver resolver;
    // 1x10^6 cells per 50 mL
    const DoseTarget target = resolver.resolve(70.0, 1.0, SeparatorProfile("PBSC"));
    EXPECT_DOUBLE_EQ(target.collection_volume_mL, 3500.0);
}

TEST(TargetResolverTest, CollectionVolumeIsClampedToFloor) {
    const TargetResolver resolver;
    const DoseTarget target = resolver.resolve(30.0, 0.5, SeparatorProfile("rich", 1e7, 50.0));
    EXPECT_DOUBLE_EQ(target.cells, 15e6);
    EXPECT_DOUBLE_EQ(target.collection_volume_mL, 50.0);
}

TEST(TargetResolverTest, ZeroYieldIsAConfigurationError) {
    const TargetResolver resolver;
    EXPECT_THROW(resolver.resolve(70.0, 1.0, SeparatorProfile("dry", 0.0)), ConfigurationError);
    EXPECT_THROW(resolver.resolve(70.0, 1.0, SeparatorProfile("negative", -5.0)), ConfigurationError);
}

TEST(TargetResolverTest, RejectsOutOfRangeInputs) {
    const TargetResolver adult;
    const SeparatorProfile separator("PBSC");

    EXPECT_THROW(adult.resolve(10.0, 1.0, separator), std::invalid_argument);
    EXPECT_THROW(adult.resolve(121.0, 1.0, separator), std::invalid_argument);
    EXPECT_THROW(adult.resolve(70.0, 0.4, separator), std::invalid_argument);
    EXPECT_THROW(adult.resolve(70.0, 2.1, separator), std::invalid_argument);

    EXPECT_NO_THROW(adult.resolve(30.0, 0.5, separator));
    EXPECT_NO_THROW(adult.resolve(120.0, 2.0, separator));
}

TEST(TargetResolverTest, PediatricBoundsAcceptLowWeights) {
    const TargetResolver pediatric(WeightBounds::pediatric());
    const DoseTarget target = pediatric.resolve(8.0, 1.5, SeparatorProfile("PBSC"));
    EXPECT_DOUBLE_EQ(target.cells, 12e6);
    EXPECT_THROW(pediatric.resolve(7.9, 1.5, SeparatorProfile("PBSC")), std::invalid_argument);
}

TEST(TargetResolverTest, InvalidBoundsAreRejected) {
    EXPECT_THROW(TargetResolver(WeightBounds{120.0, 30.0}), ConfigurationError);
    EXPECT_THROW(TargetResolver(WeightBounds::adult(), 0.0, 2.0), ConfigurationError);
}
