#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <iterator>
#include <vector>

#include "Observers/TrajectorySimulator.hpp"
#include "Planning/ExpansionPlanner.hpp"
#include "cnpy.h"

namespace {

VesselType standardMedium() {
    VesselType vessel("standard-medium");
    vessel.setSurfaceArea(75).setSeedingCells(2.1e6).setConfluentCells(8.4e6).setMediumVolume(15);
    return vessel;
}

ExpansionPlan fourPassagePlan() {
    const ExpansionPlanner planner;
    return planner.plan(standardMedium(), 500e6);  // days 0-7, 7-12, 12-17, 17-22
}

}  // namespace

TEST(TrajectorySimulatorTest, SampleCountSkipsSharedBoundaries) {
    const TrajectorySimulator trajectory(fourPassagePlan(), 50);
    EXPECT_EQ(trajectory.size(), 50u + 3u * 49u);
    EXPECT_EQ(static_cast<std::size_t>(std::distance(trajectory.begin(), trajectory.end())), trajectory.size());
}

TEST(TrajectorySimulatorTest, EndpointsMatchPassageRecords) {
    const auto plan = fourPassagePlan();
    const TrajectorySimulator trajectory(plan, 50);

    const auto first = *trajectory.begin();
    EXPECT_DOUBLE_EQ(first.t, 0.0);
    EXPECT_DOUBLE_EQ(first.cells, plan[0].input_cells);

    const auto last = trajectory.sample(trajectory.size() - 1);
    EXPECT_DOUBLE_EQ(last.t, 22.0);
    EXPECT_DOUBLE_EQ(last.cells, plan.finalOutput());

    // last sample of passage 0
    const auto boundary = trajectory.sample(49);
    EXPECT_DOUBLE_EQ(boundary.t, 7.0);
    EXPECT_DOUBLE_EQ(boundary.cells, plan[0].output_cells);
}

TEST(TrajectorySimulatorTest, ExponentialInterpolationWithinPassage) {
    const TrajectorySimulator trajectory(fourPassagePlan(), 3);

    // passage 0 grows 4-fold over 7 days, so it doubles at 3.5 days
    const auto mid = trajectory.sample(1);
    EXPECT_DOUBLE_EQ(mid.t, 3.5);
    EXPECT_NEAR(mid.cells, 4.2e6, 1e-3);
    EXPECT_NEAR(trajectory.growthRate(0), std::log(4.0) / 7.0, 1e-12);

    EXPECT_NEAR(trajectory.cellsAt(3.5), 4.2e6, 1e-3);
    EXPECT_DOUBLE_EQ(trajectory.cellsAt(-1.0), 2.1e6);
    EXPECT_DOUBLE_EQ(trajectory.cellsAt(7.0), 8.4e6);
    EXPECT_DOUBLE_EQ(trajectory.cellsAt(100.0), 974.4e6);
}

TEST(TrajectorySimulatorTest, CurveIsMonotonicAndFinite) {
    const TrajectorySimulator trajectory(fourPassagePlan());

    TrajectorySample previous{-1.0, 0.0};
    for (const auto& sample : trajectory) {
        ASSERT_TRUE(std::isfinite(sample.t));
        ASSERT_TRUE(std::isfinite(sample.cells));
        EXPECT_GE(sample.t, previous.t);
        EXPECT_GE(sample.cells, previous.cells * (1 - 1e-12));
        previous = sample;
    }
}

TEST(TrajectorySimulatorTest, RegenerationYieldsSameSamples) {
    const auto plan = fourPassagePlan();
    const TrajectorySimulator trajectory(plan);
    const TrajectorySimulator again(plan);

    const std::vector<TrajectorySample> first(trajectory.begin(), trajectory.end());
    const std::vector<TrajectorySample> second(trajectory.begin(), trajectory.end());
    const std::vector<TrajectorySample> third(again.begin(), again.end());

    ASSERT_EQ(first.size(), second.size());
    ASSERT_EQ(first.size(), third.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].t, second[i].t);
        EXPECT_EQ(first[i].cells, second[i].cells);
        EXPECT_EQ(first[i].cells, third[i].cells);
    }
}

TEST(TrajectorySimulatorTest, ZeroDurationPassageIsFlat) {
    const auto vessel = standardMedium();
    std::vector<PassageRecord> passages{
        {0, 1, 2.1e6, 8.4e6, 7.0, 3, 0.0},
        {1, 5, 8.4e6, 42e6, 0.0, 2, 7.0},
    };
    const ExpansionPlan plan(vessel, passages, 42e6, true);
    const TrajectorySimulator trajectory(plan, 10);

    EXPECT_FALSE(trajectory.isDegenerate(0));
    EXPECT_TRUE(trajectory.isDegenerate(1));
    EXPECT_DOUBLE_EQ(trajectory.growthRate(1), 0.0);

    for (std::size_t i = 10; i < trajectory.size(); ++i) {
        const auto sample = trajectory.sample(i);
        EXPECT_DOUBLE_EQ(sample.t, 7.0);
        EXPECT_DOUBLE_EQ(sample.cells, 42e6);
    }
    for (const auto& sample : trajectory) {
        EXPECT_FALSE(std::isnan(sample.cells));
    }
}

TEST(TrajectorySimulatorTest, ZeroInputPassageIsFlat) {
    const auto vessel = standardMedium();
    const ExpansionPlan plan(vessel, {{0, 1, 0.0, 8.4e6, 7.0, 3, 0.0}}, 8.4e6, true);
    const TrajectorySimulator trajectory(plan, 5);

    EXPECT_TRUE(trajectory.isDegenerate(0));
    for (const auto& sample : trajectory) {
        EXPECT_DOUBLE_EQ(sample.cells, 8.4e6);
    }
    EXPECT_DOUBLE_EQ(trajectory.sample(4).t, 7.0);
}

TEST(TrajectorySimulatorTest, DaysToReach) {
    const TrajectorySimulator trajectory(fourPassagePlan());

    ASSERT_TRUE(trajectory.daysToReach(4.2e6).has_value());
    EXPECT_NEAR(*trajectory.daysToReach(4.2e6), 3.5, 1e-9);
    EXPECT_DOUBLE_EQ(*trajectory.daysToReach(1.0), 0.0);
    EXPECT_GT(*trajectory.daysToReach(500e6), 17.0);
    EXPECT_FALSE(trajectory.daysToReach(1e12).has_value());
}

TEST(TrajectorySimulatorTest, ArrayExportMatchesIteration) {
    const TrajectorySimulator trajectory(fourPassagePlan(), 20);
    const Array samples = trajectory.toArray();

    ASSERT_EQ(samples.rows(), static_cast<Eigen::Index>(trajectory.size()));
    ASSERT_EQ(samples.cols(), 2);
    EXPECT_DOUBLE_EQ(samples(0, 1), 2.1e6);
    EXPECT_DOUBLE_EQ(samples(samples.rows() - 1, 0), 22.0);
    EXPECT_TRUE((trajectory.times() == samples.col(0)).all());
    EXPECT_TRUE((trajectory.cells() == samples.col(1)).all());
}

TEST(TrajectorySimulatorTest, SavesNpyFile) {
    const TrajectorySimulator trajectory(fourPassagePlan(), 10);
    const auto path = std::filesystem::temp_directory_path() / "cep_trajectory_test.npy";

    trajectory.save_to_npy(path.string());

    cnpy::NpyArray loaded = cnpy::npy_load(path.string());
    ASSERT_EQ(loaded.shape.size(), 2u);
    EXPECT_EQ(loaded.shape[0], trajectory.size());
    EXPECT_EQ(loaded.shape[1], 2u);
    const double* data = loaded.data<double>();
    EXPECT_DOUBLE_EQ(data[1], 2.1e6);
    EXPECT_DOUBLE_EQ(data[2 * trajectory.size() - 1], 974.4e6);

    std::filesystem::remove(path);
}

TEST(TrajectorySimulatorTest, RejectsTooFewSamples) {
    EXPECT_THROW(TrajectorySimulator(fourPassagePlan(), 1), std::invalid_argument);
    const TrajectorySimulator trajectory(fourPassagePlan(), 2);
    EXPECT_THROW(trajectory.sample(trajectory.size()), std::out_of_range);
}
