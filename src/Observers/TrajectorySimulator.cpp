#include "Observers/TrajectorySimulator.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

#include "Logger.hpp"
#include "Observers/NumpyIO.hpp"

realtype TrajectorySimulator::Segment::valueAt(realtype t) const {
    if (degenerate) return output;
    if (t >= start + duration) return output;
    if (t <= start) return input;
    return input * std::exp(rate * (t - start));
}

TrajectorySimulator::TrajectorySimulator(const ExpansionPlan& plan, std::size_t samples_per_passage)
    : samples_per_passage(samples_per_passage) {
    if (samples_per_passage < 2) {
        throw std::invalid_argument("TrajectorySimulator needs 2 or more samples per passage.");
    }
    segments.reserve(plan.size());

    for (const auto& passage : plan.getPassages()) {
        Segment segment{passage.start_day, passage.duration_days, passage.input_cells, passage.output_cells, 0.0, false};

        if (passage.input_cells <= 0.0 || passage.output_cells <= 0.0 || passage.duration_days <= 0.0) {
            segment.degenerate = true;
            LOG("trajectory_simulator.log", "Degenerate passage " << passage.index << " (input=" << passage.input_cells
                                                                  << ", output=" << passage.output_cells
                                                                  << ", duration=" << passage.duration_days
                                                                  << " d): flat segment at output\n");
        } else {
            segment.rate = std::log(passage.output_cells / passage.input_cells) / passage.duration_days;
        }
        segments.push_back(segment);
    }
}

std::size_t TrajectorySimulator::size() const {
    if (segments.empty()) return 0;
    return samples_per_passage + (segments.size() - 1) * (samples_per_passage - 1);
}

TrajectorySample TrajectorySimulator::sample(std::size_t idx) const {
    if (idx >= size()) {
        throw std::out_of_range("Trajectory sample index out of range: " + std::to_string(idx));
    }

    std::size_t segmentIdx = 0;
    std::size_t j = idx;
    if (idx >= samples_per_passage) {
        const std::size_t k = idx - samples_per_passage;
        segmentIdx = 1 + k / (samples_per_passage - 1);
        j = 1 + k % (samples_per_passage - 1);
    }

    const auto& segment = segments[segmentIdx];
    const std::size_t last = samples_per_passage - 1;
    const realtype width = segment.duration > 0.0 ? segment.duration : 0.0;
    const realtype t = segment.start + width * static_cast<realtype>(j) / static_cast<realtype>(last);

    // end points are exact, they must match the discrete passage records
    if (segment.degenerate || j == last) return {t, segment.output};
    if (j == 0) return {t, segment.input};
    return {t, segment.input * std::exp(segment.rate * (t - segment.start))};
}

realtype TrajectorySimulator::cellsAt(realtype t) const {
    if (segments.empty()) return 0.0;
    // last segment that has started; at a passage boundary the re-seeded passage wins
    std::size_t i = 0;
    while (i + 1 < segments.size() && segments[i + 1].start <= t) ++i;
    return segments[i].valueAt(t);
}

std::optional<realtype> TrajectorySimulator::daysToReach(realtype cells) const {
    for (const auto& segment : segments) {
        if (segment.output < cells) continue;
        if (segment.degenerate || segment.input >= cells) return segment.start;
        return segment.start + std::log(cells / segment.input) / segment.rate;
    }
    return std::nullopt;
}

Array TrajectorySimulator::toArray() const {
    Array samples(size(), 2);
    Eigen::Index row = 0;
    for (const auto& s : *this) {
        samples(row, 0) = s.t;
        samples(row, 1) = s.cells;
        ++row;
    }
    return samples;
}

ColVector TrajectorySimulator::times() const { return toArray().col(0); }

ColVector TrajectorySimulator::cells() const { return toArray().col(1); }

void TrajectorySimulator::save_to_npy(const std::string& filename) const {
    if (size() == 0) {
        std::cerr << "Warning: No trajectory samples to save." << std::endl;
        return;
    }
    CEP::npy_save(filename, toArray());
    LOG("trajectory_simulator.log", "Saved " << size() << " samples to " << filename << "\n");
}

void TrajectorySimulator::save_to_npz(const std::string& zipname,
                                      const std::string& varname,
                                      const std::string& mode) const {
    if (size() == 0) {
        std::cerr << "Warning: No trajectory samples to save." << std::endl;
        return;
    }
    CEP::npz_save(zipname, varname, toArray(), mode);
    LOG("trajectory_simulator.log", "Saved " << size() << " samples as '" << varname << "' to " << zipname << "\n");
}
