#ifndef TRAJECTORY_SIMULATOR_HPP
#define TRAJECTORY_SIMULATOR_HPP

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "EigenDataTypes.hpp"
#include "Planning/ExpansionPlan.hpp"
#include "ProtocolConstants.hpp"

/// @brief One point of the growth curve
struct TrajectorySample {
    realtype t;      // days since initial seeding
    realtype cells;  // total cell count across all vessels
};

/**
 * @brief Piecewise-exponential growth curve of an ExpansionPlan
 *
 * Each passage is sampled at samples_per_passage evenly spaced times and
 * interpolated as cells(t) = input · exp(r (t - start)) with
 * r = ln(output / input) / duration. The first sample of every re-seeded
 * passage coincides with the last one of its predecessor and is skipped.
 * Passages with non-positive input, output or duration are drawn as a flat
 * segment at their output value.
 *
 * Samples are computed on demand by the iterators; iterating twice gives
 * the same sequence.
 */
class TrajectorySimulator {
   public:
    class const_iterator {
       public:
        using iterator_category = std::random_access_iterator_tag;
        using value_type = TrajectorySample;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = TrajectorySample;

        const_iterator() = default;
        const_iterator(const TrajectorySimulator* simulator, std::size_t position)
            : simulator(simulator), position(position) {}

        TrajectorySample operator*() const { return simulator->sample(position); }
        TrajectorySample operator[](difference_type n) const { return simulator->sample(position + n); }

        const_iterator& operator++() {
            ++position;
            return *this;
        }
        const_iterator operator++(int) {
            const_iterator tmp = *this;
            ++position;
            return tmp;
        }
        const_iterator& operator--() {
            --position;
            return *this;
        }
        const_iterator operator--(int) {
            const_iterator tmp = *this;
            --position;
            return tmp;
        }
        const_iterator& operator+=(difference_type n) {
            position += n;
            return *this;
        }
        const_iterator& operator-=(difference_type n) {
            position -= n;
            return *this;
        }
        const_iterator operator+(difference_type n) const { return const_iterator(simulator, position + n); }
        const_iterator operator-(difference_type n) const { return const_iterator(simulator, position - n); }
        difference_type operator-(const const_iterator& other) const {
            return static_cast<difference_type>(position) - static_cast<difference_type>(other.position);
        }

        bool operator==(const const_iterator& other) const {
            return simulator == other.simulator && position == other.position;
        }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }
        bool operator<(const const_iterator& other) const { return position < other.position; }
        bool operator>(const const_iterator& other) const { return position > other.position; }
        bool operator<=(const const_iterator& other) const { return position <= other.position; }
        bool operator>=(const const_iterator& other) const { return position >= other.position; }

       private:
        const TrajectorySimulator* simulator = nullptr;
        std::size_t position = 0;
    };

    explicit TrajectorySimulator(const ExpansionPlan& plan,
                                 std::size_t samples_per_passage = protocol::samples_per_passage);

    std::size_t size() const;
    TrajectorySample sample(std::size_t idx) const;

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, size()); }

    // Curve value at an arbitrary time, clamped to the first/last value outside the plan
    realtype cellsAt(realtype t) const;

    // First time at which the curve reaches the given cell count
    std::optional<realtype> daysToReach(realtype cells) const;

    bool isDegenerate(std::size_t passageIdx) const { return segments.at(passageIdx).degenerate; }
    realtype growthRate(std::size_t passageIdx) const { return segments.at(passageIdx).rate; }
    std::size_t getSamplesPerPassage() const { return samples_per_passage; }
    std::size_t n_passages() const { return segments.size(); }

    // [n_samples, 2] with columns (t, cells)
    Array toArray() const;
    ColVector times() const;
    ColVector cells() const;

    void save_to_npy(const std::string& filename) const;
    void save_to_npz(const std::string& zipname, const std::string& varname, const std::string& mode = "w") const;

   private:
    struct Segment {
        realtype start;
        realtype duration;
        realtype input;
        realtype output;
        realtype rate;  // 1/day, 0 for degenerate segments
        bool degenerate;

        realtype valueAt(realtype t) const;
    };

    std::vector<Segment> segments;
    std::size_t samples_per_passage;
};

#endif  // TRAJECTORY_SIMULATOR_HPP
