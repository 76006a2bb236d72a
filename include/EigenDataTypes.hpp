#ifndef EIGENDATATYPES_HPP
#define EIGENDATATYPES_HPP

#include <cstddef>

#include "Eigen/Dense"
#include "sundials/sundials_types.h"

// dynamic-sized 2D Array, row-major (e.g. trajectory samples: [time, cells] per row)
using Array = Eigen::Array<realtype, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Column *array* type (elementwise semantics)
using ColVector = Eigen::Array<realtype, Eigen::Dynamic, 1>;

// Integer column (vessel counts per passage)
using IndexColVector = Eigen::Array<sunindextype, Eigen::Dynamic, 1>;

#endif  // EIGENDATATYPES_HPP
