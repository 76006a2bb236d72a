/**
 * @file NumpyIO.hpp
 * @brief Saving plan and trajectory data as NumPy .npy and .npz files
 *
 * Thin layer over cnpy so that plotting scripts can load the results
 * with numpy.load().
 */

#ifndef CEP_NUMPY_IO_HPP
#define CEP_NUMPY_IO_HPP

#include <string>
#include <vector>

#include "EigenDataTypes.hpp"

namespace CEP {

/**
 * @brief Save raw data to a .npy file
 *
 * @tparam T Data type (double)
 * @param filename Path to the output file (should end with .npy)
 * @param data Pointer to the data array, row-major
 * @param shape Shape of the array (e.g., {rows, cols} for 2D)
 * @param mode "w" to overwrite, "a" to append along the first axis
 */
template <typename T>
void npy_save(const std::string& filename,
              const T* data,
              const std::vector<size_t>& shape,
              const std::string& mode = "w");

/**
 * @brief Save raw data as variable varname in a .npz archive
 *
 * @param mode "w" to overwrite/create, "a" to add the variable to an existing archive
 */
template <typename T>
void npz_save(const std::string& zipname,
              const std::string& varname,
              const T* data,
              const std::vector<size_t>& shape,
              const std::string& mode = "w");

// Row-major 2D arrays, shape (rows, cols)
void npy_save(const std::string& filename, const Array& array, const std::string& mode = "w");
void npz_save(const std::string& zipname, const std::string& varname, const Array& array, const std::string& mode = "w");

}  // namespace CEP

#endif  // CEP_NUMPY_IO_HPP
