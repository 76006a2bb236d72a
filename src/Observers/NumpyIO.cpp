/**
 * @file NumpyIO.cpp
 * @brief Implementation of the NumPy I/O wrappers
 */

#include "Observers/NumpyIO.hpp"

#include "Logger.hpp"
#include "cnpy.h"

namespace CEP {

template <typename T>
void npy_save(const std::string& filename, const T* data, const std::vector<size_t>& shape, const std::string& mode) {
    cnpy::npy_save(filename, data, shape, mode);
}

template <typename T>
void npz_save(const std::string& zipname,
              const std::string& varname,
              const T* data,
              const std::vector<size_t>& shape,
              const std::string& mode) {
    cnpy::npz_save(zipname, varname, data, shape, mode);
}

void npy_save(const std::string& filename, const Array& array, const std::string& mode) {
    npy_save<realtype>(filename, array.data(),
                       {static_cast<size_t>(array.rows()), static_cast<size_t>(array.cols())}, mode);
    LOG("numpy_io.log", "Saved " << array.rows() << "x" << array.cols() << " array to " << filename << "\n");
}

void npz_save(const std::string& zipname, const std::string& varname, const Array& array, const std::string& mode) {
    npz_save<realtype>(zipname, varname, array.data(),
                       {static_cast<size_t>(array.rows()), static_cast<size_t>(array.cols())}, mode);
    LOG("numpy_io.log", "Saved " << array.rows() << "x" << array.cols() << " array as '" << varname << "' to "
                                 << zipname << "\n");
}

// Explicit template instantiations for the exported types
template void npy_save<double>(const std::string&, const double*, const std::vector<size_t>&, const std::string&);

template void npz_save<double>(const std::string&,
                               const std::string&,
                               const double*,
                               const std::vector<size_t>&,
                               const std::string&);

}  // namespace CEP
