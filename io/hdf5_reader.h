// Reads numeric variables out of HDF5 files, such as MATLAB v7.3 MAT-files.
// Author: Philip Salvaggio

#ifndef HDF5_READER_H
#define HDF5_READER_H

#include <opencv2/core/core.hpp>

#include <string>

namespace zab_io {

class HDF5Reader {
 public:
  HDF5Reader() = delete;

  // Read a 1D or 2D dataset as doubles.
  //
  // The dataset is transposed after reading, as MATLAB writes its arrays in
  // column-major order. A 1D dataset of length N becomes an Nx1 matrix.
  //
  // Arguments:
  //  filename  Path of the HDF5 file
  //  dataset   Name of the dataset, e.g. "coeff" or "/group/coeff"
  //  data      Output: the dataset contents
  static bool Read(const std::string& filename,
                   const std::string& dataset,
                   cv::Mat_<double>* data);
};

}

#endif  // HDF5_READER_H
