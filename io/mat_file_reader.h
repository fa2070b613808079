// Reads numeric variables out of MATLAB MAT-files.
//
// Two on-disk formats are supported here:
//  - Level 4 (MATLAB -v4), and
//  - Level 5 (MATLAB -v6 and -v7), including the zlib-compressed variables
//    that -v7 writes by default.
// MATLAB -v7.3 files are HDF5 files and are read with HDF5Reader instead.
//
// Author: Philip Salvaggio

#ifndef MAT_FILE_READER_H
#define MAT_FILE_READER_H

#include <opencv2/core/core.hpp>

#include <string>
#include <vector>

namespace zab_io {

class MatFileReader {
 public:
  MatFileReader() = delete;

  // Read a real, full, 2D numeric variable from a Level 4 MAT-file.
  //
  // Arguments:
  //  filename  Path of the MAT-file
  //  variable  Name of the variable
  //  data      Output: the variable, converted to double
  static bool ReadLevel4(const std::string& filename,
                         const std::string& variable,
                         cv::Mat_<double>* data);

  // Read a real, 2D numeric variable from a Level 5 MAT-file. The stored
  // type may be any of MATLAB's numeric types.
  static bool ReadLevel5(const std::string& filename,
                         const std::string& variable,
                         cv::Mat_<double>* data);

 private:
  static bool ReadFile(const std::string& filename,
                       std::vector<unsigned char>* contents);

  static bool ParseMatrixElement(const unsigned char* begin,
                                 size_t num_bytes,
                                 bool swap,
                                 const std::string& variable,
                                 bool* found,
                                 cv::Mat_<double>* data);
};

}

#endif  // MAT_FILE_READER_H
