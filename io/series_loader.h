// Loading of the time series of Zernike coefficients.
// Author: Philip Salvaggio

#ifndef SERIES_LOADER_H
#define SERIES_LOADER_H

#include "base/aberration_config.pb.h"
#include "base/error_codes.h"

#include <opencv2/core/core.hpp>

#include <string>
#include <vector>

namespace zab_io {

// Source of a time series of Zernike coefficients. Implementations return the
// coefficient matrix (one row per time sample, one column per Noll index, in
// nanometers) and the time stamps of each row (in seconds).
class SeriesLoader {
 public:
  virtual ~SeriesLoader() {}

  // Arguments:
  //  path          The file holding the series
  //  coeff_var     Name of the coefficient matrix variable
  //  time_var      Name of the time vector variable
  //  version       Format of the file
  //  coefficients  Output: TxC coefficient matrix [nm]
  //  times         Output: T time stamps [s]
  //
  // Returns:
  //  kOk or kFileLoadError
  virtual zab::ErrorCode Load(const std::string& path,
                              const std::string& coeff_var,
                              const std::string& time_var,
                              zab::AberrationConfig::MatVersion version,
                              cv::Mat_<double>* coefficients,
                              std::vector<double>* times) const = 0;
};

// Reads the series from a MATLAB MAT-file.
class MatFileSeriesLoader : public SeriesLoader {
 public:
  MatFileSeriesLoader() {}

  zab::ErrorCode Load(const std::string& path,
                      const std::string& coeff_var,
                      const std::string& time_var,
                      zab::AberrationConfig::MatVersion version,
                      cv::Mat_<double>* coefficients,
                      std::vector<double>* times) const override;

 private:
  bool ReadVariable(const std::string& path,
                    const std::string& variable,
                    zab::AberrationConfig::MatVersion version,
                    cv::Mat_<double>* data) const;
};

// Checks the shape of a loaded series against the number of modes in use.
//
// Returns:
//  kShapeMismatchError  If the series is empty, the number of time stamps
//                       differs from the number of rows, or there are fewer
//                       columns than modes.
//  kFileLoadError       If the time stamps decrease.
zab::ErrorCode ValidateSeries(const cv::Mat_<double>& coefficients,
                              const std::vector<double>& times,
                              int num_modes);

}

#endif  // SERIES_LOADER_H
