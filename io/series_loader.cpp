// Loading of the time series of Zernike coefficients.
// Author: Philip Salvaggio

#include "series_loader.h"

#include "io/hdf5_reader.h"
#include "io/logging.h"
#include "io/mat_file_reader.h"

using namespace std;
using zab::AberrationConfig;
using zab::ErrorCode;

namespace zab_io {

ErrorCode MatFileSeriesLoader::Load(const string& path,
                                    const string& coeff_var,
                                    const string& time_var,
                                    AberrationConfig::MatVersion version,
                                    cv::Mat_<double>* coefficients,
                                    vector<double>* times) const {
  if (!coefficients || !times) return ErrorCode::kFileLoadError;

  if (!ReadVariable(path, coeff_var, version, coefficients)) {
    return ErrorCode::kFileLoadError;
  }

  cv::Mat_<double> time_mat;
  if (!ReadVariable(path, time_var, version, &time_mat)) {
    return ErrorCode::kFileLoadError;
  }

  // The time stamps may be saved as a row or a column vector.
  if (time_mat.rows != 1 && time_mat.cols != 1) {
    mainLog() << "Error: Time variable " << time_var << " is a "
              << time_mat.rows << "x" << time_mat.cols
              << " matrix, expected a vector." << endl;
    return ErrorCode::kFileLoadError;
  }

  times->clear();
  for (auto it = time_mat.begin(); it != time_mat.end(); ++it) {
    times->push_back(*it);
  }

  mainLog() << "Loaded " << coefficients->rows << "x" << coefficients->cols
            << " coefficients and " << times->size() << " time stamps from "
            << path << endl;
  return ErrorCode::kOk;
}

bool MatFileSeriesLoader::ReadVariable(const string& path,
                                       const string& variable,
                                       AberrationConfig::MatVersion version,
                                       cv::Mat_<double>* data) const {
  switch (version) {
    case AberrationConfig::V4:
      return MatFileReader::ReadLevel4(path, variable, data);
    case AberrationConfig::V6:
    case AberrationConfig::V7:
      return MatFileReader::ReadLevel5(path, variable, data);
    case AberrationConfig::V7_3:
      return HDF5Reader::Read(path, variable, data);
  }

  mainLog() << "Error: Unknown MAT-file version " << version << endl;
  return false;
}

ErrorCode ValidateSeries(const cv::Mat_<double>& coefficients,
                         const vector<double>& times,
                         int num_modes) {
  if (coefficients.rows == 0 || times.empty()) {
    mainLog() << "Error: The aberration series is empty." << endl;
    return ErrorCode::kShapeMismatchError;
  }

  if (static_cast<size_t>(coefficients.rows) != times.size()) {
    mainLog() << "Error: The coefficient series has " << coefficients.rows
              << " rows, but there are " << times.size() << " time stamps."
              << endl;
    return ErrorCode::kShapeMismatchError;
  }

  if (coefficients.cols < num_modes) {
    mainLog() << "Error: The coefficient series has " << coefficients.cols
              << " columns, but " << num_modes << " modes were requested."
              << endl;
    return ErrorCode::kShapeMismatchError;
  }

  for (size_t i = 1; i < times.size(); i++) {
    if (times[i] < times[i-1]) {
      mainLog() << "Error: Time stamps decrease at sample " << i << endl;
      return ErrorCode::kFileLoadError;
    }
  }

  return ErrorCode::kOk;
}

}
