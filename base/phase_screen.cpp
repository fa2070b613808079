// Composition of a phase screen from Zernike coefficients and its addition to
// the pupil planes of the simulation.
// Author: Philip Salvaggio

#include "phase_screen.h"

#include "base/zernike_basis.h"
#include "io/logging.h"

using namespace std;
using namespace cv;

namespace zab {

bool IncludesPath(AberrationConfig::IncludePath include_path,
                  PupilPath target) {
  if (include_path == AberrationConfig::BOTH) return true;

  switch (target) {
    case PupilPath::kScience:
      return include_path == AberrationConfig::SCIENCE_ONLY;
    case PupilPath::kAnalytic:
      return include_path == AberrationConfig::ANALYTIC_ONLY;
  }
  return false;
}

ErrorCode ComposePhaseScreen(const ZernikeBasis& basis,
                             const Mat_<double>& coefficients,
                             Mat_<double>* delta) {
  if (!delta) return ErrorCode::kShapeMismatchError;

  if (coefficients.rows != 1 || coefficients.cols < basis.num_modes()) {
    mainLog() << "Error: Expected a row of at least " << basis.num_modes()
              << " coefficients, got " << coefficients.rows << "x"
              << coefficients.cols << endl;
    return ErrorCode::kShapeMismatchError;
  }

  Mat_<double> phase = Mat_<double>::zeros(basis.rows(), basis.cols());
  for (int k = 1; k <= basis.num_modes(); k++) {
    const double kWeight = coefficients(0, k - 1);
    const Mat_<double>& mode = basis.mode(k);
    for (int i = 0; i < phase.rows; i++) {
      const double* mode_row = mode[i];
      double* phase_row = phase[i];
      for (int j = 0; j < phase.cols; j++) {
        phase_row[j] += kWeight * mode_row[j];
      }
    }
  }

  *delta = phase;
  return ErrorCode::kOk;
}

ErrorCode ApplyPhaseScreen(const Mat_<double>& delta,
                           PupilPath target,
                           AberrationConfig::IncludePath include_path,
                           Mat_<float>* screen) {
  if (!IncludesPath(include_path, target)) return ErrorCode::kOk;

  if (!screen) {
    mainLog() << "Error: No phase buffer given for the "
              << (target == PupilPath::kScience ? "science" : "analytic")
              << " pupil." << endl;
    return ErrorCode::kConfigurationError;
  }

  if (screen->rows != delta.rows || screen->cols != delta.cols) {
    mainLog() << "Error: Phase screen is " << delta.rows << "x" << delta.cols
              << " but the pupil buffer is " << screen->rows << "x"
              << screen->cols << endl;
    return ErrorCode::kShapeMismatchError;
  }

  for (int i = 0; i < delta.rows; i++) {
    const double* delta_row = delta[i];
    float* screen_row = (*screen)[i];
    for (int j = 0; j < delta.cols; j++) {
      screen_row[j] += static_cast<float>(delta_row[j]);
    }
  }

  return ErrorCode::kOk;
}

}
