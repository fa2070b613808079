// Composition of a phase screen from Zernike coefficients and its addition to
// the pupil planes of the simulation.
// Author: Philip Salvaggio

#ifndef PHASE_SCREEN_H
#define PHASE_SCREEN_H

#include "base/aberration_config.pb.h"
#include "base/error_codes.h"

#include <opencv2/core/core.hpp>

namespace zab {

class ZernikeBasis;

// The pupil planes of the simulation that can receive the aberration.
enum class PupilPath {
  kScience,   // Feeds the science target.
  kAnalytic,  // Feeds the wavefront sensors.
};

// Whether an inclusion setting selects a pupil path.
bool IncludesPath(AberrationConfig::IncludePath include_path,
                  PupilPath target);

// Weighted sum of the basis modes, sum_j coefficients(0, j-1) * Z_j.
//
// Arguments:
//  basis         The Zernike modes
//  coefficients  A 1xC row of coefficients in Noll order [nm]. Columns past
//                basis.num_modes() are ignored.
//  delta         Output: the phase screen on the basis grid [nm]
//
// Returns:
//  kShapeMismatchError if there are fewer coefficients than modes.
ErrorCode ComposePhaseScreen(const ZernikeBasis& basis,
                             const cv::Mat_<double>& coefficients,
                             cv::Mat_<double>* delta);

// Add a phase screen to a pupil plane, if the inclusion setting selects it.
// The screen is added to what is already in the buffer.
//
// Arguments:
//  delta         The phase screen [nm]
//  target        The pupil plane that screen belongs to
//  include_path  The inclusion setting
//  screen        Output: the phase buffer of the pupil plane. Untouched if
//                target isn't included.
ErrorCode ApplyPhaseScreen(const cv::Mat_<double>& delta,
                           PupilPath target,
                           AberrationConfig::IncludePath include_path,
                           cv::Mat_<float>* screen);

}

#endif  // PHASE_SCREEN_H
