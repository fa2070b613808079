// A cube of Zernike modes evaluated on a pupil mask.
// Author: Philip Salvaggio

#ifndef ZERNIKE_BASIS_H
#define ZERNIKE_BASIS_H

#include "base/error_codes.h"

#include <opencv2/core/core.hpp>

#include <vector>

namespace zab {

class PupilMask;

// Sentinel values of the pupil diameter.
const double kPupDiamFitToPupil = -2;
const double kPupDiamTelescope = -1;

// Determine the diameter of the unit disk on which the Zernike polynomials are
// defined.
//
// Arguments:
//  native_diameter_pixels  Diameter of the telescope pupil on the grid [px]
//  diam_data               Diameter covered by the aberration data [m]
//  pup_diam                Diameter of the pupil within the data [m], or one
//                          of the sentinels:
//                           -2  The disk is the native pupil, no rescaling and
//                               no truncation. diam_data is ignored.
//                           -1  pup_diam is replaced by telescope_diameter.
//  telescope_diameter      Diameter of the simulated telescope [m]
//  disk_diameter_pixels    Output: diameter of the disk [px]
//  truncate                Output: whether pixels outside the disk are zeroed
ErrorCode ResolveDiskDiameter(double native_diameter_pixels,
                              double diam_data,
                              double pup_diam,
                              double telescope_diameter,
                              double* disk_diameter_pixels,
                              bool* truncate);

// Zernike modes over the illuminated pixels of a pupil, in Noll order. Mode 1
// (piston) is exactly 1 over the support, and every other mode has zero mean
// and unit RMS over the support. Mode j remains Z_j up to that offset and
// scale, so a coefficient always drives its own Noll mode. All modes are zero
// outside the support.
class ZernikeBasis {
 public:
  ZernikeBasis();
  ZernikeBasis(const ZernikeBasis& other) = delete;
  ZernikeBasis(ZernikeBasis&& other) = default;

  ZernikeBasis& operator=(const ZernikeBasis& other) = delete;
  ZernikeBasis& operator=(ZernikeBasis&& other) = default;

  // Build the modes for a pupil.
  //
  // The polynomials are evaluated on the disk given by ResolveDiskDiameter(),
  // centered on the grid. Every mode past piston then has its mean over the
  // support removed and is scaled to unit RMS over the support. A mode that
  // is flat over the support is left at zero.
  //
  // Arguments:
  //  pupil                   The illuminated pixels of the grid
  //  native_diameter_pixels  Diameter of the telescope pupil on the grid [px]
  //  num_modes               Number of modes, starting at piston
  //  diam_data               See ResolveDiskDiameter()
  //  pup_diam                See ResolveDiskDiameter()
  //  telescope_diameter      See ResolveDiskDiameter()
  //  basis                   Output: the modes
  //
  // Returns:
  //  kConfigurationError for invalid parameters, or if no illuminated pixel
  //  lies within the disk.
  static ErrorCode Build(const PupilMask& pupil,
                         double native_diameter_pixels,
                         int num_modes,
                         double diam_data,
                         double pup_diam,
                         double telescope_diameter,
                         ZernikeBasis* basis);

  int num_modes() const { return static_cast<int>(modes_.size()); }
  int rows() const { return support_.rows; }
  int cols() const { return support_.cols; }
  bool empty() const { return modes_.empty(); }

  // Mode for a Noll index, 1 <= noll_index <= num_modes().
  const cv::Mat_<double>& mode(int noll_index) const {
    return modes_[noll_index - 1];
  }

  // Pixels on which the modes are defined.
  const cv::Mat_<uchar>& support() const { return support_; }
  int SupportPixels() const;

  double disk_diameter_pixels() const { return disk_diameter_pixels_; }
  bool truncated() const { return truncated_; }

 private:
  std::vector<cv::Mat_<double>> modes_;
  cv::Mat_<uchar> support_;
  double disk_diameter_pixels_;
  bool truncated_;
};

}

#endif  // ZERNIKE_BASIS_H
