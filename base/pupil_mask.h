// Illuminated footprint of a telescope aperture on a simulation grid.
// Author: Philip Salvaggio

#ifndef PUPIL_MASK_H
#define PUPIL_MASK_H

#include <opencv2/core/core.hpp>

namespace zab {

// A binary mask of the illuminated pixels of a pupil plane, along with the
// physical scale of the grid. The pupil is centered on the grid center,
// ((rows - 1) / 2, (cols - 1) / 2).
class PupilMask {
 public:
  PupilMask();
  PupilMask(const cv::Mat_<uchar>& mask, double pixels_per_meter);

  // Create a circular pupil on a square grid.
  //
  // Arguments:
  //  size              Side length of the grid [pixels]
  //  diameter_pixels   Diameter of the aperture [pixels]
  //  pixels_per_meter  Scale of the grid
  static PupilMask Circular(int size, double diameter_pixels,
                            double pixels_per_meter);

  const cv::Mat_<uchar>& mask() const { return mask_; }
  int rows() const { return mask_.rows; }
  int cols() const { return mask_.cols; }
  bool empty() const { return mask_.empty(); }

  bool illuminated(int row, int col) const { return mask_(row, col) != 0; }

  double pixels_per_meter() const { return pixels_per_meter_; }

  int IlluminatedPixels() const;

 private:
  cv::Mat_<uchar> mask_;
  double pixels_per_meter_;
};

}

#endif  // PUPIL_MASK_H
