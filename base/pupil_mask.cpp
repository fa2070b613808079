// Illuminated footprint of a telescope aperture on a simulation grid.
// Author: Philip Salvaggio

#include "pupil_mask.h"

using namespace cv;

namespace zab {

PupilMask::PupilMask() : pixels_per_meter_(0) {}

PupilMask::PupilMask(const Mat_<uchar>& mask, double pixels_per_meter)
    : mask_(mask.clone()),
      pixels_per_meter_(pixels_per_meter) {}

PupilMask PupilMask::Circular(int size, double diameter_pixels,
                              double pixels_per_meter) {
  Mat_<uchar> mask = Mat_<uchar>::zeros(size, size);

  const double kCenter = 0.5 * (size - 1);
  const double kRadius = 0.5 * diameter_pixels;
  const double kRadius2 = kRadius * kRadius;

  for (int i = 0; i < size; i++) {
    double y = i - kCenter;
    for (int j = 0; j < size; j++) {
      double x = j - kCenter;
      mask(i, j) = (x*x + y*y < kRadius2) ? 1 : 0;
    }
  }

  return PupilMask(mask, pixels_per_meter);
}

int PupilMask::IlluminatedPixels() const {
  if (mask_.empty()) return 0;
  return countNonZero(mask_);
}

}
