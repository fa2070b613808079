// A cube of Zernike modes evaluated on a pupil mask.
// Author: Philip Salvaggio

#include "zernike_basis.h"

#include "base/pupil_mask.h"
#include "base/zernike_aberrations.h"
#include "io/logging.h"

#include <cmath>

using namespace std;
using namespace cv;

namespace zab {

namespace {

// Below this RMS, a mode with its mean removed is flat over the support.
const double kFlatRms = 1e-12;

}

ErrorCode ResolveDiskDiameter(double native_diameter_pixels,
                              double diam_data,
                              double pup_diam,
                              double telescope_diameter,
                              double* disk_diameter_pixels,
                              bool* truncate) {
  if (!disk_diameter_pixels || !truncate) {
    return ErrorCode::kConfigurationError;
  }

  if (native_diameter_pixels <= 0) {
    mainLog() << "Error: The pupil diameter must be positive, got "
              << native_diameter_pixels << " pixels." << endl;
    return ErrorCode::kConfigurationError;
  }

  if (pup_diam == kPupDiamFitToPupil) {
    *disk_diameter_pixels = native_diameter_pixels;
    *truncate = false;
    return ErrorCode::kOk;
  }

  if (pup_diam == kPupDiamTelescope) {
    pup_diam = telescope_diameter;
  } else if (pup_diam <= 0) {
    mainLog() << "Error: pup_diam must be > 0, -1 or -2, got " << pup_diam
              << endl;
    return ErrorCode::kConfigurationError;
  }

  if (pup_diam <= 0) {
    mainLog() << "Error: The telescope diameter must be positive, got "
              << telescope_diameter << endl;
    return ErrorCode::kConfigurationError;
  }

  if (diam_data <= 0) {
    mainLog() << "Error: diam_data must be positive, got " << diam_data
              << endl;
    return ErrorCode::kConfigurationError;
  }

  if (pup_diam > diam_data) {
    mainLog() << "Warning: The pupil diameter (" << pup_diam << " m) is "
              << "larger than the data diameter (" << diam_data << " m). "
              << "The pupil will be truncated." << endl;
  }

  *disk_diameter_pixels = native_diameter_pixels * diam_data / pup_diam;
  *truncate = true;
  return ErrorCode::kOk;
}

ZernikeBasis::ZernikeBasis() : disk_diameter_pixels_(0), truncated_(false) {}

int ZernikeBasis::SupportPixels() const {
  if (support_.empty()) return 0;
  return countNonZero(support_);
}

ErrorCode ZernikeBasis::Build(const PupilMask& pupil,
                              double native_diameter_pixels,
                              int num_modes,
                              double diam_data,
                              double pup_diam,
                              double telescope_diameter,
                              ZernikeBasis* basis) {
  if (!basis) return ErrorCode::kConfigurationError;

  if (num_modes < 1) {
    mainLog() << "Error: The number of Zernike modes must be at least 1, got "
              << num_modes << endl;
    return ErrorCode::kConfigurationError;
  }

  if (pupil.empty()) {
    mainLog() << "Error: Empty pupil grid." << endl;
    return ErrorCode::kConfigurationError;
  }

  double disk_diameter = 0;
  bool truncate = false;
  ErrorCode status = ResolveDiskDiameter(native_diameter_pixels, diam_data,
                                         pup_diam, telescope_diameter,
                                         &disk_diameter, &truncate);
  if (status != ErrorCode::kOk) return status;

  const int kRows = pupil.rows();
  const int kCols = pupil.cols();
  const double kCenterY = 0.5 * (kRows - 1);
  const double kCenterX = 0.5 * (kCols - 1);
  const double kRadius = 0.5 * disk_diameter;

  // Polar coordinates normalized to the disk, and the support of the modes.
  Mat_<double> rho(kRows, kCols, 0.0), theta(kRows, kCols, 0.0);
  Mat_<uchar> support = Mat_<uchar>::zeros(kRows, kCols);
  for (int i = 0; i < kRows; i++) {
    double y = i - kCenterY;
    for (int j = 0; j < kCols; j++) {
      if (!pupil.illuminated(i, j)) continue;

      double x = j - kCenterX;
      rho(i, j) = sqrt(x*x + y*y) / kRadius;
      theta(i, j) = atan2(y, x);
      if (truncate && rho(i, j) > 1) continue;
      support(i, j) = 1;
    }
  }

  const int kSupportPixels = countNonZero(support);
  if (kSupportPixels == 0) {
    mainLog() << "Error: No illuminated pixels remain within the Zernike "
              << "disk of diameter " << disk_diameter << " pixels." << endl;
    return ErrorCode::kConfigurationError;
  }

  vector<Mat_<double>> modes;
  modes.reserve(num_modes);
  for (int noll = 1; noll <= num_modes; noll++) {
    Mat_<double> mode = Mat_<double>::zeros(kRows, kCols);

    if (noll == 1) {
      mode.setTo(1.0, support);
      modes.push_back(mode);
      continue;
    }

    int n, m;
    NollToZernikeIndices(noll, &n, &m);
    double total = 0;
    for (int i = 0; i < kRows; i++) {
      for (int j = 0; j < kCols; j++) {
        if (!support(i, j)) continue;
        mode(i, j) = ZernikePolynomial(n, m, rho(i, j), theta(i, j));
        total += mode(i, j);
      }
    }

    // Remove the piston component and rescale to unit RMS over the support.
    const double kMean = total / kSupportPixels;
    double sum_squares = 0;
    for (int i = 0; i < kRows; i++) {
      for (int j = 0; j < kCols; j++) {
        if (!support(i, j)) continue;
        mode(i, j) -= kMean;
        sum_squares += mode(i, j) * mode(i, j);
      }
    }

    double rms = sqrt(sum_squares / kSupportPixels);
    if (rms < kFlatRms) {
      mainLog() << "Warning: Zernike mode " << noll << " (n=" << n << ", m="
                << m << ") is flat on a support of " << kSupportPixels
                << " pixels and is left at zero." << endl;
      mode.setTo(0.0);
    } else {
      mode /= rms;
    }
    modes.push_back(mode);
  }

  basis->modes_ = move(modes);
  basis->support_ = support;
  basis->disk_diameter_pixels_ = disk_diameter;
  basis->truncated_ = truncate;
  return ErrorCode::kOk;
}

}
