// Runs a closed-loop style iteration over a science and an analytic pupil and
// injects a recorded time series of Zernike aberrations into both, reporting
// the wavefront error of each pupil plane at every iteration.
// Author: Philip Salvaggio

#include "zab.h"

#include <opencv2/core/core.hpp>
#include <gflags/gflags.h>

#include <cmath>
#include <iostream>

DEFINE_string(config_file, "", "AberrationConfig filename or base directory.");
DEFINE_int32(iterations, 100, "Number of loop iterations to run.");
DEFINE_double(loop_tick, 0.001, "Duration of a loop iteration [s].");
DEFINE_double(telescope_diameter, 8, "Diameter of the telescope [m].");
DEFINE_int32(pupil_pixels, 64, "Diameter of the science pupil [pixels].");
DEFINE_int32(analytic_padding, 4, "Extra pixels on each side of the analytic "
                                  "pupil grid.");

using namespace std;
using namespace cv;
using namespace zab;

// RMS and peak-to-valley of a phase screen over the illuminated pixels.
void ScreenStatistics(const Mat_<float>& screen, const PupilMask& pupil,
                      double* rms, double* ptv) {
  Scalar mean, std_dev;
  meanStdDev(screen, mean, std_dev, pupil.mask());
  *rms = sqrt(mean[0] * mean[0] + std_dev[0] * std_dev[0]);

  double min_val, max_val;
  minMaxLoc(screen, &min_val, &max_val, nullptr, nullptr, pupil.mask());
  *ptv = max_val - min_val;
}

int main(int argc, char** argv) {
  google::ParseCommandLineFlags(&argc, &argv, true);

  AberrationConfig config;
  if (!ZabInit(ResolvePath(FLAGS_config_file), &config)) {
    return 1;
  }

  if (FLAGS_pupil_pixels <= 0 || FLAGS_analytic_padding < 0 ||
      FLAGS_telescope_diameter <= 0) {
    mainLog() << "Error: Invalid pupil geometry." << endl;
    return 1;
  }

  // Both grids share the same scale, the analytic grid is padded around the
  // science pupil.
  const double kPixelsPerMeter =
      FLAGS_pupil_pixels / FLAGS_telescope_diameter;
  const int kAnalyticSize = FLAGS_pupil_pixels + 2 * FLAGS_analytic_padding;
  PupilMask science_pupil = PupilMask::Circular(
      FLAGS_pupil_pixels, FLAGS_pupil_pixels, kPixelsPerMeter);
  PupilMask analytic_pupil = PupilMask::Circular(
      kAnalyticSize, FLAGS_pupil_pixels, kPixelsPerMeter);

  Mat_<float> science_screen(science_pupil.rows(), science_pupil.cols());
  Mat_<float> analytic_screen(analytic_pupil.rows(), analytic_pupil.cols());

  HostPupils pupils;
  pupils.science = PupilPlane(&science_pupil, &science_screen);
  pupils.analytic = PupilPlane(&analytic_pupil, &analytic_screen);

  AberrationEngine engine;
  ErrorCode status = engine.Init(config, pupils, FLAGS_telescope_diameter,
                                 FLAGS_loop_tick);
  if (status != ErrorCode::kOk) {
    mainLog() << "Error: Could not initialize the Zernike aberrations ("
              << ErrorCodeName(status) << ")" << endl;
    return 1;
  }

  mainLog() << "Iteration, Science RMS [nm], Science PTV [nm], "
            << "Analytic RMS [nm], Analytic PTV [nm]" << endl;

  for (int i = 0; i < FLAGS_iterations; i++) {
    // The pupil planes are rebuilt every iteration, before any aberration
    // source adds to them.
    science_screen = 0;
    analytic_screen = 0;

    status = engine.Update(i);
    if (status != ErrorCode::kOk) {
      mainLog() << "Error: Aborting at iteration " << i << " ("
                << ErrorCodeName(status) << ")" << endl;
      return 1;
    }

    double science_rms, science_ptv, analytic_rms, analytic_ptv;
    ScreenStatistics(science_screen, science_pupil, &science_rms,
                     &science_ptv);
    ScreenStatistics(analytic_screen, analytic_pupil, &analytic_rms,
                     &analytic_ptv);

    mainLog() << i << ", " << science_rms << ", " << science_ptv << ", "
              << analytic_rms << ", " << analytic_ptv << endl;
  }

  return 0;
}
