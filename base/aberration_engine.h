// Injects a time series of Zernike aberrations into the pupil planes of a
// closed-loop simulation.
//
// The host calls Init() once before its loop, then Update() once per loop
// iteration. Each update adds the aberration sample for that iteration to the
// phase buffers the host registered at Init(). The host owns the buffers and
// is expected to rebuild them every iteration, as the aberration is added on
// top of their contents.
//
// Author: Philip Salvaggio

#ifndef ABERRATION_ENGINE_H
#define ABERRATION_ENGINE_H

#include "base/aberration_config.pb.h"
#include "base/error_codes.h"
#include "base/phase_screen.h"
#include "base/zernike_basis.h"

#include <opencv2/core/core.hpp>

#include <memory>
#include <string>
#include <vector>

namespace zab_io {
class SeriesLoader;
}

namespace zab {

class PupilMask;

// A pupil plane of the host simulation. A plane that isn't used can be left
// as nullptrs.
struct PupilPlane {
  PupilPlane() : mask(nullptr), phase_screen(nullptr) {}
  PupilPlane(const PupilMask* mask, cv::Mat_<float>* phase_screen)
      : mask(mask), phase_screen(phase_screen) {}

  const PupilMask* mask;
  cv::Mat_<float>* phase_screen;  // [nm]
};

struct HostPupils {
  PupilPlane science;
  PupilPlane analytic;
};

class AberrationEngine {
 public:
  enum State {
    UNINITIALIZED,
    READY,
    DISABLED,
  };

  // Reads the series from MAT-files.
  AberrationEngine();

  explicit AberrationEngine(std::unique_ptr<zab_io::SeriesLoader> loader);

  ~AberrationEngine();

  // No copy or assignment
  AberrationEngine(const AberrationEngine& other) = delete;
  AberrationEngine& operator=(const AberrationEngine& other) = delete;

  // Prepare the aberrations for a run. If config.include_zab() is false, the
  // engine is disabled for the rest of its life. Otherwise, the Zernike modes
  // are built for each included pupil plane, the series is loaded and the
  // decimation factor is computed. On failure the engine stays uninitialized.
  //
  // Arguments:
  //  config              The aberration parameters. A copy is kept.
  //  pupils              The pupil planes of the host. Planes selected by
  //                      config.include_path() need a mask and a buffer.
  //  telescope_diameter  Diameter of the simulated telescope [m]
  //  loop_tick_duration  Duration of one loop iteration [s]
  ErrorCode Init(const AberrationConfig& config,
                 const HostPupils& pupils,
                 double telescope_diameter,
                 double loop_tick_duration);

  // Add the aberration for a loop iteration to the pupil planes. Iterations
  // start at 0 and must increase from call to call. Any error is fatal to the
  // run.
  ErrorCode Update(int iteration_index);

  State state() const { return state_; }
  const AberrationConfig& config() const { return config_; }

  int decimation() const { return dec_; }
  double step() const { return step_; }

  // Empty for a plane that doesn't receive the aberration.
  const ZernikeBasis& science_basis() const { return science_basis_; }
  const ZernikeBasis& analytic_basis() const { return analytic_basis_; }

  const cv::Mat_<double>& coefficients() const { return coefficients_; }
  const std::vector<double>& times() const { return times_; }

 private:
  ErrorCode ValidateConfig(const AberrationConfig& config,
                           const HostPupils& pupils,
                           double telescope_diameter) const;

  ErrorCode BuildBasis(const AberrationConfig& config,
                       PupilPath target,
                       const PupilMask* pupil,
                       double telescope_diameter,
                       ZernikeBasis* basis) const;

  ErrorCode ApplyPlane(PupilPath target,
                       const ZernikeBasis& basis,
                       int row,
                       cv::Mat_<double>* delta,
                       cv::Mat_<float>* screen);

  void LogStatus(const std::string& path) const;

 private:
  std::unique_ptr<zab_io::SeriesLoader> loader_;
  State state_;

  AberrationConfig config_;
  HostPupils pupils_;
  ZernikeBasis science_basis_;
  ZernikeBasis analytic_basis_;
  cv::Mat_<double> coefficients_;  // [nm]
  std::vector<double> times_;  // [s]
  double step_;  // [s]
  int dec_;

  int last_iteration_;

 private:  // Cache variables
  int cached_row_;
  cv::Mat_<double> science_delta_;
  cv::Mat_<double> analytic_delta_;
};

}

#endif  // ABERRATION_ENGINE_H
