// Injects a time series of Zernike aberrations into the pupil planes of a
// closed-loop simulation.
// Author: Philip Salvaggio

#include "aberration_engine.h"

#include "base/decimation.h"
#include "base/filesystem.h"
#include "base/pupil_mask.h"
#include "io/logging.h"
#include "io/series_loader.h"

using namespace std;
using namespace cv;
using zab_io::MatFileSeriesLoader;
using zab_io::PrintIncludePath;
using zab_io::PrintPupilDiameter;
using zab_io::SeriesLoader;

namespace zab {

namespace {

// Allowed spread of the spacing of the time stamps [s].
const double kTimeStepTolerance = 1e-12;

}

AberrationEngine::AberrationEngine()
    : AberrationEngine(unique_ptr<SeriesLoader>(new MatFileSeriesLoader())) {}

AberrationEngine::AberrationEngine(unique_ptr<SeriesLoader> loader)
    : loader_(move(loader)),
      state_(UNINITIALIZED),
      step_(0),
      dec_(0),
      last_iteration_(-1),
      cached_row_(-1) {}

AberrationEngine::~AberrationEngine() {}

ErrorCode AberrationEngine::Init(const AberrationConfig& config,
                                 const HostPupils& pupils,
                                 double telescope_diameter,
                                 double loop_tick_duration) {
  if (state_ != UNINITIALIZED) {
    mainLog() << "Error: The Zernike aberrations were already initialized."
              << endl;
    return ErrorCode::kConfigurationError;
  }

  if (!config.include_zab()) {
    config_ = config;
    state_ = DISABLED;
    mainLog() << endl
              << "*-------------------------------" << endl
              << "CUSTOM ZERNIKE ABERRATIONS" << endl
              << "status: disabled" << endl
              << "*-------------------------------" << endl;
    return ErrorCode::kOk;
  }

  ErrorCode status = ValidateConfig(config, pupils, telescope_diameter);
  if (status != ErrorCode::kOk) return status;

  // Everything is staged locally and only committed once all of it succeeds.
  ZernikeBasis science_basis, analytic_basis;
  status = BuildBasis(config, PupilPath::kScience, pupils.science.mask,
                      telescope_diameter, &science_basis);
  if (status != ErrorCode::kOk) return status;
  status = BuildBasis(config, PupilPath::kAnalytic, pupils.analytic.mask,
                      telescope_diameter, &analytic_basis);
  if (status != ErrorCode::kOk) return status;

  const string kPath = JoinPath(config.file_dir(), config.file_name());
  Mat_<double> coefficients;
  vector<double> times;
  status = loader_->Load(kPath, config.var_name_coeff(),
                         config.var_name_time(), config.mat_vers(),
                         &coefficients, &times);
  if (status != ErrorCode::kOk) {
    mainLog() << "Error: Could not load the aberration series from " << kPath
              << " (" << ErrorCodeName(status) << ")" << endl;
    return status;
  }

  status = zab_io::ValidateSeries(coefficients, times, config.num_zpol());
  if (status != ErrorCode::kOk) return status;

  double step = config.step();
  if (!config.has_step()) {
    status = ComputeSeriesStep(times, kTimeStepTolerance, &step);
    if (status != ErrorCode::kOk) return status;
  }

  int dec = 0;
  status = ComputeDecimation(step, loop_tick_duration, &dec);
  if (status != ErrorCode::kOk) return status;

  config_ = config;
  pupils_ = pupils;
  science_basis_ = move(science_basis);
  analytic_basis_ = move(analytic_basis);
  coefficients_ = coefficients;
  times_ = move(times);
  step_ = step;
  dec_ = dec;
  last_iteration_ = -1;
  cached_row_ = -1;
  state_ = READY;

  LogStatus(kPath);
  return ErrorCode::kOk;
}

ErrorCode AberrationEngine::Update(int iteration_index) {
  switch (state_) {
    case DISABLED:
      return ErrorCode::kOk;
    case UNINITIALIZED:
      mainLog() << "Error: Update() called before Init()." << endl;
      return ErrorCode::kConfigurationError;
    case READY:
      break;
  }

  if (iteration_index <= last_iteration_) {
    mainLog() << "Error: Iteration " << iteration_index << " follows "
              << "iteration " << last_iteration_ << endl;
    return ErrorCode::kConfigurationError;
  }

  int row = 0;
  ErrorCode status =
      RowForIteration(iteration_index, dec_, coefficients_.rows, &row);
  if (status != ErrorCode::kOk) {
    mainLog() << "Error: The aberration series ends before the simulation."
              << endl;
    return status;
  }

  status = ApplyPlane(PupilPath::kScience, science_basis_, row,
                      &science_delta_, pupils_.science.phase_screen);
  if (status != ErrorCode::kOk) return status;

  status = ApplyPlane(PupilPath::kAnalytic, analytic_basis_, row,
                      &analytic_delta_, pupils_.analytic.phase_screen);
  if (status != ErrorCode::kOk) return status;

  cached_row_ = row;
  last_iteration_ = iteration_index;
  return ErrorCode::kOk;
}

ErrorCode AberrationEngine::ValidateConfig(const AberrationConfig& config,
                                           const HostPupils& pupils,
                                           double telescope_diameter) const {
  if (config.num_zpol() < 1) {
    mainLog() << "Error: num_zpol must be at least 1, got "
              << config.num_zpol() << endl;
    return ErrorCode::kConfigurationError;
  }

  if (config.file_name().empty() || config.var_name_coeff().empty() ||
      config.var_name_time().empty()) {
    mainLog() << "Error: file_name, var_name_coeff and var_name_time are "
              << "required when include_zab is set." << endl;
    return ErrorCode::kConfigurationError;
  }

  if (config.has_step() && config.step() <= 0) {
    mainLog() << "Error: step must be positive, got " << config.step()
              << endl;
    return ErrorCode::kConfigurationError;
  }

  if (telescope_diameter <= 0) {
    mainLog() << "Error: The telescope diameter must be positive, got "
              << telescope_diameter << endl;
    return ErrorCode::kConfigurationError;
  }

  const AberrationConfig::IncludePath kPath = config.include_path();
  const PupilPlane* planes[] = {&pupils.science, &pupils.analytic};
  const PupilPath targets[] = {PupilPath::kScience, PupilPath::kAnalytic};
  for (int i = 0; i < 2; i++) {
    if (!IncludesPath(kPath, targets[i])) continue;
    if (!planes[i]->mask || !planes[i]->phase_screen) {
      mainLog() << "Error: The " << (i == 0 ? "science" : "analytic")
                << " pupil is included, but the host did not provide its "
                << "mask and phase buffer." << endl;
      return ErrorCode::kConfigurationError;
    }
    if (planes[i]->mask->rows() != planes[i]->phase_screen->rows ||
        planes[i]->mask->cols() != planes[i]->phase_screen->cols) {
      mainLog() << "Error: The " << (i == 0 ? "science" : "analytic")
                << " pupil mask and phase buffer differ in size." << endl;
      return ErrorCode::kShapeMismatchError;
    }
  }

  return ErrorCode::kOk;
}

ErrorCode AberrationEngine::BuildBasis(const AberrationConfig& config,
                                       PupilPath target,
                                       const PupilMask* pupil,
                                       double telescope_diameter,
                                       ZernikeBasis* basis) const {
  // Planes that don't receive the aberration get no modes.
  if (!IncludesPath(config.include_path(), target)) return ErrorCode::kOk;
  if (!pupil) return ErrorCode::kOk;

  if (pupil->pixels_per_meter() <= 0) {
    mainLog() << "Error: The pupil grid needs a positive scale, got "
              << pupil->pixels_per_meter() << " pixels/m." << endl;
    return ErrorCode::kConfigurationError;
  }

  const double kNativeDiameter =
      telescope_diameter * pupil->pixels_per_meter();
  return ZernikeBasis::Build(*pupil, kNativeDiameter, config.num_zpol(),
                             config.diam_data(), config.pup_diam(),
                             telescope_diameter, basis);
}

ErrorCode AberrationEngine::ApplyPlane(PupilPath target,
                                       const ZernikeBasis& basis,
                                       int row,
                                       Mat_<double>* delta,
                                       Mat_<float>* screen) {
  if (!IncludesPath(config_.include_path(), target)) return ErrorCode::kOk;

  // The sample is held for dec_ iterations, so the screen only needs to be
  // recomposed when the row changes.
  if (row != cached_row_ || delta->empty()) {
    ErrorCode status =
        ComposePhaseScreen(basis, coefficients_.row(row), delta);
    if (status != ErrorCode::kOk) return status;
  }

  return ApplyPhaseScreen(*delta, target, config_.include_path(), screen);
}

void AberrationEngine::LogStatus(const string& path) const {
  mainLog() << endl
            << "*-------------------------------" << endl
            << "CUSTOM ZERNIKE ABERRATIONS" << endl
            << "status: enabled" << endl
            << "source file: " << path << endl
            << "number of modes: " << config_.num_zpol() << endl
            << "inclusion: " << PrintIncludePath(config_.include_path())
              << endl
            << "telescope diameter: " << PrintPupilDiameter(config_) << endl
            << "samples: " << coefficients_.rows << " every " << step_
              << " s" << endl
            << "decimation: " << dec_ << endl
            << "*-------------------------------" << endl;
}

}
