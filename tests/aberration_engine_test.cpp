// Tests for injecting an aberration series into the pupil planes.
// Author: Philip Salvaggio

#include "base/aberration_engine.h"
#include "base/phase_screen.h"
#include "base/pupil_mask.h"
#include "io/logging.h"
#include "io/series_loader.h"
#include "test_utils.h"

#include <memory>

using namespace std;
using namespace cv;
using namespace zab;

namespace {

const int kScienceSize = 32;
const int kAnalyticSize = 48;
const double kPixelsPerMeter = 4;
const double kTelescopeDiameter = 8;  // [m]
const double kLoopTick = 0.002;  // [s]
const int kModes = 4;

// Serves a fixed series from memory.
class FakeSeriesLoader : public zab_io::SeriesLoader {
 public:
  FakeSeriesLoader(const Mat_<double>& coefficients,
                   const vector<double>& times,
                   string* requested_path)
      : coefficients_(coefficients),
        times_(times),
        requested_path_(requested_path) {}

  ErrorCode Load(const string& path,
                 const string& coeff_var,
                 const string& time_var,
                 AberrationConfig::MatVersion /*version*/,
                 Mat_<double>* coefficients,
                 vector<double>* times) const override {
    if (requested_path_) *requested_path_ = path;
    if (coeff_var != "zcoeff" || time_var != "ztime") {
      return ErrorCode::kFileLoadError;
    }
    *coefficients = coefficients_.clone();
    *times = times_;
    return ErrorCode::kOk;
  }

 private:
  Mat_<double> coefficients_;
  vector<double> times_;
  string* requested_path_;
};

Mat_<double> TestCoefficients() {
  const double kValues[3][kModes] = {
    {-22.3, -6.1, 20.9, 45.9},
    {10.0, 31.5, -4.2, -12.8},
    {3.3, -17.0, 8.8, 0.5},
  };
  Mat_<double> coeffs(3, kModes);
  for (int i = 0; i < 3; i++) {
    for (int j = 0; j < kModes; j++) coeffs(i, j) = kValues[i][j];
  }
  return coeffs;
}

vector<double> TestTimes() { return {0, 0.004, 0.008}; }

AberrationConfig TestConfig(AberrationConfig::IncludePath include_path) {
  AberrationConfig config;
  config.set_include_zab(true);
  config.set_file_dir("/data/aberrations");
  config.set_file_name("series.mat");
  config.set_num_zpol(kModes);
  config.set_include_path(include_path);
  config.set_mat_vers(AberrationConfig::V7_3);
  config.set_step(0.004);
  config.set_var_name_coeff("zcoeff");
  config.set_var_name_time("ztime");
  config.set_diam_data(kTelescopeDiameter);
  config.set_pup_diam(kPupDiamFitToPupil);
  return config;
}

unique_ptr<zab_io::SeriesLoader> MakeLoader(string* requested_path = nullptr) {
  return unique_ptr<zab_io::SeriesLoader>(
      new FakeSeriesLoader(TestCoefficients(), TestTimes(), requested_path));
}

// The pupil planes of a host simulation, with the analytic grid padded
// around the same aperture.
struct TestHost {
  TestHost()
      : science_mask(PupilMask::Circular(kScienceSize,
                                         kTelescopeDiameter * kPixelsPerMeter,
                                         kPixelsPerMeter)),
        analytic_mask(PupilMask::Circular(kAnalyticSize,
                                          kTelescopeDiameter * kPixelsPerMeter,
                                          kPixelsPerMeter)),
        science_screen(kScienceSize, kScienceSize, 0.f),
        analytic_screen(kAnalyticSize, kAnalyticSize, 0.f) {
    pupils.science = PupilPlane(&science_mask, &science_screen);
    pupils.analytic = PupilPlane(&analytic_mask, &analytic_screen);
  }

  void ResetScreens() {
    science_screen.setTo(0);
    analytic_screen.setTo(0);
  }

  PupilMask science_mask;
  PupilMask analytic_mask;
  Mat_<float> science_screen;
  Mat_<float> analytic_screen;
  HostPupils pupils;
};

bool IsZero(const Mat_<float>& screen) {
  return countNonZero(screen) == 0;
}

// Whether a buffer holds exactly the screen of one row of the series.
bool MatchesRow(const ZernikeBasis& basis, int row,
                const Mat_<float>& screen) {
  Mat_<double> delta;
  if (ComposePhaseScreen(basis, TestCoefficients().row(row), &delta) !=
      ErrorCode::kOk) {
    return false;
  }
  if (delta.rows != screen.rows || delta.cols != screen.cols) return false;

  for (int i = 0; i < delta.rows; i++) {
    for (int j = 0; j < delta.cols; j++) {
      if (screen(i, j) != static_cast<float>(delta(i, j))) return false;
    }
  }
  return true;
}

}

void TestDisabledIsNoOp() {
  TestHost host;
  AberrationConfig config = TestConfig(AberrationConfig::BOTH);
  config.set_include_zab(false);

  AberrationEngine engine(MakeLoader());
  EXPECT(engine.Init(config, host.pupils, kTelescopeDiameter, kLoopTick) ==
             ErrorCode::kOk,
         "Disabled init failed");
  EXPECT(engine.state() == AberrationEngine::DISABLED, "Not disabled");

  for (int i = 0; i < 100; i++) {
    EXPECT(engine.Update(i) == ErrorCode::kOk, "Update " << i);
  }
  EXPECT(IsZero(host.science_screen), "Science screen modified");
  EXPECT(IsZero(host.analytic_screen), "Analytic screen modified");
}

void TestSchedule() {
  TestHost host;
  string requested_path;
  AberrationEngine engine(MakeLoader(&requested_path));
  EXPECT(engine.Init(TestConfig(AberrationConfig::BOTH), host.pupils,
                     kTelescopeDiameter, kLoopTick) == ErrorCode::kOk,
         "Init failed");
  EXPECT(engine.state() == AberrationEngine::READY, "Not ready");
  EXPECT(engine.decimation() == 2, "Decimation " << engine.decimation());
  EXPECT(requested_path == "/data/aberrations/series.mat",
         "Loaded " << requested_path);
  EXPECT(engine.science_basis().num_modes() == kModes, "Science modes");
  EXPECT(engine.analytic_basis().rows() == kAnalyticSize, "Analytic grid");

  // Each sample is held for two iterations.
  const int kExpectedRows[] = {0, 0, 1, 1, 2, 2};
  for (int i = 0; i < 6; i++) {
    host.ResetScreens();
    EXPECT(engine.Update(i) == ErrorCode::kOk, "Update " << i);
    EXPECT(MatchesRow(engine.science_basis(), kExpectedRows[i],
                      host.science_screen),
           "Science screen at iteration " << i);
    EXPECT(MatchesRow(engine.analytic_basis(), kExpectedRows[i],
                      host.analytic_screen),
           "Analytic screen at iteration " << i);
  }

  host.ResetScreens();
  EXPECT(engine.Update(6) == ErrorCode::kIndexExhaustedError,
         "Series should be exhausted");
  EXPECT(IsZero(host.science_screen), "Exhausted update modified a screen");
}

void TestUpdateAddsToBuffer() {
  TestHost host;
  AberrationEngine engine(MakeLoader());
  EXPECT(engine.Init(TestConfig(AberrationConfig::SCIENCE_ONLY), host.pupils,
                     kTelescopeDiameter, kLoopTick) == ErrorCode::kOk,
         "Init failed");

  // Without a reset, the second update lands on top of the first.
  EXPECT(engine.Update(0) == ErrorCode::kOk, "Update 0");
  Mat_<float> once = host.science_screen.clone();
  EXPECT(engine.Update(1) == ErrorCode::kOk, "Update 1");
  for (int i = 0; i < kScienceSize; i++) {
    for (int j = 0; j < kScienceSize; j++) {
      EXPECT(host.science_screen(i, j) == once(i, j) + once(i, j),
             "Pixel " << i << "," << j);
    }
  }
}

void TestIncludePath() {
  {
    TestHost host;
    AberrationEngine engine(MakeLoader());
    EXPECT(engine.Init(TestConfig(AberrationConfig::NONE), host.pupils,
                       kTelescopeDiameter, kLoopTick) == ErrorCode::kOk,
           "Init failed");
    for (int i = 0; i < 6; i++) {
      EXPECT(engine.Update(i) == ErrorCode::kOk, "Update " << i);
    }
    EXPECT(engine.science_basis().empty() && engine.analytic_basis().empty(),
           "NONE built modes");
    EXPECT(IsZero(host.science_screen), "NONE modified the science pupil");
    EXPECT(IsZero(host.analytic_screen), "NONE modified the analytic pupil");
  }
  {
    TestHost host;
    AberrationEngine engine(MakeLoader());
    EXPECT(engine.Init(TestConfig(AberrationConfig::SCIENCE_ONLY),
                       host.pupils, kTelescopeDiameter, kLoopTick) ==
               ErrorCode::kOk,
           "Init failed");
    EXPECT(engine.Update(0) == ErrorCode::kOk, "Update failed");
    EXPECT(!IsZero(host.science_screen), "Science pupil not aberrated");
    EXPECT(IsZero(host.analytic_screen), "Analytic pupil aberrated");
  }
  {
    TestHost host;
    host.pupils.science = PupilPlane();
    AberrationEngine engine(MakeLoader());
    EXPECT(engine.Init(TestConfig(AberrationConfig::ANALYTIC_ONLY),
                       host.pupils, kTelescopeDiameter, kLoopTick) ==
               ErrorCode::kOk,
           "Init without a science pupil failed");
    EXPECT(engine.Update(0) == ErrorCode::kOk, "Update failed");
    EXPECT(IsZero(host.science_screen), "Science pupil aberrated");
    EXPECT(MatchesRow(engine.analytic_basis(), 0, host.analytic_screen),
           "Analytic pupil");
  }
}

void TestExcludedPlaneIsNotBuilt() {
  // The analytic mask is unusable, with no scale and a single pixel, but the
  // analytic plane doesn't receive the aberration.
  TestHost host;
  Mat_<uchar> single = Mat_<uchar>::zeros(kAnalyticSize, kAnalyticSize);
  single(kAnalyticSize / 2, kAnalyticSize / 2) = 1;
  PupilMask unusable(single, 0);
  host.pupils.analytic = PupilPlane(&unusable, &host.analytic_screen);

  AberrationEngine engine(MakeLoader());
  EXPECT(engine.Init(TestConfig(AberrationConfig::SCIENCE_ONLY), host.pupils,
                     kTelescopeDiameter, kLoopTick) == ErrorCode::kOk,
         "An excluded plane should not be validated");
  EXPECT(!engine.science_basis().empty(), "Science modes missing");
  EXPECT(engine.analytic_basis().empty(), "Excluded plane got modes");
  EXPECT(engine.Update(0) == ErrorCode::kOk, "Update failed");
  EXPECT(MatchesRow(engine.science_basis(), 0, host.science_screen),
         "Science pupil");
  EXPECT(IsZero(host.analytic_screen), "Analytic pupil aberrated");

  // The same mask fails once the plane is included.
  AberrationEngine included(MakeLoader());
  EXPECT(included.Init(TestConfig(AberrationConfig::BOTH), host.pupils,
                       kTelescopeDiameter, kLoopTick) ==
             ErrorCode::kConfigurationError,
         "An included plane needs a scale");
}

void TestFailedInitCanBeRetried() {
  TestHost host;
  AberrationEngine engine(MakeLoader());

  AberrationConfig too_many_modes = TestConfig(AberrationConfig::BOTH);
  too_many_modes.set_num_zpol(kModes + 2);
  EXPECT(engine.Init(too_many_modes, host.pupils, kTelescopeDiameter,
                     kLoopTick) == ErrorCode::kShapeMismatchError,
         "Too many modes should fail");
  EXPECT(engine.state() == AberrationEngine::UNINITIALIZED,
         "Failed init changed the state");
  EXPECT(engine.Update(0) == ErrorCode::kConfigurationError,
         "Update after a failed init");

  AberrationConfig slow_loop = TestConfig(AberrationConfig::BOTH);
  EXPECT(engine.Init(slow_loop, host.pupils, kTelescopeDiameter, 0.01) ==
             ErrorCode::kDecimationError,
         "A loop slower than the series should fail");

  AberrationConfig bad_names = TestConfig(AberrationConfig::BOTH);
  bad_names.set_var_name_coeff("coefficients");
  EXPECT(engine.Init(bad_names, host.pupils, kTelescopeDiameter,
                     kLoopTick) == ErrorCode::kFileLoadError,
         "Unknown variable should fail");

  EXPECT(engine.Init(TestConfig(AberrationConfig::BOTH), host.pupils,
                     kTelescopeDiameter, kLoopTick) == ErrorCode::kOk,
         "Retry failed");
  EXPECT(engine.Update(0) == ErrorCode::kOk, "Update after retry");
}

void TestInvalidConfigurations() {
  TestHost host;

  {
    AberrationEngine engine(MakeLoader());
    AberrationConfig config = TestConfig(AberrationConfig::BOTH);
    config.set_num_zpol(0);
    EXPECT(engine.Init(config, host.pupils, kTelescopeDiameter, kLoopTick) ==
               ErrorCode::kConfigurationError,
           "num_zpol = 0");
  }
  {
    AberrationEngine engine(MakeLoader());
    AberrationConfig config = TestConfig(AberrationConfig::BOTH);
    config.set_pup_diam(-3);
    EXPECT(engine.Init(config, host.pupils, kTelescopeDiameter, kLoopTick) ==
               ErrorCode::kConfigurationError,
           "Unknown diameter policy");
  }
  {
    AberrationEngine engine(MakeLoader());
    HostPupils pupils = host.pupils;
    pupils.analytic.phase_screen = nullptr;
    EXPECT(engine.Init(TestConfig(AberrationConfig::BOTH), pupils,
                       kTelescopeDiameter, kLoopTick) ==
               ErrorCode::kConfigurationError,
           "Missing analytic buffer");
  }
  {
    AberrationEngine engine(MakeLoader());
    Mat_<float> wrong_size(kScienceSize + 1, kScienceSize, 0.f);
    HostPupils pupils = host.pupils;
    pupils.science.phase_screen = &wrong_size;
    EXPECT(engine.Init(TestConfig(AberrationConfig::SCIENCE_ONLY), pupils,
                       kTelescopeDiameter, kLoopTick) ==
               ErrorCode::kShapeMismatchError,
           "Buffer size mismatch");
  }
}

void TestCallOrder() {
  TestHost host;
  AberrationEngine engine(MakeLoader());
  EXPECT(engine.Update(0) == ErrorCode::kConfigurationError,
         "Update before Init");

  EXPECT(engine.Init(TestConfig(AberrationConfig::BOTH), host.pupils,
                     kTelescopeDiameter, kLoopTick) == ErrorCode::kOk,
         "Init failed");
  EXPECT(engine.Init(TestConfig(AberrationConfig::BOTH), host.pupils,
                     kTelescopeDiameter, kLoopTick) ==
             ErrorCode::kConfigurationError,
         "Second Init should be rejected");

  EXPECT(engine.Update(2) == ErrorCode::kOk, "Update 2");
  EXPECT(engine.Update(2) == ErrorCode::kConfigurationError,
         "Repeated iteration");
  EXPECT(engine.Update(1) == ErrorCode::kConfigurationError,
         "Iteration going backwards");
  EXPECT(engine.Update(3) == ErrorCode::kOk, "Update 3");
}

void TestStepFromTimeStamps() {
  TestHost host;
  AberrationConfig config = TestConfig(AberrationConfig::BOTH);
  config.clear_step();

  AberrationEngine engine(MakeLoader());
  EXPECT(engine.Init(config, host.pupils, kTelescopeDiameter, kLoopTick) ==
             ErrorCode::kOk,
         "Init failed");
  EXPECT_NEAR(engine.step(), 0.004, 1e-15, "Derived step");
  EXPECT(engine.decimation() == 2, "Decimation " << engine.decimation());
}

int main() {
  zab_io::Logging::Init();

  TestDisabledIsNoOp();
  TestSchedule();
  TestUpdateAddsToBuffer();
  TestIncludePath();
  TestExcludedPlaneIsNotBuilt();
  TestFailedInitCanBeRetried();
  TestInvalidConfigurations();
  TestCallOrder();
  TestStepFromTimeStamps();

  return zab_test::Finish("aberration_engine_test");
}
