// Tests for the alignment of the loop clock with the aberration series.
// Author: Philip Salvaggio

#include "base/decimation.h"
#include "io/logging.h"
#include "test_utils.h"

#include <vector>

using namespace std;
using namespace zab;

void TestComputeDecimation() {
  int dec = 0;
  EXPECT(ComputeDecimation(0.004, 0.002, &dec) == ErrorCode::kOk,
         "0.004 / 0.002");
  EXPECT(dec == 2, "Expected a decimation of 2, got " << dec);

  EXPECT(ComputeDecimation(0.001, 0.001, &dec) == ErrorCode::kOk,
         "Equal steps");
  EXPECT(dec == 1, "Expected a decimation of 1, got " << dec);

  EXPECT(ComputeDecimation(0.01, 0.001, &dec) == ErrorCode::kOk, "0.01");
  EXPECT(dec == 10, "Expected a decimation of 10, got " << dec);

  // Not an exact multiple: rounded.
  EXPECT(ComputeDecimation(0.0051, 0.002, &dec) == ErrorCode::kOk, "0.0051");
  EXPECT(dec == 3, "Expected a decimation of 3, got " << dec);
}

void TestLoopSlowerThanSeriesFails() {
  int dec = 7;
  EXPECT(ComputeDecimation(0.001, 0.002, &dec) == ErrorCode::kDecimationError,
         "Loop slower than the series");
  EXPECT(dec == 7, "Output changed on failure");

  EXPECT(ComputeDecimation(0, 0.002, &dec) == ErrorCode::kDecimationError,
         "Zero step");
  EXPECT(ComputeDecimation(0.004, 0, &dec) == ErrorCode::kDecimationError,
         "Zero loop tick");
  EXPECT(ComputeDecimation(-0.004, -0.002, &dec) ==
             ErrorCode::kDecimationError,
         "Negative durations");
}

void TestRowsAreHeldForDecimation() {
  const int kExpected[] = {0, 0, 1, 1, 2, 2};
  for (int i = 0; i < 6; i++) {
    int row = -1;
    EXPECT(RowForIteration(i, 2, 10, &row) == ErrorCode::kOk,
           "Iteration " << i);
    EXPECT(row == kExpected[i], "Iteration " << i << " gave row " << row);
  }

  int row = -1;
  EXPECT(RowForIteration(19, 2, 10, &row) == ErrorCode::kOk, "Last row");
  EXPECT(row == 9, "Iteration 19 gave row " << row);

  EXPECT(RowForIteration(7, 1, 10, &row) == ErrorCode::kOk, "No decimation");
  EXPECT(row == 7, "Iteration 7 gave row " << row);
}

void TestExhaustedSeriesFails() {
  int row = -1;
  EXPECT(RowForIteration(100, 2, 10, &row) ==
             ErrorCode::kIndexExhaustedError,
         "Iteration 100");
  EXPECT(RowForIteration(20, 2, 10, &row) == ErrorCode::kIndexExhaustedError,
         "First iteration past the end");
  EXPECT(row == -1, "Row written on failure");

  EXPECT(RowForIteration(-1, 2, 10, &row) == ErrorCode::kDecimationError,
         "Negative iteration");
  EXPECT(RowForIteration(0, 0, 10, &row) == ErrorCode::kDecimationError,
         "Zero decimation");
}

void TestSeriesStep() {
  vector<double> times;
  for (int i = 0; i < 100; i++) times.push_back(0.5 + i * 0.004);

  double step = 0;
  EXPECT(ComputeSeriesStep(times, 1e-12, &step) == ErrorCode::kOk,
         "Equally spaced series");
  EXPECT_NEAR(step, 0.004, 1e-15, "Series step");

  int dec = 0;
  EXPECT(ComputeDecimation(step, 0.002, &dec) == ErrorCode::kOk,
         "Decimation from the series step");
  EXPECT(dec == 2, "Expected a decimation of 2, got " << dec);
}

void TestUnevenSeriesFails() {
  vector<double> times = {0, 0.004, 0.008, 0.013};
  double step = -1;
  EXPECT(ComputeSeriesStep(times, 1e-12, &step) == ErrorCode::kDecimationError,
         "Uneven spacing");
  EXPECT(step == -1, "Step written on failure");

  vector<double> single = {0.1};
  EXPECT(ComputeSeriesStep(single, 1e-12, &step) ==
             ErrorCode::kDecimationError,
         "Single sample");

  vector<double> constant = {1, 1, 1};
  EXPECT(ComputeSeriesStep(constant, 1e-12, &step) ==
             ErrorCode::kDecimationError,
         "Zero step");
}

int main() {
  zab_io::Logging::Init();

  TestComputeDecimation();
  TestLoopSlowerThanSeriesFails();
  TestRowsAreHeldForDecimation();
  TestExhaustedSeriesFails();
  TestSeriesStep();
  TestUnevenSeriesFails();

  return zab_test::Finish("decimation_test");
}
