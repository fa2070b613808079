// Alignment of the simulation loop clock with the sampling clock of the
// aberration series.
// Author: Philip Salvaggio

#include "decimation.h"

#include "io/logging.h"

#include <algorithm>
#include <cmath>

using namespace std;

namespace zab {

namespace {

// Relative distance from an integer ratio that is still considered exact.
const double kRatioTolerance = 1e-10;

}

ErrorCode ComputeDecimation(double step, double loop_tick_duration, int* dec) {
  if (!dec) return ErrorCode::kDecimationError;

  if (step <= 0 || loop_tick_duration <= 0) {
    mainLog() << "Error: The aberration step (" << step << " s) and the loop "
              << "iteration time (" << loop_tick_duration << " s) must be "
              << "positive." << endl;
    return ErrorCode::kDecimationError;
  }

  if (loop_tick_duration > step) {
    mainLog() << "Error: The aberration series is sampled every " << step
              << " s, faster than the loop iteration time of "
              << loop_tick_duration << " s." << endl;
    return ErrorCode::kDecimationError;
  }

  double ratio = step / loop_tick_duration;
  *dec = static_cast<int>(lround(ratio));

  if (fabs(ratio - *dec) > kRatioTolerance * ratio) {
    mainLog() << "Warning: The aberration step is not a multiple of the "
              << "loop iteration time (ratio " << ratio << "), using a "
              << "decimation of " << *dec << endl;
  }

  return ErrorCode::kOk;
}

ErrorCode RowForIteration(int iteration_index, int dec, int series_length,
                          int* row) {
  if (!row) return ErrorCode::kDecimationError;

  if (dec < 1 || iteration_index < 0) {
    mainLog() << "Error: Invalid iteration " << iteration_index
              << " or decimation " << dec << endl;
    return ErrorCode::kDecimationError;
  }

  int index = iteration_index / dec;
  if (index >= series_length) {
    mainLog() << "Error: Iteration " << iteration_index << " needs sample "
              << index << " of the aberration series, which only has "
              << series_length << " samples." << endl;
    return ErrorCode::kIndexExhaustedError;
  }

  *row = index;
  return ErrorCode::kOk;
}

ErrorCode ComputeSeriesStep(const vector<double>& times,
                            double tolerance,
                            double* step) {
  if (!step) return ErrorCode::kDecimationError;

  if (times.size() < 2) {
    mainLog() << "Error: At least two time stamps are needed to compute the "
              << "step of the aberration series." << endl;
    return ErrorCode::kDecimationError;
  }

  vector<double> diffs(times.size() - 1);
  for (size_t i = 1; i < times.size(); i++) {
    diffs[i-1] = times[i] - times[i-1];
  }

  auto range = minmax_element(diffs.begin(), diffs.end());
  if (*range.second - *range.first > tolerance) {
    mainLog() << "Error: The aberration series is not equally spaced (steps "
              << "from " << *range.first << " to " << *range.second
              << " s)." << endl;
    return ErrorCode::kDecimationError;
  }

  double mean = (times.back() - times.front()) / diffs.size();
  if (mean <= 0) {
    mainLog() << "Error: The aberration series has a step of " << mean
              << " s." << endl;
    return ErrorCode::kDecimationError;
  }

  *step = mean;
  return ErrorCode::kOk;
}

}
