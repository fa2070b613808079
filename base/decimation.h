// Alignment of the simulation loop clock with the sampling clock of the
// aberration series.
// Author: Philip Salvaggio

#ifndef DECIMATION_H
#define DECIMATION_H

#include "base/error_codes.h"

#include <vector>

namespace zab {

// Compute the number of loop iterations that share one sample of the series,
// round(step / loop_tick_duration).
//
// Arguments:
//  step                Sampling period of the aberration series [s]
//  loop_tick_duration  Duration of one loop iteration [s]
//  dec                 Output: decimation factor, >= 1
//
// Returns:
//  kDecimationError if either duration is not positive, or if the loop is
//  slower than the series (loop_tick_duration > step).
ErrorCode ComputeDecimation(double step, double loop_tick_duration, int* dec);

// Row of the series to use for a loop iteration. Each row is held for dec
// consecutive iterations, so row = floor(iteration_index / dec).
//
// Returns:
//  kIndexExhaustedError if the row is past the end of the series.
//  kDecimationError for a negative iteration or dec < 1.
ErrorCode RowForIteration(int iteration_index, int dec, int series_length,
                          int* row);

// Sampling period of a time vector, which must be equally spaced.
//
// Arguments:
//  times      Time stamps [s]
//  tolerance  Allowed spread between the largest and smallest spacing [s]
//  step       Output: the mean spacing [s]
ErrorCode ComputeSeriesStep(const std::vector<double>& times,
                            double tolerance,
                            double* step);

}

#endif  // DECIMATION_H
