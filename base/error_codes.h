// Result codes for the aberration injection routines.
// Author: Philip Salvaggio

#ifndef ERROR_CODES_H
#define ERROR_CODES_H

namespace zab {

enum class ErrorCode {
  kOk = 0,
  // Invalid number of modes, diameter policy or missing field.
  kConfigurationError,
  // Unreadable file or missing variable.
  kFileLoadError,
  // Row or column counts of the loaded series don't match.
  kShapeMismatchError,
  // The loop runs slower than the aberration was sampled.
  kDecimationError,
  // The simulation outlasted the aberration series.
  kIndexExhaustedError,
};

const char* ErrorCodeName(ErrorCode code);

}

#endif  // ERROR_CODES_H
