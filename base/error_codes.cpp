// Result codes for the aberration injection routines.
// Author: Philip Salvaggio

#include "error_codes.h"

namespace zab {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk: return "OK";
    case ErrorCode::kConfigurationError: return "ConfigurationError";
    case ErrorCode::kFileLoadError: return "FileLoadError";
    case ErrorCode::kShapeMismatchError: return "ShapeMismatchError";
    case ErrorCode::kDecimationError: return "DecimationError";
    case ErrorCode::kIndexExhaustedError: return "IndexExhaustedError";
  }
  return "Unknown";
}

}
