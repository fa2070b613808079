// This is a common include file for the main components of the ZAB library.
// Author: Philip Salvaggio

#ifndef ZAB_H
#define ZAB_H

// Core headers of the library.
#include "base/aberration_config.pb.h"
#include "base/aberration_engine.h"
#include "base/decimation.h"
#include "base/error_codes.h"
#include "base/filesystem.h"
#include "base/phase_screen.h"
#include "base/pupil_mask.h"
#include "base/zab_init.h"
#include "base/zernike_aberrations.h"
#include "base/zernike_basis.h"

// Input/output headers.
#include "io/hdf5_reader.h"
#include "io/logging.h"
#include "io/mat_file_reader.h"
#include "io/protobuf_reader.h"
#include "io/series_loader.h"

#endif  // ZAB_H
