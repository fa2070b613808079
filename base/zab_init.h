// File Description
// Author: Philip Salvaggio

#ifndef ZAB_INIT_H
#define ZAB_INIT_H

#include <string>

namespace zab {

class AberrationConfig;

// Perform initialization of the aberration injection.
//
// Parameters:
//  config_path  Either a path to the config file or the base directory. If
//               this is a path to the file, then logging will be performed
//               to stderr. If this is a path to a directory, then the config
//               file should be input/zernike_aberrations.txt and logging will
//               be done to logs/main_log.txt.
//  config       Output: AberrationConfig read from the file.
bool ZabInit(const std::string& config_path, AberrationConfig* config);

}

#endif  // ZAB_INIT_H
