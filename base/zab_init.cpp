// Initialization of logging and configuration for the aberration injection.
// Author: Philip Salvaggio

#include "zab_init.h"

#include "base/aberration_config.pb.h"
#include "base/filesystem.h"
#include "io/logging.h"
#include "io/protobuf_reader.h"

#include <iostream>

using namespace std;

namespace zab {

bool ZabInit(const string& config_path, AberrationConfig* config) {
  if (!config) {
    cerr << "Invalid Pointer passed to zab::ZabInit()" << endl;
    return false;
  }

  string version = "1.0.0";

  // Initialize logging.
  string config_file = config_path;
  if (is_dir(config_path)) {
    config_file = AppendSlash(config_path) + "input/zernike_aberrations.txt";
    if (!zab_io::Logging::Init(AppendSlash(config_path))) {
      cerr << "Could not open log files." << endl;
      return false;
    }
  } else if (!zab_io::Logging::Init()) {
    cerr << "Could not initialize logging." << endl;
    return false;
  }

  // Write the header to the log file
  mainLog() << "Zernike Aberration Injection (ZAB " << version
            << ") Main Log File" << endl << endl;

  // Initialize the aberration parameters.
  if (!file_exists(config_file)) {
    mainLog() << "Error: Config file " << config_file << " does not exist."
              << endl;
    return false;
  }
  if (!zab_io::ProtobufReader::Read(config_file, config)) {
    cerr << "Could not read aberration config file." << endl;
    return false;
  }

  mainLog() << "Configuration Parameters:" << endl
            << zab_io::PrintConfig(*config) << endl;

  return true;
}

}
