// File Description
// Author: Philip Salvaggio

#ifndef LOGGING_H
#define LOGGING_H

#include "base/aberration_config.pb.h"

#include <fstream>
#include <string>

namespace zab_io {

class Logging {
 public:
  // Initialize and log to standard error.
  static bool Init();

  // Initialize and log to a log file.
  static bool Init(const std::string& base_dir);

  static std::ostream& Main();

 private:
  static std::ofstream main_logfile_;
  static bool inited_;
  static bool using_stderr_;

  Logging();
};

std::string PrintConfig(const zab::AberrationConfig& config);
std::string PrintIncludePath(zab::AberrationConfig::IncludePath path);
std::string PrintPupilDiameter(const zab::AberrationConfig& config);

}

std::ostream& mainLog();

#endif  // LOGGING_H
