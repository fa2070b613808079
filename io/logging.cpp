// File Description
// Author: Philip Salvaggio

#include "logging.h"

#include "base/filesystem.h"

#include <iostream>
#include <sstream>

using namespace std;
using namespace zab;

std::ostream& mainLog() {
  return zab_io::Logging::Main();
}

namespace zab_io {

bool Logging::using_stderr_ = false;
bool Logging::inited_ = false;
ofstream Logging::main_logfile_;

Logging::Logging() {}

bool Logging::Init() {
  inited_ = true;
  using_stderr_ = true;
  return true;
}

bool Logging::Init(const string& base_dir) {
  if (inited_) return true;

  string fname = base_dir + "logs/main_log.txt";
  main_logfile_.open(fname.c_str());
  if (!main_logfile_.is_open()) {
    return false;
  }

  inited_ = true;
  return true;
}

ostream& Logging::Main() {
  if (!inited_) {
    cerr << "Warning: Please call zab_io::Logging::Init() before trying "
         << "to log messages." << endl;
    return cerr;
  }
  return using_stderr_ ? cerr : main_logfile_;
}

string PrintConfig(const AberrationConfig& config) {
  stringstream output;
  output << "Include Zernike aberrations: "
         << (config.include_zab() ? "yes" : "no") << endl;
  if (!config.include_zab()) return output.str();

  output << "Source file: "
           << JoinPath(config.file_dir(), config.file_name()) << endl
         << "MAT-file version: "
           << AberrationConfig::MatVersion_Name(config.mat_vers()) << endl
         << "Coefficient variable: " << config.var_name_coeff() << endl
         << "Time variable: " << config.var_name_time() << endl
         << "Number of modes: " << config.num_zpol() << endl
         << "Inclusion: " << PrintIncludePath(config.include_path()) << endl
         << "Data diameter: " << config.diam_data() << " [m]" << endl
         << "Pupil diameter: " << PrintPupilDiameter(config) << endl;

  if (config.has_step()) {
    output << "Step: " << config.step() << " [s]" << endl;
  } else {
    output << "Step: from time series" << endl;
  }

  return output.str();
}

string PrintIncludePath(AberrationConfig::IncludePath path) {
  switch (path) {
    case AberrationConfig::NONE: return "not included";
    case AberrationConfig::SCIENCE_ONLY: return "science (target) path";
    case AberrationConfig::ANALYTIC_ONLY: return "analytic (WFS) path";
    case AberrationConfig::BOTH:
      return "science (target) and analytic (WFS) path";
  }
  return "unknown";
}

string PrintPupilDiameter(const AberrationConfig& config) {
  stringstream ss;
  if (config.pup_diam() == -2) {
    ss << "data fitted to simulation";
  } else if (config.pup_diam() == -1) {
    ss << "telescope diameter";
  } else {
    ss << config.pup_diam() << " [m]";
  }
  return ss.str();
}

}
