// Reads text-format protobufs, such as the aberration configuration.
// Author: Philip Salvaggio

#include "protobuf_reader.h"

using namespace std;

namespace zab_io {

LoggingErrorCollector::LoggingErrorCollector(const string& filename)
    : filename_(filename), num_errors_(0) {}

// Lines and columns are reported 0-based by the tokenizer.
void LoggingErrorCollector::AddError(int line,
                                     google::protobuf::io::ColumnNumber column,
                                     const string& message) {
  num_errors_++;
  mainLog() << "Error: " << filename_ << ":" << line + 1 << ":" << column + 1
            << ": " << message << endl;
}

void LoggingErrorCollector::AddWarning(
    int line, google::protobuf::io::ColumnNumber column,
    const string& message) {
  mainLog() << "Warning: " << filename_ << ":" << line + 1 << ":"
            << column + 1 << ": " << message << endl;
}

}
