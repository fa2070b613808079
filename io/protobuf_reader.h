// Reads text-format protobufs, such as the aberration configuration.
// Author: Philip Salvaggio

#ifndef PROTOBUF_READER_H
#define PROTOBUF_READER_H

#include "io/logging.h"

#include <fstream>
#include <string>

#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>

namespace zab_io {

// Sends the syntax errors of a text-format file to the main log, with their
// position in the file.
class LoggingErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  explicit LoggingErrorCollector(const std::string& filename);

  void AddError(int line, google::protobuf::io::ColumnNumber column,
                const std::string& message) override;
  void AddWarning(int line, google::protobuf::io::ColumnNumber column,
                  const std::string& message) override;

  int num_errors() const { return num_errors_; }

 private:
  std::string filename_;
  int num_errors_;
};

class ProtobufReader {
 public:
  ProtobufReader() = delete;

  // Parse a text-format file into a message. Fields missing from the file
  // keep their defaults, unknown fields are an error.
  template <typename T>
  static bool Read(const std::string& filename, T* output) {
    if (!output) return false;

    std::ifstream ifs(filename.c_str());
    if (!ifs.is_open()) {
      mainLog() << "Error: Could not open file: " << filename << std::endl;
      return false;
    }

    LoggingErrorCollector errors(filename);
    google::protobuf::TextFormat::Parser parser;
    parser.RecordErrorsTo(&errors);

    google::protobuf::io::IstreamInputStream is(&ifs);
    if (!parser.Parse(&is, output)) {
      mainLog() << "Error: Could not parse " << output->GetTypeName()
                << " from " << filename << " (" << errors.num_errors()
                << " errors)" << std::endl;
      return false;
    }
    return true;
  }
};

}

#endif  // PROTOBUF_READER_H
