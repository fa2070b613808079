// Reads numeric variables out of MATLAB MAT-files.
// Author: Philip Salvaggio

#include "mat_file_reader.h"

#include "base/endian.h"
#include "io/logging.h"

#include <cstdint>
#include <cstring>
#include <fstream>

#include <zlib.h>

using namespace std;
using zab::isLittleEndian;
using zab::read_value;

namespace {

// Data element types of Level 5 files.
enum MatDataType {
  miINT8 = 1,
  miUINT8 = 2,
  miINT16 = 3,
  miUINT16 = 4,
  miINT32 = 5,
  miUINT32 = 6,
  miSINGLE = 7,
  miDOUBLE = 9,
  miINT64 = 12,
  miUINT64 = 13,
  miMATRIX = 14,
  miCOMPRESSED = 15,
};

// Array classes of Level 5 files. Everything from mxDOUBLE_CLASS onwards is
// numeric.
const int kMxDoubleClass = 6;
const int kMxUint64Class = 15;
const uint32_t kComplexFlag = 0x0800;

const size_t kLevel5HeaderSize = 128;
const size_t kLevel4HeaderSize = 20;

size_t DataTypeSize(int type) {
  switch (type) {
    case miINT8: case miUINT8: return 1;
    case miINT16: case miUINT16: return 2;
    case miINT32: case miUINT32: case miSINGLE: return 4;
    case miDOUBLE: case miINT64: case miUINT64: return 8;
  }
  return 0;
}

double ValueAsDouble(const unsigned char* data, int type, bool swap) {
  switch (type) {
    case miINT8: return read_value<int8_t>(data, swap);
    case miUINT8: return read_value<uint8_t>(data, swap);
    case miINT16: return read_value<int16_t>(data, swap);
    case miUINT16: return read_value<uint16_t>(data, swap);
    case miINT32: return read_value<int32_t>(data, swap);
    case miUINT32: return read_value<uint32_t>(data, swap);
    case miSINGLE: return read_value<float>(data, swap);
    case miDOUBLE: return read_value<double>(data, swap);
    case miINT64: return static_cast<double>(read_value<int64_t>(data, swap));
    case miUINT64: return static_cast<double>(read_value<uint64_t>(data, swap));
  }
  return 0;
}

// MAT-files store matrices in column-major order.
void ColumnMajorToMat(const unsigned char* data, int type, bool swap,
                      int rows, int cols, cv::Mat_<double>* output) {
  const size_t kTypeSize = DataTypeSize(type);
  output->create(rows, cols);
  for (int j = 0; j < cols; j++) {
    for (int i = 0; i < rows; i++) {
      size_t index = static_cast<size_t>(j) * rows + i;
      (*output)(i, j) = ValueAsDouble(data + index * kTypeSize, type, swap);
    }
  }
}

// A single tag + data element of a Level 5 file.
struct DataElement {
  int type;
  size_t num_bytes;
  const unsigned char* data;
  size_t total_size;  // Tag, data and padding.
};

bool ReadDataElement(const unsigned char* begin, size_t available, bool swap,
                     DataElement* element) {
  if (available < 8) return false;

  uint32_t type = read_value<uint32_t>(begin, swap);
  if ((type >> 16) != 0) {
    // Small data element format: the data shares the 8 bytes of the tag.
    element->type = type & 0xFFFF;
    element->num_bytes = type >> 16;
    element->data = begin + 4;
    element->total_size = 8;
    return element->num_bytes <= 4;
  }

  element->type = type;
  element->num_bytes = read_value<uint32_t>(begin + 4, swap);
  element->data = begin + 8;
  size_t padded = (element->num_bytes + 7) / 8 * 8;
  element->total_size = 8 + padded;

  // The last element of a file does not need its padding.
  return 8 + element->num_bytes <= available;
}

// Inflate the zlib stream of a miCOMPRESSED element. The size of the inflated
// data isn't stored in the file, so the output grows as needed.
bool Inflate(const unsigned char* data, size_t num_bytes,
             vector<unsigned char>* output) {
  const size_t kChunk = 1 << 16;

  z_stream stream;
  memset(&stream, 0, sizeof(stream));
  if (inflateInit(&stream) != Z_OK) return false;

  stream.next_in = const_cast<Bytef*>(data);
  stream.avail_in = static_cast<uInt>(num_bytes);

  output->clear();
  int status = Z_OK;
  while (status == Z_OK) {
    size_t offset = output->size();
    output->resize(offset + kChunk);
    stream.next_out = &(*output)[offset];
    stream.avail_out = static_cast<uInt>(kChunk);

    status = inflate(&stream, Z_NO_FLUSH);
    output->resize(offset + kChunk - stream.avail_out);

    // Out of input before the end of the stream.
    if (status == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      status = Z_DATA_ERROR;
    }
  }

  inflateEnd(&stream);
  return status == Z_STREAM_END;
}

}

namespace zab_io {

bool MatFileReader::ReadFile(const string& filename,
                             vector<unsigned char>* contents) {
  ifstream ifs(filename.c_str(), ios::binary);
  if (!ifs.is_open()) {
    mainLog() << "Error: Could not open MAT-file " << filename << endl;
    return false;
  }

  contents->assign(istreambuf_iterator<char>(ifs),
                   istreambuf_iterator<char>());
  return true;
}

bool MatFileReader::ReadLevel4(const string& filename,
                               const string& variable,
                               cv::Mat_<double>* data) {
  if (!data) return false;

  vector<unsigned char> contents;
  if (!ReadFile(filename, &contents)) return false;

  // Level 4 types, indexed by the precision digit of the MOPT field.
  static const int kPrecisionTypes[] = {
    miDOUBLE, miSINGLE, miINT32, miINT16, miUINT16, miUINT8
  };

  const bool kHostLittle = isLittleEndian();
  size_t offset = 0;
  while (offset + kLevel4HeaderSize <= contents.size()) {
    const unsigned char* header = &contents[offset];

    // The byte order is encoded in the thousands digit of the MOPT field, so
    // try both orders and keep the one that decodes consistently.
    bool swap = false;
    int32_t mopt = read_value<int32_t>(header, swap);
    bool little = (mopt / 1000 == 0);
    if (mopt < 0 || mopt > 4052 || little != kHostLittle) {
      swap = true;
      mopt = read_value<int32_t>(header, swap);
      little = (mopt / 1000 == 0);
      if (mopt < 0 || mopt > 4052 || little == kHostLittle) {
        mainLog() << "Error: " << filename << " is not a Level 4 MAT-file."
                  << endl;
        return false;
      }
    }

    const int kPrecision = (mopt / 10) % 10;
    const int kMatrixType = mopt % 10;
    const int32_t kRows = read_value<int32_t>(header + 4, swap);
    const int32_t kCols = read_value<int32_t>(header + 8, swap);
    const int32_t kImag = read_value<int32_t>(header + 12, swap);
    const int32_t kNameLength = read_value<int32_t>(header + 16, swap);

    if (kPrecision > 5 || kRows < 0 || kCols < 0 || kNameLength < 1) {
      mainLog() << "Error: Corrupt matrix header in " << filename << endl;
      return false;
    }

    const int kType = kPrecisionTypes[kPrecision];
    const size_t kElements = static_cast<size_t>(kRows) * kCols;
    const size_t kDataSize =
        kElements * DataTypeSize(kType) * (kImag ? 2 : 1);

    offset += kLevel4HeaderSize;
    if (offset + kNameLength + kDataSize > contents.size()) {
      mainLog() << "Error: Truncated matrix in " << filename << endl;
      return false;
    }

    string name(reinterpret_cast<const char*>(&contents[offset]),
                kNameLength);
    name = name.substr(0, name.find('\0'));
    offset += kNameLength;

    if (name == variable) {
      if (kMatrixType != 0 || kImag) {
        mainLog() << "Error: Variable " << variable << " in " << filename
                  << " is not a real, full numeric matrix." << endl;
        return false;
      }
      if (kElements == 0) {
        mainLog() << "Error: Variable " << variable << " is empty." << endl;
        return false;
      }
      ColumnMajorToMat(&contents[offset], kType, swap, kRows, kCols, data);
      return true;
    }

    offset += kDataSize;
  }

  mainLog() << "Error: Variable " << variable << " not found in "
            << filename << endl;
  return false;
}

bool MatFileReader::ReadLevel5(const string& filename,
                               const string& variable,
                               cv::Mat_<double>* data) {
  if (!data) return false;

  vector<unsigned char> contents;
  if (!ReadFile(filename, &contents)) return false;

  if (contents.size() < kLevel5HeaderSize) {
    mainLog() << "Error: " << filename << " is too short for a MAT-file."
              << endl;
    return false;
  }

  // The endian indicator reads "IM" when the file was written on a
  // little-endian machine.
  bool file_little;
  if (contents[126] == 'I' && contents[127] == 'M') {
    file_little = true;
  } else if (contents[126] == 'M' && contents[127] == 'I') {
    file_little = false;
  } else {
    mainLog() << "Error: " << filename << " is not a Level 5 MAT-file."
              << endl;
    return false;
  }
  const bool kSwap = (file_little != isLittleEndian());

  size_t offset = kLevel5HeaderSize;
  while (offset + 8 <= contents.size()) {
    DataElement element;
    if (!ReadDataElement(&contents[offset], contents.size() - offset, kSwap,
                         &element)) {
      mainLog() << "Error: Truncated data element in " << filename << endl;
      return false;
    }

    size_t next_offset = offset + element.total_size;

    // MATLAB -v7 compresses each variable into its own zlib stream, which
    // holds a complete miMATRIX element. Compressed elements aren't padded.
    vector<unsigned char> inflated;
    if (element.type == miCOMPRESSED) {
      next_offset = offset + 8 + element.num_bytes;
      if (!Inflate(element.data, element.num_bytes, &inflated)) {
        mainLog() << "Error: Corrupt compressed variable in " << filename
                  << endl;
        return false;
      }
      if (!ReadDataElement(inflated.data(), inflated.size(), kSwap,
                           &element)) {
        mainLog() << "Error: Truncated compressed variable in " << filename
                  << endl;
        return false;
      }
    }

    if (element.type == miMATRIX) {
      bool found = false;
      if (!ParseMatrixElement(element.data, element.num_bytes, kSwap,
                              variable, &found, data)) {
        mainLog() << "Error: Could not parse variable " << variable
                  << " in " << filename << endl;
        return false;
      }
      if (found) return true;
    }

    offset = next_offset;
  }

  mainLog() << "Error: Variable " << variable << " not found in "
            << filename << endl;
  return false;
}

bool MatFileReader::ParseMatrixElement(const unsigned char* begin,
                                       size_t num_bytes,
                                       bool swap,
                                       const string& variable,
                                       bool* found,
                                       cv::Mat_<double>* data) {
  *found = false;
  if (num_bytes == 0) return true;  // Empty matrix.

  size_t offset = 0;
  DataElement flags, dims, name;
  if (!ReadDataElement(begin, num_bytes, swap, &flags)) return false;
  offset += flags.total_size;
  if (offset > num_bytes ||
      !ReadDataElement(begin + offset, num_bytes - offset, swap, &dims)) {
    return false;
  }
  offset += dims.total_size;
  if (offset > num_bytes ||
      !ReadDataElement(begin + offset, num_bytes - offset, swap, &name)) {
    return false;
  }
  offset += name.total_size;

  string matrix_name(reinterpret_cast<const char*>(name.data), name.num_bytes);
  if (matrix_name != variable) return true;
  *found = true;

  if (flags.num_bytes < 4) return false;
  uint32_t flag_word = read_value<uint32_t>(flags.data, swap);
  int array_class = flag_word & 0xFF;
  if (array_class < kMxDoubleClass || array_class > kMxUint64Class) {
    mainLog() << "Error: Variable " << variable << " is not numeric." << endl;
    return false;
  }
  if (flag_word & kComplexFlag) {
    mainLog() << "Error: Variable " << variable << " is complex." << endl;
    return false;
  }

  if (dims.type != miINT32 || dims.num_bytes != 8) {
    mainLog() << "Error: Variable " << variable << " must be 2D." << endl;
    return false;
  }
  const int32_t kRows = read_value<int32_t>(dims.data, swap);
  const int32_t kCols = read_value<int32_t>(dims.data + 4, swap);
  if (kRows <= 0 || kCols <= 0) {
    mainLog() << "Error: Variable " << variable << " is empty." << endl;
    return false;
  }

  DataElement real_part;
  if (offset > num_bytes ||
      !ReadDataElement(begin + offset, num_bytes - offset, swap, &real_part)) {
    return false;
  }

  const size_t kTypeSize = DataTypeSize(real_part.type);
  if (kTypeSize == 0 ||
      real_part.num_bytes !=
          static_cast<size_t>(kRows) * kCols * kTypeSize) {
    mainLog() << "Error: Unexpected data layout for variable " << variable
              << endl;
    return false;
  }

  ColumnMajorToMat(real_part.data, real_part.type, swap, kRows, kCols, data);
  return true;
}

}
