// Byte order helpers for binary files that may have been written on a machine
// with the other endianness.
// Author: Philip Salvaggio

#ifndef ENDIAN_H
#define ENDIAN_H

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <vector>

namespace zab {

// Reverse the bytes of a plain value.
template <typename T> T swap_endian(T value) {
  unsigned char bytes[sizeof(T)];
  memcpy(bytes, &value, sizeof(T));
  std::reverse(bytes, bytes + sizeof(T));
  memcpy(&value, bytes, sizeof(T));
  return value;
}

// Detect whether the system is little Endian
inline bool isLittleEndian() {
  const unsigned short kOne = 1;
  unsigned char first_byte;
  memcpy(&first_byte, &kOne, 1);
  return first_byte == 1;
}

// Read a value from an unaligned position of a byte buffer.
//
// Arguments:
//  data  Start of the value in the buffer
//  swap  Whether the buffer has the opposite byte order of this machine
template <typename T> T read_value(const unsigned char* data, bool swap) {
  T value;
  memcpy(&value, data, sizeof(T));
  return swap ? swap_endian(value) : value;
}

// Append a value to a byte buffer, in the opposite byte order of this
// machine if swap is set.
template <typename T>
void append_value(T value, bool swap, std::vector<unsigned char>* buffer) {
  if (swap) value = swap_endian(value);
  unsigned char bytes[sizeof(T)];
  memcpy(bytes, &value, sizeof(T));
  buffer->insert(buffer->end(), bytes, bytes + sizeof(T));
}

}

#endif  // ENDIAN_H
