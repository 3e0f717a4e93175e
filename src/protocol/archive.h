/*
  This file is part of Chessd.
  Copyright (C) 2026 The Chessd Authors

  Chessd is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  Chessd is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with Chessd.  If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <cstdint>
#include <ostream>
#include <span>
#include <type_traits>
#include <vector>

#include "utils/expected.h"

namespace chessd::protocol {

enum class ArchiveError {
  kNone,
  kBufferOverflow,
  kInvalidData,
  kValueOverflow,
  kSizeCalculationFailed,
};

std::ostream& operator<<(std::ostream& os, ArchiveError error);

// Wraps an integer which is stored little endian with its full width instead
// of the variable length encoding.
template <typename T>
struct FixedInteger {
  T& value;
};
template <typename T>
FixedInteger(T&) -> FixedInteger<T>;

template <typename T, typename Archive>
Archive::ResultType Serialize(T& value, Archive& ar, const unsigned version) {
  return value.Serialize(ar, version);
}

class BinaryOArchive {
 public:
  static constexpr bool is_saving = true;
  static constexpr bool is_loading = false;

  using ResultType = Expected<BinaryOArchive&, ArchiveError>;

  explicit BinaryOArchive(unsigned version) : version_(version) {}

  template <typename T>
  [[nodiscard]]
  ResultType operator<<(const T& value) {
    return Save(value);
  }

  template <typename T>
  [[nodiscard]]
  ResultType operator&(const T& value) {
    return *this << value;
  }

  // Reserves the exact frame size and writes the message with its header.
  template <typename T>
  [[nodiscard]]
  ResultType StartSerialize(T& message);

  size_t Size() const { return buffer_.size(); }

  const std::vector<char>& GetVector() const { return buffer_; }
  std::vector<char> TakeVector() { return std::move(buffer_); }

 protected:
  template <typename T>
  ResultType Save(const T& value) {
    return Serialize(const_cast<T&>(value), *this, version_);
  };

  // Integer serialization using protobuf variable encoding.
  ResultType Save(const uint64_t& value);
  ResultType Save(const uint32_t& value);
  ResultType Save(const uint16_t& value);
  ResultType Save(const uint8_t& value);

  ResultType Save(const bool& value);

  // Fixed width integer serialization.
  ResultType Save(const FixedInteger<uint32_t>& value);
  ResultType Save(const FixedInteger<uint8_t>& value);

 private:
  std::vector<char> buffer_;
  unsigned version_;
};

class BinaryIArchive {
 public:
  static constexpr bool is_saving = false;
  static constexpr bool is_loading = true;

  using ResultType = Expected<BinaryIArchive&, ArchiveError>;

  BinaryIArchive(std::span<const char> buffer, unsigned version)
      : buffer_(buffer), version_(version) {}

  template <typename T>
  [[nodiscard]]
  ResultType operator>>(T& value) {
    return Load(value);
  }
  template <typename T>
  [[nodiscard]]
  ResultType operator>>(FixedInteger<T> value) {
    return Load(value);
  }

  template <typename T>
  [[nodiscard]]
  ResultType operator&(T& value) {
    return *this >> value;
  }
  template <typename T>
  [[nodiscard]]
  ResultType operator&(FixedInteger<T> value) {
    return *this >> value;
  }

  // Number of bytes not consumed yet.
  size_t Size() const { return buffer_.size(); }

 protected:
  template <typename T>
  ResultType Load(T& value) {
    return Serialize(value, *this, version_);
  };

  // Integer deserialization using protobuf variable encoding.
  ResultType Load(uint64_t& value);
  ResultType Load(uint32_t& value);
  ResultType Load(uint16_t& value);
  ResultType Load(uint8_t& value);

  ResultType Load(bool& value);

  // Fixed width integer deserialization.
  ResultType Load(FixedInteger<uint32_t> value);
  ResultType Load(FixedInteger<uint8_t> value);

 private:
  std::span<const char> buffer_;
  unsigned version_;
};

}  // namespace chessd::protocol
