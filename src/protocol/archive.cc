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

#include "protocol/archive.h"

#include <ostream>
#include <type_traits>
#include <vector>

#include "protocol/protocol.h"

namespace chessd::protocol {

namespace {

template <typename R, typename T>
auto SaveImpl(R&& successed, std::vector<char>& buffer, const T& value)
    -> std::enable_if_t<std::is_unsigned_v<T>, R> {
  T uvalue = value;
  do {
    char byte = static_cast<char>(uvalue & 0x7f);
    uvalue >>= 7;
    if (uvalue) byte |= 0x80;
    if (buffer.size() == buffer.capacity()) {
      return Unexpected{ArchiveError::kBufferOverflow};
    }
    buffer.push_back(byte);
  } while (uvalue);
  return std::forward<R>(successed);
}
template <typename R, typename T>
auto LoadImpl(R&& successed, std::span<const char>& buffer, T& value)
    -> std::enable_if_t<std::is_unsigned_v<T>, R> {
  T uvalue = 0;
  unsigned shift = 0;
  while (true) {
    if (buffer.size() == 0) {
      return Unexpected{ArchiveError::kBufferOverflow};
    }
    const char byte = buffer[0];
    buffer = buffer.subspan(1);
    const T bits = static_cast<T>(byte & 0x7f);
    // Bits shifted out of the type mean the value doesn't fit.
    if (static_cast<T>(bits << shift) >> shift != bits) {
      return Unexpected{ArchiveError::kValueOverflow};
    }
    uvalue |= static_cast<T>(bits << shift);
    if (!(byte & 0x80)) break;
    shift += 7;
    if (shift >= sizeof(T) * 8) {
      return Unexpected{ArchiveError::kValueOverflow};
    }
  }
  value = uvalue;
  return std::forward<R>(successed);
}
template <typename R, typename T>
auto SizeImpl(R&& successed, size_t& size_archive, const T& value)
    -> std::enable_if_t<std::is_unsigned_v<T>, R> {
  T uvalue = value;
  size_t size = 0;
  do {
    ++size;
    uvalue >>= 7;
  } while (uvalue);
  size_archive += size;
  return std::forward<R>(successed);
}

template <typename R, typename T>
auto SaveImpl(R&& successed, std::vector<char>& buffer,
              const FixedInteger<T>& value)
    -> std::enable_if_t<std::is_integral_v<T>, R> {
  T v = static_cast<T>(value.value);
  if (buffer.size() + sizeof(T) > buffer.capacity()) {
    return Unexpected{ArchiveError::kBufferOverflow};
  }
  for (size_t i = 0; i < sizeof(T); ++i) {
    buffer.push_back(static_cast<char>(v & 0xff));
    if constexpr (sizeof(T) > 1) v >>= 8;
  }
  return std::forward<R>(successed);
}
template <typename R, typename T>
auto LoadImpl(R&& successed, std::span<const char>& buffer,
              FixedInteger<T> value)
    -> std::enable_if_t<std::is_integral_v<T>, R> {
  T v = 0;
  if (buffer.size() < sizeof(T)) {
    return Unexpected{ArchiveError::kBufferOverflow};
  }
  for (size_t i = 0; i < sizeof(T); ++i) {
    v |= static_cast<T>(static_cast<unsigned char>(buffer[0])) << (i * 8);
    buffer = buffer.subspan(1);
  }
  value.value = v;
  return std::forward<R>(successed);
}
template <typename R, typename T>
auto SizeImpl(R&& successed, size_t& size_archive, const FixedInteger<T>&)
    -> std::enable_if_t<std::is_integral_v<T>, R> {
  size_archive += sizeof(T);
  return std::forward<R>(successed);
}

template <typename R>
auto SaveImpl(R&& successed, std::vector<char>& buffer, const bool& value)
    -> R {
  uint8_t v = value ? 1 : 0;
  return SaveImpl(std::forward<R>(successed), buffer, FixedInteger{v});
}
template <typename R>
auto LoadImpl(R&& successed, std::span<const char>& buffer, bool& value) -> R {
  uint8_t v;
  auto res = LoadImpl(std::forward<R>(successed), buffer, FixedInteger{v});
  if (!res) return res;
  if (v > 1) return Unexpected{ArchiveError::kInvalidData};
  value = !!v;
  return res;
}
template <typename R>
auto SizeImpl(R&& successed, size_t& size_archive, const bool&) -> R {
  size_archive += 1;
  return std::forward<R>(successed);
}

struct BinaryOSizeArchive {
  using ResultType = Expected<BinaryOSizeArchive&, ArchiveError>;
  static constexpr bool is_loading = false;
  static constexpr bool is_saving = true;

  template <typename T>
  ResultType operator&(const T& value) {
    return Size(value);
  }

  template <typename T>
  std::enable_if_t<!std::is_integral_v<T>, ResultType> Size(const T& value) {
    return Serialize(const_cast<T&>(value), *this, kProtocolVersion);
  }

  size_t Size() const { return 0; }

  template <typename T>
  std::enable_if_t<std::is_unsigned_v<T> && !std::is_same_v<T, bool>,
                   ResultType>
  Size(const T& value) {
    return SizeImpl(ResultType{*this}, total_size_, value);
  }

  ResultType Size(const bool& value) {
    return SizeImpl(ResultType{*this}, total_size_, value);
  }

  template <typename T>
  std::enable_if_t<std::is_integral_v<T>, ResultType> Size(
      const FixedInteger<T>& value) {
    return SizeImpl(ResultType{*this}, total_size_, value);
  }

  size_t total_size_ = 0;
};

}  // namespace

std::ostream& operator<<(std::ostream& os, ArchiveError error) {
  switch (error) {
    case ArchiveError::kNone:
      os << "None";
      break;
    case ArchiveError::kBufferOverflow:
      os << "BufferOverflow";
      break;
    case ArchiveError::kValueOverflow:
      os << "ValueOverflow";
      break;
    case ArchiveError::kSizeCalculationFailed:
      os << "SizeCalculationFailed";
      break;
    case ArchiveError::kInvalidData:
      os << "InvalidData";
      break;
  }
  return os;
}

BinaryOArchive::ResultType BinaryOArchive::Save(const uint64_t& value) {
  return SaveImpl(ResultType{*this}, buffer_, value);
}
BinaryOArchive::ResultType BinaryOArchive::Save(const uint32_t& value) {
  return SaveImpl(ResultType{*this}, buffer_, value);
}
BinaryOArchive::ResultType BinaryOArchive::Save(const uint16_t& value) {
  return SaveImpl(ResultType{*this}, buffer_, value);
}
BinaryOArchive::ResultType BinaryOArchive::Save(const uint8_t& value) {
  return SaveImpl(ResultType{*this}, buffer_, value);
}

BinaryOArchive::ResultType BinaryOArchive::Save(const bool& value) {
  return SaveImpl(ResultType{*this}, buffer_, value);
}

BinaryOArchive::ResultType BinaryOArchive::Save(
    const FixedInteger<uint32_t>& value) {
  return SaveImpl(ResultType{*this}, buffer_, value);
}
BinaryOArchive::ResultType BinaryOArchive::Save(
    const FixedInteger<uint8_t>& value) {
  return SaveImpl(ResultType{*this}, buffer_, value);
}

template <typename T>
BinaryOArchive::ResultType BinaryOArchive::StartSerialize(T& message) {
  BinaryOSizeArchive header_size;
  BinaryOSizeArchive size_archive;
  if (!(header_size & message.header_)) {
    return Unexpected{ArchiveError::kSizeCalculationFailed};
  }
  if (!(size_archive & message)) {
    return Unexpected{ArchiveError::kSizeCalculationFailed};
  }
  size_t size = size_archive.total_size_ - header_size.total_size_;
  message.header_.size_ = size;
  while (size >= 0x80) {
    size_archive.total_size_++;
    size >>= 7;
  }
  buffer_.reserve(size_archive.total_size_);
  return Save(message);
}

template BinaryOArchive::ResultType BinaryOArchive::StartSerialize<MoveMessage>(
    MoveMessage& message);
template BinaryOArchive::ResultType
BinaryOArchive::StartSerialize<PromoteMessage>(PromoteMessage& message);
template BinaryOArchive::ResultType
BinaryOArchive::StartSerialize<RequestDrawMessage>(RequestDrawMessage& message);
template BinaryOArchive::ResultType
BinaryOArchive::StartSerialize<ReconnectMessage>(ReconnectMessage& message);
template BinaryOArchive::ResultType
BinaryOArchive::StartSerialize<ResignMessage>(ResignMessage& message);
template BinaryOArchive::ResultType
BinaryOArchive::StartSerialize<MatchFoundMessage>(MatchFoundMessage& message);
template BinaryOArchive::ResultType
BinaryOArchive::StartSerialize<MoveAppliedMessage>(MoveAppliedMessage& message);
template BinaryOArchive::ResultType
BinaryOArchive::StartSerialize<PromotionAppliedMessage>(
    PromotionAppliedMessage& message);
template BinaryOArchive::ResultType
BinaryOArchive::StartSerialize<StateSnapshotMessage>(
    StateSnapshotMessage& message);
template BinaryOArchive::ResultType
BinaryOArchive::StartSerialize<DrawOfferedMessage>(DrawOfferedMessage& message);
template BinaryOArchive::ResultType
BinaryOArchive::StartSerialize<GameEndedMessage>(GameEndedMessage& message);

BinaryIArchive::ResultType BinaryIArchive::Load(uint64_t& value) {
  return LoadImpl(ResultType{*this}, buffer_, value);
}
BinaryIArchive::ResultType BinaryIArchive::Load(uint32_t& value) {
  return LoadImpl(ResultType{*this}, buffer_, value);
}
BinaryIArchive::ResultType BinaryIArchive::Load(uint16_t& value) {
  return LoadImpl(ResultType{*this}, buffer_, value);
}
BinaryIArchive::ResultType BinaryIArchive::Load(uint8_t& value) {
  return LoadImpl(ResultType{*this}, buffer_, value);
}

BinaryIArchive::ResultType BinaryIArchive::Load(bool& value) {
  return LoadImpl(ResultType{*this}, buffer_, value);
}

BinaryIArchive::ResultType BinaryIArchive::Load(FixedInteger<uint32_t> value) {
  return LoadImpl(ResultType{*this}, buffer_, value);
}
BinaryIArchive::ResultType BinaryIArchive::Load(FixedInteger<uint8_t> value) {
  return LoadImpl(ResultType{*this}, buffer_, value);
}

}  // namespace chessd::protocol
