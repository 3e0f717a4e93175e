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

#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

namespace chessd {

template <typename E>
class Unexpected {
 public:
  explicit constexpr Unexpected(const E& e) : value(e) {}
  explicit constexpr Unexpected(E&& e) : value(std::move(e)) {}
  E value;
};

// A small subset of std::expected. Features should be added when code needs
// them.
template <typename T, typename E>
class ExpectedImpl {
 public:
  using value_type = T;
  using error_type = E;
  using unexpected_type = Unexpected<E>;

  template <typename U>
  using rebind = ExpectedImpl<U, E>;

  constexpr ExpectedImpl() : data_(E{}) {};
  constexpr ExpectedImpl(const ExpectedImpl& other) = default;
  constexpr ExpectedImpl(ExpectedImpl&& other) = default;
  constexpr ExpectedImpl& operator=(const ExpectedImpl& other) = default;
  constexpr ExpectedImpl& operator=(ExpectedImpl&& other) = default;

  constexpr ExpectedImpl(const T& value) : data_(value) {};
  constexpr ExpectedImpl(T&& value) : data_(std::move(value)) {};

  constexpr ExpectedImpl(const unexpected_type& e) : data_(e.value) {}

  constexpr const T* operator->() const { return &std::get<T>(data_); }
  constexpr T* operator->() { return &std::get<T>(data_); }
  constexpr const T& value() const& { return std::get<T>(data_); }
  constexpr T& value() & { return std::get<T>(data_); }
  constexpr T&& value() && { return std::get<T>(std::move(data_)); }

  constexpr explicit operator bool() const noexcept {
    return std::holds_alternative<T>(data_);
  }
  constexpr bool has_value() const noexcept {
    return std::holds_alternative<T>(data_);
  }

  constexpr const E& error() const& { return std::get<E>(data_); }
  constexpr E& error() & { return std::get<E>(data_); }
  constexpr E&& error() && { return std::get<E>(std::move(data_)); }

  template <typename Func>
  constexpr auto and_then(Func&& func) & {
    using RetType = decltype(func(std::declval<T&>()));
    if (has_value()) {
      return func(value());
    } else {
      return RetType(unexpected_type(error()));
    }
  }
  template <typename Func>
  constexpr auto and_then(Func&& func) && {
    using RetType = decltype(func(std::declval<T&&>()));
    if (has_value()) {
      return func(std::move(value()));
    } else {
      return RetType(unexpected_type(std::move(error())));
    }
  }

 private:
  std::variant<T, E> data_;
};

template <typename T>
using MaybeRef =
    std::conditional_t<std::is_reference_v<T>,
                       std::reference_wrapper<std::remove_reference_t<T>>, T>;

template <typename T, typename E>
using Expected = ExpectedImpl<MaybeRef<T>, E>;

}  // namespace chessd
