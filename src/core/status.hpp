/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <fmt/format.h>

#include <optional>
#include <string>
#include <utility>

namespace usbwatch::core {

struct Status {
  bool ok = true;
  std::string msg;

  Status() = default;
  Status(bool ok_, std::string msg_) : ok(ok_), msg(std::move(msg_)) {}

  static Status Ok() { return {}; }

  static Status Fail(std::string msg) { return Status(false, std::move(msg)); }

  template <class... Args>
  static Status Failf(fmt::format_string<Args...> f, Args&&... args) {
    return Fail(fmt::format(f, std::forward<Args>(args)...));
  }

  explicit operator bool() const noexcept { return ok; }
};

template <class T>
struct Result {
  // Default construct = failure-without-value.
  Status st{false, {}};
  std::optional<T> value_;

  Result() = default;

  Result(const Result&) = delete;
  Result& operator=(const Result&) = delete;

  Result(Result&&) noexcept = default;
  Result& operator=(Result&&) noexcept = default;

  static Result Ok(T v) {
    Result r;
    r.st = Status::Ok();
    r.value_.emplace(std::move(v));
    return r;
  }

  static Result Fail(std::string msg) {
    Result r;
    r.st = Status::Fail(std::move(msg));
    return r;
  }

  template <class... Args>
  static Result Failf(fmt::format_string<Args...> f, Args&&... args) {
    return Fail(fmt::format(f, std::forward<Args>(args)...));
  }

  T& value() & { return *value_; }
  const T& value() const& { return *value_; }
  T&& value() && { return std::move(*value_); }

  T* operator->() { return &*value_; }
  const T* operator->() const { return &*value_; }

  explicit operator bool() const noexcept { return st.ok && value_.has_value(); }
};

} // namespace usbwatch::core
