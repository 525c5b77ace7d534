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

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace usbwatch::core {

// One-directional channels between exactly one producer and one consumer.
// Each end is a move-only handle; destroying a handle closes its side and
// the peer observes it on its next operation.

namespace detail {

template <class T> struct MailboxState {
  std::mutex m;
  std::condition_variable cv;

  std::optional<T> slot;
  std::uint64_t dropped = 0;

  bool sender_open = true;
  bool receiver_open = true;
};

struct SignalState {
  std::mutex m;
  std::condition_variable cv;

  std::size_t pending = 0;

  bool sender_open = true;
  bool receiver_open = true;
};

} // namespace detail

template <class T> class MailboxSender;
template <class T> class MailboxReceiver;

template <class T>
std::pair<MailboxSender<T>, MailboxReceiver<T>> make_mailbox();

// Single-slot value channel. send() never blocks: an unconsumed value is
// replaced by the newer one, so a slow consumer only ever sees the latest.
template <class T> class MailboxSender {
public:
  MailboxSender() = default;
  ~MailboxSender() { close(); }

  MailboxSender(const MailboxSender &) = delete;
  MailboxSender &operator=(const MailboxSender &) = delete;

  MailboxSender(MailboxSender &&o) noexcept : s_(std::move(o.s_)) {}
  MailboxSender &operator=(MailboxSender &&o) noexcept {
    if (this == &o) return *this;
    close();
    s_ = std::move(o.s_);
    return *this;
  }

  // Returns false once the receiver is gone; the value is discarded.
  bool send(T v) {
    if (!s_) return false;
    {
      std::lock_guard lk(s_->m);
      if (!s_->receiver_open) return false;
      if (s_->slot) ++s_->dropped;
      s_->slot.emplace(std::move(v));
    }
    s_->cv.notify_all();
    return true;
  }

  void close() noexcept {
    if (!s_) return;
    {
      std::lock_guard lk(s_->m);
      s_->sender_open = false;
    }
    s_->cv.notify_all();
    s_.reset();
  }

private:
  friend std::pair<MailboxSender<T>, MailboxReceiver<T>> make_mailbox<T>();
  explicit MailboxSender(std::shared_ptr<detail::MailboxState<T>> s) : s_(std::move(s)) {}

  std::shared_ptr<detail::MailboxState<T>> s_;
};

template <class T> class MailboxReceiver {
public:
  MailboxReceiver() = default;
  ~MailboxReceiver() { close(); }

  MailboxReceiver(const MailboxReceiver &) = delete;
  MailboxReceiver &operator=(const MailboxReceiver &) = delete;

  MailboxReceiver(MailboxReceiver &&o) noexcept : s_(std::move(o.s_)) {}
  MailboxReceiver &operator=(MailboxReceiver &&o) noexcept {
    if (this == &o) return *this;
    close();
    s_ = std::move(o.s_);
    return *this;
  }

  std::optional<T> try_recv() {
    if (!s_) return std::nullopt;
    std::lock_guard lk(s_->m);
    return take_();
  }

  template <class Rep, class Period>
  std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
    if (!s_) return std::nullopt;
    std::unique_lock lk(s_->m);
    s_->cv.wait_for(lk, timeout, [&] { return s_->slot.has_value() || !s_->sender_open; });
    return take_();
  }

  // True while a value may still arrive.
  bool connected() const {
    if (!s_) return false;
    std::lock_guard lk(s_->m);
    return s_->sender_open || s_->slot.has_value();
  }

  std::uint64_t dropped() const {
    if (!s_) return 0;
    std::lock_guard lk(s_->m);
    return s_->dropped;
  }

  void close() noexcept {
    if (!s_) return;
    {
      std::lock_guard lk(s_->m);
      s_->receiver_open = false;
      s_->slot.reset();
    }
    s_.reset();
  }

private:
  friend std::pair<MailboxSender<T>, MailboxReceiver<T>> make_mailbox<T>();
  explicit MailboxReceiver(std::shared_ptr<detail::MailboxState<T>> s) : s_(std::move(s)) {}

  std::optional<T> take_() {
    std::optional<T> out;
    out.swap(s_->slot);
    return out;
  }

  std::shared_ptr<detail::MailboxState<T>> s_;
};

template <class T>
std::pair<MailboxSender<T>, MailboxReceiver<T>> make_mailbox() {
  auto s = std::make_shared<detail::MailboxState<T>>();
  return {MailboxSender<T>(s), MailboxReceiver<T>(s)};
}

class SignalSender;
class SignalReceiver;

std::pair<SignalSender, SignalReceiver> make_signal();

// Zero-payload wake-up channel.
class SignalSender {
public:
  SignalSender() = default;
  ~SignalSender() { close(); }

  SignalSender(const SignalSender &) = delete;
  SignalSender &operator=(const SignalSender &) = delete;

  SignalSender(SignalSender &&o) noexcept : s_(std::move(o.s_)) {}
  SignalSender &operator=(SignalSender &&o) noexcept {
    if (this == &o) return *this;
    close();
    s_ = std::move(o.s_);
    return *this;
  }

  bool notify() {
    if (!s_) return false;
    {
      std::lock_guard lk(s_->m);
      if (!s_->receiver_open) return false;
      ++s_->pending;
    }
    s_->cv.notify_all();
    return true;
  }

  void close() noexcept {
    if (!s_) return;
    {
      std::lock_guard lk(s_->m);
      s_->sender_open = false;
    }
    s_->cv.notify_all();
    s_.reset();
  }

private:
  friend std::pair<SignalSender, SignalReceiver> make_signal();
  explicit SignalSender(std::shared_ptr<detail::SignalState> s) : s_(std::move(s)) {}

  std::shared_ptr<detail::SignalState> s_;
};

class SignalReceiver {
public:
  enum class Wait { Signalled, Timeout, Closed };

  SignalReceiver() = default;
  ~SignalReceiver() { close(); }

  SignalReceiver(const SignalReceiver &) = delete;
  SignalReceiver &operator=(const SignalReceiver &) = delete;

  SignalReceiver(SignalReceiver &&o) noexcept : s_(std::move(o.s_)) {}
  SignalReceiver &operator=(SignalReceiver &&o) noexcept {
    if (this == &o) return *this;
    close();
    s_ = std::move(o.s_);
    return *this;
  }

  // Consumes one pending signal. Pending signals are delivered before the
  // closed state is reported.
  template <class Rep, class Period>
  Wait wait_for(std::chrono::duration<Rep, Period> timeout) {
    if (!s_) return Wait::Closed;
    std::unique_lock lk(s_->m);
    s_->cv.wait_for(lk, timeout, [&] { return s_->pending > 0 || !s_->sender_open; });
    if (s_->pending > 0) {
      --s_->pending;
      return Wait::Signalled;
    }
    return s_->sender_open ? Wait::Timeout : Wait::Closed;
  }

  void close() noexcept {
    if (!s_) return;
    {
      std::lock_guard lk(s_->m);
      s_->receiver_open = false;
      s_->pending = 0;
    }
    s_.reset();
  }

private:
  friend std::pair<SignalSender, SignalReceiver> make_signal();
  explicit SignalReceiver(std::shared_ptr<detail::SignalState> s) : s_(std::move(s)) {}

  std::shared_ptr<detail::SignalState> s_;
};

inline std::pair<SignalSender, SignalReceiver> make_signal() {
  auto s = std::make_shared<detail::SignalState>();
  return {SignalSender(s), SignalReceiver(s)};
}

} // namespace usbwatch::core
