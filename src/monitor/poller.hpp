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

#include "core/channel.hpp"
#include "monitor/device.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <thread>

namespace usbwatch::monitor {

// Produces snapshots on a worker thread: one per refresh() call, and one
// whenever idle_timeout passes without a refresh. Only the newest
// undelivered snapshot is kept for the consumer.
class Poller {
public:
  using BuildFn = std::function<Snapshot()>;

  static constexpr std::chrono::milliseconds kDefaultIdle{200};

  explicit Poller(BuildFn build, std::chrono::milliseconds idle_timeout = kDefaultIdle);
  ~Poller();

  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  void refresh();

  // Non-blocking; returns the newest snapshot produced since the last call.
  std::optional<Snapshot> try_latest();
  std::optional<Snapshot> wait_next(std::chrono::milliseconds timeout);

  std::uint64_t dropped() const { return rx_.dropped(); }
  std::chrono::milliseconds idle_timeout() const noexcept { return idle_; }

  // Closes both channels and joins the worker. Idempotent.
  void stop() noexcept;

private:
  static void worker_loop_(std::stop_token st, BuildFn build, std::chrono::milliseconds idle,
                           core::MailboxSender<Snapshot> tx, core::SignalReceiver trigger) noexcept;

  std::chrono::milliseconds idle_;
  core::MailboxReceiver<Snapshot> rx_;
  core::SignalSender trigger_;
  std::jthread worker_;
};

} // namespace usbwatch::monitor
