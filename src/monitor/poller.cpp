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

#include "monitor/poller.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace usbwatch::monitor {

Poller::Poller(BuildFn build, std::chrono::milliseconds idle_timeout) : idle_(idle_timeout) {
  auto [tx, rx] = core::make_mailbox<Snapshot>();
  auto [sig_tx, sig_rx] = core::make_signal();
  rx_ = std::move(rx);
  trigger_ = std::move(sig_tx);

  worker_ = std::jthread(&Poller::worker_loop_, std::move(build), idle_, std::move(tx), std::move(sig_rx));
}

Poller::~Poller() { stop(); }

void Poller::refresh() {
  if (!trigger_.notify()) spdlog::debug("Poller: refresh requested after worker exit");
}

std::optional<Snapshot> Poller::try_latest() { return rx_.try_recv(); }

std::optional<Snapshot> Poller::wait_next(std::chrono::milliseconds timeout) { return rx_.recv_for(timeout); }

void Poller::stop() noexcept {
  worker_.request_stop();
  trigger_.close();
  rx_.close();
  if (worker_.joinable()) worker_.join();
}

void Poller::worker_loop_(std::stop_token st, BuildFn build, std::chrono::milliseconds idle,
                          core::MailboxSender<Snapshot> tx, core::SignalReceiver trigger) noexcept {
  std::uint64_t seq = 0;

  for (;;) {
    if (trigger.wait_for(idle) == core::SignalReceiver::Wait::Closed) break;
    if (st.stop_requested()) break;

    Snapshot snap;
    try {
      snap = build();
    } catch (const std::exception& e) {
      spdlog::warn("Snapshot build failed: {}", e.what());
      snap = Snapshot{};
    } catch (...) {
      spdlog::warn("Snapshot build failed: unknown exception");
      snap = Snapshot{};
    }
    snap.sequence = ++seq;

    if (!tx.send(std::move(snap))) break;
  }

  spdlog::debug("Poller: worker exiting after {} snapshot(s)", seq);
}

} // namespace usbwatch::monitor
