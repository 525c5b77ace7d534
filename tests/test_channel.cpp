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

#include "core/channel.hpp"
#include "monitor/poller.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>

using namespace usbwatch;
using namespace std::chrono_literals;

static int g_pass = 0;
static int g_fail = 0;

template <class T, class U>
static void check_eq(const char* label, const T& got, const U& expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static void check(const char* label, bool ok) { check_eq(label, ok, true); }

// ----- mailbox -----

static void test_mailbox_keeps_latest() {
  auto [tx, rx] = core::make_mailbox<int>();
  check("send_1", tx.send(1));
  check("send_2", tx.send(2));
  check("send_3", tx.send(3));

  const auto v = rx.try_recv();
  check("latest_present", v.has_value());
  if (v) check_eq("latest_value", *v, 3);
  check_eq("dropped", rx.dropped(), std::uint64_t{2});
  check("drained", !rx.try_recv().has_value());
}

static void test_mailbox_timeout() {
  auto [tx, rx] = core::make_mailbox<int>();
  const auto t0 = std::chrono::steady_clock::now();
  check("timeout_empty", !rx.recv_for(30ms).has_value());
  check("timeout_waited", std::chrono::steady_clock::now() - t0 >= 25ms);
  check("timeout_still_connected", rx.connected());
}

static void test_mailbox_receiver_closed() {
  auto [tx, rx] = core::make_mailbox<std::string>();
  rx.close();
  check("send_after_rx_close", !tx.send("x"));
}

static void test_mailbox_sender_closed() {
  auto [tx, rx] = core::make_mailbox<int>();
  tx.send(7);
  tx.close();
  check("pending_after_close_connected", rx.connected());
  const auto v = rx.recv_for(1s);
  check("pending_after_close_delivered", v == std::optional<int>(7));
  check("disconnected", !rx.connected());

  const auto t0 = std::chrono::steady_clock::now();
  check("closed_recv_empty", !rx.recv_for(5s).has_value());
  check("closed_recv_immediate", std::chrono::steady_clock::now() - t0 < 1s);
}

static void test_mailbox_cross_thread() {
  auto [tx, rx] = core::make_mailbox<int>();
  std::jthread producer([t = std::move(tx)]() mutable {
    std::this_thread::sleep_for(20ms);
    t.send(42);
  });
  const auto v = rx.recv_for(5s);
  check("cross_thread_value", v == std::optional<int>(42));
}

// ----- signal -----

static void test_signal() {
  using W = core::SignalReceiver::Wait;
  auto [tx, rx] = core::make_signal();

  check("notify_1", tx.notify());
  check("notify_2", tx.notify());
  check("signalled_1", rx.wait_for(0ms) == W::Signalled);
  check("signalled_2", rx.wait_for(0ms) == W::Signalled);
  check("timeout", rx.wait_for(10ms) == W::Timeout);

  tx.notify();
  tx.close();
  check("pending_before_closed", rx.wait_for(0ms) == W::Signalled);
  check("closed", rx.wait_for(1s) == W::Closed);

  auto [tx2, rx2] = core::make_signal();
  rx2.close();
  check("notify_after_rx_close", !tx2.notify());

  core::SignalReceiver unbound;
  check("unbound_closed", unbound.wait_for(0ms) == W::Closed);
}

// ----- poller -----

static monitor::Snapshot one_device() {
  monitor::Snapshot s;
  monitor::Device d;
  d.bus = "001";
  d.address = "002";
  s.devices.push_back(d);
  return s;
}

static void test_poller_refresh() {
  std::atomic<int> builds{0};
  monitor::Poller p([&] { ++builds; return one_device(); }, 5000ms);

  p.refresh();
  const auto a = p.wait_next(5s);
  check("refresh_first", a.has_value());
  if (a) {
    check_eq("refresh_first_seq", a->sequence, std::uint64_t{1});
    check_eq("refresh_first_devices", a->devices.size(), std::size_t{1});
  }

  p.refresh();
  const auto b = p.wait_next(5s);
  check("refresh_second", b.has_value());
  if (b) check_eq("refresh_second_seq", b->sequence, std::uint64_t{2});

  check("no_extra_snapshot", !p.try_latest().has_value());

  p.stop();
  p.stop();
  p.refresh();
  check("nothing_after_stop", !p.try_latest().has_value());
  check_eq("build_count", builds.load(), 2);
}

static void test_poller_idle() {
  monitor::Poller p([] { return one_device(); }, 20ms);
  check_eq("idle_timeout", p.idle_timeout().count(), 20);
  const auto s = p.wait_next(5s);
  check("idle_snapshot", s.has_value());
}

static void test_poller_build_throws() {
  monitor::Poller p([]() -> monitor::Snapshot { throw std::runtime_error("boom"); }, 5000ms);
  p.refresh();
  const auto s = p.wait_next(5s);
  check("throw_published", s.has_value());
  if (s) {
    check("throw_empty", s->devices.empty());
    check_eq("throw_seq", s->sequence, std::uint64_t{1});
  }
}

static void test_poller_build_throws_non_exception() {
  std::atomic<int> calls{0};
  monitor::Poller p([&]() -> monitor::Snapshot {
    if (++calls == 1) throw 42;
    return one_device();
  }, 5000ms);

  p.refresh();
  const auto a = p.wait_next(5s);
  check("non_exception_published", a.has_value());
  if (a) check("non_exception_empty", a->devices.empty());

  // The worker survives and keeps serving refreshes.
  p.refresh();
  const auto b = p.wait_next(5s);
  check("non_exception_worker_alive", b.has_value());
  if (b) {
    check_eq("non_exception_next_devices", b->devices.size(), std::size_t{1});
    check_eq("non_exception_next_seq", b->sequence, std::uint64_t{2});
  }
}

static void test_poller_shutdown_during_build() {
  std::atomic<bool> started{false};
  const auto t0 = std::chrono::steady_clock::now();
  {
    monitor::Poller p([&] {
      started = true;
      std::this_thread::sleep_for(50ms);
      return one_device();
    }, 5000ms);
    p.refresh();
    for (int i = 0; i < 200 && !started; ++i) std::this_thread::sleep_for(1ms);
  }
  check("shutdown_joined", std::chrono::steady_clock::now() - t0 < 5s);
  check("shutdown_build_ran", started.load());
}

int main() {
  test_mailbox_keeps_latest();
  test_mailbox_timeout();
  test_mailbox_receiver_closed();
  test_mailbox_sender_closed();
  test_mailbox_cross_thread();
  test_signal();
  test_poller_refresh();
  test_poller_idle();
  test_poller_build_throws();
  test_poller_build_throws_non_exception();
  test_poller_shutdown_during_build();

  std::fprintf(stdout, "channel: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
