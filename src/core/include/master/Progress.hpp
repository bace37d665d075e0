#pragma once
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <unistd.h>

namespace disagg::master::prog {
// Task progress on stderr; redraws only on a TTY and only when the percentage changes.
struct Bar {
  const char* label = "tasks";
  long total = 1;
  long done = 0;
  std::chrono::steady_clock::time_point t0{};
  bool enabled = false;
  int last_pct = -1;

  void start(long n, bool on_this_rank, const char* what = "tasks") {
    label = what;
    total = std::max(1L, n);
    done = 0;
    t0 = std::chrono::steady_clock::now();
    enabled = on_this_rank && ::isatty(::fileno(stderr));
    last_pct = -1;
  }
  void tick(long n = 1) {
    done += n;
    if (!enabled) return;
    const int pct = int((100.0 * double(done)) / double(total));
    if (pct == last_pct) return;
    last_pct = pct;
    const double dt = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    const double eta = pct > 0 ? dt * (100.0 / pct - 1.0) : 0.0;
    const int width = 40, fill = std::min(width, (pct * width) / 100);
    std::fprintf(stderr, "\r%s [", label);
    for (int i = 0; i < width; i++) std::fputc(i < fill ? '=' : ' ', stderr);
    std::fprintf(stderr, "] %3d%% %ld/%ld  t=%.1fs  ETA=%.1fs", pct, done, total, dt, eta);
    std::fflush(stderr);
  }
  void finish() {
    if (!enabled) return;
    std::fprintf(stderr, "\n");
    std::fflush(stderr);
  }
};
} // namespace disagg::master::prog
