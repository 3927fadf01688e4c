#pragma once

#include <atomic>
#include <cstdint>

namespace scs
{
  enum class progress_state
  {
    idle,
    active,
    completed,
    aborted
  };

  enum class progress_style
  {
    compact,  // [=====>      ]  45% 10.0 MiB/s 00m05s
    percent,  // 45%
    detailed  // Bar, byte counts, speed and ETA.
  };

  // Lock-free transfer counters, updated from any worker.
  //
  struct progress_metrics
  {
    std::atomic<std::uint64_t> total_bytes {0};
    std::atomic<std::uint64_t> current_bytes {0};
    std::atomic<progress_state> state {progress_state::idle};
  };

  // Point-in-time copy of progress_metrics plus the current speed, for
  // rendering.
  //
  struct progress_snapshot
  {
    std::uint64_t total_bytes = 0;
    std::uint64_t current_bytes = 0;
    float speed = 0.0f;
    progress_state state = progress_state::idle;

    progress_snapshot () = default;

    progress_snapshot (const progress_metrics& m, float s)
      : total_bytes (m.total_bytes.load (std::memory_order_relaxed)),
        current_bytes (m.current_bytes.load (std::memory_order_relaxed)),
        speed (s),
        state (m.state.load (std::memory_order_relaxed))
    {
    }

    float
    progress_ratio () const noexcept
    {
      if (total_bytes == 0)
        return 0.0f;

      return static_cast<float> (current_bytes) /
             static_cast<float> (total_bytes);
    }

    // Seconds remaining at the current speed, 0 if unknown.
    //
    int
    eta_seconds () const noexcept
    {
      if (speed <= 0.0f || total_bytes <= current_bytes)
        return 0;

      return static_cast<int> ((total_bytes - current_bytes) / speed);
    }
  };
}
