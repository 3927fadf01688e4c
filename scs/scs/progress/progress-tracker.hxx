#pragma once

#include <atomic>
#include <string>
#include <cstdint>

#include <scs/progress/progress-types.hxx>

namespace scs
{
  template <typename S = std::string>
  struct progress_tracker_traits
  {
    using string_type = S;

    // EWMA weight of the newest sample. Low values keep the displayed speed
    // steady.
    //
    static constexpr float ewma_alpha = 0.2f;

    // Samples closer together than this are ignored.
    //
    static constexpr int min_update_interval_ms = 500;

    static string_type
    format_bytes (std::uint64_t);

    static string_type
    format_speed (float bytes_per_sec);

    static string_type
    format_duration (int seconds);

    // Bar of width cells for a ratio in [0, 1]. An unknown total renders an
    // indeterminate bar.
    //
    static string_type
    format_bar (float ratio, bool indeterminate, int width);
  };

  // Transfer speed estimate (bytes/sec), lock-free.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_progress_tracker () = default;

    basic_progress_tracker (const basic_progress_tracker&) = delete;
    basic_progress_tracker& operator= (const basic_progress_tracker&) = delete;

    // Feed the running byte total.
    //
    void
    update (std::uint64_t current_bytes) noexcept;

    float
    speed () const noexcept
    {
      return speed_.load (std::memory_order_relaxed);
    }

    void
    reset () noexcept;

  private:
    std::atomic<std::uint64_t> last_bytes_ {0};
    std::atomic<std::uint64_t> last_time_us_ {0};
    std::atomic<float> speed_ {0.0f};
  };

  template <typename T = progress_tracker_traits<>>
  class basic_progress_formatter
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    explicit
    basic_progress_formatter (progress_style s = progress_style::compact)
      : style_ (s) {}

    string_type
    format (const progress_snapshot&, int bar_width = 20) const;

    progress_style
    style () const noexcept
    {
      return style_;
    }

  private:
    progress_style style_;
  };

  using progress_tracker   = basic_progress_tracker<>;
  using progress_formatter = basic_progress_formatter<>;
}

#include <scs/progress/progress-tracker.txx>
