#include <cmath>
#include <algorithm>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace scs
{
  inline std::uint64_t
  steady_time_us () noexcept
  {
    using namespace std::chrono;

    return static_cast<std::uint64_t> (
      duration_cast<microseconds> (
        steady_clock::now ().time_since_epoch ()).count ());
  }

  // Scale n to the largest IEC unit that keeps it at or above 1.
  //
  template <typename S>
  inline S
  format_iec (double n, const char* suffix, int unit_precision)
  {
    static const char* const units[] = {"B", "KiB", "MiB", "GiB", "TiB"};

    std::size_t u (0);
    for (; n >= 1024.0 && u != 4; ++u)
      n /= 1024.0;

    std::ostringstream o;
    o << std::fixed << std::setprecision (u == 0 ? 0 : unit_precision)
      << n << ' ' << units[u] << suffix;

    return o.str ();
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bytes (std::uint64_t n)
  {
    return format_iec<S> (static_cast<double> (n), "", 1);
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_speed (float bps)
  {
    return format_iec<S> (bps, "/s", 1);
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_duration (int s)
  {
    std::ostringstream o;
    o << std::setfill ('0');

    if (int h = s / 3600; h > 0)
      o << h << 'h' << std::setw (2) << (s % 3600) / 60 << 'm';
    else
      o << std::setw (2) << s / 60 << 'm';

    o << std::setw (2) << s % 60 << 's';
    return o.str ();
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bar (float p, bool ind, int w)
  {
    S r ("[");

    if (ind)
    {
      r += "<=>";
      r.append (w > 3 ? w - 3 : 0, ' ');
    }
    else
    {
      int f (static_cast<int> (std::lround (std::clamp (p, 0.0f, 1.0f) * w)));

      for (int i (0); i != w; ++i)
        r += i < f - 1 ? '=' : i == f - 1 ? '>' : ' ';
    }

    r += ']';
    return r;
  }

  template <typename T>
  void basic_progress_tracker<T>::
  update (std::uint64_t n) noexcept
  {
    std::uint64_t t (steady_time_us ());
    std::uint64_t t0 (last_time_us_.load (std::memory_order_relaxed));
    std::uint64_t dt (t - t0);

    if (t0 == 0)
    {
      last_bytes_.store (n, std::memory_order_relaxed);
      last_time_us_.store (t, std::memory_order_relaxed);
      return;
    }

    if (dt < traits_type::min_update_interval_ms * 1000ULL)
      return;

    std::uint64_t n0 (last_bytes_.load (std::memory_order_relaxed));

    float inst (static_cast<float> (n > n0 ? n - n0 : 0) /
                (static_cast<float> (dt) / 1000000.0f));

    float s0 (speed_.load (std::memory_order_relaxed));
    float s (s0 == 0.0f
             ? inst
             : traits_type::ewma_alpha * inst +
               (1.0f - traits_type::ewma_alpha) * s0);

    last_bytes_.store (n, std::memory_order_relaxed);
    last_time_us_.store (t, std::memory_order_relaxed);
    speed_.store (s, std::memory_order_relaxed);
  }

  template <typename T>
  void basic_progress_tracker<T>::
  reset () noexcept
  {
    last_bytes_.store (0, std::memory_order_relaxed);
    last_time_us_.store (0, std::memory_order_relaxed);
    speed_.store (0.0f, std::memory_order_relaxed);
  }

  template <typename T>
  typename T::string_type basic_progress_formatter<T>::
  format (const progress_snapshot& s, int w) const
  {
    std::ostringstream o;

    bool ind (s.total_bytes == 0);
    int pct (static_cast<int> (s.progress_ratio () * 100));
    int eta (s.eta_seconds ());

    switch (style_)
    {
    case progress_style::percent:
      {
        o << pct << '%';
        break;
      }
    case progress_style::detailed:
      {
        o << traits_type::format_bar (s.progress_ratio (), ind, w)
          << ' ' << std::setw (3) << pct << "% "
          << traits_type::format_bytes (s.current_bytes) << " / "
          << traits_type::format_bytes (s.total_bytes) << " @ "
          << traits_type::format_speed (s.speed);

        if (eta > 0)
          o << " ETA " << traits_type::format_duration (eta);

        break;
      }
    case progress_style::compact:
      {
        o << traits_type::format_bar (s.progress_ratio (), ind, w)
          << ' ' << std::setw (3) << pct << "% "
          << std::setw (11) << std::left
          << traits_type::format_speed (s.speed);

        if (eta > 0)
          o << ' ' << traits_type::format_duration (eta);

        break;
      }
    }

    return o.str ();
  }
}
