#include <scs/progress/progress-reporter.hxx>

#include <ostream>

using namespace std;

namespace scs
{
  read_function progress_reporter::
  wrap (read_function r)
  {
    return [this, r = move (r)] (char* d, size_t n)
    {
      size_t c (r (d, n));

      if (c != 0)
        increment (c);

      return c;
    };
  }

  // Redraw at most this often unless forced.
  //
  static const uint64_t render_interval_us (100000);

  console_progress_reporter::
  console_progress_reporter (ostream& os, string l, progress_style s)
    : os_ (os), label_ (move (l)), formatter_ (s)
  {
  }

  void console_progress_reporter::
  init (uint64_t total)
  {
    metrics_.total_bytes.store (total, memory_order_relaxed);
    metrics_.current_bytes.store (0, memory_order_relaxed);
    metrics_.state.store (progress_state::active, memory_order_relaxed);
    tracker_.reset ();
    render (true);
  }

  void console_progress_reporter::
  increment (uint64_t n)
  {
    uint64_t c (metrics_.current_bytes.fetch_add (n, memory_order_relaxed) + n);
    tracker_.update (c);
    render (false);
  }

  void console_progress_reporter::
  abort (bool drop)
  {
    metrics_.state.store (progress_state::aborted, memory_order_relaxed);

    lock_guard<mutex> l (render_mutex_);

    if (drop)
    {
      os_ << '\r' << string (last_width_, ' ') << '\r' << flush;
      last_width_ = 0;
    }
  }

  void console_progress_reporter::
  wait ()
  {
    progress_state s (metrics_.state.load (memory_order_relaxed));

    if (s == progress_state::active)
    {
      metrics_.state.store (progress_state::completed, memory_order_relaxed);
      render (true);
    }

    lock_guard<mutex> l (render_mutex_);

    if (last_width_ != 0)
    {
      os_ << endl;
      last_width_ = 0;
    }
  }

  void console_progress_reporter::
  render (bool force)
  {
    if (metrics_.state.load (memory_order_relaxed) == progress_state::aborted)
      return;

    uint64_t t (steady_time_us ());

    if (!force &&
        t - last_render_us_.load (memory_order_relaxed) < render_interval_us)
      return;

    // Another worker is drawing; skip rather than queue up.
    //
    unique_lock<mutex> l (render_mutex_, try_to_lock);
    if (!l.owns_lock ())
    {
      if (!force)
        return;

      l.lock ();
    }

    last_render_us_.store (t, memory_order_relaxed);

    string line (label_.empty () ? string () : label_ + ' ');
    line += formatter_.format (snapshot ());

    os_ << '\r' << line;

    if (line.size () < last_width_)
      os_ << string (last_width_ - line.size (), ' ');

    os_ << flush;
    last_width_ = line.size ();
  }
}
