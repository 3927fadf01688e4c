#pragma once

#include <mutex>
#include <atomic>
#include <string>
#include <cstdint>
#include <iosfwd>
#include <functional>

#include <scs/progress/progress-types.hxx>
#include <scs/progress/progress-tracker.hxx>

namespace scs
{
  // Fills the buffer with up to n bytes and returns the count, 0 at end.
  //
  using read_function = std::function<std::size_t (char*, std::size_t)>;

  // Receives byte counts from a transfer. increment() may be called from
  // any worker concurrently.
  //
  class progress_reporter
  {
  public:
    virtual
    ~progress_reporter () = default;

    virtual void
    init (std::uint64_t total) = 0;

    virtual void
    increment (std::uint64_t n) = 0;

    // Stop reporting after a failure. If drop is true the display is
    // removed rather than left at its last value.
    //
    virtual void
    abort (bool drop) = 0;

    // Called once the transfer is over, successful or not.
    //
    virtual void
    wait () = 0;

    // Return a reader that credits every byte read through it.
    //
    read_function
    wrap (read_function);
  };

  class null_progress_reporter: public progress_reporter
  {
  public:
    void init (std::uint64_t) override {}
    void increment (std::uint64_t) override {}
    void abort (bool) override {}
    void wait () override {}
  };

  // Single self-overwriting progress line on a terminal stream.
  //
  class console_progress_reporter: public progress_reporter
  {
  public:
    explicit
    console_progress_reporter (std::ostream&,
                               std::string label = std::string (),
                               progress_style = progress_style::compact);

    void
    init (std::uint64_t) override;

    void
    increment (std::uint64_t) override;

    void
    abort (bool) override;

    void
    wait () override;

    progress_snapshot
    snapshot () const
    {
      return progress_snapshot (metrics_, tracker_.speed ());
    }

  private:
    void
    render (bool force);

  private:
    std::ostream& os_;
    std::string label_;
    progress_formatter formatter_;
    progress_metrics metrics_;
    progress_tracker tracker_;

    std::mutex render_mutex_;
    std::atomic<std::uint64_t> last_render_us_ {0};
    std::size_t last_width_ = 0;
  };

  // Strategy driven by the single-stream upload: it is handed the body
  // reader up front, supplies the reader the transport actually pulls from,
  // and is told when the transfer is over.
  //
  class upload_callback
  {
  public:
    virtual
    ~upload_callback () = default;

    virtual void
    init_upload (std::uint64_t total, read_function source) = 0;

    virtual read_function
    reader () = 0;

    virtual void
    finish () = 0;
  };

  // Upload callback that credits the transferred bytes to a reporter.
  //
  class progress_upload_callback: public upload_callback
  {
  public:
    explicit
    progress_upload_callback (progress_reporter& r): reporter_ (r) {}

    void
    init_upload (std::uint64_t total, read_function source) override
    {
      reporter_.init (total);
      reader_ = reporter_.wrap (std::move (source));
    }

    read_function
    reader () override
    {
      return reader_;
    }

    void
    finish () override
    {
      reporter_.wait ();
    }

  private:
    progress_reporter& reporter_;
    read_function reader_;
  };
}
