#include <scs/progress/progress-reporter.hxx>

#include <string>
#include <cassert>
#include <sstream>
#include <cstring>

#include <scs/progress/progress-tracker.hxx>

using namespace std;
using namespace scs;

using traits = progress_tracker_traits<>;

static void
test_format ()
{
  assert (traits::format_bytes (0) == "0 B");
  assert (traits::format_bytes (1023) == "1023 B");
  assert (traits::format_bytes (1536) == "1.5 KiB");
  assert (traits::format_bytes (5 * 1024 * 1024) == "5.0 MiB");
  assert (traits::format_speed (2048.0f) == "2.0 KiB/s");

  assert (traits::format_duration (5) == "00m05s");
  assert (traits::format_duration (65) == "01m05s");
  assert (traits::format_duration (3725) == "1h02m05s");

  assert (traits::format_bar (0.5f, false, 10) == "[====>     ]");
  assert (traits::format_bar (1.0f, false, 4) == "[===>]");
  assert (traits::format_bar (0.0f, false, 4) == "[    ]");
  assert (traits::format_bar (0.0f, true, 5) == "[<=>  ]");
}

static void
test_snapshot ()
{
  progress_metrics m;
  m.total_bytes = 200;
  m.current_bytes = 50;

  progress_snapshot s (m, 10.0f);
  assert (s.progress_ratio () == 0.25f);
  assert (s.eta_seconds () == 15);

  progress_formatter f (progress_style::percent);
  assert (f.format (s) == "25%");

  // Unknown total.
  //
  m.total_bytes = 0;
  progress_snapshot u (m, 0.0f);
  assert (u.progress_ratio () == 0.0f);
  assert (u.eta_seconds () == 0);
}

static void
test_console ()
{
  // Completion always draws the final state.
  //
  {
    ostringstream o;
    console_progress_reporter r (o, "alpine", progress_style::percent);

    r.init (100);
    r.increment (40);
    r.increment (60);

    assert (r.snapshot ().current_bytes == 100);

    r.wait ();

    string s (o.str ());
    assert (s.find ("alpine 100%") != string::npos);
    assert (s.back () == '\n');
  }

  // Dropping the line on abort blanks it out and ends the line without a
  // newline.
  //
  {
    ostringstream o;
    console_progress_reporter r (o, "", progress_style::percent);

    r.init (10);
    r.abort (true);

    string s (o.str ());
    assert (s.back () == '\r');
    assert (r.snapshot ().state == progress_state::aborted);

    r.increment (5);
    r.wait ();
    assert (o.str () == s);
  }
}

// Wrapped readers credit every byte they return.
//
static void
test_wrap ()
{
  ostringstream o;
  console_progress_reporter r (o);
  r.init (11);

  string src ("hello world");
  size_t pos (0);

  read_function rd (r.wrap ([&src, &pos] (char* d, size_t n)
  {
    size_t c (min (n, src.size () - pos));
    memcpy (d, src.data () + pos, c);
    pos += c;
    return c;
  }));

  char b[4];
  while (rd (b, sizeof (b)) != 0) ;

  assert (r.snapshot ().current_bytes == 11);
}

static void
test_upload_callback ()
{
  ostringstream o;
  console_progress_reporter r (o, "", progress_style::percent);
  progress_upload_callback cb (r);

  string src ("0123456789");
  size_t pos (0);

  cb.init_upload (src.size (), [&src, &pos] (char* d, size_t n)
  {
    size_t c (min (n, src.size () - pos));
    memcpy (d, src.data () + pos, c);
    pos += c;
    return c;
  });

  read_function rd (cb.reader ());

  char b[3];
  size_t t (0);
  for (size_t n; (n = rd (b, sizeof (b))) != 0; )
    t += n;

  cb.finish ();

  assert (t == 10);
  assert (r.snapshot ().current_bytes == 10);
  assert (r.snapshot ().state == progress_state::completed);
  assert (o.str ().find ("100%") != string::npos);
}

static void
test_null ()
{
  null_progress_reporter r;
  r.init (10);
  r.increment (10);
  r.abort (false);
  r.wait ();
}

int
main ()
{
  test_format ();
  test_snapshot ();
  test_console ();
  test_wrap ();
  test_upload_callback ();
  test_null ();
}
