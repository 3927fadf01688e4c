#include <scs/transfer/transfer-engine.hxx>

#include <atomic>
#include <string>
#include <vector>
#include <cassert>
#include <algorithm>

#include <boost/asio.hpp>

#include <scs/scs-error.hxx>
#include <scs/http/http-client.test.hxx>
#include <scs/transfer/transfer-file.hxx>
#include <scs/transfer/transfer-part.hxx>
#include <scs/transfer/transfer-planner.hxx>

using namespace std;
using namespace scs;

namespace asio = boost::asio;

// Records what the engine reports.
//
class recording_reporter: public progress_reporter
{
public:
  void init (uint64_t t) override {total = t;}
  void increment (uint64_t n) override {done += n; ++increments;}
  void abort (bool d) override {aborted = true; dropped = d;}
  void wait () override {waited = true;}

  uint64_t total = 0;
  atomic<uint64_t> done {0};
  size_t increments = 0;
  bool aborted = false;
  bool dropped = false;
  bool waited = false;
};

// Part function copying from an in-memory source. It yields before and in
// the middle of each part so that the workers interleave.
//
static part_function
copier (const string& src, positional_sink& dst, atomic<size_t>& calls)
{
  return [&src, &dst, &calls] (part_descriptor& p)
    -> asio::awaitable<uint64_t>
  {
    ++calls;

    auto ex (co_await asio::this_coro::executor);
    co_await asio::post (ex, asio::use_awaitable);

    part_writer w (dst, p);

    while (!p.complete ())
    {
      uint64_t n (min<uint64_t> (2, p.remaining ()));
      w (src.data () + p.start + p.cursor, static_cast<size_t> (n));

      co_await asio::post (ex, asio::use_awaitable);
    }

    co_return p.size ();
  };
}

static string
make_source (size_t n)
{
  string r;
  for (size_t i (0); i != n; ++i)
    r += static_cast<char> ('a' + (i * 7 + i / 26) % 26);
  return r;
}

static void
transfer (const string& src, const transfer_spec& spec)
{
  part_plan p (plan_parts (static_cast<int64_t> (src.size ()), spec));

  memory_file dst;
  recording_reporter rep;
  atomic<size_t> calls (0);

  rep.init (p.size);
  run (transfer_engine ().run (p.parts,
                               p.concurrency,
                               copier (src, dst, calls),
                               rep));

  assert (dst.data () == src);
  assert (calls == p.parts.size ());
  assert (rep.done == src.size ());
  assert (rep.increments == p.parts.size ());
  assert (!rep.aborted);

  for (const part_descriptor& d: p.parts)
    assert (d.complete ());
}

// 30 bytes in parts of 3 with 10 workers.
//
static void
test_thirty ()
{
  transfer ("0123456789abcdefghijklmnopqrst", transfer_spec {10, 3});
}

// Reassembly is byte-exact whatever the plan.
//
static void
test_fidelity ()
{
  for (size_t n: {1, 2, 31, 100, 257})
  {
    string s (make_source (n));

    for (int64_t ps: {1, 3, 16, 300})
    {
      for (size_t c: {1, 2, 5, 64})
        transfer (s, transfer_spec {c, ps});
    }
  }

  // One byte per part, one worker and as many workers as bytes.
  //
  string s (make_source (31));
  transfer (s, transfer_spec {1, 1});
  transfer (s, transfer_spec {31, 1});
}

// The first failure aborts the progress display, stops the remaining
// parts from being claimed and is rethrown.
//
static void
test_failure ()
{
  string src (make_source (40));
  part_plan p (plan_parts (40, transfer_spec {1, 4}));

  memory_file dst;
  recording_reporter rep;
  size_t calls (0);

  part_function f (
    [&src, &dst, &calls] (part_descriptor& d) -> asio::awaitable<uint64_t>
    {
      if (++calls == 3)
        throw error (scs::errc::http_status, "part failed");

      part_writer w (dst, d);
      w (src.data () + d.start, static_cast<size_t> (d.size ()));
      co_return d.size ();
    });

  bool thrown (false);
  try
  {
    run (transfer_engine ().run (p.parts, 1, f, rep));
  }
  catch (const error& e)
  {
    assert (e.code () == scs::errc::http_status);
    thrown = true;
  }

  assert (thrown);
  assert (rep.aborted && rep.dropped);
  assert (calls == 3);
  assert (rep.done == 8);

  // Bytes already written stay where they are.
  //
  assert (dst.data () == src.substr (0, 8));
  assert (p.parts[3].cursor == 0);
}

// With several workers every one of them stops claiming parts.
//
static void
test_failure_parallel ()
{
  part_plan p (plan_parts (100, transfer_spec {4, 1}));

  recording_reporter rep;
  atomic<size_t> calls (0);

  part_function f (
    [&calls] (part_descriptor& d) -> asio::awaitable<uint64_t>
    {
      ++calls;

      auto ex (co_await asio::this_coro::executor);
      co_await asio::post (ex, asio::use_awaitable);

      if (d.start == 5)
        throw error (scs::errc::malformed_value, "bad part");

      d.cursor = d.size ();
      co_return d.size ();
    });

  bool thrown (false);
  try
  {
    run (transfer_engine ().run (p.parts, p.concurrency, f, rep));
  }
  catch (const error& e)
  {
    assert (e.code () == scs::errc::malformed_value);
    thrown = true;
  }

  assert (thrown);
  assert (rep.aborted);
  assert (calls < 100);
}

static void
test_empty ()
{
  vector<part_descriptor> ps;
  recording_reporter rep;
  atomic<size_t> calls (0);
  memory_file dst;

  run (transfer_engine ().run (ps, 4, copier ("", dst, calls), rep));
  assert (calls == 0);
}

int
main ()
{
  test_thirty ();
  test_fidelity ();
  test_failure ();
  test_failure_parallel ();
  test_empty ();
}
