#include <scs/transfer/transfer-engine.hxx>

#include <atomic>
#include <utility>
#include <algorithm>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

using namespace std;

namespace scs
{
  asio::awaitable<void> transfer_engine::
  run (vector<part_descriptor>& parts,
       size_t workers,
       part_function transfer,
       progress_reporter& progress) const
  {
    using namespace asio::experimental;

    if (parts.empty ())
      co_return;

    workers = clamp<size_t> (workers, 1, parts.size ());

    asio::any_io_executor ex (co_await asio::this_coro::executor);

    atomic<size_t> next (0);
    atomic<bool> failed (false);

    auto worker = [&] () -> asio::awaitable<void>
    {
      while (!failed.load ())
      {
        size_t i (next.fetch_add (1));
        if (i >= parts.size ())
          break;

        part_descriptor& p (parts[i]);
        uint64_t n (0);

        try
        {
          n = co_await transfer (p);
        }
        catch (...)
        {
          if (!failed.exchange (true))
            progress.abort (true);

          throw;
        }

        progress.increment (n);
      }
    };

    log (log_, "transferring " + std::to_string (parts.size ()) +
         " parts with " + std::to_string (workers) + " workers");

    using op_type = decltype (asio::co_spawn (ex, worker (), asio::deferred));

    vector<op_type> ops;
    ops.reserve (workers);

    for (size_t i (0); i != workers; ++i)
      ops.push_back (asio::co_spawn (ex, worker (), asio::deferred));

    // Wait for every worker, failed or not, so nothing still references the
    // parts when we return. The first exception to complete wins.
    //
    auto [ord, exs] =
      co_await make_parallel_group (std::move (ops)).async_wait (
        wait_for_all (), asio::use_awaitable);

    for (size_t i: ord)
    {
      if (exs[i])
        rethrow_exception (exs[i]);
    }
  }
}
