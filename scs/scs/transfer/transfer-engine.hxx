#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>
#include <functional>

#include <boost/asio.hpp>

#include <scs/scs-log.hxx>
#include <scs/transfer/transfer-types.hxx>
#include <scs/progress/progress-reporter.hxx>

namespace scs
{
  namespace asio = boost::asio;

  // Moves one part and returns the number of bytes it moved. Advances the
  // part's cursor as data is written.
  //
  using part_function =
    std::function<asio::awaitable<std::uint64_t> (part_descriptor&)>;

  // Runs a fixed pool of workers over a list of parts.
  //
  // Each worker repeatedly claims the next unclaimed part and runs the part
  // function on it, crediting the moved bytes to the progress reporter when
  // the part completes. The first failure stops further parts from being
  // claimed (parts already in flight are allowed to finish), aborts the
  // progress display, and is rethrown once all workers have returned.
  //
  // Workers are coroutines on the calling coroutine's executor. Running the
  // io_context from several threads makes them run in parallel, so the
  // part function must be safe to call concurrently for distinct parts.
  //
  class transfer_engine
  {
  public:
    explicit
    transfer_engine (log_function log = nullptr): log_ (std::move (log)) {}

    asio::awaitable<void>
    run (std::vector<part_descriptor>& parts,
         std::size_t workers,
         part_function transfer,
         progress_reporter& progress) const;

  private:
    log_function log_;
  };
}
