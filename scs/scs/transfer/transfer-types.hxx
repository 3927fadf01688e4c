#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>
#include <ostream>

namespace scs
{
  // How a transfer is split up.
  //
  struct transfer_spec
  {
    // Maximum number of parts in flight. 0 is treated as 1.
    //
    std::size_t concurrency = 4;

    // Size of each part except possibly the last. Must be positive.
    //
    std::int64_t part_size = 5 * 1024 * 1024;
  };

  // Inclusive byte range [start, end] of the transfer plus the number of
  // bytes of it already written. The cursor only ever grows, up to size().
  //
  struct part_descriptor
  {
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    std::uint64_t cursor = 0;

    std::uint64_t
    size () const noexcept
    {
      return end - start + 1;
    }

    std::uint64_t
    remaining () const noexcept
    {
      return size () - cursor;
    }

    bool
    complete () const noexcept
    {
      return cursor == size ();
    }
  };

  inline std::ostream&
  operator<< (std::ostream& o, const part_descriptor& p)
  {
    return o << p.start << '-' << p.end << " (" << p.cursor << ')';
  }

  struct part_plan
  {
    std::uint64_t size = 0;
    std::uint64_t part_size = 0;

    // Effective worker count, never more than the number of parts.
    //
    std::size_t concurrency = 1;

    std::vector<part_descriptor> parts;
  };
}
