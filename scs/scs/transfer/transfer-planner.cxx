#include <scs/transfer/transfer-planner.hxx>

#include <algorithm>

#include <scs/scs-error.hxx>

using namespace std;

namespace scs
{
  part_plan
  plan_parts (int64_t size, const transfer_spec& spec)
  {
    if (size <= 0)
      throw error (errc::invalid_size,
                   "invalid size " + std::to_string (size));

    if (spec.part_size <= 0)
      throw error (errc::invalid_part_size,
                   "invalid part size " + std::to_string (spec.part_size));

    uint64_t n (static_cast<uint64_t> (size));
    uint64_t ps (static_cast<uint64_t> (spec.part_size));
    uint64_t count (1 + (n - 1) / ps);

    part_plan r;
    r.size = n;
    r.part_size = ps;
    r.concurrency = static_cast<size_t> (
      min<uint64_t> (max<size_t> (spec.concurrency, 1), count));

    r.parts.reserve (static_cast<size_t> (count));

    for (uint64_t i (0); i != count; ++i)
    {
      part_descriptor p;
      p.start = i * ps;
      p.end = p.start + min (ps, n - p.start) - 1;
      r.parts.push_back (p);
    }

    return r;
  }

  string
  to_string (const part_plan& p)
  {
    return "size: " + std::to_string (p.size) +
           ", parts: " + std::to_string (p.parts.size ()) +
           ", streams: " + std::to_string (p.concurrency) +
           ", partsize: " + std::to_string (p.part_size);
  }
}
