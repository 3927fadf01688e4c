#include <scs/transfer/transfer-part.hxx>

using namespace std;

namespace scs
{
  void part_writer::
  operator() (const char* d, size_t n)
  {
    part_descriptor& p (*part_);

    if (n > p.remaining ())
      throw error (errc::malformed_value,
                   "received more than the " + std::to_string (p.size ()) +
                   " bytes requested for range " + std::to_string (p.start) +
                   '-' + std::to_string (p.end));

    sink_->write_at (d, n, p.start + p.cursor);
    p.cursor += n;
  }
}
