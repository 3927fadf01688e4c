#include <scs/transfer/transfer-file.hxx>

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

using namespace std;

namespace scs
{
  [[noreturn]] static void
  throw_errno (const string& what, const fs::path& p)
  {
    throw system_error (errno, generic_category (), what + ' ' + p.string ());
  }

  positional_file::
  positional_file (const fs::path& p, file_mode m)
    : path_ (p)
  {
    int flags (0);

    switch (m)
    {
    case file_mode::read:       flags = O_RDONLY; break;
    case file_mode::write:      flags = O_WRONLY | O_CREAT | O_TRUNC; break;
    case file_mode::read_write: flags = O_RDWR | O_CREAT | O_TRUNC; break;
    }

    fd_ = ::open (p.c_str (), flags | O_CLOEXEC, 0644);

    if (fd_ == -1)
      throw_errno ("unable to open", p);
  }

  positional_file::
  ~positional_file ()
  {
    ::close (fd_);
  }

  void positional_file::
  write_at (const char* d, size_t n, uint64_t o)
  {
    while (n != 0)
    {
      ssize_t r (::pwrite (fd_, d, n, static_cast<off_t> (o)));

      if (r == -1)
      {
        if (errno == EINTR)
          continue;

        throw_errno ("unable to write", path_);
      }

      d += r;
      n -= static_cast<size_t> (r);
      o += static_cast<uint64_t> (r);
    }
  }

  size_t positional_file::
  read_at (char* d, size_t n, uint64_t o)
  {
    size_t t (0);

    while (t != n)
    {
      ssize_t r (::pread (fd_, d + t, n - t, static_cast<off_t> (o + t)));

      if (r == -1)
      {
        if (errno == EINTR)
          continue;

        throw_errno ("unable to read", path_);
      }

      if (r == 0)
        break;

      t += static_cast<size_t> (r);
    }

    return t;
  }

  uint64_t positional_file::
  size () const
  {
    struct stat s;

    if (::fstat (fd_, &s) == -1)
      throw_errno ("unable to stat", path_);

    return static_cast<uint64_t> (s.st_size);
  }

  void memory_file::
  write_at (const char* d, size_t n, uint64_t o)
  {
    lock_guard<mutex> l (mutex_);

    if (data_.size () < o + n)
      data_.resize (static_cast<size_t> (o + n));

    data_.replace (static_cast<size_t> (o), n, d, n);
  }

  size_t memory_file::
  read_at (char* d, size_t n, uint64_t o)
  {
    lock_guard<mutex> l (mutex_);

    if (o >= data_.size ())
      return 0;

    return data_.copy (d, n, static_cast<size_t> (o));
  }

  uint64_t memory_file::
  size () const
  {
    lock_guard<mutex> l (mutex_);
    return data_.size ();
  }

  string memory_file::
  data () const
  {
    lock_guard<mutex> l (mutex_);
    return data_;
  }
}
