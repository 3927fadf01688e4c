#pragma once

#include <mutex>
#include <string>
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace scs
{
  namespace fs = std::filesystem;

  // Destination that accepts writes at arbitrary offsets. Writes to
  // non-overlapping ranges may be issued concurrently.
  //
  class positional_sink
  {
  public:
    virtual
    ~positional_sink () = default;

    virtual void
    write_at (const char* data, std::size_t size, std::uint64_t offset) = 0;
  };

  // Source that can be read at arbitrary offsets. A short count means end
  // of data.
  //
  class positional_source
  {
  public:
    virtual
    ~positional_source () = default;

    virtual std::size_t
    read_at (char* data, std::size_t size, std::uint64_t offset) = 0;

    virtual std::uint64_t
    size () const = 0;
  };

  // Both at once, such as a file being downloaded into and then read back
  // for verification.
  //
  class positional_store: public positional_sink, public positional_source
  {
  };

  enum class file_mode
  {
    read,       // Existing file, read only.
    write,      // Create or truncate.
    read_write  // Create or truncate, and read back.
  };

  // Regular file accessed with pread()/pwrite().
  //
  class positional_file: public positional_store
  {
  public:
    positional_file (const fs::path&, file_mode);
    ~positional_file () override;

    positional_file (const positional_file&) = delete;
    positional_file& operator= (const positional_file&) = delete;

    void
    write_at (const char*, std::size_t, std::uint64_t) override;

    std::size_t
    read_at (char*, std::size_t, std::uint64_t) override;

    std::uint64_t
    size () const override;

    const fs::path&
    path () const noexcept
    {
      return path_;
    }

  private:
    fs::path path_;
    int fd_;
  };

  // In-memory file that grows to cover the highest offset written.
  //
  class memory_file: public positional_store
  {
  public:
    memory_file () = default;

    explicit
    memory_file (std::string data): data_ (std::move (data)) {}

    void
    write_at (const char*, std::size_t, std::uint64_t) override;

    std::size_t
    read_at (char*, std::size_t, std::uint64_t) override;

    std::uint64_t
    size () const override;

    std::string
    data () const;

  private:
    mutable std::mutex mutex_;
    std::string data_;
  };

  // Sequential reader over a positional source, starting at offset 0.
  //
  class source_reader
  {
  public:
    explicit
    source_reader (positional_source& s): source_ (s) {}

    std::size_t
    operator() (char* data, std::size_t size)
    {
      std::size_t n (source_.read_at (data, size, offset_));
      offset_ += n;
      return n;
    }

    std::uint64_t
    offset () const noexcept
    {
      return offset_;
    }

  private:
    positional_source& source_;
    std::uint64_t offset_ = 0;
  };
}
