#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include <boost/asio.hpp>

#include <scs/http/http-client.hxx>
#include <scs/library/library-types.hxx>
#include <scs/library/library-client.hxx>
#include <scs/library/library-metadata.hxx>
#include <scs/transfer/transfer-file.hxx>
#include <scs/progress/progress-reporter.hxx>

namespace scs
{
  namespace asio = boost::asio;
  namespace fs   = std::filesystem;

  // Library client over the Beast HTTP client.
  //
  class client
  {
  public:
    using library_type  = basic_library_client<http_client>;
    using metadata_type = basic_library_metadata_client<http_client>;

    client (asio::io_context&, client_config);

    client (const client&) = delete;
    client& operator= (const client&) = delete;

    // Pull name:tag into dst.
    //
    asio::awaitable<void>
    pull (const std::string& name,
          const std::string& tag,
          const std::string& arch,
          positional_store& dst,
          progress_reporter& progress);

    // Pull a reference of the form [library://]name[:tag] into a file,
    // creating or truncating it. The tag defaults to latest.
    //
    asio::awaitable<void>
    pull (const std::string& ref,
          const fs::path& file,
          const std::string& arch,
          progress_reporter& progress);

    asio::awaitable<void>
    push (positional_source& src,
          const std::string& name,
          const std::vector<std::string>& tags,
          const std::string& description,
          upload_callback* callback = nullptr,
          const std::string& arch = std::string ());

    // Push a file as [library://]entity/collection/container[:tags].
    //
    asio::awaitable<void>
    push (const fs::path& file,
          const std::string& ref,
          const std::string& description,
          progress_reporter& progress);

    library_metadata&
    metadata () noexcept
    {
      return metadata_;
    }

  private:
    http_client http_;
    metadata_type metadata_;
    library_type library_;
  };
}
