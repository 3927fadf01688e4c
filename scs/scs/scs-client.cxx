#include <scs/scs-client.hxx>

#include <utility>

using namespace std;

namespace scs
{
  // The library and registry code count and follow redirects themselves.
  //
  static http_client_traits<>
  client_traits (http_client_traits<> t)
  {
    t.follow_redirects = false;
    return t;
  }

  static string
  strip_scheme (const string& r)
  {
    if (r.compare (0, 10, "library://") == 0)
      return r.substr (10);

    if (r.compare (0, 8, "library:") == 0)
      return r.substr (8);

    return r;
  }

  client::
  client (asio::io_context& ioc, client_config cfg)
    : http_ (ioc, client_traits (cfg.http)),
      metadata_ (http_,
                 cfg.base_url,
                 cfg.auth_token.empty ()
                 ? credentials_ptr ()
                 : make_shared<bearer_credentials> (cfg.auth_token),
                 cfg.log),
      library_ (http_, move (cfg))
  {
  }

  asio::awaitable<void> client::
  pull (const string& name,
        const string& tag,
        const string& arch,
        positional_store& dst,
        progress_reporter& progress)
  {
    co_await library_.pull (name, tag, arch, dst, progress);
  }

  asio::awaitable<void> client::
  pull (const string& ref,
        const fs::path& file,
        const string& arch,
        progress_reporter& progress)
  {
    auto [name, tags] (split_tags (strip_scheme (ref)));

    string n (name);
    if (!n.empty () && n.front () == '/')
      n.erase (0, 1);

    positional_file f (file, file_mode::read_write);
    co_await library_.pull (n, tags.front (), arch, f, progress);
  }

  asio::awaitable<void> client::
  push (positional_source& src,
        const string& name,
        const vector<string>& tags,
        const string& description,
        upload_callback* callback,
        const string& arch)
  {
    co_await library_.push (src,
                            name,
                            tags,
                            description,
                            metadata_,
                            callback,
                            arch);
  }

  asio::awaitable<void> client::
  push (const fs::path& file,
        const string& ref,
        const string& description,
        progress_reporter& progress)
  {
    auto [name, tags] (split_tags (strip_scheme (ref)));

    positional_file f (file, file_mode::read);
    progress_upload_callback cb (progress);

    co_await library_.push (f, name, tags, description, metadata_, &cb);
  }
}
