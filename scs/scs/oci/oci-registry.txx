#include <memory>
#include <vector>
#include <algorithm>
#include <functional>

#include <scs/scs-error.hxx>
#include <scs/http/http-url.hxx>
#include <scs/auth/auth-challenge.hxx>
#include <scs/transfer/transfer-part.hxx>

namespace scs
{
  template <typename C>
  std::string basic_oci_registry<C>::
  url (const std::string& path) const
  {
    return join_url (base_url_, path);
  }

  template <typename C>
  asio::awaitable<typename basic_oci_registry<C>::response_type>
  basic_oci_registry<C>::
  send (request_type& req, const body_callback* sink)
  {
    bool follow (req.method == http_method::get ||
                 req.method == http_method::head);

    request_type cur (req);

    for (std::uint8_t i (0);; ++i)
    {
      response_type r (sink != nullptr
                       ? co_await client_.stream (cur, *sink)
                       : co_await client_.request (cur));

      if (!follow || !r.is_redirection () || !r.location ())
        co_return r;

      if (i == traits_.max_redirects)
        throw error (errc::too_many_redirects,
                     "stopped after " +
                     std::to_string (traits_.max_redirects) + " redirects");

      std::string u (resolve_reference (cur.url, *r.location ()));

      // Blob storage answers with pre-signed URLs. Our token means nothing
      // there and some stores reject the request if it is present.
      //
      if (!same_origin (cur.url, u))
        cur.headers.remove ("Authorization");

      cur.url = std::move (u);
    }
  }

  template <typename C>
  asio::awaitable<typename basic_oci_registry<C>::response_type>
  basic_oci_registry<C>::
  do_request (request_type& req,
              const credentials_ptr& creds,
              const namespace_access& access,
              const rewind_function& rewind,
              const body_callback* sink)
  {
    bool had_body (req.body.has_value ());

    response_type r (co_await send (req, sink));

    if (r.is_success ())
      co_return r;

    if (r.status != http_status::unauthorized)
      throw http_status_error (r.status_code (), r.text ());

    log (log_, to_string (req.method) + ' ' + req.url + ": " +
         to_string (r.status) + ", retrying with credentials");

    // Some registries require an explicit "Authorization: none" even for
    // anonymous access.
    //
    credentials_ptr c (creds != nullptr
                       ? creds
                       : std::make_shared<none_credentials> ());

    auth_challenge ch (
      parse_auth_challenge (r.get_header ("WWW-Authenticate").value_or ("")));

    c = co_await auth_.negotiate (ch, c, access);

    if (had_body)
    {
      if (!rewind)
        throw error (errc::unable_to_reset_body,
                     "unable to reset HTTP request body");

      req.body = rewind ();
    }

    c->apply (req);

    r = co_await send (req, sink);

    if (!r.is_success ())
      throw http_status_error (errc::unauthorized,
                               r.status_code (),
                               "unauthorized: unexpected http status " +
                               std::to_string (r.status_code ()) +
                               " after authenticating to " + base_url_);

    co_return r;
  }

  template <typename C>
  asio::awaitable<std::pair<scs::digest, std::string>>
  basic_oci_registry<C>::
  download_manifest (const std::string& name,
                     const std::string& ref,
                     const std::string& mt)
  {
    request_type req (http_method::get,
                      url ("v2/" + name + "/manifests/" + ref));
    req.set_header ("Accept", mt);

    response_type r (
      co_await do_request (req,
                           credentials_,
                           namespace_access {name, {access_type::pull}}));

    // Registries are free to ignore Accept.
    //
    std::string ct (r.content_type ().value_or (""));

    if (ct != mt)
      throw content_type_error (errc::unexpected_content_type, ct, mt);

    std::optional<std::string> h (r.get_header ("Docker-Content-Digest"));

    if (!h)
      throw error (errc::invalid_digest,
                   "missing Docker-Content-Digest header for " + name + ':' +
                   ref);

    scs::digest d (scs::digest::parse (*h));

    std::string b (r.text ());

    if (scs::digest::valid (ref))
    {
      scs::digest e (scs::digest::parse (ref));
      verify_digest (e, scs::digest::of (b, e.algorithm ()));
    }

    co_return std::make_pair (std::move (d), std::move (b));
  }

  template <typename C>
  asio::awaitable<std::pair<scs::digest, oci_index>>
  basic_oci_registry<C>::
  download_index (const std::string& name, const std::string& ref)
  {
    auto [d, b] (co_await download_manifest (name, ref,
                                             media_type::image_index));
    co_return std::make_pair (std::move (d), parse_index (b));
  }

  template <typename C>
  asio::awaitable<std::pair<scs::digest, oci_manifest>>
  basic_oci_registry<C>::
  download_image_manifest (const std::string& name, const std::string& ref)
  {
    auto [d, b] (co_await download_manifest (name, ref,
                                             media_type::image_manifest));
    co_return std::make_pair (std::move (d), parse_manifest (b));
  }

  template <typename C>
  asio::awaitable<std::pair<scs::digest, oci_manifest>>
  basic_oci_registry<C>::
  image_manifest (const std::string& name,
                  const std::string& tag,
                  const std::string& arch)
  {
    std::optional<oci_index> idx;

    // Not every image is published with an index, so a failure here just
    // means the tag names the manifest directly.
    //
    try
    {
      idx = (co_await download_index (name, tag)).second;
    }
    catch (const error& e)
    {
      log (log_, "no image index for " + name + ':' + tag + ": " + e.what ());
    }

    std::string ref (idx ? manifest_from_index (*idx, arch).string () : tag);

    co_return co_await download_image_manifest (name, ref);
  }

  template <typename C>
  asio::awaitable<scs::image_config>
  basic_oci_registry<C>::
  image_config (const std::string& name, const scs::digest& d)
  {
    std::string b (co_await download_blob (name, d));

    verify_digest (d, scs::digest::of (b, d.algorithm ()));

    co_return parse_image_config (b);
  }

  template <typename C>
  asio::awaitable<oci_descriptor>
  basic_oci_registry<C>::
  image_details (const std::string& name,
                 const std::string& tag,
                 const std::string& arch)
  {
    oci_manifest m ((co_await image_manifest (name, tag, arch)).second);

    if (m.config.media_type != media_type::sif_config)
      throw content_type_error (errc::unexpected_media_type,
                                m.config.media_type,
                                media_type::sif_config);

    // The image itself is the only layer.
    //
    if (m.layers.size () != 1)
      throw error (errc::unexpected_layer_count,
                   "unexpected # of layers: " +
                   std::to_string (m.layers.size ()));

    scs::image_config ic (co_await image_config (name, m.config.digest));

    if (!arch.empty () && ic.architecture != arch)
      throw architecture_mismatch_error (ic.architecture, arch);

    co_return m.layers.front ();
  }

  template <typename C>
  asio::awaitable<scs::digest>
  basic_oci_registry<C>::
  upload_manifest (const std::string& name,
                   const std::string& bytes,
                   const std::string& mt,
                   const std::string& reference)
  {
    scs::digest d (scs::digest::of (bytes));

    std::string ref (reference.empty () ? d.string () : reference);

    request_type req (http_method::put,
                      url ("v2/" + name + "/manifests/" + ref));
    req.set_content_type (mt);
    req.set_body (bytes);

    co_await do_request (req,
                         credentials_,
                         namespace_access {name,
                                           {access_type::pull,
                                            access_type::push}},
                         [&bytes] () {return bytes;});

    log (log_, "uploaded manifest " + d.string () + " as " + name + ':' + ref);

    co_return d;
  }

  template <typename C>
  asio::awaitable<bool>
  basic_oci_registry<C>::
  blob_exists (const std::string& name, const scs::digest& d)
  {
    request_type req (http_method::head,
                      url ("v2/" + name + "/blobs/" + d.string ()));

    std::optional<response_type> r;

    try
    {
      r = co_await do_request (req,
                               credentials_,
                               namespace_access {name, {access_type::pull}});
    }
    catch (const error& e)
    {
      if (e.code () != errc::not_found)
        throw;
    }

    co_return r &&
      r->status == http_status::ok &&
      r->get_header ("Docker-Content-Digest").value_or ("") == d.string ();
  }

  template <typename C>
  asio::awaitable<std::pair<scs::digest, std::uint64_t>>
  basic_oci_registry<C>::
  upload_blob (const std::string& name, std::uint64_t size, read_function read)
  {
    namespace_access access {name, {access_type::pull, access_type::push}};

    // Open the upload session.
    //
    request_type req (http_method::post,
                      url ("v2/" + name + "/blobs/uploads/"));

    response_type r (co_await do_request (req, credentials_, access));

    if (r.status != http_status::accepted || !r.location ())
      throw http_status_error (errc::http_status,
                               r.status_code (),
                               "unexpected http status " +
                               std::to_string (r.status_code ()) +
                               " opening upload session for " + name);

    std::string location (resolve_reference (req.url, *r.location ()));

    // The rest of the session uses whatever token opening it took.
    //
    credentials_ptr creds (
      bearer_from_authorization (req.get_header ("Authorization").value_or ("")));

    if (creds == nullptr)
      creds = credentials_;

    digester dg;
    std::uint64_t offset (0);
    std::string chunk;

    for (;;)
    {
      std::size_t cap (static_cast<std::size_t> (
        std::min<std::uint64_t> (traits_.max_chunk_size, size - offset)));

      chunk.resize (cap);

      std::size_t n (0);
      while (n != cap)
      {
        std::size_t m (read (chunk.data () + n, cap - n));

        if (m == 0)
          break;

        n += m;
      }

      chunk.resize (n);

      if (n == 0)
        break;

      dg.update (chunk.data (), n);

      request_type p (http_method::patch, location);
      p.set_content_type ("application/octet-stream");
      p.set_header ("Content-Range",
                    std::to_string (offset) + '-' +
                    std::to_string (offset + n - 1));
      p.set_body (chunk);

      if (creds != nullptr)
        creds->apply (p);

      r = co_await do_request (p, creds, access, [&chunk] () {return chunk;});

      if (r.location ())
        location = resolve_reference (location, *r.location ());

      offset += n;

      if (offset == size)
        break;
    }

    if (offset != size)
      throw error (errc::malformed_value,
                   "short read: got " + std::to_string (offset) + " of " +
                   std::to_string (size) + " bytes for blob upload");

    scs::digest d (dg.finish ());

    // Close the session, naming the content.
    //
    request_type f (
      http_method::put,
      location + (location.find ('?') == std::string::npos ? '?' : '&') +
      "digest=" + url_encode (d.string ()));

    if (creds != nullptr)
      creds->apply (f);

    r = co_await do_request (f, creds, access);

    if (r.status != http_status::created)
      throw http_status_error (errc::http_status,
                               r.status_code (),
                               "unexpected http status " +
                               std::to_string (r.status_code ()) +
                               " closing upload session for " + name);

    log (log_, "uploaded blob " + d.string () + " (" +
         std::to_string (offset) + " bytes) to " + name);

    co_return std::make_pair (std::move (d), offset);
  }

  template <typename C>
  asio::awaitable<oci_descriptor>
  basic_oci_registry<C>::
  push_blob (const std::string& name,
             const std::string& mt,
             const std::string& bytes)
  {
    oci_descriptor r;
    r.media_type = mt;
    r.digest = scs::digest::of (bytes);
    r.size = bytes.size ();

    if (co_await blob_exists (name, r.digest))
    {
      log (log_, "blob " + r.digest.string () + " already present in " + name);
      co_return r;
    }

    memory_file f (bytes);
    source_reader rd (f);

    co_await upload_blob (name, r.size, std::ref (rd));

    co_return r;
  }

  template <typename C>
  asio::awaitable<std::uint64_t>
  basic_oci_registry<C>::
  download_blob_part (const std::string& name,
                      const scs::digest& d,
                      part_descriptor& part,
                      positional_sink& sink)
  {
    std::uint64_t before (part.cursor);

    request_type req (http_method::get,
                      url ("v2/" + name + "/blobs/" + d.string ()));
    req.set_range (part.start + part.cursor, part.end);

    // Send the credentials up front so each part does not cost a 401.
    //
    if (credentials_ != nullptr)
      credentials_->apply (req);

    body_callback w (part_writer (sink, part));

    response_type r (
      co_await do_request (req,
                           credentials_,
                           namespace_access {name, {access_type::pull}},
                           nullptr,
                           &w));

    verify_part_response (r, part);

    co_return part.cursor - before;
  }

  template <typename C>
  asio::awaitable<std::string>
  basic_oci_registry<C>::
  download_blob (const std::string& name, const scs::digest& d)
  {
    request_type req (http_method::get,
                      url ("v2/" + name + "/blobs/" + d.string ()));

    response_type r (
      co_await do_request (req,
                           credentials_,
                           namespace_access {name, {access_type::pull}}));

    co_return r.text ();
  }
}
