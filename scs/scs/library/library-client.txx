#include <memory>
#include <utility>
#include <algorithm>

#include <scs/scs-error.hxx>
#include <scs/http/http-url.hxx>
#include <scs/oci/oci-types.hxx>
#include <scs/oci/oci-digest.hxx>
#include <scs/transfer/transfer-part.hxx>
#include <scs/transfer/transfer-range.hxx>
#include <scs/transfer/transfer-engine.hxx>
#include <scs/transfer/transfer-planner.hxx>

namespace scs
{
  template <typename C>
  credentials_ptr basic_library_client<C>::
  library_credentials () const
  {
    if (config_.auth_token.empty ())
      return nullptr;

    return std::make_shared<bearer_credentials> (config_.auth_token);
  }

  template <typename C>
  asio::awaitable<std::optional<registry_endpoint>>
  basic_library_client<C>::
  oci_endpoint (const std::string& name,
                const std::vector<access_type>& access)
  {
    std::optional<registry_endpoint> r;

    try
    {
      r = co_await auth_.authenticate (config_.base_url,
                                       library_credentials (),
                                       name,
                                       namespace_access {oci_namespace (name),
                                                         access});
    }
    catch (const error& e)
    {
      if (e.code () != errc::oci_access_unsupported)
        throw;

      log (config_.log, std::string (e.what ()) +
           ", falling back to the library protocol");
    }

    co_return r;
  }

  template <typename C>
  asio::awaitable<void> basic_library_client<C>::
  pull (const std::string& name,
        const std::string& tag,
        const std::string& arch,
        positional_store& dst,
        progress_reporter& progress)
  {
    std::optional<registry_endpoint> e (
      co_await oci_endpoint (name, {access_type::pull}));

    if (e)
      co_await oci_pull (*e, tag, arch, dst, progress);
    else
      co_await legacy_pull (name, tag, arch, dst, progress);
  }

  template <typename C>
  asio::awaitable<void> basic_library_client<C>::
  oci_pull (const registry_endpoint& e,
            const std::string& tag,
            const std::string& arch,
            positional_store& dst,
            progress_reporter& progress)
  {
    registry_type reg (client_,
                       e.url,
                       e.credentials,
                       config_.registry,
                       config_.log);

    oci_descriptor d (co_await reg.image_details (e.name, tag, arch));

    part_plan p (plan_parts (static_cast<std::int64_t> (d.size),
                             config_.transfer));

    log (config_.log, to_string (p));

    transfer_engine engine (config_.log);

    progress.init (d.size);

    try
    {
      co_await engine.run (
        p.parts,
        p.concurrency,
        [&reg, &e, &d, &dst] (part_descriptor& pd)
        {
          return reg.download_blob_part (e.name, d.digest, pd, dst);
        },
        progress);
    }
    catch (...)
    {
      progress.wait ();
      throw;
    }

    progress.wait ();

    verify_digest (d.digest, digest_source (dst, d.digest.algorithm ()));

    log (config_.log, "downloaded " + e.name + ':' + tag + " (" +
         d.digest.string () + ')');
  }

  template <typename C>
  asio::awaitable<void> basic_library_client<C>::
  legacy_pull (const std::string& name,
               const std::string& tag,
               const std::string& arch,
               positional_sink& dst,
               progress_reporter& progress)
  {
    const transfer_spec& spec (config_.transfer);

    if (spec.part_size <= 0)
      throw error (errc::invalid_part_size,
                   "invalid part size (" + std::to_string (spec.part_size) +
                   ')');

    std::string u (join_url (config_.base_url,
                             "v1/imagefile/" + name + ':' + tag));

    if (!arch.empty ())
      u = append_query (u, {{"arch", arch}});

    credentials_ptr c (library_credentials ());

    // The first request asks for the first part. A server that ignores
    // Range answers with the whole image, which is then all we need.
    //
    std::uint64_t written (0);
    bool single (false);

    body_callback w ([&dst, &written, &single, &progress] (const char* b,
                                                          std::size_t n)
    {
      dst.write_at (b, n, written);
      written += n;

      if (single)
        progress.increment (n);
    });

    header_callback h ([&single, &progress] (const response_type& r)
    {
      if (r.status == http_status::ok)
      {
        single = true;
        progress.init (r.content_length ().value_or (0));
      }
    });

    std::uint8_t max (config_.http.max_redirects);
    response_type r;

    for (std::uint8_t i (0);; ++i)
    {
      request_type req (http_method::get, u);
      req.set_range (0, static_cast<std::uint64_t> (spec.part_size) - 1);

      if (c != nullptr)
        c->apply (req);

      written = 0;
      r = co_await client_.stream (req, w, h);

      if (r.status != http_status::see_other)
        break;

      if (i == max)
        throw error (errc::too_many_redirects,
                     "stopped after " + std::to_string (max) + " redirects");

      std::optional<std::string> l (r.location ());

      if (!l)
        throw error (errc::malformed_value,
                     "redirect from " + u + " without Location");

      std::string n (resolve_reference (u, *l));

      // The library token is only for the library itself.
      //
      if (c != nullptr && !same_origin (config_.base_url, n))
        c = nullptr;

      log (config_.log, "redirected to " + n);
      u = std::move (n);
    }

    if (r.status == http_status::ok)
    {
      progress.wait ();

      if (std::optional<std::uint64_t> n = r.content_length ();
          n && *n != written)
        throw error (errc::malformed_value,
                     "short read: got " + std::to_string (written) + " of " +
                     std::to_string (*n) + " bytes");

      log (config_.log, "downloaded " + name + ':' + tag + " in a single "
           "stream (" + std::to_string (written) + " bytes)");
      co_return;
    }

    if (r.status != http_status::partial_content)
      throw http_status_error (r.status_code (), r.text ());

    std::uint64_t size (
      parse_content_range (r.get_header ("Content-Range").value_or ("")));

    part_plan p (plan_parts (static_cast<std::int64_t> (size), spec));

    log (config_.log, to_string (p));

    // The initial response was the first part.
    //
    p.parts.front ().cursor = written;
    verify_part_response (r, p.parts.front ());

    progress.init (size);
    progress.increment (written);

    std::vector<part_descriptor> rest (p.parts.begin () + 1, p.parts.end ());
    transfer_engine engine (config_.log);

    try
    {
      co_await engine.run (
        rest,
        p.concurrency,
        [this, &u, &c, &dst] (part_descriptor& pd)
          -> asio::awaitable<std::uint64_t>
        {
          request_type req (http_method::get, u);
          req.set_range (pd.start + pd.cursor, pd.end);

          if (c != nullptr)
            c->apply (req);

          std::uint64_t before (pd.cursor);

          response_type r (
            co_await client_.stream (req, part_writer (dst, pd)));

          verify_part_response (r, pd);
          co_return pd.cursor - before;
        },
        progress);
    }
    catch (...)
    {
      progress.wait ();
      throw;
    }

    progress.wait ();

    log (config_.log, "downloaded " + name + ':' + tag + " (" +
         std::to_string (size) + " bytes)");
  }

  template <typename C>
  asio::awaitable<void> basic_library_client<C>::
  push (positional_source& src,
        const std::string& name,
        const std::vector<std::string>& tags,
        const std::string& description,
        library_metadata& md,
        upload_callback* callback,
        const std::string& arch)
  {
    library_path path (parse_library_path (name));

    // Everything about the image comes from its leading bytes, so there is
    // no need to read the whole file to build the config.
    //
    std::uint64_t size (src.size ());
    std::string probe (
      static_cast<std::size_t> (
        std::min<std::uint64_t> (config_.header_probe_size, size)),
      '\0');

    probe.resize (src.read_at (probe.data (), probe.size (), 0));

    sif_summary s (parse_sif_header (probe));

    if (!arch.empty ())
    {
      if (s.architecture.empty ())
        s.architecture = arch;
      else if (s.architecture != arch)
        throw architecture_mismatch_error (s.architecture, arch);
    }

    digest d (digest_source (src));

    log (config_.log, "image hash computed as " + image_hash (d));

    // Resolve or create the metadata hierarchy.
    //
    const std::string none ("No description");

    metadata_record en (
      co_await md.get_or_create (metadata_kind::entity,
                                 path.entity, "", none));
    metadata_record co (
      co_await md.get_or_create (metadata_kind::collection,
                                 path.collection_path (), en.id, none));
    metadata_record ct (
      co_await md.get_or_create (metadata_kind::container,
                                 path.container_path (), co.id, none));
    metadata_record im (
      co_await md.get_or_create (metadata_kind::image,
                                 path.container_path () + ':' + image_hash (d),
                                 ct.id,
                                 description));

    null_progress_reporter np;
    progress_upload_callback ncb (np);
    upload_callback& cb (callback != nullptr ? *callback : ncb);

    std::optional<registry_endpoint> e (
      co_await oci_endpoint (path.container_path (),
                             {access_type::pull, access_type::push}));

    if (e)
      co_await oci_push (*e,
                         src,
                         d,
                         make_image_config (s, d, description),
                         tags,
                         cb);
    else if (!im.uploaded)
      co_await legacy_push (src, im.id, cb);
    else
      log (config_.log, "image is already present in the library, "
           "not uploading");

    co_await md.set_tags (ct.id, im.id, tags);
  }

  template <typename C>
  asio::awaitable<void> basic_library_client<C>::
  oci_push (const registry_endpoint& e,
            positional_source& src,
            const digest& d,
            const image_config& ic,
            const std::vector<std::string>& tags,
            upload_callback& cb)
  {
    registry_type reg (client_,
                       e.url,
                       e.credentials,
                       config_.registry,
                       config_.log);

    oci_descriptor layer;
    layer.media_type = media_type::sif_layer;
    layer.digest = d;
    layer.size = src.size ();

    if (co_await reg.blob_exists (e.name, d))
      log (config_.log, "image " + d.string () + " already present in " +
           e.name + ", not uploading");
    else
    {
      source_reader rd (src);
      cb.init_upload (layer.size, std::ref (rd));

      std::pair<digest, std::uint64_t> r;

      try
      {
        r = co_await reg.upload_blob (e.name, layer.size, cb.reader ());
      }
      catch (...)
      {
        cb.finish ();
        throw;
      }

      cb.finish ();

      // The file changed under us.
      //
      verify_digest (d, r.first);
    }

    oci_descriptor cfg (
      co_await reg.push_blob (e.name,
                             media_type::sif_config,
                             serialize (ic)));

    std::string m (serialize (make_sif_manifest (cfg, layer)));

    for (const std::string& t: tags)
      co_await reg.upload_manifest (e.name, m, media_type::image_manifest, t);
  }

  template <typename C>
  asio::awaitable<void> basic_library_client<C>::
  legacy_push (positional_source& src,
               const std::string& id,
               upload_callback& cb)
  {
    std::uint64_t size (src.size ());

    request_type req (http_method::post,
                      join_url (config_.base_url, "v1/imagefile/" + id));

    if (credentials_ptr c = library_credentials ())
      c->apply (req);

    source_reader rd (src);
    cb.init_upload (size, std::ref (rd));

    log (config_.log, "uploading " + std::to_string (size) + " bytes to " +
         req.url);

    response_type r;

    try
    {
      r = co_await client_.upload (req, size, cb.reader ());
    }
    catch (...)
    {
      cb.finish ();
      throw;
    }

    cb.finish ();

    if (r.status != http_status::ok)
      throw http_status_error (r.status_code (), r.text ());
  }
}
