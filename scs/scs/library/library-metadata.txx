#include <algorithm>

#include <boost/json.hpp>

#include <scs/scs-error.hxx>
#include <scs/http/http-url.hxx>

namespace scs
{
  inline const char*
  metadata_collection (metadata_kind k)
  {
    switch (k)
    {
    case metadata_kind::entity:     return "v1/entities";
    case metadata_kind::collection: return "v1/collections";
    case metadata_kind::container:  return "v1/containers";
    case metadata_kind::image:      return "v1/images";
    }
    return "";
  }

  template <typename C>
  asio::awaitable<typename basic_library_metadata_client<C>::response_type>
  basic_library_metadata_client<C>::
  send (request_type& req)
  {
    if (credentials_ != nullptr)
      credentials_->apply (req);

    co_return co_await client_.request (req);
  }

  template <typename C>
  asio::awaitable<std::optional<std::string>>
  basic_library_metadata_client<C>::
  get (const std::string& path)
  {
    request_type req (http_method::get, join_url (base_url_, path));
    response_type r (co_await send (req));

    if (r.status == http_status::not_found)
      co_return std::nullopt;

    if (r.status != http_status::ok)
      throw http_status_error (r.status_code (), r.text ());

    co_return r.text ();
  }

  template <typename C>
  asio::awaitable<std::string>
  basic_library_metadata_client<C>::
  create (const std::string& path, const std::string& body)
  {
    request_type req (http_method::post, join_url (base_url_, path));
    req.set_content_type ("application/json");
    req.set_body (body);

    response_type r (co_await send (req));

    if (r.status != http_status::ok && r.status != http_status::created)
      throw http_status_error (r.status_code (), r.text ());

    co_return r.text ();
  }

  template <typename C>
  asio::awaitable<metadata_record>
  basic_library_metadata_client<C>::
  get_or_create (metadata_kind k,
                 const std::string& path,
                 const std::string& parent,
                 const std::string& description)
  {
    std::string c (metadata_collection (k));

    if (std::optional<std::string> b = co_await get (c + '/' + path))
      co_return parse_metadata_record (*b, true);

    log (log_, to_string (k) + ' ' + path + " does not exist in library, "
         "creating it");

    std::string b (
      co_await create (c, metadata_create_body (k, path, parent, description)));

    co_return parse_metadata_record (b, false);
  }

  template <typename C>
  asio::awaitable<void>
  basic_library_metadata_client<C>::
  set_tags (const std::string& container,
            const std::string& image,
            const std::vector<std::string>& tags)
  {
    std::string p ("v1/tags/" + container);

    std::optional<std::string> b (co_await get (p));
    std::vector<std::string> existing (b ? parse_tag_names (*b)
                                         : std::vector<std::string> ());

    for (const std::string& t: tags)
    {
      if (std::find (existing.begin (), existing.end (), t) != existing.end ())
        log (log_, "tag " + t + " replaces an existing tag");
      else
        log (log_, "setting tag " + t);

      boost::json::object o;
      o["Tag"] = t;
      o["ImageID"] = image;

      co_await create (p, boost::json::serialize (o));
    }
  }
}
