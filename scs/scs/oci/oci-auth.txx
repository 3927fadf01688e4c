#include <boost/json.hpp>

#include <scs/scs-error.hxx>
#include <scs/http/http-url.hxx>

namespace scs
{
  // Pull a string member out of a JSON object response, empty if absent.
  //
  inline std::string
  json_member (const boost::json::object& o, const char* k)
  {
    auto i (o.find (k));
    return i != o.end () && i->value ().is_string ()
      ? std::string (i->value ().as_string ())
      : std::string ();
  }

  template <typename C>
  asio::awaitable<registry_endpoint> basic_registry_authenticator<C>::
  authenticate (const std::string& base,
                const credentials_ptr& lc,
                const std::string& name,
                const namespace_access& access)
  {
    namespace json = boost::json;

    std::string u (
      append_query (join_url (base, "v1/oci-redirect"),
                    {{"namespace", access.name},
                     {"accessTypes", access.types_string ()}}));

    request_type req (http_method::get, u);

    if (lc != nullptr && lc->kind () != credential_kind::none)
      lc->apply (req);

    response_type r (co_await client_.request (req));

    if (r.status != http_status::ok)
      throw error (errc::oci_access_unsupported,
                   "error determining direct OCI registry access: "
                   "unexpected http status " +
                   std::to_string (r.status_code ()));

    json::error_code ec;
    json::value v (json::parse (r.text (), ec));

    if (ec || !v.is_object ())
      throw error (errc::malformed_value,
                   "error decoding direct OCI registry access response");

    const json::object& o (v.as_object ());

    registry_endpoint e;
    e.url = json_member (o, "url");
    e.name = json_member (o, "name");

    if (e.url.empty ())
      throw error (errc::malformed_value,
                   "direct OCI registry access response has no url");

    // Fail now rather than on the first registry request.
    //
    parse_url (e.url);

    if (e.name.empty ())
      e.name = name;

    // No token means anonymous access.
    //
    if (std::string t = json_member (o, "token"); !t.empty ())
      e.credentials = std::make_shared<bearer_credentials> (std::move (t));

    log (log_, "using OCI registry endpoint " + e.url);

    if (e.name != name)
      log (log_, "library maps " + name + " to " + e.name);

    co_return e;
  }

  template <typename C>
  asio::awaitable<credentials_ptr> basic_registry_authenticator<C>::
  negotiate (const auth_challenge& ch,
             const credentials_ptr& c,
             const namespace_access& access)
  {
    namespace json = boost::json;

    if (ch.scheme != auth_scheme::bearer ||
        ch.realm.empty () ||
        c->kind () != credential_kind::basic)
      co_return c;

    std::vector<std::pair<std::string, std::string>> q;

    if (!ch.service.empty ())
      q.emplace_back ("service", ch.service);

    q.emplace_back ("scope", ch.scope.empty () ? access.scope () : ch.scope);

    request_type req (http_method::get, append_query (ch.realm, q));
    c->apply (req);

    log (log_, "requesting registry token from " + ch.realm);

    response_type r (co_await client_.request (req));

    if (r.status != http_status::ok)
      throw http_status_error (errc::unauthorized,
                               r.status_code (),
                               "unauthorized: token request to " + ch.realm +
                               " failed with http status " +
                               std::to_string (r.status_code ()));

    json::error_code ec;
    json::value v (json::parse (r.text (), ec));

    if (ec || !v.is_object ())
      throw error (errc::malformed_value, "invalid token response from " +
                   ch.realm);

    // Docker's token endpoint answers with "token", OAuth2 style ones with
    // "access_token".
    //
    std::string t (json_member (v.as_object (), "token"));

    if (t.empty ())
      t = json_member (v.as_object (), "access_token");

    if (t.empty ())
      throw error (errc::unauthorized, "no token in response from " +
                   ch.realm);

    co_return std::make_shared<bearer_credentials> (std::move (t));
  }
}
