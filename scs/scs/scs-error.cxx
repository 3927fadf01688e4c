#include <scs/scs-error.hxx>

using namespace std;

namespace scs
{
  string
  to_string (errc c)
  {
    switch (c)
    {
    case errc::invalid_size:             return "invalid size";
    case errc::invalid_part_size:        return "invalid part size";
    case errc::http_status:              return "unexpected http status";
    case errc::not_found:                return "not found";
    case errc::unauthorized:             return "unauthorized";
    case errc::invalid_auth_header:      return "invalid auth header";
    case errc::unknown_auth_type:        return "unknown auth type";
    case errc::unable_to_reset_body:     return "unable to reset HTTP request body";
    case errc::oci_access_unsupported:   return "OCI download not supported";
    case errc::arch_not_specified:       return "architecture not specified";
    case errc::no_matching_architecture: return "no matching OS/architecture";
    case errc::unexpected_architecture:  return "unexpected image architecture";
    case errc::unexpected_media_type:    return "unexpected media type";
    case errc::unexpected_layer_count:   return "unexpected number of layers";
    case errc::unexpected_content_type:  return "unexpected content type";
    case errc::digest_mismatch:          return "digest not verified";
    case errc::invalid_digest:           return "invalid digest";
    case errc::malformed_value:          return "unexpected/malformed value";
    case errc::too_many_redirects:       return "too many redirects";
    case errc::invalid_image_config:     return "invalid image config";
    case errc::invalid_sif:              return "invalid SIF image";
    }

    return "unknown error";
  }

  // Keep the body excerpt short since some servers return whole HTML pages
  // for errors.
  //
  static string
  status_message (uint16_t s, const string& body)
  {
    string r ("unexpected http status " + std::to_string (s));

    if (!body.empty ())
    {
      r += ": ";
      r += body.size () > 200 ? body.substr (0, 200) + "..." : body;
    }

    return r;
  }

  http_status_error::
  http_status_error (uint16_t s, const string& body)
    : error (s == 404 ? errc::not_found : errc::http_status,
             status_message (s, body)),
      status_ (s)
  {
  }

  digest_mismatch_error::
  digest_mismatch_error (const string& e, const string& a)
    : error (errc::digest_mismatch,
             "digest not verified (got " + a + ", want " + e + ")"),
      expected_ (e),
      actual_ (a)
  {
  }

  architecture_mismatch_error::
  architecture_mismatch_error (const string& g, const string& w)
    : error (errc::unexpected_architecture,
             "unexpected image architecture: got " + g + ", want " + w),
      got_ (g),
      want_ (w)
  {
  }

  content_type_error::
  content_type_error (errc c, const string& g, const string& w)
    : error (c,
             (c == errc::unexpected_media_type
              ? "unexpected media type error (got "
              : "unexpected content type (got ") + g + ", want " + w + ")"),
      got_ (g),
      want_ (w)
  {
  }
}
