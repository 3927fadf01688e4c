#include <scs/http/http-types.hxx>

#include <cctype>

using namespace std;

namespace scs
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
    case http_method::get:     return "GET";
    case http_method::head:    return "HEAD";
    case http_method::post:    return "POST";
    case http_method::put:     return "PUT";
    case http_method::patch:   return "PATCH";
    case http_method::delete_: return "DELETE";
    }

    return "GET";
  }

  string
  to_string (http_status s)
  {
    switch (s)
    {
    case http_status::ok:                    return "OK";
    case http_status::created:               return "Created";
    case http_status::accepted:              return "Accepted";
    case http_status::no_content:            return "No Content";
    case http_status::partial_content:       return "Partial Content";
    case http_status::moved_permanently:     return "Moved Permanently";
    case http_status::found:                 return "Found";
    case http_status::see_other:             return "See Other";
    case http_status::temporary_redirect:    return "Temporary Redirect";
    case http_status::permanent_redirect:    return "Permanent Redirect";
    case http_status::bad_request:           return "Bad Request";
    case http_status::unauthorized:          return "Unauthorized";
    case http_status::forbidden:             return "Forbidden";
    case http_status::not_found:             return "Not Found";
    case http_status::range_not_satisfiable: return "Range Not Satisfiable";
    case http_status::internal_server_error: return "Internal Server Error";
    case http_status::service_unavailable:   return "Service Unavailable";
    }

    return std::to_string (static_cast<uint16_t> (s));
  }

  bool
  header_name_equal (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i != x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }
}
