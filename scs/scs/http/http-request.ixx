#include <scs/http/http-url.hxx>

namespace scs
{
  template <typename S, typename B>
  inline typename basic_http_request<S, B>::string_type
  basic_http_request<S, B>::
  target () const
  {
    return parse_url (url).target;
  }
}
