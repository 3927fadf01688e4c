#include <scs/library/library-metadata.hxx>

#include <boost/json.hpp>

#include <scs/scs-error.hxx>

using namespace std;

namespace scs
{
  namespace json = boost::json;

  string
  to_string (metadata_kind k)
  {
    switch (k)
    {
    case metadata_kind::entity:     return "entity";
    case metadata_kind::collection: return "collection";
    case metadata_kind::container:  return "container";
    case metadata_kind::image:      return "image";
    }
    return string ();
  }

  static const json::object&
  response_data (const json::value& v, const string& what)
  {
    const json::object* o (v.if_object ());
    const json::value* d (o != nullptr ? o->if_contains ("data") : nullptr);

    if (d == nullptr || !d->is_object ())
      throw error (errc::malformed_value,
                   "error decoding " + what + ": no data object");

    return d->as_object ();
  }

  metadata_record
  parse_metadata_record (const string& b, bool found)
  {
    json::error_code ec;
    json::value v (json::parse (b, ec));

    if (ec)
      throw error (errc::malformed_value,
                   "error decoding library record: " + ec.message ());

    const json::object& d (response_data (v, "library record"));

    metadata_record r;
    r.found = found;

    if (const json::value* i = d.if_contains ("id"); i != nullptr &&
                                                     i->is_string ())
      r.id = string (i->as_string ());

    if (r.id.empty ())
      throw error (errc::malformed_value,
                   "error decoding library record: no id");

    if (const json::value* u = d.if_contains ("uploaded"); u != nullptr &&
                                                           u->is_bool ())
      r.uploaded = u->as_bool ();

    return r;
  }

  string
  metadata_create_body (metadata_kind k,
                        const string& path,
                        const string& parent,
                        const string& description)
  {
    json::object o;
    o["description"] = description;

    // The record's own name is the last path component; for images it is
    // the hash after the colon.
    //
    if (k == metadata_kind::image)
    {
      size_t i (path.rfind (':'));
      o["hash"] = i == string::npos ? path : path.substr (i + 1);
      o["container"] = parent;
    }
    else
    {
      size_t i (path.rfind ('/'));
      o["name"] = i == string::npos ? path : path.substr (i + 1);

      if (k == metadata_kind::collection)
        o["entity"] = parent;
      else if (k == metadata_kind::container)
        o["collection"] = parent;
    }

    return json::serialize (o);
  }

  vector<string>
  parse_tag_names (const string& b)
  {
    json::error_code ec;
    json::value v (json::parse (b, ec));

    if (ec)
      throw error (errc::malformed_value,
                   "error decoding tags: " + ec.message ());

    vector<string> r;
    for (const auto& kv: response_data (v, "tags"))
      r.emplace_back (kv.key ());

    return r;
  }
}
