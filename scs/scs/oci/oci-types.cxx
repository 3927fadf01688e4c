#include <scs/oci/oci-types.hxx>

#include <scs/scs-error.hxx>

using namespace std;

namespace scs
{
  static json::value
  parse_json (const string& s, const char* what)
  {
    json::error_code ec;
    json::value v (json::parse (s, ec));

    if (ec)
      throw error (errc::malformed_value,
                   string ("invalid ") + what + ": " + ec.message ());

    if (!v.is_object ())
      throw error (errc::malformed_value,
                   string ("invalid ") + what + ": not a JSON object");

    return v;
  }

  static string
  get_string (const json::object& o, const char* k, bool required = false)
  {
    auto i (o.find (k));

    if (i == o.end () || i->value ().is_null ())
    {
      if (required)
        throw error (errc::malformed_value,
                     string ("missing '") + k + "' field");

      return string ();
    }

    if (!i->value ().is_string ())
      throw error (errc::malformed_value,
                   string ("'") + k + "' field is not a string");

    return json::value_to<string> (i->value ());
  }

  static map<string, string>
  get_annotations (const json::object& o)
  {
    map<string, string> r;

    if (auto i = o.find ("annotations");
        i != o.end () && i->value ().is_object ())
    {
      for (const auto& kv: i->value ().as_object ())
      {
        if (kv.value ().is_string ())
          r[string (kv.key ())] = json::value_to<string> (kv.value ());
      }
    }

    return r;
  }

  static json::object
  to_json (const map<string, string>& m)
  {
    json::object r;

    for (const auto& [k, v]: m)
      r[k] = v;

    return r;
  }

  oci_descriptor
  parse_descriptor (const json::value& v)
  {
    if (!v.is_object ())
      throw error (errc::malformed_value, "descriptor is not a JSON object");

    const json::object& o (v.as_object ());

    oci_descriptor r;
    r.media_type = get_string (o, "mediaType");
    r.digest = digest::parse (get_string (o, "digest", true));

    if (auto i = o.find ("size"); i != o.end ())
    {
      if (!i->value ().is_number ())
        throw error (errc::malformed_value, "descriptor size is not a number");

      r.size = i->value ().to_number<uint64_t> ();
    }

    if (auto i = o.find ("platform");
        i != o.end () && i->value ().is_object ())
    {
      const json::object& p (i->value ().as_object ());

      r.platform = oci_platform {get_string (p, "architecture"),
                                 get_string (p, "os"),
                                 get_string (p, "variant")};
    }

    r.annotations = get_annotations (o);
    return r;
  }

  oci_manifest
  parse_manifest (const string& s)
  {
    json::value v (parse_json (s, "manifest"));
    const json::object& o (v.as_object ());

    oci_manifest r;

    if (auto i = o.find ("schemaVersion"); i != o.end () && i->value ().is_int64 ())
      r.schema_version = static_cast<int> (i->value ().as_int64 ());

    r.media_type = get_string (o, "mediaType");

    auto c (o.find ("config"));
    if (c == o.end ())
      throw error (errc::malformed_value, "invalid manifest: no config");

    r.config = parse_descriptor (c->value ());

    if (auto i = o.find ("layers"); i != o.end () && i->value ().is_array ())
    {
      for (const json::value& l: i->value ().as_array ())
        r.layers.push_back (parse_descriptor (l));
    }

    r.annotations = get_annotations (o);
    return r;
  }

  oci_index
  parse_index (const string& s)
  {
    json::value v (parse_json (s, "index"));
    const json::object& o (v.as_object ());

    oci_index r;

    if (auto i = o.find ("schemaVersion"); i != o.end () && i->value ().is_int64 ())
      r.schema_version = static_cast<int> (i->value ().as_int64 ());

    r.media_type = get_string (o, "mediaType");

    if (auto i = o.find ("manifests"); i != o.end () && i->value ().is_array ())
    {
      for (const json::value& m: i->value ().as_array ())
        r.manifests.push_back (parse_descriptor (m));
    }

    return r;
  }

  image_config
  parse_image_config (const string& s)
  {
    json::value v (parse_json (s, "image config"));
    const json::object& o (v.as_object ());

    image_config r;
    r.architecture = get_string (o, "architecture");
    r.os = get_string (o, "os");
    r.description = get_string (o, "description");

    if (auto i = o.find ("signed"); i != o.end () && i->value ().is_bool ())
      r.is_signed = i->value ().as_bool ();

    if (auto i = o.find ("encrypted"); i != o.end () && i->value ().is_bool ())
      r.is_encrypted = i->value ().as_bool ();

    if (r.architecture.empty ())
      throw error (errc::invalid_image_config,
                   "invalid image config: architecture not present");

    string fs (get_string (o, "rootfs"));

    if (!digest::valid (fs))
      throw error (errc::invalid_image_config,
                   "invalid image config: invalid rootfs digest '" + fs + "'");

    r.rootfs = digest::parse (fs);
    return r;
  }

  json::value
  to_json (const oci_descriptor& d)
  {
    json::object r;
    r["mediaType"] = d.media_type;
    r["digest"] = d.digest.string ();
    r["size"] = d.size;

    if (d.platform)
    {
      json::object p;
      p["architecture"] = d.platform->architecture;
      p["os"] = d.platform->os;

      if (!d.platform->variant.empty ())
        p["variant"] = d.platform->variant;

      r["platform"] = move (p);
    }

    if (!d.annotations.empty ())
      r["annotations"] = to_json (d.annotations);

    return r;
  }

  json::value
  to_json (const oci_manifest& m)
  {
    json::object r;
    r["schemaVersion"] = m.schema_version;

    if (!m.media_type.empty ())
      r["mediaType"] = m.media_type;

    r["config"] = to_json (m.config);

    json::array ls;
    for (const oci_descriptor& l: m.layers)
      ls.push_back (to_json (l));

    r["layers"] = move (ls);

    if (!m.annotations.empty ())
      r["annotations"] = to_json (m.annotations);

    return r;
  }

  json::value
  to_json (const image_config& c)
  {
    json::object r;
    r["architecture"] = c.architecture;
    r["os"] = c.os;
    r["rootfs"] = c.rootfs.string ();

    if (!c.description.empty ())
      r["description"] = c.description;

    r["signed"] = c.is_signed;
    r["encrypted"] = c.is_encrypted;
    return r;
  }

  string
  serialize (const oci_manifest& m)
  {
    return json::serialize (to_json (m));
  }

  string
  serialize (const image_config& c)
  {
    return json::serialize (to_json (c));
  }

  digest
  manifest_from_index (const oci_index& idx, const string& arch)
  {
    if (arch.empty ())
    {
      const oci_descriptor* r (nullptr);
      size_t n (0);

      for (const oci_descriptor& d: idx.manifests)
      {
        if (d.media_type == media_type::image_manifest)
        {
          r = &d;
          ++n;
        }
      }

      if (n != 1)
        throw error (errc::arch_not_specified,
                     "architecture not specified and index holds " +
                     std::to_string (n) + " image manifests");

      return r->digest;
    }

    for (const oci_descriptor& d: idx.manifests)
    {
      if (d.media_type != media_type::image_manifest)
        continue;

      if (d.platform && d.platform->architecture == arch)
        return d.digest;
    }

    throw error (errc::no_matching_architecture,
                 "no matching OS/architecture (" + arch + ") found");
  }

  oci_manifest
  make_sif_manifest (const oci_descriptor& c, const oci_descriptor& l)
  {
    oci_manifest r;
    r.media_type = media_type::image_manifest;
    r.config = c;
    r.layers.push_back (l);
    return r;
  }
}
