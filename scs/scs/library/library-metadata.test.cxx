#include <scs/library/library-metadata.hxx>

#include <map>
#include <algorithm>
#include <cassert>

#include <boost/json.hpp>

#include <scs/scs-error.hxx>
#include <scs/http/http-client.test.hxx>

using namespace std;
using namespace scs;

namespace json = boost::json;

using metadata_client = basic_library_metadata_client<fake_http_client>;

static const string lib ("https://library.example");

static void
test_parse ()
{
  metadata_record r (
    parse_metadata_record (R"({"data":{"id":"abc","uploaded":true}})", true));
  assert (r.id == "abc");
  assert (r.found);
  assert (r.uploaded);

  r = parse_metadata_record (R"({"data":{"id":"x","name":"n"}})", false);
  assert (r.id == "x" && !r.found && !r.uploaded);

  for (const char* b: {R"({"data":{}})",
                       R"({"data":{"id":""}})",
                       R"({"id":"abc"})",
                       "[1,2]",
                       "{"})
  {
    try
    {
      parse_metadata_record (b, true);
      assert (false);
    }
    catch (const error& e)
    {
      assert (e.code () == scs::errc::malformed_value);
    }
  }

  vector<string> ts (
    parse_tag_names (R"({"data":{"latest":"i1","v1":"i2"}})"));
  assert (ts.size () == 2);
  assert (find (ts.begin (), ts.end (), "latest") != ts.end ());
  assert (find (ts.begin (), ts.end (), "v1") != ts.end ());

  assert (parse_tag_names (R"({"data":{}})").empty ());
}

static void
test_create_body ()
{
  auto parse = [] (const string& s) {return json::parse (s).as_object ();};

  json::object e (parse (metadata_create_body (metadata_kind::entity,
                                               "library", "", "d")));
  assert (e["name"].as_string () == "library");
  assert (e["description"].as_string () == "d");

  json::object c (parse (metadata_create_body (metadata_kind::collection,
                                               "library/default", "e1", "d")));
  assert (c["name"].as_string () == "default");
  assert (c["entity"].as_string () == "e1");

  json::object k (parse (metadata_create_body (metadata_kind::container,
                                               "library/default/alpine",
                                               "c1",
                                               "d")));
  assert (k["name"].as_string () == "alpine");
  assert (k["collection"].as_string () == "c1");

  json::object i (parse (metadata_create_body (metadata_kind::image,
                                               "library/default/alpine:sha256.ab",
                                               "k1",
                                               "Alpine")));
  assert (i["hash"].as_string () == "sha256.ab");
  assert (i["container"].as_string () == "k1");
  assert (i["description"].as_string () == "Alpine");
}

// Library knowing about the entity only.
//
struct fake_api
{
  map<string, string> records {
    {lib + "/v1/entities/library", R"({"data":{"id":"e1"}})"}};

  map<string, string> tags;
  size_t created = 0;

  http_response
  operator() (const http_request& r)
  {
    if (r.method == http_method::get)
    {
      auto i (records.find (r.url));

      if (i != records.end ())
        return make_response (http_status::ok, i->second);

      if (r.url == lib + "/v1/tags/k1")
      {
        json::object d;
        for (const auto& [t, id]: tags)
          d[t] = id;

        json::object o;
        o["data"] = move (d);
        return make_response (http_status::ok, json::serialize (o));
      }

      return make_response (http_status::not_found);
    }

    if (r.url == lib + "/v1/tags/k1")
    {
      json::object o (json::parse (*r.body).as_object ());
      tags[string (o["Tag"].as_string ())] =
        string (o["ImageID"].as_string ());
      return make_response (http_status::ok);
    }

    ++created;
    return make_response (
      http_status::created,
      R"({"data":{"id":"new)" + std::to_string (created) + R"("}})");
  }
};

static void
test_client ()
{
  fake_api api;
  fake_http_client c (ref (api));

  vector<string> log;
  metadata_client md (c,
                      lib,
                      make_shared<bearer_credentials> ("tok"),
                      [&log] (const string& m) {log.push_back (m);});

  metadata_record e (
    run (md.get_or_create (metadata_kind::entity, "library", "", "x")));
  assert (e.id == "e1" && e.found);
  assert (c.requests.size () == 1);
  assert (c.requests[0].get_header ("Authorization") == "Bearer tok");

  metadata_record co (
    run (md.get_or_create (metadata_kind::collection,
                           "library/default",
                           e.id,
                           "No description")));
  assert (co.id == "new1" && !co.found);
  assert (c.requests.size () == 3);
  assert (c.requests[1].url == lib + "/v1/collections/library/default");

  const http_request& p (c.requests[2]);
  assert (p.method == http_method::post);
  assert (p.url == lib + "/v1/collections");
  assert (p.get_header ("Content-Type") == "application/json");
  assert (p.get_header ("Authorization") == "Bearer tok");
  json::object pb (json::parse (*p.body).as_object ());
  assert (pb["entity"].as_string () == "e1");
  assert (log.back () ==
          "collection library/default does not exist in library, creating it");

  // Tags: one new, one moved.
  //
  api.tags["latest"] = "i0";

  run (md.set_tags ("k1", "i1", {"latest", "v1"}));

  assert (api.tags["latest"] == "i1");
  assert (api.tags["v1"] == "i1");
  assert (log[log.size () - 2] == "tag latest replaces an existing tag");
  assert (log.back () == "setting tag v1");

  // Library errors other than "not found" are reported.
  //
  fake_http_client b (
    [] (const http_request&)
    {
      return make_response (http_status::internal_server_error, "oops");
    });

  metadata_client bm (b, lib, nullptr);

  try
  {
    run (bm.get_or_create (metadata_kind::entity, "library", "", ""));
    assert (false);
  }
  catch (const http_status_error& e)
  {
    assert (e.code () == scs::errc::http_status);
    assert (e.status () == 500);
  }

  assert (!b.requests[0].has_header ("Authorization"));
}

int
main ()
{
  test_parse ();
  test_create_body ();
  test_client ();
}
