#include <wws/Abi.hpp>

#include "base64.hpp"
#include "test_util.hpp"

#include <rapidjson/document.h>

#include <catch2/catch.hpp>

using namespace wws;

namespace
{
   std::vector<char> bytes(std::string_view s)
   {
      return {s.begin(), s.end()};
   }
}  // namespace

TEST_CASE("base64")
{
   using detail::from_base64;
   using detail::to_base64;
   CHECK(to_base64(bytes("")) == "");
   CHECK(to_base64(bytes("f")) == "Zg==");
   CHECK(to_base64(bytes("fo")) == "Zm8=");
   CHECK(to_base64(bytes("foo")) == "Zm9v");
   CHECK(to_base64(bytes("foobar")) == "Zm9vYmFy");
   CHECK(to_base64(std::vector<char>{'\xff', '\xfe'}) == "//4=");

   CHECK(from_base64("Zm9vYmE=") == bytes("fooba"));
   CHECK(from_base64("Zm9vYg==") == bytes("foob"));
   CHECK(from_base64("") == bytes(""));
   CHECK(from_base64("Zm9v!") == std::nullopt);
   CHECK(from_base64("Zg=x") == std::nullopt);
}

TEST_CASE("serializeRequest")
{
   ExecutionRequest req;
   req.method  = "GET";
   req.url     = "/users/42?a=1&a=2";
   req.path    = "/users/42";
   req.query   = {{"a", {"1", "2"}}};
   req.headers = {{"Accept", "*/*"}, {"Accept", "text/html"}};
   req.body    = bytes("body");
   req.params  = {{"id", "42"}};
   req.vars    = {{"MODE", "test"}};

   auto                json = serializeRequest(req);
   rapidjson::Document doc;
   doc.Parse(json.data(), json.size());
   REQUIRE(!doc.HasParseError());
   CHECK(doc["abi"].GetUint() == 1);
   CHECK(std::string(doc["method"].GetString()) == "GET");
   CHECK(std::string(doc["url"].GetString()) == req.url);
   CHECK(std::string(doc["path"].GetString()) == "/users/42");
   CHECK(doc["query"]["a"].Size() == 2);
   CHECK(std::string(doc["query"]["a"][1].GetString()) == "2");
   REQUIRE(doc["headers"].Size() == 2);
   CHECK(std::string(doc["headers"][1]["value"].GetString()) == "text/html");
   CHECK(std::string(doc["body"].GetString()) == "Ym9keQ==");
   CHECK(std::string(doc["params"]["id"].GetString()) == "42");
   CHECK(std::string(doc["vars"]["MODE"].GetString()) == "test");
   CHECK(!doc.HasMember("kv"));

   KvMap kv{{"k", "v"}};
   auto  withKv = serializeRequest(req, &kv);
   doc.Parse(withKv.data(), withKv.size());
   REQUIRE(!doc.HasParseError());
   CHECK(std::string(doc["kv"]["k"].GetString()) == "v");
}

TEST_CASE("parseWorkerOutput")
{
   SECTION("defaults")
   {
      auto out = parseWorkerOutput("{}");
      CHECK(out.response == ExecutionResponse{});
      CHECK(!out.kv);
   }
   SECTION("all fields")
   {
      auto out = parseWorkerOutput(
          R"({"status":404,"headers":[{"name":"a","value":"1"},{"name":"a","value":"2"}],)"
          R"("body":"bm9wZQ==","kv":{"x":"y"},"extra":[1,2,3]})");
      CHECK(out.response.status == 404);
      CHECK(out.response.headers == std::vector<Header>{{"a", "1"}, {"a", "2"}});
      CHECK(out.response.body == bytes("nope"));
      CHECK(out.kv == KvMap{{"x", "y"}});
   }
   SECTION("utf-8 body")
   {
      auto out = parseWorkerOutput(R"({"body":"héllo","bodyEncoding":"utf-8"})");
      CHECK(out.response.body == bytes("héllo"));
   }
   SECTION("violations")
   {
      CHECK_THROWS_AS(parseWorkerOutput(""), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput("[]"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"status":"200"})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"status":99})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"status":-1})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"headers":[{"name":"a"}]})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"headers":{"a":1}})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"headers":"a"})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"body":5})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"body":"a","bodyEncoding":"gzip"})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"kv":[]})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"kv":{"a":1}})"), ProtocolError);
   }
   SECTION("header names must be tokens")
   {
      CHECK(parseWorkerOutput(R"({"headers":{"X-Custom_1.v~":"ok"}})").response.headers ==
            std::vector<Header>{{"X-Custom_1.v~", "ok"}});
      CHECK_THROWS_AS(parseWorkerOutput(R"({"headers":{"":"v"}})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"headers":{"X A":"v"}})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"headers":{"X-A:":"v"}})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"headers":[{"name":"X\r\nY","value":"v"}]})"),
                      ProtocolError);
   }
   SECTION("header values must not split the response")
   {
      CHECK_THROWS_WITH(
          parseWorkerOutput(R"({"headers":[{"name":"X-A","value":"v\r\n\r\nHTTP/1.1 200 OK"}]})"),
          "header X-A has a control character in its value");
      CHECK_THROWS_AS(parseWorkerOutput(R"({"headers":{"X-A":"v\nSet-Cookie: a=b"}})"),
                      ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"headers":{"X-A":"v\u0000"}})"), ProtocolError);
      CHECK(parseWorkerOutput(R"({"headers":{"X-A":"a, b;\tq=1"}})").response.headers ==
            std::vector<Header>{{"X-A", "a, b;\tq=1"}});
   }
   SECTION("bodiless statuses")
   {
      CHECK_THROWS_WITH(parseWorkerOutput(R"({"status":204,"body":"aGk="})"),
                        "status 204 must not have a body");
      CHECK_THROWS_AS(parseWorkerOutput(R"({"status":304,"body":"aGk="})"), ProtocolError);
      CHECK_THROWS_AS(parseWorkerOutput(R"({"status":101,"body":"x","bodyEncoding":"utf-8"})"),
                      ProtocolError);
      CHECK(parseWorkerOutput(R"({"status":204})").response.status == 204);
      CHECK(parseWorkerOutput(R"({"status":304,"body":""})").response.body.empty());
   }
}
