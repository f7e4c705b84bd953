#include <wws/RoutePattern.hpp>

#include <catch2/catch.hpp>

using namespace wws;

namespace
{
   Segment lit(std::string s)
   {
      return {Segment::literal, std::move(s)};
   }
   Segment param(std::string s)
   {
      return {Segment::parameter, std::move(s)};
   }
}  // namespace

TEST_CASE("deriveRoute maps files to patterns")
{
   CHECK(deriveRoute("index.wasm").segments.empty());
   CHECK(deriveRoute("index.wasm").str() == "/");
   CHECK(deriveRoute("about.wasm").segments == std::vector{lit("about")});
   CHECK(deriveRoute("users/[id].wasm").segments == std::vector{lit("users"), param("id")});
   CHECK(deriveRoute("users/[id].wasm").str() == "/users/[id]");
   CHECK(deriveRoute("users/index.wasm").segments == std::vector{lit("users")});
   CHECK(deriveRoute("[org]/repos/[repo]/index.wasm").segments ==
         std::vector{param("org"), lit("repos"), param("repo")});
   CHECK(deriveRoute("a/b/c.wasm").numParameters() == 0);
   CHECK(deriveRoute("[a]/[b].wasm").numParameters() == 2);
}

TEST_CASE("deriveRoute rejects invalid names")
{
   CHECK_THROWS(deriveRoute("users/[id.wasm"));
   CHECK_THROWS(deriveRoute("users/id].wasm"));
   CHECK_THROWS(deriveRoute("users/[].wasm"));
   CHECK_THROWS(deriveRoute("users/[a b].wasm"));
   CHECK_THROWS(deriveRoute("[id]/[id].wasm"));
   CHECK_THROWS(deriveRoute("users/readme.txt"));
   CHECK_THROWS(deriveRoute("/abs/index.wasm"));
}

TEST_CASE("sameStructure ignores parameter names")
{
   CHECK(deriveRoute("users/[id].wasm").sameStructure(deriveRoute("users/[name].wasm")));
   CHECK(deriveRoute("users/index.wasm").sameStructure(deriveRoute("users.wasm")));
   CHECK(!deriveRoute("users/[id].wasm").sameStructure(deriveRoute("users/me.wasm")));
   CHECK(!deriveRoute("users/[id].wasm").sameStructure(deriveRoute("users.wasm")));
}

TEST_CASE("splitRequestPath")
{
   using V = std::vector<std::string>;
   CHECK(splitRequestPath("/") == V{});
   CHECK(splitRequestPath("/users/42") == V{"users", "42"});
   CHECK(splitRequestPath("/users//42/") == V{"users", "42"});
   CHECK(splitRequestPath("/users/42?x=1/2") == V{"users", "42"});
   CHECK(splitRequestPath("/a%20b/%2F") == V{"a b", "/"});
   CHECK(splitRequestPath("/bad%2") == std::nullopt);
   CHECK(splitRequestPath("/bad%zz") == std::nullopt);
}

TEST_CASE("parseQuery")
{
   using Q = std::map<std::string, std::vector<std::string>>;
   CHECK(parseQuery("/") == Q{});
   CHECK(parseQuery("/?") == Q{});
   CHECK(parseQuery("/p?a=1&b=2&a=3") == Q{{"a", {"1", "3"}}, {"b", {"2"}}});
   CHECK(parseQuery("/p?flag&x=") == Q{{"flag", {""}}, {"x", {""}}});
   CHECK(parseQuery("/p?q=hello%20world") == Q{{"q", {"hello world"}}});
   CHECK_THROWS(parseQuery("/p?q=%g0"));
}
