#include <wws/Router.hpp>

#include <catch2/catch.hpp>

using namespace wws;

namespace
{
   RouteEntry entry(const std::string& path, MethodSet methods = {})
   {
      auto module              = std::make_shared<WorkerModule>();
      module->relativePath     = path;
      module->contentHash      = path;
      module->manifest.methods = methods;
      return RouteEntry{deriveRoute(path), std::move(methods), path, std::move(module)};
   }

   Router makeRouter(std::vector<RouteEntry> entries, RouterOptions options = {})
   {
      return Router{std::make_shared<const RouteTable>(std::move(entries)), options};
   }

   // The relative path of the matched worker, or "404"/"405"
   std::string resolve(const Router& router, std::string_view method, std::string_view target)
   {
      auto result = router.match(method, target);
      if (auto* m = std::get_if<RouteMatch>(&result))
         return m->entry.relativePath.generic_string();
      if (std::holds_alternative<NotFound>(result))
         return "404";
      return "405";
   }
}  // namespace

TEST_CASE("Index and parameter routes")
{
   auto router = makeRouter({entry("index.wasm", {"GET"}), entry("users/[id].wasm")});

   auto root = router.match("GET", "/");
   REQUIRE(std::holds_alternative<RouteMatch>(root));
   CHECK(std::get<RouteMatch>(root).entry.relativePath == "index.wasm");
   CHECK(std::get<RouteMatch>(root).params.empty());

   auto user = router.match("GET", "/users/42");
   REQUIRE(std::holds_alternative<RouteMatch>(user));
   CHECK(std::get<RouteMatch>(user).entry.relativePath == "users/[id].wasm");
   CHECK(std::get<RouteMatch>(user).params == std::map<std::string, std::string>{{"id", "42"}});

   CHECK(std::holds_alternative<NotFound>(router.match("GET", "/users")));

   auto post = router.match("POST", "/");
   REQUIRE(std::holds_alternative<MethodNotAllowed>(post));
   CHECK(std::get<MethodNotAllowed>(post).allowed == MethodSet{"GET"});
}

TEST_CASE("Literal segments outrank parameters")
{
   auto router = makeRouter({entry("a/[x].wasm"), entry("a/b.wasm")});
   CHECK(resolve(router, "GET", "/a/b") == "a/b.wasm");
   CHECK(resolve(router, "GET", "/a/c") == "a/[x].wasm");

   auto m = std::get<RouteMatch>(router.match("GET", "/a/c"));
   CHECK(m.params == std::map<std::string, std::string>{{"x", "c"}});
}

TEST_CASE("Fewer remaining parameters wins")
{
   auto router = makeRouter(
       {entry("[a]/[b]/c.wasm"), entry("[a]/b/[c].wasm"), entry("x/[y]/[z].wasm")});
   CHECK(resolve(router, "GET", "/q/b/c") == "[a]/b/[c].wasm");
   CHECK(resolve(router, "GET", "/q/r/c") == "[a]/[b]/c.wasm");
   CHECK(resolve(router, "GET", "/x/b/c") == "x/[y]/[z].wasm");
   CHECK(resolve(router, "GET", "/q/r/s") == "404");
}

TEST_CASE("Parameters are decoded and the query string is ignored")
{
   auto router = makeRouter({entry("files/[name].wasm")});
   auto m      = router.match("GET", "/files/a%20b.txt?download=1");
   REQUIRE(std::holds_alternative<RouteMatch>(m));
   CHECK(std::get<RouteMatch>(m).params.at("name") == "a b.txt");
   CHECK(resolve(router, "GET", "/files/%zz") == "404");
   CHECK(resolve(router, "GET", "/files/") == "404");
}

TEST_CASE("Method constraints")
{
   auto entries =
       std::vector{entry("items/[id].wasm", {"GET"}), entry("items/new.wasm", {"POST"})};

   SECTION("fallthrough to a less specific route")
   {
      auto router = makeRouter(entries);
      CHECK(resolve(router, "POST", "/items/new") == "items/new.wasm");
      CHECK(resolve(router, "GET", "/items/new") == "items/[id].wasm");
      CHECK(resolve(router, "DELETE", "/items/new") == "405");
      auto result = router.match("DELETE", "/items/new");
      CHECK(std::get<MethodNotAllowed>(result).allowed == MethodSet{"GET", "POST"});
   }

   SECTION("without fallthrough")
   {
      auto router = makeRouter(entries, {.methodFallthrough = false});
      CHECK(resolve(router, "POST", "/items/new") == "items/new.wasm");
      CHECK(resolve(router, "GET", "/items/new") == "405");
      CHECK(std::get<MethodNotAllowed>(router.match("GET", "/items/new")).allowed ==
            MethodSet{"POST"});
      CHECK(resolve(router, "GET", "/items/7") == "items/[id].wasm");
   }

   SECTION("same pattern with disjoint methods")
   {
      auto router = makeRouter({entry("users/[id].wasm", {"GET"}),
                                entry("users/[name].wasm", {"PUT"})});
      CHECK(resolve(router, "GET", "/users/1") == "users/[id].wasm");
      CHECK(resolve(router, "PUT", "/users/1") == "users/[name].wasm");
      auto m = std::get<RouteMatch>(router.match("PUT", "/users/1"));
      CHECK(m.params == std::map<std::string, std::string>{{"name", "1"}});
      CHECK(resolve(router, "PATCH", "/users/1") == "405");
   }
}

TEST_CASE("Empty table")
{
   auto router = makeRouter({});
   CHECK(resolve(router, "GET", "/") == "404");
}

TEST_CASE("Table order is independent of insertion order")
{
   auto a = RouteTable{{entry("b.wasm"), entry("[x].wasm"), entry("a/index.wasm")}};
   auto b = RouteTable{{entry("a/index.wasm"), entry("b.wasm"), entry("[x].wasm")}};
   CHECK(a == b);
   REQUIRE(a.size() == 3);
   CHECK(a.entries()[0].relativePath == "a/index.wasm");
   CHECK(a.entries()[2].relativePath == "[x].wasm");
}
