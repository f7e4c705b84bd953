#include <wws/RouteTable.hpp>
#include <wws/check.hpp>

#include "fake_loader.hpp"
#include "test_util.hpp"

#include <sstream>

#include <catch2/catch.hpp>

using namespace wws;
using wws::test::FakeLoader;
using wws::test::TempDirectory;
using wws::test::describe;

TEST_CASE("Every worker becomes a route")
{
   TempDirectory dir;
   dir.write("index.wasm", "GET");
   dir.write("users/[id].wasm", "");
   dir.write("users/[id]/posts.wasm", "GET,POST");
   dir.write("about.wasm", "");
   dir.write("README.md", "not a worker");
   dir.write("users/[id].conf", "vars.X = 1");

   FakeLoader loader;
   auto       table = buildRouteTable(dir.path, loader);
   CHECK(table.size() == 4);
   CHECK(loader.loads == 4);
   CHECK(describe(table) == std::vector<std::string>{
                                "GET /",
                                "* /about",
                                "* /users/[id]",
                                "GET,POST /users/[id]/posts",
                            });

   SECTION("rebuilding an unchanged tree gives an equal table")
   {
      CHECK(buildRouteTable(dir.path, loader) == table);
   }

   SECTION("a changed module gives a different table")
   {
      dir.write("about.wasm", "GET");
      CHECK(!(buildRouteTable(dir.path, loader) == table));
   }
}

TEST_CASE("Hidden files and directories are skipped")
{
   TempDirectory dir;
   dir.write("a.wasm", "");
   dir.write(".hidden.wasm", "");
   dir.write(".git/x.wasm", "");
   dir.write("b/.c.wasm", "");

   CHECK(discoverWorkers(dir.path) == std::vector<std::filesystem::path>{"a.wasm"});
}

TEST_CASE("Workers that fail to load are omitted")
{
   TempDirectory dir;
   dir.write("index.wasm", "");
   dir.write("broken.wasm", "invalid");
   dir.write("[unbalanced.wasm", "");

   FakeLoader loader;
   auto       table = buildRouteTable(dir.path, loader);
   REQUIRE(table.size() == 1);
   CHECK(table.entries()[0].relativePath == "index.wasm");
}

TEST_CASE("Conflicting routes")
{
   TempDirectory dir;
   dir.write("users/index.wasm", "");
   dir.write("users.wasm", "GET");
   dir.write("items/[id].wasm", "GET");
   dir.write("items/[name].wasm", "DELETE");

   FakeLoader loader;

   SECTION("reject")
   {
      CHECK_THROWS_AS(buildRouteTable(dir.path, loader), BuildError);
   }

   SECTION("first")
   {
      auto table = buildRouteTable(dir.path, loader, {.conflicts = ConflictPolicy::first});
      CHECK(describe(table) == std::vector<std::string>{
                                   "GET /items/[id]",
                                   "DELETE /items/[name]",
                                   "* /users",
                               });
      CHECK(table.entries()[2].relativePath == "users/index.wasm");
   }

   SECTION("disjoint methods do not conflict")
   {
      std::filesystem::remove(dir.path / "users.wasm");
      auto table = buildRouteTable(dir.path, loader);
      CHECK(table.size() == 3);
   }
}

TEST_CASE("A missing root is a build error")
{
   TempDirectory dir;
   FakeLoader    loader;
   CHECK_THROWS_AS(buildRouteTable(dir.path / "missing", loader), BuildError);
   CHECK(buildRouteTable(dir.path, loader).empty());
}

TEST_CASE("ConflictPolicy parsing")
{
   std::istringstream in{"first"};
   ConflictPolicy     policy = ConflictPolicy::reject;
   in >> policy;
   CHECK(policy == ConflictPolicy::first);

   std::ostringstream out;
   out << ConflictPolicy::reject;
   CHECK(out.str() == "reject");
}

TEST_CASE("RouteTableHolder swaps snapshots")
{
   RouteTableHolder holder{std::make_shared<const RouteTable>()};
   auto             before = holder.get();
   holder.set(std::make_shared<const RouteTable>());
   CHECK(holder.get() != before);
   CHECK(before->empty());
   CHECK_THROWS(holder.set(nullptr));
}
