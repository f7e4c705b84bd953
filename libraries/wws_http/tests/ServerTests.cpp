#include <wws/http.hpp>

#include <wws/WorkerModule.hpp>

#include "test_util.hpp"
#include "wasm_builder.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <sstream>

#include <catch2/catch.hpp>

using namespace wws;
using namespace wws::test;

namespace net   = boost::asio;
namespace beast = boost::beast;
namespace bhttp = beast::http;
using tcp       = net::ip::tcp;

namespace
{
   using request  = bhttp::request<bhttp::string_body>;
   using response = bhttp::response<bhttp::string_body>;

   constexpr std::string_view indexOutput =
       R"({"status":201,"headers":[{"name":"X-Worker","value":"index"}],)"
       R"("bodyEncoding":"utf-8","body":"hello"})";

   // Loops until interrupted
   std::vector<char> spinWorker()
   {
      auto b = WasmBuilder::worker();
      b.start(Code{}.spin());
      return b.build();
   }

   request makeRequest(bhttp::verb method, std::string target, std::string body = {})
   {
      request req{method, target, 11};
      req.set(bhttp::field::host, "localhost");
      req.body() = std::move(body);
      return req;
   }

   // A running server over a temporary worker tree
   struct TestServer
   {
      TempDirectory                      dir;
      net::io_context                    ctx;
      std::shared_ptr<http::http_config> config = std::make_shared<http::http_config>();
      std::shared_ptr<RouteTableHolder>  routes;
      std::shared_ptr<Sandbox>           sandbox;
      std::unique_ptr<WasmModuleLoader>  loader;
      http::server_service*              service = nullptr;

      TestServer()
      {
         dir.write("index.wasm", constantWorker(indexOutput, "methods = GET"));
         dir.write("echo/[name].wasm", echoWorker("methods = POST, PUT"));
         dir.write("echo/[name].conf", "vars.MODE = test");
         dir.write("spin.wasm", spinWorker());
         dir.write("head.wasm", constantWorker(indexOutput, "methods = GET, HEAD"));
         dir.write("bodyless.wasm", constantWorker(R"({"status":204,"body":"aGk="})"));

         loader = std::make_unique<WasmModuleLoader>(LoaderConfig{});
         routes = std::make_shared<RouteTableHolder>(
             std::make_shared<const RouteTable>(buildRouteTable(dir.path, *loader)));
         SandboxConfig limits{.timeout = std::chrono::milliseconds(100)};
         sandbox = std::make_shared<Sandbox>(limits, std::make_shared<KvStore>());

         config->num_threads      = 1;
         config->worker_threads   = 2;
         config->max_request_size = 1024;
         config->listen           = http::parse_listen_tcp("127.0.0.1", 0);

         service = &net::make_service<http::server_service>(ctx, config, routes, sandbox);
         service->start();
      }
      ~TestServer() { service->stop(); }

      response send(request req)
      {
         net::io_context   ioc;
         beast::tcp_stream stream{ioc};
         stream.connect(service->local_endpoint());
         req.prepare_payload();
         bhttp::write(stream, req);
         beast::flat_buffer buffer;
         response           res;
         bhttp::read(stream, buffer, res);
         beast::error_code ec;
         stream.socket().shutdown(tcp::socket::shutdown_both, ec);
         return res;
      }
   };

}  // namespace

TEST_CASE("HTTP server")
{
   TestServer server;
   CHECK(server.service->local_endpoint().port() != 0);

   SECTION("worker responses are returned to the client")
   {
      auto res = server.send(makeRequest(bhttp::verb::get, "/"));
      CHECK(res.result_int() == 201);
      CHECK(res["X-Worker"] == "index");
      CHECK(res.body() == "hello");
   }

   SECTION("the request reaches the worker")
   {
      auto req = makeRequest(bhttp::verb::post, "/echo/abc?x=1", "payload");
      req.set("X-Test", "yes");
      auto res = server.send(std::move(req));
      CHECK(res.result_int() == 200);
      CHECK(res.body() == "payload");
      CHECK(res["X-Test"] == "yes");
   }

   SECTION("unknown paths are not found")
   {
      CHECK(server.send(makeRequest(bhttp::verb::get, "/missing/page")).result_int() == 404);
      CHECK(server.send(makeRequest(bhttp::verb::get, "/echo/a/b")).result_int() == 404);
   }

   SECTION("methods outside the manifest are not allowed")
   {
      auto res = server.send(makeRequest(bhttp::verb::delete_, "/echo/abc"));
      CHECK(res.result_int() == 405);
      CHECK(res[bhttp::field::allow] == "POST, PUT");
   }

   SECTION("malformed queries are rejected")
   {
      auto res = server.send(makeRequest(bhttp::verb::post, "/echo/abc?q=%zz"));
      CHECK(res.result_int() == 400);
   }

   SECTION("oversized bodies are rejected")
   {
      auto req = makeRequest(bhttp::verb::post, "/echo/abc", std::string(2048, 'x'));
      auto res = server.send(std::move(req));
      CHECK(res.result_int() == 413);
      CHECK(!res.keep_alive());
   }

   SECTION("runaway workers time out")
   {
      auto res = server.send(makeRequest(bhttp::verb::get, "/spin"));
      CHECK(res.result_int() == 504);
      CHECK(res.body().starts_with("Timeout: "));
   }

   SECTION("connections are kept alive between requests")
   {
      net::io_context   ioc;
      beast::tcp_stream stream{ioc};
      stream.connect(server.service->local_endpoint());
      beast::flat_buffer buffer;
      for (int i = 0; i < 3; ++i)
      {
         auto req = makeRequest(bhttp::verb::put, "/echo/n", std::to_string(i));
         req.prepare_payload();
         bhttp::write(stream, req);
         response res;
         bhttp::read(stream, buffer, res);
         CHECK(res.result_int() == 200);
         CHECK(res.body() == std::to_string(i));
         CHECK(res.keep_alive());
      }
   }

   SECTION("pipelined requests are answered in order")
   {
      std::ostringstream batch;
      for (auto req : {makeRequest(bhttp::verb::put, "/echo/a", "first"),
                       makeRequest(bhttp::verb::get, "/"),
                       makeRequest(bhttp::verb::get, "/missing"),
                       makeRequest(bhttp::verb::put, "/echo/b", "fourth")})
      {
         req.prepare_payload();
         batch << req;
      }

      net::io_context   ioc;
      beast::tcp_stream stream{ioc};
      stream.connect(server.service->local_endpoint());
      net::write(stream, net::buffer(batch.str()));

      beast::flat_buffer                            buffer;
      std::vector<std::pair<unsigned, std::string>> results;
      for (int i = 0; i < 4; ++i)
      {
         response res;
         bhttp::read(stream, buffer, res);
         results.emplace_back(res.result_int(), res.body());
      }
      CHECK(results[0] == std::pair<unsigned, std::string>{200, "first"});
      CHECK(results[1] == std::pair<unsigned, std::string>{201, "hello"});
      CHECK(results[2].first == 404);
      CHECK(results[3] == std::pair<unsigned, std::string>{200, "fourth"});
   }

   SECTION("HEAD responses carry no body")
   {
      net::io_context   ioc;
      beast::tcp_stream stream{ioc};
      stream.connect(server.service->local_endpoint());
      beast::flat_buffer buffer;

      auto head = makeRequest(bhttp::verb::head, "/head");
      head.prepare_payload();
      bhttp::write(stream, head);
      bhttp::response_parser<bhttp::string_body> parser;
      parser.skip(true);
      bhttp::read(stream, buffer, parser);
      CHECK(parser.get().result_int() == 201);
      CHECK(parser.get()[bhttp::field::content_length] == "5");
      CHECK(parser.get().body().empty());

      // The next response on the connection is not shifted by a stray body
      auto get = makeRequest(bhttp::verb::get, "/head");
      get.prepare_payload();
      bhttp::write(stream, get);
      response res;
      bhttp::read(stream, buffer, res);
      CHECK(res.result_int() == 201);
      CHECK(res.body() == "hello");
   }

   SECTION("an invalid worker response does not stop the server")
   {
      auto res = server.send(makeRequest(bhttp::verb::get, "/bodyless"));
      CHECK(res.result_int() == 500);
      CHECK(res.body().starts_with("ProtocolViolation: "));
      CHECK(server.send(makeRequest(bhttp::verb::get, "/")).result_int() == 201);
   }

   SECTION("swapped route tables take effect")
   {
      server.routes->set(std::make_shared<const RouteTable>());
      CHECK(server.send(makeRequest(bhttp::verb::get, "/")).result_int() == 404);
   }
}

TEST_CASE("listen addresses")
{
   CHECK(http::parse_listen_tcp("localhost", 8080) ==
         tcp::endpoint{net::ip::address_v4::loopback(), 8080});
   CHECK(http::parse_listen_tcp("::1", 80).address().is_v6());
   CHECK_THROWS(http::parse_listen_tcp("not an address", 80));
}
