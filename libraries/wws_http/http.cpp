#include "wws/http.hpp"
#include "wws/check.hpp"
#include "wws/log.hpp"

#include "connection.hpp"
#include "server_state.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

namespace net = boost::asio;
using tcp     = boost::asio::ip::tcp;

namespace wws::http
{
   struct server_impl : server_state
   {
      net::io_context          ioc;
      tcp::acceptor            acceptor{net::make_strand(ioc)};
      tcp::endpoint            endpoint;
      loggers::common_logger   logger = loggers::channel("http");
      std::vector<std::thread> io_threads;
      std::mutex               mutex;
      bool                     running = false;

      server_impl(const std::shared_ptr<const http::http_config>& http_config,
                  const std::shared_ptr<RouteTableHolder>&  routes,
                  const std::shared_ptr<Sandbox>&           sandbox)
          : server_state{http_config, routes, sandbox}
      {
      }

      ~server_impl() { stop(); }

      void open(const tcp::endpoint& address)
      {
         boost::system::error_code ec;
         auto                      require = [&](const char* step)
         {
            if (!ec)
               return;
            WWS_LOG(logger, error) << step << " " << address << ": " << ec.message();
            throw std::runtime_error("unable to open listen socket: " + ec.message());
         };
         acceptor.open(address.protocol(), ec);
         require("open");
         acceptor.set_option(net::socket_base::reuse_address(true), ec);
         require("set_option");
         acceptor.bind(address, ec);
         require("bind");
         acceptor.listen(net::socket_base::max_listen_connections, ec);
         require("listen");
         endpoint = acceptor.local_endpoint();
         WWS_LOG(logger, info) << "Listening on " << endpoint;
      }

      // Each accepted socket is bound to its own strand
      void accept_next()
      {
         acceptor.async_accept(net::make_strand(ioc),
                               [this](boost::system::error_code ec, tcp::socket socket)
                               {
                                  if (ec == net::error::operation_aborted)
                                     return;
                                  if (ec)
                                     WWS_LOG(logger, warning) << "accept: " << ec.message();
                                  else
                                     std::make_shared<connection>(*this, std::move(socket))
                                         ->start();
                                  accept_next();
                               });
      }

      void start()
      {
         std::lock_guard l{mutex};
         check(!running, "server already started");
         open(http_config->listen);

         auto num_workers = http_config->worker_threads;
         if (num_workers == 0)
            num_workers = std::max(1u, std::thread::hardware_concurrency());
         workers = std::make_unique<net::thread_pool>(num_workers);

         accept_next();
         running = true;
         for (unsigned i = 0; i < http_config->num_threads; ++i)
            io_threads.emplace_back(
                [this, name = "wws-http-" + std::to_string(i)]
                {
                   pthread_setname_np(pthread_self(), name.c_str());
                   ioc.run();
                });
      }

      // Connections still open are dropped with the io_context
      void stop()
      {
         std::lock_guard l{mutex};
         if (!running)
            return;
         running = false;
         ioc.stop();
         for (auto& t : io_threads)
            t.join();
         io_threads.clear();
         workers->join();
         boost::system::error_code ec;
         acceptor.close(ec);
         WWS_LOG(logger, info) << "Stopped TCP listener";
      }
   };

   tcp::endpoint parse_listen_tcp(const std::string& host, unsigned short port)
   {
      boost::system::error_code ec;
      auto                      addr = net::ip::make_address(host, ec);
      if (!ec)
         return {addr, port};
      check(host == "localhost", "Invalid listen address: " + host);
      return {net::ip::make_address("127.0.0.1"), port};
   }

   server_service::server_service(net::execution_context& ctx) : service(ctx) {}

   server_service::server_service(net::execution_context&                   ctx,
                                  const std::shared_ptr<const http_config>& http_config,
                                  const std::shared_ptr<RouteTableHolder>&  routes,
                                  const std::shared_ptr<Sandbox>&           sandbox)
       : service(ctx), impl(std::make_shared<server_impl>(http_config, routes, sandbox))
   {
   }

   void server_service::start()
   {
      check(impl->http_config->num_threads > 0, "too few threads");
      impl->start();
   }

   void server_service::stop()
   {
      impl->stop();
   }

   void server_service::shutdown() noexcept
   {
      if (impl)
         impl->stop();
   }

   tcp::endpoint server_service::local_endpoint() const
   {
      return impl->endpoint;
   }

}  // namespace wws::http
