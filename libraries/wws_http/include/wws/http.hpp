#pragma once

#include <wws/ExecutionContext.hpp>
#include <wws/RouteTable.hpp>
#include <wws/Router.hpp>

#include <atomic>
#include <boost/asio/execution_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace wws::http
{
   struct http_config
   {
      uint32_t                       num_threads      = 2;
      uint32_t                       worker_threads   = 0;  // 0 means one per core
      uint32_t                       max_request_size = 8 << 20;
      std::atomic<int64_t>           idle_timeout_us  = 30'000'000;
      boost::asio::ip::tcp::endpoint listen;
      RouterOptions                  router;
   };

   boost::asio::ip::tcp::endpoint parse_listen_tcp(const std::string& host, unsigned short port);

   struct server_impl;
   class server_service : public boost::asio::execution_context::service
   {
     public:
      using key_type = server_service;
      explicit server_service(boost::asio::execution_context& ctx);
      server_service(boost::asio::execution_context&           ctx,
                     const std::shared_ptr<const http_config>& http_config,
                     const std::shared_ptr<RouteTableHolder>&  routes,
                     const std::shared_ptr<Sandbox>&           sandbox);

      // Throws if the listen socket cannot be opened
      void start();
      // Stops accepting connections, then stops all threads
      void stop();

      boost::asio::ip::tcp::endpoint local_endpoint() const;

     private:
      void                         shutdown() noexcept override;
      std::shared_ptr<server_impl> impl;
   };

}  // namespace wws::http
