#pragma once

#include <boost/asio/thread_pool.hpp>
#include <memory>

namespace wws
{
   class RouteTableHolder;
   class Sandbox;
}  // namespace wws

namespace wws::http
{

   struct http_config;

   struct server_state
   {
      std::shared_ptr<const http::http_config>  http_config = {};
      std::shared_ptr<RouteTableHolder>         routes      = {};
      std::shared_ptr<Sandbox>                  sandbox     = {};
      std::unique_ptr<boost::asio::thread_pool> workers     = {};
   };

}  // namespace wws::http
