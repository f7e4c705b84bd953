#pragma once

#include <wws/ExecutionRequest.hpp>
#include <wws/http.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/vector_body.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace wws::http
{
   namespace bhttp = boost::beast::http;

   using response_type = bhttp::response<bhttp::vector_body<char>>;

   inline std::vector<char> to_vector(std::string_view s)
   {
      return std::vector(s.begin(), s.end());
   }

   // Headers that describe the connection or the framing. Beast computes these.
   inline bool is_hop_header(std::string_view name)
   {
      return boost::iequals(name, "content-length") || boost::iequals(name, "transfer-encoding") ||
             boost::iequals(name, "connection") || boost::iequals(name, "keep-alive");
   }

   inline bhttp::status failure_status(ExecutionFailure::Kind kind)
   {
      switch (kind)
      {
         case ExecutionFailure::Kind::timeout:
            return bhttp::status::gateway_timeout;
         case ExecutionFailure::Kind::resourceExceeded:
            return bhttp::status::insufficient_storage;
         case ExecutionFailure::Kind::runtimeTrap:
         case ExecutionFailure::Kind::protocolViolation:
            return bhttp::status::internal_server_error;
      }
      return bhttp::status::internal_server_error;
   }

   struct HttpReplyBuilder
   {
      const http_config& config;
      unsigned           req_version;
      bool               req_keep_alive;
      bool               req_head;

      HttpReplyBuilder(const http_config& config,
                       unsigned           version,
                       bool               keep_alive,
                       bool               head = false)
          : config(config), req_version(version), req_keep_alive(keep_alive), req_head(head)
      {
      }

      // Content-Length describes the body a GET would have returned
      void finish(response_type& res) const
      {
         res.prepare_payload();
         if (req_head)
            res.body().clear();
      }

      void setKeepAlive(response_type& res) const
      {
         res.keep_alive(req_keep_alive);
         if (req_keep_alive)
         {
            if (auto usec = config.idle_timeout_us.load(); usec >= 0)
            {
               auto sec =
                   std::chrono::duration_cast<std::chrono::seconds>(std::chrono::microseconds{usec})
                       .count();
               res.set(bhttp::field::keep_alive, "timeout=" + std::to_string(sec));
            }
         }
      }

      // Returns a method_not_allowed response
      response_type methodNotAllowed(std::string_view target,
                                     std::string_view method,
                                     std::string_view allowed_methods) const
      {
         response_type res{bhttp::status::method_not_allowed, req_version};
         res.set(bhttp::field::server, BOOST_BEAST_VERSION_STRING);
         res.set(bhttp::field::content_type, "text/html");
         res.set(bhttp::field::allow, allowed_methods);
         setKeepAlive(res);
         res.body() = to_vector("The resource '" + std::string(target) +
                                "' does not accept the method " + std::string(method) + ".");
         finish(res);
         return res;
      }

      // Returns an error response
      response_type error(bhttp::status    status,
                          std::string_view why,
                          const char*      content_type = "text/html") const
      {
         response_type res{status, req_version};
         res.set(bhttp::field::server, BOOST_BEAST_VERSION_STRING);
         res.set(bhttp::field::content_type, content_type);
         setKeepAlive(res);
         res.body() = to_vector(why);
         finish(res);
         return res;
      }

      response_type notFound(std::string_view target) const
      {
         return error(bhttp::status::not_found,
                      "The resource '" + std::string(target) + "' was not found.");
      }
      response_type badRequest(std::string_view why) const
      {
         return error(bhttp::status::bad_request, why);
      }

      response_type failure(const ExecutionFailure& f) const
      {
         return error(failure_status(f.kind), std::string(to_string(f.kind)) + ": " + f.message,
                      "text/plain");
      }

      response_type ok(const ExecutionResponse& reply) const
      {
         response_type res{bhttp::status::ok, req_version};
         res.result(reply.status);
         res.set(bhttp::field::server, BOOST_BEAST_VERSION_STRING);
         bool has_server = false;
         for (const auto& h : reply.headers)
         {
            if (is_hop_header(h.name))
               continue;
            if (boost::iequals(h.name, "server"))
            {
               if (!has_server)
                  res.erase(bhttp::field::server);
               has_server = true;
            }
            res.insert(h.name, h.value);
         }
         setKeepAlive(res);
         res.body() = reply.body;
         finish(res);
         return res;
      }

      response_type operator()(const ExecutionResult& result) const
      {
         return std::visit(
             [&](const auto& r)
             {
                if constexpr (std::is_same_v<std::decay_t<decltype(r)>, ExecutionResponse>)
                   return ok(r);
                else
                   return failure(r);
             },
             result);
      }
   };

}  // namespace wws::http
