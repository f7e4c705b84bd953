#include "connection.hpp"
#include "reply_builder.hpp"

#include <wws/Router.hpp>

#include <boost/algorithm/string/join.hpp>
#include <boost/asio/post.hpp>

namespace beast = boost::beast;
namespace bhttp = beast::http;

namespace wws::http
{
   namespace
   {
      std::string_view to_sv(beast::string_view s)
      {
         return {s.data(), s.size()};
      }

      ExecutionRequest make_request(connection::request_type& req,
                                    std::string_view          path,
                                    RouteMatch&               match)
      {
         ExecutionRequest result;
         result.method = std::string(req.method_string());
         result.url    = std::string(to_sv(req.target()));
         result.path   = std::string(path);
         result.query  = parseQuery(to_sv(req.target()));
         for (const auto& field : req)
            result.headers.push_back(
                {std::string(to_sv(field.name_string())), std::string(to_sv(field.value()))});
         result.body   = std::move(req.body());
         result.params = std::move(match.params);
         result.vars   = match.entry.module->config.vars;
         return result;
      }

      std::string format_allow(const MethodSet& methods)
      {
         return boost::algorithm::join(methods, ", ");
      }
   }  // namespace

   void handle_request(server_state& server, connection::request_type&& req, connection& conn)
   {
      HttpReplyBuilder builder{*server.http_config, req.version(), req.keep_alive(),
                               req.method() == bhttp::verb::head};
      try
      {
         std::string_view target = to_sv(req.target());
         std::string_view method = to_sv(req.method_string());
         std::string_view path   = target.substr(0, target.find('?'));

         Router router{server.routes->get(), server.http_config->router};
         auto   result = router.match(method, target);

         if (std::holds_alternative<NotFound>(result))
            return conn.send(builder.notFound(path));
         if (auto* mna = std::get_if<MethodNotAllowed>(&result))
            return conn.send(
                builder.methodNotAllowed(path, method, format_allow(mna->allowed)));

         auto&            match = std::get<RouteMatch>(result);
         ExecutionRequest request;
         try
         {
            request = make_request(req, path, match);
         }
         catch (std::exception& e)
         {
            return conn.send(builder.badRequest(e.what()));
         }

         // The sandbox blocks, so run it on the worker pool and post the
         // reply back to the connection's strand
         conn.suspend();
         boost::asio::post(
             *server.workers,
             [&server, builder, module = match.entry.module, request = std::move(request),
              self = conn.shared_from_this()]() mutable
             {
                ExecutionResult result;
                try
                {
                   result = server.sandbox->execute(*module, request);
                }
                catch (std::exception& e)
                {
                   result = ExecutionFailure{ExecutionFailure::Kind::runtimeTrap, e.what()};
                }
                auto* p = self.get();
                p->post(
                    [builder, result = std::move(result), self = std::move(self)]() mutable
                    {
                       connection::response_type reply;
                       try
                       {
                          reply = builder(result);
                       }
                       catch (std::exception& e)
                       {
                          WWS_LOG(self->logger, error) << "invalid worker response: " << e.what();
                          reply = builder.error(bhttp::status::internal_server_error,
                                                "ProtocolViolation: invalid response",
                                                "text/plain");
                       }
                       self->resume(std::move(reply));
                    });
             });
      }
      catch (std::exception& e)
      {
         WWS_LOG(conn.logger, error) << "request failed: " << e.what();
         conn.resume(builder.error(bhttp::status::internal_server_error, e.what()));
      }
   }

}  // namespace wws::http
