#include "connection.hpp"
#include "reply_builder.hpp"

#include <boost/asio/socket_base.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <sstream>

namespace beast = boost::beast;
namespace bhttp = beast::http;
using std::chrono::steady_clock;

namespace wws::http
{
   connection::connection(server_state& server, boost::asio::ip::tcp::socket&& socket)
       : server(server),
         logger(loggers::channel("http")),
         stream(std::move(socket)),
         idle(stream.get_executor())
   {
      std::ostringstream        ss;
      boost::system::error_code ec;
      ss << stream.socket().remote_endpoint(ec);
      logger.add_attribute("RemoteEndpoint",
                           boost::log::attributes::constant<std::string>(ss.str()));
   }

   connection::~connection()
   {
      WWS_LOG(logger, debug) << "Connection closed";
   }

   void connection::start()
   {
      WWS_LOG(logger, debug) << "Accepted connection";
      maybe_read();
   }

   void connection::maybe_read()
   {
      if (!wants_read())
         return;
      parser.emplace();
      parser->body_limit(server.http_config->max_request_size);
      reading = true;
      arm_idle_timer();
      bhttp::async_read(stream, buffer, *parser,
                        beast::bind_front_handler(&connection::on_read, shared_from_this()));
   }

   void connection::on_read(beast::error_code ec, std::size_t)
   {
      reading = false;
      if (closed)
         return;

      if (ec == bhttp::error::end_of_stream)
      {
         closing = true;
         if (outgoing.empty() && !busy)
            shutdown();
         return;
      }

      if (ec == bhttp::error::body_limit)
      {
         WWS_LOG(logger, warning) << "read: " << ec.message();
         HttpReplyBuilder builder{*server.http_config, parser->get().version(), false};
         return send(builder.error(bhttp::status::payload_too_large, "Request body too large"));
      }

      if (ec)
         return close_on_error("read", ec);

      {
         const auto& req = parser->get();
         request_attrs.emplace(
             boost::log::add_scoped_logger_attribute(
                 logger, "RequestMethod",
                 boost::log::attributes::constant{std::string(req.method_string())}),
             boost::log::add_scoped_logger_attribute(
                 logger, "RequestTarget",
                 boost::log::attributes::constant{std::string(req.target())}));
         WWS_LOG(logger, debug) << "Received HTTP request";
      }

      handle_request(server, parser->release(), *this);
      maybe_read();
   }

   void connection::send(response_type&& msg)
   {
      {
         BOOST_LOG_SCOPED_LOGGER_TAG(logger, "ResponseStatus",
                                     static_cast<unsigned>(msg.result_int()));
         WWS_LOG(logger, info) << "Handled HTTP request";
         request_attrs.reset();
      }
      if (closed)
         return;
      if (msg.need_eof())
         closing = true;
      outgoing.push_back(std::move(msg));
      if (outgoing.size() == 1)
         write_front();
      maybe_read();
   }

   void connection::suspend()
   {
      busy = true;
      disarm_idle_timer();
   }

   void connection::resume(response_type&& msg)
   {
      busy = false;
      send(std::move(msg));
   }

   void connection::write_front()
   {
      arm_idle_timer();
      // The deque keeps the front element in place until on_write pops it
      bhttp::async_write(stream, outgoing.front(),
                         beast::bind_front_handler(&connection::on_write, shared_from_this()));
   }

   void connection::on_write(beast::error_code ec, std::size_t)
   {
      if (closed)
         return;
      if (ec)
         return close_on_error("write", ec);

      bool eof = outgoing.front().need_eof();
      outgoing.pop_front();
      if (eof)
         return shutdown();
      if (!outgoing.empty())
         return write_front();
      if (closing && !busy)
         return shutdown();
      if (busy)
         disarm_idle_timer();
      else if (!reading)
         maybe_read();
      else
         arm_idle_timer();
   }

   void connection::arm_idle_timer()
   {
      auto usec = server.http_config->idle_timeout_us.load();
      if (usec < 0)
         return;
      idle.expires_after(std::chrono::microseconds{usec});
      idle.async_wait(beast::bind_front_handler(&connection::on_idle, shared_from_this()));
   }

   void connection::disarm_idle_timer()
   {
      idle.expires_at(steady_clock::time_point::max());
   }

   void connection::on_idle(beast::error_code ec)
   {
      // A rearmed timer may still deliver a completion for an older wait
      if (ec || closed || busy || idle.expiry() > steady_clock::now())
         return;
      beast::error_code close_ec;
      stream.socket().close(close_ec);
      if (close_ec)
         WWS_LOG(logger, warning) << "close: " << close_ec.message();
      else
         WWS_LOG(logger, debug) << "Idle connection closed";
      closed = true;
   }

   void connection::shutdown()
   {
      if (closed)
         return;
      closed = true;
      idle.cancel();
      beast::error_code ec;
      stream.socket().shutdown(boost::asio::socket_base::shutdown_both, ec);
      if (ec)
         WWS_LOG(logger, warning) << "shutdown: " << ec.message();
      stream.socket().close(ec);
      if (ec)
         WWS_LOG(logger, warning) << "close: " << ec.message();
   }

   void connection::close_on_error(const char* what, beast::error_code ec)
   {
      WWS_LOG(logger, warning) << what << ": " << ec.message();
      if (closed)
         return;
      closed = true;
      idle.cancel();
      beast::error_code close_ec;
      stream.socket().close(close_ec);
      if (close_ec)
         WWS_LOG(logger, warning) << "close: " << close_ec.message();
   }

}  // namespace wws::http
