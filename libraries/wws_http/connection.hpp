#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/vector_body.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <wws/log.hpp>

#include "server_state.hpp"

namespace wws::http
{
   /// One accepted TCP connection
   ///
   /// Requests are read and answered in order. Responses that are ready
   /// while an earlier one is still being written wait in `outgoing`, and
   /// reading stops while a worker runs or the backlog is full. All members
   /// run on the connection's strand.
   class connection : public std::enable_shared_from_this<connection>
   {
     public:
      using request_type  = boost::beast::http::request<boost::beast::http::vector_body<char>>;
      using response_type = boost::beast::http::response<boost::beast::http::vector_body<char>>;

      static constexpr std::size_t max_pipelined = 8;

      connection(server_state& server, boost::asio::ip::tcp::socket&& socket);
      ~connection();

      void start();

      // Queues a response behind any that are still being written
      void send(response_type&& msg);

      // Stops reading until resume is called
      void suspend();
      void resume(response_type&& msg);

      template <typename F>
      void post(F&& f)
      {
         boost::asio::post(stream.get_executor(), std::forward<F>(f));
      }

      server_state&          server;
      loggers::common_logger logger;

     private:
      using parser_type = boost::beast::http::request_parser<boost::beast::http::vector_body<char>>;
      using scoped_attribute = decltype(boost::log::add_scoped_logger_attribute(
          std::declval<loggers::common_logger&>(),
          std::string(),
          boost::log::attributes::constant{std::string()}));

      bool wants_read() const
      {
         return !reading && !busy && !closing && !closed && outgoing.size() < max_pipelined;
      }
      void maybe_read();
      void on_read(boost::beast::error_code ec, std::size_t);
      void write_front();
      void on_write(boost::beast::error_code ec, std::size_t);

      void arm_idle_timer();
      void disarm_idle_timer();
      void on_idle(boost::beast::error_code ec);

      void shutdown();
      void close_on_error(const char* what, boost::beast::error_code ec);

      boost::beast::tcp_stream                                     stream;
      boost::beast::flat_buffer                                    buffer;
      std::optional<parser_type>                                   parser;
      boost::asio::steady_timer                                    idle;
      std::deque<response_type>                                    outgoing;
      std::optional<std::pair<scoped_attribute, scoped_attribute>> request_attrs;

      bool reading = false;
      bool busy    = false;
      // No more requests will be read. Close once outgoing drains.
      bool closing = false;
      bool closed  = false;
   };

   void handle_request(server_state& server, connection::request_type&& req, connection& conn);

}  // namespace wws::http
