#include <wws/log.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/function.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/core/record_view.hpp>
#include <boost/log/expressions/attr.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/phoenix/operator.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/log/utility/value_ref.hpp>
#include <boost/make_shared.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string_view>

namespace wws::loggers
{
   BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)

   // Available attributes: TimeStamp, Channel, Severity
   //
   // Additional attributes for specific Channels:
   // http: RequestMethod, RequestTarget, ResponseStatus
   // sandbox: Worker

   namespace
   {
      constexpr std::string_view level_names[] = {"debug",   "info",  "notice",
                                                  "warning", "error", "critical"};

      using sink_type =
          boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

      template <typename S, typename T>
      void format_timestamp(S& os, const T& timestamp)
      {
         auto date = std::chrono::floor<std::chrono::days>(timestamp);
         auto ymd  = std::chrono::year_month_day(date);
         auto time = std::chrono::hh_mm_ss(
             std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - date));
         os << std::setfill('0');
         os << std::setw(4) << (int)ymd.year() << '-' << std::setw(2) << (unsigned)ymd.month()
            << '-' << std::setw(2) << (unsigned)ymd.day();
         os << 'T' << std::setw(2) << time.hours().count() << ':' << std::setw(2)
            << time.minutes().count() << ':' << std::setw(2) << time.seconds().count() << '.'
            << std::setw(3) << time.subseconds().count() << 'Z';
         os << std::setfill(' ');
      }

      void add_timestamp_attribute()
      {
         auto core = boost::log::core::get();
         core->add_global_attribute(
             "TimeStamp", boost::log::attributes::function<std::chrono::system_clock::time_point>(
                              [] { return std::chrono::system_clock::now(); }));
      }

      auto make_formatter(bool timestamps)
      {
         return [timestamps](const boost::log::record_view&  rec,
                             boost::log::formatting_ostream& out)
         {
            std::ostringstream os;
            if (timestamps)
            {
               if (auto ts =
                       boost::log::extract<std::chrono::system_clock::time_point>("TimeStamp", rec))
               {
                  format_timestamp(os, *ts);
                  os << ' ';
               }
            }
            if (auto sev = boost::log::extract<level>("Severity", rec))
               os << '[' << *sev << "] ";
            if (auto channel = boost::log::extract<std::string>("Channel", rec))
               os << '[' << *channel << "]: ";
            if (auto message = rec[boost::log::expressions::smessage])
               os << *message;
            if (auto method = boost::log::extract<std::string>("RequestMethod", rec))
               os << ' ' << *method;
            if (auto target = boost::log::extract<std::string>("RequestTarget", rec))
               os << ' ' << *target;
            if (auto status = boost::log::extract<unsigned>("ResponseStatus", rec))
               os << " -> " << *status;
            if (auto worker = boost::log::extract<std::string>("Worker", rec))
               os << " (" << *worker << ')';
            out << os.str();
         };
      }
   }  // namespace

   std::ostream& operator<<(std::ostream& os, const level& l)
   {
      auto idx = static_cast<std::uint32_t>(l);
      if (idx < std::size(level_names))
         os << level_names[idx];
      else
         os << idx;
      return os;
   }

   std::istream& operator>>(std::istream& is, level& l)
   {
      std::string s;
      is >> s;
      for (std::uint32_t i = 0; i < std::size(level_names); ++i)
      {
         if (s == level_names[i])
         {
            l = static_cast<level>(i);
            return is;
         }
      }
      is.setstate(std::ios_base::failbit);
      return is;
   }

   common_logger channel(const std::string& name)
   {
      common_logger result;
      result.add_attribute("Channel", boost::log::attributes::constant<std::string>(name));
      return result;
   }

   void configure(const Config& config)
   {
      static bool has_timestamp = (add_timestamp_attribute(), true);
      (void)has_timestamp;

      auto core    = boost::log::core::get();
      auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);
      auto sink = boost::make_shared<sink_type>(std::move(backend));
      sink->set_formatter(make_formatter(config.timestamps));
      sink->set_filter(boost::log::expressions::attr<level>("Severity") >= config.minLevel);
      core->remove_all_sinks();
      core->add_sink(sink);
   }

   void configure(const boost::program_options::variables_map& vm)
   {
      Config config;
      if (auto iter = vm.find("log-level"); iter != vm.end())
         config.minLevel = iter->second.as<level>();
      if (auto iter = vm.find("log-timestamps"); iter != vm.end())
         config.timestamps = iter->second.as<bool>();
      configure(config);
   }
}  // namespace wws::loggers
