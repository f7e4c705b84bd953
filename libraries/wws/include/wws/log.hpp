#pragma once

#include <boost/log/attributes/constant.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>

namespace wws
{
   namespace loggers
   {
      enum class level : std::uint32_t
      {
         debug,
         info,
         notice,
         warning,
         error,
         critical,
      };
      std::ostream& operator<<(std::ostream&, const level&);
      std::istream& operator>>(std::istream& is, level& l);
      using common_logger = boost::log::sources::severity_logger_mt<level>;
      BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)

      // Returns a logger tagged with the given Channel attribute
      common_logger channel(const std::string& name);

      struct Config
      {
         level minLevel   = level::info;
         bool  timestamps = true;
      };

      // Installs a single console sink on stderr, replacing any
      // previously configured sinks.
      void configure(const Config&);
      // Reads log-level and log-timestamps
      void configure(const boost::program_options::variables_map&);
   }  // namespace loggers

#define WWS_LOG(logger, log_level) BOOST_LOG_SEV(logger, ::wws::loggers::level::log_level)
}  // namespace wws
