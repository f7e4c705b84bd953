#include <wws/ExecutionContext.hpp>
#include <wws/log.hpp>

#include <sstream>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

using namespace wws;

int main(int argc, const char* const* argv)
{
   loggers::Config logConfig{.minLevel = loggers::level::critical, .timestamps = false};
   std::string     level;

   Sandbox::registerHostFunctions();

   Catch::Session session;

   using Catch::clara::Opt;
   auto cli = session.cli() |
              Opt(level, "level")["--log-level"]("Minimum severity of server log messages");
   session.cli(cli);

   if (int res = session.applyCommandLine(argc, argv))
      return res;

   if (!level.empty())
   {
      std::istringstream in{level};
      in >> logConfig.minLevel;
      if (!in)
      {
         std::cerr << "invalid log level: " << level << "\n";
         return 1;
      }
   }
   loggers::configure(logConfig);

   return session.run();
}
