#include <wws/ConfigFile.hpp>
#include <wws/ExecutionContext.hpp>
#include <wws/RouteSupervisor.hpp>
#include <wws/RouteTable.hpp>
#include <wws/check.hpp>
#include <wws/http.hpp>
#include <wws/log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace wws;

const char usage[] = "USAGE: wws <root> [options]";

namespace
{
   struct ServerOptions
   {
      std::string              hostname;
      unsigned short           port;
      uint32_t                 http_threads;
      uint32_t                 worker_threads;
      uint32_t                 timeout_ms;
      uint32_t                 max_memory_mib;
      uint32_t                 max_request_size;
      std::size_t              max_response_size;
      int64_t                  idle_timeout;
      bool                     watch;
      uint32_t                 watch_interval_ms;
      ConflictPolicy           conflicts;
      bool                     method_fallthrough;
      std::vector<std::string> capabilities;
      uint32_t                 cache_size;
   };

   CapabilitySet parseCapabilities(const std::vector<std::string>& names)
   {
      if (names.empty())
         return CapabilitySet::all();
      CapabilitySet result;
      for (const auto& name : names)
      {
         auto c = capabilityFromString(name);
         check(c.has_value(), "Unknown capability: " + name);
         result.insert(*c);
      }
      return result;
   }

   void printRoutes(const RouteTable& table)
   {
      if (table.empty())
         std::cout << "No workers found\n";
      for (const auto& entry : table.entries())
         std::cout << "  " << entry.describe() << "\n";
      std::cout.flush();
   }

   void run(const std::filesystem::path& root, const ServerOptions& opts)
   {
      auto& logger = loggers::generic::get();

      check(std::filesystem::is_directory(root), "Not a directory: " + root.string());

      Sandbox::registerHostFunctions();

      LoaderConfig loaderConfig;
      loaderConfig.vmOptions           = VMOptions::withMemoryCeiling(opts.max_memory_mib);
      loaderConfig.allowedCapabilities = parseCapabilities(opts.capabilities);
      loaderConfig.cacheSize           = opts.cache_size;
      WasmModuleLoader loader{loaderConfig};

      BuildOptions buildOptions{.conflicts = opts.conflicts};
      auto         table = std::make_shared<const RouteTable>(
          buildRouteTable(root, loader, buildOptions));
      std::cout << "Routes:\n";
      printRoutes(*table);
      auto holder = std::make_shared<RouteTableHolder>(table);

      auto sandbox = std::make_shared<Sandbox>(
          SandboxConfig{.timeout         = std::chrono::milliseconds{opts.timeout_ms},
                        .maxResponseSize = opts.max_response_size},
          std::make_shared<KvStore>());

      auto http_config              = std::make_shared<http::http_config>();
      http_config->num_threads      = opts.http_threads;
      http_config->worker_threads   = opts.worker_threads;
      http_config->max_request_size = opts.max_request_size;
      http_config->idle_timeout_us  = opts.idle_timeout < 0 ? -1 : opts.idle_timeout * 1000000;
      http_config->listen           = http::parse_listen_tcp(opts.hostname, opts.port);
      http_config->router.methodFallthrough = opts.method_fallthrough;

      boost::asio::io_context ioc;
      auto&                   server =
          boost::asio::make_service<http::server_service>(ioc, http_config, holder, sandbox);
      server.start();

      std::optional<RouteSupervisor> supervisor;
      if (opts.watch)
      {
         supervisor.emplace(root, loader, *holder,
                            WatchOptions{.interval = std::chrono::milliseconds{
                                             opts.watch_interval_ms},
                                         .build    = buildOptions});
         supervisor->onSwap(
             [](const RouteTable& table)
             {
                std::cout << "Routes:\n";
                printRoutes(table);
             });
         supervisor->start();
         WWS_LOG(logger, info) << "Watching " << root.string() << " for changes";
      }

      boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
      signals.async_wait(
          [&](const boost::system::error_code& ec, int signo)
          {
             if (!ec)
                WWS_LOG(logger, info) << "Received signal " << signo;
          });
      ioc.run();

      if (supervisor)
         supervisor->stop();
      server.stop();
   }
}  // namespace

int main(int argc, char* argv[])
{
   ServerOptions  opts;
   std::string    root;
   std::string    config_path;
   loggers::level log_level;
   bool           log_timestamps;

   namespace po = boost::program_options;

   po::options_description common_opts("Options");
   auto                    opt = common_opts.add_options();
   opt("hostname,o", po::value(&opts.hostname)->default_value("127.0.0.1")->value_name("address"),
       "Address on which the server accepts connections");
   opt("port,p", po::value(&opts.port)->default_value(8080)->value_name("port"),
       "Port on which the server accepts connections");
   opt("http-threads", po::value(&opts.http_threads)->default_value(2)->value_name("num"),
       "The number of threads that handle connections");
   opt("worker-threads", po::value(&opts.worker_threads)->default_value(0, "")->value_name("num"),
       "The number of threads that run workers. Defaults to the number of cores");
   opt("timeout-ms", po::value(&opts.timeout_ms)->default_value(5000)->value_name("ms"),
       "Wall-clock limit for a single worker execution");
   opt("max-memory-mib", po::value(&opts.max_memory_mib)->default_value(64)->value_name("MiB"),
       "Maximum linear memory of a worker");
   opt("max-request-size",
       po::value(&opts.max_request_size)->default_value(8 << 20, "8 MiB")->value_name("bytes"),
       "Maximum size of a request body");
   opt("max-response-size",
       po::value(&opts.max_response_size)->default_value(8 << 20, "8 MiB")->value_name("bytes"),
       "Maximum size of a worker's serialized response");
   opt("idle-timeout", po::value(&opts.idle_timeout)->default_value(30)->value_name("seconds"),
       "Close keep-alive connections after this much idle time. Negative disables the limit");
   opt("watch", po::bool_switch(&opts.watch), "Rebuild the routes when the worker tree changes");
   opt("watch-interval-ms",
       po::value(&opts.watch_interval_ms)->default_value(1000)->value_name("ms"),
       "How often to check the worker tree for changes");
   opt("route-conflicts",
       po::value(&opts.conflicts)->default_value(ConflictPolicy::reject)->value_name("policy"),
       "reject: ambiguous routes are an error. first: keep the route with the smallest path");
   opt("method-fallthrough",
       po::value(&opts.method_fallthrough)->default_value(true)->value_name("bool"),
       "Try less specific routes when the most specific one does not allow the method");
   opt("allow-capability",
       po::value(&opts.capabilities)->composing()->default_value({}, "all")->value_name("name"),
       "A capability that workers may be granted (console, clock, random, kv)");
   opt("cache-size", po::value(&opts.cache_size)->default_value(256)->value_name("num"),
       "Maximum number of compiled modules kept in memory");
   opt("log-level", po::value(&log_level)->default_value(loggers::level::info)->value_name("level"),
       "Minimum severity of log messages");
   opt("log-timestamps", po::value(&log_timestamps)->default_value(true)->value_name("bool"),
       "Prefix log messages with a timestamp");

   po::options_description desc("wws");
   desc.add(common_opts);
   auto add_cmdonly = [](auto& opts)
   {
      opts.add_options()("help,h", "Show this message")("version,V", "Print version information")(
          "config,c", po::value<std::string>()->value_name("path"), "Read options from a file");
   };
   add_cmdonly(desc);
   desc.add_options()("root", po::value(&root), "Directory containing the workers");

   po::positional_options_description positional;
   positional.add("root", 1);

   po::variables_map vm;
   try
   {
      po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
                vm);
      if (auto iter = vm.find("config"); iter != vm.end())
      {
         config_path = iter->second.as<std::string>();
         std::ifstream in(config_path);
         check(in.is_open(), "Cannot open config file: " + config_path);
         po::store(wws::parse_config_file(in, common_opts, config_path), vm);
      }
      po::notify(vm);
   }
   catch (std::exception& e)
   {
      if (!vm.count("help") && !vm.count("version"))
      {
         std::cerr << e.what() << "\n";
         return 1;
      }
   }

   if (vm.count("help"))
   {
      add_cmdonly(common_opts);
      std::cerr << usage << "\n\n";
      std::cerr << common_opts << "\n";
      return 1;
   }

   if (vm.count("version"))
   {
      std::cerr << "wws " << WWS_VERSION_MAJOR << "." << WWS_VERSION_MINOR << "."
                << WWS_VERSION_PATCH << "\n";
      return 1;
   }

   if (root.empty())
   {
      std::cerr << usage << "\n";
      return 1;
   }

   try
   {
      loggers::configure(vm);
      run(root, opts);
      WWS_LOG(loggers::generic::get(), info) << "Shutdown";
      return 0;
   }
   catch (BuildError& e)
   {
      WWS_LOG(loggers::generic::get(), critical) << "Cannot build routes: " << e.what();
   }
   catch (std::exception& e)
   {
      WWS_LOG(loggers::generic::get(), error) << e.what();
   }
   return 1;
}
