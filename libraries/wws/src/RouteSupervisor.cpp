#include <wws/RouteSupervisor.hpp>

#include <wws/check.hpp>
#include <wws/log.hpp>

#include <pthread.h>

namespace wws
{
   namespace
   {
      loggers::common_logger& watchLog()
      {
         static auto log = loggers::channel("watch");
         return log;
      }
   }  // namespace

   TreeSnapshot takeSnapshot(const std::filesystem::path& rootDir)
   {
      TreeSnapshot    result;
      std::error_code ec;
      using std::filesystem::directory_options;
      std::filesystem::recursive_directory_iterator it{
          rootDir, directory_options::follow_directory_symlink, ec},
          end;
      for (; !ec && it != end; it.increment(ec))
      {
         auto name = it->path().filename().string();
         if (name.starts_with('.'))
         {
            if (it->is_directory(ec))
               it.disable_recursion_pending();
            continue;
         }
         auto ext = it->path().extension();
         if ((ext == ".wasm" || ext == ".conf") && it->is_regular_file(ec))
         {
            auto size  = it->file_size(ec);
            auto mtime = it->last_write_time(ec);
            if (!ec)
               result[std::filesystem::relative(it->path(), rootDir)] = {size, mtime};
         }
         // A file that vanished while scanning shows up in the next snapshot
         ec.clear();
      }
      return result;
   }

   RouteSupervisor::RouteSupervisor(std::filesystem::path rootDir,
                                    ModuleLoader&         loader,
                                    RouteTableHolder&     holder,
                                    const WatchOptions&   options)
       : rootDir(std::move(rootDir)),
         loader(loader),
         holder(holder),
         options(options),
         last(takeSnapshot(this->rootDir))
   {
   }

   RouteSupervisor::~RouteSupervisor()
   {
      stop();
   }

   void RouteSupervisor::start()
   {
      check(!worker.joinable(), "watcher already running");
      done   = false;
      worker = std::thread{[this]
                           {
                              pthread_setname_np(pthread_self(), "wws-watch");
                              run();
                           }};
      WWS_LOG(watchLog(), info) << "Watching " << rootDir.string();
   }

   void RouteSupervisor::stop()
   {
      {
         std::lock_guard l{mutex};
         done = true;
      }
      cond.notify_one();
      if (worker.joinable())
         worker.join();
   }

   void RouteSupervisor::run()
   {
      std::unique_lock l{mutex};
      while (!cond.wait_for(l, options.interval, [this] { return done; }))
      {
         l.unlock();
         poll();
         l.lock();
      }
   }

   bool RouteSupervisor::poll()
   {
      auto snapshot = takeSnapshot(rootDir);
      if (snapshot == last)
         return false;
      last = std::move(snapshot);
      WWS_LOG(watchLog(), debug) << "Change detected under " << rootDir.string();
      return rebuild();
   }

   bool RouteSupervisor::rebuild()
   {
      try
      {
         auto table = std::make_shared<const RouteTable>(
             buildRouteTable(rootDir, loader, options.build));
         holder.set(table);
         WWS_LOG(watchLog(), notice) << "Route table updated: " << table->size() << " routes";
         if (listener)
            listener(*table);
         return true;
      }
      catch (const BuildError& e)
      {
         WWS_LOG(watchLog(), warning) << "Rebuild failed, keeping previous routes: " << e.what();
         return false;
      }
   }

}  // namespace wws
