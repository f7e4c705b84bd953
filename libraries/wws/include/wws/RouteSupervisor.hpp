#pragma once

#include <wws/RouteTable.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace wws
{
   // (size, modification time) of each watched file, by relative path
   using TreeSnapshot =
       std::map<std::filesystem::path, std::pair<std::uintmax_t, std::filesystem::file_time_type>>;

   // Workers and their sidecar files. Missing or unreadable roots yield an empty snapshot.
   TreeSnapshot takeSnapshot(const std::filesystem::path& rootDir);

   struct WatchOptions
   {
      std::chrono::milliseconds interval{1000};
      BuildOptions              build;
   };

   /// Rebuilds the route table when the worker tree changes
   ///
   /// Rebuilding happens on the supervisor's own thread. Requests keep
   /// using the previous table until the new one is swapped in. A failed
   /// rebuild leaves the previous table in place.
   class RouteSupervisor
   {
     public:
      using Listener = std::function<void(const RouteTable&)>;

      RouteSupervisor(std::filesystem::path rootDir,
                      ModuleLoader&         loader,
                      RouteTableHolder&     holder,
                      const WatchOptions&   options);
      ~RouteSupervisor();

      void start();
      void stop();

      // Rebuilds if the tree changed since the last snapshot. Returns true
      // if a new table was installed.
      bool poll();
      bool rebuild();

      void onSwap(Listener l) { listener = std::move(l); }

     private:
      void run();

      std::filesystem::path   rootDir;
      ModuleLoader&           loader;
      RouteTableHolder&       holder;
      WatchOptions            options;
      TreeSnapshot            last;
      Listener                listener;
      std::mutex              mutex;
      std::condition_variable cond;
      bool                    done = false;
      std::thread             worker;
   };

}  // namespace wws
