#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace wws
{
   // Worker executions are limited by wall-clock time, so that a worker
   // blocked in a host call is also interrupted.
   using WallClock = std::chrono::steady_clock;

   class Watchdog;

   // Owns a single thread that fires watchdogs in deadline order
   class WatchdogManager
   {
     public:
      WatchdogManager();
      ~WatchdogManager();

     private:
      friend class Watchdog;
      using Queue = std::multimap<WallClock::time_point, Watchdog*>;

      void arm(Watchdog& wd);
      void disarm(Watchdog& wd);
      void run();

      std::mutex              mutex;
      std::condition_variable cond;
      Queue                   pending;
      bool                    done = false;
      std::thread             worker;
   };

   /// Calls its handler once if it is still alive at its deadline
   ///
   /// The handler runs on the manager's thread with the manager locked, so
   /// it never runs after the destructor returns. It must be safe to call
   /// concurrently with the guarded execution.
   class Watchdog
   {
     public:
      Watchdog(WatchdogManager& m, WallClock::time_point deadline, std::function<void()> f);
      // Throws if limit is negative. A limit too large to represent never fires.
      Watchdog(WatchdogManager& m, WallClock::duration limit, std::function<void()> f);
      ~Watchdog();

      Watchdog(const Watchdog&)            = delete;
      Watchdog& operator=(const Watchdog&) = delete;

      WallClock::time_point deadline() const { return when; }
      bool                  expired() const;

     private:
      friend class WatchdogManager;
      WatchdogManager*                                manager;
      WallClock::time_point                           when;
      std::function<void()>                           handler;
      std::optional<WatchdogManager::Queue::iterator> position;
      bool                                            fired = false;
   };

}  // namespace wws
