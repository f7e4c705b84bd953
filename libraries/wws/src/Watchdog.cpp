#include <wws/Watchdog.hpp>

#include <wws/check.hpp>

#include <pthread.h>

namespace wws
{
   namespace
   {
      WallClock::time_point deadlineAfter(WallClock::duration limit)
      {
         check(limit.count() >= 0, "watchdog limit must not be negative");
         auto now = WallClock::now();
         if (limit >= WallClock::time_point::max() - now)
            return WallClock::time_point::max();
         return now + limit;
      }
   }  // namespace

   WatchdogManager::WatchdogManager()
       : worker{[this]
                {
                   pthread_setname_np(pthread_self(), "wws-watchdog");
                   run();
                }}
   {
   }

   WatchdogManager::~WatchdogManager()
   {
      {
         std::lock_guard l{mutex};
         done = true;
      }
      cond.notify_one();
      worker.join();
   }

   void WatchdogManager::arm(Watchdog& wd)
   {
      bool earliest;
      {
         std::lock_guard l{mutex};
         wd.position = pending.emplace(wd.when, &wd);
         earliest    = *wd.position == pending.begin();
      }
      if (earliest)
         cond.notify_one();
   }

   void WatchdogManager::disarm(Watchdog& wd)
   {
      std::lock_guard l{mutex};
      if (wd.position)
      {
         pending.erase(*wd.position);
         wd.position.reset();
      }
   }

   void WatchdogManager::run()
   {
      std::unique_lock l{mutex};
      while (!done)
      {
         auto now = WallClock::now();
         while (!pending.empty() && pending.begin()->first <= now)
         {
            Watchdog* wd = pending.begin()->second;
            pending.erase(pending.begin());
            wd->position.reset();
            wd->fired = true;
            wd->handler();
         }
         if (pending.empty() || pending.begin()->first == WallClock::time_point::max())
            cond.wait(l);
         else
            cond.wait_until(l, pending.begin()->first);
      }
   }

   Watchdog::Watchdog(WatchdogManager& m, WallClock::time_point deadline, std::function<void()> f)
       : manager(&m), when(deadline), handler(std::move(f))
   {
      manager->arm(*this);
   }

   Watchdog::Watchdog(WatchdogManager& m, WallClock::duration limit, std::function<void()> f)
       : Watchdog(m, deadlineAfter(limit), std::move(f))
   {
   }

   Watchdog::~Watchdog()
   {
      manager->disarm(*this);
   }

   bool Watchdog::expired() const
   {
      std::lock_guard l{manager->mutex};
      return fired;
   }

}  // namespace wws
