#pragma once

#include <wws/ExecutionRequest.hpp>
#include <wws/KvStore.hpp>
#include <wws/Watchdog.hpp>
#include <wws/WorkerModule.hpp>

#include <chrono>
#include <cstddef>
#include <memory>

namespace wws
{
   struct SandboxConfig
   {
      std::chrono::milliseconds timeout{5000};
      std::size_t               maxResponseSize = 8 << 20;
   };

   struct SandboxImpl;

   /// Runs workers in isolated instances under a deadline and a memory ceiling
   ///
   /// Every execution gets a freshly initialized instance and produces
   /// exactly one result. Failures of the worker are reported in the result;
   /// they never escape as exceptions.
   class Sandbox
   {
     public:
      Sandbox(const SandboxConfig& config, std::shared_ptr<KvStore> kvStore);
      ~Sandbox();

      // Must be called once before any module is compiled
      static void registerHostFunctions();

      ExecutionResult execute(const WorkerModule&     module,
                              const ExecutionRequest& request,
                              WallClock::time_point   deadline);
      // Uses the configured timeout
      ExecutionResult execute(const WorkerModule& module, const ExecutionRequest& request);

      const SandboxConfig& config() const;
      KvStore&             kvStore();
      std::size_t          idleMemories() const;

     private:
      std::unique_ptr<SandboxImpl> impl;
   };

}  // namespace wws
