#pragma once

#include <wws/Manifest.hpp>
#include <wws/WasmBinary.hpp>

#include <eosio/vm/argument_proxy.hpp>
#include <eosio/vm/span.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wws
{
   /// Module name of every host function import
   constexpr std::string_view hostModuleName = "wws";

   struct HostImport
   {
      std::string_view          name;
      std::optional<Capability> capability;
      FuncType                  type;
   };

   // Returns nullptr for unknown names
   const HostImport* findHostImport(std::string_view name);

   /// Thrown by abortMessage
   struct WorkerAbort : std::runtime_error
   {
      using std::runtime_error::runtime_error;
   };

   /// A worker exceeded a resource limit enforced by the host
   struct ResourceLimitError : std::runtime_error
   {
      using std::runtime_error::runtime_error;
   };

   /// Host functions available to one execution of a worker
   struct NativeFunctions
   {
      CapabilitySet              capabilities;
      std::string                workerName;
      std::string                input;
      std::optional<std::string> output;
      std::size_t                maxOutputSize = 0;

      uint32_t getInput(eosio::vm::span<char> dest, uint32_t offset);
      void     setOutput(eosio::vm::span<const char> data);
      void     abortMessage(eosio::vm::span<const char> str);
      void     writeConsole(eosio::vm::span<const char> str);
      int32_t  clockTimeGet(uint32_t id, eosio::vm::argument_proxy<uint64_t*> time);
      void     getRandom(eosio::vm::span<char> dest);

      // Throws if the worker was not granted the capability
      void requireCapability(Capability c, std::string_view function) const;
   };  // NativeFunctions
}  // namespace wws
