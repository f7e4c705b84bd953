#pragma once

#include <wws/ExecutionRequest.hpp>
#include <wws/KvStore.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wws
{
   /// The worker's output does not follow the host/guest contract
   struct ProtocolError : std::runtime_error
   {
      using std::runtime_error::runtime_error;
   };

   /// Serializes the input handed to a worker. `kv` is present only
   /// for workers granted the kv capability.
   std::string serializeRequest(const ExecutionRequest& request, const KvMap* kv = nullptr);

   struct WorkerOutput
   {
      ExecutionResponse    response;
      std::optional<KvMap> kv;
   };

   // Throws ProtocolError
   WorkerOutput parseWorkerOutput(std::string_view json);

}  // namespace wws
