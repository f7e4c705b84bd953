#include <wws/NativeFunctions.hpp>

#include <wws/log.hpp>

#include <algorithm>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <chrono>
#include <cstring>
#include <random>

namespace wws
{
   namespace
   {
      constexpr std::uint8_t i32 = 0x7f;

      // wasi errno
      constexpr int32_t wasi_errno_inval = 28;

      const HostImport hostImports[] = {
          {"getInput", std::nullopt, {{i32, i32, i32}, {i32}}},
          {"setOutput", std::nullopt, {{i32, i32}, {}}},
          {"abortMessage", std::nullopt, {{i32, i32}, {}}},
          {"writeConsole", Capability::console, {{i32, i32}, {}}},
          {"clockTimeGet", Capability::clock, {{i32, i32}, {i32}}},
          {"getRandom", Capability::random, {{i32, i32}, {}}},
      };

      loggers::common_logger& sandboxLog()
      {
         static auto log = loggers::channel("sandbox");
         return log;
      }
   }  // namespace

   const HostImport* findHostImport(std::string_view name)
   {
      for (const auto& imp : hostImports)
         if (imp.name == name)
            return &imp;
      return nullptr;
   }

   void NativeFunctions::requireCapability(Capability c, std::string_view function) const
   {
      if (!capabilities.contains(c))
         throw std::runtime_error(std::string(function) + " requires capability " +
                                  std::string(to_string(c)));
   }

   uint32_t NativeFunctions::getInput(eosio::vm::span<char> dest, uint32_t offset)
   {
      if (offset < input.size() && dest.size())
         memcpy(dest.data(), input.data() + offset, std::min(input.size() - offset, dest.size()));
      return input.size();
   }

   void NativeFunctions::setOutput(eosio::vm::span<const char> data)
   {
      if (data.size() > maxOutputSize)
         throw ResourceLimitError("response is larger than " + std::to_string(maxOutputSize) +
                                  " bytes");
      output.emplace(data.begin(), data.end());
   }

   void NativeFunctions::abortMessage(eosio::vm::span<const char> str)
   {
      throw WorkerAbort("worker '" + workerName +
                        "' aborted with message: " + std::string(str.data(), str.size()));
   }

   void NativeFunctions::writeConsole(eosio::vm::span<const char> str)
   {
      requireCapability(Capability::console, "writeConsole");
      std::string_view message{str.data(), str.size()};
      while (message.ends_with('\n'))
         message.remove_suffix(1);
      WWS_LOG(sandboxLog(), info) << boost::log::add_value("Worker", workerName) << message;
   }

   int32_t NativeFunctions::clockTimeGet(uint32_t id, eosio::vm::argument_proxy<uint64_t*> time)
   {
      requireCapability(Capability::clock, "clockTimeGet");
      std::chrono::nanoseconds result;
      if (id == 0)
      {  // CLOCK_REALTIME
         result = std::chrono::system_clock::now().time_since_epoch();
      }
      else if (id == 1)
      {  // CLOCK_MONOTONIC
         result = std::chrono::steady_clock::now().time_since_epoch();
      }
      else
      {
         return wasi_errno_inval;
      }
      *time = result.count();
      return 0;
   }

   void NativeFunctions::getRandom(eosio::vm::span<char> dest)
   {
      requireCapability(Capability::random, "getRandom");
      std::random_device rng;
      std::ranges::generate(dest, [&] { return static_cast<char>(rng()); });
   }
}  // namespace wws
