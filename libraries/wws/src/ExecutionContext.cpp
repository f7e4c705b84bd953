#include <wws/ExecutionContext.hpp>

#include <wws/Abi.hpp>
#include <wws/NativeFunctions.hpp>
#include <wws/check.hpp>
#include <wws/log.hpp>

#include <atomic>
#include <eosio/vm/backend.hpp>
#include <mutex>
#include <new>
#include <vector>

using eosio::vm::span;

namespace wws
{
   struct ExecutionContextImpl;
   using rhf_t = eosio::vm::registered_host_functions<ExecutionContextImpl>;
#ifdef __x86_64__
   using backend_t = eosio::vm::backend<rhf_t, eosio::vm::jit_profile, VMOptions>;
#else
   using backend_t = eosio::vm::backend<rhf_t, eosio::vm::interpreter, VMOptions>;
#endif

   namespace
   {
      constexpr std::size_t maxIdleInstances = 8;

      // Rethrow with detailed info
      template <typename F>
      void rethrowVMExcept(F f)
      {
         try
         {
            f();
         }
         catch (const eosio::vm::exception& e)
         {
            throw std::runtime_error(std::string(e.what()) + ": " + e.detail());
         }
      }

      loggers::common_logger& sandboxLog()
      {
         static auto log = loggers::channel("sandbox");
         return log;
      }
   }  // namespace

   struct CompiledModuleImpl
   {
      std::vector<uint8_t>                    code;
      VMOptions                               vmOptions;
      std::mutex                              mutex;
      std::vector<std::unique_ptr<backend_t>> idle;

      std::unique_ptr<backend_t> get()
      {
         {
            std::lock_guard l{mutex};
            if (!idle.empty())
            {
               auto result = std::move(idle.back());
               idle.pop_back();
               result->get_module().allocator.enable_code(true);
               return result;
            }
         }
         std::unique_ptr<backend_t> result;
         rethrowVMExcept([&] { result = std::make_unique<backend_t>(code, nullptr, vmOptions); });
         return result;
      }

      void add(std::unique_ptr<backend_t> backend)
      {
         std::lock_guard l{mutex};
         if (idle.size() < maxIdleInstances)
            idle.push_back(std::move(backend));
      }
   };

   CompiledModule::CompiledModule(std::vector<char> code, const VMOptions& options)
       : impl{std::make_unique<CompiledModuleImpl>()}
   {
      impl->code.assign(code.begin(), code.end());
      impl->vmOptions = options;
      // Parses and links the module
      impl->add(impl->get());
   }

   CompiledModule::~CompiledModule() {}

   std::span<const char> CompiledModule::code() const
   {
      return {reinterpret_cast<const char*>(impl->code.data()), impl->code.size()};
   }

   const VMOptions& CompiledModule::vmOptions() const
   {
      return impl->vmOptions;
   }

   std::size_t CompiledModule::idleInstances() const
   {
      std::lock_guard l{impl->mutex};
      return impl->idle.size();
   }

   struct ExecutionMemory
   {
      eosio::vm::wasm_allocator wa;
      eosio::vm::stack_manager  altStack;
   };

   struct ExecutionContextImpl : NativeFunctions
   {
      const WorkerModule&        module;
      ExecutionMemory&           memory;
      std::unique_ptr<backend_t> backend;
      std::atomic<bool>          timedOut = false;

      ExecutionContextImpl(const WorkerModule& module, ExecutionMemory& memory)
          : module{module}, memory{memory}, backend{module.compiled->impl->get()}
      {
         capabilities = module.capabilities();
         workerName   = module.relativePath.generic_string();
      }

      void run()
      {
         backend->set_wasm_allocator(&memory.wa);
         backend->initialize(memory.altStack, this);
         backend->get_context().set_max_call_depth(module.compiled->vmOptions().max_call_depth);
         (*backend)(memory.altStack, *this, "env", module.entry());
      }

      bool memoryAtCeiling() const
      {
         return static_cast<std::uint32_t>(memory.wa.get_current_page()) >=
                module.compiled->vmOptions().max_pages;
      }

      // Must be called from within a catch block
      ExecutionFailure failure() const
      {
         using Kind = ExecutionFailure::Kind;
         if (timedOut)
            return {Kind::timeout, "worker exceeded its deadline"};
         try
         {
            throw;
         }
         catch (const ResourceLimitError& e)
         {
            return {Kind::resourceExceeded, e.what()};
         }
         catch (const std::bad_alloc&)
         {
            return {Kind::resourceExceeded, "out of memory"};
         }
         catch (const WorkerAbort& e)
         {
            return {Kind::runtimeTrap, e.what()};
         }
         catch (const eosio::vm::exception& e)
         {
            if (memoryAtCeiling())
               return {Kind::resourceExceeded, std::string("memory ceiling reached: ") + e.what()};
            return {Kind::runtimeTrap, std::string(e.what()) + ": " + e.detail()};
         }
         catch (const std::exception& e)
         {
            return {Kind::runtimeTrap, e.what()};
         }
      }

      // Cancel execution because of timeout; may be called from another thread
      void asyncTimeout()
      {
         timedOut = true;
         backend->get_module().allocator.disable_code();
      }
   };  // ExecutionContextImpl

   struct SandboxImpl
   {
      SandboxConfig                                 config;
      std::shared_ptr<KvStore>                      kvStore;
      WatchdogManager                               watchdogManager;
      mutable std::mutex                            mutex;
      std::vector<std::unique_ptr<ExecutionMemory>> memories;

      std::unique_ptr<ExecutionMemory> getMemory()
      {
         {
            std::lock_guard l{mutex};
            if (!memories.empty())
            {
               auto result = std::move(memories.back());
               memories.pop_back();
               return result;
            }
         }
         return std::make_unique<ExecutionMemory>();
      }

      void addMemory(std::unique_ptr<ExecutionMemory> memory)
      {
         std::lock_guard l{mutex};
         memories.push_back(std::move(memory));
      }
   };

   Sandbox::Sandbox(const SandboxConfig& config, std::shared_ptr<KvStore> kvStore)
       : impl{std::make_unique<SandboxImpl>()}
   {
      check(kvStore != nullptr, "missing kv store");
      impl->config  = config;
      impl->kvStore = std::move(kvStore);
   }

   Sandbox::~Sandbox() {}

   void Sandbox::registerHostFunctions()
   {
      rhf_t::add<&ExecutionContextImpl::getInput>("wws", "getInput");
      rhf_t::add<&ExecutionContextImpl::setOutput>("wws", "setOutput");
      rhf_t::add<&ExecutionContextImpl::abortMessage>("wws", "abortMessage");
      rhf_t::add<&ExecutionContextImpl::writeConsole>("wws", "writeConsole");
      rhf_t::add<&ExecutionContextImpl::clockTimeGet>("wws", "clockTimeGet");
      rhf_t::add<&ExecutionContextImpl::getRandom>("wws", "getRandom");
   }

   ExecutionResult Sandbox::execute(const WorkerModule& module, const ExecutionRequest& request)
   {
      return execute(module, request, WallClock::now() + impl->config.timeout);
   }

   ExecutionResult Sandbox::execute(const WorkerModule&     module,
                                    const ExecutionRequest& request,
                                    WallClock::time_point   deadline)
   {
      using Kind = ExecutionFailure::Kind;

      bool  hasKv = module.capabilities().contains(Capability::kv);
      KvMap kv;
      if (hasKv)
         kv = impl->kvStore->get(module.kvNamespace);

      auto memory = impl->getMemory();
      std::optional<WorkerOutput> output;
      {
         std::unique_ptr<ExecutionContextImpl> ctx;
         try
         {
            ctx = std::make_unique<ExecutionContextImpl>(module, *memory);
         }
         catch (const std::exception& e)
         {
            impl->addMemory(std::move(memory));
            return ExecutionFailure{Kind::runtimeTrap, e.what()};
         }
         ctx->input         = serializeRequest(request, hasKv ? &kv : nullptr);
         ctx->maxOutputSize = impl->config.maxResponseSize;

         try
         {
            Watchdog watchdog{impl->watchdogManager, deadline, [&ctx] { ctx->asyncTimeout(); }};
            ctx->run();
         }
         catch (const std::exception&)
         {
            auto failure = ctx->failure();
            WWS_LOG(sandboxLog(), debug) << ctx->workerName << ": " << to_string(failure.kind)
                                         << ": " << failure.message;
            impl->addMemory(std::move(memory));
            return failure;
         }
         impl->addMemory(std::move(memory));

         if (!ctx->output)
            return ExecutionFailure{Kind::protocolViolation, "worker produced no output"};
         try
         {
            output = parseWorkerOutput(*ctx->output);
         }
         catch (const ProtocolError& e)
         {
            return ExecutionFailure{Kind::protocolViolation, e.what()};
         }
         if (output->kv && !hasKv)
            return ExecutionFailure{Kind::protocolViolation,
                                    "kv output requires the kv capability"};
         module.compiled->impl->add(std::move(ctx->backend));
      }

      if (output->kv)
         impl->kvStore->replace(module.kvNamespace, std::move(*output->kv));
      return std::move(output->response);
   }

   const SandboxConfig& Sandbox::config() const
   {
      return impl->config;
   }

   KvStore& Sandbox::kvStore()
   {
      return *impl->kvStore;
   }

   std::size_t Sandbox::idleMemories() const
   {
      std::lock_guard l{impl->mutex};
      return impl->memories.size();
   }

}  // namespace wws
