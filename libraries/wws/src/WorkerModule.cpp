#define OPENSSL_SUPPRESS_DEPRECATED

#include <wws/WorkerModule.hpp>

#include <wws/NativeFunctions.hpp>
#include <wws/RoutePattern.hpp>
#include <wws/WasmBinary.hpp>
#include <wws/check.hpp>
#include <wws/log.hpp>

#include <algorithm>
#include <boost/multi_index/key.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index_container.hpp>
#include <fstream>
#include <future>
#include <iterator>
#include <map>
#include <mutex>
#include <openssl/sha.h>
#include <system_error>

namespace bmi = boost::multi_index;

namespace wws
{
   namespace
   {
      loggers::common_logger& loaderLog()
      {
         static auto log = loggers::channel("loader");
         return log;
      }
   }  // namespace

   VMOptions VMOptions::withMemoryCeiling(std::uint32_t mebibytes)
   {
      VMOptions result;
      result.max_pages = mebibytes * (1024 * 1024 / wasm_page_size);
      return result;
   }

   std::string compilerVersion(const VMOptions& options)
   {
#ifdef __x86_64__
      std::string result = "eos-vm-jit";
#else
      std::string result = "eos-vm-interpreter";
#endif
      result += "/pages=" + std::to_string(options.max_pages);
      result += "/depth=" + std::to_string(options.max_call_depth);
      return result;
   }

   std::string contentHash(std::span<const char> code)
   {
      unsigned char hash[SHA256_DIGEST_LENGTH];
      SHA256_CTX    ctx;
      SHA256_Init(&ctx);
      SHA256_Update(&ctx, (const unsigned char*)code.data(), code.size());
      SHA256_Final(hash, &ctx);

      static constexpr char digits[] = "0123456789abcdef";
      std::string           result;
      for (auto b : hash)
      {
         result.push_back(digits[b >> 4]);
         result.push_back(digits[b & 0xf]);
      }
      return result;
   }

   struct ModuleCacheKey
   {
      std::string path;
      std::string hash;
      std::string compilerVersion;

      friend auto operator<=>(const ModuleCacheKey&, const ModuleCacheKey&) = default;
   };

   struct ModuleEntry
   {
      ModuleCacheKey                  key;
      std::shared_ptr<CompiledModule> module;
   };

   struct ByAge;
   struct ByKey;

   using ModuleContainer = bmi::multi_index_container<
       ModuleEntry,
       bmi::indexed_by<bmi::sequenced<bmi::tag<ByAge>>,
                       bmi::ordered_unique<bmi::tag<ByKey>, bmi::key<&ModuleEntry::key>>>>;

   struct InFlight
   {
      ModuleCacheKey                                     key;
      std::shared_future<std::shared_ptr<CompiledModule>> result;
   };

   struct ModuleCacheImpl
   {
      mutable std::mutex              mutex;
      std::uint32_t                   cacheSize;
      std::string                     compilerVersion;
      ModuleCache::Compile            compile;
      ModuleContainer                 modules;
      std::map<std::string, InFlight> inFlight;

      // Called with mutex held
      std::shared_ptr<CompiledModule> find(const ModuleCacheKey& key)
      {
         auto& ind = modules.get<ByKey>();
         auto  it  = ind.find(key);
         if (it == ind.end())
            return nullptr;
         auto& age = modules.get<ByAge>();
         age.relocate(age.end(), modules.project<ByAge>(it));
         return it->module;
      }

      // Called with mutex held
      void add(ModuleEntry&& entry)
      {
         auto& ind = modules.get<ByAge>();
         ind.push_back(std::move(entry));
         while (ind.size() > cacheSize)
            ind.pop_front();
      }
   };

   ModuleCache::ModuleCache(std::uint32_t cacheSize, std::string compilerVersion, Compile compile)
       : impl{std::make_unique<ModuleCacheImpl>()}
   {
      impl->cacheSize       = cacheSize;
      impl->compilerVersion = std::move(compilerVersion);
      impl->compile         = std::move(compile);
   }

   ModuleCache::~ModuleCache() {}

   namespace
   {
      // Relative and absolute spellings of one file share an entry
      std::string canonicalKey(const std::filesystem::path& path)
      {
         std::error_code ec;
         auto            result = std::filesystem::weakly_canonical(path, ec);
         if (ec)
            return path.lexically_normal().string();
         return result.string();
      }
   }  // namespace

   std::shared_ptr<CompiledModule> ModuleCache::get(const std::filesystem::path& path,
                                                    const std::string&           hash,
                                                    std::vector<char>            code)
   {
      ModuleCacheKey key{canonicalKey(path), hash, impl->compilerVersion};
      std::promise<std::shared_ptr<CompiledModule>> promise;
      {
         std::unique_lock l{impl->mutex};
         while (true)
         {
            if (auto module = impl->find(key))
               return module;
            auto pos = impl->inFlight.find(key.path);
            if (pos == impl->inFlight.end())
               break;
            auto pending = pos->second.result;
            if (pos->second.key == key)
            {
               l.unlock();
               return pending.get();
            }
            // A different version of the same file is compiling. Wait for
            // it to finish before starting ours.
            l.unlock();
            pending.wait();
            l.lock();
         }
         impl->inFlight.insert({key.path, InFlight{key, promise.get_future().share()}});
      }

      std::shared_ptr<CompiledModule> module;
      try
      {
         module = impl->compile(std::move(code));
      }
      catch (...)
      {
         {
            std::lock_guard l{impl->mutex};
            impl->inFlight.erase(key.path);
         }
         promise.set_exception(std::current_exception());
         throw;
      }
      WWS_LOG(loaderLog(), debug) << "Compiled " << key.path << " " << key.hash;
      {
         std::lock_guard l{impl->mutex};
         impl->add({key, module});
         impl->inFlight.erase(key.path);
      }
      promise.set_value(module);
      return module;
   }

   std::size_t ModuleCache::size() const
   {
      std::lock_guard l{impl->mutex};
      return impl->modules.size();
   }

   WorkerManifest validateModule(std::span<const char> code, const LoaderConfig& config)
   {
      auto bin = inspectWasm(code);

      WorkerManifest manifest;
      auto           numManifests =
          std::count_if(bin.customSections.begin(), bin.customSections.end(),
                        [](const auto& sec) { return sec.name == manifestSectionName; });
      check(numManifests <= 1, "duplicate manifest section");
      if (auto* sec = bin.findCustomSection(manifestSectionName))
      {
         try
         {
            manifest = parseManifest({sec->data.data(), sec->data.size()});
         }
         catch (std::exception& e)
         {
            abortMessage(std::string("invalid manifest: ") + e.what());
         }
      }
      check(manifest.abi == abiVersion,
            "unsupported abi version " + std::to_string(manifest.abi));

      for (const auto& imp : bin.imports)
      {
         auto name = imp.module + "." + imp.name;
         check(imp.kind == ExternalKind::function, "unsupported import " + name);
         check(imp.module == hostModuleName, "unknown import " + name);
         auto* host = findHostImport(imp.name);
         check(host != nullptr, "unknown import " + name);
         check(bin.types[imp.typeIndex] == host->type, "import " + name + " has the wrong type");
         if (host->capability)
            check(manifest.capabilities.contains(*host->capability),
                  "import " + name + " requires undeclared capability " +
                      std::string(to_string(*host->capability)));
      }

      for (std::size_t i = 0; i < numCapabilities; ++i)
      {
         auto cap = static_cast<Capability>(i);
         check(!manifest.capabilities.contains(cap) || config.allowedCapabilities.contains(cap),
               "capability " + std::string(to_string(cap)) + " is not allowed");
      }

      auto* entry = bin.findExport(manifest.entry);
      check(entry != nullptr, "missing entry point " + manifest.entry);
      check(entry->kind == ExternalKind::function, "entry point " + manifest.entry +
                                                        " is not a function");
      auto* entryType = bin.functionType(entry->index);
      check(entryType != nullptr, "entry point index out of range");
      check(*entryType == FuncType{}, "entry point " + manifest.entry + " must take no arguments "
                                      "and return nothing");

      auto* memory = bin.findExport("memory");
      check(memory != nullptr && memory->kind == ExternalKind::memory, "missing memory export");
      check(!bin.memories.empty(), "missing memory");
      check(bin.memories.front().initial <= config.vmOptions.max_pages,
            "initial memory exceeds the memory ceiling");
      return manifest;
   }

   namespace
   {
      std::vector<char> readWholeFile(const std::filesystem::path& path)
      {
         std::ifstream in(path, std::ios_base::binary);
         check(in.is_open(), "cannot open file");
         std::vector<char> result{std::istreambuf_iterator<char>(in),
                                  std::istreambuf_iterator<char>()};
         check(!in.bad(), "read failed");
         return result;
      }
   }  // namespace

   WasmModuleLoader::WasmModuleLoader(const LoaderConfig& config)
       : WasmModuleLoader(config,
                          [opts = config.vmOptions](std::vector<char> code)
                          { return std::make_shared<CompiledModule>(std::move(code), opts); })
   {
   }

   WasmModuleLoader::WasmModuleLoader(const LoaderConfig& config, ModuleCache::Compile compile)
       : cfg(config),
         moduleCache(config.cacheSize, compilerVersion(config.vmOptions), std::move(compile))
   {
   }

   std::shared_ptr<const WorkerModule> WasmModuleLoader::load(
       const std::filesystem::path& rootDir,
       const std::filesystem::path& relativePath)
   {
      auto result          = std::make_shared<WorkerModule>();
      result->path         = rootDir / relativePath;
      result->relativePath = relativePath;
      try
      {
         auto code            = readWholeFile(result->path);
         result->manifest     = validateModule(code, cfg);
         result->contentHash  = contentHash(code);

         auto sidecar = result->path;
         sidecar.replace_extension(".conf");
         if (std::filesystem::exists(sidecar))
         {
            std::ifstream in(sidecar);
            check(in.is_open(), "cannot open " + sidecar.string());
            result->config = parseWorkerConfig(in, sidecar.filename().string());
         }
         result->kvNamespace =
             result->config.kvNamespace.value_or(deriveRoute(relativePath).str());

         result->compiled = moduleCache.get(result->path, result->contentHash, std::move(code));
      }
      catch (LoadError&)
      {
         throw;
      }
      catch (std::exception& e)
      {
         throw LoadError(relativePath, e.what());
      }
      return result;
   }

}  // namespace wws
