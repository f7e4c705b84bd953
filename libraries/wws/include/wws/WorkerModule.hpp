#pragma once

#include <wws/Manifest.hpp>

#include <compare>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace wws
{
   struct VMOptions
   {
      static constexpr std::uint32_t wasm_page_size = 64 * 1024;

      std::uint32_t max_mutable_global_bytes = 1024;
      std::uint32_t max_table_elements       = 8192;
      std::uint32_t max_section_elements     = 8191;
      std::uint32_t max_linear_memory_init   = 64 * 1024;
      std::uint32_t max_func_local_bytes     = 8192;
      std::uint32_t max_local_sets           = 1023;
      std::uint32_t max_nested_structures    = 1023;
      std::uint32_t max_br_table_elements    = 8191;
      std::uint32_t max_symbol_bytes         = 8191;
      std::uint32_t max_memory_offset        = 64 * 1024 * 1024 - 1;
      std::uint32_t max_pages                = 1024;
      std::uint32_t max_call_depth           = 251;

      static VMOptions withMemoryCeiling(std::uint32_t mebibytes);

      friend auto operator<=>(const VMOptions&, const VMOptions&) = default;
   };

   /// Identifies the engine configuration that produced a compiled module
   std::string compilerVersion(const VMOptions& options);

   /// Hex SHA-256 of a module's bytes
   std::string contentHash(std::span<const char> code);

   struct CompiledModuleImpl;

   /// A validated module ready for execution
   ///
   /// The code is immutable and shared by all concurrent executions. Each
   /// execution takes a private engine instance from an internal pool.
   struct CompiledModule
   {
      std::unique_ptr<CompiledModuleImpl> impl;

      // Parses and links the module. Throws std::runtime_error.
      CompiledModule(std::vector<char> code, const VMOptions& options);
      ~CompiledModule();

      std::span<const char> code() const;
      const VMOptions&      vmOptions() const;
      std::size_t           idleInstances() const;
   };

   /// Immutable description of a loaded worker
   struct WorkerModule
   {
      std::filesystem::path           path;
      std::filesystem::path           relativePath;
      std::string                     contentHash;
      WorkerManifest                  manifest;
      WorkerConfig                    config;
      // Defaults to the route pattern
      std::string                     kvNamespace;
      std::shared_ptr<CompiledModule> compiled;

      const std::string&   entry() const { return manifest.entry; }
      const CapabilitySet& capabilities() const { return manifest.capabilities; }
      const MethodSet&     methods() const { return manifest.methods; }
   };

   class ModuleLoader
   {
     public:
      virtual ~ModuleLoader() = default;
      // Throws LoadError
      virtual std::shared_ptr<const WorkerModule> load(
          const std::filesystem::path& rootDir,
          const std::filesystem::path& relativePath) = 0;
   };

   struct ModuleCacheImpl;

   /// Bounded LRU of compiled modules keyed by (path, content hash, compiler version)
   ///
   /// At most one compilation per path is in flight. Other callers for the
   /// same path wait for its result.
   class ModuleCache
   {
     public:
      using Compile = std::function<std::shared_ptr<CompiledModule>(std::vector<char> code)>;

      ModuleCache(std::uint32_t cacheSize, std::string compilerVersion, Compile compile);
      ~ModuleCache();

      std::shared_ptr<CompiledModule> get(const std::filesystem::path& path,
                                          const std::string&           hash,
                                          std::vector<char>            code);
      std::size_t                     size() const;

     private:
      std::unique_ptr<ModuleCacheImpl> impl;
   };

   struct LoaderConfig
   {
      VMOptions     vmOptions;
      CapabilitySet allowedCapabilities = CapabilitySet::all();
      std::uint32_t cacheSize           = 256;
   };

   /// Loads workers from disk, validating them against the host/guest contract
   class WasmModuleLoader : public ModuleLoader
   {
     public:
      explicit WasmModuleLoader(const LoaderConfig& config);
      WasmModuleLoader(const LoaderConfig& config, ModuleCache::Compile compile);

      std::shared_ptr<const WorkerModule> load(const std::filesystem::path& rootDir,
                                               const std::filesystem::path& relativePath) override;

      const LoaderConfig& config() const { return cfg; }
      ModuleCache&        cache() { return moduleCache; }

     private:
      LoaderConfig cfg;
      ModuleCache  moduleCache;
   };

   /// Checks a module against the contract: imports, exports, manifest,
   /// capabilities and the memory ceiling. Throws std::runtime_error.
   WorkerManifest validateModule(std::span<const char> code, const LoaderConfig& config);

}  // namespace wws
