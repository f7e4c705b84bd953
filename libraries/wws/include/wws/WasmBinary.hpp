#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wws
{
   enum class ExternalKind : std::uint8_t
   {
      function = 0,
      table    = 1,
      memory   = 2,
      global   = 3,
   };

   struct FuncType
   {
      std::vector<std::uint8_t> params;
      std::vector<std::uint8_t> results;

      friend bool operator==(const FuncType&, const FuncType&) = default;
   };

   struct WasmImport
   {
      std::string   module;
      std::string   name;
      ExternalKind  kind;
      std::uint32_t typeIndex = 0;  // only for functions
   };

   struct WasmExport
   {
      std::string   name;
      ExternalKind  kind;
      std::uint32_t index;
   };

   struct MemoryLimits
   {
      std::uint32_t                initial;
      std::optional<std::uint32_t> maximum;
   };

   struct CustomSection
   {
      std::string       name;
      std::vector<char> data;
   };

   /// The parts of a module's structure that matter for validation
   ///
   /// Function bodies are skipped; the engine validates them when it
   /// compiles the module.
   struct WasmBinary
   {
      std::vector<FuncType>      types;
      std::vector<WasmImport>    imports;
      std::vector<std::uint32_t> functions;
      std::vector<MemoryLimits>  memories;
      std::vector<WasmExport>    exports;
      std::vector<CustomSection> customSections;

      std::uint32_t        numImportedFunctions() const;
      const WasmExport*    findExport(std::string_view name) const;
      const CustomSection* findCustomSection(std::string_view name) const;
      // Functions are indexed with imports first, as in the binary
      const FuncType* functionType(std::uint32_t funcIndex) const;
   };

   // Throws std::runtime_error if the binary is malformed
   WasmBinary inspectWasm(std::span<const char> code);

}  // namespace wws
