#pragma once

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace wws
{
   /// Version of the host/guest contract implemented by this server
   constexpr std::uint32_t abiVersion = 1;

   /// Name of the custom section holding a worker's manifest
   constexpr std::string_view manifestSectionName = "wws.manifest";

   enum class Capability : std::uint8_t
   {
      console,
      clock,
      random,
      kv,
   };
   constexpr std::size_t numCapabilities = 4;

   std::string_view          to_string(Capability c);
   std::optional<Capability> capabilityFromString(std::string_view name);

   /// An explicit set of granted capabilities
   class CapabilitySet
   {
     public:
      constexpr CapabilitySet() = default;
      constexpr CapabilitySet(std::initializer_list<Capability> caps)
      {
         for (auto c : caps)
            insert(c);
      }
      static constexpr CapabilitySet all()
      {
         CapabilitySet result;
         result.bits = (1u << numCapabilities) - 1;
         return result;
      }

      constexpr bool contains(Capability c) const { return bits & bit(c); }
      constexpr void insert(Capability c) { bits |= bit(c); }
      constexpr bool empty() const { return bits == 0; }
      // true if every member of other is also a member of this
      constexpr bool includes(const CapabilitySet& other) const
      {
         return (other.bits & ~bits) == 0;
      }
      friend bool operator==(const CapabilitySet&, const CapabilitySet&) = default;

     private:
      static constexpr std::uint8_t bit(Capability c)
      {
         return std::uint8_t(1u << static_cast<unsigned>(c));
      }
      std::uint8_t bits = 0;
   };

   std::ostream& operator<<(std::ostream& os, const CapabilitySet& caps);

   /// Upper-case HTTP method names. Empty means all methods.
   using MethodSet = std::set<std::string>;

   bool          allowsMethod(const MethodSet& methods, std::string_view method);
   std::string   formatMethods(const MethodSet& methods);

   struct WorkerManifest
   {
      std::uint32_t abi   = abiVersion;
      std::string   entry = "_start";
      MethodSet     methods;
      CapabilitySet capabilities;
   };

   // Parses the payload of the manifest section. Throws std::runtime_error.
   WorkerManifest parseManifest(std::string_view text);

   /// Contents of a worker's sidecar `.conf` file
   struct WorkerConfig
   {
      std::map<std::string, std::string> vars;
      std::optional<std::string>         kvNamespace;

      friend bool operator==(const WorkerConfig&, const WorkerConfig&) = default;
   };

   WorkerConfig parseWorkerConfig(std::istream& file, const std::string& filename);

}  // namespace wws
