#pragma once

#include <wws/RoutePattern.hpp>
#include <wws/WorkerModule.hpp>

#include <filesystem>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace wws
{
   /// What to do with routes that have the same structure and overlapping methods
   enum class ConflictPolicy
   {
      reject,  // the build fails
      first,   // the smallest relative path wins; the others are dropped
   };
   std::ostream& operator<<(std::ostream& os, ConflictPolicy policy);
   std::istream& operator>>(std::istream& is, ConflictPolicy& policy);

   struct RouteEntry
   {
      RoutePattern                        pattern;
      MethodSet                           methods;
      std::filesystem::path               relativePath;
      std::shared_ptr<const WorkerModule> module;

      // e.g. GET,POST /users/[id] => users/[id].wasm
      std::string describe() const;

      // Modules are compared by content
      friend bool operator==(const RouteEntry& a, const RouteEntry& b);
   };

   bool methodsOverlap(const MethodSet& a, const MethodSet& b);

   /// An immutable set of routes indexed by path segment
   class RouteTable
   {
     public:
      RouteTable() = default;
      // Entries must be free of conflicts
      explicit RouteTable(std::vector<RouteEntry> entries);

      const std::vector<RouteEntry>& entries() const { return routes; }
      std::size_t                    size() const { return routes.size(); }
      bool                           empty() const { return routes.empty(); }

      // Entries whose pattern matches the segments, highest precedence first
      std::vector<const RouteEntry*> candidates(const std::vector<std::string>& segments) const;

      friend bool operator==(const RouteTable& a, const RouteTable& b)
      {
         return a.routes == b.routes;
      }

     private:
      struct Node
      {
         std::map<std::string, std::size_t> literals;
         std::optional<std::size_t>         parameter;
         std::vector<std::size_t>           entries;
      };
      void collect(std::size_t                     node,
                   const std::vector<std::string>& segments,
                   std::size_t                     depth,
                   std::vector<const RouteEntry*>& out) const;

      std::vector<RouteEntry> routes;
      std::vector<Node>       nodes;
   };

   struct BuildOptions
   {
      ConflictPolicy conflicts = ConflictPolicy::reject;
   };

   /// Relative paths of the candidate worker files under rootDir, sorted.
   /// Hidden files and directories are skipped. Throws BuildError.
   std::vector<std::filesystem::path> discoverWorkers(const std::filesystem::path& rootDir);

   /// Scans rootDir and loads every worker. A worker that fails to load is
   /// logged and omitted. Throws BuildError if the routes are ambiguous
   /// under the reject policy or the root cannot be scanned.
   RouteTable buildRouteTable(const std::filesystem::path& rootDir,
                              ModuleLoader&                loader,
                              const BuildOptions&          options = {});

   /// Holds the current table. Readers keep their snapshot alive for as
   /// long as they need it; writers replace the whole table.
   class RouteTableHolder
   {
     public:
      explicit RouteTableHolder(std::shared_ptr<const RouteTable> table = nullptr);

      std::shared_ptr<const RouteTable> get() const;
      void                              set(std::shared_ptr<const RouteTable> table);

     private:
      mutable std::shared_mutex         mutex;
      std::shared_ptr<const RouteTable> table;
   };

}  // namespace wws
