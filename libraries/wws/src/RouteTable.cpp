#include <wws/RouteTable.hpp>

#include <wws/check.hpp>
#include <wws/log.hpp>

#include <algorithm>
#include <istream>
#include <mutex>
#include <ostream>

namespace wws
{
   namespace
   {
      loggers::common_logger& routesLog()
      {
         static auto log = loggers::channel("routes");
         return log;
      }

      bool isHidden(const std::filesystem::path& p)
      {
         auto name = p.filename().string();
         return !name.empty() && name.front() == '.';
      }

      // Literals before parameters at the first position where they
      // differ, then shorter patterns, then by file
      bool precedes(const RouteEntry& a, const RouteEntry& b)
      {
         const auto& x = a.pattern.segments;
         const auto& y = b.pattern.segments;
         for (std::size_t i = 0; i < std::min(x.size(), y.size()); ++i)
         {
            if (x[i].kind != y[i].kind)
               return x[i].kind == Segment::literal;
            if (x[i].kind == Segment::literal && x[i].text != y[i].text)
               return x[i].text < y[i].text;
         }
         if (x.size() != y.size())
            return x.size() < y.size();
         return a.relativePath < b.relativePath;
      }
   }  // namespace

   std::ostream& operator<<(std::ostream& os, ConflictPolicy policy)
   {
      return os << (policy == ConflictPolicy::reject ? "reject" : "first");
   }

   std::istream& operator>>(std::istream& is, ConflictPolicy& policy)
   {
      std::string s;
      is >> s;
      if (s == "reject")
         policy = ConflictPolicy::reject;
      else if (s == "first")
         policy = ConflictPolicy::first;
      else
         is.setstate(std::ios_base::failbit);
      return is;
   }

   std::string RouteEntry::describe() const
   {
      return formatMethods(methods) + " " + pattern.str() + " => " + relativePath.generic_string();
   }

   bool operator==(const RouteEntry& a, const RouteEntry& b)
   {
      auto hash = [](const RouteEntry& e) { return e.module ? e.module->contentHash : ""; };
      return a.pattern == b.pattern && a.methods == b.methods &&
             a.relativePath == b.relativePath && hash(a) == hash(b);
   }

   bool methodsOverlap(const MethodSet& a, const MethodSet& b)
   {
      if (a.empty() || b.empty())
         return true;
      return std::any_of(a.begin(), a.end(), [&](const auto& m) { return b.contains(m); });
   }

   RouteTable::RouteTable(std::vector<RouteEntry> entries) : routes(std::move(entries))
   {
      std::sort(routes.begin(), routes.end(), precedes);
      nodes.emplace_back();
      for (std::size_t i = 0; i < routes.size(); ++i)
      {
         std::size_t node = 0;
         for (const auto& seg : routes[i].pattern.segments)
         {
            std::optional<std::size_t> next;
            if (seg.kind == Segment::literal)
            {
               auto& literals = nodes[node].literals;
               if (auto pos = literals.find(seg.text); pos != literals.end())
                  next = pos->second;
            }
            else
            {
               next = nodes[node].parameter;
            }
            if (!next)
            {
               next = nodes.size();
               if (seg.kind == Segment::literal)
                  nodes[node].literals[seg.text] = *next;
               else
                  nodes[node].parameter = *next;
               nodes.emplace_back();
            }
            node = *next;
         }
         nodes[node].entries.push_back(i);
      }
   }

   void RouteTable::collect(std::size_t                     node,
                            const std::vector<std::string>& segments,
                            std::size_t                     depth,
                            std::vector<const RouteEntry*>& out) const
   {
      const auto& n = nodes[node];
      if (depth == segments.size())
      {
         for (auto i : n.entries)
            out.push_back(&routes[i]);
         return;
      }
      if (auto pos = n.literals.find(segments[depth]); pos != n.literals.end())
         collect(pos->second, segments, depth + 1, out);
      if (n.parameter)
         collect(*n.parameter, segments, depth + 1, out);
   }

   std::vector<const RouteEntry*> RouteTable::candidates(
       const std::vector<std::string>& segments) const
   {
      std::vector<const RouteEntry*> result;
      if (!nodes.empty())
         collect(0, segments, 0, result);
      return result;
   }

   std::vector<std::filesystem::path> discoverWorkers(const std::filesystem::path& rootDir)
   {
      std::vector<std::filesystem::path> result;
      std::error_code                    ec;
      if (!std::filesystem::is_directory(rootDir, ec))
         throw BuildError(rootDir.string() + " is not a directory");
      try
      {
         using std::filesystem::directory_options;
         std::filesystem::recursive_directory_iterator it{
             rootDir, directory_options::follow_directory_symlink},
             end;
         for (; it != end; ++it)
         {
            if (isHidden(it->path()))
            {
               if (it->is_directory())
                  it.disable_recursion_pending();
               continue;
            }
            if (it->is_regular_file() && it->path().extension() == ".wasm")
               result.push_back(std::filesystem::relative(it->path(), rootDir));
         }
      }
      catch (const std::filesystem::filesystem_error& e)
      {
         throw BuildError(std::string("scanning failed: ") + e.what());
      }
      std::sort(result.begin(), result.end());
      return result;
   }

   RouteTable buildRouteTable(const std::filesystem::path& rootDir,
                              ModuleLoader&                loader,
                              const BuildOptions&          options)
   {
      std::vector<RouteEntry> entries;
      for (const auto& rel : discoverWorkers(rootDir))
      {
         try
         {
            RoutePattern pattern;
            try
            {
               pattern = deriveRoute(rel);
            }
            catch (const std::runtime_error& e)
            {
               throw LoadError(rel, e.what());
            }
            auto module = loader.load(rootDir, rel);
            RouteEntry entry{std::move(pattern), module->methods(), rel, std::move(module)};

            auto conflict = std::find_if(
                entries.begin(), entries.end(),
                [&](const RouteEntry& e)
                {
                   return e.pattern.sameStructure(entry.pattern) &&
                          methodsOverlap(e.methods, entry.methods);
                });
            if (conflict != entries.end())
            {
               auto message = "route conflict: " + entry.describe() + " and " +
                              conflict->describe();
               if (options.conflicts == ConflictPolicy::reject)
                  throw BuildError(message);
               WWS_LOG(routesLog(), warning)
                   << message << "; keeping " << conflict->relativePath.generic_string();
               continue;
            }
            entries.push_back(std::move(entry));
         }
         catch (const LoadError& e)
         {
            WWS_LOG(routesLog(), warning) << "skipping worker: " << e.what();
         }
      }
      return RouteTable{std::move(entries)};
   }

   RouteTableHolder::RouteTableHolder(std::shared_ptr<const RouteTable> table)
       : table(table ? std::move(table) : std::make_shared<const RouteTable>())
   {
   }

   std::shared_ptr<const RouteTable> RouteTableHolder::get() const
   {
      std::shared_lock l{mutex};
      return table;
   }

   void RouteTableHolder::set(std::shared_ptr<const RouteTable> newTable)
   {
      check(newTable != nullptr, "route table must not be null");
      std::lock_guard l{mutex};
      table = std::move(newTable);
   }

}  // namespace wws
