#pragma once

#include <map>
#include <shared_mutex>
#include <string>

namespace wws
{
   using KvMap = std::map<std::string, std::string>;

   /// In-memory key/value contents shared by the workers of a namespace
   ///
   /// A worker with the `kv` capability receives a snapshot of its
   /// namespace and may replace it in its response. Concurrent writers to
   /// the same namespace do not merge; the last one to finish wins.
   class KvStore
   {
     public:
      KvMap       get(const std::string& ns) const;
      void        replace(const std::string& ns, KvMap contents);
      std::size_t size(const std::string& ns) const;

     private:
      mutable std::shared_mutex    mutex;
      std::map<std::string, KvMap> namespaces;
   };

}  // namespace wws
