#include <wws/KvStore.hpp>

#include <mutex>

namespace wws
{
   KvMap KvStore::get(const std::string& ns) const
   {
      std::shared_lock l{mutex};
      auto             pos = namespaces.find(ns);
      if (pos == namespaces.end())
         return {};
      return pos->second;
   }

   void KvStore::replace(const std::string& ns, KvMap contents)
   {
      std::lock_guard l{mutex};
      if (contents.empty())
         namespaces.erase(ns);
      else
         namespaces[ns] = std::move(contents);
   }

   std::size_t KvStore::size(const std::string& ns) const
   {
      std::shared_lock l{mutex};
      auto             pos = namespaces.find(ns);
      return pos == namespaces.end() ? 0 : pos->second.size();
   }

}  // namespace wws
