#pragma once

#include <wws/RouteTable.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace wws
{
   struct RouteMatch
   {
      RouteEntry                         entry;
      std::map<std::string, std::string> params;
   };

   struct NotFound
   {
   };

   struct MethodNotAllowed
   {
      // Union of the methods allowed by the matching routes
      MethodSet allowed;
   };

   using RouteResult = std::variant<RouteMatch, NotFound, MethodNotAllowed>;

   struct RouterOptions
   {
      // If the most specific route does not allow the method, try the
      // next most specific one
      bool methodFallthrough = true;
   };

   /// Read-only lookup in one route table snapshot; safe for concurrent use
   class Router
   {
     public:
      explicit Router(std::shared_ptr<const RouteTable> table, const RouterOptions& options = {});

      // target may include a query string, which is ignored
      RouteResult match(std::string_view method, std::string_view target) const;

      const RouteTable& table() const { return *routes; }

     private:
      std::shared_ptr<const RouteTable> routes;
      RouterOptions                     options;
   };

}  // namespace wws
