#include <wws/Router.hpp>

#include <wws/check.hpp>

namespace wws
{
   Router::Router(std::shared_ptr<const RouteTable> table, const RouterOptions& options)
       : routes(std::move(table)), options(options)
   {
      check(routes != nullptr, "router requires a route table");
   }

   RouteResult Router::match(std::string_view method, std::string_view target) const
   {
      auto segments = splitRequestPath(target);
      if (!segments)
         return NotFound{};
      auto candidates = routes->candidates(*segments);
      if (candidates.empty())
         return NotFound{};

      MethodSet allowed;
      for (const auto* entry : candidates)
      {
         if (!options.methodFallthrough &&
             !entry->pattern.sameStructure(candidates.front()->pattern))
            break;
         if (allowsMethod(entry->methods, method))
         {
            RouteMatch result{*entry, {}};
            for (std::size_t i = 0; i < segments->size(); ++i)
            {
               const auto& seg = entry->pattern.segments[i];
               if (seg.kind == Segment::parameter)
                  result.params[seg.text] = (*segments)[i];
            }
            return result;
         }
         allowed.insert(entry->methods.begin(), entry->methods.end());
      }
      return MethodNotAllowed{std::move(allowed)};
   }

}  // namespace wws
