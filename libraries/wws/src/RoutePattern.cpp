#include <wws/RoutePattern.hpp>

#include <wws/check.hpp>

#include <algorithm>
#include <set>

namespace
{
   template <typename Iter>
   char read_pct(Iter& iter, Iter end)
   {
      auto read_digit = [&]
      {
         ++iter;
         if (iter != end)
         {
            if (*iter >= '0' && *iter <= '9')
               return *iter - '0';
            else if (*iter >= 'a' && *iter <= 'f')
               return *iter - 'a' + 10;
            else if (*iter >= 'A' && *iter <= 'F')
               return *iter - 'A' + 10;
         }
         wws::abortMessage("Invalid pct-encoded");
      };
      auto upper = read_digit();
      auto lower = read_digit();
      return (upper << 4) | lower;
   }

   bool isParamChar(char ch)
   {
      return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
             ch == '_' || ch == '-';
   }

   wws::Segment parseSegment(std::string_view name)
   {
      if (name.find_first_of("[]") == std::string_view::npos)
         return {wws::Segment::literal, std::string(name)};
      wws::check(name.size() >= 2 && name.front() == '[' && name.back() == ']',
                 "unbalanced brackets in " + std::string(name));
      auto param = name.substr(1, name.size() - 2);
      wws::check(!param.empty(), "empty parameter name");
      wws::check(std::all_of(param.begin(), param.end(), isParamChar),
                 "invalid parameter name " + std::string(param));
      return {wws::Segment::parameter, std::string(param)};
   }

   std::string_view pathPart(std::string_view target)
   {
      return target.substr(0, target.find('?'));
   }
}  // namespace

namespace wws
{
   std::size_t RoutePattern::numParameters() const
   {
      return std::count_if(segments.begin(), segments.end(),
                           [](const auto& s) { return s.kind == Segment::parameter; });
   }

   bool RoutePattern::sameStructure(const RoutePattern& other) const
   {
      return std::equal(segments.begin(), segments.end(), other.segments.begin(),
                        other.segments.end(),
                        [](const Segment& a, const Segment& b)
                        {
                           if (a.kind != b.kind)
                              return false;
                           return a.kind == Segment::parameter || a.text == b.text;
                        });
   }

   std::string RoutePattern::str() const
   {
      if (segments.empty())
         return "/";
      std::string result;
      for (const auto& seg : segments)
      {
         result += '/';
         if (seg.kind == Segment::parameter)
            result += "[" + seg.text + "]";
         else
            result += seg.text;
      }
      return result;
   }

   RoutePattern deriveRoute(const std::filesystem::path& relativePath)
   {
      check(relativePath.is_relative(), "route path must be relative");
      check(relativePath.extension() == ".wasm", "not a worker module");

      std::vector<std::string> components;
      for (const auto& part : relativePath.parent_path())
      {
         auto name = part.string();
         check(!name.empty() && name != "." && name != "..", "invalid path component");
         components.push_back(std::move(name));
      }
      auto stem = relativePath.stem().string();
      check(!stem.empty(), "empty file name");
      if (stem != "index")
         components.push_back(std::move(stem));

      RoutePattern          result;
      std::set<std::string> names;
      for (const auto& name : components)
      {
         auto seg = parseSegment(name);
         if (seg.kind == Segment::parameter)
            check(names.insert(seg.text).second, "repeated parameter name " + seg.text);
         result.segments.push_back(std::move(seg));
      }
      return result;
   }

   std::string decodePct(std::string_view s)
   {
      std::string result;
      for (auto iter = s.begin(), end = s.end(); iter != end; ++iter)
      {
         if (*iter == '%')
            result += read_pct(iter, end);
         else
            result += *iter;
      }
      return result;
   }

   std::optional<std::vector<std::string>> splitRequestPath(std::string_view target)
   {
      std::vector<std::string> result;
      auto                     path = pathPart(target);
      while (!path.empty())
      {
         auto end = path.find('/');
         auto raw = path.substr(0, end);
         if (!raw.empty())
         {
            try
            {
               result.push_back(decodePct(raw));
            }
            catch (std::runtime_error&)
            {
               return std::nullopt;
            }
         }
         if (end == std::string_view::npos)
            break;
         path.remove_prefix(end + 1);
      }
      return result;
   }

   std::map<std::string, std::vector<std::string>> parseQuery(std::string_view target)
   {
      std::map<std::string, std::vector<std::string>> result;
      auto                                            pos = target.find('?');
      if (pos == std::string_view::npos)
         return result;
      auto query = target.substr(pos + 1);
      while (!query.empty())
      {
         auto end   = query.find('&');
         auto item  = query.substr(0, end);
         auto split = item.find('=');
         auto key   = item.substr(0, split);
         auto value = split == std::string_view::npos ? std::string_view{}
                                                      : item.substr(split + 1);
         if (!item.empty())
            result[decodePct(key)].push_back(decodePct(value));
         if (end == std::string_view::npos)
            break;
         query.remove_prefix(end + 1);
      }
      return result;
   }

}  // namespace wws
