#include <wws/Manifest.hpp>

#include <wws/ConfigFile.hpp>
#include <wws/check.hpp>

#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <charconv>
#include <ostream>
#include <sstream>
#include <vector>

namespace po = boost::program_options;

namespace wws
{
   namespace
   {
      constexpr std::string_view capabilityNames[] = {"console", "clock", "random", "kv"};

      std::vector<std::string> splitList(const std::string& s)
      {
         std::vector<std::string> result;
         boost::algorithm::split(result, s, boost::algorithm::is_any_of(", \t"),
                                 boost::algorithm::token_compress_on);
         std::erase(result, std::string{});
         return result;
      }

      bool isToken(std::string_view s)
      {
         return !s.empty() && std::all_of(s.begin(), s.end(),
                                          [](char ch) { return ch >= 'A' && ch <= 'Z'; });
      }
   }  // namespace

   std::string_view to_string(Capability c)
   {
      return capabilityNames[static_cast<unsigned>(c)];
   }

   std::optional<Capability> capabilityFromString(std::string_view name)
   {
      for (std::size_t i = 0; i < numCapabilities; ++i)
         if (capabilityNames[i] == name)
            return static_cast<Capability>(i);
      return std::nullopt;
   }

   std::ostream& operator<<(std::ostream& os, const CapabilitySet& caps)
   {
      bool first = true;
      for (std::size_t i = 0; i < numCapabilities; ++i)
      {
         if (caps.contains(static_cast<Capability>(i)))
         {
            if (!first)
               os << ',';
            os << capabilityNames[i];
            first = false;
         }
      }
      return os;
   }

   bool allowsMethod(const MethodSet& methods, std::string_view method)
   {
      return methods.empty() || methods.find(std::string(method)) != methods.end();
   }

   std::string formatMethods(const MethodSet& methods)
   {
      if (methods.empty())
         return "*";
      std::string result;
      for (const auto& m : methods)
      {
         if (!result.empty())
            result += ',';
         result += m;
      }
      return result;
   }

   WorkerManifest parseManifest(std::string_view text)
   {
      po::options_description desc;
      auto                    opt = desc.add_options();
      opt("abi", po::value<std::string>());
      opt("entry", po::value<std::string>());
      opt("methods", po::value<std::string>());
      opt("capabilities", po::value<std::string>());

      std::istringstream stream{std::string(text)};
      auto parsed = wws::parse_config_file(stream, desc, "manifest", {.expandEnvironment = false});

      WorkerManifest result;
      for (const auto& option : parsed.options)
      {
         const auto& key   = option.string_key;
         const auto& value = option.value.front();
         if (key == "abi")
         {
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result.abi);
            check(ec == std::errc{} && ptr == value.data() + value.size(),
                  "invalid abi version: " + value);
         }
         else if (key == "entry")
         {
            check(!value.empty(), "entry must not be empty");
            result.entry = value;
         }
         else if (key == "methods")
         {
            result.methods.clear();
            for (auto& m : splitList(value))
            {
               boost::algorithm::to_upper(m);
               check(isToken(m), "invalid method: " + m);
               result.methods.insert(std::move(m));
            }
         }
         else if (key == "capabilities")
         {
            result.capabilities = {};
            for (const auto& name : splitList(value))
            {
               auto cap = capabilityFromString(name);
               check(cap.has_value(), "unknown capability: " + name);
               result.capabilities.insert(*cap);
            }
         }
      }
      return result;
   }

   WorkerConfig parseWorkerConfig(std::istream& file, const std::string& filename)
   {
      po::options_description desc;
      auto                    opt = desc.add_options();
      opt("vars.*", po::value<std::string>());
      opt("kv.namespace", po::value<std::string>());

      auto parsed = wws::parse_config_file(file, desc, filename);

      WorkerConfig result;
      for (const auto& option : parsed.options)
      {
         const auto& key   = option.string_key;
         const auto& value = option.value.front();
         if (key == "kv.namespace")
         {
            check(!value.empty(), filename + ": kv.namespace must not be empty");
            result.kvNamespace = value;
         }
         else
         {
            auto name = key.substr(5);
            check(!name.empty(), filename + ": missing variable name");
            result.vars[name] = value;
         }
      }
      return result;
   }

}  // namespace wws
