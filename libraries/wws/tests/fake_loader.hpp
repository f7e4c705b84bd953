#pragma once

#include <wws/RouteTable.hpp>
#include <wws/check.hpp>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <fstream>
#include <iterator>

namespace wws::test
{
   // Loads files holding a comma-separated method list, or "invalid"
   struct FakeLoader : ModuleLoader
   {
      int loads = 0;

      std::shared_ptr<const WorkerModule> load(const std::filesystem::path& rootDir,
                                               const std::filesystem::path& relativePath) override
      {
         ++loads;
         std::ifstream in(rootDir / relativePath);
         std::string   content{std::istreambuf_iterator<char>(in), {}};
         if (content == "invalid")
            throw LoadError(relativePath, "invalid module");
         auto result          = std::make_shared<WorkerModule>();
         result->path         = rootDir / relativePath;
         result->relativePath = relativePath;
         result->contentHash  = content;
         if (!content.empty())
         {
            std::vector<std::string> methods;
            boost::split(methods, content, boost::is_any_of(","));
            result->manifest.methods.insert(methods.begin(), methods.end());
         }
         return result;
      }
   };

   inline std::vector<std::string> describe(const RouteTable& table)
   {
      std::vector<std::string> result;
      for (const auto& e : table.entries())
         result.push_back(e.describe());
      return result;
   }

}  // namespace wws::test
