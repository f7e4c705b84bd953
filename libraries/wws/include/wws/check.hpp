#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wws
{
   /// Abort with `message`
   [[noreturn]] inline void abortMessage(std::string_view message)
   {
      throw std::runtime_error(std::string(message));
   }

   /// Abort with message if `!cond`
   inline void check(bool cond, std::string_view message)
   {
      if (!cond)
         abortMessage(message);
   }

   // A single worker module could not be loaded. Discovery continues without it.
   struct LoadError : std::runtime_error
   {
      LoadError(const std::filesystem::path& path, const std::string& message)
          : std::runtime_error(path.string() + ": " + message), path(path)
      {
      }
      std::filesystem::path path;
   };

   // The route configuration as a whole is unusable
   struct BuildError : std::runtime_error
   {
      using std::runtime_error::runtime_error;
   };
}  // namespace wws
