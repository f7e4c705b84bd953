#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wws
{
   struct Segment
   {
      enum Kind
      {
         literal,
         parameter,
      };
      Kind kind;
      // The literal text, or the parameter name
      std::string text;

      friend bool operator==(const Segment&, const Segment&) = default;
   };

   struct RoutePattern
   {
      std::vector<Segment> segments;

      std::size_t numParameters() const;
      // Same literals and parameters at the same positions, ignoring parameter names
      bool        sameStructure(const RoutePattern& other) const;
      // e.g. /users/[id]
      std::string str() const;

      friend bool operator==(const RoutePattern&, const RoutePattern&) = default;
   };

   /// Maps a worker's path relative to the root directory to its URL pattern
   ///
   /// - the extension is stripped
   /// - each directory becomes a segment
   /// - a file named `index` maps to its directory's own path
   /// - a component of the form `[name]` is a parameter
   ///
   /// Throws std::runtime_error if a component is not a valid segment.
   RoutePattern deriveRoute(const std::filesystem::path& relativePath);

   // Throws std::runtime_error on invalid pct-encoding
   std::string decodePct(std::string_view s);

   /// Splits the path portion of a request target into decoded segments.
   /// The query string is ignored and empty segments are dropped.
   /// Returns nullopt if a segment is not valid pct-encoding.
   std::optional<std::vector<std::string>> splitRequestPath(std::string_view target);

   /// Decodes the query string of a request target. Keys may repeat.
   /// Throws std::runtime_error on invalid pct-encoding.
   std::map<std::string, std::vector<std::string>> parseQuery(std::string_view target);

}  // namespace wws
