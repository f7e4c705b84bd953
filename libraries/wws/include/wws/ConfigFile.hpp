#pragma once

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <iosfwd>
#include <string>

namespace wws
{
   struct ConfigSyntax
   {
      // $NAME in a value expands to the environment variable NAME. Manifests
      // embedded in worker modules are read with this off.
      bool expandEnvironment = true;
   };

   /// Reads the INI syntax shared by the server config, worker sidecar
   /// files and module manifests.
   ///
   /// - `[section]` prefixes the following keys with `section.`
   /// - `#` starts a comment unless it is inside a double-quoted string
   /// - double quotes are removed from values; `\n` is a newline and a
   ///   backslash before any other character makes it literal
   /// - options whose name ends in `*` accept any key with that prefix
   ///
   /// Errors are reported as `filename:line: message`.
   boost::program_options::parsed_options parse_config_file(
       std::istream&,
       const boost::program_options::options_description&,
       const std::string&  filename = "<unknown>",
       const ConfigSyntax& syntax   = {});

}  // namespace wws
