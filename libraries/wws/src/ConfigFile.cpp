#include <wws/ConfigFile.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <istream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace po = boost::program_options;

namespace wws
{
   namespace
   {
      constexpr std::string_view blanks = " \t\r\n";

      std::string_view trim(std::string_view s)
      {
         auto first = s.find_first_not_of(blanks);
         if (first == std::string_view::npos)
            return {};
         return s.substr(first, s.find_last_not_of(blanks) + 1 - first);
      }

      // Offset of the first # that is neither quoted nor escaped
      std::size_t commentStart(std::string_view s)
      {
         bool quoted = false;
         for (std::size_t i = 0; i < s.size(); ++i)
         {
            if (s[i] == '\\')
               ++i;
            else if (s[i] == '"')
               quoted = !quoted;
            else if (s[i] == '#' && !quoted)
               return i;
         }
         return s.size();
      }

      std::string_view variableName(std::string_view s)
      {
         auto end = std::find_if(s.begin(), s.end(),
                                 [](unsigned char ch) { return !std::isalnum(ch) && ch != '_'; });
         return s.substr(0, end - s.begin());
      }

      std::string unquote(std::string_view raw, const ConfigSyntax& syntax)
      {
         std::string result;
         for (std::size_t i = 0; i < raw.size(); ++i)
         {
            char ch = raw[i];
            if (ch == '"')
               continue;
            if (ch == '\\')
            {
               if (++i == raw.size())
                  break;
               result.push_back(raw[i] == 'n' ? '\n' : raw[i]);
            }
            else if (ch == '$' && syntax.expandEnvironment)
            {
               auto name = variableName(raw.substr(i + 1));
               if (name.empty())
               {
                  result.push_back('$');
                  continue;
               }
               if (const char* value = std::getenv(std::string(name).c_str()))
                  result += value;
               i += name.size();
            }
            else
            {
               result.push_back(ch);
            }
         }
         return result;
      }

      struct Entry
      {
         std::string key;
         std::string value;
         std::string raw;
      };

      class Reader
      {
        public:
         Reader(std::istream& file, const std::string& filename, const ConfigSyntax& syntax)
             : file(file), filename(filename), syntax(syntax)
         {
         }

         // Returns false at the end of the file
         bool next(Entry& entry)
         {
            std::string line;
            while (std::getline(file, line))
            {
               ++lineNumber;
               std::string_view text = line;
               text                  = trim(text.substr(0, commentStart(text)));
               if (text.empty())
                  continue;
               if (text.front() == '[' && text.back() == ']')
               {
                  auto name = trim(text.substr(1, text.size() - 2));
                  if (name.ends_with('.'))
                     name.remove_suffix(1);
                  section = trim(name);
                  continue;
               }
               auto eq = text.find('=');
               if (eq == std::string_view::npos)
                  fail("Expected key = value");
               auto key = trim(text.substr(0, eq));
               if (key.empty())
                  fail("Missing option name");
               auto raw    = trim(text.substr(eq + 1));
               entry.key   = section.empty() ? std::string(key) : section + "." + std::string(key);
               entry.value = unquote(raw, syntax);
               entry.raw   = raw;
               return true;
            }
            return false;
         }

         [[noreturn]] void fail(const std::string& message) const
         {
            throw std::runtime_error(filename + ":" + std::to_string(lineNumber) + ": " + message);
         }

        private:
         std::istream&       file;
         const std::string&  filename;
         const ConfigSyntax& syntax;
         std::string         section;
         std::size_t         lineNumber = 0;
      };

      class OptionNames
      {
        public:
         explicit OptionNames(const po::options_description& opts)
         {
            for (const auto& opt : opts.options())
            {
               const auto& name = opt->long_name();
               if (name.empty())
                  continue;
               if (name.back() == '*')
                  prefixes.push_back(name.substr(0, name.size() - 1));
               else
                  exact.push_back(name);
            }
            std::sort(exact.begin(), exact.end());
         }

         bool contains(std::string_view key) const
         {
            return std::binary_search(exact.begin(), exact.end(), key) ||
                   std::any_of(prefixes.begin(), prefixes.end(),
                               [&](const std::string& p) { return key.starts_with(p); });
         }

        private:
         std::vector<std::string> exact;
         std::vector<std::string> prefixes;
      };
   }  // namespace

   po::parsed_options parse_config_file(std::istream&                  file,
                                        const po::options_description& opts,
                                        const std::string&             filename,
                                        const ConfigSyntax&            syntax)
   {
      OptionNames        names{opts};
      Reader             reader{file, filename, syntax};
      po::parsed_options result{&opts};
      Entry              entry;
      while (reader.next(entry))
      {
         if (!names.contains(entry.key))
            reader.fail("Unknown option " + entry.key);
         po::option opt{entry.key, {entry.value}};
         opt.original_tokens = {entry.key, entry.raw};
         result.options.push_back(std::move(opt));
      }
      return result;
   }

}  // namespace wws
