#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wws
{
   struct Header
   {
      std::string name;
      std::string value;

      friend bool operator==(const Header&, const Header&) = default;
   };

   struct ExecutionRequest
   {
      std::string                                     method;
      std::string                                     url;
      std::string                                     path;
      std::map<std::string, std::vector<std::string>> query;
      std::vector<Header>                             headers;
      std::vector<char>                               body;
      std::map<std::string, std::string>              params;
      std::map<std::string, std::string>              vars;
   };

   struct ExecutionResponse
   {
      std::uint16_t       status = 200;
      std::vector<Header> headers;
      std::vector<char>   body;

      friend bool operator==(const ExecutionResponse&, const ExecutionResponse&) = default;
   };

   struct ExecutionFailure
   {
      enum class Kind
      {
         timeout,
         resourceExceeded,
         runtimeTrap,
         protocolViolation,
      };
      Kind        kind;
      std::string message;
   };

   std::string_view to_string(ExecutionFailure::Kind kind);

   using ExecutionResult = std::variant<ExecutionResponse, ExecutionFailure>;

}  // namespace wws
