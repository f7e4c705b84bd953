#include <wws/Abi.hpp>

#include <wws/Manifest.hpp>
#include "base64.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cctype>
#include <string_view>

namespace wws
{
   namespace
   {
      using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

      void writeString(Writer& w, std::string_view s)
      {
         w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
      }

      void writeMap(Writer& w, const std::map<std::string, std::string>& m)
      {
         w.StartObject();
         for (const auto& [k, v] : m)
         {
            writeString(w, k);
            writeString(w, v);
         }
         w.EndObject();
      }

      void protocolCheck(bool cond, const std::string& message)
      {
         if (!cond)
            throw ProtocolError(message);
      }

      std::string asString(const rapidjson::Value& v, const std::string& what)
      {
         protocolCheck(v.IsString(), what + " must be a string");
         return std::string(v.GetString(), v.GetStringLength());
      }

      constexpr std::string_view tokenPunctuation = "!#$%&'*+-.^_`|~";

      // RFC 7230 token
      bool isToken(std::string_view s)
      {
         auto tchar = [](unsigned char ch)
         { return std::isalnum(ch) || tokenPunctuation.find(ch) != std::string_view::npos; };
         return !s.empty() && std::all_of(s.begin(), s.end(), tchar);
      }

      std::vector<Header> parseHeaders(const rapidjson::Value& v)
      {
         std::vector<Header> result;
         if (v.IsArray())
         {
            for (const auto& item : v.GetArray())
            {
               protocolCheck(item.IsObject(), "header must be an object");
               auto name  = item.FindMember("name");
               auto value = item.FindMember("value");
               protocolCheck(name != item.MemberEnd() && value != item.MemberEnd(),
                             "header must have name and value");
               result.push_back(
                   {asString(name->value, "header name"), asString(value->value, "header value")});
            }
         }
         else
         {
            protocolCheck(v.IsObject(), "headers must be an array or an object");
            for (const auto& m : v.GetObject())
               result.push_back(
                   {asString(m.name, "header name"), asString(m.value, "header value")});
         }
         for (const auto& h : result)
         {
            protocolCheck(isToken(h.name), "invalid header name: " + h.name);
            protocolCheck(h.value.find_first_of(std::string_view{"\r\n\0", 3}) ==
                              std::string::npos,
                          "header " + h.name + " has a control character in its value");
         }
         return result;
      }
   }  // namespace

   std::string serializeRequest(const ExecutionRequest& request, const KvMap* kv)
   {
      rapidjson::StringBuffer buf;
      Writer                  w{buf};
      w.StartObject();
      w.Key("abi");
      w.Uint(abiVersion);
      w.Key("method");
      writeString(w, request.method);
      w.Key("url");
      writeString(w, request.url);
      w.Key("path");
      writeString(w, request.path);
      w.Key("query");
      w.StartObject();
      for (const auto& [k, values] : request.query)
      {
         writeString(w, k);
         w.StartArray();
         for (const auto& v : values)
            writeString(w, v);
         w.EndArray();
      }
      w.EndObject();
      w.Key("headers");
      w.StartArray();
      for (const auto& h : request.headers)
      {
         w.StartObject();
         w.Key("name");
         writeString(w, h.name);
         w.Key("value");
         writeString(w, h.value);
         w.EndObject();
      }
      w.EndArray();
      w.Key("body");
      writeString(w, detail::to_base64(request.body));
      w.Key("params");
      writeMap(w, request.params);
      w.Key("vars");
      writeMap(w, request.vars);
      if (kv)
      {
         w.Key("kv");
         writeMap(w, *kv);
      }
      w.EndObject();
      return {buf.GetString(), buf.GetSize()};
   }

   WorkerOutput parseWorkerOutput(std::string_view json)
   {
      rapidjson::Document doc;
      doc.Parse(json.data(), json.size());
      protocolCheck(!doc.HasParseError(), std::string("output is not valid JSON: ") +
                                              rapidjson::GetParseError_En(doc.GetParseError()));
      protocolCheck(doc.IsObject(), "output must be a JSON object");

      WorkerOutput result;
      if (auto it = doc.FindMember("status"); it != doc.MemberEnd())
      {
         protocolCheck(it->value.IsUint(), "status must be an integer");
         auto status = it->value.GetUint();
         protocolCheck(status >= 100 && status <= 599, "status out of range");
         result.response.status = static_cast<std::uint16_t>(status);
      }
      if (auto it = doc.FindMember("headers"); it != doc.MemberEnd())
         result.response.headers = parseHeaders(it->value);

      bool utf8 = false;
      if (auto it = doc.FindMember("bodyEncoding"); it != doc.MemberEnd())
      {
         auto encoding = asString(it->value, "bodyEncoding");
         protocolCheck(encoding == "base64" || encoding == "utf-8",
                       "unknown bodyEncoding " + encoding);
         utf8 = encoding == "utf-8";
      }
      if (auto it = doc.FindMember("body"); it != doc.MemberEnd())
      {
         auto body = asString(it->value, "body");
         if (utf8)
         {
            result.response.body.assign(body.begin(), body.end());
         }
         else
         {
            auto decoded = detail::from_base64(body);
            protocolCheck(decoded.has_value(), "body is not valid base64");
            result.response.body = std::move(*decoded);
         }
      }
      auto status = result.response.status;
      protocolCheck(result.response.body.empty() ||
                        !(status < 200 || status == 204 || status == 304),
                    "status " + std::to_string(status) + " must not have a body");
      if (auto it = doc.FindMember("kv"); it != doc.MemberEnd())
      {
         protocolCheck(it->value.IsObject(), "kv must be an object");
         KvMap kv;
         for (const auto& m : it->value.GetObject())
            kv[asString(m.name, "kv key")] = asString(m.value, "kv value");
         result.kv = std::move(kv);
      }
      return result;
   }

   std::string_view to_string(ExecutionFailure::Kind kind)
   {
      switch (kind)
      {
         case ExecutionFailure::Kind::timeout:
            return "Timeout";
         case ExecutionFailure::Kind::resourceExceeded:
            return "ResourceExceeded";
         case ExecutionFailure::Kind::runtimeTrap:
            return "RuntimeTrap";
         case ExecutionFailure::Kind::protocolViolation:
            return "ProtocolViolation";
      }
      return "Unknown";
   }

}  // namespace wws
