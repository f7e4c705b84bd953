#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wws::detail
{
   inline constexpr std::string_view base64Alphabet =
       "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

   // -1 for bytes outside the alphabet
   inline constexpr auto base64Values = []
   {
      std::array<std::int8_t, 256> result{};
      result.fill(-1);
      for (std::size_t i = 0; i < base64Alphabet.size(); ++i)
         result[static_cast<unsigned char>(base64Alphabet[i])] = static_cast<std::int8_t>(i);
      return result;
   }();

   inline std::uint32_t byteAt(std::span<const char> data, std::size_t i)
   {
      return static_cast<unsigned char>(data[i]);
   }

   inline std::string to_base64(std::span<const char> data)
   {
      std::string result;
      result.reserve((data.size() + 2) / 3 * 4);
      std::size_t i = 0;
      for (; i + 3 <= data.size(); i += 3)
      {
         auto group = byteAt(data, i) << 16 | byteAt(data, i + 1) << 8 | byteAt(data, i + 2);
         for (int shift = 18; shift >= 0; shift -= 6)
            result.push_back(base64Alphabet[(group >> shift) & 0x3f]);
      }
      if (auto rest = data.size() - i)
      {
         auto group = byteAt(data, i) << 16;
         if (rest == 2)
            group |= byteAt(data, i + 1) << 8;
         result.push_back(base64Alphabet[(group >> 18) & 0x3f]);
         result.push_back(base64Alphabet[(group >> 12) & 0x3f]);
         result.push_back(rest == 2 ? base64Alphabet[(group >> 6) & 0x3f] : '=');
         result.push_back('=');
      }
      return result;
   }

   // Returns nullopt unless the argument is padded base64 with zero fill bits
   inline std::optional<std::vector<char>> from_base64(std::string_view text)
   {
      if (text.size() % 4 != 0)
         return std::nullopt;
      text.remove_suffix(text.ends_with("==") ? 2 : text.ends_with('=') ? 1 : 0);

      std::vector<char> result;
      result.reserve(text.size() * 3 / 4);
      std::uint32_t group = 0;
      int           bits  = 0;
      for (unsigned char ch : text)
      {
         auto value = base64Values[ch];
         if (value < 0)
            return std::nullopt;
         group = (group << 6) | static_cast<std::uint32_t>(value);
         bits += 6;
         if (bits >= 8)
         {
            bits -= 8;
            result.push_back(static_cast<char>((group >> bits) & 0xff));
         }
      }
      if (group & ((1u << bits) - 1))
         return std::nullopt;
      return result;
   }
}  // namespace wws::detail
