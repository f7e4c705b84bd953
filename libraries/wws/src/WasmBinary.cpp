#include <wws/WasmBinary.hpp>

#include <wws/check.hpp>

#include <algorithm>

namespace wws
{
   namespace
   {
      constexpr std::uint8_t wasmMagic[]   = {0x00, 0x61, 0x73, 0x6d};
      constexpr std::uint8_t wasmVersion[] = {0x01, 0x00, 0x00, 0x00};

      enum SectionId : std::uint8_t
      {
         customSection    = 0,
         typeSection      = 1,
         importSection    = 2,
         functionSection  = 3,
         tableSection     = 4,
         memorySection    = 5,
         globalSection    = 6,
         exportSection    = 7,
         startSection     = 8,
         elementSection   = 9,
         codeSection      = 10,
         dataSection      = 11,
         dataCountSection = 12,
      };

      // Position of each known section in the required ordering
      int sectionOrder(std::uint8_t id)
      {
         // data count must come before code
         static constexpr int order[] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 11, 12, 10};
         return order[id];
      }

      struct Reader
      {
         const char* pos;
         const char* end;

         std::size_t remaining() const { return end - pos; }

         std::uint8_t byte()
         {
            check(pos != end, "unexpected end of wasm binary");
            return static_cast<std::uint8_t>(*pos++);
         }

         std::uint32_t varuint32()
         {
            std::uint32_t result = 0;
            for (int shift = 0;; shift += 7)
            {
               auto b = byte();
               check(shift < 32 && (shift != 28 || (b & 0x70) == 0), "invalid varuint32");
               result |= std::uint32_t(b & 0x7f) << shift;
               if (!(b & 0x80))
                  return result;
            }
         }

         std::span<const char> bytes(std::uint32_t size)
         {
            check(size <= remaining(), "unexpected end of wasm binary");
            std::span<const char> result{pos, size};
            pos += size;
            return result;
         }

         std::string name()
         {
            auto data = bytes(varuint32());
            return std::string(data.begin(), data.end());
         }

         MemoryLimits limits()
         {
            auto         flags = byte();
            MemoryLimits result{varuint32(), std::nullopt};
            if (flags == 1)
               result.maximum = varuint32();
            else
               check(flags == 0, "invalid limits flags");
            return result;
         }

         std::uint8_t valueType()
         {
            auto t = byte();
            check(t == 0x7f || t == 0x7e || t == 0x7d || t == 0x7c, "invalid value type");
            return t;
         }
      };

      void parseTypes(Reader& r, WasmBinary& result)
      {
         for (auto n = r.varuint32(); n; --n)
         {
            check(r.byte() == 0x60, "expected function type");
            FuncType type;
            for (auto np = r.varuint32(); np; --np)
               type.params.push_back(r.valueType());
            for (auto nr = r.varuint32(); nr; --nr)
               type.results.push_back(r.valueType());
            result.types.push_back(std::move(type));
         }
      }

      void parseImports(Reader& r, WasmBinary& result)
      {
         for (auto n = r.varuint32(); n; --n)
         {
            WasmImport imp;
            imp.module = r.name();
            imp.name   = r.name();
            auto kind  = r.byte();
            switch (kind)
            {
               case 0:
                  imp.kind      = ExternalKind::function;
                  imp.typeIndex = r.varuint32();
                  check(imp.typeIndex < result.types.size(), "import type index out of range");
                  break;
               case 1:
                  imp.kind = ExternalKind::table;
                  r.byte();
                  r.limits();
                  break;
               case 2:
                  imp.kind = ExternalKind::memory;
                  result.memories.push_back(r.limits());
                  break;
               case 3:
                  imp.kind = ExternalKind::global;
                  r.valueType();
                  r.byte();
                  break;
               default:
                  abortMessage("invalid import kind");
            }
            result.imports.push_back(std::move(imp));
         }
      }

      void parseFunctions(Reader& r, WasmBinary& result)
      {
         for (auto n = r.varuint32(); n; --n)
         {
            auto idx = r.varuint32();
            check(idx < result.types.size(), "function type index out of range");
            result.functions.push_back(idx);
         }
      }

      void parseMemories(Reader& r, WasmBinary& result)
      {
         for (auto n = r.varuint32(); n; --n)
            result.memories.push_back(r.limits());
      }

      void parseExports(Reader& r, WasmBinary& result)
      {
         for (auto n = r.varuint32(); n; --n)
         {
            WasmExport exp;
            exp.name  = r.name();
            auto kind = r.byte();
            check(kind <= 3, "invalid export kind");
            exp.kind  = static_cast<ExternalKind>(kind);
            exp.index = r.varuint32();
            check(!result.findExport(exp.name), "duplicate export " + exp.name);
            result.exports.push_back(std::move(exp));
         }
      }
   }  // namespace

   std::uint32_t WasmBinary::numImportedFunctions() const
   {
      return std::count_if(imports.begin(), imports.end(),
                           [](const auto& imp) { return imp.kind == ExternalKind::function; });
   }

   const WasmExport* WasmBinary::findExport(std::string_view name) const
   {
      for (const auto& exp : exports)
         if (exp.name == name)
            return &exp;
      return nullptr;
   }

   const CustomSection* WasmBinary::findCustomSection(std::string_view name) const
   {
      for (const auto& sec : customSections)
         if (sec.name == name)
            return &sec;
      return nullptr;
   }

   const FuncType* WasmBinary::functionType(std::uint32_t funcIndex) const
   {
      for (const auto& imp : imports)
      {
         if (imp.kind != ExternalKind::function)
            continue;
         if (funcIndex == 0)
            return &types[imp.typeIndex];
         --funcIndex;
      }
      if (funcIndex < functions.size())
         return &types[functions[funcIndex]];
      return nullptr;
   }

   WasmBinary inspectWasm(std::span<const char> code)
   {
      WasmBinary result;
      Reader     r{code.data(), code.data() + code.size()};
      check(r.remaining() >= 8 && std::equal(std::begin(wasmMagic), std::end(wasmMagic),
                                             reinterpret_cast<const std::uint8_t*>(r.pos)),
            "not a wasm binary");
      r.pos += 4;
      check(std::equal(std::begin(wasmVersion), std::end(wasmVersion),
                       reinterpret_cast<const std::uint8_t*>(r.pos)),
            "unsupported wasm version");
      r.pos += 4;

      int lastOrder = 0;
      while (r.remaining())
      {
         auto id = r.byte();
         check(id <= dataCountSection, "unknown section id " + std::to_string(id));
         auto   data = r.bytes(r.varuint32());
         Reader section{data.data(), data.data() + data.size()};
         if (id != customSection)
         {
            check(sectionOrder(id) > lastOrder, "section out of order");
            lastOrder = sectionOrder(id);
         }
         switch (id)
         {
            case customSection:
            {
               auto name = section.name();
               auto rest = section.bytes(section.remaining());
               result.customSections.push_back({std::move(name), {rest.begin(), rest.end()}});
               continue;
            }
            case typeSection:
               parseTypes(section, result);
               break;
            case importSection:
               parseImports(section, result);
               break;
            case functionSection:
               parseFunctions(section, result);
               break;
            case memorySection:
               parseMemories(section, result);
               break;
            case exportSection:
               parseExports(section, result);
               break;
            default:
               // Validated by the engine
               section.pos = section.end;
               break;
         }
         check(!section.remaining(), "trailing bytes in section " + std::to_string(id));
      }
      check(result.memories.size() <= 1, "multiple memories are not supported");
      return result;
   }

}  // namespace wws
