#pragma once

#include <contractdb/Stream.hpp>
#include <contractdb/TypeSignature.hpp>
#include <contractdb/Value.hpp>

#include <span>
#include <vector>

namespace contractdb
{
   // Tags shared by values and type signatures
   enum class TypeTag : std::uint8_t
   {
      void_     = 0,
      int_      = 1,
      bool_     = 2,
      buffer    = 3,
      principal = 4,
      tuple     = 5,
   };

   /// Tuples nested deeper than this are rejected when decoding
   constexpr std::uint32_t max_tuple_depth = 64;

   void to_bin(const Value& v, VectorStream& stream);
   void to_bin(const TypeSignature& t, VectorStream& stream);
   void from_bin(Value& v, InputStream& stream);
   void from_bin(TypeSignature& t, InputStream& stream);

   std::vector<char> convert_to_bin(const Value& v);
   std::vector<char> convert_to_bin(const TypeSignature& t);

   /// Decodes a complete value; trailing bytes are an error
   Value         value_from_bin(std::span<const char> data);
   TypeSignature type_from_bin(std::span<const char> data);

   /// Decodes a type signature that must be a tuple shape
   TupleTypeSignature tuple_type_from_bin(std::span<const char> data);
}  // namespace contractdb
