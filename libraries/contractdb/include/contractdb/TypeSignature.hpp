#pragma once

#include <contractdb/Value.hpp>

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace contractdb
{
   struct TypeSignature;
   struct TupleTypeMember;

   struct VoidType
   {
      friend bool operator==(const VoidType&, const VoidType&) = default;
   };

   struct IntType
   {
      friend bool operator==(const IntType&, const IntType&) = default;
   };

   struct BoolType
   {
      friend bool operator==(const BoolType&, const BoolType&) = default;
   };

   struct BufferType
   {
      std::uint32_t maxLength = 0;
      friend bool   operator==(const BufferType&, const BufferType&) = default;
   };

   struct PrincipalType
   {
      friend bool operator==(const PrincipalType&, const PrincipalType&) = default;
   };

   /// The shape of a tuple: member names and their types, sorted by name.
   ///
   /// Map keys and values are always described by a tuple shape.
   struct TupleTypeSignature
   {
      TupleTypeSignature() = default;
      explicit TupleTypeSignature(std::vector<TupleTypeMember> members);
      TupleTypeSignature(std::initializer_list<TupleTypeMember> members);

      const std::vector<TupleTypeMember>& members() const { return members_; }

      bool admits(const Tuple& t) const;

      friend bool operator==(const TupleTypeSignature&, const TupleTypeSignature&);

     private:
      std::vector<TupleTypeMember> members_;
   };

   struct TypeSignature
   {
      using Data =
          std::variant<VoidType, IntType, BoolType, BufferType, PrincipalType, TupleTypeSignature>;

      Data value;

      TypeSignature() = default;
      TypeSignature(VoidType t) : value{t} {}
      TypeSignature(IntType t) : value{t} {}
      TypeSignature(BoolType t) : value{t} {}
      TypeSignature(BufferType t) : value{t} {}
      TypeSignature(PrincipalType t) : value{t} {}
      TypeSignature(TupleTypeSignature t) : value{std::move(t)} {}

      /// Decides whether `v` conforms to this signature
      bool admits(const Value& v) const;

      const TupleTypeSignature* tuple() const { return std::get_if<TupleTypeSignature>(&value); }

      friend bool operator==(const TypeSignature&, const TypeSignature&) = default;
   };

   struct TupleTypeMember
   {
      std::string   name;
      TypeSignature type;
      friend bool   operator==(const TupleTypeMember&, const TupleTypeMember&) = default;
   };

   std::string   to_string(const TypeSignature& t);
   std::ostream& operator<<(std::ostream& os, const TypeSignature& t);
}  // namespace contractdb
