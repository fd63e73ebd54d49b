#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace contractdb
{
   struct Value;
   struct TupleMember;

   /// The absent value. Fetching a key with no entry yields this.
   struct Void
   {
      friend bool operator==(const Void&, const Void&) = default;
   };

   using Buffer = std::vector<unsigned char>;

   /// An account that can own contract state
   struct Principal
   {
      std::string name;
      friend bool operator==(const Principal&, const Principal&) = default;
   };

   /// Named members, always kept sorted by name.
   ///
   /// Sorting on construction makes two tuples with the same members equal
   /// regardless of the order they were written in, and gives them the same
   /// binary encoding.
   struct Tuple
   {
      Tuple() = default;
      explicit Tuple(std::vector<TupleMember> members);

      const std::vector<TupleMember>& members() const { return members_; }
      const Value*                    get(std::string_view name) const;

      friend bool operator==(const Tuple&, const Tuple&);

     private:
      std::vector<TupleMember> members_;
   };

   struct Value
   {
      using Data = std::variant<Void, std::int64_t, bool, Buffer, Principal, Tuple>;

      Data data;

      Value() = default;
      Value(int v) : data{std::int64_t{v}} {}
      Value(std::int64_t v) : data{v} {}
      Value(bool v) : data{v} {}
      Value(Buffer v) : data{std::move(v)} {}
      Value(Principal v) : data{std::move(v)} {}
      Value(Tuple v) : data{std::move(v)} {}
      Value(const char*) = delete;

      bool isVoid() const { return std::holds_alternative<Void>(data); }

      template <typename T>
      const T* get_if() const
      {
         return std::get_if<T>(&data);
      }

      friend bool operator==(const Value&, const Value&) = default;
   };

   struct TupleMember
   {
      std::string name;
      Value       value;
      friend bool operator==(const TupleMember&, const TupleMember&) = default;
   };

   /// Builds a tuple from (name, value) pairs
   Tuple makeTuple(std::initializer_list<TupleMember> members);

   std::string   to_string(const Value& v);
   std::ostream& operator<<(std::ostream& os, const Value& v);

   std::size_t hash_value(const Value& v);
}  // namespace contractdb

template <>
struct std::hash<contractdb::Value>
{
   std::size_t operator()(const contractdb::Value& v) const { return contractdb::hash_value(v); }
};
