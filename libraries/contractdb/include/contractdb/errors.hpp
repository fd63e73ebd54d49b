#pragma once

#include <contractdb/TypeSignature.hpp>
#include <contractdb/Value.hpp>

#include <cstddef>
#include <stdexcept>

namespace contractdb
{
   /// A key or value that its map's schema does not admit
   ///
   /// Raised before the offending operation changes anything.
   class TypeError : public std::runtime_error
   {
     public:
      /// Longer printed forms are cut short in the message
      static constexpr std::size_t max_printed = 200;

      TypeError(TypeSignature expected, Value actual);

      const TypeSignature& expected() const { return expected_; }
      const Value&         actual() const { return actual_; }

     private:
      TypeSignature expected_;
      Value         actual_;
   };

   /// Failure reported by a durable storage backend
   class StorageError : public std::runtime_error
   {
     public:
      using std::runtime_error::runtime_error;
   };

   /// Throws TypeError if `type` does not admit `v`
   void checkAdmits(const TypeSignature& type, const Value& v);
}  // namespace contractdb
