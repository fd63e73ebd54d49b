#pragma once

#include <contractdb/TypeSignature.hpp>
#include <contractdb/Value.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace contractdb
{
   /// One named key-value store with fixed key and value schemas.
   ///
   /// Every operation checks its arguments against the schemas before it
   /// touches storage, and throws TypeError on a mismatch, so a failed call
   /// never leaves a partial change behind. Backends only implement the raw
   /// storage primitives below; the checks live here so that every backend
   /// behaves identically.
   class DataMap
   {
     public:
      DataMap(TupleTypeSignature keyType, TupleTypeSignature valueType);
      DataMap(const DataMap&)            = delete;
      DataMap& operator=(const DataMap&) = delete;
      virtual ~DataMap()                 = default;

      const TypeSignature& keyType() const { return keyType_; }
      const TypeSignature& valueType() const { return valueType_; }

      /// Returns the value stored under `key`, or void if there is none
      Value fetchEntry(const Value& key) const;

      /// Inserts or overwrites the entry for `key`
      void setEntry(Value key, Value value);

      /// Inserts only if `key` has no entry. Returns whether it inserted.
      bool insertEntry(Value key, Value value);

      /// Removes the entry for `key`. Returns whether there was one.
      bool deleteEntry(const Value& key);

      virtual std::size_t size() const = 0;

      /// Visits every entry in ascending order of the encoded key
      virtual void forEachEntry(
          const std::function<void(const Value& key, const Value& value)>& f) const = 0;

     protected:
      using RawKey = std::vector<char>;

      virtual std::optional<Value> get(const RawKey& rawKey) const                 = 0;
      virtual void                 put(RawKey rawKey, Value key, Value value)      = 0;
      virtual bool                 putIfAbsent(RawKey rawKey, Value key, Value value) = 0;
      virtual bool                 remove(const RawKey& rawKey)                    = 0;

     private:
      const TypeSignature keyType_;
      const TypeSignature valueType_;
   };

   /// The named collection of maps that belongs to one contract.
   ///
   /// A database owns its maps. Read handles come from a const database and
   /// write handles only from a non-const one; callers must not keep a read
   /// handle to a map while they hold a write handle to it. createMap
   /// invalidates any handle to a map it replaces.
   class ContractDatabase
   {
     public:
      virtual ~ContractDatabase() = default;

      /// Returns nullptr if there is no map called `name`
      virtual const DataMap* getDataMap(std::string_view name) const = 0;
      virtual DataMap*       getMutDataMap(std::string_view name)    = 0;

      /// Installs a new, empty map under `name`.
      ///
      /// An existing map with the same name is replaced, and its entries are
      /// discarded.
      virtual void createMap(std::string_view   name,
                             TupleTypeSignature keyType,
                             TupleTypeSignature valueType) = 0;

      /// Names of all maps in ascending order
      virtual std::vector<std::string> mapNames() const = 0;

      /// Runs `f` as one unit. If `f` throws, every change it made through
      /// this database is undone and the exception propagates; handles
      /// obtained before the failure are invalidated. Calls may nest.
      virtual void apply(const std::function<void()>& f) = 0;
   };
}  // namespace contractdb
