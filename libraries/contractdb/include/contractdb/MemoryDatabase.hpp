#pragma once

#include <contractdb/ContractDatabase.hpp>
#include <contractdb/log.hpp>

#include <map>
#include <memory>

namespace contractdb
{
   class MemoryDataMap final : public DataMap
   {
     public:
      MemoryDataMap(TupleTypeSignature keyType, TupleTypeSignature valueType);

      std::unique_ptr<MemoryDataMap> clone() const;

      std::size_t size() const override { return entries.size(); }
      void        forEachEntry(
                 const std::function<void(const Value& key, const Value& value)>& f) const override;

     protected:
      std::optional<Value> get(const RawKey& rawKey) const override;
      void                 put(RawKey rawKey, Value key, Value value) override;
      bool                 putIfAbsent(RawKey rawKey, Value key, Value value) override;
      bool                 remove(const RawKey& rawKey) override;

     private:
      struct Entry
      {
         Value key;
         Value value;
      };
      // Bytes compare as unsigned, the same order SQLite gives BLOBs
      struct BlobLess
      {
         bool operator()(const RawKey& lhs, const RawKey& rhs) const;
      };
      std::map<RawKey, Entry, BlobLess> entries;
   };

   class MemoryContractDatabase final : public ContractDatabase
   {
     public:
      MemoryContractDatabase();

      const DataMap* getDataMap(std::string_view name) const override;
      DataMap*       getMutDataMap(std::string_view name) override;
      void           createMap(std::string_view   name,
                               TupleTypeSignature keyType,
                               TupleTypeSignature valueType) override;

      std::vector<std::string> mapNames() const override;

      // Keeps a copy of every map while `f` runs
      void apply(const std::function<void()>& f) override;

     private:
      using MapTable = std::map<std::string, std::unique_ptr<MemoryDataMap>, std::less<>>;

      MapTable               maps;
      loggers::common_logger logger;
   };
}  // namespace contractdb
