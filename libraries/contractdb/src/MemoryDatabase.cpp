#include <contractdb/MemoryDatabase.hpp>

#include <algorithm>
#include <cstring>

namespace contractdb
{
   MemoryDataMap::MemoryDataMap(TupleTypeSignature keyType, TupleTypeSignature valueType)
       : DataMap(std::move(keyType), std::move(valueType))
   {
   }

   std::unique_ptr<MemoryDataMap> MemoryDataMap::clone() const
   {
      auto result     = std::make_unique<MemoryDataMap>(*keyType().tuple(), *valueType().tuple());
      result->entries = entries;
      return result;
   }

   bool MemoryDataMap::BlobLess::operator()(const RawKey& lhs, const RawKey& rhs) const
   {
      auto n = std::min(lhs.size(), rhs.size());
      if (int cmp = n ? std::memcmp(lhs.data(), rhs.data(), n) : 0)
         return cmp < 0;
      return lhs.size() < rhs.size();
   }

   void MemoryDataMap::forEachEntry(
       const std::function<void(const Value& key, const Value& value)>& f) const
   {
      for (const auto& [rawKey, entry] : entries)
         f(entry.key, entry.value);
   }

   std::optional<Value> MemoryDataMap::get(const RawKey& rawKey) const
   {
      auto pos = entries.find(rawKey);
      if (pos == entries.end())
         return std::nullopt;
      return pos->second.value;
   }

   void MemoryDataMap::put(RawKey rawKey, Value key, Value value)
   {
      entries.insert_or_assign(std::move(rawKey), Entry{std::move(key), std::move(value)});
   }

   bool MemoryDataMap::putIfAbsent(RawKey rawKey, Value key, Value value)
   {
      return entries.try_emplace(std::move(rawKey), Entry{std::move(key), std::move(value)})
          .second;
   }

   bool MemoryDataMap::remove(const RawKey& rawKey)
   {
      return entries.erase(rawKey) != 0;
   }

   MemoryContractDatabase::MemoryContractDatabase() : logger{loggers::make_logger("database")} {}

   const DataMap* MemoryContractDatabase::getDataMap(std::string_view name) const
   {
      auto pos = maps.find(name);
      if (pos == maps.end())
         return nullptr;
      return pos->second.get();
   }

   DataMap* MemoryContractDatabase::getMutDataMap(std::string_view name)
   {
      auto pos = maps.find(name);
      if (pos == maps.end())
         return nullptr;
      return pos->second.get();
   }

   void MemoryContractDatabase::createMap(std::string_view   name,
                                          TupleTypeSignature keyType,
                                          TupleTypeSignature valueType)
   {
      auto map = std::make_unique<MemoryDataMap>(std::move(keyType), std::move(valueType));
      auto [pos, inserted] = maps.insert_or_assign(std::string(name), std::move(map));
      if (inserted)
         CONTRACTDB_LOG(logger, debug) << "Created map " << name;
      else
         CONTRACTDB_LOG(logger, notice) << "Replaced map " << name << "; its entries were discarded";
   }

   std::vector<std::string> MemoryContractDatabase::mapNames() const
   {
      std::vector<std::string> result;
      result.reserve(maps.size());
      for (const auto& [name, map] : maps)
         result.push_back(name);
      return result;
   }

   void MemoryContractDatabase::apply(const std::function<void()>& f)
   {
      MapTable saved;
      for (const auto& [name, map] : maps)
         saved.try_emplace(name, map->clone());
      try
      {
         f();
      }
      catch (...)
      {
         maps = std::move(saved);
         throw;
      }
   }
}  // namespace contractdb
