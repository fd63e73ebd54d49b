#include <contractdb/Codec.hpp>
#include <contractdb/ContractDatabase.hpp>
#include <contractdb/errors.hpp>

namespace contractdb
{
   DataMap::DataMap(TupleTypeSignature keyType, TupleTypeSignature valueType)
       : keyType_(std::move(keyType)), valueType_(std::move(valueType))
   {
   }

   Value DataMap::fetchEntry(const Value& key) const
   {
      checkAdmits(keyType_, key);
      if (auto value = get(convert_to_bin(key)))
         return std::move(*value);
      return Value{};
   }

   void DataMap::setEntry(Value key, Value value)
   {
      checkAdmits(keyType_, key);
      checkAdmits(valueType_, value);
      auto rawKey = convert_to_bin(key);
      put(std::move(rawKey), std::move(key), std::move(value));
   }

   bool DataMap::insertEntry(Value key, Value value)
   {
      checkAdmits(keyType_, key);
      checkAdmits(valueType_, value);
      auto rawKey = convert_to_bin(key);
      return putIfAbsent(std::move(rawKey), std::move(key), std::move(value));
   }

   bool DataMap::deleteEntry(const Value& key)
   {
      checkAdmits(keyType_, key);
      return remove(convert_to_bin(key));
   }
}  // namespace contractdb
