#include <contractdb/Codec.hpp>
#include <contractdb/Snapshot.hpp>
#include <contractdb/errors.hpp>
#include <contractdb/log.hpp>

#include <cstring>

namespace contractdb::snapshot
{
   namespace
   {
      struct MapData
      {
         std::string                          name;
         TupleTypeSignature                   keyType;
         TupleTypeSignature                   valueType;
         std::vector<std::pair<Value, Value>> entries;
      };

      loggers::common_logger& snapshotLogger()
      {
         static loggers::common_logger logger = loggers::make_logger("snapshot");
         return logger;
      }

      TupleTypeSignature read_tuple_type(InputStream& stream)
      {
         TypeSignature t;
         from_bin(t, stream);
         auto tuple = t.tuple();
         check(tuple != nullptr, stream_error::bad_tag);
         return *tuple;
      }
   }  // namespace

   std::vector<char> saveSnapshot(const ContractDatabase& db)
   {
      std::vector<char> result;
      VectorStream      stream{result};
      SnapshotHeader    header;
      write_u32(header.magic, stream);
      write_u32(header.version, stream);

      auto names = db.mapNames();
      write_u32(static_cast<std::uint32_t>(names.size()), stream);
      std::size_t totalEntries = 0;
      for (const auto& name : names)
      {
         const DataMap* map = db.getDataMap(name);
         check(map != nullptr, "map disappeared while saving snapshot: " + name);
         write_string(name, stream);
         to_bin(map->keyType(), stream);
         to_bin(map->valueType(), stream);

         // The count is patched in after the entries are written
         auto countPos = stream.written();
         write_u32(0, stream);
         std::uint32_t count = 0;
         map->forEachEntry(
             [&](const Value& key, const Value& value)
             {
                to_bin(key, stream);
                to_bin(value, stream);
                ++count;
             });
         std::memcpy(result.data() + countPos, &count, sizeof(count));
         totalEntries += count;
      }
      CONTRACTDB_LOG(snapshotLogger(), info)
          << "Saved " << names.size() << " maps with " << totalEntries << " entries";
      return result;
   }

   void loadSnapshot(ContractDatabase& db, std::span<const char> data)
   {
      InputStream    stream{data};
      SnapshotHeader expected;
      check(read_u32(stream) == expected.magic, stream_error::bad_magic);
      check(read_u32(stream) == expected.version, stream_error::bad_version);

      std::vector<MapData> maps;
      auto                 mapCount     = read_u32(stream);
      std::size_t          totalEntries = 0;
      for (std::uint32_t i = 0; i < mapCount; ++i)
      {
         MapData map;
         map.name      = read_string(stream);
         map.keyType   = read_tuple_type(stream);
         map.valueType = read_tuple_type(stream);
         TypeSignature keyType{map.keyType};
         TypeSignature valueType{map.valueType};
         auto          entryCount = read_u32(stream);
         for (std::uint32_t j = 0; j < entryCount; ++j)
         {
            Value key, value;
            from_bin(key, stream);
            from_bin(value, stream);
            checkAdmits(keyType, key);
            checkAdmits(valueType, value);
            map.entries.emplace_back(std::move(key), std::move(value));
         }
         totalEntries += entryCount;
         maps.push_back(std::move(map));
      }
      check(stream.remaining() == 0, stream_error::trailing_data);

      db.apply(
          [&]
          {
             for (auto& map : maps)
             {
                db.createMap(map.name, std::move(map.keyType), std::move(map.valueType));
                DataMap* target = db.getMutDataMap(map.name);
                check(target != nullptr, "createMap did not install " + map.name);
                for (auto& [key, value] : map.entries)
                   target->setEntry(std::move(key), std::move(value));
             }
          });
      CONTRACTDB_LOG(snapshotLogger(), info)
          << "Loaded " << maps.size() << " maps with " << totalEntries << " entries";
   }
}  // namespace contractdb::snapshot
