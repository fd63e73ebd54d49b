#pragma once

#include <contractdb/ContractDatabase.hpp>
#include <contractdb/log.hpp>

#include <filesystem>
#include <map>
#include <memory>

struct sqlite3;

namespace contractdb
{
   class SqliteDataMap final : public DataMap
   {
     public:
      SqliteDataMap(sqlite3*           db,
                    std::string        name,
                    TupleTypeSignature keyType,
                    TupleTypeSignature valueType);

      const std::string& name() const { return name_; }

      std::size_t size() const override;
      void        forEachEntry(
                 const std::function<void(const Value& key, const Value& value)>& f) const override;

     protected:
      std::optional<Value> get(const RawKey& rawKey) const override;
      void                 put(RawKey rawKey, Value key, Value value) override;
      bool                 putIfAbsent(RawKey rawKey, Value key, Value value) override;
      bool                 remove(const RawKey& rawKey) override;

     private:
      sqlite3*    db;
      std::string name_;
   };

   /// Durable database stored in a SQLite file.
   ///
   /// Opening an existing file restores every map it holds. Pass ":memory:"
   /// for a private, non-persistent database. SQLite failures are reported
   /// as StorageError.
   class SqliteContractDatabase final : public ContractDatabase
   {
     public:
      explicit SqliteContractDatabase(const std::filesystem::path& path);
      SqliteContractDatabase(const SqliteContractDatabase&)            = delete;
      SqliteContractDatabase& operator=(const SqliteContractDatabase&) = delete;
      ~SqliteContractDatabase();

      const DataMap* getDataMap(std::string_view name) const override;
      DataMap*       getMutDataMap(std::string_view name) override;
      void           createMap(std::string_view   name,
                               TupleTypeSignature keyType,
                               TupleTypeSignature valueType) override;

      std::vector<std::string> mapNames() const override;

      /// Runs `f` inside a SQLite transaction, reloading the maps if it fails
      void apply(const std::function<void()>& f) override;

     private:
      void loadMaps();

      struct Closer
      {
         void operator()(sqlite3* db) const;
      };
      // Declared before maps so that the connection outlives them
      std::unique_ptr<sqlite3, Closer>                                   db;
      std::map<std::string, std::unique_ptr<SqliteDataMap>, std::less<>> maps;
      loggers::common_logger                                             logger;
   };
}  // namespace contractdb
