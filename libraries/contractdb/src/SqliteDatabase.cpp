#include <contractdb/Codec.hpp>
#include <contractdb/SqliteDatabase.hpp>
#include <contractdb/errors.hpp>

#include <sqlite3.h>

#include <span>

namespace contractdb
{
   namespace
   {
      [[noreturn]] void sqliteError(sqlite3* db, const char* what)
      {
         abortMessage<StorageError>(std::string(what) + ": " + sqlite3_errmsg(db));
      }

      class Statement
      {
        public:
         Statement(sqlite3* db, std::string_view sql) : db{db}
         {
            if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr))
               sqliteError(db, "sqlite3_prepare_v2");
         }
         Statement(const Statement&)            = delete;
         Statement& operator=(const Statement&) = delete;
         ~Statement() { sqlite3_finalize(stmt); }

         Statement& bind(int i, std::string_view text)
         {
            static const char empty = 0;
            if (sqlite3_bind_text64(stmt, i, text.empty() ? &empty : text.data(), text.size(),
                                    SQLITE_STATIC, SQLITE_UTF8))
               sqliteError(db, "sqlite3_bind_text64");
            return *this;
         }

         Statement& bind(int i, const std::vector<char>& blob)
         {
            // A zero-length blob still has to bind as a blob, not NULL
            static const char empty = 0;
            if (sqlite3_bind_blob64(stmt, i, blob.empty() ? &empty : blob.data(), blob.size(),
                                    SQLITE_STATIC))
               sqliteError(db, "sqlite3_bind_blob64");
            return *this;
         }

         // Returns true if a row is available
         bool step()
         {
            int err = sqlite3_step(stmt);
            if (err == SQLITE_ROW)
               return true;
            if (err != SQLITE_DONE)
               sqliteError(db, "sqlite3_step");
            return false;
         }

         std::span<const char> blob(int i)
         {
            auto data = static_cast<const char*>(sqlite3_column_blob(stmt, i));
            auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, i));
            return {data, size};
         }

         std::string text(int i)
         {
            auto data = reinterpret_cast<const char*>(sqlite3_column_text(stmt, i));
            auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, i));
            return {data, size};
         }

         std::int64_t int64(int i) { return sqlite3_column_int64(stmt, i); }

        private:
         sqlite3*      db;
         sqlite3_stmt* stmt = nullptr;
      };

      void exec(sqlite3* db, const char* sql)
      {
         if (sqlite3_exec(db, sql, nullptr, nullptr, nullptr))
            sqliteError(db, "sqlite3_exec");
      }

      // Rolls back unless committed. Savepoints let transactions nest; the
      // outermost one begins and commits the SQLite transaction.
      class Transaction
      {
        public:
         explicit Transaction(sqlite3* db) : db{db} { exec(db, "SAVEPOINT contractdb"); }
         Transaction(const Transaction&)            = delete;
         Transaction& operator=(const Transaction&) = delete;
         ~Transaction()
         {
            if (db)
               sqlite3_exec(db, "ROLLBACK TO contractdb; RELEASE contractdb", nullptr, nullptr,
                            nullptr);
         }

         void commit()
         {
            exec(db, "RELEASE contractdb");
            db = nullptr;
         }

        private:
         sqlite3* db;
      };

      constexpr const char* createTables =
          "CREATE TABLE IF NOT EXISTS maps(name TEXT PRIMARY KEY, key_type BLOB NOT NULL, "
          "value_type BLOB NOT NULL);"
          "CREATE TABLE IF NOT EXISTS entries(map TEXT NOT NULL, key BLOB NOT NULL, value BLOB NOT "
          "NULL, PRIMARY KEY(map, key));";
   }  // namespace

   SqliteDataMap::SqliteDataMap(sqlite3*           db,
                                std::string        name,
                                TupleTypeSignature keyType,
                                TupleTypeSignature valueType)
       : DataMap(std::move(keyType), std::move(valueType)), db{db}, name_{std::move(name)}
   {
   }

   std::size_t SqliteDataMap::size() const
   {
      Statement stmt{db, "SELECT COUNT(*) FROM entries WHERE map = ?"};
      stmt.bind(1, name_);
      check<StorageError>(stmt.step(), "COUNT returned no rows");
      return static_cast<std::size_t>(stmt.int64(0));
   }

   // The BLOB primary key compares with memcmp, which is the same order
   // that the in-memory backend uses
   void SqliteDataMap::forEachEntry(
       const std::function<void(const Value& key, const Value& value)>& f) const
   {
      Statement stmt{db, "SELECT key, value FROM entries WHERE map = ? ORDER BY key"};
      stmt.bind(1, name_);
      while (stmt.step())
      {
         auto key   = value_from_bin(stmt.blob(0));
         auto value = value_from_bin(stmt.blob(1));
         f(key, value);
      }
   }

   std::optional<Value> SqliteDataMap::get(const RawKey& rawKey) const
   {
      Statement stmt{db, "SELECT value FROM entries WHERE map = ? AND key = ?"};
      stmt.bind(1, name_).bind(2, rawKey);
      if (!stmt.step())
         return std::nullopt;
      return value_from_bin(stmt.blob(0));
   }

   void SqliteDataMap::put(RawKey rawKey, Value, Value value)
   {
      Statement stmt{db, "INSERT OR REPLACE INTO entries(map, key, value) VALUES(?, ?, ?)"};
      auto      rawValue = convert_to_bin(value);
      stmt.bind(1, name_).bind(2, rawKey).bind(3, rawValue);
      stmt.step();
   }

   bool SqliteDataMap::putIfAbsent(RawKey rawKey, Value, Value value)
   {
      Statement stmt{db, "INSERT OR IGNORE INTO entries(map, key, value) VALUES(?, ?, ?)"};
      auto      rawValue = convert_to_bin(value);
      stmt.bind(1, name_).bind(2, rawKey).bind(3, rawValue);
      stmt.step();
      return sqlite3_changes(db) != 0;
   }

   bool SqliteDataMap::remove(const RawKey& rawKey)
   {
      Statement stmt{db, "DELETE FROM entries WHERE map = ? AND key = ?"};
      stmt.bind(1, name_).bind(2, rawKey);
      stmt.step();
      return sqlite3_changes(db) != 0;
   }

   void SqliteContractDatabase::Closer::operator()(sqlite3* db) const
   {
      sqlite3_close(db);
   }

   SqliteContractDatabase::SqliteContractDatabase(const std::filesystem::path& path)
       : logger{loggers::make_logger("database")}
   {
      sqlite3* handle = nullptr;
      int      err    = sqlite3_open(path.c_str(), &handle);
      // sqlite3_open allocates a handle even on failure
      db.reset(handle);
      if (err)
      {
         if (handle)
            sqliteError(handle, "sqlite3_open");
         abortMessage<StorageError>(std::string("sqlite3_open: ") + sqlite3_errstr(err));
      }
      exec(db.get(), createTables);
      loadMaps();
      CONTRACTDB_LOG(logger, info) << "Opened " << path.string() << " with " << maps.size()
                                   << " maps";
   }

   SqliteContractDatabase::~SqliteContractDatabase() = default;

   void SqliteContractDatabase::loadMaps()
   {
      Statement stmt{db.get(), "SELECT name, key_type, value_type FROM maps ORDER BY name"};
      while (stmt.step())
      {
         auto name      = stmt.text(0);
         auto keyType   = tuple_type_from_bin(stmt.blob(1));
         auto valueType = tuple_type_from_bin(stmt.blob(2));
         auto map       = std::make_unique<SqliteDataMap>(db.get(), name, std::move(keyType),
                                                          std::move(valueType));
         maps.insert_or_assign(std::move(name), std::move(map));
      }
   }

   const DataMap* SqliteContractDatabase::getDataMap(std::string_view name) const
   {
      auto pos = maps.find(name);
      if (pos == maps.end())
         return nullptr;
      return pos->second.get();
   }

   DataMap* SqliteContractDatabase::getMutDataMap(std::string_view name)
   {
      auto pos = maps.find(name);
      if (pos == maps.end())
         return nullptr;
      return pos->second.get();
   }

   void SqliteContractDatabase::createMap(std::string_view   name,
                                          TupleTypeSignature keyType,
                                          TupleTypeSignature valueType)
   {
      auto rawKeyType   = convert_to_bin(TypeSignature{keyType});
      auto rawValueType = convert_to_bin(TypeSignature{valueType});
      {
         Transaction trx{db.get()};
         {
            Statement stmt{db.get(), "DELETE FROM entries WHERE map = ?"};
            stmt.bind(1, name);
            stmt.step();
         }
         {
            Statement stmt{db.get(),
                           "INSERT OR REPLACE INTO maps(name, key_type, value_type) VALUES(?, ?, ?)"};
            stmt.bind(1, name).bind(2, rawKeyType).bind(3, rawValueType);
            stmt.step();
         }
         trx.commit();
      }
      auto map = std::make_unique<SqliteDataMap>(db.get(), std::string(name), std::move(keyType),
                                                 std::move(valueType));
      auto [pos, inserted] = maps.insert_or_assign(std::string(name), std::move(map));
      if (inserted)
         CONTRACTDB_LOG(logger, debug) << "Created map " << name;
      else
         CONTRACTDB_LOG(logger, notice) << "Replaced map " << name << "; its entries were discarded";
   }

   std::vector<std::string> SqliteContractDatabase::mapNames() const
   {
      std::vector<std::string> result;
      result.reserve(maps.size());
      for (const auto& [name, map] : maps)
         result.push_back(name);
      return result;
   }

   void SqliteContractDatabase::apply(const std::function<void()>& f)
   {
      try
      {
         Transaction trx{db.get()};
         f();
         trx.commit();
      }
      catch (...)
      {
         // The rollback has restored the tables; bring the handles back in line
         maps.clear();
         loadMaps();
         throw;
      }
   }
}  // namespace contractdb
