#include <contractdb/Commands.hpp>
#include <contractdb/Snapshot.hpp>
#include <contractdb/log.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <ostream>
#include <stdexcept>

namespace contractdb
{
   namespace
   {
      struct Command
      {
         std::string_view name;
         std::size_t      args;
         bool             needsFile;  // save and load are pointless without a file
      };

      constexpr Command commands[] = {
          {"list", 0, false},
          {"dump", 1, false},
          {"save", 1, true},
          {"load", 1, true},
      };

      bool isDurable(const DatabaseConfig& cfg)
      {
         return cfg.backend == Backend::sqlite && !cfg.path.empty() && cfg.path != ":memory:";
      }

      void list(const ContractDatabase& db, std::ostream& out)
      {
         for (const auto& name : db.mapNames())
         {
            const DataMap* map = db.getDataMap(name);
            out << name << ' ' << map->keyType() << " -> " << map->valueType() << " ("
                << map->size() << " entries)\n";
         }
      }

      int dump(const ContractDatabase& db,
               const std::string&      name,
               std::ostream&           out,
               std::ostream&           err)
      {
         const DataMap* map = db.getDataMap(name);
         if (!map)
         {
            err << "no map named " << name << "\n";
            return 2;
         }
         map->forEachEntry([&out](const Value& key, const Value& value)
                           { out << key << " => " << value << "\n"; });
         return 0;
      }

      void save(const ContractDatabase& db, const std::filesystem::path& file)
      {
         auto          data = snapshot::saveSnapshot(db);
         std::ofstream out(file, std::ios::binary);
         out.write(data.data(), static_cast<std::streamsize>(data.size()));
         out.close();
         if (!out)
            throw std::runtime_error("failed to write " + file.string());
      }

      void load(ContractDatabase& db, const std::filesystem::path& file)
      {
         std::ifstream in(file, std::ios::binary);
         if (!in)
            throw std::runtime_error("failed to open " + file.string());
         std::vector<char> data{std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>()};
         snapshot::loadSnapshot(db, data);
      }
   }  // namespace

   std::string_view commandUsage()
   {
      return "Commands:\n"
             "  list          List maps with their schemas and entry counts\n"
             "  dump <map>    Print every entry of a map\n"
             "  save <file>   Write a snapshot of the database to file\n"
             "  load <file>   Load a snapshot file into the database\n"
             "save and load need a SQLite database file (--backend sqlite --path <file>).";
   }

   int runCommand(const std::vector<std::string>& command,
                  const DatabaseConfig&           cfg,
                  std::ostream&                   out,
                  std::ostream&                   err)
   {
      const Command* cmd = nullptr;
      for (const auto& c : commands)
      {
         if (!command.empty() && command[0] == c.name && command.size() == c.args + 1)
            cmd = &c;
      }
      if (!cmd)
      {
         err << commandUsage() << "\n";
         return 1;
      }
      if (cmd->needsFile && !isDurable(cfg))
      {
         err << command[0] << " needs a SQLite database file (--backend sqlite --path <file>)\n";
         return 1;
      }

      try
      {
         auto db = openDatabase(cfg);
         if (cmd->name == "list")
            list(*db, out);
         else if (cmd->name == "dump")
            return dump(*db, command[1], out, err);
         else if (cmd->name == "save")
            save(*db, command[1]);
         else
            load(*db, command[1]);
      }
      catch (std::exception& e)
      {
         CONTRACTDB_LOG(loggers::generic::get(), error) << e.what();
         return 2;
      }
      return 0;
   }
}  // namespace contractdb
