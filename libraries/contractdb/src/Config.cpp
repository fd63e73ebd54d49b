#include <contractdb/Config.hpp>
#include <contractdb/check.hpp>
#include <contractdb/ConfigFile.hpp>
#include <contractdb/MemoryDatabase.hpp>
#include <contractdb/SqliteDatabase.hpp>

#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>

#include <istream>
#include <ostream>

namespace contractdb
{
   std::ostream& operator<<(std::ostream& os, const Backend& b)
   {
      switch (b)
      {
         case Backend::memory:
            os << "memory";
            break;
         case Backend::sqlite:
            os << "sqlite";
            break;
      }
      return os;
   }

   std::istream& operator>>(std::istream& is, Backend& b)
   {
      std::string s;
      if (is >> s)
      {
         if (s == "memory")
            b = Backend::memory;
         else if (s == "sqlite")
            b = Backend::sqlite;
         else
            throw boost::program_options::invalid_option_value(s);
      }
      return is;
   }

   void addDatabaseOptions(boost::program_options::options_description& desc, DatabaseConfig& cfg)
   {
      namespace po = boost::program_options;
      auto opt     = desc.add_options();
      opt("backend", po::value(&cfg.backend)->default_value(cfg.backend)->value_name("name"),
          "Storage backend: memory or sqlite");
      opt("path", po::value(&cfg.path)->default_value(cfg.path, "")->value_name("file"),
          "SQLite database file");
      opt("log-level", po::value(&cfg.logLevel)->default_value(cfg.logLevel)->value_name("level"),
          "Minimum severity written to the console: debug, info, notice, warning, error, critical");
   }

   DatabaseConfig parseConfig(std::istream& in, const std::string& filename)
   {
      namespace po = boost::program_options;
      DatabaseConfig          result;
      po::options_description desc("contractdb");
      addDatabaseOptions(desc, result);
      po::variables_map vm;
      po::store(parse_config_file(in, desc, filename), vm);
      po::notify(vm);
      return result;
   }

   std::unique_ptr<ContractDatabase> openDatabase(const DatabaseConfig& cfg)
   {
      switch (cfg.backend)
      {
         case Backend::memory:
            return std::make_unique<MemoryContractDatabase>();
         case Backend::sqlite:
            return std::make_unique<SqliteContractDatabase>(cfg.path.empty() ? ":memory:"
                                                                               : cfg.path);
      }
      abortMessage("unknown backend");
   }
}  // namespace contractdb
