#pragma once

#include <contractdb/ContractDatabase.hpp>
#include <contractdb/log.hpp>

#include <boost/program_options/options_description.hpp>

#include <iosfwd>
#include <memory>
#include <string>

namespace contractdb
{
   enum class Backend
   {
      memory,
      sqlite,
   };
   std::ostream& operator<<(std::ostream&, const Backend&);
   std::istream& operator>>(std::istream&, Backend&);

   struct DatabaseConfig
   {
      Backend        backend  = Backend::memory;
      std::string    path     = "";
      loggers::level logLevel = loggers::level::info;
   };

   // Registers the options that fill in `cfg`. The same description
   // serves both the config file and the command line.
   void addDatabaseOptions(boost::program_options::options_description& desc, DatabaseConfig& cfg);

   DatabaseConfig parseConfig(std::istream& in, const std::string& filename = "<unknown>");

   /// An empty path with the sqlite backend opens a private in-memory database
   std::unique_ptr<ContractDatabase> openDatabase(const DatabaseConfig& cfg);
}  // namespace contractdb
