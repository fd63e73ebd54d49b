#pragma once

#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>

namespace contractdb
{
   namespace loggers
   {
      enum class level : std::uint32_t
      {
         debug,
         info,
         notice,
         warning,
         error,
         critical,
      };
      std::ostream& operator<<(std::ostream&, const level&);
      std::istream& operator>>(std::istream& is, level& l);
      using common_logger = boost::log::sources::severity_logger_mt<level>;
      BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)

      namespace keyword
      {
         BOOST_LOG_ATTRIBUTE_KEYWORD(Severity, "Severity", level)
         BOOST_LOG_ATTRIBUTE_KEYWORD(Channel, "Channel", std::string)
      }  // namespace keyword

      // Replaces all sinks with a single console sink that
      // writes records at or above `min` to stderr.
      void configure(level min);

      // Creates a logger that tags its records with `channel`
      common_logger make_logger(const std::string& channel);

   }  // namespace loggers

#define CONTRACTDB_LOG(logger, log_level) BOOST_LOG_SEV(logger, contractdb::loggers::level::log_level)
}  // namespace contractdb
