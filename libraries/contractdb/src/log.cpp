#include <contractdb/log.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/formatters/date_time.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>
#include <stdexcept>

namespace contractdb::loggers
{
   BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)

   // Available attributes: TimeStamp, Severity, Channel

   namespace
   {
      BOOST_LOG_ATTRIBUTE_KEYWORD(TimeStamp, "TimeStamp", boost::posix_time::ptime)

      using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
   }  // namespace

   void configure(level min)
   {
      namespace expr = boost::log::expressions;

      auto core = boost::log::core::get();
      core->remove_all_sinks();
      core->add_global_attribute("TimeStamp", boost::log::attributes::utc_clock());

      auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);

      auto sink = boost::make_shared<console_sink>(backend);
      sink->set_filter(keyword::Severity >= min);
      sink->set_formatter(
          expr::stream << expr::format_date_time(TimeStamp, "%Y-%m-%dT%H:%M:%S.%fZ") << " ["
                       << keyword::Severity << "]"
                       << expr::if_(expr::has_attr(keyword::Channel))
                              [expr::stream << " [" << keyword::Channel << "]"]
                       << ": " << expr::smessage);
      core->add_sink(sink);
   }

   common_logger make_logger(const std::string& channel)
   {
      common_logger result;
      result.add_attribute("Channel", boost::log::attributes::constant(channel));
      return result;
   }

   std::ostream& operator<<(std::ostream& os, const level& l)
   {
      switch (l)
      {
         case level::debug:
            os << "debug";
            break;
         case level::info:
            os << "info";
            break;
         case level::notice:
            os << "notice";
            break;
         case level::warning:
            os << "warning";
            break;
         case level::error:
            os << "error";
            break;
         case level::critical:
            os << "critical";
            break;
      }
      return os;
   }

   std::istream& operator>>(std::istream& is, level& l)
   {
      std::string s;
      if (is >> s)
      {
         if (s == "debug")
         {
            l = level::debug;
         }
         else if (s == "info")
         {
            l = level::info;
         }
         else if (s == "notice")
         {
            l = level::notice;
         }
         else if (s == "warning")
         {
            l = level::warning;
         }
         else if (s == "error")
         {
            l = level::error;
         }
         else if (s == "critical")
         {
            l = level::critical;
         }
         else
         {
            throw std::runtime_error("not a valid log level: \"" + s + "\"");
         }
      }
      return is;
   }
}  // namespace contractdb::loggers
