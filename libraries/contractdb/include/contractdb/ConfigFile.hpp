#pragma once

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>

#include <iosfwd>
#include <string>

namespace contractdb
{
   // Differences from boost::program_options::parse_config_file:
   // - Allows double-quoted strings in value
   //   - # inside a double-quoted string does not begin a comment
   //   - backslash escapes are processed inside double-quoted strings
   // - $VAR in a value expands to the environment variable VAR
   // - Unknown options are an error that names the file and line
   boost::program_options::parsed_options parse_config_file(
       std::istream&,
       const boost::program_options::options_description&,
       const std::string& filename = "<unknown>");
}  // namespace contractdb
