#pragma once

#include <contractdb/Config.hpp>

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace contractdb
{
   /// Help text listing the commands runCommand accepts
   std::string_view commandUsage();

   /// Runs `command` (name followed by its arguments) against the database
   /// `cfg` describes, writing results to `out` and complaints to `err`.
   ///
   /// Returns 0 on success, 1 for a usage error and 2 when the command
   /// fails. Failures are also logged.
   int runCommand(const std::vector<std::string>& command,
                  const DatabaseConfig&           cfg,
                  std::ostream&                   out,
                  std::ostream&                   err);
}  // namespace contractdb
