#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace contractdb
{
   /// Abort with `message`
   ///
   /// Throws `E`, which must be constructible from a std::string.
   template <typename E = std::runtime_error>
   [[noreturn]] void abortMessage(std::string_view message)
   {
      throw E(std::string(message));
   }

   /// Abort with message if `!cond`
   template <typename E = std::runtime_error>
   void check(bool cond, std::string_view message)
   {
      if (!cond)
         abortMessage<E>(message);
   }
}  // namespace contractdb
