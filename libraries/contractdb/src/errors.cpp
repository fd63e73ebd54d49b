#include <contractdb/errors.hpp>
#include <contractdb/log.hpp>

namespace contractdb
{
   namespace
   {
      // Keeps messages and log records readable for huge values
      std::string abbreviate(std::string s)
      {
         if (s.size() > TypeError::max_printed)
         {
            s.resize(TypeError::max_printed);
            s += "...";
         }
         return s;
      }
   }  // namespace

   TypeError::TypeError(TypeSignature expected, Value actual)
       : std::runtime_error("type error: expected " + abbreviate(to_string(expected)) +
                            ", got " + abbreviate(to_string(actual))),
         expected_(std::move(expected)),
         actual_(std::move(actual))
   {
   }

   void checkAdmits(const TypeSignature& type, const Value& v)
   {
      if (!type.admits(v))
      {
         TypeError err{type, v};
         CONTRACTDB_LOG(loggers::generic::get(), debug) << err.what();
         throw err;
      }
   }
}  // namespace contractdb
