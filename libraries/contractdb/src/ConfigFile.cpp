#include <contractdb/ConfigFile.hpp>

#include <cctype>
#include <cstdlib>
#include <istream>
#include <stdexcept>
#include <string_view>

namespace
{
   std::string_view trim(std::string_view s)
   {
      constexpr std::string_view ws    = " \t\r\n";
      auto                       start = s.find_first_not_of(ws);
      if (start == std::string_view::npos)
         return {};
      return s.substr(start, s.find_last_not_of(ws) + 1 - start);
   }

   // Finds the # that starts a comment, skipping quoted text and escapes
   std::size_t commentStart(std::string_view line)
   {
      bool quoted = false;
      for (std::size_t i = 0; i < line.size(); ++i)
      {
         if (line[i] == '\\')
            ++i;
         else if (line[i] == '"')
            quoted = !quoted;
         else if (line[i] == '#' && !quoted)
            return i;
      }
      return line.size();
   }

   // Environment variable named at the start of `s`, if any
   std::string_view varName(std::string_view s)
   {
      std::size_t n = 0;
      while (n < s.size() && (std::isalnum(static_cast<unsigned char>(s[n])) || s[n] == '_'))
         ++n;
      return s.substr(0, n);
   }

   // Drops quotes, applies \ escapes (\n is a newline) and substitutes $VAR
   std::string unquote(std::string_view s)
   {
      std::string result;
      for (std::size_t i = 0; i < s.size(); ++i)
      {
         char ch = s[i];
         if (ch == '"')
            continue;
         if (ch == '\\' && i + 1 < s.size())
         {
            ch = s[++i];
            result.push_back(ch == 'n' ? '\n' : ch);
         }
         else if (ch == '$' && !varName(s.substr(i + 1)).empty())
         {
            std::string name{varName(s.substr(i + 1))};
            if (const char* value = std::getenv(name.c_str()))
               result += value;
            i += name.size();
         }
         else if (ch != '\\')
         {
            result.push_back(ch);
         }
      }
      return result;
   }
}  // namespace

boost::program_options::parsed_options contractdb::parse_config_file(
    std::istream&                                      file,
    const boost::program_options::options_description& opts,
    const std::string&                                 filename)
{
   boost::program_options::parsed_options result{&opts};
   std::string                            line;
   for (std::size_t lineNumber = 1; std::getline(file, line); ++lineNumber)
   {
      auto fail = [&](const std::string& msg)
      { throw std::runtime_error(filename + ":" + std::to_string(lineNumber) + ": " + msg); };

      std::string_view text{line};
      text = trim(text.substr(0, commentStart(text)));
      if (text.empty())
         continue;
      auto eq = text.find('=');
      if (eq == std::string_view::npos)
         fail("expected key = value");
      std::string key{trim(text.substr(0, eq))};
      auto        value = trim(text.substr(eq + 1));
      if (!opts.find_nothrow(key, false))
         fail("Unknown option " + key);

      boost::program_options::option opt{key, {unquote(value)}};
      opt.original_tokens = {key, std::string(value)};
      result.options.push_back(std::move(opt));
   }
   return result;
}
