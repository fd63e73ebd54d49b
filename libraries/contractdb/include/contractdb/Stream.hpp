#pragma once

#include <contractdb/check.hpp>

#include <bit>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace contractdb
{
   enum class stream_error
   {
      no_error,
      underrun,
      bad_tag,
      trailing_data,
      unsorted_members,
      bad_magic,
      bad_version,
      too_deep,
   };

   constexpr inline std::string_view error_to_str(stream_error e)
   {
      switch (e)
      {
            // clang-format off
         case stream_error::no_error:         return "No error";
         case stream_error::underrun:         return "Stream underrun";
         case stream_error::bad_tag:          return "Bad type tag";
         case stream_error::trailing_data:    return "Trailing data after value";
         case stream_error::unsorted_members: return "Tuple members are not sorted or not unique";
         case stream_error::bad_magic:        return "Not a snapshot";
         case stream_error::bad_version:      return "Unsupported snapshot version";
         case stream_error::too_deep:         return "Value nested too deeply";
            // clang-format on

         default:
            return "unknown";
      }
   }

   class StreamError : public std::runtime_error
   {
     public:
      explicit StreamError(stream_error e)
          : std::runtime_error(std::string(error_to_str(e))), code_(e)
      {
      }
      stream_error code() const { return code_; }

     private:
      stream_error code_;
   };

   [[noreturn]] inline void abort_error(stream_error e)
   {
      throw StreamError(e);
   }

   inline void check(bool cond, stream_error e)
   {
      if (!cond)
         abort_error(e);
   }

   // Integers are written in host order, which must be little endian
   static_assert(std::endian::native == std::endian::little);

   struct VectorStream
   {
      std::vector<char>& data;
      VectorStream(std::vector<char>& data) : data(data) {}

      void write(char ch) { data.push_back(ch); }

      void write(const void* src, std::size_t size)
      {
         auto s = reinterpret_cast<const char*>(src);
         data.insert(data.end(), s, s + size);
      }

      template <typename T>
      void write_raw(const T& v)
      {
         static_assert(std::is_arithmetic_v<T>);
         write(&v, sizeof(v));
      }

      std::size_t written() const { return data.size(); }
   };

   struct InputStream
   {
      const char* pos;
      const char* end;

      InputStream(const char* pos, std::size_t size) : pos{pos}, end{pos + size} {}
      InputStream(std::span<const char> in) : InputStream(in.data(), in.size()) {}
      InputStream(const std::vector<char>& in) : InputStream(in.data(), in.size()) {}

      std::size_t remaining() const { return end - pos; }

      void check_available(std::size_t size) const { check(size <= remaining(), stream_error::underrun); }

      void read(void* dest, std::size_t size)
      {
         check_available(size);
         std::memcpy(dest, pos, size);
         pos += size;
      }

      template <typename T>
      void read_raw(T& dest)
      {
         static_assert(std::is_arithmetic_v<T>);
         read(&dest, sizeof(dest));
      }
   };

   inline void write_u32(std::uint32_t value, VectorStream& stream)
   {
      stream.write_raw(value);
   }

   inline std::uint32_t read_u32(InputStream& stream)
   {
      std::uint32_t result;
      stream.read_raw(result);
      return result;
   }

   inline void write_string(std::string_view s, VectorStream& stream)
   {
      write_u32(static_cast<std::uint32_t>(s.size()), stream);
      stream.write(s.data(), s.size());
   }

   inline std::string read_string(InputStream& stream)
   {
      auto size = read_u32(stream);
      stream.check_available(size);
      std::string result(stream.pos, size);
      stream.pos += size;
      return result;
   }
}  // namespace contractdb
