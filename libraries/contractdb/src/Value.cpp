#include <contractdb/Value.hpp>
#include <contractdb/check.hpp>

#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <ostream>
#include <sstream>

namespace contractdb
{
   namespace
   {
      bool nameLess(const TupleMember& lhs, const TupleMember& rhs)
      {
         return lhs.name < rhs.name;
      }

      void writeHex(std::ostream& os, const Buffer& b)
      {
         static const char xdigits[] = "0123456789abcdef";
         os << "0x";
         for (auto ch : b)
         {
            os << xdigits[(ch >> 4) & 0xF];
            os << xdigits[ch & 0xF];
         }
      }
   }  // namespace

   Tuple::Tuple(std::vector<TupleMember> members) : members_(std::move(members))
   {
      std::sort(members_.begin(), members_.end(), nameLess);
      auto dup = std::adjacent_find(members_.begin(), members_.end(),
                                    [](const auto& lhs, const auto& rhs)
                                    { return lhs.name == rhs.name; });
      check(dup == members_.end(), "duplicate tuple member");
   }

   const Value* Tuple::get(std::string_view name) const
   {
      auto pos = std::lower_bound(members_.begin(), members_.end(), name,
                                  [](const TupleMember& m, std::string_view n)
                                  { return m.name < n; });
      if (pos != members_.end() && pos->name == name)
         return &pos->value;
      return nullptr;
   }

   bool operator==(const Tuple& lhs, const Tuple& rhs)
   {
      return lhs.members_ == rhs.members_;
   }

   Tuple makeTuple(std::initializer_list<TupleMember> members)
   {
      return Tuple{std::vector<TupleMember>(members)};
   }

   std::ostream& operator<<(std::ostream& os, const Value& v)
   {
      std::visit(
          [&os](const auto& x)
          {
             using T = std::decay_t<decltype(x)>;
             if constexpr (std::is_same_v<T, Void>)
                os << "void";
             else if constexpr (std::is_same_v<T, bool>)
                os << (x ? "true" : "false");
             else if constexpr (std::is_same_v<T, std::int64_t>)
                os << x;
             else if constexpr (std::is_same_v<T, Buffer>)
                writeHex(os, x);
             else if constexpr (std::is_same_v<T, Principal>)
                os << '\'' << x.name;
             else
             {
                os << "(tuple";
                for (const auto& m : x.members())
                   os << " (" << m.name << ' ' << m.value << ')';
                os << ')';
             }
          },
          v.data);
      return os;
   }

   std::string to_string(const Value& v)
   {
      std::ostringstream ss;
      ss << v;
      return ss.str();
   }

   std::size_t hash_value(const Value& v)
   {
      std::size_t seed = v.data.index();
      std::visit(
          [&seed](const auto& x)
          {
             using T = std::decay_t<decltype(x)>;
             if constexpr (std::is_same_v<T, Void>)
             {
             }
             else if constexpr (std::is_same_v<T, Principal>)
                boost::hash_combine(seed, x.name);
             else if constexpr (std::is_same_v<T, Tuple>)
             {
                for (const auto& m : x.members())
                {
                   boost::hash_combine(seed, m.name);
                   boost::hash_combine(seed, hash_value(m.value));
                }
             }
             else
                boost::hash_combine(seed, x);
          },
          v.data);
      return seed;
   }
}  // namespace contractdb
