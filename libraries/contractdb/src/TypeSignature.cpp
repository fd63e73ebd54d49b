#include <contractdb/TypeSignature.hpp>
#include <contractdb/check.hpp>

#include <algorithm>
#include <ostream>
#include <sstream>

namespace contractdb
{
   TupleTypeSignature::TupleTypeSignature(std::vector<TupleTypeMember> members)
       : members_(std::move(members))
   {
      std::sort(members_.begin(), members_.end(),
                [](const auto& lhs, const auto& rhs) { return lhs.name < rhs.name; });
      auto dup = std::adjacent_find(members_.begin(), members_.end(),
                                    [](const auto& lhs, const auto& rhs)
                                    { return lhs.name == rhs.name; });
      check(dup == members_.end(), "duplicate tuple type member");
   }

   TupleTypeSignature::TupleTypeSignature(std::initializer_list<TupleTypeMember> members)
       : TupleTypeSignature(std::vector<TupleTypeMember>(members))
   {
   }

   // Both member lists are sorted, so a single pass decides it
   bool TupleTypeSignature::admits(const Tuple& t) const
   {
      const auto& values = t.members();
      if (values.size() != members_.size())
         return false;
      for (std::size_t i = 0; i < members_.size(); ++i)
      {
         if (values[i].name != members_[i].name || !members_[i].type.admits(values[i].value))
            return false;
      }
      return true;
   }

   bool operator==(const TupleTypeSignature& lhs, const TupleTypeSignature& rhs)
   {
      return lhs.members_ == rhs.members_;
   }

   bool TypeSignature::admits(const Value& v) const
   {
      return std::visit(
          [&v](const auto& type)
          {
             using T = std::decay_t<decltype(type)>;
             if constexpr (std::is_same_v<T, VoidType>)
                return v.isVoid();
             else if constexpr (std::is_same_v<T, IntType>)
                return v.get_if<std::int64_t>() != nullptr;
             else if constexpr (std::is_same_v<T, BoolType>)
                return v.get_if<bool>() != nullptr;
             else if constexpr (std::is_same_v<T, BufferType>)
             {
                auto b = v.get_if<Buffer>();
                return b && b->size() <= type.maxLength;
             }
             else if constexpr (std::is_same_v<T, PrincipalType>)
                return v.get_if<Principal>() != nullptr;
             else
             {
                auto t = v.get_if<Tuple>();
                return t && type.admits(*t);
             }
          },
          value);
   }

   std::ostream& operator<<(std::ostream& os, const TypeSignature& t)
   {
      std::visit(
          [&os](const auto& type)
          {
             using T = std::decay_t<decltype(type)>;
             if constexpr (std::is_same_v<T, VoidType>)
                os << "void";
             else if constexpr (std::is_same_v<T, IntType>)
                os << "int";
             else if constexpr (std::is_same_v<T, BoolType>)
                os << "bool";
             else if constexpr (std::is_same_v<T, BufferType>)
                os << "(buff " << type.maxLength << ')';
             else if constexpr (std::is_same_v<T, PrincipalType>)
                os << "principal";
             else
             {
                os << "(tuple";
                for (const auto& m : type.members())
                   os << " (" << m.name << ' ' << m.type << ')';
                os << ')';
             }
          },
          t.value);
      return os;
   }

   std::string to_string(const TypeSignature& t)
   {
      std::ostringstream ss;
      ss << t;
      return ss.str();
   }
}  // namespace contractdb
