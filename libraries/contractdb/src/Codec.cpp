#include <contractdb/Codec.hpp>

#include <algorithm>

namespace contractdb
{
   namespace
   {
      void write_tag(TypeTag tag, VectorStream& stream)
      {
         stream.write(static_cast<char>(tag));
      }

      TypeTag read_tag(InputStream& stream)
      {
         std::uint8_t tag;
         stream.read_raw(tag);
         check(tag <= static_cast<std::uint8_t>(TypeTag::tuple), stream_error::bad_tag);
         return static_cast<TypeTag>(tag);
      }

      // Encoded tuples must already be in canonical order. Accepting any
      // other order would give one value two encodings.
      template <typename M>
      void check_sorted(const std::vector<M>& members)
      {
         for (std::size_t i = 1; i < members.size(); ++i)
            check(members[i - 1].name < members[i].name, stream_error::unsorted_members);
      }

      template <typename T, typename F>
      T from_bin_exact(std::span<const char> data, F&& f)
      {
         InputStream stream{data};
         T           result;
         f(result, stream);
         check(stream.remaining() == 0, stream_error::trailing_data);
         return result;
      }
   }  // namespace

   void to_bin(const Value& v, VectorStream& stream)
   {
      std::visit(
          [&stream](const auto& x)
          {
             using T = std::decay_t<decltype(x)>;
             if constexpr (std::is_same_v<T, Void>)
                write_tag(TypeTag::void_, stream);
             else if constexpr (std::is_same_v<T, std::int64_t>)
             {
                write_tag(TypeTag::int_, stream);
                stream.write_raw(x);
             }
             else if constexpr (std::is_same_v<T, bool>)
             {
                write_tag(TypeTag::bool_, stream);
                stream.write(static_cast<char>(x ? 1 : 0));
             }
             else if constexpr (std::is_same_v<T, Buffer>)
             {
                write_tag(TypeTag::buffer, stream);
                write_u32(static_cast<std::uint32_t>(x.size()), stream);
                stream.write(x.data(), x.size());
             }
             else if constexpr (std::is_same_v<T, Principal>)
             {
                write_tag(TypeTag::principal, stream);
                write_string(x.name, stream);
             }
             else
             {
                write_tag(TypeTag::tuple, stream);
                write_u32(static_cast<std::uint32_t>(x.members().size()), stream);
                for (const auto& m : x.members())
                {
                   write_string(m.name, stream);
                   to_bin(m.value, stream);
                }
             }
          },
          v.data);
   }

   void to_bin(const TypeSignature& t, VectorStream& stream)
   {
      std::visit(
          [&stream](const auto& type)
          {
             using T = std::decay_t<decltype(type)>;
             if constexpr (std::is_same_v<T, VoidType>)
                write_tag(TypeTag::void_, stream);
             else if constexpr (std::is_same_v<T, IntType>)
                write_tag(TypeTag::int_, stream);
             else if constexpr (std::is_same_v<T, BoolType>)
                write_tag(TypeTag::bool_, stream);
             else if constexpr (std::is_same_v<T, BufferType>)
             {
                write_tag(TypeTag::buffer, stream);
                write_u32(type.maxLength, stream);
             }
             else if constexpr (std::is_same_v<T, PrincipalType>)
                write_tag(TypeTag::principal, stream);
             else
             {
                write_tag(TypeTag::tuple, stream);
                write_u32(static_cast<std::uint32_t>(type.members().size()), stream);
                for (const auto& m : type.members())
                {
                   write_string(m.name, stream);
                   to_bin(m.type, stream);
                }
             }
          },
          t.value);
   }

   namespace
   {
      void read_value(Value& v, InputStream& stream, std::uint32_t depth);
      void read_type(TypeSignature& t, InputStream& stream, std::uint32_t depth);

      // `depth` counts the tuples that enclose this one
      template <typename M, typename F>
      std::vector<M> read_members(InputStream& stream, std::uint32_t depth, F&& read_member)
      {
         check(depth < max_tuple_depth, stream_error::too_deep);
         auto           count = read_u32(stream);
         std::vector<M> members;
         // Each member takes at least 5 bytes
         members.reserve(std::min<std::size_t>(count, stream.remaining() / 5));
         for (std::uint32_t i = 0; i < count; ++i)
         {
            M m;
            m.name = read_string(stream);
            read_member(m);
            members.push_back(std::move(m));
         }
         check_sorted(members);
         return members;
      }

      void read_value(Value& v, InputStream& stream, std::uint32_t depth)
      {
         switch (read_tag(stream))
         {
            case TypeTag::void_:
               v = Value{};
               break;
            case TypeTag::int_:
            {
               std::int64_t x;
               stream.read_raw(x);
               v = x;
               break;
            }
            case TypeTag::bool_:
            {
               std::uint8_t x;
               stream.read_raw(x);
               check(x <= 1, stream_error::bad_tag);
               v = x != 0;
               break;
            }
            case TypeTag::buffer:
            {
               auto size = read_u32(stream);
               stream.check_available(size);
               Buffer b(stream.pos, stream.pos + size);
               stream.pos += size;
               v = std::move(b);
               break;
            }
            case TypeTag::principal:
               v = Principal{read_string(stream)};
               break;
            case TypeTag::tuple:
               v = Tuple{read_members<TupleMember>(
                   stream, depth,
                   [&](TupleMember& m) { read_value(m.value, stream, depth + 1); })};
               break;
         }
      }

      void read_type(TypeSignature& t, InputStream& stream, std::uint32_t depth)
      {
         switch (read_tag(stream))
         {
            case TypeTag::void_:
               t = VoidType{};
               break;
            case TypeTag::int_:
               t = IntType{};
               break;
            case TypeTag::bool_:
               t = BoolType{};
               break;
            case TypeTag::buffer:
               t = BufferType{read_u32(stream)};
               break;
            case TypeTag::principal:
               t = PrincipalType{};
               break;
            case TypeTag::tuple:
               t = TupleTypeSignature{read_members<TupleTypeMember>(
                   stream, depth,
                   [&](TupleTypeMember& m) { read_type(m.type, stream, depth + 1); })};
               break;
         }
      }
   }  // namespace

   void from_bin(Value& v, InputStream& stream)
   {
      read_value(v, stream, 0);
   }

   void from_bin(TypeSignature& t, InputStream& stream)
   {
      read_type(t, stream, 0);
   }

   std::vector<char> convert_to_bin(const Value& v)
   {
      std::vector<char> result;
      VectorStream      stream{result};
      to_bin(v, stream);
      return result;
   }

   std::vector<char> convert_to_bin(const TypeSignature& t)
   {
      std::vector<char> result;
      VectorStream      stream{result};
      to_bin(t, stream);
      return result;
   }

   Value value_from_bin(std::span<const char> data)
   {
      return from_bin_exact<Value>(data, [](Value& v, InputStream& s) { from_bin(v, s); });
   }

   TypeSignature type_from_bin(std::span<const char> data)
   {
      return from_bin_exact<TypeSignature>(data,
                                           [](TypeSignature& t, InputStream& s) { from_bin(t, s); });
   }

   TupleTypeSignature tuple_type_from_bin(std::span<const char> data)
   {
      auto t     = type_from_bin(data);
      auto tuple = t.tuple();
      check(tuple != nullptr, stream_error::bad_tag);
      return *tuple;
   }
}  // namespace contractdb
