#include <contractdb/Codec.hpp>

#include <catch2/catch.hpp>

using namespace contractdb;

namespace
{
   std::vector<char> bytes(std::initializer_list<int> in)
   {
      std::vector<char> result;
      for (int b : in)
         result.push_back(static_cast<char>(b));
      return result;
   }
}  // namespace

TEST_CASE("value encoding")
{
   CHECK(convert_to_bin(Value{}) == bytes({0}));
   CHECK(convert_to_bin(Value{true}) == bytes({2, 1}));
   CHECK(convert_to_bin(Value{Principal{"ab"}}) == bytes({4, 2, 0, 0, 0, 'a', 'b'}));
   CHECK(convert_to_bin(Value{1}) == bytes({1, 1, 0, 0, 0, 0, 0, 0, 0}));
   CHECK(convert_to_bin(makeTuple({{"x", false}})) ==
         bytes({5, 1, 0, 0, 0, 1, 0, 0, 0, 'x', 2, 0}));
}

TEST_CASE("equal tuples encode identically")
{
   auto a = makeTuple({{"owner", Principal{"alice"}}, {"id", 7}});
   auto b = makeTuple({{"id", 7}, {"owner", Principal{"alice"}}});
   CHECK(convert_to_bin(a) == convert_to_bin(b));
}

TEST_CASE("nested value survives encoding")
{
   Value v = makeTuple({{"inner", makeTuple({{"buf", Buffer{0, 0xff, 7}}, {"n", -3}})},
                        {"who", Principal{"carol"}}});
   CHECK(value_from_bin(convert_to_bin(v)) == v);

   TypeSignature t = TupleTypeSignature{
       {"inner", TupleTypeSignature{{"buf", BufferType{8}}, {"n", IntType{}}}},
       {"who", PrincipalType{}}};
   CHECK(type_from_bin(convert_to_bin(t)) == t);
   CHECK(t.admits(v));
}

TEST_CASE("malformed encodings")
{
   auto expectError = [](const std::vector<char>& data, stream_error code)
   {
      try
      {
         value_from_bin(data);
         FAIL("expected StreamError");
      }
      catch (StreamError& e)
      {
         CHECK(e.code() == code);
      }
   };

   SECTION("empty")
   {
      expectError({}, stream_error::underrun);
   }
   SECTION("truncated int")
   {
      expectError(bytes({1, 0, 0}), stream_error::underrun);
   }
   SECTION("unknown tag")
   {
      expectError(bytes({9}), stream_error::bad_tag);
   }
   SECTION("bad bool")
   {
      expectError(bytes({2, 2}), stream_error::bad_tag);
   }
   SECTION("string longer than input")
   {
      expectError(bytes({4, 100, 0, 0, 0, 'a'}), stream_error::underrun);
   }
   SECTION("trailing data")
   {
      expectError(bytes({0, 0}), stream_error::trailing_data);
   }
   SECTION("unsorted tuple")
   {
      expectError(bytes({5, 2, 0, 0, 0, 1, 0, 0, 0, 'b', 0, 1, 0, 0, 0, 'a', 0}),
                  stream_error::unsorted_members);
   }
   SECTION("duplicate tuple member")
   {
      expectError(bytes({5, 2, 0, 0, 0, 1, 0, 0, 0, 'a', 0, 1, 0, 0, 0, 'a', 0}),
                  stream_error::unsorted_members);
   }
}

TEST_CASE("tuple type decoding requires a tuple")
{
   CHECK_THROWS_AS(tuple_type_from_bin(convert_to_bin(TypeSignature{IntType{}})), StreamError);
   TupleTypeSignature t{{"a", IntType{}}};
   CHECK(tuple_type_from_bin(convert_to_bin(TypeSignature{t})) == t);
}

namespace
{
   Value nestedValue(std::uint32_t depth)
   {
      Value v{1};
      for (std::uint32_t i = 0; i < depth; ++i)
         v = makeTuple({{"a", std::move(v)}});
      return v;
   }

   // `depth` single-member tuples wrapped around void, built directly as bytes
   std::vector<char> nestedBytes(std::size_t depth)
   {
      std::vector<char> result;
      result.reserve(depth * 10 + 1);
      for (std::size_t i = 0; i < depth; ++i)
      {
         auto level = bytes({5, 1, 0, 0, 0, 1, 0, 0, 0, 'a'});
         result.insert(result.end(), level.begin(), level.end());
      }
      result.push_back(0);
      return result;
   }
}  // namespace

TEST_CASE("nesting depth is limited when decoding")
{
   auto deepest = nestedValue(max_tuple_depth);
   CHECK(value_from_bin(convert_to_bin(deepest)) == deepest);

   auto tooDeep = [](const std::vector<char>& data)
   {
      try
      {
         value_from_bin(data);
         FAIL("expected StreamError");
      }
      catch (StreamError& e)
      {
         CHECK(e.code() == stream_error::too_deep);
      }
   };
   tooDeep(convert_to_bin(nestedValue(max_tuple_depth + 1)));
   // Far deeper than the stack could take if every level recursed
   tooDeep(nestedBytes(1000000));

   TypeSignature type = IntType{};
   for (std::uint32_t i = 0; i <= max_tuple_depth; ++i)
      type = TupleTypeSignature{{"a", std::move(type)}};
   CHECK_THROWS_AS(type_from_bin(convert_to_bin(type)), StreamError);
}
