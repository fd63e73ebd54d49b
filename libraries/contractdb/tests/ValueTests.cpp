#include <contractdb/TypeSignature.hpp>
#include <contractdb/Value.hpp>

#include <catch2/catch.hpp>

#include <unordered_set>

using namespace contractdb;

TEST_CASE("tuple members are sorted")
{
   auto t = makeTuple({{"b", 2}, {"a", 1}});
   REQUIRE(t.members().size() == 2);
   CHECK(t.members()[0].name == "a");
   CHECK(t.members()[1].name == "b");
   CHECK(t == makeTuple({{"a", 1}, {"b", 2}}));
   REQUIRE(t.get("b") != nullptr);
   CHECK(*t.get("b") == Value{2});
   CHECK(t.get("c") == nullptr);
}

TEST_CASE("duplicate tuple members")
{
   CHECK_THROWS(makeTuple({{"a", 1}, {"a", 2}}));
   CHECK_THROWS(TupleTypeSignature{{"a", IntType{}}, {"a", BoolType{}}});
}

TEST_CASE("value equality and hashing")
{
   Value a = makeTuple({{"owner", Principal{"alice"}}});
   Value b = makeTuple({{"owner", Principal{"alice"}}});
   Value c = makeTuple({{"owner", Principal{"bob"}}});
   CHECK(a == b);
   CHECK(a != c);
   CHECK(std::hash<Value>{}(a) == std::hash<Value>{}(b));

   // int and bool never compare equal, even for 1 and true
   CHECK(Value{1} != Value{true});

   std::unordered_set<Value> set{a, b, c, Value{}, Value{1}};
   CHECK(set.size() == 4);
}

TEST_CASE("value printing")
{
   CHECK(to_string(Value{}) == "void");
   CHECK(to_string(Value{-42}) == "-42");
   CHECK(to_string(Value{false}) == "false");
   CHECK(to_string(Value{Buffer{0x01, 0xab}}) == "0x01ab");
   CHECK(to_string(Value{Principal{"alice"}}) == "'alice");
   CHECK(to_string(makeTuple({{"owner", Principal{"alice"}}, {"amount", 100}})) ==
         "(tuple (amount 100) (owner 'alice))");
}

TEST_CASE("type printing")
{
   TypeSignature t = TupleTypeSignature{{"memo", BufferType{32}}, {"ok", BoolType{}}};
   CHECK(to_string(t) == "(tuple (memo (buff 32)) (ok bool))");
   CHECK(to_string(TypeSignature{}) == "void");
   CHECK(to_string(TypeSignature{PrincipalType{}}) == "principal");
   CHECK(to_string(TypeSignature{IntType{}}) == "int");
}

TEST_CASE("admits")
{
   CHECK(TypeSignature{IntType{}}.admits(Value{5}));
   CHECK(!TypeSignature{IntType{}}.admits(Value{true}));
   CHECK(TypeSignature{BoolType{}}.admits(Value{true}));
   CHECK(TypeSignature{PrincipalType{}}.admits(Value{Principal{"a"}}));
   CHECK(!TypeSignature{PrincipalType{}}.admits(Value{}));
   CHECK(TypeSignature{VoidType{}}.admits(Value{}));
   CHECK(!TypeSignature{IntType{}}.admits(Value{}));

   TypeSignature buff{BufferType{2}};
   CHECK(buff.admits(Value{Buffer{}}));
   CHECK(buff.admits(Value{Buffer{1, 2}}));
   CHECK(!buff.admits(Value{Buffer{1, 2, 3}}));

   TypeSignature tuple = TupleTypeSignature{{"a", IntType{}}, {"b", BoolType{}}};
   CHECK(tuple.admits(makeTuple({{"b", true}, {"a", 1}})));
   CHECK(!tuple.admits(makeTuple({{"a", 1}})));
   CHECK(!tuple.admits(makeTuple({{"a", 1}, {"b", 2}})));
   CHECK(!tuple.admits(makeTuple({{"a", 1}, {"b", true}, {"c", 3}})));
   CHECK(!tuple.admits(makeTuple({{"a", 1}, {"c", true}})));
   CHECK(!tuple.admits(Value{1}));

   TypeSignature nested = TupleTypeSignature{{"inner", TupleTypeSignature{{"x", IntType{}}}}};
   CHECK(nested.admits(makeTuple({{"inner", makeTuple({{"x", 1}})}})));
   CHECK(!nested.admits(makeTuple({{"inner", makeTuple({{"x", false}})}})));
}
