#include <contractdb/Codec.hpp>
#include <contractdb/Snapshot.hpp>
#include <contractdb/errors.hpp>

#include <catch2/catch.hpp>

#include <stdexcept>
#include <utility>

#include "Backends.hpp"

using namespace contractdb;
using namespace contractdb::snapshot;

namespace
{
   void fillBalances(ContractDatabase& db)
   {
      db.createMap("balances", ownerKey(), amountValue());
      db.createMap("empty", ownerKey(), {{"flag", BoolType{}}});
      auto* map = db.getMutDataMap("balances");
      map->setEntry(owner("amy"), amount(1));
      map->setEntry(owner("bob"), amount(-2));
   }

   // A snapshot with one map whose single entry is described by the caller
   std::vector<char> handWritten(const Value& key, const Value& value)
   {
      std::vector<char> result;
      VectorStream      stream{result};
      SnapshotHeader    header;
      write_u32(header.magic, stream);
      write_u32(header.version, stream);
      write_u32(1, stream);
      write_string("balances", stream);
      to_bin(TypeSignature{ownerKey()}, stream);
      to_bin(TypeSignature{amountValue()}, stream);
      write_u32(1, stream);
      to_bin(key, stream);
      to_bin(value, stream);
      return result;
   }
}  // namespace

TEMPLATE_TEST_CASE("snapshot round trip", "[snapshot]", MemoryBackend, SqliteBackend)
{
   auto source = TestType::open();
   fillBalances(*source);
   auto data = saveSnapshot(*source);

   // Load into the other backend as well, so the format is backend neutral
   auto memory = MemoryBackend::open();
   auto sqlite = SqliteBackend::open();
   for (auto* target : {memory.get(), sqlite.get()})
   {
      loadSnapshot(*target, data);
      CHECK(target->mapNames() == std::vector<std::string>{"balances", "empty"});
      const DataMap* balances = std::as_const(*target).getDataMap("balances");
      REQUIRE(balances != nullptr);
      CHECK(balances->size() == 2);
      CHECK(balances->fetchEntry(owner("amy")) == amount(1));
      CHECK(balances->fetchEntry(owner("bob")) == amount(-2));
      const DataMap* empty = std::as_const(*target).getDataMap("empty");
      REQUIRE(empty != nullptr);
      CHECK(empty->size() == 0);
      CHECK(empty->valueType() == TypeSignature{TupleTypeSignature{{"flag", BoolType{}}}});
      CHECK(saveSnapshot(*target) == data);
   }
}

TEST_CASE("empty database snapshot")
{
   auto db   = MemoryBackend::open();
   auto data = saveSnapshot(*db);
   CHECK(data.size() == 12);
   auto other = SqliteBackend::open();
   loadSnapshot(*other, data);
   CHECK(other->mapNames().empty());
}

TEST_CASE("loading leaves unnamed maps alone and replaces named ones")
{
   auto source = MemoryBackend::open();
   fillBalances(*source);
   auto data = saveSnapshot(*source);

   auto target = MemoryBackend::open();
   target->createMap("balances", ownerKey(), amountValue());
   target->getMutDataMap("balances")->setEntry(owner("zed"), amount(9));
   target->createMap("other", ownerKey(), amountValue());
   target->getMutDataMap("other")->setEntry(owner("zed"), amount(9));

   loadSnapshot(*target, data);
   CHECK(target->mapNames() == std::vector<std::string>{"balances", "empty", "other"});
   CHECK(target->getMutDataMap("balances")->fetchEntry(owner("zed")).isVoid());
   CHECK(target->getMutDataMap("other")->fetchEntry(owner("zed")) == amount(9));
}

TEST_CASE("malformed snapshots change nothing")
{
   auto source = MemoryBackend::open();
   fillBalances(*source);
   auto data = saveSnapshot(*source);

   auto target = MemoryBackend::open();
   target->createMap("balances", ownerKey(), amountValue());
   target->getMutDataMap("balances")->setEntry(owner("zed"), amount(9));

   auto unchanged = [&]
   {
      CHECK(target->mapNames() == std::vector<std::string>{"balances"});
      CHECK(target->getMutDataMap("balances")->fetchEntry(owner("zed")) == amount(9));
   };
   auto expectError = [&](const std::vector<char>& bad, stream_error code)
   {
      try
      {
         loadSnapshot(*target, bad);
         FAIL("expected StreamError");
      }
      catch (StreamError& e)
      {
         CHECK(e.code() == code);
      }
      unchanged();
   };

   SECTION("bad magic")
   {
      auto bad = data;
      bad[0] ^= 1;
      expectError(bad, stream_error::bad_magic);
   }
   SECTION("bad version")
   {
      auto bad = data;
      bad[4]   = 1;
      expectError(bad, stream_error::bad_version);
   }
   SECTION("truncated")
   {
      auto bad = data;
      bad.pop_back();
      expectError(bad, stream_error::underrun);
   }
   SECTION("trailing data")
   {
      auto bad = data;
      bad.push_back(0);
      expectError(bad, stream_error::trailing_data);
   }
   SECTION("key nested too deeply")
   {
      Value key = Value{};
      for (int i = 0; i < 1000; ++i)
         key = makeTuple({{"owner", std::move(key)}});
      expectError(handWritten(key, amount(1)), stream_error::too_deep);
   }
   SECTION("entry violates its schema")
   {
      auto bad = handWritten(owner("amy"), makeTuple({{"amount", true}}));
      CHECK_THROWS_AS(loadSnapshot(*target, bad), TypeError);
      unchanged();
   }
   SECTION("hand-written snapshot that follows its schema")
   {
      loadSnapshot(*target, handWritten(owner("amy"), amount(3)));
      CHECK(target->getMutDataMap("balances")->fetchEntry(owner("amy")) == amount(3));
      CHECK(target->getMutDataMap("balances")->fetchEntry(owner("zed")).isVoid());
   }
}

TEMPLATE_TEST_CASE("a load undone by an enclosing apply",
                   "[snapshot]",
                   MemoryBackend,
                   SqliteBackend)
{
   auto source = MemoryBackend::open();
   fillBalances(*source);
   auto data = saveSnapshot(*source);

   auto target = TestType::open();
   target->createMap("balances", ownerKey(), amountValue());
   target->getMutDataMap("balances")->setEntry(owner("zed"), amount(9));
   CHECK_THROWS_WITH(target->apply(
                         [&]
                         {
                            loadSnapshot(*target, data);
                            throw std::runtime_error("stop");
                         }),
                     "stop");
   CHECK(target->mapNames() == std::vector<std::string>{"balances"});
   CHECK(target->getMutDataMap("balances")->fetchEntry(owner("zed")) == amount(9));
   CHECK(target->getMutDataMap("balances")->fetchEntry(owner("amy")).isVoid());
}
