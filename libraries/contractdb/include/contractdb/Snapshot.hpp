#pragma once

#include <contractdb/ContractDatabase.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace contractdb::snapshot
{
   // snapshot format:
   // header
   // u32 map-count
   // (name key-type value-type u32 entry-count (key value)*)*
   struct SnapshotHeader
   {
      std::uint32_t magic   = 0x4d444243;
      std::uint32_t version = 0;
   };

   /// Serializes every map in `db`, with its schemas and entries
   std::vector<char> saveSnapshot(const ContractDatabase& db);

   /// Recreates every map in the snapshot inside `db`.
   ///
   /// Maps in `db` that the snapshot does not name are left alone. The whole
   /// snapshot is decoded and checked against its schemas before `db` is
   /// touched, so a malformed snapshot changes nothing. The maps are then
   /// written inside ContractDatabase::apply, so a storage failure part way
   /// through also leaves `db` as it was.
   void loadSnapshot(ContractDatabase& db, std::span<const char> data);
}  // namespace contractdb::snapshot
