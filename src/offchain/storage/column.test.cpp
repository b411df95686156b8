#include <gtest/gtest.h>

#include <offchain/storage/column.hpp>

#include <set>
#include <string>

using offchain::storage::column;

TEST( column, stable_ids )
{
  EXPECT_EQ( offchain::storage::column_id( column::metadata ), 0u );
  EXPECT_EQ( offchain::storage::column_id( column::owned_coins ), 2u );
  EXPECT_EQ( offchain::storage::column_id( column::transaction_status ), 3u );
  EXPECT_EQ( offchain::storage::column_id( column::transactions_by_owner_block_idx ), 4u );
  EXPECT_EQ( offchain::storage::column_id( column::owned_message_ids ), 5u );
  EXPECT_EQ( offchain::storage::column_id( column::statistic ), 6u );
  EXPECT_EQ( offchain::storage::column_id( column::fuel_block_ids_to_heights ), 7u );
  EXPECT_EQ( offchain::storage::column_id( column::spent_messages ), 13u );
  EXPECT_EQ( offchain::storage::column_id( column::coins_to_spend ), 26u );
}

TEST( column, catalog )
{
#ifdef OFFCHAIN_FAULT_PROVING
  EXPECT_EQ( offchain::storage::column_count, offchain::storage::reserved_column_bound );
#else
  EXPECT_EQ( offchain::storage::column_count, offchain::storage::unconditional_column_bound );
#endif

  std::set< std::uint32_t > ids;
  std::set< std::string > names;

  for( auto c: offchain::storage::columns )
  {
    EXPECT_LT( offchain::storage::column_id( c ), offchain::storage::reserved_column_bound );
    EXPECT_FALSE( offchain::storage::column_name( c ).empty() );

    ids.insert( offchain::storage::column_id( c ) );
    names.emplace( offchain::storage::column_name( c ) );
  }

  EXPECT_EQ( ids.size(), offchain::storage::column_count );
  EXPECT_EQ( names.size(), offchain::storage::column_count );
}

TEST( column, names )
{
  EXPECT_EQ( offchain::storage::column_name( column::metadata ), "Metadata" );
  EXPECT_EQ( offchain::storage::column_name( column::transaction_status ), "TransactionStatus" );
  EXPECT_EQ( offchain::storage::column_name( column::statistic ), "Statistic" );
  EXPECT_EQ( offchain::storage::column_name( column::fuel_block_ids_to_heights ), "FuelBlockIdsToHeights" );
  EXPECT_EQ( offchain::storage::column_name( column::old_fuel_blocks ), "OldFuelBlocks" );
  EXPECT_EQ( offchain::storage::column_name( column::old_fuel_block_consensus ), "OldFuelBlockConsensus" );
  EXPECT_EQ( offchain::storage::column_name( column::coins_to_spend ), "CoinsToSpend" );

#ifdef OFFCHAIN_FAULT_PROVING
  EXPECT_EQ( offchain::storage::column_id( column::da_compression_temporal_registry_address_v2 ), 27u );
  EXPECT_EQ( offchain::storage::column_name( column::da_compression_temporal_registry_evictor_cache_merkle_metadata ),
             "DaCompressionTemporalRegistryEvictorCacheMerkleMetadata" );
#endif
}
