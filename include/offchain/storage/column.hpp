#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace offchain::storage {

/**
 * Logical tables multiplexed over the physical store.
 *
 * Identifiers are permanent. New columns are appended with the next free id and
 * an id is never reused, including the ids of columns that only exist when the
 * fault proving tables are compiled in.
 */
enum class column : std::uint32_t
{
  metadata = 0,
  genesis_metadata = 1,
  owned_coins = 2,
  transaction_status = 3,
  transactions_by_owner_block_idx = 4,
  owned_message_ids = 5,
  statistic = 6,
  fuel_block_ids_to_heights = 7,
  contracts_info = 8,
  old_fuel_blocks = 9,
  old_fuel_block_consensus = 10,
  old_transactions = 11,
  relayed_transaction_status = 12,
  spent_messages = 13,
  da_compressed_blocks = 14,
  da_compression_temporal_registry_index = 15,
  da_compression_temporal_registry_timestamps = 16,
  da_compression_temporal_registry_evictor_cache = 17,
  da_compression_temporal_registry_address = 18,
  da_compression_temporal_registry_asset_id = 19,
  da_compression_temporal_registry_contract_id = 20,
  da_compression_temporal_registry_script_code = 21,
  da_compression_temporal_registry_predicate_code = 22,
  coin_balances = 23,
  message_balances = 24,
  assets_info = 25,
  coins_to_spend = 26,
#ifdef OFFCHAIN_FAULT_PROVING
  da_compression_temporal_registry_address_v2 = 27,
  da_compression_temporal_address_merkle_data = 28,
  da_compression_temporal_address_merkle_metadata = 29,
  da_compression_temporal_registry_asset_id_v2 = 30,
  da_compression_temporal_asset_id_merkle_data = 31,
  da_compression_temporal_asset_id_merkle_metadata = 32,
  da_compression_temporal_registry_contract_id_v2 = 33,
  da_compression_temporal_contract_id_merkle_data = 34,
  da_compression_temporal_contract_id_merkle_metadata = 35,
  da_compression_temporal_registry_script_code_v2 = 36,
  da_compression_temporal_script_code_merkle_data = 37,
  da_compression_temporal_script_code_merkle_metadata = 38,
  da_compression_temporal_registry_predicate_code_v2 = 39,
  da_compression_temporal_predicate_code_merkle_data = 40,
  da_compression_temporal_predicate_code_merkle_metadata = 41,
  da_compression_temporal_registry_index_v2 = 42,
  da_compression_temporal_registry_index_merkle_data = 43,
  da_compression_temporal_registry_index_merkle_metadata = 44,
  da_compression_temporal_registry_timestamps_v2 = 45,
  da_compression_temporal_registry_timestamps_merkle_data = 46,
  da_compression_temporal_registry_timestamps_merkle_metadata = 47,
  da_compression_temporal_registry_evictor_cache_v2 = 48,
  da_compression_temporal_registry_evictor_cache_merkle_data = 49,
  da_compression_temporal_registry_evictor_cache_merkle_metadata = 50,
#endif
};

// Ids below this bound are present in every build.
constexpr std::uint32_t unconditional_column_bound = 27;

// Ids below this bound are assigned, whether or not they are compiled in.
constexpr std::uint32_t reserved_column_bound = 51;

constexpr std::uint32_t column_id( column c ) noexcept
{
  return static_cast< std::uint32_t >( c );
}

std::string_view column_name( column c ) noexcept;

namespace detail {

constexpr std::array unconditional_columns{
  column::metadata,
  column::genesis_metadata,
  column::owned_coins,
  column::transaction_status,
  column::transactions_by_owner_block_idx,
  column::owned_message_ids,
  column::statistic,
  column::fuel_block_ids_to_heights,
  column::contracts_info,
  column::old_fuel_blocks,
  column::old_fuel_block_consensus,
  column::old_transactions,
  column::relayed_transaction_status,
  column::spent_messages,
  column::da_compressed_blocks,
  column::da_compression_temporal_registry_index,
  column::da_compression_temporal_registry_timestamps,
  column::da_compression_temporal_registry_evictor_cache,
  column::da_compression_temporal_registry_address,
  column::da_compression_temporal_registry_asset_id,
  column::da_compression_temporal_registry_contract_id,
  column::da_compression_temporal_registry_script_code,
  column::da_compression_temporal_registry_predicate_code,
  column::coin_balances,
  column::message_balances,
  column::assets_info,
  column::coins_to_spend,
};

#ifdef OFFCHAIN_FAULT_PROVING
constexpr std::array conditional_columns{
  column::da_compression_temporal_registry_address_v2,
  column::da_compression_temporal_address_merkle_data,
  column::da_compression_temporal_address_merkle_metadata,
  column::da_compression_temporal_registry_asset_id_v2,
  column::da_compression_temporal_asset_id_merkle_data,
  column::da_compression_temporal_asset_id_merkle_metadata,
  column::da_compression_temporal_registry_contract_id_v2,
  column::da_compression_temporal_contract_id_merkle_data,
  column::da_compression_temporal_contract_id_merkle_metadata,
  column::da_compression_temporal_registry_script_code_v2,
  column::da_compression_temporal_script_code_merkle_data,
  column::da_compression_temporal_script_code_merkle_metadata,
  column::da_compression_temporal_registry_predicate_code_v2,
  column::da_compression_temporal_predicate_code_merkle_data,
  column::da_compression_temporal_predicate_code_merkle_metadata,
  column::da_compression_temporal_registry_index_v2,
  column::da_compression_temporal_registry_index_merkle_data,
  column::da_compression_temporal_registry_index_merkle_metadata,
  column::da_compression_temporal_registry_timestamps_v2,
  column::da_compression_temporal_registry_timestamps_merkle_data,
  column::da_compression_temporal_registry_timestamps_merkle_metadata,
  column::da_compression_temporal_registry_evictor_cache_v2,
  column::da_compression_temporal_registry_evictor_cache_merkle_data,
  column::da_compression_temporal_registry_evictor_cache_merkle_metadata,
};
#else
constexpr std::array< column, 0 > conditional_columns{};
#endif

template< std::size_t N, std::size_t M >
constexpr std::array< column, N + M > concat( const std::array< column, N >& a, const std::array< column, M >& b )
{
  std::array< column, N + M > out{};
  for( std::size_t i = 0; i < N; ++i )
    out[ i ] = a[ i ];
  for( std::size_t i = 0; i < M; ++i )
    out[ N + i ] = b[ i ];
  return out;
}

template< std::size_t N >
constexpr bool dense_from( const std::array< column, N >& cols, std::uint32_t first )
{
  for( std::size_t i = 0; i < N; ++i )
    if( column_id( cols[ i ] ) != first + i )
      return false;
  return true;
}

} // namespace detail

/**
 * Every column compiled into this build, in id order.
 */
constexpr auto columns = detail::concat( detail::unconditional_columns, detail::conditional_columns );

constexpr std::size_t column_count = columns.size();

static_assert( detail::unconditional_columns.size() == unconditional_column_bound );
static_assert( detail::dense_from( detail::unconditional_columns, 0 ) );
static_assert( detail::dense_from( detail::conditional_columns, unconditional_column_bound ) );
static_assert( detail::conditional_columns.empty()
               || unconditional_column_bound + detail::conditional_columns.size() == reserved_column_bound );

} // namespace offchain::storage
