#include <offchain/storage/column.hpp>

#include <utility>

namespace offchain::storage {

std::string_view column_name( column c ) noexcept
{
  using namespace std::string_view_literals;
  switch( c )
  {
    case column::metadata:
      return "Metadata"sv;
    case column::genesis_metadata:
      return "GenesisMetadata"sv;
    case column::owned_coins:
      return "OwnedCoins"sv;
    case column::transaction_status:
      return "TransactionStatus"sv;
    case column::transactions_by_owner_block_idx:
      return "TransactionsByOwnerBlockIdx"sv;
    case column::owned_message_ids:
      return "OwnedMessageIds"sv;
    case column::statistic:
      return "Statistic"sv;
    case column::fuel_block_ids_to_heights:
      return "FuelBlockIdsToHeights"sv;
    case column::contracts_info:
      return "ContractsInfo"sv;
    case column::old_fuel_blocks:
      return "OldFuelBlocks"sv;
    case column::old_fuel_block_consensus:
      return "OldFuelBlockConsensus"sv;
    case column::old_transactions:
      return "OldTransactions"sv;
    case column::relayed_transaction_status:
      return "RelayedTransactionStatus"sv;
    case column::spent_messages:
      return "SpentMessages"sv;
    case column::da_compressed_blocks:
      return "DaCompressedBlocks"sv;
    case column::da_compression_temporal_registry_index:
      return "DaCompressionTemporalRegistryIndex"sv;
    case column::da_compression_temporal_registry_timestamps:
      return "DaCompressionTemporalRegistryTimestamps"sv;
    case column::da_compression_temporal_registry_evictor_cache:
      return "DaCompressionTemporalRegistryEvictorCache"sv;
    case column::da_compression_temporal_registry_address:
      return "DaCompressionTemporalRegistryAddress"sv;
    case column::da_compression_temporal_registry_asset_id:
      return "DaCompressionTemporalRegistryAssetId"sv;
    case column::da_compression_temporal_registry_contract_id:
      return "DaCompressionTemporalRegistryContractId"sv;
    case column::da_compression_temporal_registry_script_code:
      return "DaCompressionTemporalRegistryScriptCode"sv;
    case column::da_compression_temporal_registry_predicate_code:
      return "DaCompressionTemporalRegistryPredicateCode"sv;
    case column::coin_balances:
      return "CoinBalances"sv;
    case column::message_balances:
      return "MessageBalances"sv;
    case column::assets_info:
      return "AssetsInfo"sv;
    case column::coins_to_spend:
      return "CoinsToSpend"sv;
#ifdef OFFCHAIN_FAULT_PROVING
    case column::da_compression_temporal_registry_address_v2:
      return "DaCompressionTemporalRegistryAddressV2"sv;
    case column::da_compression_temporal_address_merkle_data:
      return "DaCompressionTemporalAddressMerkleData"sv;
    case column::da_compression_temporal_address_merkle_metadata:
      return "DaCompressionTemporalAddressMerkleMetadata"sv;
    case column::da_compression_temporal_registry_asset_id_v2:
      return "DaCompressionTemporalRegistryAssetIdV2"sv;
    case column::da_compression_temporal_asset_id_merkle_data:
      return "DaCompressionTemporalAssetIdMerkleData"sv;
    case column::da_compression_temporal_asset_id_merkle_metadata:
      return "DaCompressionTemporalAssetIdMerkleMetadata"sv;
    case column::da_compression_temporal_registry_contract_id_v2:
      return "DaCompressionTemporalRegistryContractIdV2"sv;
    case column::da_compression_temporal_contract_id_merkle_data:
      return "DaCompressionTemporalContractIdMerkleData"sv;
    case column::da_compression_temporal_contract_id_merkle_metadata:
      return "DaCompressionTemporalContractIdMerkleMetadata"sv;
    case column::da_compression_temporal_registry_script_code_v2:
      return "DaCompressionTemporalRegistryScriptCodeV2"sv;
    case column::da_compression_temporal_script_code_merkle_data:
      return "DaCompressionTemporalScriptCodeMerkleData"sv;
    case column::da_compression_temporal_script_code_merkle_metadata:
      return "DaCompressionTemporalScriptCodeMerkleMetadata"sv;
    case column::da_compression_temporal_registry_predicate_code_v2:
      return "DaCompressionTemporalRegistryPredicateCodeV2"sv;
    case column::da_compression_temporal_predicate_code_merkle_data:
      return "DaCompressionTemporalPredicateCodeMerkleData"sv;
    case column::da_compression_temporal_predicate_code_merkle_metadata:
      return "DaCompressionTemporalPredicateCodeMerkleMetadata"sv;
    case column::da_compression_temporal_registry_index_v2:
      return "DaCompressionTemporalRegistryIndexV2"sv;
    case column::da_compression_temporal_registry_index_merkle_data:
      return "DaCompressionTemporalRegistryIndexMerkleData"sv;
    case column::da_compression_temporal_registry_index_merkle_metadata:
      return "DaCompressionTemporalRegistryIndexMerkleMetadata"sv;
    case column::da_compression_temporal_registry_timestamps_v2:
      return "DaCompressionTemporalRegistryTimestampsV2"sv;
    case column::da_compression_temporal_registry_timestamps_merkle_data:
      return "DaCompressionTemporalRegistryTimestampsMerkleData"sv;
    case column::da_compression_temporal_registry_timestamps_merkle_metadata:
      return "DaCompressionTemporalRegistryTimestampsMerkleMetadata"sv;
    case column::da_compression_temporal_registry_evictor_cache_v2:
      return "DaCompressionTemporalRegistryEvictorCacheV2"sv;
    case column::da_compression_temporal_registry_evictor_cache_merkle_data:
      return "DaCompressionTemporalRegistryEvictorCacheMerkleData"sv;
    case column::da_compression_temporal_registry_evictor_cache_merkle_metadata:
      return "DaCompressionTemporalRegistryEvictorCacheMerkleMetadata"sv;
#endif
  }
  std::unreachable();
}

} // namespace offchain::storage
