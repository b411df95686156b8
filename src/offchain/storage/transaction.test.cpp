#include <gtest/gtest.h>

#include <offchain/storage/backends/map/map_backend.hpp>
#include <offchain/storage/table.hpp>
#include <offchain/storage/transaction.hpp>

#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

using offchain::storage::bytes;
using offchain::storage::column;

namespace {

struct numbers
{
  using key_type   = std::uint32_t;
  using value_type = std::string;

  static constexpr offchain::storage::column column = offchain::storage::column::metadata;
};

struct flags
{
  using key_type   = std::uint32_t;
  using value_type = bool;

  static constexpr offchain::storage::column column = offchain::storage::column::genesis_metadata;
};

struct counters
{
  using key_type   = std::string;
  using value_type = std::uint64_t;

  static constexpr offchain::storage::column column = offchain::storage::column::statistic;
};

static_assert( offchain::storage::table< numbers > );
static_assert( offchain::storage::table< counters > );
static_assert( offchain::storage::schema< numbers, flags, counters >::size == 3 );

class failing_backend final: public offchain::storage::backends::map::map_backend
{
public:
  bool fail_reads  = false;
  bool fail_writes = false;

  offchain::storage::result< std::optional< bytes > > get( const bytes& key ) const override
  {
    if( fail_reads )
      return std::unexpected( offchain::storage::storage_errc::io_error );

    return map_backend::get( key );
  }

  offchain::storage::result< offchain::storage::backends::key_value_pairs >
  scan( std::span< const std::byte > prefix ) const override
  {
    if( fail_reads )
      return std::unexpected( offchain::storage::storage_errc::io_error );

    return map_backend::scan( prefix );
  }

  offchain::storage::result< void > write( const offchain::storage::backends::write_batch& batch ) override
  {
    if( fail_writes )
      return std::unexpected( offchain::storage::storage_errc::io_error );

    return map_backend::write( batch );
  }
};

class transaction_test: public ::testing::Test
{
protected:
  std::shared_ptr< failing_backend > backend = std::make_shared< failing_backend >();

  offchain::storage::transaction make_transaction()
  {
    return offchain::storage::transaction( backend );
  }
};

} // namespace

TEST_F( transaction_test, read_your_writes )
{
  auto tx = make_transaction();

  auto missing = tx.get< numbers >( 1 );
  ASSERT_TRUE( missing );
  EXPECT_FALSE( missing->has_value() );

  ASSERT_TRUE( tx.insert< numbers >( 1, "one" ) );

  auto value = tx.get< numbers >( 1 );
  ASSERT_TRUE( value );
  ASSERT_TRUE( value->has_value() );
  EXPECT_EQ( **value, "one" );

  auto contained = tx.contains< numbers >( 1 );
  ASSERT_TRUE( contained );
  EXPECT_TRUE( *contained );

  // Nothing reaches the backend before commit
  EXPECT_TRUE( backend->empty() );
  EXPECT_EQ( tx.staged(), 1 );
}

TEST_F( transaction_test, replace_returns_prior_value )
{
  auto tx = make_transaction();

  auto fresh = tx.replace< numbers >( 7, "seven" );
  ASSERT_TRUE( fresh );
  EXPECT_FALSE( fresh->has_value() );

  auto updated = tx.replace< numbers >( 7, "SEVEN" );
  ASSERT_TRUE( updated );
  ASSERT_TRUE( updated->has_value() );
  EXPECT_EQ( **updated, "seven" );

  ASSERT_TRUE( std::move( tx ).commit() );

  // The prior value comes from the backend when nothing is staged
  auto tx2      = make_transaction();
  auto previous = tx2.replace< numbers >( 7, "7" );
  ASSERT_TRUE( previous );
  ASSERT_TRUE( previous->has_value() );
  EXPECT_EQ( **previous, "SEVEN" );
}

TEST_F( transaction_test, remove )
{
  {
    auto tx = make_transaction();
    ASSERT_TRUE( tx.insert< numbers >( 1, "one" ) );
    ASSERT_TRUE( tx.insert< numbers >( 2, "two" ) );
    ASSERT_TRUE( std::move( tx ).commit() );
  }

  auto tx = make_transaction();

  auto removed = tx.remove< numbers >( 1 );
  ASSERT_TRUE( removed );
  ASSERT_TRUE( removed->has_value() );
  EXPECT_EQ( **removed, "one" );

  // A staged removal hides the committed value
  auto hidden = tx.get< numbers >( 1 );
  ASSERT_TRUE( hidden );
  EXPECT_FALSE( hidden->has_value() );

  auto absent = tx.remove< numbers >( 3 );
  ASSERT_TRUE( absent );
  EXPECT_FALSE( absent->has_value() );

  ASSERT_TRUE( tx.insert< numbers >( 1, "uno" ) );
  ASSERT_TRUE( std::move( tx ).commit() );

  auto reader = make_transaction();
  auto value  = reader.get< numbers >( 1 );
  ASSERT_TRUE( value && value->has_value() );
  EXPECT_EQ( **value, "uno" );
}

TEST_F( transaction_test, tables_do_not_collide )
{
  auto tx = make_transaction();

  ASSERT_TRUE( tx.insert< numbers >( 5, "five" ) );
  ASSERT_TRUE( tx.insert< flags >( 5, true ) );
  ASSERT_TRUE( std::move( tx ).commit() );

  EXPECT_EQ( backend->size(), 2 );

  auto reader = make_transaction();
  auto number = reader.get< numbers >( 5 );
  auto flag   = reader.get< flags >( 5 );
  ASSERT_TRUE( number && number->has_value() );
  ASSERT_TRUE( flag && flag->has_value() );
  EXPECT_EQ( **number, "five" );
  EXPECT_TRUE( **flag );
}

TEST_F( transaction_test, atomic_commit )
{
  auto tx = make_transaction();
  ASSERT_TRUE( tx.insert< numbers >( 1, "one" ) );
  ASSERT_TRUE( tx.insert< flags >( 1, true ) );
  ASSERT_TRUE( tx.insert< counters >( "count", 1 ) );

  auto uncommitted = make_transaction();
  auto not_yet     = uncommitted.get< counters >( "count" );
  ASSERT_TRUE( not_yet );
  EXPECT_FALSE( not_yet->has_value() );

  ASSERT_TRUE( std::move( tx ).commit() );

  auto reader = make_transaction();
  auto number = reader.get< numbers >( 1 );
  auto flag   = reader.get< flags >( 1 );
  auto count  = reader.get< counters >( "count" );
  ASSERT_TRUE( number && number->has_value() );
  ASSERT_TRUE( flag && flag->has_value() );
  ASSERT_TRUE( count && count->has_value() );
  EXPECT_EQ( **count, 1 );
}

TEST_F( transaction_test, failed_commit_applies_nothing )
{
  {
    auto tx = make_transaction();
    ASSERT_TRUE( tx.insert< counters >( "count", 5 ) );
    ASSERT_TRUE( std::move( tx ).commit() );
  }

  auto tx = make_transaction();
  ASSERT_TRUE( tx.insert< numbers >( 1, "one" ) );
  ASSERT_TRUE( tx.insert< flags >( 1, true ) );
  ASSERT_TRUE( tx.insert< counters >( "count", 6 ) );

  backend->fail_writes = true;
  auto committed       = std::move( tx ).commit();
  ASSERT_FALSE( committed );
  EXPECT_EQ( committed.error(), offchain::storage::storage_errc::io_error );
  backend->fail_writes = false;

  auto reader = make_transaction();
  auto number = reader.get< numbers >( 1 );
  auto flag   = reader.get< flags >( 1 );
  auto count  = reader.get< counters >( "count" );
  ASSERT_TRUE( number && flag && count );
  EXPECT_FALSE( number->has_value() );
  EXPECT_FALSE( flag->has_value() );
  ASSERT_TRUE( count->has_value() );
  EXPECT_EQ( **count, 5 );
}

TEST_F( transaction_test, dropped_transaction_discards_writes )
{
  {
    auto tx = make_transaction();
    ASSERT_TRUE( tx.insert< numbers >( 1, "one" ) );
  }

  EXPECT_TRUE( backend->empty() );
}

TEST_F( transaction_test, committed_transaction_is_consumed )
{
  auto tx = make_transaction();
  ASSERT_TRUE( tx.insert< numbers >( 1, "one" ) );
  ASSERT_TRUE( std::move( tx ).commit() );

  EXPECT_THROW( tx.get< numbers >( 1 ), std::logic_error );
  EXPECT_THROW( static_cast< void >( tx.insert< numbers >( 2, "two" ) ), std::logic_error );
  EXPECT_THROW( static_cast< void >( std::move( tx ).commit() ), std::logic_error );
}

TEST_F( transaction_test, decode_failure_propagates )
{
  offchain::storage::backends::write_batch batch;
  batch.put( offchain::storage::make_compound_key( column::metadata, offchain::storage::to_bytes( std::uint32_t{ 9 } ) ),
             bytes{ std::byte{ 0x05 } } );
  ASSERT_TRUE( backend->write( batch ) );

  auto tx     = make_transaction();
  auto number = tx.get< numbers >( 9 );
  ASSERT_FALSE( number );
  EXPECT_EQ( number.error(), offchain::encode::encode_errc::invalid_length );

  auto replaced = tx.replace< numbers >( 9, "nine" );
  ASSERT_FALSE( replaced );
  EXPECT_EQ( tx.staged(), 0 );

  auto entries = tx.scan< numbers >();
  ASSERT_FALSE( entries );
  EXPECT_EQ( entries.error(), offchain::encode::encode_errc::invalid_length );
}

TEST_F( transaction_test, read_failure_propagates )
{
  {
    auto tx = make_transaction();
    ASSERT_TRUE( tx.insert< numbers >( 1, "one" ) );
    ASSERT_TRUE( std::move( tx ).commit() );
  }

  auto tx = make_transaction();
  ASSERT_TRUE( tx.insert< numbers >( 2, "two" ) );

  backend->fail_reads = true;

  auto number = tx.get< numbers >( 1 );
  ASSERT_FALSE( number );
  EXPECT_EQ( number.error(), offchain::storage::storage_errc::io_error );

  auto contained = tx.contains< numbers >( 1 );
  ASSERT_FALSE( contained );
  EXPECT_EQ( contained.error(), offchain::storage::storage_errc::io_error );

  auto replaced = tx.replace< numbers >( 1, "uno" );
  ASSERT_FALSE( replaced );
  EXPECT_EQ( replaced.error(), offchain::storage::storage_errc::io_error );

  auto removed = tx.remove< numbers >( 1 );
  ASSERT_FALSE( removed );
  EXPECT_EQ( removed.error(), offchain::storage::storage_errc::io_error );

  auto entries = tx.scan< numbers >();
  ASSERT_FALSE( entries );
  EXPECT_EQ( entries.error(), offchain::storage::storage_errc::io_error );

  // Failed reads stage nothing
  EXPECT_EQ( tx.staged(), 1 );

  // A staged key is served without reading the backend
  auto staged = tx.get< numbers >( 2 );
  ASSERT_TRUE( staged && staged->has_value() );
  EXPECT_EQ( **staged, "two" );

  backend->fail_reads = false;

  auto value = tx.get< numbers >( 1 );
  ASSERT_TRUE( value && value->has_value() );
  EXPECT_EQ( **value, "one" );
}

TEST_F( transaction_test, scan_merges_staged_writes )
{
  {
    auto tx = make_transaction();
    ASSERT_TRUE( tx.insert< numbers >( 1, "one" ) );
    ASSERT_TRUE( tx.insert< numbers >( 3, "three" ) );
    ASSERT_TRUE( tx.insert< numbers >( 5, "five" ) );
    ASSERT_TRUE( tx.insert< flags >( 2, false ) );
    ASSERT_TRUE( std::move( tx ).commit() );
  }

  auto tx = make_transaction();
  ASSERT_TRUE( tx.insert< numbers >( 4, "four" ) );
  ASSERT_TRUE( tx.insert< numbers >( 5, "FIVE" ) );
  ASSERT_TRUE( tx.remove< numbers >( 3 ) );

  auto entries = tx.scan< numbers >();
  ASSERT_TRUE( entries );
  ASSERT_EQ( entries->size(), 3 );

  EXPECT_EQ( entries->at( 0 ).first, 1 );
  EXPECT_EQ( entries->at( 0 ).second, "one" );
  EXPECT_EQ( entries->at( 1 ).first, 4 );
  EXPECT_EQ( entries->at( 1 ).second, "four" );
  EXPECT_EQ( entries->at( 2 ).first, 5 );
  EXPECT_EQ( entries->at( 2 ).second, "FIVE" );
}

TEST_F( transaction_test, compound_key_layout )
{
  auto key = offchain::storage::make_compound_key( column::statistic, bytes{ std::byte{ 0xaa } } );
  EXPECT_EQ( key, ( bytes{ std::byte{ 0x00 }, std::byte{ 0x00 }, std::byte{ 0x00 }, std::byte{ 0x06 }, std::byte{ 0xaa } } ) );
}
