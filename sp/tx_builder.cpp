#include "tx_builder.hpp"
#include "log.hpp"

using namespace sp;

tx_builder::tx_builder()
: has_payer_( false ),
  has_bhash_( false )
{
}

void tx_builder::set_fee_payer( const pub_key& pk )
{
  payer_ = pk;
  has_payer_ = true;
}

void tx_builder::set_recent_hash( const hash& bhash )
{
  bhash_ = bhash;
  has_bhash_ = true;
}

tx_builder& tx_builder::add( const instruction& ix )
{
  ixs_.push_back( ix );
  return *this;
}

tx_builder& tx_builder::add( const instruction_vec_t& ixs )
{
  ixs_.insert( ixs_.end(), ixs.begin(), ixs.end() );
  return *this;
}

void tx_builder::reset()
{
  reset_err();
  payer_.zero();
  bhash_.zero();
  has_payer_ = false;
  has_bhash_ = false;
  ixs_.clear();
}

bool tx_builder::build( transaction& tx )
{
  return build_tx( msg_version::e_legacy, tx );
}

bool tx_builder::build_versioned( transaction& tx )
{
  return build_tx( msg_version::e_v0, tx );
}

bool tx_builder::build_tx( msg_version ver, transaction& tx )
{
  reset_err();
  if ( !has_payer_ ) {
    return set_err( err_code::e_missing_field, "fee payer not set" );
  }
  if ( !has_bhash_ ) {
    return set_err( err_code::e_missing_field, "recent block hash not set" );
  }
  if ( ixs_.empty() ) {
    return set_err( err_code::e_empty_instructions, "no instructions" );
  }
  bool ok = ver == msg_version::e_v0 ?
    cmp_.compile_v0( payer_, bhash_, ixs_, tx.get_message() ) :
    cmp_.compile( payer_, bhash_, ixs_, tx.get_message() );
  if ( !ok ) {
    return set_err( cmp_ );
  }
  tx.init_signatures();
  tx.reset_err();
  SP_LOG_DBG( "built transaction" )
    .add( "fee_payer", payer_ )
    .add( "recent_hash", bhash_ )
    .add( "num_instructions", (uint64_t)ixs_.size() )
    .add( "num_signatures", (uint64_t)tx.get_signatures().size() )
    .end();
  return true;
}
