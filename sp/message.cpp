#include "message.hpp"
#include "log.hpp"

using namespace sp;

// smallest encodings: index plus two empty lengths, key plus two
// empty lengths
#define SP_MIN_IX_SIZE     3
#define SP_MIN_LOOKUP_SIZE 34

///////////////////////////////////////////////////////////////////////////
// message

message::message()
: ver_( msg_version::e_legacy )
{
}

void message::clear()
{
  ver_ = msg_version::e_legacy;
  hdr_ = message_header();
  keys_.clear();
  bhash_.zero();
  ixs_.clear();
  lookups_.clear();
}

bool message::is_signer( size_t idx ) const
{
  return idx < hdr_.num_required_sigs_;
}

bool message::is_writable( size_t idx ) const
{
  size_t nsigs = hdr_.num_required_sigs_;
  size_t nkeys = keys_.size();
  if ( idx < nsigs ) {
    return idx < nsigs - hdr_.num_readonly_signed_;
  }
  if ( idx < nkeys ) {
    return idx < nkeys - hdr_.num_readonly_unsigned_;
  }
  // accounts loaded from lookup tables: all writable then all readonly
  size_t nwr = 0;
  for( const lookup_ref& lk : lookups_ ) {
    nwr += lk.writable_.size();
  }
  return idx - nkeys < nwr;
}

bool message::equals( const message& obj ) const
{
  return ver_ == obj.ver_ &&
         hdr_ == obj.hdr_ &&
         keys_ == obj.keys_ &&
         bhash_ == obj.bhash_ &&
         ixs_ == obj.ixs_ &&
         lookups_ == obj.lookups_;
}

bool message::check_len( size_t len, const char *what )
{
  if ( len > 0xffff ) {
    return set_err( err_code::e_malformed_len,
        std::string( "length of " ) + what + " not encodable [len=" +
        std::to_string( len ) + "]" );
  }
  return true;
}

bool message::encode( bincode& tx )
{
  reset_err();
  if ( ver_ == msg_version::e_v0 ) {
    tx.add( (uint8_t)( SP_MSG_VERSION_PREFIX | 0 ) );
  }

  // header
  tx.add( hdr_.num_required_sigs_ );
  tx.add( hdr_.num_readonly_signed_ );
  tx.add( hdr_.num_readonly_unsigned_ );

  // account table
  if ( !check_len( keys_.size(), "account keys" ) ) {
    return false;
  }
  tx.add_len( (uint16_t)keys_.size() );
  for( const pub_key& key : keys_ ) {
    tx.add( key );
  }

  // recent block hash
  tx.add( bhash_ );

  // instructions
  if ( !check_len( ixs_.size(), "instructions" ) ) {
    return false;
  }
  tx.add_len( (uint16_t)ixs_.size() );
  for( const compiled_instruction& ix : ixs_ ) {
    if ( !check_len( ix.accts_.size(), "instruction accounts" ) ||
         !check_len( ix.data_.size(), "instruction data" ) ) {
      return false;
    }
    tx.add( ix.prog_idx_ );
    tx.add_len( (uint16_t)ix.accts_.size() );
    tx.add( ix.accts_ );
    tx.add_len( (uint16_t)ix.data_.size() );
    tx.add( ix.data_ );
  }

  // address lookup table references
  if ( ver_ == msg_version::e_v0 ) {
    if ( !check_len( lookups_.size(), "lookups" ) ) {
      return false;
    }
    tx.add_len( (uint16_t)lookups_.size() );
    for( const lookup_ref& lk : lookups_ ) {
      if ( !check_len( lk.writable_.size(), "writable lookup indices" ) ||
           !check_len( lk.readonly_.size(), "readonly lookup indices" ) ) {
        return false;
      }
      tx.add( lk.table_ );
      tx.add_len( (uint16_t)lk.writable_.size() );
      tx.add( lk.writable_ );
      tx.add_len( (uint16_t)lk.readonly_.size() );
      tx.add( lk.readonly_ );
    }
  }
  return true;
}

bool message::encode( byte_vec_t& buf )
{
  bincode tx;
  if ( !encode( tx ) ) {
    return false;
  }
  tx.detach( buf );
  return true;
}

bool message::decode( bindecode& rd )
{
  clear();
  reset_err();

  // version prefix
  uint8_t pfx = 0;
  if ( !rd.peek( pfx, "message header" ) ) {
    return set_err( rd );
  }
  if ( pfx & SP_MSG_VERSION_PREFIX ) {
    size_t pos = rd.get_pos();
    if ( !rd.get( pfx, "version prefix" ) ) {
      return set_err( rd );
    }
    unsigned ver = pfx & ~SP_MSG_VERSION_PREFIX;
    if ( ver != 0 ) {
      return set_err( err_code::e_unsupported_version,
          "unsupported message version [offset=" + std::to_string( pos ) +
          " version=" + std::to_string( ver ) + "]" );
    }
    ver_ = msg_version::e_v0;
  }

  // header
  if ( !rd.get( hdr_.num_required_sigs_, "message header" ) ||
       !rd.get( hdr_.num_readonly_signed_, "message header" ) ||
       !rd.get( hdr_.num_readonly_unsigned_, "message header" ) ) {
    return set_err( rd );
  }

  // account table
  uint16_t nkeys = 0;
  if ( !rd.get_len( nkeys, "account keys" ) ||
       !rd.check_count( nkeys, pub_key::len, "account keys" ) ) {
    return set_err( rd );
  }
  keys_.resize( nkeys );
  for( uint16_t i = 0; i != nkeys; ++i ) {
    if ( !rd.get( keys_[i], "account key" ) ) {
      return set_err( rd );
    }
  }
  if ( hdr_.num_required_sigs_ > nkeys ) {
    return set_err( err_code::e_inconsistent_header,
        "required signatures exceed account keys [expected<=" +
        std::to_string( nkeys ) + " found=" +
        std::to_string( hdr_.num_required_sigs_ ) + "]" );
  }
  if ( hdr_.num_readonly_signed_ > hdr_.num_required_sigs_ ) {
    return set_err( err_code::e_inconsistent_header,
        "readonly signed accounts exceed signers [expected<=" +
        std::to_string( hdr_.num_required_sigs_ ) + " found=" +
        std::to_string( hdr_.num_readonly_signed_ ) + "]" );
  }
  if ( hdr_.num_readonly_unsigned_ > nkeys - hdr_.num_required_sigs_ ) {
    return set_err( err_code::e_inconsistent_header,
        "readonly unsigned accounts exceed unsigned accounts [expected<=" +
        std::to_string( nkeys - hdr_.num_required_sigs_ ) + " found=" +
        std::to_string( hdr_.num_readonly_unsigned_ ) + "]" );
  }

  // recent block hash
  if ( !rd.get( bhash_, "recent block hash" ) ) {
    return set_err( rd );
  }

  // instructions
  uint16_t nixs = 0;
  if ( !rd.get_len( nixs, "instructions" ) ||
       !rd.check_count( nixs, SP_MIN_IX_SIZE, "instructions" ) ) {
    return set_err( rd );
  }
  ixs_.resize( nixs );
  for( uint16_t i = 0; i != nixs; ++i ) {
    compiled_instruction& ix = ixs_[i];
    uint16_t len = 0;
    if ( !rd.get( ix.prog_idx_, "program index" ) ||
         !rd.get_len( len, "instruction accounts" ) ||
         !rd.get_bytes( len, ix.accts_, "instruction accounts" ) ||
         !rd.get_len( len, "instruction data" ) ||
         !rd.get_bytes( len, ix.data_, "instruction data" ) ) {
      return set_err( rd );
    }
  }

  // address lookup table references
  size_t naccts = nkeys;
  if ( ver_ == msg_version::e_v0 ) {
    uint16_t nlks = 0;
    if ( !rd.get_len( nlks, "lookups" ) ||
         !rd.check_count( nlks, SP_MIN_LOOKUP_SIZE, "lookups" ) ) {
      return set_err( rd );
    }
    lookups_.resize( nlks );
    for( uint16_t i = 0; i != nlks; ++i ) {
      lookup_ref& lk = lookups_[i];
      uint16_t len = 0;
      if ( !rd.get( lk.table_, "lookup table key" ) ||
           !rd.get_len( len, "writable lookup indices" ) ||
           !rd.get_bytes( len, lk.writable_, "writable lookup indices" ) ||
           !rd.get_len( len, "readonly lookup indices" ) ||
           !rd.get_bytes( len, lk.readonly_, "readonly lookup indices" ) ) {
        return set_err( rd );
      }
      naccts += lk.writable_.size() + lk.readonly_.size();
    }
  }

  // every index must resolve to a loaded account
  for( size_t i = 0; i != ixs_.size(); ++i ) {
    const compiled_instruction& ix = ixs_[i];
    if ( ix.prog_idx_ >= naccts ) {
      return set_err( err_code::e_invalid_index,
          "program index out of range [instruction=" + std::to_string( i ) +
          " index=" + std::to_string( ix.prog_idx_ ) +
          " accounts=" + std::to_string( naccts ) + "]" );
    }
    for( uint8_t idx : ix.accts_ ) {
      if ( idx >= naccts ) {
        return set_err( err_code::e_invalid_index,
            "account index out of range [instruction=" + std::to_string( i ) +
            " index=" + std::to_string( idx ) +
            " accounts=" + std::to_string( naccts ) + "]" );
      }
    }
  }
  return true;
}

bool message::find_key( const pub_key& key, size_t& idx ) const
{
  for( idx = 0; idx != keys_.size(); ++idx ) {
    if ( keys_[idx] == key ) {
      return true;
    }
  }
  return false;
}

bool message::get_tx_size( size_t& res )
{
  bincode wtr;
  if ( !encode( wtr ) ) {
    return false;
  }
  size_t nsigs = hdr_.num_required_sigs_;
  res = short_vec::size( (uint16_t)nsigs ) + nsigs * signature::len +
    wtr.size();
  return true;
}

bool message::add_instruction( const instruction& ix )
{
  reset_err();
  if ( ver_ != msg_version::e_legacy ) {
    return set_err( err_code::e_unsupported_version,
        "instructions can only be appended to legacy messages" );
  }

  // accounts not yet in the table, merged by address
  key_vec_t nkeys;
  std::vector<bool> nwr;
  for( size_t i = 0; i <= ix.accts_.size(); ++i ) {
    account_meta am( ix.prog_id_, false, false );
    if ( i != ix.accts_.size() ) {
      am = ix.accts_[i];
    }
    size_t idx = 0;
    if ( find_key( am.key_, idx ) ) {
      if ( ( am.is_signer_ && !is_signer( idx ) ) ||
           ( am.is_writable_ && !is_writable( idx ) ) ) {
        return set_err( err_code::e_account_permission,
            "account lacks requested permission [account=" +
            am.key_.to_base58() + "]" );
      }
      continue;
    }
    if ( am.is_signer_ ) {
      return set_err( err_code::e_account_permission,
          "signer not in account table [account=" +
          am.key_.to_base58() + "]" );
    }
    size_t j = 0;
    while( j != nkeys.size() && nkeys[j] != am.key_ ) {
      ++j;
    }
    if ( j == nkeys.size() ) {
      nkeys.push_back( am.key_ );
      nwr.push_back( am.is_writable_ );
    } else if ( am.is_writable_ ) {
      nwr[j] = true;
    }
  }

  size_t nw = 0;
  for( size_t j = 0; j != nkeys.size(); ++j ) {
    nw += nwr[j] ? 1 : 0;
  }
  size_t nr = nkeys.size() - nw;
  size_t total = keys_.size() + nkeys.size();
  if ( total > SP_MAX_ACCOUNTS ||
       hdr_.num_readonly_unsigned_ + nr > 0xff ) {
    return set_err( err_code::e_account_limit,
        "too many accounts [num=" + std::to_string( total ) +
        " max=" + std::to_string( SP_MAX_ACCOUNTS ) + "]" );
  }

  // build on a copy so failure leaves this message unchanged
  message res( *this );
  key_vec_t& keys = res.keys_;
  size_t pos = keys.size() - hdr_.num_readonly_unsigned_;
  key_vec_t wkeys;
  for( size_t j = 0; j != nkeys.size(); ++j ) {
    if ( nwr[j] ) {
      wkeys.push_back( nkeys[j] );
    } else {
      keys.push_back( nkeys[j] );
    }
  }
  keys.insert( keys.begin() + pos, wkeys.begin(), wkeys.end() );
  if ( nw ) {
    for( compiled_instruction& cix : res.ixs_ ) {
      if ( cix.prog_idx_ >= pos ) {
        cix.prog_idx_ = (uint8_t)( cix.prog_idx_ + nw );
      }
      for( uint8_t& idx : cix.accts_ ) {
        if ( idx >= pos ) {
          idx = (uint8_t)( idx + nw );
        }
      }
    }
  }
  res.hdr_.num_readonly_unsigned_ =
    (uint8_t)( hdr_.num_readonly_unsigned_ + nr );

  // resolve the new instruction against the extended table
  compiled_instruction cix;
  size_t idx = 0;
  res.find_key( ix.prog_id_, idx );
  cix.prog_idx_ = (uint8_t)idx;
  for( const account_meta& am : ix.accts_ ) {
    res.find_key( am.key_, idx );
    cix.accts_.push_back( (uint8_t)idx );
  }
  cix.data_ = ix.data_;
  res.ixs_.push_back( cix );

  size_t tx_size = 0;
  if ( !res.get_tx_size( tx_size ) ) {
    return set_err( err_code::e_msg_too_large, res.get_err_msg() );
  }
  if ( tx_size > SP_PACKET_DATA_SIZE ) {
    return set_err( err_code::e_msg_too_large,
        "transaction too large [size=" + std::to_string( tx_size ) +
        " max=" + std::to_string( SP_PACKET_DATA_SIZE ) + "]" );
  }
  *this = res;
  return true;
}

///////////////////////////////////////////////////////////////////////////
// msg_compiler

msg_compiler::msg_compiler()
{
}

void msg_compiler::add_acct(
    const pub_key& key, bool is_signer, bool is_writable )
{
  acct_map_t::iter_t it = amap_.find( key );
  if ( it ) {
    acct& a = avec_[amap_.obj( it )];
    a.is_signer_ = a.is_signer_ || is_signer;
    a.is_writable_ = a.is_writable_ || is_writable;
    return;
  }
  it = amap_.add( key );
  amap_.ref( it ) = (uint32_t)avec_.size();
  acct a;
  a.key_ = key;
  a.is_signer_ = is_signer;
  a.is_writable_ = is_writable;
  a.idx_ = 0;
  avec_.push_back( a );
}

uint8_t msg_compiler::get_idx( const pub_key& key )
{
  // every address was registered before indices are resolved
  return avec_[amap_.obj( amap_.find( key ) )].idx_;
}

bool msg_compiler::compile(
    const pub_key& fee_payer, const hash& recent_hash,
    const instruction_vec_t& ixs, message& msg )
{
  return compile_msg( msg_version::e_legacy, fee_payer, recent_hash,
                      ixs, msg );
}

bool msg_compiler::compile_v0(
    const pub_key& fee_payer, const hash& recent_hash,
    const instruction_vec_t& ixs, message& msg )
{
  return compile_msg( msg_version::e_v0, fee_payer, recent_hash, ixs, msg );
}

bool msg_compiler::compile_msg(
    msg_version ver, const pub_key& fee_payer, const hash& recent_hash,
    const instruction_vec_t& ixs, message& msg )
{
  reset_err();
  amap_.clear();
  avec_.clear();

  // collect accounts in first-seen order, fee payer first
  add_acct( fee_payer, true, true );
  for( const instruction& ix : ixs ) {
    for( const account_meta& am : ix.accts_ ) {
      add_acct( am.key_, am.is_signer_, am.is_writable_ );
    }
    add_acct( ix.prog_id_, false, false );
  }

  // partition sizes
  size_t nsw = 0, nsr = 0, nuw = 0, nur = 0;
  for( size_t i = 1; i != avec_.size(); ++i ) {
    const acct& a = avec_[i];
    if ( a.is_signer_ ) {
      if ( a.is_writable_ ) ++nsw; else ++nsr;
    } else {
      if ( a.is_writable_ ) ++nuw; else ++nur;
    }
  }
  size_t nsigs = 1 + nsw + nsr;
  if ( nsigs > SP_MAX_SIGNERS ) {
    return set_err( err_code::e_too_many_signatures,
        "too many signers [num=" + std::to_string( nsigs ) +
        " max=" + std::to_string( SP_MAX_SIGNERS ) + "]" );
  }
  if ( avec_.size() > SP_MAX_ACCOUNTS ) {
    return set_err( err_code::e_account_limit,
        "too many accounts [num=" + std::to_string( avec_.size() ) +
        " max=" + std::to_string( SP_MAX_ACCOUNTS ) + "]" );
  }

  // caller's message is only replaced on success
  message res;
  res.set_version( ver );
  message_header& hdr = res.get_header();
  hdr.num_required_sigs_ = (uint8_t)nsigs;
  hdr.num_readonly_signed_ = (uint8_t)nsr;
  hdr.num_readonly_unsigned_ = (uint8_t)nur;
  res.get_recent_hash() = recent_hash;

  // account table: fee payer, signer+writable, signer+readonly,
  // writable, readonly
  key_vec_t& keys = res.get_keys();
  keys.reserve( avec_.size() );
  keys.push_back( fee_payer );
  for( unsigned grp = 0; grp != 4; ++grp ) {
    bool is_signer = grp < 2;
    bool is_writable = ( grp & 1 ) == 0;
    for( size_t i = 1; i != avec_.size(); ++i ) {
      acct& a = avec_[i];
      if ( a.is_signer_ == is_signer && a.is_writable_ == is_writable ) {
        a.idx_ = (uint8_t)keys.size();
        keys.push_back( a.key_ );
      }
    }
  }

  // resolve addresses to table indices
  compiled_vec_t& cixs = res.get_instructions();
  cixs.resize( ixs.size() );
  for( size_t i = 0; i != ixs.size(); ++i ) {
    const instruction& ix = ixs[i];
    compiled_instruction& cix = cixs[i];
    cix.prog_idx_ = get_idx( ix.prog_id_ );
    cix.accts_.resize( ix.accts_.size() );
    for( size_t j = 0; j != ix.accts_.size(); ++j ) {
      cix.accts_[j] = get_idx( ix.accts_[j].key_ );
    }
    cix.data_ = ix.data_;
  }

  // full transaction must fit in one packet
  size_t tx_size = 0;
  if ( !res.get_tx_size( tx_size ) ) {
    return set_err( err_code::e_msg_too_large, res.get_err_msg() );
  }
  if ( tx_size > SP_PACKET_DATA_SIZE ) {
    return set_err( err_code::e_msg_too_large,
        "transaction too large [size=" + std::to_string( tx_size ) +
        " max=" + std::to_string( SP_PACKET_DATA_SIZE ) + "]" );
  }

  SP_LOG_DBG( "compiled message" )
    .add( "fee_payer", fee_payer )
    .add( "version", (uint32_t)ver )
    .add( "num_accounts", (uint64_t)keys.size() )
    .add( "num_signers", (uint64_t)nsigs )
    .add( "num_instructions", (uint64_t)cixs.size() )
    .add( "size", (uint64_t)tx_size )
    .end();
  msg = res;
  return true;
}
