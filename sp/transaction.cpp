#include "transaction.hpp"
#include "log.hpp"

using namespace sp;

transaction::transaction()
{
}

void transaction::init_signatures()
{
  sigs_.assign( msg_.get_header().num_required_sigs_, signature() );
}

bool transaction::encode( bincode& tx )
{
  reset_err();
  if ( sigs_.size() != msg_.get_header().num_required_sigs_ ) {
    return set_err( err_code::e_inconsistent_header,
        "signature count does not match header [expected=" +
        std::to_string( msg_.get_header().num_required_sigs_ ) +
        " found=" + std::to_string( sigs_.size() ) + "]" );
  }

  // signatures section
  tx.add_len( (uint16_t)sigs_.size() );
  for( const signature& sig : sigs_ ) {
    tx.add( sig );
  }

  // message section
  if ( !msg_.encode( tx ) ) {
    return set_err( msg_ );
  }
  return true;
}

bool transaction::encode( byte_vec_t& buf )
{
  bincode tx;
  if ( !encode( tx ) ) {
    return false;
  }
  tx.detach( buf );
  return true;
}

size_t transaction::get_size()
{
  bincode tx;
  return encode( tx ) ? tx.size() : 0;
}

bool transaction::enc_base58( std::string& res )
{
  byte_vec_t buf;
  if ( !encode( buf ) ) {
    return false;
  }
  std::vector<uint8_t> txt( 2 * buf.size() + 2 );
  int n = sp::enc_base58( buf.data(), (int)buf.size(),
                          txt.data(), (int)txt.size() );
  res.assign( (const char*)txt.data(), (size_t)n );
  return true;
}

bool transaction::enc_base64( std::string& res )
{
  byte_vec_t buf;
  if ( !encode( buf ) ) {
    return false;
  }
  std::vector<uint8_t> txt( enc_base64_len( (int)buf.size() ) + 1 );
  int n = sp::enc_base64( buf.data(), (int)buf.size(), txt.data() );
  res.assign( (const char*)txt.data(), (size_t)n );
  return true;
}

bool transaction::decode( const uint8_t *buf, size_t len )
{
  reset_err();
  sigs_.clear();
  bindecode rd( buf, len );

  // signatures section
  uint16_t nsigs = 0;
  if ( !rd.get_len( nsigs, "signatures" ) ||
       !rd.check_count( nsigs, signature::len, "signatures" ) ) {
    return set_err( rd );
  }
  sigs_.resize( nsigs );
  for( uint16_t i = 0; i != nsigs; ++i ) {
    if ( !rd.get( sigs_[i], "signature" ) ) {
      return set_err( rd );
    }
  }

  // message section
  if ( !msg_.decode( rd ) ) {
    return set_err( msg_ );
  }
  if ( nsigs != msg_.get_header().num_required_sigs_ ) {
    return set_err( err_code::e_inconsistent_header,
        "signature count does not match header [expected=" +
        std::to_string( msg_.get_header().num_required_sigs_ ) +
        " found=" + std::to_string( nsigs ) + "]" );
  }
  if ( !rd.is_end() ) {
    return set_err( err_code::e_trailing_bytes,
        "trailing bytes after transaction [offset=" +
        std::to_string( rd.get_pos() ) + " count=" +
        std::to_string( rd.get_remaining() ) + "]" );
  }
  return true;
}

bool transaction::decode( const byte_vec_t& buf )
{
  return decode( buf.data(), buf.size() );
}

bool transaction::dec_base58( str txt )
{
  byte_vec_t buf( txt.len_ + 1 );
  int n = sp::dec_base58( (const uint8_t*)txt.str_, (int)txt.len_,
                          buf.data(), (int)buf.size() );
  if ( n < 0 ) {
    return set_err( err_code::e_malformed_len, "invalid base58 text" );
  }
  return decode( buf.data(), (size_t)n );
}

bool transaction::dec_base64( str txt )
{
  byte_vec_t buf( txt.len_ + 3 );
  int n = sp::dec_base64( (const uint8_t*)txt.str_, (int)txt.len_,
                          buf.data() );
  if ( n < 0 ) {
    return set_err( err_code::e_malformed_len, "invalid base64 text" );
  }
  return decode( buf.data(), (size_t)n );
}

bool transaction::sign_slots(
    signer *signers[], size_t n, bool require_all )
{
  reset_err();
  const key_vec_t& keys = msg_.get_keys();
  size_t nsigs = msg_.get_header().num_required_sigs_;
  if ( nsigs > keys.size() ) {
    return set_err( err_code::e_inconsistent_header,
        "required signatures exceed account keys [expected<=" +
        std::to_string( keys.size() ) + " found=" +
        std::to_string( nsigs ) + "]" );
  }
  // match signers to required slots before touching any slot
  std::vector<signer*> slots( nsigs, nullptr );
  for( size_t i = 0; i != nsigs; ++i ) {
    for( size_t j = 0; j != n; ++j ) {
      if ( signers[j]->get_pub_key() == keys[i] ) {
        slots[i] = signers[j];
        break;
      }
    }
    if ( !slots[i] && require_all ) {
      return set_err( err_code::e_missing_signer,
          "missing signer [account=" + keys[i].to_base58() + "]" );
    }
  }

  byte_vec_t buf;
  if ( !msg_.encode( buf ) ) {
    return set_err( msg_ );
  }
  if ( sigs_.size() != nsigs ) {
    init_signatures();
  }
  for( size_t i = 0; i != nsigs; ++i ) {
    if ( !slots[i] ) {
      continue;
    }
    signature sig;
    if ( !slots[i]->sign( buf.data(), buf.size(), sig ) ) {
      return set_err( err_code::e_crypto,
          "failed to sign [account=" + keys[i].to_base58() + "]" );
    }
    sigs_[i] = sig;
    SP_LOG_DBG( "signed transaction" )
      .add( "account", keys[i] )
      .add( "slot", (uint64_t)i )
      .end();
  }
  return true;
}

bool transaction::sign( signer *signers[], size_t n )
{
  return sign_slots( signers, n, true );
}

bool transaction::partial_sign( signer *signers[], size_t n )
{
  return sign_slots( signers, n, false );
}

bool transaction::is_signed() const
{
  if ( sigs_.size() != msg_.get_header().num_required_sigs_ ) {
    return false;
  }
  for( const signature& sig : sigs_ ) {
    if ( sig.is_zero() ) {
      return false;
    }
  }
  return true;
}

bool transaction::verify()
{
  reset_err();
  const key_vec_t& keys = msg_.get_keys();
  if ( sigs_.size() != msg_.get_header().num_required_sigs_ ||
       sigs_.size() > keys.size() ) {
    return set_err( err_code::e_inconsistent_header,
        "signature count does not match header [expected=" +
        std::to_string( msg_.get_header().num_required_sigs_ ) +
        " found=" + std::to_string( sigs_.size() ) + "]" );
  }
  byte_vec_t buf;
  if ( !msg_.encode( buf ) ) {
    return set_err( msg_ );
  }
  for( size_t i = 0; i != sigs_.size(); ++i ) {
    if ( !sigs_[i].verify( buf.data(), buf.size(), keys[i] ) ) {
      return set_err( err_code::e_crypto,
          "signature verification failed [account=" +
          keys[i].to_base58() + "]" );
    }
  }
  return true;
}

bool transaction::add_instruction( const instruction& ix )
{
  reset_err();
  if ( !msg_.add_instruction( ix ) ) {
    return set_err( msg_ );
  }
  init_signatures();
  SP_LOG_DBG( "appended instruction" )
    .add( "program_id", ix.prog_id_ )
    .add( "num_accounts", (uint64_t)msg_.get_keys().size() )
    .add( "num_instructions", (uint64_t)msg_.get_instructions().size() )
    .end();
  return true;
}

static void add_hex( std::string& res, const byte_vec_t& buf )
{
  static const char hex[] = "0123456789abcdef";
  for( uint8_t v : buf ) {
    res += hex[v >> 4];
    res += hex[v & 0xf];
  }
}

static void add_indices( std::string& res, const byte_vec_t& buf )
{
  res += '[';
  for( size_t i = 0; i != buf.size(); ++i ) {
    if ( i ) {
      res += ',';
    }
    res += std::to_string( buf[i] );
  }
  res += ']';
}

void transaction::inspect( std::string& res ) const
{
  const message_header& hdr = msg_.get_header();
  const key_vec_t& keys = msg_.get_keys();
  std::string txt;
  res = "version: ";
  res += msg_.get_version() == msg_version::e_v0 ? "v0" : "legacy";
  res += "\nsignatures: " + std::to_string( sigs_.size() ) + "\n";
  for( size_t i = 0; i != sigs_.size(); ++i ) {
    sigs_[i].enc_base58( txt );
    res += "  " + std::to_string( i ) + ": " + txt + "\n";
  }
  res += "header: required_sigs=" +
    std::to_string( hdr.num_required_sigs_ ) + " readonly_signed=" +
    std::to_string( hdr.num_readonly_signed_ ) + " readonly_unsigned=" +
    std::to_string( hdr.num_readonly_unsigned_ ) + "\n";
  res += "accounts: " + std::to_string( keys.size() ) + "\n";
  for( size_t i = 0; i != keys.size(); ++i ) {
    res += "  " + std::to_string( i ) + ": " + keys[i].to_base58();
    res += msg_.is_signer( i ) ? " signer" : "";
    res += msg_.is_writable( i ) ? " writable" : " readonly";
    res += "\n";
  }
  res += "recent_hash: " + msg_.get_recent_hash().to_base58() + "\n";
  const compiled_vec_t& ixs = msg_.get_instructions();
  res += "instructions: " + std::to_string( ixs.size() ) + "\n";
  for( size_t i = 0; i != ixs.size(); ++i ) {
    const compiled_instruction& ix = ixs[i];
    res += "  " + std::to_string( i ) + ": program=" +
      std::to_string( ix.prog_idx_ ) + " accounts=";
    add_indices( res, ix.accts_ );
    res += " data_len=" + std::to_string( ix.data_.size() ) + " data=";
    add_hex( res, ix.data_ );
    res += "\n";
  }
  const lookup_vec_t& lks = msg_.get_lookups();
  if ( !lks.empty() ) {
    res += "lookups: " + std::to_string( lks.size() ) + "\n";
    for( size_t i = 0; i != lks.size(); ++i ) {
      res += "  " + std::to_string( i ) + ": " + lks[i].table_.to_base58() +
        " writable=";
      add_indices( res, lks[i].writable_ );
      res += " readonly=";
      add_indices( res, lks[i].readonly_ );
      res += "\n";
    }
  }
}

void transaction::get_summary( std::string& res )
{
  res = "transaction: " + std::to_string( sigs_.size() ) + " signatures, " +
    std::to_string( msg_.get_keys().size() ) + " accounts, " +
    std::to_string( msg_.get_instructions().size() ) + " instructions, " +
    "size=" + std::to_string( get_size() ) + " bytes";
}

bool transaction::equals( const transaction& obj ) const
{
  return sigs_ == obj.sigs_ && msg_.equals( obj.msg_ );
}
