#include "key_pair.hpp"
#include "mem_map.hpp"
#include <openssl/evp.h>
#include <ctype.h>

using namespace sp;

hash::hash()
{
  zero();
}

hash::hash( const hash& obj )
{
  *this = obj;
}

hash& hash::operator=( const hash& obj )
{
  i_[0] = obj.i_[0];
  i_[1] = obj.i_[1];
  i_[2] = obj.i_[2];
  i_[3] = obj.i_[3];
  return *this;
}

bool hash::operator==( const hash& obj) const
{
  return i_[0] == obj.i_[0] &&
    i_[1] == obj.i_[1] &&
    i_[2] == obj.i_[2] &&
    i_[3] == obj.i_[3];
}

bool hash::operator!=( const hash& obj) const
{
  return i_[0] != obj.i_[0] ||
    i_[1] != obj.i_[1] ||
    i_[2] != obj.i_[2] ||
    i_[3] != obj.i_[3];
}

bool hash::operator<( const hash& obj ) const
{
  return __builtin_memcmp( pk_, obj.pk_, len ) < 0;
}

void hash::zero()
{
  i_[0] = i_[1] = i_[2] = i_[3] = 0UL;
}

bool hash::is_zero() const
{
  return 0UL == ( i_[0] | i_[1] | i_[2] | i_[3] );
}

bool hash::init_from_text( const std::string& buf )
{
  return init_from_text( str( buf ) );
}

bool hash::init_from_text( str buf )
{
  uint8_t res[len];
  int n = sp::dec_base58( (const uint8_t*)buf.str_, buf.len_, res, len );
  if ( n != (int)len ) {
    return false;
  }
  init_from_buf( res );
  return true;
}

void hash::init_from_buf( const uint8_t *pk )
{
  __builtin_memcpy( pk_, pk, len );
}

int hash::enc_base58( uint8_t *buf, uint32_t buflen ) const
{
  return sp::enc_base58( pk_, len, buf, buflen );
}

int hash::enc_base58( std::string& res ) const
{
  uint8_t buf[64];
  int n = enc_base58( buf, 64 );
  res.assign( (const char*)buf, static_cast< unsigned >( n ) );
  return n;
}

std::string hash::to_base58() const
{
  std::string res;
  enc_base58( res );
  return res;
}

pub_key::pub_key()
{
}

pub_key::pub_key( const pub_key& obj )
: hash( obj )
{
}

pub_key::pub_key( const key_pair& kp )
{
  kp.get_pub_key( *this );
}

pub_key& pub_key::operator=( const pub_key& pk )
{
  hash::operator=( pk );
  return *this;
}

key_pair::key_pair()
{
  zero();
}

bool key_pair::gen()
{
  EVP_PKEY *pkey = NULL;
  EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new_id( EVP_PKEY_ED25519, NULL );
  if ( !pctx ) {
    return false;
  }
  bool res = 0 < EVP_PKEY_keygen_init( pctx ) &&
             0 < EVP_PKEY_keygen( pctx, &pkey );
  EVP_PKEY_CTX_free( pctx );
  if ( !res ) {
    return false;
  }
  size_t plen[] = { pub_key::len };
  res = 0 < EVP_PKEY_get_raw_private_key( pkey, pk_, plen );
  plen[0] = pub_key::len;
  res = res && 0 < EVP_PKEY_get_raw_public_key(
      pkey, &pk_[pub_key::len], plen );
  EVP_PKEY_free( pkey );
  return res;
}

void key_pair::zero()
{
  __builtin_memset( pk_, 0, len );
}

bool key_pair::init_from_file( const std::string& file )
{
  mem_map mp;
  mp.set_file( file );
  if ( !mp.init() ) {
    return false;
  }
  return init_from_json( mp.data(), mp.size() );
}

bool key_pair::init_from_json( const std::string& buf )
{
  return init_from_json( buf.c_str(), buf.length() );
}

// parse json array of 64 byte values e.g. [1,255,171,...]
bool key_pair::init_from_json( const char *buf, size_t blen )
{
  const char *cptr = buf, *end = &buf[blen];
  while( cptr != end && isspace( *cptr ) ) ++cptr;
  if ( cptr == end || *cptr++ != '[' ) {
    return false;
  }
  size_t num = 0;
  for(;;) {
    while( cptr != end && isspace( *cptr ) ) ++cptr;
    const char *beg = cptr;
    while( cptr != end && isdigit( *cptr ) ) ++cptr;
    if ( cptr == beg || cptr - beg > 3 || num == len ) {
      return false;
    }
    uint64_t val = str_to_uint( beg, cptr - beg );
    if ( val > 255 ) {
      return false;
    }
    pk_[num++] = (uint8_t)val;
    while( cptr != end && isspace( *cptr ) ) ++cptr;
    if ( cptr == end ) {
      return false;
    }
    if ( *cptr == ']' ) {
      break;
    }
    if ( *cptr++ != ',' ) {
      return false;
    }
  }
  return num == len;
}

void key_pair::get_pub_key( pub_key& pk ) const
{
  pk.init_from_buf( &pk_[pub_key::len] );
}

signature::signature()
{
  zero();
}

bool signature::operator==( const signature& obj ) const
{
  return 0 == __builtin_memcmp( sig_, obj.sig_, len );
}

bool signature::operator!=( const signature& obj ) const
{
  return !operator==( obj );
}

void signature::zero()
{
  __builtin_memset( sig_, 0, len );
}

bool signature::is_zero() const
{
  for( size_t i = 0; i != len; ++i ) {
    if ( sig_[i] ) {
      return false;
    }
  }
  return true;
}

void signature::init_from_buf( const uint8_t *buf )
{
  __builtin_memcpy( sig_, buf, len );
}

bool signature::init_from_text( const std::string& buf )
{
  uint8_t res[len];
  int n = sp::dec_base58(
      (const uint8_t*)buf.c_str(), buf.length(), res, len );
  if ( n != (int)len ) {
    return false;
  }
  init_from_buf( res );
  return true;
}

int signature::enc_base58( uint8_t *buf, uint32_t buflen ) const
{
  return sp::enc_base58( sig_, len, buf, buflen );
}

int signature::enc_base58( std::string& res ) const
{
  uint8_t buf[128];
  int n = enc_base58( buf, 128 );
  res.assign( (const char*)buf, static_cast< unsigned >( n ) );
  return n;
}

bool signature::sign(
    const uint8_t* msg, size_t msg_len, const key_pair& kp )
{
  EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key( EVP_PKEY_ED25519,
      NULL, kp.data(), pub_key::len );
  if ( !pkey ) {
    return false;
  }
  EVP_MD_CTX *mctx = EVP_MD_CTX_new();
  int rc = EVP_DigestSignInit( mctx, NULL, NULL, NULL, pkey );
  if ( rc == 1 ) {
    size_t sig_len[1] = { len };
    rc = EVP_DigestSign( mctx, sig_, sig_len, msg, msg_len );
  }
  EVP_MD_CTX_free( mctx );
  EVP_PKEY_free( pkey );
  return rc == 1;
}

bool signature::verify(
    const uint8_t* msg, size_t msg_len, const pub_key& pk ) const
{
  EVP_PKEY *pkey = EVP_PKEY_new_raw_public_key( EVP_PKEY_ED25519,
      NULL, pk.data(), pub_key::len );
  if ( !pkey ) {
    return false;
  }
  EVP_MD_CTX *mctx = EVP_MD_CTX_new();
  int rc = EVP_DigestVerifyInit( mctx, NULL, NULL, NULL, pkey );
  if ( rc == 1 ) {
    rc = EVP_DigestVerify( mctx, sig_, len, msg, msg_len );
  }
  EVP_MD_CTX_free( mctx );
  EVP_PKEY_free( pkey );
  return rc == 1;
}

signer::~signer()
{
}

key_signer::key_signer( const key_pair& kp )
: kp_( kp ),
  pk_( kp )
{
}

const pub_key& key_signer::get_pub_key() const
{
  return pk_;
}

bool key_signer::sign( const uint8_t *msg, size_t msg_len, signature& sig )
{
  return sig.sign( msg, msg_len, kp_ );
}
