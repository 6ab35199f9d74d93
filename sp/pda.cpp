#include "pda.hpp"
#include "log.hpp"
#include "program_ids.hpp"
#include <openssl/evp.h>
#include <openssl/bn.h>

using namespace sp;

static const char pda_marker[] = "ProgramDerivedAddress";

bool sp::is_on_curve( const uint8_t *pt )
{
  // compressed edwards point: y little-endian with x sign in top bit
  uint8_t ybuf[hash::len];
  __builtin_memcpy( ybuf, pt, hash::len );
  ybuf[hash::len-1] &= 0x7f;

  BN_CTX *ctx = BN_CTX_new();
  if ( !ctx ) {
    return true;
  }
  BN_CTX_start( ctx );
  BIGNUM *p  = BN_CTX_get( ctx );
  BIGNUM *d  = BN_CTX_get( ctx );
  BIGNUM *t  = BN_CTX_get( ctx );
  BIGNUM *y  = BN_CTX_get( ctx );
  BIGNUM *y2 = BN_CTX_get( ctx );
  BIGNUM *u  = BN_CTX_get( ctx );
  BIGNUM *v  = BN_CTX_get( ctx );
  BIGNUM *w  = BN_CTX_get( ctx );

  // p = 2^255 - 19, d = -121665/121666 mod p
  // x^2 = (y^2 - 1) / (d*y^2 + 1) must be a square mod p
  // arithmetic failure is reported as on-curve
  bool res = true;
  bool ok = w &&
    BN_set_bit( p, 255 ) && BN_sub_word( p, 19 ) &&
    BN_set_word( t, 121666 ) && BN_mod_inverse( t, t, p, ctx ) &&
    BN_set_word( d, 121665 ) && BN_mod_mul( d, d, t, p, ctx ) &&
    BN_sub( d, p, d ) &&
    BN_lebin2bn( ybuf, hash::len, y ) && BN_nnmod( y, y, p, ctx ) &&
    BN_mod_sqr( y2, y, p, ctx ) &&
    BN_one( t ) && BN_mod_sub( u, y2, t, p, ctx ) &&
    BN_mod_mul( v, d, y2, p, ctx ) && BN_mod_add( v, v, t, p, ctx ) &&
    BN_mod_inverse( v, v, p, ctx ) && BN_mod_mul( w, u, v, p, ctx );
  if ( ok ) {
    if ( BN_is_zero( w ) ) {
      res = true;
    } else if ( BN_sub( t, p, BN_value_one() ) && BN_rshift1( t, t ) &&
                BN_mod_exp( w, w, t, p, ctx ) ) {
      // euler criterion
      res = BN_is_one( w );
    }
  }
  BN_CTX_end( ctx );
  BN_CTX_free( ctx );
  return res;
}

program_address::program_address()
: bump_( 0 )
{
}

bool program_address::check_seeds( const seed_vec_t& seeds )
{
  if ( seeds.size() > SP_MAX_SEEDS ) {
    return set_err( err_code::e_too_many_seeds,
        "too many seeds [num=" + std::to_string( seeds.size() ) +
        " max=" + std::to_string( SP_MAX_SEEDS ) + "]" );
  }
  for( size_t i = 0; i != seeds.size(); ++i ) {
    if ( seeds[i].len_ > SP_MAX_SEED_LEN ) {
      return set_err( err_code::e_seed_too_long,
          "seed too long [idx=" + std::to_string( i ) +
          " len=" + std::to_string( seeds[i].len_ ) +
          " max=" + std::to_string( SP_MAX_SEED_LEN ) + "]" );
    }
  }
  return true;
}

bool program_address::derive( const seed_vec_t& seeds, const uint8_t *bump,
                              const pub_key& prog_id, pub_key& res )
{
  uint8_t digest[EVP_MAX_MD_SIZE];
  unsigned dlen = 0;
  EVP_MD_CTX *mctx = EVP_MD_CTX_new();
  bool ok = mctx && 1 == EVP_DigestInit_ex( mctx, EVP_sha256(), NULL );
  for( size_t i = 0; ok && i != seeds.size(); ++i ) {
    ok = 1 == EVP_DigestUpdate( mctx, seeds[i].str_, seeds[i].len_ );
  }
  if ( ok && bump ) {
    ok = 1 == EVP_DigestUpdate( mctx, bump, 1 );
  }
  ok = ok &&
    1 == EVP_DigestUpdate( mctx, prog_id.data(), pub_key::len ) &&
    1 == EVP_DigestUpdate( mctx, pda_marker, sizeof( pda_marker ) - 1 ) &&
    1 == EVP_DigestFinal_ex( mctx, digest, &dlen );
  EVP_MD_CTX_free( mctx );
  if ( !ok || dlen != pub_key::len ) {
    return set_err( err_code::e_crypto, "sha256 digest failed" );
  }
  res.init_from_buf( digest );
  return true;
}

bool program_address::create(
    const seed_vec_t& seeds, uint8_t bump, const pub_key& prog_id )
{
  reset_err();
  if ( !check_seeds( seeds ) ) {
    return false;
  }
  pub_key res;
  if ( !derive( seeds, &bump, prog_id, res ) ) {
    return false;
  }
  if ( is_on_curve( res.data() ) ) {
    return set_err( err_code::e_on_curve,
        "derived address is on curve [bump=" +
        std::to_string( bump ) + "]" );
  }
  addr_ = res;
  bump_ = bump;
  return true;
}

bool program_address::create_with_seeds(
    const seed_vec_t& seeds, const pub_key& prog_id )
{
  reset_err();
  if ( !check_seeds( seeds ) ) {
    return false;
  }
  pub_key res;
  if ( !derive( seeds, nullptr, prog_id, res ) ) {
    return false;
  }
  if ( is_on_curve( res.data() ) ) {
    return set_err( err_code::e_on_curve, "derived address is on curve" );
  }
  addr_ = res;
  bump_ = 0;
  return true;
}

bool program_address::find( const seed_vec_t& seeds, const pub_key& prog_id )
{
  reset_err();
  if ( !check_seeds( seeds ) ) {
    return false;
  }
  pub_key res;
  for( unsigned i = 256; i-- != 0; ) {
    uint8_t bump = (uint8_t)i;
    if ( !derive( seeds, &bump, prog_id, res ) ) {
      return false;
    }
    if ( !is_on_curve( res.data() ) ) {
      addr_ = res;
      bump_ = bump;
      SP_LOG_DBG( "found program address" )
        .add( "program_id", prog_id )
        .add( "address", addr_ )
        .add( "bump", (uint32_t)bump_ )
        .end();
      return true;
    }
  }
  return set_err( err_code::e_bump_exhausted,
      "no off-curve address for any bump seed [program_id=" +
      prog_id.to_base58() + "]" );
}

bool sp::find_associated_token_address(
    const pub_key& wallet, const pub_key& mint, pub_key& res )
{
  const pub_key& token = get_program_id( program_id::e_token );
  seed_vec_t seeds;
  seeds.push_back( str( wallet.data(), pub_key::len ) );
  seeds.push_back( str( token.data(), pub_key::len ) );
  seeds.push_back( str( mint.data(), pub_key::len ) );
  program_address pda;
  if ( !pda.find( seeds, get_program_id( program_id::e_assoc_token ) ) ) {
    return false;
  }
  res = pda.get_address();
  return true;
}
