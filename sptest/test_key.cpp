#include <sp/error.hpp>
#include <sp/key_pair.hpp>
#include <sp/program_ids.hpp>
#include <sp/misc.hpp>
#include <sp/log.hpp>
#include "test_error.hpp"
#include <vector>

using namespace sp;

static const char kptxt[] = "[1,255,171,208,173,142,62,253,217,43,175,186,121,205,69,158,81,20,106,216,112,153,91,128,111,144,115,208,226,228,180,230,54,224,118,105,238,95,215,221,52,118,41,49,241,73,160,221,225,36,45,167,11,203,7,232,201,166,138,219,218,113,232,229 ]";
static const char pktxt[] = "4hDXpxxchPLHUH4aCgr8Ec9B82Aztjy2w4xRc4NFhqCg";
static const char sigtxt[] = "3LEWGZ5K88RqFnftjqyzaFm4AdYkwnGvJhKb13dVEa9uLnoDUif5B3esZyQ8dwxtx44PQZqkvhqH4HZUMi5PjTHQ";

void test_base58()
{
  // leading zero bytes map to leading '1' characters
  static const uint8_t src[] = { 0, 0, 1, 2, 255 };
  uint8_t txt[32];
  int n = enc_base58( src, sizeof( src ), txt, sizeof( txt ) );
  SP_TEST_CHECK( n > 2 );
  SP_TEST_CHECK( txt[0] == '1' && txt[1] == '1' && txt[2] != '1' );
  uint8_t dst[16];
  SP_TEST_CHECK( dec_base58( txt, n, dst, sizeof( dst ) ) ==
                 (int)sizeof( src ) );
  SP_TEST_CHECK( 0 == __builtin_memcmp( src, dst, sizeof( src ) ) );

  // all-zero address
  hash zh;
  SP_TEST_CHECK( zh.is_zero() );
  SP_TEST_CHECK( zh.to_base58() == "11111111111111111111111111111111" );
  hash zh2;
  SP_TEST_CHECK( zh2.init_from_text( zh.to_base58() ) );
  SP_TEST_CHECK( zh2 == zh );

  // rejected text
  hash bad;
  SP_TEST_CHECK( !bad.init_from_text( std::string( "0OIl" ) ) );
  SP_TEST_CHECK( !bad.init_from_text( std::string( "1111" ) ) );
  SP_TEST_CHECK( dec_base58( (const uint8_t*)"abc0", 4, dst,
                             sizeof( dst ) ) < 0 );
}

void test_base64()
{
  uint8_t dst[16];
  SP_TEST_CHECK( dec_base64( (const uint8_t*)"aGk=", 4, dst ) == 2 );
  SP_TEST_CHECK( dst[0] == 'h' && dst[1] == 'i' );
  SP_TEST_CHECK( dec_base64( (const uint8_t*)"aGk", 3, dst ) == 2 );
  SP_TEST_CHECK( dec_base64( (const uint8_t*)"aGVsbG8=", 8, dst ) == 5 );
  SP_TEST_CHECK( 0 == __builtin_memcmp( dst, "hello", 5 ) );

  // non-alphabet bytes, data after padding, dangling character
  SP_TEST_CHECK( dec_base64( (const uint8_t*)"aG*=", 4, dst ) < 0 );
  SP_TEST_CHECK( dec_base64( (const uint8_t*)"aG k", 4, dst ) < 0 );
  SP_TEST_CHECK( dec_base64( (const uint8_t*)"aG=k", 4, dst ) < 0 );
  SP_TEST_CHECK( dec_base64( (const uint8_t*)"aGk=a", 5, dst ) < 0 );
  SP_TEST_CHECK( dec_base64( (const uint8_t*)"aGVsb", 5, dst ) < 0 );
}

void test_key()
{
  static const uint8_t kp_val[] = {
    1,255,171,208,173,142,62,253,217,43,175,186,121,205,69,158,81,20,106,216,112,153,91,128,111,144,115,208,226,228,180,230,54,224,118,105,238,95,215,221,52,118,41,49,241,73,160,221,225,36,45,167,11,203,7,232,201,166,138,219,218,113,232,229
  };
  key_pair kp;
  SP_TEST_CHECK( kp.init_from_json( kptxt ) );
  SP_TEST_CHECK( 0 == __builtin_memcmp( kp.data(), kp_val, key_pair::len ) );

  // short or malformed arrays are rejected
  key_pair kp2;
  SP_TEST_CHECK( !kp2.init_from_json( std::string( "[1,2,3]" ) ) );
  SP_TEST_CHECK( !kp2.init_from_json( std::string( "1,2,3" ) ) );

  // public key half of pair
  pub_key pk( kp );
  SP_TEST_CHECK( pk.to_base58() == pktxt );
  pub_key pk2;
  SP_TEST_CHECK( pk2.init_from_text( std::string( pktxt ) ) );
  SP_TEST_CHECK( pk == pk2 );
  SP_TEST_CHECK( !( pk < pk2 ) && !( pk2 < pk ) );
  pk2.zero();
  SP_TEST_CHECK( pk != pk2 );
  SP_TEST_CHECK( pk2 < pk );

  // signing vector
  const char *msg = "hello world";
  size_t msglen = __builtin_strlen( msg );
  signature sig;
  SP_TEST_CHECK( sig.is_zero() );
  SP_TEST_CHECK( sig.sign( (const uint8_t*)msg, msglen, kp ) );
  std::string res;
  sig.enc_base58( res );
  SP_TEST_CHECK( res == sigtxt );
  signature sig2;
  SP_TEST_CHECK( sig2.init_from_text( sigtxt ) );
  SP_TEST_CHECK( sig2 == sig );
  SP_TEST_CHECK( sig2.verify( (const uint8_t*)msg, msglen, pk ) );
  SP_TEST_CHECK( !sig2.verify( (const uint8_t*)msg, msglen - 1, pk ) );

  // zero signature never verifies
  signature zsig;
  SP_TEST_CHECK( !zsig.verify( (const uint8_t*)msg, msglen, pk ) );

  // signer interface over key pair
  key_signer ks( kp );
  SP_TEST_CHECK( ks.get_pub_key() == pk );
  signature sig3;
  SP_TEST_CHECK( ks.sign( (const uint8_t*)msg, msglen, sig3 ) );
  SP_TEST_CHECK( sig3 == sig );

  // generated keys sign and verify
  key_pair gk;
  SP_TEST_CHECK( gk.gen() );
  pub_key gp( gk );
  signature gsig;
  SP_TEST_CHECK( gsig.sign( (const uint8_t*)msg, msglen, gk ) );
  SP_TEST_CHECK( gsig.verify( (const uint8_t*)msg, msglen, gp ) );
  SP_TEST_CHECK( !gsig.verify( (const uint8_t*)msg, msglen, pk ) );
}

void test_program_ids()
{
  static const uint8_t clock[] = {
    0x06,0xa7,0xd5,0x17,0x18,0xc7,0x74,0xc9,0x28,0x56,0x63,0x98,0x69,0x1d,
    0x5e,0xb6,0x8b,0x5e,0xb8,0xa3,0x9b,0x4b,0x6d,0x5c,0x73,0x55,0x5b,0x21,
    0x00,0x00,0x00,0x00
  };
  const pub_key& ck = get_program_id( program_id::e_sysvar_clock );
  SP_TEST_CHECK( 0 == __builtin_memcmp( ck.data(), clock, sizeof( clock ) ) );
  SP_TEST_CHECK( get_program_id( program_id::e_system ).is_zero() );
  SP_TEST_CHECK( get_program_id( program_id::e_token ).to_base58() ==
                 "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA" );

  // every entry is found by its name
  for( unsigned i = 0; i != (unsigned)program_id::e_last_program_id; ++i ) {
    program_id id = (program_id)i;
    const pub_key *pk = find_program_id( get_program_name( id ) );
    SP_TEST_CHECK( pk != nullptr );
    SP_TEST_CHECK( *pk == get_program_id( id ) );
  }
  SP_TEST_CHECK( find_program_id( "associated_token" ) ==
                 &get_program_id( program_id::e_assoc_token ) );
  SP_TEST_CHECK( find_program_id( "no_such_program" ) == nullptr );
}

void test_error_str()
{
  SP_TEST_CHECK( std::string( err_code_str( err_code::e_ok ) ) == "ok" );
  error err;
  SP_TEST_CHECK( !err.get_is_err() );
  SP_TEST_CHECK( !err.set_err( err_code::e_truncated, "short" ) );
  SP_TEST_CHECK( err.get_is_err() );
  SP_TEST_CHECK( err.get_err_code() == err_code::e_truncated );
  SP_TEST_CHECK( err.get_err_msg() == "short" );
  err.reset_err();
  SP_TEST_CHECK( !err.get_is_err() );
  SP_TEST_CHECK( err.get_err_code() == err_code::e_ok );
}

void test_log()
{
  log::set_level( SP_LOG_DBG_LVL );
  pub_key pk;
  SP_LOG_DBG( "example" )
    .add( "hello", "world" )
    .add( "ival", 42L )
    .add( "key", pk )
    .end();
  log::set_level( SP_LOG_INF_LVL );
  SP_TEST_CHECK( !log::has_level( SP_LOG_DBG_LVL ) );
  SP_TEST_CHECK( log::has_level( SP_LOG_INF_LVL ) );
  SP_LOG_INF( "example2" )
    .add( "hello", "world2" )
    .end();
}

int main(int,char**)
{
  SP_TEST_START
  test_base58();
  test_base64();
  test_key();
  test_program_ids();
  test_error_str();
  test_log();
  SP_TEST_END
  return 0;
}
