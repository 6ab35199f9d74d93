#include <sp/tx_builder.hpp>
#include <sp/program_ids.hpp>
#include <sp/log.hpp>
#include "test_error.hpp"

using namespace sp;

static const char kptxt[] = "[1,255,171,208,173,142,62,253,217,43,175,186,121,205,69,158,81,20,106,216,112,153,91,128,111,144,115,208,226,228,180,230,54,224,118,105,238,95,215,221,52,118,41,49,241,73,160,221,225,36,45,167,11,203,7,232,201,166,138,219,218,113,232,229 ]";

static pub_key mk_key( uint8_t v )
{
  uint8_t buf[pub_key::len];
  __builtin_memset( buf, v, sizeof( buf ) );
  pub_key pk;
  pk.init_from_buf( buf );
  return pk;
}

// system program transfer: u32 variant 2 then u64 lamports
static instruction transfer_ix(
    const pub_key& from, const pub_key& to, uint64_t lamports )
{
  bincode wtr;
  wtr.add( (uint32_t)2 );
  wtr.add( lamports );
  return instruction_builder( get_program_id( program_id::e_system ) )
    .account( from, true, true )
    .account( to, false, true )
    .data( wtr )
    .build();
}

// memo co-signed read-only by sgn
static instruction memo_ix( str text, const pub_key& sgn )
{
  return instruction_builder( get_program_id( program_id::e_memo ) )
    .account( sgn, true, false )
    .data( (const uint8_t*)text.str_, text.len_ )
    .build();
}

void test_instruction_builder()
{
  pub_key prog = mk_key( 1 ), a = mk_key( 2 ), b = mk_key( 3 );
  account_vec_t accts;
  accts.push_back( account_meta( b, true, false ) );
  bincode wtr;
  wtr.add( (uint32_t)7 );
  static const uint8_t tail[] = { 0xaa, 0xbb };
  instruction ix = instruction_builder( prog )
    .account( a, false, true )
    .accounts( accts )
    .data( wtr )
    .data( tail, sizeof( tail ) )
    .build();
  SP_TEST_CHECK( ix.prog_id_ == prog );
  SP_TEST_CHECK( ix.accts_.size() == 2 );
  SP_TEST_CHECK( ix.accts_[0] == account_meta( a, false, true ) );
  SP_TEST_CHECK( ix.accts_[1] == account_meta( b, true, false ) );
  static const uint8_t exp[] = { 7, 0, 0, 0, 0xaa, 0xbb };
  SP_TEST_CHECK( ix.data_ == byte_vec_t( exp, exp + sizeof( exp ) ) );
}

void test_builder_fields()
{
  pub_key fp = mk_key( 1 );
  instruction ix = transfer_ix( fp, mk_key( 2 ), 1 );
  transaction tx;

  // nothing set
  {
    tx_builder bld;
    SP_TEST_CHECK( !bld.build( tx ) );
    SP_TEST_CHECK( bld.get_err_code() == err_code::e_missing_field );
  }

  // block hash missing
  {
    tx_builder bld;
    bld.set_fee_payer( fp );
    bld.add( ix );
    SP_TEST_CHECK( !bld.build( tx ) );
    SP_TEST_CHECK( bld.get_err_code() == err_code::e_missing_field );
  }

  // no instructions
  {
    tx_builder bld;
    bld.set_fee_payer( fp );
    bld.set_recent_hash( mk_key( 9 ) );
    SP_TEST_CHECK( !bld.build( tx ) );
    SP_TEST_CHECK( bld.get_err_code() == err_code::e_empty_instructions );
    SP_TEST_CHECK( !bld.build_versioned( tx ) );
    SP_TEST_CHECK( bld.get_err_code() == err_code::e_empty_instructions );
  }

  // compiler errors pass through
  {
    tx_builder bld;
    bld.set_fee_payer( fp );
    bld.set_recent_hash( mk_key( 9 ) );
    bld.add( instruction_builder( mk_key( 3 ) )
        .data( byte_vec_t( 1500, 0 ) ).build() );
    SP_TEST_CHECK( !bld.build( tx ) );
    SP_TEST_CHECK( bld.get_err_code() == err_code::e_msg_too_large );
  }

  // legacy and versioned from same inputs
  {
    tx_builder bld;
    bld.set_fee_payer( fp );
    bld.set_recent_hash( mk_key( 9 ) );
    bld.add( ix ).add( memo_ix( "fee", fp ) );
    SP_TEST_CHECK( bld.get_instructions().size() == 2 );
    SP_TEST_CHECK( bld.build( tx ) );
    SP_TEST_CHECK( tx.get_message().get_version() == msg_version::e_legacy );
    SP_TEST_CHECK( tx.get_signatures().size() == 1 );
    SP_TEST_CHECK( tx.get_signatures()[0].is_zero() );
    SP_TEST_CHECK( !tx.is_signed() );
    SP_TEST_CHECK( tx.get_message().get_recent_hash() == mk_key( 9 ) );

    transaction vtx;
    SP_TEST_CHECK( bld.build_versioned( vtx ) );
    SP_TEST_CHECK( vtx.get_message().get_version() == msg_version::e_v0 );
    SP_TEST_CHECK( vtx.get_message().get_keys() ==
                   tx.get_message().get_keys() );

    bld.reset();
    SP_TEST_CHECK( bld.get_instructions().empty() );
    SP_TEST_CHECK( !bld.build( tx ) );
    SP_TEST_CHECK( bld.get_err_code() == err_code::e_missing_field );
  }
}

void test_sign()
{
  key_pair kp1, kp2, kp3;
  SP_TEST_CHECK( kp1.init_from_json( kptxt ) );
  SP_TEST_CHECK( kp2.gen() );
  SP_TEST_CHECK( kp3.gen() );
  key_signer s1( kp1 ), s2( kp2 ), s3( kp3 );
  pub_key p1( kp1 ), p2( kp2 );

  // payer funds transfer, second key co-signs memo read-only
  tx_builder bld;
  bld.set_fee_payer( p1 );
  bld.set_recent_hash( mk_key( 9 ) );
  bld.add( transfer_ix( p1, mk_key( 4 ), 10 ) );
  bld.add( memo_ix( "hi", p2 ) );
  transaction tx;
  SP_TEST_CHECK( bld.build( tx ) );
  SP_TEST_CHECK( tx.get_signatures().size() == 2 );
  SP_TEST_CHECK( tx.get_message().get_keys()[0] == p1 );
  SP_TEST_CHECK( tx.get_message().get_keys()[1] == p2 );
  SP_TEST_CHECK( tx.get_message().get_header().num_readonly_signed_ == 1 );

  // missing signer leaves slots untouched
  {
    signer *sgn[] = { &s1, &s3 };
    SP_TEST_CHECK( !tx.sign( sgn, 2 ) );
    SP_TEST_CHECK( tx.get_err_code() == err_code::e_missing_signer );
    SP_TEST_CHECK( tx.get_err_msg().find( p2.to_base58() ) !=
                   std::string::npos );
    SP_TEST_CHECK( tx.get_signatures()[0].is_zero() );
    SP_TEST_CHECK( tx.get_signatures()[1].is_zero() );
  }

  // short slot vector is not rebuilt when a signer is missing
  {
    transaction odd( tx );
    uint8_t sbuf[signature::len];
    __builtin_memset( sbuf, 0x77, sizeof( sbuf ) );
    odd.get_signatures().resize( 1 );
    odd.get_signatures()[0].init_from_buf( sbuf );
    signer *sgn[] = { &s1 };
    SP_TEST_CHECK( !odd.sign( sgn, 1 ) );
    SP_TEST_CHECK( odd.get_err_code() == err_code::e_missing_signer );
    SP_TEST_CHECK( odd.get_signatures().size() == 1 );
    SP_TEST_CHECK( 0 == __builtin_memcmp(
          odd.get_signatures()[0].data(), sbuf, sizeof( sbuf ) ) );
  }

  // full signing in any signer order
  transaction full( tx );
  {
    signer *sgn[] = { &s3, &s2, &s1 };
    SP_TEST_CHECK( full.sign( sgn, 3 ) );
    SP_TEST_CHECK( full.is_signed() );
    SP_TEST_CHECK( full.verify() );
  }

  // partial signing fills matching slots only
  {
    signer *sgn[] = { &s2, &s3 };
    SP_TEST_CHECK( tx.partial_sign( sgn, 2 ) );
    SP_TEST_CHECK( tx.get_signatures()[0].is_zero() );
    SP_TEST_CHECK( !tx.get_signatures()[1].is_zero() );
    SP_TEST_CHECK( !tx.is_signed() );
    signer *sgn2[] = { &s1 };
    SP_TEST_CHECK( tx.partial_sign( sgn2, 1 ) );
    SP_TEST_CHECK( tx.is_signed() );
    SP_TEST_CHECK( tx.verify() );
    SP_TEST_CHECK( tx.equals( full ) );
  }

  // signed transaction survives the wire
  {
    byte_vec_t buf;
    SP_TEST_CHECK( full.encode( buf ) );
    transaction rtx;
    SP_TEST_CHECK( rtx.decode( buf ) );
    SP_TEST_CHECK( rtx.is_signed() );
    SP_TEST_CHECK( rtx.verify() );
  }

  // tampered signature
  {
    transaction bad( full );
    uint8_t sbuf[signature::len];
    __builtin_memcpy( sbuf, bad.get_signatures()[1].data(), sizeof( sbuf ) );
    sbuf[0] ^= 1;
    bad.get_signatures()[1].init_from_buf( sbuf );
    SP_TEST_CHECK( bad.is_signed() );
    SP_TEST_CHECK( !bad.verify() );
    SP_TEST_CHECK( bad.get_err_code() == err_code::e_crypto );
  }
}

int main(int,char**)
{
  log::set_level( SP_LOG_ERR_LVL );
  SP_TEST_START
  test_instruction_builder();
  test_builder_fields();
  test_sign();
  SP_TEST_END
  return 0;
}
