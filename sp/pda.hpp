#pragma once

#include <sp/key_pair.hpp>
#include <sp/error.hpp>
#include <vector>

// caller seeds per derivation, not counting the bump seed
#define SP_MAX_SEEDS    16
// bytes per seed segment
#define SP_MAX_SEED_LEN 32

namespace sp
{

  // ordered seed material, each entry at most SP_MAX_SEED_LEN bytes
  typedef std::vector<str> seed_vec_t;

  // true if the 32 bytes decompress to a point of the ed25519 curve
  bool is_on_curve( const uint8_t *pt );

  // program derived address:
  //   sha256( seeds || bump || program id || "ProgramDerivedAddress" )
  // accepted only when off the ed25519 curve so no private key can sign
  class program_address : public error
  {
  public:
    program_address();

    // derive from seeds and explicit bump seed
    bool create( const seed_vec_t&, uint8_t bump, const pub_key& prog_id );

    // derive from seeds that already contain any bump segment
    bool create_with_seeds( const seed_vec_t&, const pub_key& prog_id );

    // search bump seeds from 255 down to 0 for the first off-curve address
    bool find( const seed_vec_t&, const pub_key& prog_id );

    // result of last successful create or find
    const pub_key& get_address() const;
    uint8_t get_bump() const;

  private:
    bool check_seeds( const seed_vec_t& );
    bool derive( const seed_vec_t&, const uint8_t *bump,
                 const pub_key& prog_id, pub_key& res );

    pub_key addr_;
    uint8_t bump_;
  };

  // associated token account of wallet for mint
  bool find_associated_token_address(
      const pub_key& wallet, const pub_key& mint, pub_key& res );

  inline const pub_key& program_address::get_address() const
  {
    return addr_;
  }

  inline uint8_t program_address::get_bump() const
  {
    return bump_;
  }

}
