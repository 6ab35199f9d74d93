#include "program_ids.hpp"

using namespace sp;

namespace
{
  struct program_entry
  {
    const char *name_;
    const char *addr_;
  };

  const program_entry program_entries[] = {
    { "system",                   "11111111111111111111111111111111" },
    { "token",                    "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA" },
    { "token_2022",               "TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb" },
    { "associated_token",         "ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL" },
    { "memo",                     "MemoSq4gqABAXKb96qnH8TysNcWxMyWCqXgDLGmfcHr" },
    { "compute_budget",           "ComputeBudget111111111111111111111111111111" },
    { "bpf_upgradeable_loader",   "BPFLoaderUpgradeab1e11111111111111111111111" },
    { "sysvar_clock",             "SysvarC1ock11111111111111111111111111111111" },
    { "sysvar_rent",              "SysvarRent111111111111111111111111111111111" },
    { "sysvar_recent_blockhashes","SysvarRecentB1ockHashes11111111111111111111" }
  };

  const unsigned num_programs = (unsigned)program_id::e_last_program_id;

  static_assert( sizeof( program_entries ) / sizeof( program_entries[0] ) ==
      num_programs, "program_entries out of sync" );

  // decoded once on first use and immutable afterwards
  class program_table
  {
  public:
    program_table() {
      for( unsigned i = 0; i != num_programs; ++i ) {
        keys_[i].init_from_text( str( program_entries[i].addr_ ) );
      }
    }
    pub_key keys_[num_programs];
  };

  const program_table& get_table()
  {
    static const program_table tab;
    return tab;
  }
}

const pub_key& sp::get_program_id( program_id id )
{
  return get_table().keys_[(unsigned)id];
}

const char *sp::get_program_name( program_id id )
{
  return program_entries[(unsigned)id].name_;
}

const pub_key *sp::find_program_id( str name )
{
  for( unsigned i = 0; i != num_programs; ++i ) {
    if ( name == str( program_entries[i].name_ ) ) {
      return &get_table().keys_[i];
    }
  }
  return nullptr;
}
