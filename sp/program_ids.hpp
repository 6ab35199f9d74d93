#pragma once

#include <sp/key_pair.hpp>

namespace sp
{

  // well-known program and sysvar addresses
  enum class program_id : unsigned
  {
    e_system = 0,
    e_token,
    e_token_2022,
    e_assoc_token,
    e_memo,
    e_compute_budget,
    e_bpf_upgradeable_loader,
    e_sysvar_clock,
    e_sysvar_rent,
    e_sysvar_recent_blockhashes,
    e_last_program_id
  };

  // fixed address of well-known program
  const pub_key& get_program_id( program_id );

  // name of well-known program e.g. "token"
  const char *get_program_name( program_id );

  // look up well-known program by name, nullptr if unknown
  const pub_key *find_program_id( str name );

}
