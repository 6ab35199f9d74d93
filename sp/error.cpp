#include "error.hpp"

static const char *err_code_names[] = {
  "ok",
  "seed_too_long",
  "too_many_seeds",
  "on_curve",
  "bump_exhausted",
  "too_many_signatures",
  "account_limit",
  "msg_too_large",
  "empty_instructions",
  "missing_field",
  "truncated",
  "malformed_len",
  "inconsistent_header",
  "trailing_bytes",
  "unsupported_version",
  "invalid_index",
  "missing_signer",
  "account_permission",
  "invalid_key",
  "crypto",
  "io"
};

static_assert( sizeof( err_code_names ) / sizeof( err_code_names[0] ) ==
    (size_t)sp::err_code::e_last_err_code, "err_code_names out of sync" );

const char *sp::err_code_str( err_code code )
{
  unsigned idx = (unsigned)code;
  if ( idx >= (unsigned)err_code::e_last_err_code ) {
    return "unknown";
  }
  return err_code_names[idx];
}
