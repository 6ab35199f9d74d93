#pragma once

#include <string>
#include <string.h>

namespace sp
{

  // error kinds reported by the library
  enum class err_code : int
  {
    e_ok = 0,
    e_seed_too_long,        // derivation seed longer than SP_MAX_SEED_LEN
    e_too_many_seeds,       // more seed segments than SP_MAX_SEEDS
    e_on_curve,             // derived address is a valid ed25519 point
    e_bump_exhausted,       // all 256 bump seeds land on the curve
    e_too_many_signatures,  // more than 255 signers
    e_account_limit,        // more than SP_MAX_ACCOUNTS accounts
    e_msg_too_large,        // encoded transaction above SP_PACKET_DATA_SIZE
    e_empty_instructions,
    e_missing_field,
    e_truncated,
    e_malformed_len,
    e_inconsistent_header,
    e_trailing_bytes,
    e_unsupported_version,
    e_invalid_index,
    e_missing_signer,
    e_account_permission,   // account lacks signer or writable permission
    e_invalid_key,
    e_crypto,               // openssl hash or signing failure
    e_io,
    e_last_err_code
  };

  // short name of error kind
  const char *err_code_str( err_code );

  // container for general errors
  class error
  {
  public:
    error();
    void reset_err();
    bool get_is_err() const;
    err_code get_err_code() const;
    bool set_err_msg( const std::string& );
    bool set_err_msg( const std::string&, int errcode );
    bool set_err( err_code, const std::string& );
    bool set_err( const error& );
    std::string get_err_msg() const;
  private:
    bool        is_err_;
    err_code    code_;
    std::string err_msg_;
  };

  inline error::error()
  : is_err_( false ),
    code_( err_code::e_ok )
  {
  }

  inline void error::reset_err()
  {
    is_err_ = false;
    code_ = err_code::e_ok;
    err_msg_.clear();
  }

  inline bool error::get_is_err() const
  {
    return is_err_;
  }

  inline err_code error::get_err_code() const
  {
    return code_;
  }

  inline bool error::set_err_msg( const std::string& err_msg )
  {
    return set_err( err_code::e_io, err_msg );
  }

  inline bool error::set_err_msg( const std::string& err_msg, int errcode )
  {
    err_msg_ = err_msg;
    err_msg_ += " [";
    err_msg_ += std::to_string( errcode );
    err_msg_ += ' ';
    err_msg_ += strerror( errcode );
    err_msg_ += ']';
    code_ = err_code::e_io;
    is_err_ = true;
    return false;
  }

  inline bool error::set_err( err_code code, const std::string& err_msg )
  {
    err_msg_ = err_msg;
    code_ = code;
    is_err_ = true;
    return false;
  }

  inline bool error::set_err( const error& err )
  {
    return set_err( err.code_, err.err_msg_ );
  }

  inline std::string error::get_err_msg() const
  {
    return err_msg_;
  }

}
