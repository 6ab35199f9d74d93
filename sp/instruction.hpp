#pragma once

#include <sp/key_pair.hpp>
#include <sp/bincode.hpp>
#include <vector>

namespace sp
{

  // account referenced by an instruction
  struct account_meta
  {
    account_meta();
    account_meta( const pub_key&, bool is_signer, bool is_writable );
    bool operator==( const account_meta& ) const;

    pub_key key_;
    bool    is_signer_;
    bool    is_writable_;
  };

  typedef std::vector<account_meta> account_vec_t;
  typedef std::vector<uint8_t>      byte_vec_t;

  // single program invocation prior to compilation
  struct instruction
  {
    pub_key       prog_id_;
    account_vec_t accts_;
    byte_vec_t    data_;
  };

  typedef std::vector<instruction> instruction_vec_t;

  // instruction with addresses replaced by account table indices
  struct compiled_instruction
  {
    compiled_instruction();
    bool operator==( const compiled_instruction& ) const;

    uint8_t    prog_idx_;
    byte_vec_t accts_;
    byte_vec_t data_;
  };

  typedef std::vector<compiled_instruction> compiled_vec_t;

  // fluent construction of one instruction
  class instruction_builder
  {
  public:
    explicit instruction_builder( const pub_key& prog_id );

    // append account reference
    instruction_builder& account( const pub_key&, bool is_signer,
                                  bool is_writable );
    instruction_builder& account( const account_meta& );
    instruction_builder& accounts( const account_vec_t& );

    // append raw payload bytes
    instruction_builder& data( const uint8_t *buf, size_t len );
    instruction_builder& data( const byte_vec_t& );

    // append payload written by bincode writer
    instruction_builder& data( const bincode& );

    const instruction& get() const;
    instruction build() const;

  private:
    instruction ix_;
  };

  inline account_meta::account_meta()
  : is_signer_( false ),
    is_writable_( false )
  {
  }

  inline account_meta::account_meta(
      const pub_key& key, bool is_signer, bool is_writable )
  : key_( key ),
    is_signer_( is_signer ),
    is_writable_( is_writable )
  {
  }

  inline bool account_meta::operator==( const account_meta& obj ) const
  {
    return key_ == obj.key_ &&
           is_signer_ == obj.is_signer_ &&
           is_writable_ == obj.is_writable_;
  }

  inline compiled_instruction::compiled_instruction()
  : prog_idx_( 0 )
  {
  }

  inline bool compiled_instruction::operator==(
      const compiled_instruction& obj ) const
  {
    return prog_idx_ == obj.prog_idx_ &&
           accts_ == obj.accts_ &&
           data_ == obj.data_;
  }

  inline const instruction& instruction_builder::get() const
  {
    return ix_;
  }

}
