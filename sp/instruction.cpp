#include "instruction.hpp"

using namespace sp;

instruction_builder::instruction_builder( const pub_key& prog_id )
{
  ix_.prog_id_ = prog_id;
}

instruction_builder& instruction_builder::account(
    const pub_key& key, bool is_signer, bool is_writable )
{
  ix_.accts_.push_back( account_meta( key, is_signer, is_writable ) );
  return *this;
}

instruction_builder& instruction_builder::account( const account_meta& acc )
{
  ix_.accts_.push_back( acc );
  return *this;
}

instruction_builder& instruction_builder::accounts(
    const account_vec_t& accts )
{
  ix_.accts_.insert( ix_.accts_.end(), accts.begin(), accts.end() );
  return *this;
}

instruction_builder& instruction_builder::data(
    const uint8_t *buf, size_t len )
{
  ix_.data_.insert( ix_.data_.end(), buf, buf + len );
  return *this;
}

instruction_builder& instruction_builder::data( const byte_vec_t& buf )
{
  ix_.data_.insert( ix_.data_.end(), buf.begin(), buf.end() );
  return *this;
}

instruction_builder& instruction_builder::data( const bincode& wtr )
{
  return data( wtr.get_buf(), wtr.size() );
}

instruction instruction_builder::build() const
{
  return ix_;
}
