#pragma once

#include <sp/transaction.hpp>

namespace sp
{

  // accumulates instructions for one transaction
  class tx_builder : public error
  {
  public:
    tx_builder();

    void set_fee_payer( const pub_key& );
    void set_recent_hash( const hash& );
    tx_builder& add( const instruction& );
    tx_builder& add( const instruction_vec_t& );

    const instruction_vec_t& get_instructions() const;

    // compile legacy transaction with zeroed signature slots
    bool build( transaction& );

    // compile version 0 transaction with zeroed signature slots
    bool build_versioned( transaction& );

    // drop instructions and fields for next transaction
    void reset();

  private:
    bool build_tx( msg_version, transaction& );

    pub_key           payer_;
    hash              bhash_;
    bool              has_payer_;
    bool              has_bhash_;
    instruction_vec_t ixs_;
    msg_compiler      cmp_;
  };

  inline const instruction_vec_t& tx_builder::get_instructions() const
  {
    return ixs_;
  }

}
