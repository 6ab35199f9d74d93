#pragma once

#include <sp/message.hpp>
#include <string>

namespace sp
{

  typedef std::vector<signature> sig_vec_t;

  // signed message as sent over the wire:
  // one signature slot per required signer followed by the message
  class transaction : public error
  {
  public:
    transaction();

    sig_vec_t& get_signatures();
    const sig_vec_t& get_signatures() const;

    message& get_message();
    const message& get_message() const;

    // zeroed signature slot for every required signer
    void init_signatures();

    // wire encoding
    bool encode( bincode& );
    bool encode( byte_vec_t& );

    // encoded size in bytes or 0 if not encodable
    size_t get_size();

    // text form of wire encoding
    bool enc_base58( std::string& );
    bool enc_base64( std::string& );

    // decode complete transaction, rejecting trailing bytes
    bool decode( const uint8_t *buf, size_t len );
    bool decode( const byte_vec_t& );
    bool dec_base58( str );
    bool dec_base64( str );

    // fill all required signature slots
    // fails without signing if any required signer is absent
    bool sign( signer *signers[], size_t n );

    // fill slots for which a signer is supplied
    bool partial_sign( signer *signers[], size_t n );

    // every required slot holds a signature
    bool is_signed() const;

    // check every signature against its account key
    bool verify();

    // append instruction to legacy message, existing signatures are
    // cleared as they no longer cover the message
    bool add_instruction( const instruction& );

    // multi-line listing of signatures, header, accounts, instructions
    // and lookups
    void inspect( std::string& ) const;

    // one-line count of signatures, accounts, instructions and size
    void get_summary( std::string& );

    bool equals( const transaction& ) const;

  private:
    bool sign_slots( signer *signers[], size_t n, bool require_all );

    sig_vec_t sigs_;
    message   msg_;
  };

  inline sig_vec_t& transaction::get_signatures()
  {
    return sigs_;
  }

  inline const sig_vec_t& transaction::get_signatures() const
  {
    return sigs_;
  }

  inline message& transaction::get_message()
  {
    return msg_;
  }

  inline const message& transaction::get_message() const
  {
    return msg_;
  }

}
