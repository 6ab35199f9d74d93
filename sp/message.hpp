#pragma once

#include <sp/instruction.hpp>
#include <sp/hash_map.hpp>
#include <sp/bincode.hpp>
#include <sp/error.hpp>

// largest serialized transaction accepted by the network
#define SP_PACKET_DATA_SIZE 1232

// accounts addressable by one-byte indices
#define SP_MAX_ACCOUNTS     256

// signers countable in the one-byte header field
#define SP_MAX_SIGNERS      255

// prefix of versioned messages
#define SP_MSG_VERSION_PREFIX 0x80

namespace sp
{

  // counts partitioning the account table
  struct message_header
  {
    message_header();
    bool operator==( const message_header& ) const;

    uint8_t num_required_sigs_;
    uint8_t num_readonly_signed_;
    uint8_t num_readonly_unsigned_;
  };

  // message format
  enum class msg_version : uint8_t
  {
    e_legacy = 0,
    e_v0
  };

  // v0 reference into an address lookup table
  struct lookup_ref
  {
    bool operator==( const lookup_ref& ) const;

    pub_key    table_;
    byte_vec_t writable_;
    byte_vec_t readonly_;
  };

  typedef std::vector<pub_key>    key_vec_t;
  typedef std::vector<lookup_ref> lookup_vec_t;

  // compiled message: the portion of a transaction that is signed
  class message : public error
  {
  public:
    message();

    msg_version get_version() const;
    void set_version( msg_version );

    message_header& get_header();
    const message_header& get_header() const;

    key_vec_t& get_keys();
    const key_vec_t& get_keys() const;

    hash& get_recent_hash();
    const hash& get_recent_hash() const;

    compiled_vec_t& get_instructions();
    const compiled_vec_t& get_instructions() const;

    lookup_vec_t& get_lookups();
    const lookup_vec_t& get_lookups() const;

    // permission of account at index of the account table
    bool is_signer( size_t idx ) const;
    bool is_writable( size_t idx ) const;

    // append wire encoding to writer
    bool encode( bincode& );

    // encoding as standalone byte vector
    bool encode( byte_vec_t& );

    // decode message from reader positioned at message start
    bool decode( bindecode& );

    // append instruction to legacy message: new writable accounts go to
    // the end of the writable unsigned accounts, new read-only accounts
    // to the end of the table and existing indices are shifted
    bool add_instruction( const instruction& );

    // encoded size of a transaction carrying this message
    bool get_tx_size( size_t& );

    // equality of wire content
    bool equals( const message& ) const;

    void clear();

  private:
    bool check_len( size_t len, const char *what );
    bool find_key( const pub_key&, size_t& idx ) const;

    msg_version    ver_;
    message_header hdr_;
    key_vec_t      keys_;
    hash           bhash_;
    compiled_vec_t ixs_;
    lookup_vec_t   lookups_;
  };

  // compiles instructions into a message with a deduplicated,
  // permission-partitioned account table
  class msg_compiler : public error
  {
  public:
    msg_compiler();

    // legacy message
    bool compile( const pub_key& fee_payer, const hash& recent_hash,
                  const instruction_vec_t&, message& );

    // version 0 message without lookup table references
    bool compile_v0( const pub_key& fee_payer, const hash& recent_hash,
                     const instruction_vec_t&, message& );

  private:

    // first-seen account with merged permissions
    struct acct
    {
      pub_key key_;
      bool    is_signer_;
      bool    is_writable_;
      uint8_t idx_;
    };

    // address to position in first-seen account vector
    struct trait_acct {
      static const size_t hsize_ = 521UL;
      typedef uint32_t        idx_t;
      typedef pub_key         key_t;
      typedef const pub_key&  keyref_t;
      typedef uint32_t        val_t;
      struct hash_t {
        idx_t operator() ( keyref_t k ) const {
          return (idx_t)k.get_hash_code();
        }
      };
    };

    typedef hash_map<trait_acct> acct_map_t;
    typedef std::vector<acct>    acct_vec_t;

    bool compile_msg( msg_version, const pub_key& fee_payer,
                      const hash& recent_hash,
                      const instruction_vec_t&, message& );
    void add_acct( const pub_key&, bool is_signer, bool is_writable );
    uint8_t get_idx( const pub_key& );

    acct_map_t amap_;
    acct_vec_t avec_;
  };

  inline message_header::message_header()
  : num_required_sigs_( 0 ),
    num_readonly_signed_( 0 ),
    num_readonly_unsigned_( 0 )
  {
  }

  inline bool message_header::operator==( const message_header& obj ) const
  {
    return num_required_sigs_ == obj.num_required_sigs_ &&
           num_readonly_signed_ == obj.num_readonly_signed_ &&
           num_readonly_unsigned_ == obj.num_readonly_unsigned_;
  }

  inline bool lookup_ref::operator==( const lookup_ref& obj ) const
  {
    return table_ == obj.table_ &&
           writable_ == obj.writable_ &&
           readonly_ == obj.readonly_;
  }

  inline msg_version message::get_version() const
  {
    return ver_;
  }

  inline void message::set_version( msg_version ver )
  {
    ver_ = ver;
  }

  inline message_header& message::get_header()
  {
    return hdr_;
  }

  inline const message_header& message::get_header() const
  {
    return hdr_;
  }

  inline key_vec_t& message::get_keys()
  {
    return keys_;
  }

  inline const key_vec_t& message::get_keys() const
  {
    return keys_;
  }

  inline hash& message::get_recent_hash()
  {
    return bhash_;
  }

  inline const hash& message::get_recent_hash() const
  {
    return bhash_;
  }

  inline compiled_vec_t& message::get_instructions()
  {
    return ixs_;
  }

  inline const compiled_vec_t& message::get_instructions() const
  {
    return ixs_;
  }

  inline lookup_vec_t& message::get_lookups()
  {
    return lookups_;
  }

  inline const lookup_vec_t& message::get_lookups() const
  {
    return lookups_;
  }

}
