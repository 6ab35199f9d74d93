#pragma once

#include <sp/misc.hpp>
#include <string>

namespace sp
{

  class key_pair;

  // 32-byte value (block hash, base of public key)
  class hash
  {
  public:
    static const size_t len = 32;
    hash();
    hash( const hash& );
    hash& operator=( const hash& );
    bool operator==( const hash& )const;
    bool operator!=( const hash& )const;
    bool operator<( const hash& )const;
    void zero();
    bool is_zero() const;

    // initialize from base58 encoded text
    bool init_from_text( const std::string& buf );
    bool init_from_text( str buf );
    void init_from_buf( const uint8_t * );

    // encode to text buffer
    int enc_base58( uint8_t *buf, uint32_t buflen ) const;
    int enc_base58( std::string& ) const;
    std::string to_base58() const;

    // get underlying bytes
    const uint8_t *data() const;

    // bucket index for hash_map traits
    uint64_t get_hash_code() const;

  protected:
    union{ uint64_t i_[4]; uint8_t pk_[len]; };
  };

  // public key or any other account address
  class pub_key : public hash
  {
  public:
    pub_key();
    pub_key( const pub_key& );
    pub_key( const key_pair& );
    pub_key& operator=( const pub_key& );
  };

  // private/public key pair
  class key_pair
  {
  public:
    static const size_t len = 64;

    key_pair();
    void zero();

    // generate new keypair
    bool gen();

    // initialize from json-format key file used by solana
    bool init_from_file( const std::string& file );
    bool init_from_json( const char *buf, size_t len );
    bool init_from_json( const std::string& buf );

    // get public key part of pair
    void get_pub_key( pub_key& ) const;

    // get underlying bytes
    const uint8_t *data() const;

  private:
    uint8_t pk_[len];
  };

  // digital signature
  class signature
  {
  public:

    static const size_t len = 64;

    signature();
    bool operator==( const signature& )const;
    bool operator!=( const signature& )const;
    void zero();
    bool is_zero() const;

    // initialize from raw bytes or bas58 encoded text
    void init_from_buf( const uint8_t * );
    bool init_from_text( const std::string& buf );

    // encode to text buffer
    int enc_base58( uint8_t *buf, uint32_t buflen ) const;
    int enc_base58( std::string& ) const;

    // sign message given key_pair
    bool sign( const uint8_t* msg, size_t msg_len,
               const key_pair& );

    // verify message given public key
    bool verify( const uint8_t* msg, size_t msg_len,
                 const pub_key& ) const;

    // get underlying bytes
    const uint8_t *data() const;

  private:
    uint8_t sig_[len];
  };

  // capability to sign on behalf of one address
  class signer
  {
  public:
    virtual ~signer();
    virtual const pub_key& get_pub_key() const = 0;
    virtual bool sign( const uint8_t *msg, size_t msg_len, signature& ) = 0;
  };

  // signer backed by an in-memory key_pair
  class key_signer : public signer
  {
  public:
    explicit key_signer( const key_pair& );
    const pub_key& get_pub_key() const override;
    bool sign( const uint8_t *msg, size_t msg_len, signature& ) override;
  private:
    const key_pair& kp_;
    pub_key         pk_;
  };

  inline const uint8_t *hash::data() const
  {
    return pk_;
  }

  inline uint64_t hash::get_hash_code() const
  {
    return i_[0];
  }

  inline const uint8_t *key_pair::data() const
  {
    return pk_;
  }

  inline const uint8_t *signature::data() const
  {
    return sig_;
  }

}
