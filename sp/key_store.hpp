#pragma once

#include <sp/key_pair.hpp>
#include <sp/hash_map.hpp>
#include <sp/error.hpp>
#include <vector>

namespace sp
{

  // directory of solana-format json key files indexed by public key
  class key_store : public error
  {
  public:

    key_store();
    ~key_store();

    // create/chmod key_store directory
    bool create();

    // check directory permissions and load every *.json key file
    bool init();

    // directory where account keys are stored
    void set_dir( const std::string& dir_name );
    std::string get_dir() const;

    // file name used for key with given public key
    std::string get_key_pair_file( const pub_key& ) const;

    // generate, persist and index new key pair
    bool create_key_pair( pub_key& );

    // persist and index existing key pair
    bool add_key_pair( const key_pair& );

    // lookup by public key, nullptr if not in store
    const key_pair *get_key_pair( const pub_key& );
    signer *get_signer( const pub_key& );

    // every signer in load order
    void get_signers( std::vector<signer*>& );

    size_t size() const;

  private:

    struct entry
    {
      explicit entry( const key_pair& );
      key_pair   kp_;
      key_signer sgn_;
    };

    struct trait_key {
      static const size_t hsize_ = 127UL;
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

    typedef hash_map<trait_key>  key_map_t;
    typedef std::vector<entry*>  entry_vec_t;

    key_store( const key_store& );
    key_store& operator=( const key_store& );

    bool load_dir();
    void add_entry( const key_pair& );
    entry *find_entry( const pub_key& );
    void clear();

    std::string dir_;  // key store directory
    key_map_t   kmap_;
    entry_vec_t kvec_;
  };

  inline size_t key_store::size() const
  {
    return kvec_.size();
  }

}
