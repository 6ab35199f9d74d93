#pragma once

#include <sp/key_pair.hpp>
#include <sp/short_vec.hpp>
#include <sp/error.hpp>
#include <stdint.h>
#include <vector>

namespace sp
{

  // binary serialization in the spirit of rust bincode convention
  // integers are written little-endian, lengths as compact-u16
  class bincode
  {
  public:
    bincode();

    const uint8_t *get_buf() const;
    size_t size() const;
    void reset();

    // move encoded bytes out, leaving the writer empty
    void detach( std::vector<uint8_t>& );

    // add values to buffer
    void add( uint8_t );
    void add( uint16_t );
    void add( uint32_t );
    void add( uint64_t );
    void add( int32_t );
    void add( int64_t );
    void add( const hash& );
    void add( const signature& );
    void add( const uint8_t *, size_t );
    void add( const std::vector<uint8_t>& );

    // add compact-u16 length encoding
    void add_len( uint16_t );

  private:
    template<class T> void add_val_T( T val );
    std::vector<uint8_t> buf_;
  };

  // bounds-checked reader of bincode encoded buffers
  // every failure records the byte offset of the failing field
  class bindecode : public error
  {
  public:
    bindecode( const uint8_t *buf, size_t len );

    size_t get_pos() const;
    size_t get_remaining() const;
    bool is_end() const;

    // peek next byte without consuming it
    bool peek( uint8_t&, const char *what );

    bool get( uint8_t&, const char *what );
    bool get( hash&, const char *what );
    bool get( signature&, const char *what );
    bool get_len( uint16_t&, const char *what );
    bool get_bytes( size_t n, std::vector<uint8_t>&, const char *what );

    // n elements of at least elem_size bytes each fit the remaining input
    bool check_count( size_t n, size_t elem_size, const char *what );

  private:
    bool check( size_t need, const char *what );
    const uint8_t *buf_;
    size_t         len_;
    size_t         idx_;
  };

  inline bincode::bincode()
  {
  }

  inline const uint8_t *bincode::get_buf() const
  {
    return buf_.data();
  }

  inline size_t bincode::size() const
  {
    return buf_.size();
  }

  inline void bincode::reset()
  {
    buf_.clear();
  }

  inline void bincode::detach( std::vector<uint8_t>& res )
  {
    res.swap( buf_ );
    buf_.clear();
  }

  inline void bincode::add( uint8_t val )
  {
    buf_.push_back( val );
  }

  template<class T>
  void bincode::add_val_T( T val )
  {
    for( size_t i = 0; i != sizeof( T ); ++i ) {
      buf_.push_back( (uint8_t)( val >> ( 8 * i ) ) );
    }
  }

  inline void bincode::add( uint16_t val )
  {
    add_val_T( val );
  }

  inline void bincode::add( uint32_t val )
  {
    add_val_T( val );
  }

  inline void bincode::add( uint64_t val )
  {
    add_val_T( val );
  }

  inline void bincode::add( int32_t val )
  {
    add_val_T( (uint32_t)val );
  }

  inline void bincode::add( int64_t val )
  {
    add_val_T( (uint64_t)val );
  }

  inline void bincode::add( const hash& pk )
  {
    add( pk.data(), hash::len );
  }

  inline void bincode::add( const signature& sig )
  {
    add( sig.data(), signature::len );
  }

  inline void bincode::add( const uint8_t *buf, size_t len )
  {
    buf_.insert( buf_.end(), buf, buf + len );
  }

  inline void bincode::add( const std::vector<uint8_t>& buf )
  {
    buf_.insert( buf_.end(), buf.begin(), buf.end() );
  }

  inline void bincode::add_len( uint16_t len )
  {
    uint8_t buf[short_vec::max_len];
    add( buf, short_vec::encode( len, buf ) );
  }

  inline bindecode::bindecode( const uint8_t *buf, size_t len )
  : buf_( buf ),
    len_( len ),
    idx_( 0 )
  {
  }

  inline size_t bindecode::get_pos() const
  {
    return idx_;
  }

  inline size_t bindecode::get_remaining() const
  {
    return len_ - idx_;
  }

  inline bool bindecode::is_end() const
  {
    return idx_ == len_;
  }

  inline bool bindecode::check( size_t need, const char *what )
  {
    if ( SP_UNLIKELY( need > len_ - idx_ ) ) {
      return set_err( err_code::e_truncated,
          std::string( "truncated input reading " ) + what +
          " [offset=" + std::to_string( idx_ ) +
          " need=" + std::to_string( need ) +
          " have=" + std::to_string( len_ - idx_ ) + "]" );
    }
    return true;
  }

  inline bool bindecode::check_count(
      size_t n, size_t elem_size, const char *what )
  {
    return check( n * elem_size, what );
  }

  inline bool bindecode::peek( uint8_t& val, const char *what )
  {
    if ( !check( 1, what ) ) {
      return false;
    }
    val = buf_[idx_];
    return true;
  }

  inline bool bindecode::get( uint8_t& val, const char *what )
  {
    if ( !check( 1, what ) ) {
      return false;
    }
    val = buf_[idx_++];
    return true;
  }

  inline bool bindecode::get( hash& val, const char *what )
  {
    if ( !check( hash::len, what ) ) {
      return false;
    }
    val.init_from_buf( &buf_[idx_] );
    idx_ += hash::len;
    return true;
  }

  inline bool bindecode::get( signature& val, const char *what )
  {
    if ( !check( signature::len, what ) ) {
      return false;
    }
    val.init_from_buf( &buf_[idx_] );
    idx_ += signature::len;
    return true;
  }

  inline bool bindecode::get_len( uint16_t& val, const char *what )
  {
    size_t nbytes = 0;
    err_code ec = short_vec::decode( &buf_[idx_], len_ - idx_, val, nbytes );
    if ( SP_UNLIKELY( ec != err_code::e_ok ) ) {
      return set_err( ec, std::string( ec == err_code::e_truncated ?
            "truncated length of " : "malformed length of " ) + what +
          " [offset=" + std::to_string( idx_ ) + "]" );
    }
    idx_ += nbytes;
    return true;
  }

  inline bool bindecode::get_bytes(
      size_t n, std::vector<uint8_t>& res, const char *what )
  {
    if ( !check( n, what ) ) {
      return false;
    }
    res.assign( &buf_[idx_], &buf_[idx_] + n );
    idx_ += n;
    return true;
  }

}
