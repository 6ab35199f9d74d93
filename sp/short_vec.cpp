#include "short_vec.hpp"

namespace sp
{
  namespace short_vec
  {

    size_t size( uint16_t val )
    {
      size_t n = 1;
      while( val >>= 7 ) {
        ++n;
      }
      return n;
    }

    size_t encode( uint16_t val, uint8_t *buf )
    {
      size_t n = 0;
      uint32_t rem = val;
      for(;;) {
        uint8_t elem = rem & 0x7f;
        rem >>= 7;
        if ( !rem ) {
          buf[n++] = elem;
          break;
        }
        buf[n++] = elem | 0x80;
      }
      return n;
    }

    err_code decode( const uint8_t *buf, size_t buflen,
                     uint16_t& val, size_t& nbytes )
    {
      uint32_t res = 0;
      for( size_t i = 0; i != max_len; ++i ) {
        if ( i == buflen ) {
          return err_code::e_truncated;
        }
        uint8_t elem = buf[i];
        bool done = !( elem & 0x80 );

        // a continuation bit on the last allowed byte means overlong input
        if ( i == max_len - 1 && !done ) {
          return err_code::e_malformed_len;
        }

        // zero group after a continuation bit is a padded encoding
        if ( elem == 0 && i != 0 ) {
          return err_code::e_malformed_len;
        }
        res |= (uint32_t)( elem & 0x7f ) << ( i * 7 );
        if ( res > 0xffffU ) {
          return err_code::e_malformed_len;
        }
        if ( done ) {
          val = (uint16_t)res;
          nbytes = i + 1;
          return err_code::e_ok;
        }
      }
      return err_code::e_malformed_len;
    }

  }
}
