#pragma once

#include <sp/error.hpp>
#include <stdint.h>
#include <stddef.h>

namespace sp
{

  // compact-u16 encoding of sequence lengths: 7 bits per byte,
  // least-significant group first, high bit set while more bytes follow
  namespace short_vec
  {

    // maximum bytes used by an encoded length
    static const size_t max_len = 3;

    // number of bytes needed to encode val
    size_t size( uint16_t val );

    // encode val to buf which must hold max_len bytes
    // returns number of bytes written
    size_t encode( uint16_t val, uint8_t *buf );

    // decode length from buf of buflen bytes
    // returns e_ok and sets val and number of bytes consumed,
    // e_truncated if buf ends before the last byte of the encoding or
    // e_malformed_len for overlong, overflowing or non-canonical input
    err_code decode( const uint8_t *buf, size_t buflen,
                     uint16_t& val, size_t& nbytes );

  }

}
