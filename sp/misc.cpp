#include "misc.hpp"
#include <ctype.h>
#include <time.h>
#include <vector>

namespace sp
{

static const char * const ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
static const int8_t ALPHABET_MAP[256] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1,  0,  1,  2,  3,  4,  5,  6,  7,  8, -1, -1, -1, -1, -1, -1,
    -1,  9, 10, 11, 12, 13, 14, 15, 16, -1, 17, 18, 19, 20, 21, -1,
    22, 23, 24, 25, 26, 27, 28, 29, 30, 31, 32, -1, -1, -1, -1, -1,
    -1, 33, 34, 35, 36, 37, 38, 39, 40, 41, 42, 43, -1, 44, 45, 46,
    47, 48, 49, 50, 51, 52, 53, 54, 55, 56, 57, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
};

// reslen is the allocated length for result, feel free to overallocate
int enc_base58( const uint8_t *source, int len, uint8_t *result, int reslen )
{
  int zeros = 0, length = 0, pbegin = 0, pend;
  if ( !(pend = len) ) return 0;
  while ( pbegin != pend && !source[pbegin] ) pbegin = ++zeros;
  // log(256)/log(58), rounded up
  int size = ( pend - pbegin ) * 138 / 100 + 1;
  std::vector<uint8_t> b58( size, 0 );
  while ( pbegin != pend ) {
    uint32_t carry = source[pbegin];
    int i = 0;
    for ( int it1 = size - 1; (carry || i < length) && (it1 != -1); it1--,i++ ) {
      carry += 256 * b58[it1];
      b58[it1] = carry % 58;
      carry /= 58;
    }
    if ( carry ) return 0;
    length = i;
    pbegin++;
  }
  int it2 = size - length;
  while ( it2 != size && !b58[it2] ) it2++;
  if ( (zeros + size - it2 + 1) > reslen ) return 0;
  int ri = 0;
  while( ri < zeros ) result[ri++] = '1';
  for (; it2 < size; ++it2 ) result[ri++] = ALPHABET[b58[it2]];
  result[ri] = 0;
  return ri;
}

int dec_base58( const uint8_t *str, int len, uint8_t *result, int reslen )
{
  int zeros = 0, length = 0, pbegin = 0;
  while ( pbegin != len && str[pbegin] == '1' ) pbegin = ++zeros;
  // log(58)/log(256), rounded up
  int size = ( len - pbegin ) * 733 / 1000 + 1;
  std::vector<uint8_t> b256( size, 0 );
  for(; pbegin != len; ++pbegin ) {
    int carry = ALPHABET_MAP[str[pbegin]];
    if ( carry < 0 ) return -1;
    int i = 0;
    for ( int it1 = size - 1; (carry || i < length) && (it1 != -1); it1--,i++ ) {
      carry += 58 * b256[it1];
      b256[it1] = carry % 256;
      carry /= 256;
    }
    if ( carry ) return -1;
    length = i;
  }
  int it2 = size - length;
  while ( it2 != size && !b256[it2] ) it2++;
  if ( (zeros + size - it2) > reslen ) return -1;
  int ri = 0;
  while( ri < zeros ) result[ri++] = 0;
  for (; it2 < size; ++it2 ) result[ri++] = b256[it2];
  return ri;
}

uint64_t str_to_uint( const char *val, int len )
{
  uint64_t res = 0L;
  if ( len ) {
    const char *cptr = val;
    const char *end = &val[len];
    for(; cptr != end; ++cptr ) {
      if ( isdigit( *cptr ) ) {
        res = res*10UL + (*cptr-'0');
      } else {
        res = 0L;
        break;
      }
    }
  }
  return res;
}

static const char b64_alphabet[] =
  "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
  "abcdefghijklmnopqrstuvwxyz"
  "0123456789+/";

inline void a3_to_a4( uint8_t* a4, uint8_t* a3 )
{
  a4[0] = (a3[0] & 0xfc) >> 2;
  a4[1] = ((a3[0] & 0x03) << 4) + ((a3[1] & 0xf0) >> 4);
  a4[2] = ((a3[1] & 0x0f) << 2) + ((a3[2] & 0xc0) >> 6);
  a4[3] = (a3[2] & 0x3f);
}

inline void a4_to_a3( uint8_t* a3, uint8_t* a4 )
{
  a3[0] = (a4[0] << 2) + ((a4[1] & 0x30) >> 4);
  a3[1] = ((a4[1] & 0xf) << 4) + ((a4[2] & 0x3c) >> 2);
  a3[2] = ((a4[2] & 0x3) << 6) + a4[3];
}

inline uint8_t b64_lookup( char c )
{
  if(c >='A' && c <='Z') return c - 'A';
  if(c >='a' && c <='z') return c - 71;
  if(c >='0' && c <='9') return c + 4;
  if(c == '+') return 62;
  if(c == '/') return 63;
  return -1;
}

int enc_base64_len( int n )
{
  return (n + 2 - ((n + 2) % 3)) / 3 * 4;
}

int enc_base64( const uint8_t *inp, int len, uint8_t *out )
{
  int i = 0, j = 0, enc_len = 0;
  uint8_t a3[3];
  uint8_t a4[4];

  while( len-- ) {
    a3[i++] = *(inp++);
    if ( i == 3 ) {
      a3_to_a4( a4, a3 );
      for( i = 0; i < 4; i++ ) {
        out[enc_len++] = b64_alphabet[a4[i]];
      }
      i = 0;
    }
  }

  if ( i ) {
    for( j = i; j < 3; j++ ) {
      a3[j] = '\0';
    }
    a3_to_a4( a4, a3 );
    for( j = 0; j < i + 1; j++ ) {
      out[enc_len++] = b64_alphabet[a4[j]];
    }
    while( i++ < 3 ) {
      out[enc_len++] = '=';
    }
  }
  return enc_len;
}

int dec_base64( const uint8_t *inp, int len, uint8_t *out )
{
  int i = 0, j = 0, dec_len = 0;
  uint8_t a3[3] = { 0,0,0 };
  uint8_t a4[4];

  // padding ends the data, any other non-alphabet byte is an error
  for( ; len && *inp != '='; --len, ++inp ) {
    a4[i] = b64_lookup( *inp );
    if ( a4[i++] > 63 ) {
      return -1;
    }
    if ( i == 4 ) {
      a4_to_a3( a3, a4 );
      for( i = 0; i < 3; i++ ) {
        out[dec_len++] = a3[i];
      }
      i = 0;
    }
  }
  for( ; len; --len, ++inp ) {
    if ( *inp != '=' ) {
      return -1;
    }
  }

  // a lone trailing character carries less than one byte
  if ( i == 1 ) {
    return -1;
  }
  if ( i ) {
    for( j = i; j < 4; j++ ) {
      a4[j] = 0;
    }
    a4_to_a3( a3, a4 );
    for( j = 0; j < i - 1; j++ ) {
      out[dec_len++] = a3[j];
    }
  }
  return dec_len;
}

int64_t get_now()
{
  struct timespec ts[1];
  clock_gettime( CLOCK_REALTIME, ts );
  int64_t res = ts->tv_sec;
  res *= 1000000000UL;
  res += ts->tv_nsec;
  return res;
}

static void uint_to_strn( char *cptr, int64_t val, int n )
{
  for( int i = n - 1; i >= 0; --i ) {
    cptr[i] = '0' + (val%10L);
    val /= 10L;
  }
}

char *nsecs_to_utc6( int64_t ts, char *cptr )
{
  int64_t nsecs = ts%SP_NSECS_IN_SEC;
  time_t secs = ts / SP_NSECS_IN_SEC;
  struct tm t[1];
  gmtime_r( &secs, t );
  uint_to_strn( &cptr[0], t->tm_year + 1900, 4 );
  uint_to_strn( &cptr[5], t->tm_mon + 1, 2 );
  uint_to_strn( &cptr[8], t->tm_mday, 2 );
  uint_to_strn( &cptr[11], t->tm_hour, 2 );
  uint_to_strn( &cptr[14], t->tm_min, 2 );
  uint_to_strn( &cptr[17], t->tm_sec, 2 );
  uint_to_strn( &cptr[20], nsecs/1000L, 6 );
  cptr[4] = cptr[7] = '-';
  cptr[10] = 'T';
  cptr[13] = cptr[16] = ':';
  cptr[19] = '.';
  cptr[26] = 'Z';
  cptr[27] = '\0';
  return cptr;
}

}
