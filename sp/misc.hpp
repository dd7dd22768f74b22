#pragma once

#include <stdint.h>
#include <string>

#define SP_NSECS_IN_SEC     1000000000L
#define SP_NSECS_IN_MSEC    1000000L
#define SP_LAMPORTS_PER_SOL 1000000000UL
#define SP_SOL_DECIMALS     9

namespace sp
{

  // base58 encoding from base-x conversion impl.
  // dec_base58 returns -1 on characters outside the alphabet
  int enc_base58( const uint8_t *src, int len, uint8_t *result, int rlen);
  int dec_base58( const uint8_t *str, int len, uint8_t *result );

  // base64 encoding courtesy of
  // Adam Rudd per licence: github.com/adamvr/arduino-base64
  int enc_base64_len( int len );
  int enc_base64( const uint8_t *src, int len, uint8_t *result );
  int dec_base64( const uint8_t *str, int len, uint8_t *result );

  // integer to string encoding
  char *uint_to_str( uint64_t val, char *end_ptr );
  uint64_t str_to_uint( const char *str, int len );
  int64_t str_to_int( const char *str, int len );

  // strict parse of a whole command-line argument; false on any
  // character outside the format or on overflow
  bool str_to_num( const char *str, uint64_t& res );

  // sol amount with up to 9 decimal places e.g. 1.5 to lamports
  bool str_to_lamports( const char *str, uint64_t& res );

  // lamports as decimal sol amount e.g. 1.500000000
  std::string lamports_to_str( uint64_t lamports );

  // current time
  int64_t get_now();
  char *nsecs_to_utc6( int64_t ts, char *cptr );

  // split host[:port] with well-known cluster names expanded
  std::string get_host_port( const std::string& host, int& port );

  // string as char pointer plus length
  struct str
  {
    str();
    str( const char * );
    str( const char *, size_t );
    str( const uint8_t *, size_t );
    str( const std::string& );
    bool operator==( const str& ) const;
    const char *str_;
    size_t      len_;
  };

  /////////////////////////////////////////////////////////////////////////
  // inline impl

  inline str::str()
  : str_( "" ), len_( 0 ) {
  }

  inline str::str( const char *str )
  : str_( str ), len_( __builtin_strlen( str ) ) {
  }

  inline str::str( const char *str, size_t len )
  : str_( str ), len_( len ) {
  }

  inline str::str( const uint8_t *str, size_t len )
  : str_( (const char*)str ), len_( len ) {
  }

  inline str::str( const std::string& str )
  : str_( str.c_str() ), len_( str.length() ) {
  }

  inline bool str::operator==( const str& obj ) const
  {
    return len_ == obj.len_ &&
           0 == __builtin_strncmp( str_, obj.str_, len_);
  }

}
