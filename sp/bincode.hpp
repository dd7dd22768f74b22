#pragma once

#include <sp/key_pair.hpp>
#include <stdint.h>

namespace sp
{

  // binary serialization in the spirit of rust bincode convention
  // (little-endian integers, compact-u16 array lengths)
  class bincode
  {
  public:
    bincode( char* );
    size_t size() const;

    // current write position
    size_t get_pos() const;

    // reserve slot for signature
    size_t reserve_sign();

    // sign message at position sig for message starting at position msg
    bool sign( size_t sig, size_t msg, const key_pair& );

    // add values to buffer
    void add( uint8_t );
    void add( uint16_t );
    void add( uint32_t );
    void add( uint64_t );
    void add( int32_t );
    void add( int64_t );
    void add( const pub_key& );
    void add( const hash& );
    void add( const char *, size_t );

    // add (fixed) array length encoding
    template<unsigned N> void add_len();
    void add_len( unsigned );

    // size of compact-u16 length encoding
    static size_t len_size( unsigned );

  private:
    template<class T> void add_val_T( T val );
    char  *buf_;
    size_t idx_;
  };

  // bounds-checked little-endian reader of account data
  class bin_rdr
  {
  public:
    bin_rdr( const char *buf, size_t len );

    // read values (false on buffer underflow)
    bool get( uint8_t& );
    bool get( uint32_t& );
    bool get( uint64_t& );
    bool get( int64_t& );
    bool get( hash& );
    bool skip( size_t );

    size_t get_pos() const;
    size_t get_left() const;

  private:
    template<class T> bool get_val_T( T& val );
    const char *buf_;
    size_t      len_;
    size_t      idx_;
  };

  inline bincode::bincode( char *buf )
  : buf_( buf ), idx_( 0 ) {
  }

  inline size_t bincode::size() const
  {
    return idx_;
  }

  inline size_t bincode::get_pos() const
  {
    return idx_;
  }

  inline void bincode::add( uint8_t val )
  {
    buf_[idx_++] = val;
  }

  template<class T>
  void bincode::add_val_T( T val )
  {
    __builtin_memcpy( &buf_[idx_], &val, sizeof( T ) );
    idx_ += sizeof( T );
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
    add_val_T( val );
  }

  inline void bincode::add( int64_t val )
  {
    add_val_T( val );
  }

  inline void bincode::add( const pub_key& pk )
  {
    add( (const hash&)pk );
  }

  inline void bincode::add( const hash& pk )
  {
    __builtin_memcpy( &buf_[idx_], pk.data(), hash::len );
    idx_ += hash::len;
  }

  inline void bincode::add( const char *buf, size_t len )
  {
    __builtin_memcpy( &buf_[idx_], buf, len );
    idx_ += len;
  }

  template<unsigned N> void bincode::add_len()
  {
    static_assert( N <= 0xffff );
    add_len( N );
  }

  inline void bincode::add_len( unsigned N )
  {
    for(;;) {
      uint8_t elem = (uint8_t)(N&0x7f);
      N >>= 7;
      if ( N == 0 ) {
        buf_[idx_++] = (char)elem;
        break;
      }
      buf_[idx_++] = (char)(0x80 | elem);
    }
  }

  inline size_t bincode::len_size( unsigned N )
  {
    return N < 0x80 ? 1 : ( N < 0x4000 ? 2 : 3 );
  }

  inline size_t bincode::reserve_sign()
  {
    size_t idx = idx_;
    __builtin_memset( &buf_[idx_], 0, signature::len );
    idx_ += signature::len;
    return idx;
  }

  inline bool bincode::sign( size_t sig, size_t msg, const key_pair& kp )
  {
    signature sg;
    if ( !sg.sign( (const uint8_t*)&buf_[msg], idx_ - msg, kp ) ) {
      return false;
    }
    __builtin_memcpy( &buf_[sig], sg.data(), signature::len );
    return true;
  }

  inline bin_rdr::bin_rdr( const char *buf, size_t len )
  : buf_( buf ), len_( len ), idx_( 0 ) {
  }

  template<class T>
  bool bin_rdr::get_val_T( T& val )
  {
    if ( len_ - idx_ < sizeof( T ) ) {
      return false;
    }
    __builtin_memcpy( &val, &buf_[idx_], sizeof( T ) );
    idx_ += sizeof( T );
    return true;
  }

  inline bool bin_rdr::get( uint8_t& val )
  {
    return get_val_T( val );
  }

  inline bool bin_rdr::get( uint32_t& val )
  {
    return get_val_T( val );
  }

  inline bool bin_rdr::get( uint64_t& val )
  {
    return get_val_T( val );
  }

  inline bool bin_rdr::get( int64_t& val )
  {
    return get_val_T( val );
  }

  inline bool bin_rdr::get( hash& val )
  {
    if ( len_ - idx_ < hash::len ) {
      return false;
    }
    val.init_from_buf( (const uint8_t*)&buf_[idx_] );
    idx_ += hash::len;
    return true;
  }

  inline bool bin_rdr::skip( size_t len )
  {
    if ( len_ - idx_ < len ) {
      return false;
    }
    idx_ += len;
    return true;
  }

  inline size_t bin_rdr::get_pos() const
  {
    return idx_;
  }

  inline size_t bin_rdr::get_left() const
  {
    return len_ - idx_;
  }

}
