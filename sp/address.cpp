#include "address.hpp"
#include <openssl/evp.h>
#include <openssl/bn.h>

using namespace sp;

static const char pda_marker[] = "ProgramDerivedAddress";

namespace sp
{

  // field arithmetic context for the curve25519 decompression check
  class curve_ctx
  {
  public:
    curve_ctx();
    ~curve_ctx();
    bool is_on_curve( const uint8_t *enc );
  private:
    BN_CTX *cx_;
    BIGNUM *p_;    // 2^255 - 19
    BIGNUM *d_;    // -121665/121666 mod p
    BIGNUM *e_;    // (p-1)/2
  };

}

curve_ctx::curve_ctx()
: cx_( BN_CTX_new() ),
  p_( BN_new() ),
  d_( BN_new() ),
  e_( BN_new() )
{
  BIGNUM *t = BN_new();
  BN_one( p_ );
  BN_lshift( p_, p_, 255 );
  BN_sub_word( p_, 19 );
  BN_copy( e_, p_ );
  BN_sub_word( e_, 1 );
  BN_rshift1( e_, e_ );
  BN_set_word( t, 121666 );
  BN_mod_inverse( d_, t, p_, cx_ );
  BN_copy( t, p_ );
  BN_sub_word( t, 121665 );
  BN_mod_mul( d_, d_, t, p_, cx_ );
  BN_free( t );
}

curve_ctx::~curve_ctx()
{
  BN_free( e_ );
  BN_free( d_ );
  BN_free( p_ );
  BN_CTX_free( cx_ );
}

bool curve_ctx::is_on_curve( const uint8_t *enc )
{
  // y coordinate is little-endian with the sign of x in the top bit
  uint8_t ybuf[hash::len];
  __builtin_memcpy( ybuf, enc, hash::len );
  ybuf[hash::len-1] &= 0x7f;

  BN_CTX_start( cx_ );
  BIGNUM *y  = BN_CTX_get( cx_ );
  BIGNUM *yy = BN_CTX_get( cx_ );
  BIGNUM *u  = BN_CTX_get( cx_ );
  BIGNUM *v  = BN_CTX_get( cx_ );
  BIGNUM *r  = BN_CTX_get( cx_ );
  bool res = false;
  if ( r && BN_lebin2bn( ybuf, hash::len, y ) &&
       BN_nnmod( y, y, p_, cx_ ) &&
       BN_mod_sqr( yy, y, p_, cx_ ) ) {
    // x^2 = (y^2 - 1) / (d*y^2 + 1)
    BN_copy( u, yy );
    BN_mod_sub( u, u, BN_value_one(), p_, cx_ );
    BN_mod_mul( v, d_, yy, p_, cx_ );
    BN_mod_add( v, v, BN_value_one(), p_, cx_ );
    if ( BN_is_zero( u ) ) {
      res = true;
    } else if ( BN_mod_inverse( v, v, p_, cx_ ) ) {
      // euler criterion for x^2
      BN_mod_mul( r, u, v, p_, cx_ );
      BN_mod_exp( r, r, e_, p_, cx_ );
      res = BN_is_one( r );
    }
  }
  BN_CTX_end( cx_ );
  return res;
}

namespace sp
{

  bool is_on_curve( const hash& pk )
  {
    static curve_ctx cx;
    return cx.is_on_curve( pk.data() );
  }

  bool sha256( const str parts[], unsigned num_parts, hash& res )
  {
    uint8_t md[EVP_MAX_MD_SIZE];
    unsigned md_len = 0;
    EVP_MD_CTX *mctx = EVP_MD_CTX_new();
    int rc = EVP_DigestInit_ex( mctx, EVP_sha256(), NULL );
    for( unsigned i=0; rc && i != num_parts; ++i ) {
      rc = EVP_DigestUpdate( mctx, parts[i].str_, parts[i].len_ );
    }
    if ( rc ) {
      rc = EVP_DigestFinal_ex( mctx, md, &md_len );
    }
    EVP_MD_CTX_free( mctx );
    if ( rc != 1 || md_len != hash::len ) {
      return false;
    }
    res.init_from_buf( md );
    return true;
  }

  bool create_program_address( const str seeds[], unsigned num_seeds,
                               const pub_key& program, pub_key& res )
  {
    if ( num_seeds > SP_MAX_SEEDS ) {
      return false;
    }
    str parts[SP_MAX_SEEDS+2];
    for( unsigned i=0; i != num_seeds; ++i ) {
      if ( seeds[i].len_ > SP_MAX_SEED_LEN ) {
        return false;
      }
      parts[i] = seeds[i];
    }
    parts[num_seeds] = str( program.data(), pub_key::len );
    parts[num_seeds+1] = str( pda_marker, sizeof( pda_marker ) - 1 );
    hash hres;
    if ( !sha256( parts, num_seeds + 2, hres ) || is_on_curve( hres ) ) {
      return false;
    }
    res.init_from_buf( hres.data() );
    return true;
  }

  bool find_program_address( const str seeds[], unsigned num_seeds,
                             const pub_key& program,
                             pub_key& res, uint8_t& bump )
  {
    if ( num_seeds >= SP_MAX_SEEDS ) {
      return false;
    }
    str bseeds[SP_MAX_SEEDS];
    for( unsigned i=0; i != num_seeds; ++i ) {
      bseeds[i] = seeds[i];
    }
    uint8_t bump_seed[1];
    bseeds[num_seeds] = str( bump_seed, 1 );
    for( int b = 255; b >= 0; --b ) {
      bump_seed[0] = (uint8_t)b;
      if ( create_program_address( bseeds, num_seeds+1, program, res ) ) {
        bump = bump_seed[0];
        return true;
      }
    }
    return false;
  }

}
