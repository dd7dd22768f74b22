#include "key_pair.hpp"
#include "jtree.hpp"
#include "mem_map.hpp"
#include "misc.hpp"
#include <openssl/evp.h>
#include <ctype.h>

using namespace sp;

// decode base58 text into exactly n bytes
static bool dec_base58_exact( const char *txt, size_t len,
                              uint8_t *tgt, size_t n )
{
  if ( len == 0 || len > 128 ) {
    return false;
  }
  uint8_t buf[256];
  int rc = sp::dec_base58( (const uint8_t*)txt, (int)len, buf );
  if ( rc != (int)n ) {
    return false;
  }
  __builtin_memcpy( tgt, buf, n );
  return true;
}

///////////////////////////////////////////////////////////////////////////
// hash

hash::hash()
{
  zero();
}

hash::hash( const hash& obj )
{
  *this = obj;
}

hash& hash::operator=( const hash& obj )
{
  i_[0] = obj.i_[0];
  i_[1] = obj.i_[1];
  i_[2] = obj.i_[2];
  i_[3] = obj.i_[3];
  return *this;
}

bool hash::operator==( const hash& obj) const
{
  return i_[0] == obj.i_[0] &&
    i_[1] == obj.i_[1] &&
    i_[2] == obj.i_[2] &&
    i_[3] == obj.i_[3];
}

bool hash::operator!=( const hash& obj) const
{
  return i_[0] != obj.i_[0] ||
    i_[1] != obj.i_[1] ||
    i_[2] != obj.i_[2] ||
    i_[3] != obj.i_[3];
}

void hash::zero()
{
  i_[0] = i_[1] = i_[2] = i_[3] = 0UL;
}

bool hash::get_is_zero() const
{
  return 0UL == ( i_[0] | i_[1] | i_[2] | i_[3] );
}

bool hash::init_from_file( const std::string& file )
{
  mem_map mp;
  mp.set_file( file );
  if ( !mp.init() ) {
    return false;
  }
  // ignore trailing whitespace
  size_t tlen = mp.size();
  const char *txt = mp.data();
  while( tlen && isspace( txt[tlen-1] ) ) --tlen;
  return dec_base58_exact( txt, tlen, pk_, len );
}

bool hash::init_from_text( const std::string& buf )
{
  return dec_base58_exact( buf.c_str(), buf.length(), pk_, len );
}

bool hash::init_from_text( str buf )
{
  return dec_base58_exact( buf.str_, buf.len_, pk_, len );
}

void hash::init_from_buf( const uint8_t *pk )
{
  __builtin_memcpy( pk_, pk, len );
}

int hash::enc_base58( uint8_t *buf, uint32_t buflen ) const
{
  return sp::enc_base58( pk_, len, buf, buflen );
}

int hash::enc_base58( std::string& res ) const
{
  uint8_t buf[64];
  int n = enc_base58( buf, 64 );
  res.assign( (const char*)buf, static_cast< unsigned >( n ) );
  return n;
}

std::string hash::enc_base58() const
{
  std::string res;
  enc_base58( res );
  return res;
}

int hash::dec_base58( const uint8_t *buf, uint32_t buflen )
{
  if ( !dec_base58_exact( (const char*)buf, buflen, pk_, len ) ) {
    zero();
    return 0;
  }
  return len;
}

///////////////////////////////////////////////////////////////////////////
// pub_key

pub_key::pub_key()
{
}

pub_key::pub_key( const pub_key& obj )
: hash( obj )
{
}

pub_key::pub_key( const key_pair& kp )
{
  kp.get_pub_key( *this );
}

pub_key& pub_key::operator=( const pub_key& pk )
{
  return (pub_key&)hash::operator=( pk );
}

///////////////////////////////////////////////////////////////////////////
// key_pair

void key_pair::gen()
{
  EVP_PKEY *pkey = NULL;
  EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, NULL);
  EVP_PKEY_keygen_init(pctx);
  EVP_PKEY_keygen(pctx, &pkey);
  EVP_PKEY_CTX_free(pctx);
  size_t len[] = { pub_key::len };
  EVP_PKEY_get_raw_private_key( pkey, pk_, len );
  len[0] = pub_key::len;
  EVP_PKEY_get_raw_public_key( pkey, &pk_[pub_key::len], len );
  EVP_PKEY_free( pkey );
}

void key_pair::zero()
{
  __builtin_memset( pk_, 0, len );
}

bool key_pair::init_from_file( const std::string& file )
{
  mem_map mp;
  mp.set_file( file );
  if ( !mp.init() ) {
    return false;
  }
  return init_from_json( mp.data(), mp.size() );
}

bool key_pair::init_from_json( const std::string& buf )
{
  return init_from_json( buf.c_str(), buf.length() );
}

bool key_pair::init_from_json( const char *buf, size_t len )
{
  jtree jt;
  jt.parse( buf, len );
  if ( !jt.is_valid() || jt.get_type( 1 ) != jtree::e_arr ||
       jt.get_num( 1 ) != key_pair::len ) {
    return false;
  }
  uint8_t *pk = pk_;
  for( uint32_t it = jt.get_first(1); it; it = jt.get_next( it ) ) {
    uint64_t val = jt.get_uint( it );
    if ( val > 0xff ) {
      zero();
      return false;
    }
    *pk++ = (uint8_t)val;
  }
  return true;
}

void key_pair::get_pub_key( pub_key& pk ) const
{
  pk.init_from_buf( &pk_[pub_key::len] );
}

///////////////////////////////////////////////////////////////////////////
// signature

signature::signature()
{
  __builtin_memset( sig_, 0, len );
}

bool signature::operator==( const signature& obj ) const
{
  return 0 == __builtin_memcmp( sig_, obj.sig_, len );
}

void signature::init_from_buf( const uint8_t *buf )
{
  __builtin_memcpy( sig_, buf, len );
}

bool signature::init_from_text( const std::string& buf )
{
  return dec_base58_exact( buf.c_str(), buf.length(), sig_, len );
}

bool signature::init_from_text( str buf )
{
  return dec_base58_exact( buf.str_, buf.len_, sig_, len );
}

int signature::enc_base58( uint8_t *buf, uint32_t buflen ) const
{
  return sp::enc_base58( sig_, len, buf, buflen );
}

int signature::enc_base58( std::string& res ) const
{
  uint8_t buf[256];
  int n = enc_base58( buf, 256 );
  res.assign( (const char*)buf, static_cast< unsigned >( n ) );
  return n;
}

std::string signature::enc_base58() const
{
  std::string res;
  enc_base58( res );
  return res;
}

bool signature::sign(
    const uint8_t* msg, uint32_t msg_len, const key_pair& kp )
{
  EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key( EVP_PKEY_ED25519,
      NULL, kp.data(), pub_key::len );
  if ( !pkey ) {
    return false;
  }
  EVP_MD_CTX *mctx = EVP_MD_CTX_new();
  int rc = EVP_DigestSignInit( mctx, NULL, NULL, NULL, pkey );
  if ( rc ) {
    size_t sig_len[1] = { len };
    rc = EVP_DigestSign( mctx, sig_, sig_len, msg, msg_len );
  }
  EVP_MD_CTX_free( mctx );
  EVP_PKEY_free( pkey );
  return rc == 1;
}

bool signature::verify(
    const uint8_t* msg, uint32_t msg_len, const pub_key& pk ) const
{
  EVP_PKEY *pkey = EVP_PKEY_new_raw_public_key( EVP_PKEY_ED25519,
      NULL, pk.data(), pub_key::len );
  if ( !pkey ) {
    return false;
  }
  EVP_MD_CTX *mctx = EVP_MD_CTX_new();
  int rc = EVP_DigestVerifyInit( mctx, NULL, NULL, NULL, pkey );
  if ( rc ) {
    rc = EVP_DigestVerify( mctx, sig_, len, msg, msg_len );
  }
  EVP_MD_CTX_free( mctx );
  EVP_PKEY_free( pkey );
  return rc == 1;
}
