#include <sp/transaction.hpp>
#include <sp/log.hpp>
#include "test_error.hpp"

using namespace sp;

static pub_key make_key( uint8_t id )
{
  uint8_t buf[pub_key::len];
  __builtin_memset( buf, id, sizeof( buf ) );
  pub_key pk;
  pk.init_from_buf( buf );
  return pk;
}

static const uint8_t *get_buf( const transaction& tx, size_t pos )
{
  return (const uint8_t*)tx.get_data() + pos;
}

void test_layout()
{
  key_pair payer, auth;
  payer.gen();
  auth.gen();
  pub_key payer_pk( payer ), auth_pk( auth );
  pub_key pgm = make_key( 1 ), wkey = make_key( 2 ), rkey = make_key( 3 );
  hash bhash = make_key( 9 );

  instruction ix;
  ix.set_program( pgm );
  ix.add_account( rkey, false, false );
  ix.add_account( wkey, false, true );
  ix.add_account( auth_pk, true, false );
  char data[] = { 4, 5, 6 };
  ix.set_data( data, sizeof( data ) );

  transaction tx;
  tx.set_fee_payer( &payer );
  tx.add_signer( &auth );
  tx.set_block_hash( bhash );
  tx.add( ix );
  SP_TEST_CHECK( tx.build() );

  // writable signers, readonly signers, writable, readonly
  SP_TEST_CHECK( tx.get_num_key() == 5 );
  SP_TEST_CHECK( tx.get_key( 0 ) == payer_pk );
  SP_TEST_CHECK( tx.get_key( 1 ) == auth_pk );
  SP_TEST_CHECK( tx.get_key( 2 ) == wkey );
  SP_TEST_CHECK( tx.get_key( 3 ) == rkey );
  SP_TEST_CHECK( tx.get_key( 4 ) == pgm );
  SP_TEST_CHECK( tx.get_num_signer() == 2 );
  SP_TEST_CHECK( tx.get_num_readonly_signed() == 1 );
  SP_TEST_CHECK( tx.get_num_readonly_unsigned() == 2 );

  // signatures cover the message that follows them
  size_t msg = 1 + 2*signature::len;
  SP_TEST_CHECK( get_buf( tx, 0 )[0] == 2 );
  const uint8_t *hdr = get_buf( tx, msg );
  SP_TEST_CHECK( hdr[0] == 2 && hdr[1] == 1 && hdr[2] == 2 );
  SP_TEST_CHECK( hdr[3] == 5 );
  uint32_t msg_len = tx.get_size() - msg;
  signature sig0, sig1;
  sig0.init_from_buf( get_buf( tx, 1 ) );
  sig1.init_from_buf( get_buf( tx, 1 + signature::len ) );
  SP_TEST_CHECK( sig0 == tx.get_signature() );
  SP_TEST_CHECK( sig0.verify( hdr, msg_len, payer_pk ) );
  SP_TEST_CHECK( sig1.verify( hdr, msg_len, auth_pk ) );
  SP_TEST_CHECK( !sig1.verify( hdr, msg_len, payer_pk ) );

  // block hash and compiled instruction
  size_t pos = 4 + 5*pub_key::len;
  hash chk;
  chk.init_from_buf( &hdr[pos] );
  SP_TEST_CHECK( chk == bhash );
  const uint8_t *ixp = &hdr[pos + hash::len];
  SP_TEST_CHECK( ixp[0] == 1 );
  SP_TEST_CHECK( ixp[1] == 4 );
  SP_TEST_CHECK( ixp[2] == 3 );
  SP_TEST_CHECK( ixp[3] == 3 && ixp[4] == 2 && ixp[5] == 1 );
  SP_TEST_CHECK( ixp[6] == 3 );
  SP_TEST_CHECK( ixp[7] == 4 && ixp[8] == 5 && ixp[9] == 6 );
  SP_TEST_CHECK( tx.get_size() == msg + pos + hash::len + 10 );
}

void test_merge_keys()
{
  // same key readonly in one instruction and writable in the next
  key_pair payer;
  payer.gen();
  pub_key pgm = make_key( 1 ), key = make_key( 2 );
  instruction ix1, ix2;
  ix1.set_program( pgm );
  ix1.add_account( key, false, false );
  ix2.set_program( pgm );
  ix2.add_account( key, false, true );
  ix2.add_account( pub_key( payer ), true, true );
  transaction tx;
  tx.set_fee_payer( &payer );
  tx.add( ix1 );
  tx.add( ix2 );
  SP_TEST_CHECK( tx.build() );
  SP_TEST_CHECK( tx.get_num_key() == 3 );
  SP_TEST_CHECK( tx.get_key( 1 ) == key );
  SP_TEST_CHECK( tx.get_num_signer() == 1 );
  SP_TEST_CHECK( tx.get_num_readonly_unsigned() == 1 );
  SP_TEST_CHECK( tx.get_num_instruction() == 2 );
}

void test_errors()
{
  key_pair payer, auth;
  payer.gen();
  auth.gen();
  pub_key pgm = make_key( 1 );
  instruction ix;
  ix.set_program( pgm );
  ix.add_account( pub_key( auth ), true, false );

  transaction tx;
  SP_TEST_CHECK( !tx.build() );
  tx.set_fee_payer( &payer );
  SP_TEST_CHECK( !tx.build() );
  SP_TEST_CHECK( tx.get_err_msg() == "no instructions in transaction" );

  // signer account without its key
  tx.add( ix );
  SP_TEST_CHECK( !tx.build() );
  SP_TEST_CHECK( tx.get_size() == 0 );
  tx.add_signer( &auth );
  SP_TEST_CHECK( tx.build() );

  // larger than one packet
  std::vector<char> big( 700, 1 );
  instruction bix;
  bix.set_program( pgm );
  bix.set_data( big.data(), big.size() );
  tx.clear();
  tx.add( bix );
  SP_TEST_CHECK( tx.build() );
  SP_TEST_CHECK( tx.get_size() <= transaction::max_size );
  tx.add( bix );
  SP_TEST_CHECK( !tx.build() );
  SP_TEST_CHECK( tx.get_size() == 0 );
}

int main( int, char** )
{
  log::set_level( SP_LOG_ERR_LVL );
  SP_TEST_START
  test_layout();
  test_merge_keys();
  test_errors();
  SP_TEST_END
  log::flush();
  return 0;
}
