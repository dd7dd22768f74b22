#include <sp/rpc_client.hpp>
#include <sp/log.hpp>
#include "test_error.hpp"
#include <zstd.h>
#include <sys/socket.h>

using namespace sp;

// rpc client with an offline connection fed canned replies
class test_conn
{
public:
  test_conn() {
    int fd[2];
    ::socketpair( AF_UNIX, SOCK_STREAM, 0, fd );
    conn_.set_host( "localhost" );
    conn_.set_fd( fd[0] );
    peer_ = fd[1];
    clnt_.set_http_conn( &conn_ );
  }
  ~test_conn() {
    conn_.close();
    ::close( peer_ );
  }
  bool reply( const std::string& msg ) {
    return clnt_.parse_response( msg.c_str(), msg.size() );
  }
  rpc_client  clnt_;
  tcp_connect conn_;
  int         peer_;
};

class epoch_sub : public rpc_sub,
                  public rpc_sub_i<rpc::get_epoch_info>
{
public:
  epoch_sub() : num_( 0 ), epoch_( 0 ) {}
  void on_response( rpc::get_epoch_info *req ) override {
    ++num_;
    epoch_ = req->get_epoch();
  }
  unsigned num_;
  uint64_t epoch_;
};

static const char *bhash_txt = "SPoo1Ku8WFXoNDMHPsrGSTSG1Y47rzgn41SLUNakuHy";

static std::string to_base64( const char *buf, size_t len )
{
  std::string res( enc_base64_len( (int)len ) + 1, '\0' );
  int rlen = enc_base64( (const uint8_t*)buf, (int)len,
                         (uint8_t*)&res[0] );
  res.resize( rlen );
  return res;
}

static std::string account_reply( uint64_t id, const std::string& data,
                                  const char *enc )
{
  return "{\"jsonrpc\":\"2.0\",\"result\":{\"context\":{\"slot\":77},"
    "\"value\":{\"data\":[\"" + data + "\",\"" + enc + "\"],"
    "\"executable\":false,\"lamports\":1461600,"
    "\"owner\":\"" + std::string( bhash_txt ) + "\",\"rentEpoch\":0}},"
    "\"id\":" + std::to_string( id ) + "}";
}

void test_block_hash()
{
  test_conn tc;
  rpc::get_latest_block_hash req;
  tc.clnt_.send( &req );
  SP_TEST_CHECK( req.get_id() == 1 );
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 1 );
  SP_TEST_CHECK( !req.get_is_recv() );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":{\"context\":"
    "{\"slot\":100},\"value\":{\"blockhash\":\"" + std::string( bhash_txt ) +
    "\",\"lastValidBlockHeight\":250}},\"id\":1}" ) );
  SP_TEST_CHECK( req.get_is_recv() );
  SP_TEST_CHECK( req.get_recv_time() >= req.get_sent_time() );
  SP_TEST_CHECK( !req.get_is_err() );
  SP_TEST_CHECK( req.get_slot() == 100 );
  SP_TEST_CHECK( req.get_last_valid_block_height() == 250 );
  SP_TEST_CHECK( req.get_block_hash().enc_base58() == bhash_txt );
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 0 );

  // reply ids are reused
  tc.clnt_.send( &req );
  SP_TEST_CHECK( req.get_id() == 1 );
}

void test_epoch_and_rent()
{
  test_conn tc;
  epoch_sub sub;
  rpc::get_epoch_info ereq;
  rpc::get_minimum_balance_for_rent_exemption rreq;
  ereq.set_sub( &sub );
  rreq.set_size( 200 );
  tc.clnt_.send( &ereq );
  tc.clnt_.send( &rreq );
  SP_TEST_CHECK( ereq.get_id() == 1 && rreq.get_id() == 2 );

  // replies may arrive out of order
  SP_TEST_CHECK( tc.reply(
    "{\"jsonrpc\":\"2.0\",\"result\":2282880,\"id\":2}" ) );
  SP_TEST_CHECK( rreq.get_lamports() == 2282880UL );
  SP_TEST_CHECK( !ereq.get_is_recv() );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":"
    "{\"absoluteSlot\":166598,\"blockHeight\":166500,\"epoch\":27,"
    "\"slotIndex\":2790,\"slotsInEpoch\":8192},\"id\":1}" ) );
  SP_TEST_CHECK( sub.num_ == 1 );
  SP_TEST_CHECK( sub.epoch_ == 27 );
  SP_TEST_CHECK( ereq.get_slot_index() == 2790 );
  SP_TEST_CHECK( ereq.get_slots_in_epoch() == 8192 );
  SP_TEST_CHECK( ereq.get_absolute_slot() == 166598 );

  // unknown and unroutable replies
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":1,\"id\":9}" ) );
  SP_TEST_CHECK( !tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":1}" ) );
  SP_TEST_CHECK( sub.num_ == 1 );
}

void test_account_info()
{
  test_conn tc;
  char raw[300];
  for( unsigned i=0; i != sizeof( raw ); ++i ) {
    raw[i] = (char)( i % 7 );
  }
  pub_key acc;
  SP_TEST_CHECK( acc.init_from_text( std::string( bhash_txt ) ) );

  rpc::get_account_info req;
  req.set_account( acc );
  tc.clnt_.send( &req );
  SP_TEST_CHECK( tc.reply( account_reply( req.get_id(),
          to_base64( raw, sizeof( raw ) ), "base64" ) ) );
  SP_TEST_CHECK( !req.get_is_err() );
  SP_TEST_CHECK( req.get_slot() == 77 );
  SP_TEST_CHECK( req.get_lamports() == 1461600 );
  SP_TEST_CHECK( req.get_owner() == acc );
  SP_TEST_CHECK( !req.get_is_executable() );
  SP_TEST_CHECK( req.get_data_len() == sizeof( raw ) );
  SP_TEST_CHECK( __builtin_memcmp( req.get_data(), raw,
                                   sizeof( raw ) ) == 0 );

  // compressed encoding
  std::vector<char> zbuf( ZSTD_compressBound( sizeof( raw ) ) );
  size_t zlen = ZSTD_compress( zbuf.data(), zbuf.size(), raw,
                               sizeof( raw ), 1 );
  SP_TEST_CHECK( !ZSTD_isError( zlen ) );
  tc.clnt_.send( &req );
  SP_TEST_CHECK( tc.reply( account_reply( req.get_id(),
          to_base64( zbuf.data(), zlen ), "base64+zstd" ) ) );
  SP_TEST_CHECK( !req.get_is_err() );
  SP_TEST_CHECK( req.get_data_len() == sizeof( raw ) );
  SP_TEST_CHECK( __builtin_memcmp( req.get_data(), raw,
                                   sizeof( raw ) ) == 0 );

  // unsupported encoding
  tc.clnt_.send( &req );
  SP_TEST_CHECK( tc.reply( account_reply( req.get_id(),
          to_base64( raw, sizeof( raw ) ), "jsonParsed" ) ) );
  SP_TEST_CHECK( req.get_is_err() );

  // missing account
  tc.clnt_.send( &req );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":{\"context\":"
    "{\"slot\":78},\"value\":null},\"id\":" +
    std::to_string( req.get_id() ) + "}" ) );
  SP_TEST_CHECK( req.get_is_err() );
  SP_TEST_CHECK( req.get_err_msg() ==
                 "account not found: " + std::string( bhash_txt ) );
  SP_TEST_CHECK( req.get_data_len() == 0 );
}

void test_send_transaction()
{
  test_conn tc;
  key_pair kp;
  kp.gen();
  signature sig;
  const char msg[] = "hello world";
  SP_TEST_CHECK( sig.sign( (const uint8_t*)msg, sizeof( msg ), kp ) );
  char tx[] = { 1, 2, 3 };

  rpc::send_transaction req;
  req.set_transaction( tx, sizeof( tx ) );
  tc.clnt_.send( &req );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":\"" +
    sig.enc_base58() + "\",\"id\":1}" ) );
  SP_TEST_CHECK( !req.get_is_err() );
  SP_TEST_CHECK( req.get_signature() == sig );

  // preflight failure
  tc.clnt_.send( &req );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"error\":{\"code\":-32002,"
    "\"message\":\"Transaction simulation failed: Error processing "
    "Instruction 0: custom program error: 0x10\",\"data\":{}},\"id\":1}" ) );
  SP_TEST_CHECK( req.get_is_err() );
  SP_TEST_CHECK( req.get_err_code() == SP_RPC_ERROR_SEND_TX_PREFLIGHT_FAIL );
  SP_TEST_CHECK( req.get_err_msg().find( "simulation failed" ) !=
                 std::string::npos );

  // result that is not a signature
  tc.clnt_.send( &req );
  SP_TEST_CHECK( tc.reply(
    "{\"jsonrpc\":\"2.0\",\"result\":\"0OIl\",\"id\":1}" ) );
  SP_TEST_CHECK( req.get_is_err() );
}

void test_signature_statuses()
{
  test_conn tc;
  key_pair kp;
  kp.gen();
  signature s1, s2, s3;
  SP_TEST_CHECK( s1.sign( (const uint8_t*)"a", 1, kp ) );
  SP_TEST_CHECK( s2.sign( (const uint8_t*)"b", 1, kp ) );
  SP_TEST_CHECK( s3.sign( (const uint8_t*)"c", 1, kp ) );

  rpc::get_signature_statuses req;
  req.add_signature( s1 );
  req.add_signature( s2 );
  req.add_signature( s3 );
  tc.clnt_.send( &req );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":{\"context\":"
    "{\"slot\":82},\"value\":[{\"slot\":72,\"confirmations\":10,"
    "\"err\":null,\"status\":{\"Ok\":null},"
    "\"confirmationStatus\":\"confirmed\"},null,"
    "{\"slot\":48,\"confirmations\":null,"
    "\"err\":{\"InstructionError\":[0,{\"Custom\":16}]},"
    "\"status\":{\"Err\":{\"InstructionError\":[0,{\"Custom\":16}]}},"
    "\"confirmationStatus\":\"finalized\"}]},\"id\":1}" ) );
  SP_TEST_CHECK( !req.get_is_err() );
  SP_TEST_CHECK( req.get_num_status() == 3 );
  const rpc::get_signature_statuses::status& st1 = req.get_status( 0 );
  SP_TEST_CHECK( st1.found_ && st1.slot_ == 72 );
  SP_TEST_CHECK( st1.cmt_ == e_confirmed && !st1.is_err_ );
  SP_TEST_CHECK( !req.get_status( 1 ).found_ );
  const rpc::get_signature_statuses::status& st3 = req.get_status( 2 );
  SP_TEST_CHECK( st3.found_ && st3.cmt_ == e_finalized );
  SP_TEST_CHECK( st3.is_err_ );
  SP_TEST_CHECK( st3.err_.find( "InstructionError" ) != std::string::npos );

  // fewer statuses than signatures
  tc.clnt_.send( &req );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":{\"context\":"
    "{\"slot\":83},\"value\":[null]},\"id\":1}" ) );
  SP_TEST_CHECK( req.get_is_err() );
}

void test_connection_loss()
{
  // requests fail without a connection
  rpc_client clnt;
  rpc::get_epoch_info req;
  clnt.send( &req );
  SP_TEST_CHECK( req.get_is_recv() );
  SP_TEST_CHECK( req.get_is_err() );
  SP_TEST_CHECK( clnt.get_num_pending() == 0 );

  // outstanding requests fail when the connection drops
  test_conn tc;
  rpc::get_epoch_info r1, r2;
  tc.clnt_.send( &r1 );
  tc.clnt_.send( &r2 );
  tc.clnt_.send( &r2 );
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 2 );
  tc.clnt_.fail_all( "rpc connection lost" );
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 0 );
  SP_TEST_CHECK( r1.get_is_recv() && r1.get_is_err() );
  SP_TEST_CHECK( r2.get_err_msg() == "rpc connection lost" );

  // cancelled request ignores its late reply
  epoch_sub sub;
  r1.set_sub( &sub );
  tc.clnt_.send( &r1 );
  uint64_t id = r1.get_id();
  tc.clnt_.cancel( &r1 );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":{\"epoch\":5},"
    "\"id\":" + std::to_string( id ) + "}" ) );
  SP_TEST_CHECK( sub.num_ == 0 );
}

void test_commitment()
{
  SP_TEST_CHECK( str_to_commitment( str( "confirmed" ) ) == e_confirmed );
  SP_TEST_CHECK( str_to_commitment( str( "finalized" ) ) == e_finalized );
  SP_TEST_CHECK( str_to_commitment( str( "processed" ) ) == e_processed );
  SP_TEST_CHECK( str_to_commitment( str( "bogus" ) ) == e_unknown );
  SP_TEST_CHECK( commitment_to_str( e_confirmed ) == str( "confirmed" ) );
}

int main( int, char** )
{
  log::set_level( SP_LOG_ERR_LVL );
  SP_TEST_START
  test_block_hash();
  test_epoch_and_rent();
  test_account_info();
  test_send_transaction();
  test_signature_statuses();
  test_connection_loss();
  test_commitment();
  SP_TEST_END
  log::flush();
  return 0;
}
