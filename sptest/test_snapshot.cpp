#include <sp/snapshot.hpp>
#include <sp/rebalance.hpp>
#include <sp/bincode.hpp>
#include <sp/log.hpp>
#include "test_error.hpp"
#include <sys/socket.h>

using namespace sp;

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

static pub_key make_key( uint8_t id )
{
  uint8_t buf[pub_key::len];
  __builtin_memset( buf, 0, sizeof( buf ) );
  buf[0] = id;
  buf[31] = 0x5a;
  pub_key pk;
  pk.init_from_buf( buf );
  return pk;
}

static std::string to_base64( const char *buf, size_t len )
{
  std::string res( enc_base64_len( (int)len ) + 1, '\0' );
  int rlen = enc_base64( (const uint8_t*)buf, (int)len,
                         (uint8_t*)&res[0] );
  res.resize( rlen );
  return res;
}

static std::string account_reply( uint64_t id, uint64_t lamports,
                                  const char *buf, size_t len )
{
  return "{\"jsonrpc\":\"2.0\",\"result\":{\"context\":{\"slot\":500},"
    "\"value\":{\"data\":[\"" + to_base64( buf, len ) + "\",\"base64\"],"
    "\"executable\":false,\"lamports\":" + std::to_string( lamports ) +
    ",\"owner\":\"11111111111111111111111111111111\",\"rentEpoch\":0}},"
    "\"id\":" + std::to_string( id ) + "}";
}

static std::string null_reply( uint64_t id )
{
  return "{\"jsonrpc\":\"2.0\",\"result\":{\"context\":{\"slot\":500},"
    "\"value\":null},\"id\":" + std::to_string( id ) + "}";
}

static void add_fee( bincode& wtr )
{
  wtr.add( (uint64_t)100 );
  wtr.add( (uint64_t)1 );
}

// pool account with every optional field absent
static size_t write_pool( char *buf, uint64_t total, uint64_t epoch )
{
  bincode wtr( buf );
  wtr.add( (uint8_t)e_stake_pool_account );
  wtr.add( make_key( 1 ) );
  wtr.add( make_key( 2 ) );
  wtr.add( make_key( 3 ) );
  wtr.add( (uint8_t)255 );
  wtr.add( make_key( 4 ) );  // validator list
  wtr.add( make_key( 5 ) );  // reserve
  wtr.add( make_key( 6 ) );
  wtr.add( make_key( 7 ) );
  wtr.add( make_key( 8 ) );
  wtr.add( total );
  wtr.add( total );
  wtr.add( epoch );
  wtr.add( (int64_t)0 );
  wtr.add( (uint64_t)0 );
  wtr.add( make_key( 0 ) );
  add_fee( wtr );
  wtr.add( (uint8_t)0 );
  wtr.add( (uint8_t)0 );
  wtr.add( (uint8_t)0 );
  add_fee( wtr );
  add_fee( wtr );
  wtr.add( (uint8_t)0 );
  wtr.add( (uint8_t)0 );
  wtr.add( (uint8_t)0 );
  add_fee( wtr );
  wtr.add( (uint8_t)0 );
  wtr.add( (uint8_t)0 );
  add_fee( wtr );
  wtr.add( (uint8_t)0 );
  wtr.add( total );
  wtr.add( total );
  return wtr.size();
}

static size_t write_list( char *buf, const uint64_t *active,
                          unsigned num )
{
  bincode wtr( buf );
  wtr.add( (uint8_t)e_validator_list_account );
  wtr.add( (uint32_t)50 );
  wtr.add( (uint32_t)num );
  for( unsigned i=0; i != num; ++i ) {
    wtr.add( active[i] );
    wtr.add( (uint64_t)0 );
    wtr.add( (uint64_t)12 );
    wtr.add( (uint64_t)0 );
    wtr.add( (uint32_t)0 );
    wtr.add( (uint32_t)0 );
    wtr.add( (uint8_t)0 );
    wtr.add( make_key( (uint8_t)( 20 + i ) ) );
  }
  return wtr.size();
}

static void reply_first_stage( test_conn& tc, uint64_t total )
{
  char buf[1024];
  size_t len = write_pool( buf, total, 12 );
  SP_TEST_CHECK( tc.reply( account_reply( 1, 5000000, buf, len ) ) );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":{\"epoch\":12,"
    "\"slotIndex\":10,\"slotsInEpoch\":432000,\"absoluteSlot\":5184010},"
    "\"id\":2}" ) );
  SP_TEST_CHECK( tc.reply(
    "{\"jsonrpc\":\"2.0\",\"result\":2282880,\"id\":3}" ) );
}

void test_read_snapshot()
{
  test_conn tc;
  snapshot_reader rdr;
  rdr.set_rpc_client( &tc.clnt_ );
  rdr.set_pool( make_key( 9 ) );
  SP_TEST_CHECK( !rdr.poll() );
  rdr.start();
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 3 );
  SP_TEST_CHECK( !rdr.poll() );

  // pool, epoch and rent then the list and reserve it references
  reply_first_stage( tc, 300000000UL );
  SP_TEST_CHECK( !rdr.poll() );
  SP_TEST_CHECK( !rdr.get_is_err() );
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 2 );
  char buf[1024];
  uint64_t active[] = { 0, 0, 0 };
  size_t len = write_list( buf, active, 3 );
  SP_TEST_CHECK( tc.reply( account_reply( 3, 0, buf, len ) ) );
  SP_TEST_CHECK( !rdr.poll() );
  SP_TEST_CHECK( tc.reply( account_reply( 2, 300000000UL, buf, 0 ) ) );
  SP_TEST_CHECK( rdr.poll() );
  SP_TEST_CHECK( rdr.get_is_done() );
  SP_TEST_CHECK( !rdr.get_is_err() );

  const pool_snapshot& snap = rdr.get_snapshot();
  SP_TEST_CHECK( snap.pool_key_ == make_key( 9 ) );
  SP_TEST_CHECK( snap.total_lamports_ == 300000000UL );
  SP_TEST_CHECK( snap.reserve_lamports_ == 300000000UL );
  SP_TEST_CHECK( snap.epoch_ == 12 );
  SP_TEST_CHECK( snap.stake_rent_exemption_ == 2282880UL );
  SP_TEST_CHECK( snap.pool_.last_update_epoch_ == 12 );
  SP_TEST_CHECK( snap.pool_.reserve_stake_ == make_key( 5 ) );
  SP_TEST_CHECK( snap.validators_.size() == 3 );
  SP_TEST_CHECK( snap.validators_[2].vote_account_address_ ==
                 make_key( 22 ) );

  // snapshot feeds straight into the planner
  plan_config cfg;
  cfg.retained_reserve_ = 0;
  cfg.stake_rent_exemption_ = snap.stake_rent_exemption_;
  action_vec_t acts;
  plan_stats stats;
  plan_rebalance( snap, cfg, acts, stats );
  SP_TEST_CHECK( acts.size() == 3 );
  SP_TEST_CHECK( acts[0].lamports_ == 97717120UL );
}

void test_missing_account()
{
  test_conn tc;
  snapshot_reader rdr;
  rdr.set_rpc_client( &tc.clnt_ );
  rdr.set_pool( make_key( 9 ) );
  rdr.start();
  reply_first_stage( tc, 100000000UL );
  SP_TEST_CHECK( !rdr.poll() );

  // validator list account does not exist
  SP_TEST_CHECK( tc.reply( null_reply( 3 ) ) );
  SP_TEST_CHECK( tc.reply( account_reply( 2, 100000000UL, "", 0 ) ) );
  SP_TEST_CHECK( rdr.poll() );
  SP_TEST_CHECK( rdr.get_is_err() );
  SP_TEST_CHECK( rdr.get_err_msg().find(
        "snapshot unavailable: validator list" ) == 0 );
  SP_TEST_CHECK( rdr.get_err_msg().find( "account not found" ) !=
                 std::string::npos );
}

void test_invalid_pool()
{
  test_conn tc;
  snapshot_reader rdr;
  rdr.set_rpc_client( &tc.clnt_ );
  rdr.set_pool( make_key( 9 ) );
  rdr.start();
  char buf[8] = { 2, 0, 0, 0, 0, 0, 0, 0 };
  SP_TEST_CHECK( tc.reply( account_reply( 1, 5000000, buf, sizeof( buf ) ) ) );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":{\"epoch\":12},"
    "\"id\":2}" ) );
  SP_TEST_CHECK( !rdr.poll() );
  SP_TEST_CHECK( tc.reply(
    "{\"jsonrpc\":\"2.0\",\"result\":2282880,\"id\":3}" ) );
  SP_TEST_CHECK( rdr.poll() );
  SP_TEST_CHECK( rdr.get_is_err() );
  SP_TEST_CHECK( rdr.get_err_msg().find( "not a stake pool account" ) !=
                 std::string::npos );
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 0 );

  // connection loss fails the read
  rdr.start();
  tc.clnt_.fail_all( "rpc connection lost" );
  SP_TEST_CHECK( rdr.poll() );
  SP_TEST_CHECK( rdr.get_err_msg() ==
                 "snapshot unavailable: stake pool: rpc connection lost" );
}

int main( int, char** )
{
  log::set_level( SP_LOG_ERR_LVL );
  SP_TEST_START
  test_read_snapshot();
  test_missing_account();
  test_invalid_pool();
  SP_TEST_END
  log::flush();
  return 0;
}
