#include <sp/executor.hpp>
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
  buf[1] = 0xee;
  pub_key pk;
  pk.init_from_buf( buf );
  return pk;
}

static std::vector<instruction> make_ixs( uint8_t id )
{
  instruction ix;
  ix.set_program( make_key( 100 ) );
  ix.add_account( make_key( id ), false, true );
  char cmd = (char)id;
  ix.set_data( &cmd, 1 );
  return std::vector<instruction>( 1, ix );
}

static std::string sig_reply( uint64_t id, const signature& sig )
{
  return "{\"jsonrpc\":\"2.0\",\"result\":\"" + sig.enc_base58() +
    "\",\"id\":" + std::to_string( id ) + "}";
}

void test_partial_failure()
{
  test_conn tc;
  key_pair kp;
  kp.gen();
  hash bhash = make_key( 50 );
  executor exe;
  exe.set_rpc_client( &tc.clnt_ );
  exe.set_staker( &kp );
  exe.set_block_hash( bhash );
  exe.add_job( "job1", make_ixs( 1 ) );
  exe.add_job( "job2", make_ixs( 2 ) );
  exe.add_job( "job3", make_ixs( 3 ) );
  SP_TEST_CHECK( exe.get_num_result() == 3 );
  SP_TEST_CHECK( !exe.get_is_done() );

  // all three are in flight at once
  exe.submit();
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 3 );
  SP_TEST_CHECK( !exe.poll() );
  const action_result& r1 = exe.get_result( 0 );
  const action_result& r2 = exe.get_result( 1 );
  const action_result& r3 = exe.get_result( 2 );
  SP_TEST_CHECK( !( r1.sig_ == r2.sig_ ) && !( r2.sig_ == r3.sig_ ) );

  // second transaction fails preflight
  SP_TEST_CHECK( tc.reply( sig_reply( 1, r1.sig_ ) ) );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"error\":{\"code\":-32002,"
    "\"message\":\"Transaction simulation failed: insufficient funds\"},"
    "\"id\":2}" ) );
  SP_TEST_CHECK( tc.reply( sig_reply( 3, r3.sig_ ) ) );
  SP_TEST_CHECK( r2.status_ == e_action_rejected );
  SP_TEST_CHECK( r2.err_.find( "insufficient funds" ) != std::string::npos );
  SP_TEST_CHECK( r1.status_ == e_action_pending );
  SP_TEST_CHECK( r3.status_ == e_action_pending );

  // status query of the two accepted signatures
  SP_TEST_CHECK( !exe.poll() );
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 0 );
  usleep( 600000 );
  SP_TEST_CHECK( !exe.poll() );
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 1 );

  // first still processing, third failed on chain
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":{\"context\":"
    "{\"slot\":90},\"value\":[{\"slot\":89,\"confirmations\":0,"
    "\"err\":null,\"confirmationStatus\":\"processed\"},"
    "{\"slot\":89,\"confirmations\":0,"
    "\"err\":{\"InstructionError\":[0,{\"Custom\":6}]},"
    "\"confirmationStatus\":\"confirmed\"}]},\"id\":3}" ) );
  SP_TEST_CHECK( r1.status_ == e_action_pending );
  SP_TEST_CHECK( r3.status_ == e_action_rejected );
  SP_TEST_CHECK( r3.err_.find( "Custom" ) != std::string::npos );
  SP_TEST_CHECK( !exe.poll() );

  // first reaches the requested commitment
  usleep( 600000 );
  SP_TEST_CHECK( !exe.poll() );
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 1 );
  SP_TEST_CHECK( tc.reply( "{\"jsonrpc\":\"2.0\",\"result\":{\"context\":"
    "{\"slot\":95},\"value\":[{\"slot\":89,\"confirmations\":null,"
    "\"err\":null,\"confirmationStatus\":\"finalized\"}]},\"id\":3}" ) );
  SP_TEST_CHECK( exe.poll() );
  SP_TEST_CHECK( exe.get_is_done() );
  SP_TEST_CHECK( r1.status_ == e_action_confirmed );
  SP_TEST_CHECK( exe.get_num_status( e_action_confirmed ) == 1 );
  SP_TEST_CHECK( exe.get_num_status( e_action_rejected ) == 2 );
}

void test_timeout()
{
  test_conn tc;
  key_pair kp;
  kp.gen();
  executor exe;
  exe.set_rpc_client( &tc.clnt_ );
  exe.set_staker( &kp );
  exe.set_timeout( 100L*SP_NSECS_IN_MSEC );
  SP_TEST_CHECK( exe.get_timeout() == 100L*SP_NSECS_IN_MSEC );
  exe.add_job( "job1", make_ixs( 1 ) );
  exe.submit();
  SP_TEST_CHECK( !exe.poll() );
  usleep( 200000 );
  SP_TEST_CHECK( exe.poll() );
  SP_TEST_CHECK( exe.get_result( 0 ).status_ == e_action_timeout );
  SP_TEST_CHECK( exe.get_num_status( e_action_pending ) == 0 );
}

void test_no_connection()
{
  // submission fails locally and is not retried
  rpc_client clnt;
  key_pair kp;
  kp.gen();
  executor exe;
  exe.set_rpc_client( &clnt );
  exe.add_job( "job1", make_ixs( 1 ) );
  exe.submit();
  SP_TEST_CHECK( exe.poll() );
  SP_TEST_CHECK( exe.get_result( 0 ).status_ == e_action_rejected );
  SP_TEST_CHECK( exe.get_result( 0 ).err_ == "missing staker key" );

  exe.clear();
  SP_TEST_CHECK( exe.get_num_result() == 0 );
  exe.set_staker( &kp );
  exe.add_job( "job1", make_ixs( 1 ) );
  exe.add_job( "empty", std::vector<instruction>() );
  exe.submit();
  SP_TEST_CHECK( exe.poll() );
  SP_TEST_CHECK( exe.get_result( 0 ).status_ == e_action_rejected );
  SP_TEST_CHECK( exe.get_result( 0 ).err_ ==
                 "rpc connection not available" );
  SP_TEST_CHECK( exe.get_result( 1 ).err_ ==
                 "no instructions in transaction" );
}

void test_actions()
{
  test_conn tc;
  key_pair kp;
  kp.gen();
  stake_pool_account acc;
  acc.staker_ = pub_key( kp );
  acc.validator_list_ = make_key( 10 );
  acc.reserve_stake_ = make_key( 11 );
  pool_builder bld;
  SP_TEST_CHECK( bld.init( get_stake_pool_program(), make_key( 12 ), acc ) );

  pool_snapshot snap;
  validator_stake_info v;
  v.active_stake_lamports_ = 0;
  v.transient_stake_lamports_ = 0;
  v.last_update_epoch_ = 0;
  v.transient_seed_suffix_ = 0;
  v.validator_seed_suffix_ = 0;
  v.status_ = e_validator_active;
  v.vote_account_address_ = make_key( 20 );
  snap.validators_.push_back( v );
  v.vote_account_address_ = make_key( 21 );
  snap.validators_.push_back( v );

  action_vec_t acts;
  acts.emplace_back( e_increase, make_key( 20 ), 50000000UL );
  acts.emplace_back( e_increase, make_key( 30 ), 50000000UL );
  acts.emplace_back( e_decrease, make_key( 21 ), 40000000UL );

  executor exe;
  exe.set_rpc_client( &tc.clnt_ );
  exe.set_staker( &kp );
  exe.add_actions( bld, snap, acts );
  SP_TEST_CHECK( exe.get_num_result() == 3 );

  // unknown validator is rejected up front
  const action_result& bad = exe.get_result( 1 );
  SP_TEST_CHECK( bad.is_action_ );
  SP_TEST_CHECK( bad.status_ == e_action_rejected );
  SP_TEST_CHECK( bad.err_ == "validator not in pool" );
  SP_TEST_CHECK( bad.act_.vote_ == make_key( 30 ) );

  exe.submit();
  SP_TEST_CHECK( tc.clnt_.get_num_pending() == 2 );
  const action_result& inc = exe.get_result( 0 );
  const action_result& dec = exe.get_result( 2 );
  SP_TEST_CHECK( inc.name_ == "increase" && dec.name_ == "decrease" );
  SP_TEST_CHECK( inc.act_.lamports_ == 50000000UL );
  SP_TEST_CHECK( dec.act_.type_ == e_decrease );
  SP_TEST_CHECK( tc.reply( sig_reply( 1, inc.sig_ ) ) );
  SP_TEST_CHECK( tc.reply( sig_reply( 2, dec.sig_ ) ) );
  exe.clear();
  SP_TEST_CHECK( exe.get_is_done() );
}

int main( int, char** )
{
  log::set_level( SP_LOG_ERR_LVL );
  SP_TEST_START
  test_partial_failure();
  test_timeout();
  test_no_connection();
  test_actions();
  SP_TEST_END
  log::flush();
  return 0;
}
