#include "manager.hpp"
#include "log.hpp"
#include <algorithm>

using namespace sp;

manager::manager()
: pgm_( get_stake_pool_program() ),
  kp_( nullptr ),
  cmt_( e_confirmed ),
  min_inc_( SP_MIN_INCREASE_LAMPORTS ),
  ctimeout_( SP_NSECS_IN_SEC ),
  cts_( 0L ),
  tx_timeout_( SP_CONFIRM_TIMEOUT ),
  status_( 0 ),
  dry_run_( false )
{
  breq_.set_sub( this );
}

manager::~manager()
{
  teardown();
}

void manager::set_rpc_host( const std::string& rhost )
{
  rhost_ = rhost;
}

void manager::set_commitment( commitment cmt )
{
  cmt_ = cmt;
}

commitment manager::get_commitment() const
{
  return cmt_;
}

void manager::set_program( const pub_key& pgm )
{
  pgm_ = pgm;
}

const pub_key& manager::get_program() const
{
  return pgm_;
}

void manager::set_staker( const key_pair *kp )
{
  kp_ = kp;
}

void manager::set_min_increase( uint64_t min_inc )
{
  min_inc_ = min_inc;
}

void manager::set_confirm_timeout( int64_t timeout )
{
  tx_timeout_ = timeout;
}

void manager::set_dry_run( bool dry_run )
{
  dry_run_ = dry_run;
}

rpc_client *manager::get_rpc_client()
{
  return &clnt_;
}

const hash& manager::get_block_hash() const
{
  return bhash_;
}

bool manager::has_status( int status ) const
{
  return status == (status_ & status);
}

void manager::set_status( int status )
{
  status_ |= status;
}

bool manager::init()
{
  // initialize net_loop
  if ( !nl_.init() ) {
    return set_err_msg( nl_.get_err_msg() );
  }

  // decompose rpc_host into host:port
  int rport = 0;
  std::string rhost = get_host_port( rhost_, rport );
  if ( rport == 0 ) rport = SP_RPC_HTTP_PORT;

  // add rpc_client connection to net_loop and connect
  hconn_.set_port( rport );
  hconn_.set_host( rhost );
  hconn_.set_net_loop( &nl_ );
  clnt_.set_http_conn( &hconn_ );
  if ( !hconn_.init() ) {
    return set_err_msg( hconn_.get_err_msg() );
  }
  cts_ = get_now();
  reconnect_rpc();

  SP_LOG_INF( "initialized" )
    .add( "version", SP_VERSION )
    .add( "rpc_host", str( rhost_ ) )
    .add( "program", pgm_ )
    .add( "commitment", commitment_to_str( cmt_ ) )
    .end();
  return true;
}

bool manager::bootstrap()
{
  int status = SP_RPC_CONNECTED | SP_HAS_BLOCK_HASH;
  while( !get_is_err() && !has_status( status ) ) {
    poll();
    if ( breq_.get_is_recv() && breq_.get_is_err() ) {
      return set_err_msg( "failed to get block hash", breq_ );
    }
  }
  return !get_is_err();
}

void manager::poll( bool do_wait )
{
  if ( do_wait ) {
    nl_.poll( 1 );
  } else if ( has_status( SP_RPC_CONNECTED ) ) {
    hconn_.poll();
  }
  if ( !has_status( SP_RPC_CONNECTED ) ||
       hconn_.get_is_err() || hconn_.get_fd() < 0 ) {
    reconnect_rpc();
  }
}

void manager::reconnect_rpc()
{
  // check for successful (re)connect
  if ( !hconn_.get_is_err() && hconn_.get_fd() >= 0 ) {
    if ( !has_status( SP_RPC_CONNECTED ) ) {
      SP_LOG_INF( "rpc_connected" )
        .add( "host", str( hconn_.get_host() ) )
        .add( "port", hconn_.get_port() )
        .end();
      set_status( SP_RPC_CONNECTED );
      ctimeout_ = SP_NSECS_IN_SEC;
      clnt_.reset();
      breq_.set_commitment( cmt_ );
      clnt_.send( &breq_ );
    }
    return;
  }

  // outstanding requests cannot complete on a dropped connection
  if ( has_status( SP_RPC_CONNECTED ) ) {
    std::string emsg = hconn_.get_is_err() ?
      hconn_.get_err_msg() : "rpc connection closed";
    SP_LOG_ERR( "rpc_http_reset" )
      .add( "error", str( emsg ) )
      .add( "host", str( hconn_.get_host() ) )
      .add( "port", hconn_.get_port() )
      .end();
    clnt_.fail_all( emsg );
    hconn_.teardown();
    status_ = 0;
  }

  // wait for reconnect timeout
  int64_t ts = get_now();
  if ( ctimeout_ > (ts-cts_) ) {
    return;
  }

  // attempt to reconnect
  cts_ = ts;
  ctimeout_ += ctimeout_;
  ctimeout_ = std::min( ctimeout_, SP_RECONNECT_TIMEOUT );
  if ( !hconn_.init() ) {
    SP_LOG_WRN( "rpc_reconnect_failed" )
      .add( "error", str( hconn_.get_err_msg() ) )
      .end();
    return;
  }
  reconnect_rpc();
}

void manager::on_response( rpc::get_latest_block_hash *res )
{
  if ( res->get_is_err() ) {
    SP_LOG_ERR( "failed to get block hash" )
      .add( "error", str( res->get_err_msg() ) )
      .end();
    return;
  }
  bhash_ = res->get_block_hash();
  set_status( SP_HAS_BLOCK_HASH );
  SP_LOG_DBG( "block_hash" )
    .add( "slot", res->get_slot() )
    .add( "hash", bhash_ )
    .end();
}

bool manager::wait( rpc_request *req )
{
  // poll for reply, failure or request timeout
  int64_t ts = get_now();
  while( !req->get_is_recv() && !get_is_err() ) {
    poll();
    if ( get_now() - ts > SP_REQUEST_TIMEOUT ) {
      clnt_.cancel( req );
      req->set_err_msg( "request timed out" );
      req->set_recv_time( get_now() );
    }
  }
  return !req->get_is_err() && !get_is_err();
}

bool manager::refresh_block_hash()
{
  clnt_.send( &breq_ );
  if ( !wait( &breq_ ) ) {
    return set_err_msg( "failed to get block hash", breq_ );
  }
  return true;
}

bool manager::read_snapshot( const pub_key& pool, pool_snapshot& snap )
{
  rdr_.set_rpc_client( &clnt_ );
  rdr_.set_commitment( cmt_ );
  rdr_.set_pool( pool );
  rdr_.start();
  int64_t ts = get_now();
  while( !rdr_.poll() && !get_is_err() ) {
    poll();
    if ( get_now() - ts > SP_REQUEST_TIMEOUT ) {
      return set_err_msg( "snapshot unavailable: request timed out" );
    }
  }
  if ( rdr_.get_is_err() ) {
    return set_err_msg( rdr_.get_err_msg() );
  }
  snap = rdr_.get_snapshot();
  return !get_is_err();
}

bool manager::get_epoch( uint64_t& epoch )
{
  ereq_.set_commitment( cmt_ );
  clnt_.send( &ereq_ );
  if ( !wait( &ereq_ ) ) {
    return set_err_msg( "failed to get epoch", ereq_ );
  }
  epoch = ereq_.get_epoch();
  return true;
}

bool manager::init_builder( const pool_snapshot& snap, pool_builder& bld )
{
  if ( !bld.init( pgm_, snap.pool_key_, snap.pool_ ) ) {
    return set_err_msg( bld.get_err_msg() );
  }
  if ( kp_ ) {
    pub_key pk( *kp_ );
    if ( pk != snap.pool_.staker_ ) {
      SP_LOG_WRN( "key is not pool staker" )
        .add( "key", pk )
        .add( "staker", snap.pool_.staker_ )
        .end();
    }
  }
  return true;
}

void manager::init_executor( executor& exe )
{
  exe.set_rpc_client( &clnt_ );
  exe.set_staker( kp_ );
  exe.set_commitment( cmt_ );
  exe.set_timeout( tx_timeout_ );
  exe.set_block_hash( bhash_ );
}

bool manager::execute( executor& exe )
{
  if ( !refresh_block_hash() ) {
    return false;
  }
  init_executor( exe );
  exe.submit();
  while( !exe.poll() && !get_is_err() ) {
    poll();
  }
  SP_LOG_INF( "executed" )
    .add( "num_tx", exe.get_num_result() )
    .add( "confirmed", exe.get_num_status( e_action_confirmed ) )
    .add( "rejected", exe.get_num_status( e_action_rejected ) )
    .add( "timeout", exe.get_num_status( e_action_timeout ) )
    .end();
  return !get_is_err();
}

bool manager::update_pool( const pool_snapshot& snap, bool& is_updated )
{
  is_updated = false;
  if ( snap.pool_.last_update_epoch_ == snap.epoch_ ) {
    return true;
  }
  SP_LOG_INF( "update pool" )
    .add( "pool", snap.pool_key_ )
    .add( "pool_update_epoch", snap.pool_.last_update_epoch_ )
    .add( "epoch", snap.epoch_ )
    .end();
  if ( dry_run_ ) {
    return true;
  }
  pool_builder bld;
  if ( !init_builder( snap, bld ) ) {
    return false;
  }

  // validator list balances in chunks that fit a transaction
  executor lst;
  const validator_vec_t& vals = snap.validators_;
  for( unsigned i=0; i < vals.size(); i += SP_MAX_VALIDATORS_TO_UPDATE ) {
    std::vector<instruction> ixs( 1 );
    if ( !bld.update_validator_list( ixs[0], vals, i,
                                     SP_MAX_VALIDATORS_TO_UPDATE, false ) ) {
      return set_err_msg( bld.get_err_msg() );
    }
    lst.add_job( "update_validator_list start=" + std::to_string( i ), ixs );
  }
  if ( !execute( lst ) ) {
    return false;
  }

  // then pool totals
  executor upd;
  std::vector<instruction> ixs( 2 );
  bld.update_pool_balance( ixs[0] );
  bld.cleanup( ixs[1] );
  upd.add_job( "update_stake_pool_balance", ixs );
  if ( !execute( upd ) ) {
    return false;
  }
  if ( upd.get_result( 0 ).status_ != e_action_confirmed ) {
    return set_err_msg( "failed to update stake pool balance: " +
        upd.get_result( 0 ).err_ );
  }
  is_updated = true;
  return true;
}

bool manager::rebalance( const pub_key& pool, uint64_t retained_reserve,
                         executor& exe, plan_stats& stats )
{
  exe.clear();
  pool_snapshot snap;
  if ( !read_snapshot( pool, snap ) ) {
    return false;
  }
  bool is_updated = false;
  if ( !update_pool( snap, is_updated ) ) {
    return false;
  }
  if ( is_updated && !read_snapshot( pool, snap ) ) {
    return false;
  }

  // plan against fresh balances
  plan_config cfg;
  cfg.retained_reserve_ = retained_reserve;
  cfg.stake_rent_exemption_ = snap.stake_rent_exemption_;
  cfg.min_increase_ = min_inc_;
  action_vec_t acts;
  plan_rebalance( snap, cfg, acts, stats );
  for( const rebalance_action& act: acts ) {
    SP_LOG_INF( "action" )
      .add( "type", action_type_to_str( act.type_ ) )
      .add( "vote", act.vote_ )
      .add( "lamports", act.lamports_ )
      .add( "sol", str( lamports_to_str( act.lamports_ ) ) )
      .end();
  }
  if ( dry_run_ || acts.empty() ) {
    return true;
  }
  pool_builder bld;
  if ( !init_builder( snap, bld ) ) {
    return false;
  }
  exe.add_actions( bld, snap, acts );
  return execute( exe );
}

bool manager::move_stake( const pub_key& pool, const rebalance_action& act,
                          executor& exe )
{
  exe.clear();
  pool_snapshot snap;
  if ( !read_snapshot( pool, snap ) ) {
    return false;
  }
  pool_builder bld;
  if ( !init_builder( snap, bld ) ) {
    return false;
  }
  action_vec_t acts( 1, act );
  exe.add_actions( bld, snap, acts );
  if ( dry_run_ ) {
    return true;
  }
  return execute( exe );
}

void manager::teardown()
{
  clnt_.fail_all( "shutting down" );
  hconn_.teardown();
  status_ = 0;
}
