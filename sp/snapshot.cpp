#include "snapshot.hpp"
#include "log.hpp"

using namespace sp;

pool_snapshot::pool_snapshot()
: total_lamports_( 0 ),
  reserve_lamports_( 0 ),
  epoch_( 0 ),
  stake_rent_exemption_( 0 )
{
}

snapshot_reader::snapshot_reader()
: clnt_( nullptr ),
  cmt_( e_confirmed ),
  st_( e_idle )
{
}

void snapshot_reader::set_rpc_client( rpc_client *clnt )
{
  clnt_ = clnt;
}

void snapshot_reader::set_pool( const pub_key& pool )
{
  snap_.pool_key_ = pool;
}

void snapshot_reader::set_commitment( commitment cmt )
{
  cmt_ = cmt;
}

bool snapshot_reader::get_is_done() const
{
  return st_ == e_done;
}

const pool_snapshot& snapshot_reader::get_snapshot() const
{
  return snap_;
}

void snapshot_reader::start()
{
  reset_err();
  pub_key pool = snap_.pool_key_;
  snap_ = pool_snapshot();
  snap_.pool_key_ = pool;
  st_ = e_read_pool;

  // pool account, current epoch and rent exemption in parallel
  pool_req_.set_account( pool );
  pool_req_.set_commitment( cmt_ );
  epoch_req_.set_commitment( cmt_ );
  rent_req_.set_size( SP_STAKE_ACCOUNT_SIZE );
  clnt_->send( &pool_req_ );
  clnt_->send( &epoch_req_ );
  clnt_->send( &rent_req_ );
}

bool snapshot_reader::fail( const char *what, const error& req )
{
  st_ = e_done;
  set_err_msg( std::string( "snapshot unavailable: " ) + what, req );
  SP_LOG_ERR( "snapshot unavailable" )
    .add( "pool", snap_.pool_key_ )
    .add( "read", what )
    .add( "error", str( get_err_msg() ) )
    .end();
  return true;
}

bool snapshot_reader::poll()
{
  switch( st_ ) {
    case e_idle: return false;
    case e_done: return true;
    case e_read_pool: {
      if ( !pool_req_.get_is_recv() ||
           !epoch_req_.get_is_recv() ||
           !rent_req_.get_is_recv() ) {
        return false;
      }
      if ( pool_req_.get_is_err() ) {
        return fail( "stake pool", pool_req_ );
      }
      if ( epoch_req_.get_is_err() ) {
        return fail( "epoch info", epoch_req_ );
      }
      if ( rent_req_.get_is_err() ) {
        return fail( "rent exemption", rent_req_ );
      }
      stake_pool_account& acc = snap_.pool_;
      if ( !acc.init_from_buf( pool_req_.get_data(),
                               pool_req_.get_data_len() ) ) {
        return fail( "stake pool", acc );
      }
      snap_.total_lamports_ = acc.total_lamports_;
      snap_.epoch_ = epoch_req_.get_epoch();
      snap_.stake_rent_exemption_ = rent_req_.get_lamports();

      // then the accounts referenced by the pool
      list_req_.set_account( acc.validator_list_ );
      list_req_.set_commitment( cmt_ );
      reserve_req_.set_account( acc.reserve_stake_ );
      reserve_req_.set_commitment( cmt_ );
      clnt_->send( &list_req_ );
      clnt_->send( &reserve_req_ );
      st_ = e_read_list;
      return false;
    }
    case e_read_list: {
      if ( !list_req_.get_is_recv() || !reserve_req_.get_is_recv() ) {
        return false;
      }
      if ( list_req_.get_is_err() ) {
        return fail( "validator list", list_req_ );
      }
      if ( reserve_req_.get_is_err() ) {
        return fail( "reserve stake", reserve_req_ );
      }
      validator_list_account lst;
      if ( !lst.init_from_buf( list_req_.get_data(),
                               list_req_.get_data_len() ) ) {
        return fail( "validator list", lst );
      }
      snap_.validators_ = lst.get_validators();
      snap_.reserve_lamports_ = reserve_req_.get_lamports();
      st_ = e_done;
      log_snapshot();
      return true;
    }
  }
  return true;
}

void snapshot_reader::log_snapshot()
{
  uint64_t active = 0, transient = 0;
  for( const validator_stake_info& v: snap_.validators_ ) {
    active += v.active_stake_lamports_;
    transient += v.transient_stake_lamports_;
  }
  SP_LOG_INF( "snapshot" )
    .add( "pool", snap_.pool_key_ )
    .add( "epoch", snap_.epoch_ )
    .add( "pool_update_epoch", snap_.pool_.last_update_epoch_ )
    .add( "total", str( lamports_to_str( snap_.total_lamports_ ) ) )
    .add( "reserve", str( lamports_to_str( snap_.reserve_lamports_ ) ) )
    .add( "num_validators", (uint64_t)snap_.validators_.size() )
    .add( "stake_rent", snap_.stake_rent_exemption_ )
    .end();

  // reads are not atomic so balances may be skewed slightly
  uint64_t sum = snap_.reserve_lamports_ + active + transient;
  if ( sum != snap_.total_lamports_ ) {
    SP_LOG_DBG( "snapshot skew" )
      .add( "total", snap_.total_lamports_ )
      .add( "accounted", sum )
      .end();
  }
}
