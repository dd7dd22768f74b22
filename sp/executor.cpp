#include "executor.hpp"
#include "log.hpp"

using namespace sp;

const char *sp::action_status_to_str( action_status st )
{
  switch( st ) {
    case e_action_pending: return "pending";
    case e_action_confirmed: return "confirmed";
    case e_action_rejected: return "rejected";
    case e_action_timeout: return "timeout";
  }
  return "unknown";
}

action_result::action_result()
: is_action_( false ),
  status_( e_action_pending )
{
}

executor::job::job()
: req_( nullptr ),
  is_sent_( false )
{
}

executor::job::~job()
{
  delete req_;
}

executor::executor()
: clnt_( nullptr ),
  kp_( nullptr ),
  cmt_( e_confirmed ),
  timeout_( SP_CONFIRM_TIMEOUT ),
  sub_ts_( 0L ),
  stat_ts_( 0L ),
  sreq_wait_( false ),
  num_open_( 0 )
{
}

executor::~executor()
{
  clear();
}

void executor::set_rpc_client( rpc_client *clnt )
{
  clnt_ = clnt;
}

void executor::set_staker( const key_pair *kp )
{
  kp_ = kp;
}

void executor::set_commitment( commitment cmt )
{
  cmt_ = cmt;
}

commitment executor::get_commitment() const
{
  return cmt_;
}

void executor::set_timeout( int64_t timeout )
{
  timeout_ = timeout;
}

int64_t executor::get_timeout() const
{
  return timeout_;
}

void executor::set_block_hash( const hash& bhash )
{
  bhash_ = bhash;
}

void executor::clear()
{
  if ( sreq_wait_ && clnt_ ) {
    clnt_->cancel( &sreq_ );
  }
  sreq_wait_ = false;
  sreq_jobs_.clear();
  for( job *jp: jobs_ ) {
    delete jp;
  }
  jobs_.clear();
  num_open_ = 0;
  reset_err();
}

void executor::add_actions( pool_builder& bld, const pool_snapshot& snap,
                            const action_vec_t& acts )
{
  for( const rebalance_action& act: acts ) {
    job *jp = new job;
    jobs_.push_back( jp );
    ++num_open_;
    jp->res_.name_ = action_type_to_str( act.type_ );
    jp->res_.is_action_ = true;
    jp->res_.act_ = act;

    // locate validator entry for stake account seeds
    const validator_stake_info *info = nullptr;
    for( const validator_stake_info& v: snap.validators_ ) {
      if ( v.vote_account_address_ == act.vote_ ) {
        info = &v;
        break;
      }
    }
    if ( !info ) {
      resolve( jp, e_action_rejected, "validator not in pool" );
      continue;
    }
    instruction ix;
    bool ok;
    if ( act.type_ == e_increase ) {
      ok = act.has_ephemeral_ ?
        bld.increase_additional( ix, *info, act.lamports_,
                                 act.ephemeral_seed_ ) :
        bld.increase( ix, *info, act.lamports_ );
    } else {
      ok = act.has_ephemeral_ ?
        bld.decrease_additional( ix, *info, act.lamports_,
                                 act.ephemeral_seed_ ) :
        bld.decrease( ix, *info, act.lamports_ );
    }
    if ( !ok ) {
      resolve( jp, e_action_rejected, bld.get_err_msg() );
      continue;
    }
    jp->ixs_.push_back( ix );
  }
}

void executor::add_job( const std::string& name,
                        const std::vector<instruction>& ixs )
{
  job *jp = new job;
  jobs_.push_back( jp );
  ++num_open_;
  jp->res_.name_ = name;
  jp->ixs_ = ixs;
}

void executor::submit()
{
  sub_ts_ = stat_ts_ = get_now();
  for( job *jp: jobs_ ) {
    if ( jp->res_.status_ != e_action_pending || jp->req_ ) {
      continue;
    }
    if ( !kp_ ) {
      resolve( jp, e_action_rejected, "missing staker key" );
      continue;
    }
    transaction tx;
    tx.set_fee_payer( kp_ );
    tx.set_block_hash( bhash_ );
    for( const instruction& ix: jp->ixs_ ) {
      tx.add( ix );
    }
    if ( !tx.build() ) {
      resolve( jp, e_action_rejected, tx.get_err_msg() );
      continue;
    }
    jp->res_.sig_ = tx.get_signature();
    jp->req_ = new rpc::send_transaction;
    jp->req_->set_transaction( tx.get_data(), tx.get_size() );
    jp->req_->set_preflight_commitment( cmt_ );
    jp->req_->set_sub( this );
    SP_LOG_DBG( "submit" )
      .add( "name", str( jp->res_.name_ ) )
      .add( "sig", jp->res_.sig_ )
      .add( "size", (uint64_t)tx.get_size() )
      .end();
    clnt_->send( jp->req_ );
  }
}

void executor::resolve( job *jp, action_status st, const std::string& err )
{
  if ( jp->res_.status_ != e_action_pending ) {
    return;
  }
  jp->res_.status_ = st;
  jp->res_.err_ = err;
  --num_open_;
  log_result( jp );
}

void executor::log_result( const job *jp )
{
  const action_result& res = jp->res_;
  int lvl = res.status_ == e_action_confirmed ?
    SP_LOG_INF_LVL : SP_LOG_ERR_LVL;
  if ( !log::has_level( lvl ) ) {
    return;
  }
  log_line ln = log::add( action_status_to_str( res.status_ ), lvl );
  ln.add( "name", str( res.name_ ) );
  if ( res.is_action_ ) {
    ln.add( "vote", res.act_.vote_ );
    ln.add( "lamports", res.act_.lamports_ );
  }
  if ( jp->req_ ) {
    ln.add( "sig", res.sig_ );
  }
  if ( !res.err_.empty() ) {
    ln.add( "error", str( res.err_ ) );
  }
  ln.end();
}

void executor::on_response( rpc::send_transaction *req )
{
  for( job *jp: jobs_ ) {
    if ( jp->req_ != req ) {
      continue;
    }
    if ( req->get_is_err() ) {
      resolve( jp, e_action_rejected, req->get_err_msg() );
    } else {
      jp->is_sent_ = true;
      SP_LOG_DBG( "sent" )
        .add( "name", str( jp->res_.name_ ) )
        .add( "sig", req->get_signature() )
        .end();
    }
    break;
  }
}

void executor::on_response( rpc::get_signature_statuses *req )
{
  sreq_wait_ = false;
  if ( req->get_is_err() ) {
    SP_LOG_WRN( "signature status error" )
      .add( "error", str( req->get_err_msg() ) )
      .end();
    return;
  }
  for( unsigned i=0; i != req->get_num_status() &&
                     i != sreq_jobs_.size(); ++i ) {
    const rpc::get_signature_statuses::status& st = req->get_status( i );
    job *jp = sreq_jobs_[i];
    if ( !st.found_ ) {
      continue;
    }
    if ( st.is_err_ ) {
      resolve( jp, e_action_rejected, st.err_ );
    } else if ( st.cmt_ >= cmt_ ) {
      resolve( jp, e_action_confirmed, std::string() );
    }
  }
  sreq_jobs_.clear();
}

void executor::poll_status()
{
  sreq_.clear();
  sreq_jobs_.clear();
  for( job *jp: jobs_ ) {
    if ( jp->res_.status_ == e_action_pending && jp->is_sent_ ) {
      sreq_.add_signature( jp->res_.sig_ );
      sreq_jobs_.push_back( jp );
    }
  }
  if ( sreq_jobs_.empty() ) {
    return;
  }
  sreq_.set_sub( this );
  sreq_wait_ = true;
  clnt_->send( &sreq_ );
}

bool executor::poll()
{
  // submissions failed before reaching the node
  for( job *jp: jobs_ ) {
    if ( jp->res_.status_ == e_action_pending && jp->req_ &&
         !jp->is_sent_ && jp->req_->get_is_recv() &&
         jp->req_->get_is_err() ) {
      resolve( jp, e_action_rejected, jp->req_->get_err_msg() );
    }
  }
  if ( sreq_wait_ && sreq_.get_is_recv() ) {
    on_response( &sreq_ );
  }
  if ( num_open_ == 0 ) {
    return true;
  }

  // confirmation timeout
  int64_t now = get_now();
  if ( now - sub_ts_ > timeout_ ) {
    for( job *jp: jobs_ ) {
      resolve( jp, e_action_timeout, "not confirmed after " +
          std::to_string( timeout_ / SP_NSECS_IN_SEC ) + "s" );
    }
    if ( sreq_wait_ ) {
      clnt_->cancel( &sreq_ );
      sreq_wait_ = false;
    }
    return true;
  }

  // periodically query status of accepted signatures
  if ( !sreq_wait_ && now - stat_ts_ > SP_STATUS_INTERVAL ) {
    stat_ts_ = now;
    poll_status();
  }
  return false;
}

bool executor::get_is_done() const
{
  return num_open_ == 0;
}

unsigned executor::get_num_result() const
{
  return jobs_.size();
}

const action_result& executor::get_result( unsigned i ) const
{
  return jobs_[i]->res_;
}

unsigned executor::get_num_status( action_status st ) const
{
  unsigned num = 0;
  for( const job *jp: jobs_ ) {
    if ( jp->res_.status_ == st ) {
      ++num;
    }
  }
  return num;
}
