#include "rebalance.hpp"
#include "log.hpp"

using namespace sp;

plan_config::plan_config()
: retained_reserve_( 0 ),
  stake_rent_exemption_( 0 ),
  min_increase_( SP_MIN_INCREASE_LAMPORTS )
{
}

const char *sp::action_type_to_str( action_type typ )
{
  return typ == e_increase ? "increase" : "decrease";
}

rebalance_action::rebalance_action()
: type_( e_increase ),
  lamports_( 0 ),
  has_ephemeral_( false ),
  ephemeral_seed_( 0 )
{
}

rebalance_action::rebalance_action( action_type typ, const pub_key& vote,
                                    uint64_t lamports )
: type_( typ ),
  vote_( vote ),
  lamports_( lamports ),
  has_ephemeral_( false ),
  ephemeral_seed_( 0 )
{
}

const char *sp::plan_status_to_str( plan_status st )
{
  switch( st ) {
    case e_plan_ok: return "ok";
    case e_plan_no_validators: return "no_validators";
    case e_plan_reserve_exceeds_total: return "reserve_exceeds_total";
  }
  return "unknown";
}

plan_stats::plan_stats()
: status_( e_plan_ok ),
  usable_total_( 0 ),
  target_( 0 ),
  num_validator_( 0 ),
  num_busy_( 0 ),
  num_increase_( 0 ),
  num_decrease_( 0 ),
  num_skip_( 0 )
{
}

static void log_skip( const char *why, const validator_stake_info& v,
                      uint64_t delta )
{
  SP_LOG_INF( "skip validator" )
    .add( "vote", v.vote_account_address_ )
    .add( "reason", why )
    .add( "active", v.active_stake_lamports_ )
    .add( "transient", v.transient_stake_lamports_ )
    .add( "delta", delta )
    .end();
}

void sp::plan_rebalance( const pool_snapshot& snap, const plan_config& cfg,
                         action_vec_t& res, plan_stats& stats )
{
  res.clear();
  stats = plan_stats();
  const validator_vec_t& vals = snap.validators_;
  uint64_t num = vals.size();
  stats.num_validator_ = (unsigned)num;
  if ( num == 0 ) {
    stats.status_ = e_plan_no_validators;
    SP_LOG_INF( "nothing to do" )
      .add( "reason", plan_status_to_str( stats.status_ ) )
      .end();
    return;
  }
  if ( cfg.retained_reserve_ > snap.total_lamports_ ) {
    stats.status_ = e_plan_reserve_exceeds_total;
    SP_LOG_INF( "nothing to do" )
      .add( "reason", plan_status_to_str( stats.status_ ) )
      .add( "total", snap.total_lamports_ )
      .add( "retained", cfg.retained_reserve_ )
      .end();
    return;
  }
  uint64_t usable = snap.total_lamports_ - cfg.retained_reserve_;

  // busy validators still count towards the even share
  uint64_t target = usable / num;
  uint64_t num_inc = 0;
  for( const validator_stake_info& v: vals ) {
    if ( v.transient_stake_lamports_ == 0 &&
         v.active_stake_lamports_ < target ) {
      ++num_inc;
    }
  }

  // each increase funds a new transient account from the reserve
  uint64_t rent = num_inc * cfg.stake_rent_exemption_;
  usable = usable > rent ? usable - rent : 0;
  target = usable / num;
  stats.usable_total_ = usable;
  stats.target_ = target;

  for( const validator_stake_info& v: vals ) {
    uint64_t active = v.active_stake_lamports_;
    if ( v.transient_stake_lamports_ != 0 ) {
      ++stats.num_busy_;
      log_skip( "busy", v, 0 );
      continue;
    }
    if ( active > target ) {
      uint64_t delta = active - target;
      if ( delta <= cfg.stake_rent_exemption_ ) {
        ++stats.num_skip_;
        log_skip( "decrease_below_rent", v, delta );
        continue;
      }
      res.emplace_back( e_decrease, v.vote_account_address_, delta );
      ++stats.num_decrease_;
    } else if ( active < target ) {
      uint64_t delta = target - active;
      if ( delta < cfg.min_increase_ ) {
        ++stats.num_skip_;
        log_skip( "increase_below_minimum", v, delta );
        continue;
      }
      res.emplace_back( e_increase, v.vote_account_address_, delta );
      ++stats.num_increase_;
    } else {
      ++stats.num_skip_;
      log_skip( "at_target", v, 0 );
    }
  }
  SP_LOG_INF( "plan" )
    .add( "usable_total", stats.usable_total_ )
    .add( "target", stats.target_ )
    .add( "num_validators", stats.num_validator_ )
    .add( "num_busy", stats.num_busy_ )
    .add( "num_increase", stats.num_increase_ )
    .add( "num_decrease", stats.num_decrease_ )
    .add( "num_skip", stats.num_skip_ )
    .end();
}
