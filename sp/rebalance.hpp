#pragma once

#include <sp/snapshot.hpp>

// 1% of one coin
#define SP_MIN_INCREASE_LAMPORTS  10000000UL

namespace sp
{

  // explicit inputs to one planning pass
  struct plan_config
  {
    plan_config();
    uint64_t retained_reserve_;      // kept in reserve, never staked
    uint64_t stake_rent_exemption_;  // cost of each new transient account
    uint64_t min_increase_;          // smallest increase worth making
  };

  enum action_type
  {
    e_increase = 0,
    e_decrease
  };

  const char *action_type_to_str( action_type );

  // single stake movement between reserve and one validator
  struct rebalance_action
  {
    rebalance_action();
    rebalance_action( action_type, const pub_key& vote, uint64_t lamports );

    action_type type_;
    pub_key     vote_;
    uint64_t    lamports_;

    // move via ephemeral stake account (never set by the planner)
    bool        has_ephemeral_;
    uint64_t    ephemeral_seed_;
  };

  typedef std::vector<rebalance_action> action_vec_t;

  // why a plan came out the way it did
  enum plan_status
  {
    e_plan_ok = 0,
    e_plan_no_validators,
    e_plan_reserve_exceeds_total
  };

  const char *plan_status_to_str( plan_status );

  struct plan_stats
  {
    plan_stats();
    plan_status status_;
    uint64_t    usable_total_;
    uint64_t    target_;         // per validator after rent correction
    unsigned    num_validator_;
    unsigned    num_busy_;       // skipped with transient stake in flight
    unsigned    num_increase_;
    unsigned    num_decrease_;
    unsigned    num_skip_;       // below thresholds or at target
  };

  // compute stake movements converging the pool to even distribution
  // across all validators. actions come out in validator list order,
  // at most one per validator. an empty plan is a valid outcome.
  void plan_rebalance( const pool_snapshot&, const plan_config&,
                       action_vec_t& res, plan_stats& stats );

}
