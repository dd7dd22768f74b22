#pragma once

#include <sp/rpc_client.hpp>
#include <sp/stake_pool.hpp>

namespace sp
{

  // state of one stake pool as of one ledger read sequence
  struct pool_snapshot
  {
    pool_snapshot();

    uint64_t           total_lamports_;
    uint64_t           reserve_lamports_;
    validator_vec_t    validators_;    // in on-chain list order

    // context needed to build transactions against the pool
    pub_key            pool_key_;
    stake_pool_account pool_;
    uint64_t           epoch_;
    uint64_t           stake_rent_exemption_;
  };

  // reads stake pool, validator list and reserve accounts plus epoch
  // and stake account rent exemption into a pool_snapshot
  class snapshot_reader : public error
  {
  public:
    snapshot_reader();

    void set_rpc_client( rpc_client * );
    void set_pool( const pub_key& );
    void set_commitment( commitment );

    // submit first set of reads
    void start();

    // advance read sequence on replies (true once done or failed)
    bool poll();
    bool get_is_done() const;

    const pool_snapshot& get_snapshot() const;

  private:

    typedef enum {
      e_idle = 0,
      e_read_pool,
      e_read_list,
      e_done
    } state_t;

    bool fail( const char *what, const error& );
    void log_snapshot();

    rpc_client   *clnt_;
    commitment    cmt_;
    state_t       st_;
    pool_snapshot snap_;
    rpc::get_account_info pool_req_;
    rpc::get_account_info list_req_;
    rpc::get_account_info reserve_req_;
    rpc::get_epoch_info   epoch_req_;
    rpc::get_minimum_balance_for_rent_exemption rent_req_;
  };

}
