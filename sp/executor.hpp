#pragma once

#include <sp/rebalance.hpp>
#include <sp/transaction.hpp>

// default time to wait for confirmation of submitted transactions
#define SP_CONFIRM_TIMEOUT   (60L*SP_NSECS_IN_SEC)
#define SP_STATUS_INTERVAL   (500L*SP_NSECS_IN_MSEC)

namespace sp
{

  // outcome of one submitted transaction
  enum action_status
  {
    e_action_pending = 0,  // not yet submitted or confirmed
    e_action_confirmed,
    e_action_rejected,     // build, preflight or on-chain failure
    e_action_timeout       // no confirmation before timeout
  };

  const char *action_status_to_str( action_status );

  struct action_result
  {
    action_result();
    std::string      name_;
    bool             is_action_;  // act_ describes a stake movement
    rebalance_action act_;
    action_status    status_;
    signature        sig_;
    std::string      err_;
  };

  // submits independent transactions concurrently and tracks each to
  // confirmation. failures are per transaction and never retried.
  class executor : public error,
                   public rpc_sub,
                   public rpc_sub_i<rpc::send_transaction>,
                   public rpc_sub_i<rpc::get_signature_statuses>
  {
  public:
    executor();
    virtual ~executor();

    void set_rpc_client( rpc_client * );

    // transaction fee payer and pool staker authority
    void set_staker( const key_pair * );

    // confirmation level to wait for (default confirmed)
    void set_commitment( commitment );
    commitment get_commitment() const;

    // confirmation timeout in nanoseconds (default 60 seconds)
    void set_timeout( int64_t );
    int64_t get_timeout() const;

    // recent block hash for all queued transactions
    void set_block_hash( const hash& );

    // queue one transaction per rebalance action
    void add_actions( pool_builder&, const pool_snapshot&,
                      const action_vec_t& );

    // queue a transaction of arbitrary pool instructions
    void add_job( const std::string& name,
                  const std::vector<instruction>& );

    // dispatch all queued transactions without waiting for replies
    void submit();

    // process replies and timeouts (true once every job is resolved)
    bool poll();
    bool get_is_done() const;

    // per transaction results in queue order
    unsigned get_num_result() const;
    const action_result& get_result( unsigned ) const;
    unsigned get_num_status( action_status ) const;

    // drop all jobs
    void clear();

    void on_response( rpc::send_transaction * ) override;
    void on_response( rpc::get_signature_statuses * ) override;

  private:

    struct job {
      job();
      ~job();
      action_result             res_;
      std::vector<instruction>  ixs_;
      rpc::send_transaction    *req_;
      bool                      is_sent_;  // signature accepted by node
    };

    typedef std::vector<job*> job_vec_t;

    void resolve( job *, action_status, const std::string& err );
    void poll_status();
    void log_result( const job * );

    rpc_client                  *clnt_;
    const key_pair              *kp_;
    commitment                   cmt_;
    int64_t                      timeout_;
    int64_t                      sub_ts_;
    int64_t                      stat_ts_;
    hash                         bhash_;
    job_vec_t                    jobs_;
    job_vec_t                    sreq_jobs_; // jobs in status request
    rpc::get_signature_statuses  sreq_;
    bool                         sreq_wait_;
    unsigned                     num_open_;
  };

}
