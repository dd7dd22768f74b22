#pragma once

#include <sp/net_socket.hpp>
#include <sp/rpc_client.hpp>
#include <sp/snapshot.hpp>
#include <sp/rebalance.hpp>
#include <sp/executor.hpp>

#define SP_VERSION            "1.0.0"
#define SP_RPC_HTTP_PORT      8899
#define SP_RECONNECT_TIMEOUT  (120L*SP_NSECS_IN_SEC)
#define SP_REQUEST_TIMEOUT    (30L*SP_NSECS_IN_SEC)

// status bits
#define SP_RPC_CONNECTED      (1<<0)
#define SP_HAS_BLOCK_HASH     (1<<1)

namespace sp
{

  // stake pool client connection management and rebalance driver
  class manager : public error,
                  public rpc_sub,
                  public rpc_sub_i<rpc::get_latest_block_hash>
  {
  public:

    manager();
    virtual ~manager();

    // solana rpc http connection host[:port]
    void set_rpc_host( const std::string& );

    // account read and confirmation commitment (default confirmed)
    void set_commitment( commitment );
    commitment get_commitment() const;

    // stake pool program id
    void set_program( const pub_key& );
    const pub_key& get_program() const;

    // staker authority and fee payer for all transactions
    void set_staker( const key_pair * );

    // smallest increase the planner will emit
    void set_min_increase( uint64_t );

    // transaction confirmation timeout in nanoseconds
    void set_confirm_timeout( int64_t );

    // plan only and do not submit transactions
    void set_dry_run( bool );

    // rpc client interface
    rpc_client *get_rpc_client();

    // most recently fetched block hash
    const hash& get_block_hash() const;

    // check status condition
    bool has_status( int status ) const;

    // connect to rpc node
    bool init();

    // poll until connected with a recent block hash or in error
    bool bootstrap();

    // poll for socket updates and reconnect when disconnected
    void poll( bool do_wait = true );

    // read pool snapshot
    bool read_snapshot( const pub_key& pool, pool_snapshot& );

    // current epoch
    bool get_epoch( uint64_t& );

    // refresh validator list and pool balances if not yet done this epoch
    bool update_pool( const pool_snapshot&, bool& is_updated );

    // submit queued transactions in executor and wait for all outcomes
    bool execute( executor& );

    // one full pass: read, update when stale, plan and execute
    bool rebalance( const pub_key& pool, uint64_t retained_reserve,
                    executor&, plan_stats& );

    // manual stake movement for one validator
    bool move_stake( const pub_key& pool, const rebalance_action&,
                     executor& );

    // shut-down connection
    void teardown();

    void on_response( rpc::get_latest_block_hash * ) override;

  private:

    bool wait( rpc_request * );
    bool refresh_block_hash();
    bool init_builder( const pool_snapshot&, pool_builder& );
    void init_executor( executor& );
    void reconnect_rpc();
    void set_status( int );

    net_loop    nl_;      // epoll loop
    tcp_connect hconn_;   // rpc http connection
    rpc_client  clnt_;    // rpc api
    std::string rhost_;   // rpc host
    pub_key     pgm_;     // stake pool program
    const key_pair *kp_;  // staker authority
    commitment  cmt_;
    uint64_t    min_inc_;
    int64_t     ctimeout_;
    int64_t     cts_;
    int64_t     tx_timeout_;
    int         status_;
    bool        dry_run_;
    hash        bhash_;
    rpc::get_latest_block_hash breq_;
    rpc::get_epoch_info        ereq_;
    snapshot_reader            rdr_;
  };

}
