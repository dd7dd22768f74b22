#pragma once

#include <sp/net_socket.hpp>
#include <sp/jtree.hpp>
#include <sp/key_pair.hpp>

#include <unordered_map>

#define SP_RPC_ERROR_BLOCK_CLEANED_UP          -32001
#define SP_RPC_ERROR_SEND_TX_PREFLIGHT_FAIL    -32002
#define SP_RPC_ERROR_TX_SIG_VERIFY_FAILURE     -32003
#define SP_RPC_ERROR_BLOCK_NOT_AVAILABLE       -32004
#define SP_RPC_ERROR_NODE_UNHEALTHY            -32005
#define SP_RPC_ERROR_TX_PRECOMPILE_VERIFY_FAIL -32006
#define SP_RPC_ERROR_SLOT_SKIPPED              -32007
#define SP_RPC_ERROR_NO_SNAPSHOT               -32008
#define SP_RPC_ERROR_LONG_TERM_SLOT_SKIPPED    -32009

namespace sp
{
  class rpc_request;

  // commitment status of account on blockchain
  enum commitment
  {
    e_unknown = 0,
    e_processed,
    e_confirmed,
    e_finalized,
    e_last_commitment
  };

  str commitment_to_str( commitment );
  commitment str_to_commitment( str );

  // solana rpc REST API client
  class rpc_client : public error
  {
  public:

    rpc_client();
    ~rpc_client();

    // rpc http connection
    void set_http_conn( tcp_connect * );

    // submit rpc request (and bundled callback)
    void send( rpc_request * );

    // stop tracking request without waiting for reply
    void cancel( rpc_request * );

    // number of requests waiting for a reply
    size_t get_num_pending() const;

    // fail all outstanding requests e.g. on connection loss
    void fail_all( const std::string& );

  public:

    // parse json payload and invoke callback
    // (false if the payload does not identify a request)
    bool parse_response( const char *msg, size_t msg_len );

    // decode account data of given encoding ("base64" or "base64+zstd")
    bool get_data( str enc, str data, std::vector<char>& res );

    // reset state
    void reset();

  private:

    struct rpc_http : public http_client {
      void parse_status( int, const char *, size_t ) override;
      void parse_content( const char *, size_t ) override;
      rpc_client *cp_;
      int         status_;
    };

    typedef std::unordered_map< uint64_t, rpc_request* > request_t;
    typedef std::vector<uint64_t>     id_vec_t;
    typedef std::vector<char>         acc_buf_t;

    void parse_error( int status );

    tcp_connect *hptr_;
    rpc_http     hp_;    // http parser wrapper
    jtree        jp_;    // json parser
    request_t    rv_;    // waiting requests by id
    id_vec_t     reuse_; // reuse id list
    acc_buf_t    abuf_;  // account decode buffer
    uint64_t     id_;    // next request id
    void        *cxt_;   // zstd decompression context
  };

  // rpc response or subscrption callback
  class rpc_sub
  {
  public:
    virtual ~rpc_sub() {}
  };

  // rpc subscription callback for request type T
  template<class T>
  class rpc_sub_i
  {
  public:
    virtual ~rpc_sub_i() {}
    virtual void on_response( T * ) = 0;
  };

  // base-class rpc request message
  class rpc_request : public error
  {
  public:
    rpc_request();
    virtual ~rpc_request();

    // corresponding rpc_client
    void set_rpc_client( rpc_client * );
    rpc_client *get_rpc_client() const;

    // request id
    void set_id( uint64_t );
    uint64_t get_id() const;

    // error code
    void set_err_code( int );
    int get_err_code() const;

    // time sent
    void set_sent_time( int64_t );
    int64_t get_sent_time() const;

    // time received reply
    void set_recv_time( int64_t );
    int64_t get_recv_time() const;

    // have we received a reply (or failed)
    bool get_is_recv() const;

    // rpc response callback
    void set_sub( rpc_sub * );
    rpc_sub *get_sub() const;

    // request builder
    virtual void request( json_wtr& ) = 0;

    // response parsing and callback
    virtual void response( const jtree& ) = 0;

  protected:

    template<class T> void on_response( T * );
    template<class T> bool on_error( const jtree&, T * );

  private:
    rpc_sub    *cb_;
    rpc_client *cp_;
    uint64_t    id_;
    int         ec_;
    int64_t     sent_ts_;
    int64_t     recv_ts_;
  };

  /////////////////////////////////////////////////////////////////////////
  // wrappers for various solana rpc requests

  namespace rpc
  {
    // latest block hash
    class get_latest_block_hash : public rpc_request
    {
    public:
      get_latest_block_hash();

      // parameters
      void set_commitment( commitment );

      // results
      uint64_t get_slot() const;
      const hash& get_block_hash() const;
      uint64_t get_last_valid_block_height() const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      commitment cmt_;
      uint64_t   slot_;
      hash       bhash_;
      uint64_t   height_;
    };

    // current epoch and position within epoch
    class get_epoch_info : public rpc_request
    {
    public:
      get_epoch_info();

      // parameters
      void set_commitment( commitment );

      // results
      uint64_t get_epoch() const;
      uint64_t get_slot_index() const;
      uint64_t get_slots_in_epoch() const;
      uint64_t get_absolute_slot() const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      commitment cmt_;
      uint64_t   epoch_;
      uint64_t   slot_idx_;
      uint64_t   slots_;
      uint64_t   abs_slot_;
    };

    // minimum balance for an account of given size to be rent exempt
    class get_minimum_balance_for_rent_exemption : public rpc_request
    {
    public:
      get_minimum_balance_for_rent_exemption();

      // parameters
      void set_size( uint64_t );

      // results
      uint64_t get_lamports() const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      uint64_t sz_;
      uint64_t lamports_;
    };

    // get account balance, program data and account meta-data
    class get_account_info : public rpc_request
    {
    public:
      get_account_info();

      // parameters
      void set_account( const pub_key& );
      const pub_key& get_account() const;
      void set_commitment( commitment );

      // results
      uint64_t get_slot() const;
      uint64_t get_lamports() const;
      const pub_key& get_owner() const;
      bool get_is_executable() const;
      const char *get_data() const;
      size_t get_data_len() const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      typedef std::vector<char> data_t;
      pub_key    acc_;
      commitment cmt_;
      uint64_t   slot_;
      uint64_t   lamports_;
      pub_key    owner_;
      bool       is_exec_;
      data_t     data_;
    };

    // submit signed transaction
    class send_transaction : public rpc_request
    {
    public:
      send_transaction();

      // parameters
      void set_transaction( const char *buf, size_t len );
      void set_preflight_commitment( commitment );

      // results
      const signature& get_signature() const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      typedef std::vector<char> buf_t;
      buf_t      tx_;
      commitment cmt_;
      signature  sig_;
    };

    // confirmation status of previously submitted transactions
    class get_signature_statuses : public rpc_request
    {
    public:
      struct status {
        bool        found_;    // known to the node
        uint64_t    slot_;
        commitment  cmt_;      // confirmation level reached
        bool        is_err_;   // transaction failed on chain
        std::string err_;      // on-chain error description
      };

      get_signature_statuses();

      // parameters
      void add_signature( const signature& );
      void clear();

      // results (one per signature in request order)
      unsigned get_num_status() const;
      const status& get_status( unsigned ) const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      typedef std::vector<signature> sig_vec_t;
      typedef std::vector<status>    status_vec_t;
      sig_vec_t    sigs_;
      status_vec_t res_;
    };

  }

}
