#pragma once

#include <sp/error.hpp>
#include <sp/key_pair.hpp>
#include <sp/misc.hpp>
#include <sys/epoll.h>
#include <vector>

namespace sp
{

  // network message buffer
  struct net_buf
  {
    static const uint16_t len = 1270;
    net_buf *next_;
    uint16_t size_;
    char     buf_[len];
    void dealloc();
    static net_buf *alloc();
  };

  // network message writer
  class net_wtr
  {
  public:
    net_wtr();
    ~net_wtr();
    void add( char );
    void add( str );
    void add( net_wtr& );
    void detach( net_buf *&hd, net_buf *&tl );
    size_t size() const;
    void reset();

  protected:
    void add_alloc( str );
    void alloc();
    void dealloc();
    void advance( size_t len );
    char *reserve( size_t len );
    net_buf *hd_;
    net_buf *tl_;
    size_t   sz_;
  };

  // parse inbound fragmented messages from streaming protocols
  class net_parser : public error
  {
  public:
    virtual ~net_parser();

    // parse inbound message
    virtual bool parse( const char *buf, size_t sz, size_t& len ) = 0;
  };

  class net_socket;

  // epoll-based loop
  class net_loop : public error
  {
  public:
    net_loop();
    ~net_loop();

    // initialize
    bool init();

    // add/delete sockets to epoll loop
    void add( net_socket *, int events );
    void del( net_socket * );

    // poll all connected sockets
    bool poll( int timeout );

  private:

    static const int max_events_ = 128;

    int         fd_;                 // epoll file descriptor
    epoll_event ev_[1];              // event used in epoll_ctl
    epoll_event evarr_[max_events_]; // receive events
  };

  // socket-based network source
  class net_socket : public error
  {
  public:

    net_socket();
    virtual ~net_socket();

    // file descriptor access
    int get_fd() const;
    void set_fd( int );

    // associated epoll loop
    void set_net_loop( net_loop * );
    net_loop *get_net_loop() const;

    // close connection
    void close();

    // set socket blocking flag
    bool set_block( bool block );

    // flag indicating if part of net_loop
    void set_in_loop( bool );
    bool get_in_loop() const;

    // initialize
    virtual bool init();

    // poll socket
    virtual void poll();

    // teardown connection and clean-up
    virtual void teardown();

  private:
    int        fd_;  // socket
    bool       inl_; // in-loop flag
    net_loop  *lp_;  // optional event_loop
  };

  // read/write client connection
  class net_connect : public net_socket
  {
  public:
    net_connect();
    ~net_connect();

    // associated parser
    void set_net_parser( net_parser * );

    // send/receive polling
    void poll() override;
    void poll_send();
    void poll_recv();

    // add message to send queue
    void add_send( net_wtr& );

    // any messages in the send queue
    bool get_is_send() const;

    // drop all outbound messages
    void teardown() override;

  protected:

    typedef std::vector<char> buf_t;
    static const size_t buf_len = 2048;
    void poll_error( bool );
    void drop_send();

    buf_t       rdr_; // inbound message read buffer
    net_buf    *whd_; // head of writer queue
    net_buf    *wtl_; // tail of writer queue
    size_t      rsz_; // current read position
    uint16_t    wsz_; // current write position
    net_parser *np_;  // message parser
  };

  // tcp connector or client
  class tcp_connect : public net_connect
  {
  public:

    tcp_connect();

    // connection host
    void set_host( const std::string& );
    std::string get_host() const;

    // connection port
    void set_port( int port );
    int get_port() const;

    // (re)connect to host
    bool init() override;

  private:
    int         port_; // connection port
    std::string host_; // connection host
  };

  // http request message
  class http_request : public net_wtr
  {
  public:
    void init( const char *method="POST", const char *endpoint="/" );
    void add_hdr( const char *hdr, str );
    void add_hdr( const char *hdr, uint64_t val );
    void commit( net_wtr& );
  };

  // http client parser
  class http_client : public net_parser
  {
  public:
    bool parse( const char *buf, size_t sz, size_t& len ) override;
    virtual void parse_status( int, const char *, size_t);
    virtual void parse_header( const char *hdr, size_t hdr_len,
                               const char *val, size_t val_len);
    virtual void parse_content( const char *content, size_t content_len );
  };

  // streaming json message writer
  class json_wtr : public net_wtr
  {
  public:

    typedef enum { e_obj = 0, e_arr } type_t;

    struct jfalse {};

    json_wtr();
    void reset();

    // pop latest object/array
    void pop();

    // add key/value pair in object
    void add_key( str key, str val );
    void add_key( str key, uint64_t val );
    void add_key( str key, type_t );
    void add_key( str key, jfalse );

    // add array value
    void add_val( str val );
    void add_val( uint64_t );
    void add_val( type_t );
    void add_val( const hash& );
    void add_val( const signature& );
    void add_val_enc_base64( str val );

  private:

    typedef std::vector<type_t> type_vec_t;

    void add_key_only( str key );
    void add_obj();
    void add_arr();
    void add_first();
    void add_uint( uint64_t ival );
    void add_enc_base58( str );
    void add_enc_base64( str );
    void add_text( str );

    bool       first_;
    type_vec_t st_;
  };

}
