#include "net_socket.hpp"
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <strings.h>
#include <algorithm>

#define SP_EPOLL_FLAGS (EPOLLIN|EPOLLET|EPOLLRDHUP|EPOLLHUP|EPOLLERR)

namespace sp
{
  // net_buf allocation and caching scheme
  struct net_buf_alloc
  {
  public:
    net_buf_alloc();
    ~net_buf_alloc();
    net_buf *alloc();
    void dealloc( net_buf * );
  private:
    net_buf *ptr_;
  };

}

using namespace sp;

///////////////////////////////////////////////////////////////////////////
// net_buf_alloc

net_buf_alloc::net_buf_alloc()
: ptr_( nullptr )
{
  static_assert( sizeof( net_buf ) == 1280 );
}

net_buf_alloc::~net_buf_alloc()
{
  while( ptr_ ) {
    net_buf *nxt = ptr_->next_;
    delete ptr_;
    ptr_ = nxt;
  }
}

net_buf *net_buf_alloc::alloc()
{
  net_buf *res;
  if ( ptr_ ) {
    res  = ptr_;
    ptr_ = res->next_;
  } else {
    res = new net_buf;
  }
  res->next_ = nullptr;
  res->size_ = 0;
  return res;
}

void net_buf_alloc::dealloc( net_buf *ptr )
{
  ptr->next_ = ptr_;
  ptr_ = ptr;
}

static net_buf_alloc mem_;

net_buf *net_buf::alloc()
{
  return mem_.alloc();
}

void net_buf::dealloc()
{
  mem_.dealloc( this );
}

///////////////////////////////////////////////////////////////////////////
// net_wtr

net_wtr::net_wtr()
: hd_( mem_.alloc() ),
  tl_( hd_ ),
  sz_( 0 )
{
}

net_wtr::~net_wtr()
{
  dealloc();
}

void net_wtr::reset()
{
  dealloc();
  hd_ = tl_ = mem_.alloc();
  sz_ = 0;
}

void net_wtr::dealloc()
{
  for( net_buf *ptr = hd_; ptr; ) {
    net_buf *nxt = ptr->next_;
    ptr->dealloc();
    ptr = nxt;
  }
  hd_ = tl_ = nullptr;
}

void net_wtr::detach( net_buf *&hd, net_buf *&tl )
{
  hd  = hd_;
  tl  = tl_;
  hd_ = tl_ = mem_.alloc();
  sz_ = 0UL;
}

void net_wtr::alloc()
{
  net_buf *ptr = mem_.alloc();
  tl_->next_ = ptr;
  sz_ += tl_->size_;
  tl_ = ptr;
}

void net_wtr::add( str str )
{
  size_t nlen = tl_->size_ + str.len_;
  if ( nlen <= net_buf::len ) {
    __builtin_memcpy( &tl_->buf_[tl_->size_], str.str_, str.len_ );
    tl_->size_ = nlen;
  } else {
    add_alloc( str );
  }
}

void net_wtr::add( char val )
{
  if ( tl_->size_ == net_buf::len ) {
    alloc();
  }
  tl_->buf_[tl_->size_++] = val;
}

void net_wtr::add( net_wtr& buf )
{
  net_buf *hd, *tl;
  sz_ += tl_->size_ + buf.size();
  buf.detach( hd, tl );
  if ( tl_->size_ + hd->size_ <= net_buf::len ) {
    __builtin_memcpy( &tl_->buf_[tl_->size_], hd->buf_, hd->size_ );
    tl_->next_ = hd->next_;
    tl_->size_ += hd->size_;
    if ( hd != tl ) {
      tl_ = tl;
    }
    hd->dealloc();
  } else {
    tl_->next_ = hd;
    tl_ = tl;
  }
  sz_ -= tl_->size_;
}

void net_wtr::add_alloc( str str )
{
  while( str.len_ >0 ) {
    if ( tl_->size_ == net_buf::len ) {
      alloc();
    }
    size_t left = net_buf::len - tl_->size_;
    size_t mlen = std::min( left, str.len_ );
    __builtin_memcpy( &tl_->buf_[tl_->size_], str.str_, mlen );
    tl_->size_ += mlen;
    str.str_ += mlen;
    str.len_ -= mlen;
  }
}

char *net_wtr::reserve( size_t len )
{
  size_t nlen = tl_->size_ + len;
  if ( nlen > net_buf::len ) {
    alloc();
  }
  return &tl_->buf_[tl_->size_];
}

void net_wtr::advance( size_t len )
{
  tl_->size_ += len;
}

size_t net_wtr::size() const
{
  return sz_ + tl_->size_;
}

///////////////////////////////////////////////////////////////////////////
// net_loop

net_loop::net_loop()
: fd_(-1)
{
  __builtin_memset( ev_, 0, sizeof( ev_ ) );
  __builtin_memset( evarr_, 0, sizeof( evarr_ ) );
}

net_loop::~net_loop()
{
  if ( fd_ > 0 ) {
    ::close( fd_ );
    fd_ = -1;
  }
}

bool net_loop::init()
{
  fd_ = ::epoll_create( 1 );
  if ( fd_ < 0 ) {
    return set_err_msg( "failed to create epoll", errno );
  }
  return true;
}

void net_loop::add( net_socket *eptr, int events )
{
  ev_->events   = events;
  ev_->data.ptr = eptr;
  int evop = EPOLL_CTL_ADD;
  if ( eptr->get_in_loop() ) {
    evop = EPOLL_CTL_MOD;
  } else {
    eptr->set_in_loop( true );
  }
  epoll_ctl( fd_, evop, eptr->get_fd(), ev_ );
}

void net_loop::del( net_socket *eptr )
{
  if ( eptr->get_in_loop() ) {
    ev_->events   = 0;
    ev_->data.ptr = eptr;
    epoll_ctl( fd_, EPOLL_CTL_DEL, eptr->get_fd(), ev_ );
    eptr->set_in_loop( false );
  }
}

bool net_loop::poll( int timeout )
{
  int nfds = epoll_wait( fd_, evarr_, max_events_, timeout );
  if ( nfds > 0 ) {
    for(int i=0; i != nfds; ++i ) {
      epoll_event& ev = evarr_[i];
      net_socket *sptr = static_cast<net_socket*>( ev.data.ptr );
      sptr->poll();
      if ( sptr->get_is_err() ) {
        del( sptr );
        sptr->teardown();
      }
    }
    return true;
  } else {
    return false;
  }
}

///////////////////////////////////////////////////////////////////////////
// net_socket

net_parser::~net_parser()
{
}

net_socket::~net_socket()
{
}

net_socket::net_socket()
: fd_(-1),
  inl_( false ),
  lp_( nullptr )
{
}

int net_socket::get_fd() const
{
  return fd_;
}

void net_socket::set_fd( int fd )
{
  fd_ = fd;
}

void net_socket::set_net_loop( net_loop *lp )
{
  lp_ = lp;
}

net_loop *net_socket::get_net_loop() const
{
  return lp_;
}

void net_socket::set_in_loop( bool inl )
{
  inl_ = inl;
}

bool net_socket::get_in_loop() const
{
  return inl_;
}

void net_socket::close()
{
  if ( fd_ > 0 ) {
    if ( lp_ ) {
      lp_->del( this );
    }
    ::close( fd_ );
    fd_ = -1;
  }
}

void net_socket::poll()
{
}

void net_socket::teardown()
{
  close();
}

bool net_socket::set_block( bool block )
{
  int flags = ::fcntl( fd_, F_GETFL, 0 );
  if ( flags < 0 ){
    return set_err_msg( "fcntl() failed", errno );
  }
  if ( block ) {
    flags &= ~O_NONBLOCK;
  } else {
    flags |= O_NONBLOCK;
  }
  if ( 0 > ::fcntl( fd_, F_SETFL, flags ) ) {
    return set_err_msg( "fcntl() failed", errno );
  }
  return true;
}

bool net_socket::init()
{
  if ( lp_ ) {
    lp_->add( this, SP_EPOLL_FLAGS );
  }
  return true;
}

///////////////////////////////////////////////////////////////////////////
// net_connect

net_connect::net_connect()
: whd_( nullptr ),
  wtl_( nullptr ),
  rsz_( 0 ),
  wsz_( 0 ),
  np_( nullptr )
{
}

net_connect::~net_connect()
{
  drop_send();
}

void net_connect::set_net_parser( net_parser *np )
{
  np_ = np;
}

bool net_connect::get_is_send() const
{
  return whd_ != nullptr;
}

void net_connect::add_send( net_wtr& msg )
{
  net_buf *hd, *tl;
  msg.detach( hd, tl );
  if ( wtl_ ) {
    wtl_->next_ = hd;
  } else {
    whd_ = hd;
    if ( get_net_loop() ) {
      get_net_loop()->add( this, SP_EPOLL_FLAGS | EPOLLOUT );
    }
  }
  wtl_ = tl;
}

void net_connect::poll()
{
  if ( get_is_send() ) {
    poll_send();
  }
  poll_recv();
}

void net_connect::poll_send()
{
  if ( !whd_ || get_is_err() ) {
    return;
  }
  for(;;) {
    // skip empty buffers
    if ( wsz_ == whd_->size_ ) {
      net_buf *nxt = whd_->next_;
      whd_->dealloc();
      wsz_ = 0;
      if ( ! ( whd_ = nxt ) ) {
        wtl_ = nullptr;
        if ( get_net_loop() ) {
          get_net_loop()->add( this, SP_EPOLL_FLAGS );
        }
        break;
      }
      continue;
    }
    // write current buffer to socket
    char *ptr = &whd_->buf_[wsz_];
    uint16_t len = whd_->size_ - wsz_;
    ssize_t rc = ::send( get_fd(), ptr, len, MSG_NOSIGNAL );
    if ( rc > 0 ) {
      wsz_ += rc;
    } else {
      // check if this is not a try again sort of error
      if ( rc == 0 || errno != EAGAIN ) {
        poll_error( false );
      }
      break;
    }
  }
}

void net_connect::poll_recv()
{
  while( !get_is_err() ) {
    // extend read buffer as required
    size_t len = rdr_.size() - rsz_;
    if ( len < buf_len ) {
      rdr_.resize( rdr_.size() + buf_len );
    }
    // read up to buf_len at a time
    ssize_t rc = ::recv( get_fd(), &rdr_[rsz_], buf_len, MSG_NOSIGNAL );
    if ( rc > 0 ) {
      rsz_ += rc;
    } else {
      if ( rc == 0 ) {
        set_err_msg( "connection closed by peer" );
      } else if ( errno != EAGAIN ) {
        poll_error( true );
      }
      break;
    }
    // parse content
    size_t idx = 0;
    while( !get_is_err() && rsz_ ) {
      size_t rlen = 0;
      if ( np_->parse( &rdr_[idx], rsz_, rlen ) ) {
        idx  += rlen;
        rsz_ -= rlen;
      } else {
        break;
      }
    }
    // shuffle remaining bytes to beginning of buffer
    if ( idx && rsz_ ) {
      __builtin_memmove( &rdr_[0], &rdr_[idx], rsz_ );
    }
    if ( np_->get_is_err() ) {
      set_err_msg( "parse error", *np_ );
    }
  }
}

void net_connect::poll_error( bool is_read )
{
  std::string emsg = "fail to ";
  emsg += is_read?"read":"write";
  set_err_msg( emsg, errno );
}

void net_connect::drop_send()
{
  while( whd_ ) {
    net_buf *nxt = whd_->next_;
    whd_->dealloc();
    whd_ = nxt;
  }
  wtl_ = nullptr;
  wsz_ = 0;
}

void net_connect::teardown()
{
  drop_send();
  rsz_ = 0;
  net_socket::teardown();
}

///////////////////////////////////////////////////////////////////////////
// tcp_connect

tcp_connect::tcp_connect()
: port_(-1)
{
}

void tcp_connect::set_host( const std::string& hostn )
{
  host_ = hostn;
}

std::string tcp_connect::get_host() const
{
  return host_;
}

void tcp_connect::set_port( int port )
{
  port_ = port;
}

int tcp_connect::get_port() const
{
  return port_;
}

static bool get_hname_addr( const std::string& name, sockaddr *saddr )
{
  memset( saddr, 0, sizeof( sockaddr ) );
  bool has_addr = false;
  addrinfo hints[1];
  memset( hints, 0, sizeof( addrinfo ) );
  hints->ai_family   = AF_INET;
  hints->ai_socktype = SOCK_STREAM;
  hints->ai_protocol = IPPROTO_TCP;
  addrinfo *ainfo[1] = { nullptr };
  if ( 0 != ::getaddrinfo( name.c_str(), nullptr, hints, ainfo ) ) {
    return false;
  }
  for( addrinfo *aptr = ainfo[0]; aptr; aptr = aptr->ai_next ) {
    if ( aptr->ai_family == hints->ai_family &&
         aptr->ai_socktype == hints->ai_socktype ) {
      __builtin_memcpy( saddr, aptr->ai_addr, sizeof( sockaddr ) );
      has_addr = true;
      break;
    }
  }
  if ( ainfo[0] ) {
    ::freeaddrinfo( ainfo[0] );
  }
  return has_addr;
}

bool tcp_connect::init()
{
  close();
  reset_err();
  rsz_ = 0;
  sockaddr saddr[1];
  if ( !get_hname_addr( host_, saddr ) ) {
    return set_err_msg( "failed to resolve host=" + host_ );
  }
  int fd = ::socket( AF_INET, SOCK_STREAM, IPPROTO_TCP );
  if ( fd < 0 ) {
    return set_err_msg( "failed to construct tcp socket", errno );
  }
  sockaddr_in *iaddr = (sockaddr_in*)saddr;
  iaddr->sin_port = htons( (uint16_t)port_ );
  if ( 0 != ::connect( fd, saddr, sizeof( sockaddr ) ) ) {
    int ec = errno;
    ::close( fd );
    return set_err_msg( "failed to connect to " + host_ + ":" +
        std::to_string( port_ ), ec );
  }
  set_fd( fd );
  if ( !set_block( false ) ) {
    return false;
  }
  return net_socket::init();
}

///////////////////////////////////////////////////////////////////////////
// http_request

void http_request::init( const char *method, const char *endpoint )
{
  add( method );
  add( ' ' );
  add( endpoint );
  add( " HTTP/1.1\r\n" );
}

void http_request::add_hdr( const char *hdr, str val )
{
  add( hdr );
  add( ':' );
  add( ' ' );
  add( val );
  add( '\r' );
  add( '\n' );
}

void http_request::add_hdr( const char *hdr, uint64_t ival )
{
  char buf[32], *end = &buf[sizeof(buf)];
  char *val = uint_to_str( ival, end );
  add_hdr( hdr, str( val, end - val ) );
}

void http_request::commit( net_wtr& buf )
{
  add_hdr( "Content-Length", (uint64_t)buf.size() );
  add( '\r' );
  add( '\n' );
  add( buf );
}

///////////////////////////////////////////////////////////////////////////
// http_client

static inline bool find( const char ch, const char *&ptr, const char *end )
{
  for(;ptr!=end;++ptr) {
    if ( *ptr == ch ) return true;
  }
  return false;
}

static inline bool next(char ch,  const char *ptr, const char *end )
{
  return ptr != end && *ptr == ch;
}

bool http_client::parse( const char *ptr, size_t len, size_t& res )
{
  const char CR = (char)13;
  const char LF = (char)10;
  static const char clen_hdr[] = "content-length";

  // read status line in response
  const char *beg = ptr;
  const char *end = &ptr[len];
  if ( !find( ' ', ptr, end ) ) return false;
  const char *stp = ++ptr;
  if ( !find( ' ', ptr, end ) ) return false;
  int status = (int)str_to_uint( stp, ptr - stp );
  stp = ++ptr;
  if ( !find( CR, ptr, end ) )  return false;
  const char *msg = stp;
  size_t msg_len = ptr - stp;
  if ( !next( LF, ++ptr, end ) )  return false;

  // parse other header lines
  bool has_len = false;
  size_t clen = 0;
  for(++ptr;;++ptr) {
    if ( ptr+2 > end ) return false;
    if ( ptr[0] == CR && ptr[1] == LF ) {
      break;
    }
    const char *hdr = ptr;
    if ( !find( ':', ptr, end ) ) return false;
    const char *hdr_end = ptr;
    for( ++ptr; ptr != end && isspace(*ptr); ++ptr );
    const char *val = ptr;
    if ( !find( CR, ptr, end ) )  return false;
    size_t hlen = hdr_end - hdr;
    if ( !has_len && hlen == sizeof( clen_hdr ) - 1 &&
         0 == strncasecmp( clen_hdr, hdr, hlen ) ) {
      has_len = true;
      clen = str_to_uint( val, ptr - val );
    } else {
      parse_header( hdr, hlen, val, ptr-val );
    }
    if ( !next( LF, ++ptr, end ) )  return false;
  }
  // parse body
  ptr += 2;
  if ( clen > (size_t)( end - ptr ) ) return false;
  const char *cnt = &ptr[clen];

  // only report status on complete messages
  parse_status( status, msg, msg_len );
  parse_content( ptr, clen );

  // assign total message size
  res = cnt - beg;
  return true;
}

void http_client::parse_status( int, const char *, size_t )
{
}

void http_client::parse_header( const char *, size_t,
                                const char *, size_t )
{
}

void http_client::parse_content( const char *, size_t )
{
}

///////////////////////////////////////////////////////////////////////////
// json_wtr

json_wtr::json_wtr()
: first_( true )
{
}

void json_wtr::reset()
{
  net_wtr::reset();
  first_ = true;
  st_.clear();
}

void json_wtr::add_obj()
{
  add( '{' );
  first_ = true;
  st_.push_back( e_obj );
}

void json_wtr::add_arr()
{
  add( '[' );
  first_ = true;
  st_.push_back( e_arr );
}

void json_wtr::pop()
{
  add( st_.back() == e_obj ? '}' : ']' );
  st_.pop_back();
  first_ = false;
}

void json_wtr::add_first()
{
  if ( !first_ ) add( ',' );
  first_ = false;
}

void json_wtr::add_key_only( str key )
{
  add_first();
  add_text( key );
  add( ':' );
}

void json_wtr::add_key( str key, str val )
{
  add_key_only( key );
  add_text( val );
}

void json_wtr::add_key( str key, uint64_t ival )
{
  add_key_only( key );
  add_uint( ival );
}

void json_wtr::add_key( str key, jfalse )
{
  add_key_only( key );
  add( str( "false" ) );
}

void json_wtr::add_key( str key, type_t t )
{
  add_key_only( key );
  if ( t == e_obj ) {
    add_obj();
  } else {
    add_arr();
  }
}

void json_wtr::add_val( str val )
{
  add_first();
  add_text( val );
}

void json_wtr::add_val( const hash& pk )
{
  add_first();
  add_enc_base58( str( pk.data(), hash::len ) );
}

void json_wtr::add_val( const signature& sig )
{
  add_first();
  add_enc_base58( str( sig.data(), signature::len ) );
}

void json_wtr::add_val( uint64_t ival )
{
  add_first();
  add_uint( ival );
}

void json_wtr::add_val( type_t t )
{
  add_first();
  if ( t == e_obj ) {
    add_obj();
  } else {
    add_arr();
  }
}

void json_wtr::add_val_enc_base64( str val )
{
  add_first();
  add_enc_base64( val );
}

void json_wtr::add_uint( uint64_t ival )
{
  char *buf = reserve( 32 ), *end = &buf[31];
  char *val = uint_to_str( ival, end );
  size_t val_len = end - val;
  __builtin_memmove( buf, val, val_len );
  advance( val_len );
}

void json_wtr::add_enc_base58( str val )
{
  add( '"' );
  size_t rsv_len = val.len_ + val.len_;
  char *tgt = reserve( rsv_len );
  advance( enc_base58( (const uint8_t*)val.str_,
        val.len_, (uint8_t*)tgt, rsv_len ) );
  add( '"' );
}

void json_wtr::add_enc_base64( str val )
{
  // encoded transactions may span several buffers
  std::vector<char> tgt( enc_base64_len( val.len_ ) + 1 );
  int len = enc_base64( (const uint8_t*)val.str_,
        val.len_, (uint8_t*)tgt.data() );
  add( '"' );
  add( str( tgt.data(), len ) );
  add( '"' );
}

void json_wtr::add_text( str val )
{
  add( '"' );
  add( val );
  add( '"' );
}
