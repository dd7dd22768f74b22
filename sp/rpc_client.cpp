#include "rpc_client.hpp"
#include "log.hpp"
#include <zstd.h>
#include <algorithm>

using namespace sp;

// block(slot) commitment
static const char *commitment_str[] = {
  "unknown",
  "processed",
  "confirmed",
  "finalized"
};

namespace sp
{
  str commitment_to_str( commitment val )
  {
    unsigned iv = (unsigned)val;
    if ( iv >= (unsigned)commitment::e_last_commitment ) {
      iv = 0;
    }
    return commitment_str[iv];
  }

  commitment str_to_commitment( str s )
  {
    for( unsigned i=0;
         i != (unsigned)commitment::e_last_commitment; ++i ) {
      if ( s == commitment_str[i] ) {
        return (commitment)i;
      }
    }
    return commitment::e_unknown;
  }

}

// compact text rendering of json sub-tree
static void jtree_to_str( const jtree& jt, uint32_t tok, std::string& res )
{
  if ( tok == 0 ) {
    res += "null";
    return;
  }
  switch( jt.get_type( tok ) ) {
    case jtree::e_obj:
    case jtree::e_arr: {
      bool is_obj = jt.get_type( tok ) == jtree::e_obj;
      res += is_obj ? '{' : '[';
      for( uint32_t it = jt.get_first( tok ); it; it = jt.get_next( it ) ) {
        if ( it != jt.get_first( tok ) ) res += ',';
        jtree_to_str( jt, it, res );
      }
      res += is_obj ? '}' : ']';
      break;
    }
    case jtree::e_keyval: {
      jtree_to_str( jt, jt.get_key( tok ), res );
      res += ':';
      jtree_to_str( jt, jt.get_val( tok ), res );
      break;
    }
    default: {
      str txt = jt.get_str( tok );
      res.append( txt.str_, txt.len_ );
      break;
    }
  }
}

///////////////////////////////////////////////////////////////////////////
// rpc_client

rpc_client::rpc_client()
: hptr_( nullptr ),
  id_( 0UL ),
  cxt_( nullptr )
{
  hp_.cp_ = this;
  hp_.status_ = 0;
  cxt_ = ZSTD_createDCtx();
}

rpc_client::~rpc_client()
{
  if ( cxt_ ) {
    ZSTD_freeDCtx( (ZSTD_DCtx*)cxt_ );
    cxt_ = nullptr;
  }
  for( auto& it: rv_ ) {
    it.second->set_rpc_client( nullptr );
  }
}

void rpc_client::set_http_conn( tcp_connect *hptr )
{
  hptr_ = hptr;
  hptr_->set_net_parser( &hp_ );
}

void rpc_client::reset()
{
  for( auto& it: rv_ ) {
    it.second->set_rpc_client( nullptr );
  }
  rv_.clear();
  reuse_.clear();
  id_ = 0;
}

size_t rpc_client::get_num_pending() const
{
  return rv_.size();
}

void rpc_client::send( rpc_request *rptr )
{
  // a resent request replaces any earlier outstanding one
  cancel( rptr );
  rptr->reset_err();
  rptr->set_err_code( 0 );
  rptr->set_rpc_client( this );
  rptr->set_sent_time( get_now() );
  if ( !hptr_ || hptr_->get_fd() < 0 ) {
    rptr->set_err_msg( "rpc connection not available" );
    rptr->set_recv_time( get_now() );
    return;
  }

  // get request id
  uint64_t id;
  if ( !reuse_.empty() ) {
    id = reuse_.back();
    reuse_.pop_back();
  } else {
    id = ++id_;
  }
  rptr->set_id( id );
  rv_[id] = rptr;

  // construct json message
  json_wtr jw;
  jw.add_val( json_wtr::e_obj );
  jw.add_key( "jsonrpc", "2.0" );
  jw.add_key( "id", id );
  rptr->request( jw );
  jw.pop();

  // submit http POST request
  http_request msg;
  msg.init( "POST", "/" );
  msg.add_hdr( "Host", str( hptr_->get_host() ) );
  msg.add_hdr( "Content-Type", str( "application/json" ) );
  msg.commit( jw );
  hptr_->add_send( msg );
}

void rpc_client::cancel( rpc_request *rptr )
{
  request_t::iterator i = rv_.find( rptr->get_id() );
  if ( i != rv_.end() && i->second == rptr ) {
    rv_.erase( i );
  }
}

void rpc_client::fail_all( const std::string& emsg )
{
  request_t rv;
  rv.swap( rv_ );
  reuse_.clear();
  int64_t now = get_now();
  for( auto& it: rv ) {
    rpc_request *rptr = it.second;
    rptr->set_err_msg( emsg );
    rptr->set_recv_time( now );
  }
}

void rpc_client::rpc_http::parse_status( int status, const char *, size_t )
{
  status_ = status;
}

void rpc_client::rpc_http::parse_content( const char *txt, size_t len )
{
  if ( !cp_->parse_response( txt, len ) && status_ != 200 ) {
    cp_->parse_error( status_ );
  }
}

bool rpc_client::parse_response( const char *txt, size_t len )
{
  // parse and redirect response to corresponding request
  jp_.parse( txt, len );
  uint32_t idtok = jp_.find_val( 1, "id" );
  if ( !idtok || jp_.get_is_null( idtok ) ) {
    if ( hp_.status_ == 200 ) {
      SP_LOG_WRN( "unroutable rpc response" )
        .add( "msg", str( txt, std::min( len, (size_t)256 ) ) ).end();
    }
    return false;
  }
  const uint64_t id = jp_.get_uint( idtok );
  request_t::iterator i = rv_.find( id );
  if ( i == rv_.end() ) {
    SP_LOG_DBG( "rpc response for unknown request" ).add( "id", id ).end();
    return true;
  }
  rpc_request *rptr = i->second;
  rv_.erase( i );
  reuse_.push_back( id );
  rptr->response( jp_ );
  if ( !rptr->get_is_recv() ) {
    rptr->set_recv_time( get_now() );
  }
  return true;
}

void rpc_client::parse_error( int status )
{
  // error replies without an id cannot be matched to their request
  if ( !rv_.empty() ) {
    SP_LOG_ERR( "rpc http error" )
      .add( "status", status )
      .add( "pending", (uint64_t)rv_.size() )
      .end();
    fail_all( "rpc http error status=" + std::to_string( status ) );
  }
}

bool rpc_client::get_data( str enc, str dat, std::vector<char>& res )
{
  res.clear();
  abuf_.resize( dat.len_ + 4 );
  int dlen = dec_base64( (const uint8_t*)dat.str_, (int)dat.len_,
      (uint8_t*)&abuf_[0] );
  if ( dlen < 0 ) {
    return false;
  }
  if ( enc == str( "base64" ) ) {
    res.assign( abuf_.begin(), abuf_.begin() + dlen );
    return true;
  }
  if ( !( enc == str( "base64+zstd" ) ) ) {
    return false;
  }
  if ( dlen == 0 ) {
    return true;
  }

  // stream decompress as uncompressed size is not known up front
  ZSTD_DCtx *cxt = (ZSTD_DCtx*)cxt_;
  ZSTD_DCtx_reset( cxt, ZSTD_reset_session_only );
  ZSTD_inBuffer in = { &abuf_[0], (size_t)dlen, 0 };
  const size_t chunk = ZSTD_DStreamOutSize();
  for(;;) {
    size_t off = res.size();
    res.resize( off + chunk );
    ZSTD_outBuffer out = { &res[off], chunk, 0 };
    size_t rc = ZSTD_decompressStream( cxt, &out, &in );
    res.resize( off + out.pos );
    if ( ZSTD_isError( rc ) ) {
      SP_LOG_DBG( "zstd decompress failed" )
        .add( "error", str( ZSTD_getErrorName( rc ) ) )
        .end();
      return false;
    }
    if ( in.pos == in.size ) {
      if ( rc == 0 ) {
        return true;
      }
      if ( out.pos < chunk ) {
        // truncated frame
        return false;
      }
    }
  }
}

///////////////////////////////////////////////////////////////////////////
// rpc_request

rpc_request::rpc_request()
: cb_( nullptr ),
  cp_( nullptr ),
  id_( 0UL ),
  ec_( 0 ),
  sent_ts_( 0L ),
  recv_ts_( 0L )
{
}

rpc_request::~rpc_request()
{
  if ( cp_ && !get_is_recv() ) {
    cp_->cancel( this );
  }
}

void rpc_request::set_sub( rpc_sub *cb )
{
  cb_ = cb;
}

rpc_sub *rpc_request::get_sub() const
{
  return cb_;
}

void rpc_request::set_rpc_client( rpc_client *cptr )
{
  cp_ = cptr;
}

rpc_client *rpc_request::get_rpc_client() const
{
  return cp_;
}

void rpc_request::set_id( uint64_t id )
{
  id_ = id;
}

uint64_t rpc_request::get_id() const
{
  return id_;
}

void rpc_request::set_err_code( int ecode )
{
  ec_ = ecode;
}

int rpc_request::get_err_code() const
{
  return ec_;
}

void rpc_request::set_sent_time( int64_t sent_ts )
{
  sent_ts_ = sent_ts;
  recv_ts_ = 0L;
}

int64_t rpc_request::get_sent_time() const
{
  return sent_ts_;
}

void rpc_request::set_recv_time( int64_t recv_ts )
{
  recv_ts_ = recv_ts;
}

int64_t rpc_request::get_recv_time() const
{
  return recv_ts_;
}

bool rpc_request::get_is_recv() const
{
  return recv_ts_ != 0L;
}

template<class T>
void rpc_request::on_response( T *req )
{
  req->set_recv_time( get_now() );
  rpc_sub_i<T> *iptr = dynamic_cast<rpc_sub_i<T>*>( req->get_sub() );
  if ( iptr ) {
    iptr->on_response( req );
  }
}

template<class T>
bool rpc_request::on_error( const jtree& jt, T *req )
{
  uint32_t etok = jt.find_val( 1, "error" );
  if ( etok == 0 ) return false;
  str txt = jt.get_str( jt.find_val( etok, "message" ) );
  std::string emsg( txt.str_, txt.len_ );
  if ( emsg.empty() ) {
    emsg = "rpc error";
  }
  set_err_msg( emsg );
  set_err_code( (int)jt.get_int( jt.find_val( etok, "code" ) ) );
  on_response( req );
  return true;
}

///////////////////////////////////////////////////////////////////////////
// get_latest_block_hash

rpc::get_latest_block_hash::get_latest_block_hash()
: cmt_( e_finalized ),
  slot_( 0 ),
  height_( 0 )
{
}

void rpc::get_latest_block_hash::set_commitment( commitment cmt )
{
  cmt_ = cmt;
}

uint64_t rpc::get_latest_block_hash::get_slot() const
{
  return slot_;
}

const hash& rpc::get_latest_block_hash::get_block_hash() const
{
  return bhash_;
}

uint64_t rpc::get_latest_block_hash::get_last_valid_block_height() const
{
  return height_;
}

void rpc::get_latest_block_hash::request( json_wtr& msg )
{
  msg.add_key( "method", "getLatestBlockhash" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val( json_wtr::e_obj );
  msg.add_key( "commitment", commitment_to_str( cmt_ ) );
  msg.pop();
  msg.pop();
}

void rpc::get_latest_block_hash::response( const jtree& jt )
{
  if ( on_error( jt, this ) ) return;
  uint32_t rtok = jt.find_val( 1, "result" );
  uint32_t ctok = jt.find_val( rtok, "context" );
  slot_ = jt.get_uint( jt.find_val( ctok, "slot" ) );
  uint32_t vtok = jt.find_val( rtok, "value" );
  if ( !bhash_.init_from_text( jt.get_str( jt.find_val( vtok, "blockhash" ) ) ) ) {
    set_err_msg( "invalid blockhash in response" );
  }
  height_ = jt.get_uint( jt.find_val( vtok, "lastValidBlockHeight" ) );
  on_response( this );
}

///////////////////////////////////////////////////////////////////////////
// get_epoch_info

rpc::get_epoch_info::get_epoch_info()
: cmt_( e_confirmed ),
  epoch_( 0 ),
  slot_idx_( 0 ),
  slots_( 0 ),
  abs_slot_( 0 )
{
}

void rpc::get_epoch_info::set_commitment( commitment cmt )
{
  cmt_ = cmt;
}

uint64_t rpc::get_epoch_info::get_epoch() const
{
  return epoch_;
}

uint64_t rpc::get_epoch_info::get_slot_index() const
{
  return slot_idx_;
}

uint64_t rpc::get_epoch_info::get_slots_in_epoch() const
{
  return slots_;
}

uint64_t rpc::get_epoch_info::get_absolute_slot() const
{
  return abs_slot_;
}

void rpc::get_epoch_info::request( json_wtr& msg )
{
  msg.add_key( "method", "getEpochInfo" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val( json_wtr::e_obj );
  msg.add_key( "commitment", commitment_to_str( cmt_ ) );
  msg.pop();
  msg.pop();
}

void rpc::get_epoch_info::response( const jtree& jt )
{
  if ( on_error( jt, this ) ) return;
  uint32_t rtok = jt.find_val( 1, "result" );
  uint32_t etok = jt.find_val( rtok, "epoch" );
  if ( !etok ) {
    set_err_msg( "missing epoch in response" );
  }
  epoch_    = jt.get_uint( etok );
  slot_idx_ = jt.get_uint( jt.find_val( rtok, "slotIndex" ) );
  slots_    = jt.get_uint( jt.find_val( rtok, "slotsInEpoch" ) );
  abs_slot_ = jt.get_uint( jt.find_val( rtok, "absoluteSlot" ) );
  on_response( this );
}

///////////////////////////////////////////////////////////////////////////
// get_minimum_balance_for_rent_exemption

rpc::get_minimum_balance_for_rent_exemption::
  get_minimum_balance_for_rent_exemption()
: sz_( 0 ),
  lamports_( 0 )
{
}

void rpc::get_minimum_balance_for_rent_exemption::set_size( uint64_t sz )
{
  sz_ = sz;
}

uint64_t rpc::get_minimum_balance_for_rent_exemption::get_lamports() const
{
  return lamports_;
}

void rpc::get_minimum_balance_for_rent_exemption::request( json_wtr& msg )
{
  msg.add_key( "method", "getMinimumBalanceForRentExemption" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val( sz_ );
  msg.pop();
}

void rpc::get_minimum_balance_for_rent_exemption::response( const jtree& jt )
{
  if ( on_error( jt, this ) ) return;
  uint32_t rtok = jt.find_val( 1, "result" );
  if ( !rtok ) {
    set_err_msg( "missing result in response" );
  }
  lamports_ = jt.get_uint( rtok );
  on_response( this );
}

///////////////////////////////////////////////////////////////////////////
// get_account_info

rpc::get_account_info::get_account_info()
: cmt_( e_confirmed ),
  slot_( 0 ),
  lamports_( 0 ),
  is_exec_( false )
{
}

void rpc::get_account_info::set_account( const pub_key& acc )
{
  acc_ = acc;
}

const pub_key& rpc::get_account_info::get_account() const
{
  return acc_;
}

void rpc::get_account_info::set_commitment( commitment cmt )
{
  cmt_ = cmt;
}

uint64_t rpc::get_account_info::get_slot() const
{
  return slot_;
}

uint64_t rpc::get_account_info::get_lamports() const
{
  return lamports_;
}

const pub_key& rpc::get_account_info::get_owner() const
{
  return owner_;
}

bool rpc::get_account_info::get_is_executable() const
{
  return is_exec_;
}

const char *rpc::get_account_info::get_data() const
{
  return data_.data();
}

size_t rpc::get_account_info::get_data_len() const
{
  return data_.size();
}

void rpc::get_account_info::request( json_wtr& msg )
{
  msg.add_key( "method", "getAccountInfo" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val( acc_ );
  msg.add_val( json_wtr::e_obj );
  msg.add_key( "encoding", "base64+zstd" );
  msg.add_key( "commitment", commitment_to_str( cmt_ ) );
  msg.pop();
  msg.pop();
}

void rpc::get_account_info::response( const jtree& jt )
{
  if ( on_error( jt, this ) ) return;
  data_.clear();
  lamports_ = 0;
  uint32_t rtok = jt.find_val( 1, "result" );
  uint32_t ctok = jt.find_val( rtok, "context" );
  slot_ = jt.get_uint( jt.find_val( ctok, "slot" ) );
  uint32_t vtok = jt.find_val( rtok, "value" );
  if ( jt.get_is_null( vtok ) ) {
    set_err_msg( "account not found: " + acc_.enc_base58() );
    on_response( this );
    return;
  }
  is_exec_ = jt.get_bool( jt.find_val( vtok, "executable" ) );
  lamports_ = jt.get_uint( jt.find_val( vtok, "lamports" ) );
  if ( !owner_.init_from_text( jt.get_str( jt.find_val( vtok, "owner" ) ) ) ) {
    owner_.zero();
  }
  uint32_t dtok = jt.find_val( vtok, "data" );
  uint32_t d1tok = dtok ? jt.get_first( dtok ) : 0;
  uint32_t d2tok = d1tok ? jt.get_next( d1tok ) : 0;
  if ( !d1tok || !d2tok ||
       !get_rpc_client()->get_data(
         jt.get_str( d2tok ), jt.get_str( d1tok ), data_ ) ) {
    set_err_msg( "failed to decode data for account: " +
        acc_.enc_base58() );
  }
  on_response( this );
}

///////////////////////////////////////////////////////////////////////////
// send_transaction

rpc::send_transaction::send_transaction()
: cmt_( e_confirmed )
{
}

void rpc::send_transaction::set_transaction( const char *buf, size_t len )
{
  tx_.assign( buf, buf + len );
}

void rpc::send_transaction::set_preflight_commitment( commitment cmt )
{
  cmt_ = cmt;
}

const signature& rpc::send_transaction::get_signature() const
{
  return sig_;
}

void rpc::send_transaction::request( json_wtr& msg )
{
  msg.add_key( "method", "sendTransaction" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val_enc_base64( str( tx_.data(), tx_.size() ) );
  msg.add_val( json_wtr::e_obj );
  msg.add_key( "encoding", "base64" );
  msg.add_key( "skipPreflight", json_wtr::jfalse() );
  msg.add_key( "preflightCommitment", commitment_to_str( cmt_ ) );
  msg.pop();
  msg.pop();
}

void rpc::send_transaction::response( const jtree& jt )
{
  if ( on_error( jt, this ) ) return;
  uint32_t rtok = jt.find_val( 1, "result" );
  if ( !rtok || !sig_.init_from_text( jt.get_str( rtok ) ) ) {
    set_err_msg( "invalid transaction signature in response" );
  }
  on_response( this );
}

///////////////////////////////////////////////////////////////////////////
// get_signature_statuses

rpc::get_signature_statuses::get_signature_statuses()
{
}

void rpc::get_signature_statuses::add_signature( const signature& sig )
{
  sigs_.push_back( sig );
}

void rpc::get_signature_statuses::clear()
{
  sigs_.clear();
  res_.clear();
}

unsigned rpc::get_signature_statuses::get_num_status() const
{
  return res_.size();
}

const rpc::get_signature_statuses::status&
rpc::get_signature_statuses::get_status( unsigned i ) const
{
  return res_[i];
}

void rpc::get_signature_statuses::request( json_wtr& msg )
{
  msg.add_key( "method", "getSignatureStatuses" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val( json_wtr::e_arr );
  for( const signature& sig: sigs_ ) {
    msg.add_val( sig );
  }
  msg.pop();
  msg.add_val( json_wtr::e_obj );
  msg.add_key( "searchTransactionHistory", json_wtr::jfalse() );
  msg.pop();
  msg.pop();
}

void rpc::get_signature_statuses::response( const jtree& jt )
{
  res_.clear();
  if ( on_error( jt, this ) ) return;
  uint32_t rtok = jt.find_val( 1, "result" );
  uint32_t vtok = jt.find_val( rtok, "value" );
  if ( !vtok || jt.get_type( vtok ) != jtree::e_arr ) {
    set_err_msg( "missing status list in response" );
    on_response( this );
    return;
  }
  for( uint32_t it = jt.get_first( vtok ); it; it = jt.get_next( it ) ) {
    status st;
    st.found_  = !jt.get_is_null( it );
    st.slot_   = 0;
    st.cmt_    = e_unknown;
    st.is_err_ = false;
    if ( st.found_ ) {
      st.slot_ = jt.get_uint( jt.find_val( it, "slot" ) );
      st.cmt_  = str_to_commitment(
          jt.get_str( jt.find_val( it, "confirmationStatus" ) ) );
      uint32_t etok = jt.find_val( it, "err" );
      if ( etok && !jt.get_is_null( etok ) ) {
        st.is_err_ = true;
        jtree_to_str( jt, etok, st.err_ );
      }
    }
    res_.emplace_back( std::move( st ) );
  }
  if ( res_.size() != sigs_.size() ) {
    set_err_msg( "status count mismatch in response" );
  }
  on_response( this );
}
