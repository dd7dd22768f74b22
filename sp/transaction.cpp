#include "transaction.hpp"
#include "bincode.hpp"
#include <algorithm>

using namespace sp;

///////////////////////////////////////////////////////////////////////////
// account_meta

account_meta::account_meta()
: is_signer_( false ),
  is_writable_( false )
{
}

account_meta::account_meta( const pub_key& key, bool is_signer,
                            bool is_writable )
: key_( key ),
  is_signer_( is_signer ),
  is_writable_( is_writable )
{
}

///////////////////////////////////////////////////////////////////////////
// instruction

instruction::instruction()
{
}

void instruction::set_program( const pub_key& pgm )
{
  pgm_ = pgm;
}

const pub_key& instruction::get_program() const
{
  return pgm_;
}

void instruction::add_account( const pub_key& key, bool is_signer,
                               bool is_writable )
{
  accs_.emplace_back( key, is_signer, is_writable );
}

unsigned instruction::get_num_account() const
{
  return accs_.size();
}

const account_meta& instruction::get_account( unsigned i ) const
{
  return accs_[i];
}

void instruction::set_data( const char *buf, size_t len )
{
  data_.assign( buf, buf + len );
}

const char *instruction::get_data() const
{
  return data_.data();
}

size_t instruction::get_data_len() const
{
  return data_.size();
}

///////////////////////////////////////////////////////////////////////////
// transaction

transaction::transaction()
: payer_( nullptr ),
  nsign_( 0 ),
  nro_sign_( 0 ),
  nro_unsign_( 0 )
{
}

void transaction::set_fee_payer( const key_pair *kp )
{
  payer_ = kp;
}

void transaction::add_signer( const key_pair *kp )
{
  kps_.push_back( kp );
}

void transaction::set_block_hash( const hash& bhash )
{
  bhash_ = bhash;
}

void transaction::add( const instruction& ix )
{
  ixs_.push_back( ix );
}

unsigned transaction::get_num_instruction() const
{
  return ixs_.size();
}

void transaction::clear()
{
  ixs_.clear();
  keys_.clear();
  buf_.clear();
  reset_err();
}

const char *transaction::get_data() const
{
  return buf_.data();
}

size_t transaction::get_size() const
{
  return buf_.size();
}

const signature& transaction::get_signature() const
{
  return sig_;
}

unsigned transaction::get_num_key() const
{
  return keys_.size();
}

const pub_key& transaction::get_key( unsigned i ) const
{
  return keys_[i].key_;
}

unsigned transaction::get_num_signer() const
{
  return nsign_;
}

unsigned transaction::get_num_readonly_signed() const
{
  return nro_sign_;
}

unsigned transaction::get_num_readonly_unsigned() const
{
  return nro_unsign_;
}

int transaction::find_key( const pub_key& key ) const
{
  for( unsigned i=0; i != keys_.size(); ++i ) {
    if ( keys_[i].key_ == key ) {
      return (int)i;
    }
  }
  return -1;
}

void transaction::add_key( const pub_key& key, bool is_signer,
                           bool is_writable )
{
  int idx = find_key( key );
  if ( idx < 0 ) {
    keys_.emplace_back( key, is_signer, is_writable );
  } else {
    keys_[idx].is_signer_   |= is_signer;
    keys_[idx].is_writable_ |= is_writable;
  }
}

static int key_group( const account_meta& m )
{
  if ( m.is_signer_ ) {
    return m.is_writable_ ? 0 : 1;
  }
  return m.is_writable_ ? 2 : 3;
}

bool transaction::compile()
{
  // fee payer is always the first writable signer
  keys_.clear();
  pub_key payer( *payer_ );
  add_key( payer, true, true );
  for( const instruction& ix: ixs_ ) {
    for( unsigned i=0; i != ix.get_num_account(); ++i ) {
      const account_meta& m = ix.get_account( i );
      add_key( m.key_, m.is_signer_, m.is_writable_ );
    }
    add_key( ix.get_program(), false, false );
  }
  std::stable_sort( keys_.begin(), keys_.end(),
      []( const account_meta& a, const account_meta& b ) {
        return key_group( a ) < key_group( b );
      } );
  if ( keys_.size() > 256 ) {
    return set_err_msg( "too many accounts in transaction" );
  }
  nsign_ = nro_sign_ = nro_unsign_ = 0;
  for( const account_meta& m: keys_ ) {
    switch( key_group( m ) ) {
      case 0: ++nsign_; break;
      case 1: ++nsign_; ++nro_sign_; break;
      case 2: break;
      default: ++nro_unsign_; break;
    }
  }
  return true;
}

bool transaction::build()
{
  reset_err();
  buf_.clear();
  if ( !payer_ ) {
    return set_err_msg( "missing fee payer" );
  }
  if ( ixs_.empty() ) {
    return set_err_msg( "no instructions in transaction" );
  }
  if ( !compile() ) {
    return false;
  }

  // match signing keys to compiled signer accounts
  kp_vec_t signers( nsign_, nullptr );
  signers[0] = payer_;
  for( const key_pair *kp: kps_ ) {
    pub_key pk( *kp );
    int idx = find_key( pk );
    if ( idx > 0 && (unsigned)idx < nsign_ ) {
      signers[idx] = kp;
    }
  }
  for( unsigned i=0; i != nsign_; ++i ) {
    if ( !signers[i] ) {
      return set_err_msg( "missing signing key for account " +
          keys_[i].key_.enc_base58() );
    }
  }

  // compute serialized size
  size_t sz = bincode::len_size( nsign_ ) + nsign_ * signature::len;
  sz += 3 + bincode::len_size( keys_.size() ) + keys_.size() * pub_key::len;
  sz += hash::len + bincode::len_size( ixs_.size() );
  for( const instruction& ix: ixs_ ) {
    sz += 1 + bincode::len_size( ix.get_num_account() ) +
      ix.get_num_account() + bincode::len_size( ix.get_data_len() ) +
      ix.get_data_len();
  }
  if ( sz > max_size ) {
    return set_err_msg( "transaction too large size=" +
        std::to_string( sz ) );
  }
  buf_.resize( sz );
  bincode tx( buf_.data() );

  // signatures section
  tx.add_len( nsign_ );
  std::vector<size_t> sig_idx( nsign_ );
  for( unsigned i=0; i != nsign_; ++i ) {
    sig_idx[i] = tx.reserve_sign();
  }

  // message header
  size_t msg_idx = tx.get_pos();
  tx.add( (uint8_t)nsign_ );
  tx.add( (uint8_t)nro_sign_ );
  tx.add( (uint8_t)nro_unsign_ );

  // accounts
  tx.add_len( keys_.size() );
  for( const account_meta& m: keys_ ) {
    tx.add( m.key_ );
  }

  // recent block hash
  tx.add( bhash_ );

  // instructions section
  tx.add_len( ixs_.size() );
  for( const instruction& ix: ixs_ ) {
    tx.add( (uint8_t)find_key( ix.get_program() ) );
    tx.add_len( ix.get_num_account() );
    for( unsigned i=0; i != ix.get_num_account(); ++i ) {
      tx.add( (uint8_t)find_key( ix.get_account( i ).key_ ) );
    }
    tx.add_len( ix.get_data_len() );
    tx.add( ix.get_data(), ix.get_data_len() );
  }

  // all signers sign the message
  for( unsigned i=0; i != nsign_; ++i ) {
    if ( !tx.sign( sig_idx[i], msg_idx, *signers[i] ) ) {
      buf_.clear();
      return set_err_msg( "failed to sign transaction" );
    }
  }
  sig_.init_from_buf( (const uint8_t*)&buf_[sig_idx[0]] );
  return true;
}
