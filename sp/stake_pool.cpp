#include "stake_pool.hpp"
#include "address.hpp"
#include "bincode.hpp"
#include <algorithm>

using namespace sp;

// instruction indices of the stake pool program
enum pool_instruction
{
  e_decrease_validator_stake               = 3,
  e_increase_validator_stake               = 4,
  e_update_validator_list_balance          = 6,
  e_update_stake_pool_balance              = 7,
  e_cleanup_removed_validator_entries      = 8,
  e_increase_additional_validator_stake    = 19,
  e_decrease_additional_validator_stake    = 20,
  e_decrease_validator_stake_with_reserve  = 21
};

static pub_key init_key( const char *txt )
{
  pub_key pk;
  pk.init_from_text( str( txt ) );
  return pk;
}

const pub_key& sp::get_stake_pool_program()
{
  static const pub_key pk =
    init_key( "SPoo1Ku8WFXoNDMHPsrGSTSG1Y47rzgn41SLUNakuHy" );
  return pk;
}

const pub_key& sp::get_stake_program()
{
  static const pub_key pk =
    init_key( "Stake11111111111111111111111111111111111111" );
  return pk;
}

const pub_key& sp::get_system_program()
{
  static const pub_key pk =
    init_key( "11111111111111111111111111111111" );
  return pk;
}

const pub_key& sp::get_sysvar_clock()
{
  static const pub_key pk =
    init_key( "SysvarC1ock11111111111111111111111111111111" );
  return pk;
}

const pub_key& sp::get_sysvar_rent()
{
  static const pub_key pk =
    init_key( "SysvarRent111111111111111111111111111111111" );
  return pk;
}

const pub_key& sp::get_sysvar_stake_history()
{
  static const pub_key pk =
    init_key( "SysvarStakeHistory1111111111111111111111111" );
  return pk;
}

const pub_key& sp::get_stake_config()
{
  static const pub_key pk =
    init_key( "StakeConfig11111111111111111111111111111111" );
  return pk;
}

///////////////////////////////////////////////////////////////////////////
// stake_pool_account

stake_pool_account::stake_pool_account()
{
  lockup_.unix_timestamp_ = 0L;
  lockup_.epoch_ = 0UL;
  account_type_ = e_uninitialized_account;
  total_lamports_ = pool_token_supply_ = last_update_epoch_ = 0UL;
  has_next_epoch_fee_ = false;
  has_preferred_deposit_validator_ = false;
  has_preferred_withdraw_validator_ = false;
  has_next_stake_withdrawal_fee_ = false;
  has_sol_deposit_authority_ = false;
  has_sol_withdraw_authority_ = false;
  has_next_sol_withdrawal_fee_ = false;
}

bool stake_pool_account::get_fee( bin_rdr& rdr, fee& val )
{
  return rdr.get( val.denominator_ ) && rdr.get( val.numerator_ );
}

bool stake_pool_account::get_opt_fee( bin_rdr& rdr, bool& has, fee& val )
{
  uint8_t tag = 0;
  if ( !rdr.get( tag ) || tag > 1 ) {
    return false;
  }
  has = tag == 1;
  val.denominator_ = val.numerator_ = 0UL;
  return !has || get_fee( rdr, val );
}

bool stake_pool_account::get_opt_key( bin_rdr& rdr, bool& has,
                                      pub_key& val )
{
  uint8_t tag = 0;
  if ( !rdr.get( tag ) || tag > 1 ) {
    return false;
  }
  has = tag == 1;
  val.zero();
  return !has || rdr.get( val );
}

bool stake_pool_account::init_from_buf( const char *buf, size_t len )
{
  reset_err();
  bin_rdr rdr( buf, len );
  if ( !rdr.get( account_type_ ) ) {
    return set_err_msg( "stake pool account too short" );
  }
  if ( account_type_ != e_stake_pool_account ) {
    return set_err_msg( "not a stake pool account type=" +
        std::to_string( account_type_ ) );
  }
  if ( !rdr.get( manager_ ) ||
       !rdr.get( staker_ ) ||
       !rdr.get( stake_deposit_authority_ ) ||
       !rdr.get( stake_withdraw_bump_seed_ ) ||
       !rdr.get( validator_list_ ) ||
       !rdr.get( reserve_stake_ ) ||
       !rdr.get( pool_mint_ ) ||
       !rdr.get( manager_fee_account_ ) ||
       !rdr.get( token_program_id_ ) ||
       !rdr.get( total_lamports_ ) ||
       !rdr.get( pool_token_supply_ ) ||
       !rdr.get( last_update_epoch_ ) ||
       !rdr.get( lockup_.unix_timestamp_ ) ||
       !rdr.get( lockup_.epoch_ ) ||
       !rdr.get( lockup_.custodian_ ) ||
       !get_fee( rdr, epoch_fee_ ) ||
       !get_opt_fee( rdr, has_next_epoch_fee_, next_epoch_fee_ ) ||
       !get_opt_key( rdr, has_preferred_deposit_validator_,
                     preferred_deposit_validator_ ) ||
       !get_opt_key( rdr, has_preferred_withdraw_validator_,
                     preferred_withdraw_validator_ ) ||
       !get_fee( rdr, stake_deposit_fee_ ) ||
       !get_fee( rdr, stake_withdrawal_fee_ ) ||
       !get_opt_fee( rdr, has_next_stake_withdrawal_fee_,
                     next_stake_withdrawal_fee_ ) ||
       !rdr.get( stake_referral_fee_ ) ||
       !get_opt_key( rdr, has_sol_deposit_authority_,
                     sol_deposit_authority_ ) ||
       !get_fee( rdr, sol_deposit_fee_ ) ||
       !rdr.get( sol_referral_fee_ ) ||
       !get_opt_key( rdr, has_sol_withdraw_authority_,
                     sol_withdraw_authority_ ) ||
       !get_fee( rdr, sol_withdrawal_fee_ ) ||
       !get_opt_fee( rdr, has_next_sol_withdrawal_fee_,
                     next_sol_withdrawal_fee_ ) ||
       !rdr.get( last_epoch_pool_token_supply_ ) ||
       !rdr.get( last_epoch_total_lamports_ ) ) {
    return set_err_msg( "invalid stake pool account data at offset=" +
        std::to_string( rdr.get_pos() ) );
  }
  return true;
}

///////////////////////////////////////////////////////////////////////////
// validator_list_account

const char *sp::validator_status_to_str( validator_status st )
{
  switch( st ) {
    case e_validator_active: return "active";
    case e_validator_deactivating_transient: return "deactivating_transient";
    case e_validator_ready_for_removal: return "ready_for_removal";
    default: return "unknown";
  }
}

validator_list_account::validator_list_account()
: max_( 0 )
{
}

bool validator_list_account::init_from_buf( const char *buf, size_t len )
{
  reset_err();
  vec_.clear();
  bin_rdr rdr( buf, len );
  uint8_t atype = 0;
  uint32_t num = 0;
  if ( !rdr.get( atype ) || !rdr.get( max_ ) || !rdr.get( num ) ) {
    return set_err_msg( "validator list account too short" );
  }
  if ( atype != e_validator_list_account ) {
    return set_err_msg( "not a validator list account type=" +
        std::to_string( atype ) );
  }
  if ( num > max_ || rdr.get_left() / SP_VALIDATOR_INFO_SIZE < num ) {
    return set_err_msg( "invalid validator list length=" +
        std::to_string( num ) );
  }
  vec_.resize( num );
  for( validator_stake_info& info: vec_ ) {
    uint32_t unused = 0;
    uint8_t status = 0;
    if ( !rdr.get( info.active_stake_lamports_ ) ||
         !rdr.get( info.transient_stake_lamports_ ) ||
         !rdr.get( info.last_update_epoch_ ) ||
         !rdr.get( info.transient_seed_suffix_ ) ||
         !rdr.get( unused ) ||
         !rdr.get( info.validator_seed_suffix_ ) ||
         !rdr.get( status ) ||
         !rdr.get( info.vote_account_address_ ) ) {
      vec_.clear();
      return set_err_msg( "truncated validator list entry" );
    }
    info.status_ = status < e_validator_unknown ?
      (validator_status)status : e_validator_unknown;
  }
  return true;
}

uint32_t validator_list_account::get_max_validators() const
{
  return max_;
}

unsigned validator_list_account::get_num_validator() const
{
  return vec_.size();
}

const validator_stake_info&
validator_list_account::get_validator( unsigned i ) const
{
  return vec_[i];
}

const validator_vec_t& validator_list_account::get_validators() const
{
  return vec_;
}

int validator_list_account::find( const pub_key& vote ) const
{
  for( unsigned i=0; i != vec_.size(); ++i ) {
    if ( vec_[i].vote_account_address_ == vote ) {
      return (int)i;
    }
  }
  return -1;
}

///////////////////////////////////////////////////////////////////////////
// program-derived addresses

bool sp::find_withdraw_authority( const pub_key& program,
                                  const pub_key& pool, pub_key& res )
{
  uint8_t bump;
  str seeds[] = { str( pool.data(), pub_key::len ), str( "withdraw" ) };
  return find_program_address( seeds, 2, program, res, bump );
}

bool sp::find_stake_address( const pub_key& program, const pub_key& vote,
                             const pub_key& pool, uint32_t seed,
                             pub_key& res )
{
  uint8_t bump;
  char sbuf[sizeof(seed)];
  __builtin_memcpy( sbuf, &seed, sizeof( seed ) );
  str seeds[] = {
    str( vote.data(), pub_key::len ),
    str( pool.data(), pub_key::len ),
    str( sbuf, sizeof( sbuf ) )
  };
  return find_program_address( seeds, seed ? 3 : 2, program, res, bump );
}

bool sp::find_transient_stake_address( const pub_key& program,
                                       const pub_key& vote,
                                       const pub_key& pool, uint64_t seed,
                                       pub_key& res )
{
  uint8_t bump;
  char sbuf[sizeof(seed)];
  __builtin_memcpy( sbuf, &seed, sizeof( seed ) );
  str seeds[] = {
    str( "transient" ),
    str( vote.data(), pub_key::len ),
    str( pool.data(), pub_key::len ),
    str( sbuf, sizeof( sbuf ) )
  };
  return find_program_address( seeds, 4, program, res, bump );
}

bool sp::find_ephemeral_stake_address( const pub_key& program,
                                       const pub_key& pool, uint64_t seed,
                                       pub_key& res )
{
  uint8_t bump;
  char sbuf[sizeof(seed)];
  __builtin_memcpy( sbuf, &seed, sizeof( seed ) );
  str seeds[] = {
    str( "ephemeral" ),
    str( pool.data(), pub_key::len ),
    str( sbuf, sizeof( sbuf ) )
  };
  return find_program_address( seeds, 3, program, res, bump );
}

///////////////////////////////////////////////////////////////////////////
// raw instructions

static void set_move_data( instruction& ix, pool_instruction cmd,
                           uint64_t lamports, uint64_t transient_seed )
{
  char buf[17];
  bincode data( buf );
  data.add( (uint8_t)cmd );
  data.add( lamports );
  data.add( transient_seed );
  ix.set_data( buf, data.size() );
}

static void set_move_data( instruction& ix, pool_instruction cmd,
                           uint64_t lamports, uint64_t transient_seed,
                           uint64_t ephemeral_seed )
{
  char buf[25];
  bincode data( buf );
  data.add( (uint8_t)cmd );
  data.add( lamports );
  data.add( transient_seed );
  data.add( ephemeral_seed );
  ix.set_data( buf, data.size() );
}

static void add_pool_head( instruction& ix, const pool_keys& k )
{
  ix.set_program( k.program_ );
  ix.add_account( k.pool_, false, false );
  ix.add_account( k.staker_, true, false );
  ix.add_account( k.withdraw_auth_, false, false );
  ix.add_account( k.validator_list_, false, true );
}

void ix::decrease_validator_stake( instruction& ix, const pool_keys& k,
                                   const pub_key& validator_stake,
                                   const pub_key& transient,
                                   uint64_t lamports,
                                   uint64_t transient_seed )
{
  add_pool_head( ix, k );
  ix.add_account( validator_stake, false, true );
  ix.add_account( transient, false, true );
  ix.add_account( get_sysvar_clock(), false, false );
  ix.add_account( get_sysvar_rent(), false, false );
  ix.add_account( get_system_program(), false, false );
  ix.add_account( get_stake_program(), false, false );
  set_move_data( ix, e_decrease_validator_stake, lamports, transient_seed );
}

void ix::increase_validator_stake( instruction& ix, const pool_keys& k,
                                   const pub_key& vote,
                                   const pub_key& validator_stake,
                                   const pub_key& transient,
                                   uint64_t lamports,
                                   uint64_t transient_seed )
{
  add_pool_head( ix, k );
  ix.add_account( k.reserve_, false, true );
  ix.add_account( transient, false, true );
  ix.add_account( validator_stake, false, false );
  ix.add_account( vote, false, false );
  ix.add_account( get_sysvar_clock(), false, false );
  ix.add_account( get_sysvar_rent(), false, false );
  ix.add_account( get_sysvar_stake_history(), false, false );
  ix.add_account( get_stake_config(), false, false );
  ix.add_account( get_system_program(), false, false );
  ix.add_account( get_stake_program(), false, false );
  set_move_data( ix, e_increase_validator_stake, lamports, transient_seed );
}

void ix::update_validator_list_balance( instruction& ix, const pool_keys& k,
                                        const pub_key *stake_pairs,
                                        unsigned num_validator,
                                        uint32_t start_index,
                                        bool no_merge )
{
  ix.set_program( k.program_ );
  ix.add_account( k.pool_, false, false );
  ix.add_account( k.withdraw_auth_, false, false );
  ix.add_account( k.validator_list_, false, true );
  ix.add_account( k.reserve_, false, true );
  ix.add_account( get_sysvar_clock(), false, false );
  ix.add_account( get_sysvar_stake_history(), false, false );
  ix.add_account( get_stake_program(), false, false );
  for( unsigned i=0; i != 2*num_validator; ++i ) {
    ix.add_account( stake_pairs[i], false, true );
  }
  char buf[6];
  bincode data( buf );
  data.add( (uint8_t)e_update_validator_list_balance );
  data.add( start_index );
  data.add( (uint8_t)( no_merge ? 1 : 0 ) );
  ix.set_data( buf, data.size() );
}

void ix::update_stake_pool_balance( instruction& ix, const pool_keys& k )
{
  ix.set_program( k.program_ );
  ix.add_account( k.pool_, false, true );
  ix.add_account( k.withdraw_auth_, false, false );
  ix.add_account( k.validator_list_, false, true );
  ix.add_account( k.reserve_, false, false );
  ix.add_account( k.manager_fee_, false, true );
  ix.add_account( k.pool_mint_, false, true );
  ix.add_account( k.token_program_, false, false );
  char cmd = (char)e_update_stake_pool_balance;
  ix.set_data( &cmd, 1 );
}

void ix::cleanup_removed_validator_entries( instruction& ix,
                                            const pool_keys& k )
{
  ix.set_program( k.program_ );
  ix.add_account( k.pool_, false, false );
  ix.add_account( k.validator_list_, false, true );
  char cmd = (char)e_cleanup_removed_validator_entries;
  ix.set_data( &cmd, 1 );
}

void ix::increase_additional_validator_stake( instruction& ix,
                                              const pool_keys& k,
                                              const pub_key& vote,
                                              const pub_key& validator_stake,
                                              const pub_key& ephemeral,
                                              const pub_key& transient,
                                              uint64_t lamports,
                                              uint64_t transient_seed,
                                              uint64_t ephemeral_seed )
{
  add_pool_head( ix, k );
  ix.add_account( k.reserve_, false, true );
  ix.add_account( ephemeral, false, true );
  ix.add_account( transient, false, true );
  ix.add_account( validator_stake, false, false );
  ix.add_account( vote, false, false );
  ix.add_account( get_sysvar_clock(), false, false );
  ix.add_account( get_sysvar_stake_history(), false, false );
  ix.add_account( get_stake_config(), false, false );
  ix.add_account( get_system_program(), false, false );
  ix.add_account( get_stake_program(), false, false );
  set_move_data( ix, e_increase_additional_validator_stake, lamports,
                 transient_seed, ephemeral_seed );
}

void ix::decrease_additional_validator_stake( instruction& ix,
                                              const pool_keys& k,
                                              const pub_key& validator_stake,
                                              const pub_key& ephemeral,
                                              const pub_key& transient,
                                              uint64_t lamports,
                                              uint64_t transient_seed,
                                              uint64_t ephemeral_seed )
{
  add_pool_head( ix, k );
  ix.add_account( k.reserve_, false, true );
  ix.add_account( validator_stake, false, true );
  ix.add_account( ephemeral, false, true );
  ix.add_account( transient, false, true );
  ix.add_account( get_sysvar_clock(), false, false );
  ix.add_account( get_sysvar_stake_history(), false, false );
  ix.add_account( get_system_program(), false, false );
  ix.add_account( get_stake_program(), false, false );
  set_move_data( ix, e_decrease_additional_validator_stake, lamports,
                 transient_seed, ephemeral_seed );
}

void ix::decrease_validator_stake_with_reserve( instruction& ix,
                                                const pool_keys& k,
                                                const pub_key& validator_stake,
                                                const pub_key& transient,
                                                uint64_t lamports,
                                                uint64_t transient_seed )
{
  add_pool_head( ix, k );
  ix.add_account( k.reserve_, false, true );
  ix.add_account( validator_stake, false, true );
  ix.add_account( transient, false, true );
  ix.add_account( get_sysvar_clock(), false, false );
  ix.add_account( get_sysvar_stake_history(), false, false );
  ix.add_account( get_system_program(), false, false );
  ix.add_account( get_stake_program(), false, false );
  set_move_data( ix, e_decrease_validator_stake_with_reserve, lamports,
                 transient_seed );
}

///////////////////////////////////////////////////////////////////////////
// pool_builder

pool_builder::pool_builder()
{
}

bool pool_builder::init( const pub_key& program, const pub_key& pool,
                         const stake_pool_account& acc )
{
  reset_err();
  keys_.program_ = program;
  keys_.pool_ = pool;
  keys_.staker_ = acc.staker_;
  keys_.validator_list_ = acc.validator_list_;
  keys_.reserve_ = acc.reserve_stake_;
  keys_.pool_mint_ = acc.pool_mint_;
  keys_.manager_fee_ = acc.manager_fee_account_;
  keys_.token_program_ = acc.token_program_id_;
  if ( !find_withdraw_authority( program, pool, keys_.withdraw_auth_ ) ) {
    return set_err_msg( "failed to derive withdraw authority" );
  }
  return true;
}

const pool_keys& pool_builder::get_keys() const
{
  return keys_;
}

bool pool_builder::get_stake( const validator_stake_info& info,
                              pub_key& res )
{
  if ( !find_stake_address( keys_.program_, info.vote_account_address_,
                            keys_.pool_, info.validator_seed_suffix_,
                            res ) ) {
    return set_err_msg( "failed to derive validator stake address for " +
        info.vote_account_address_.enc_base58() );
  }
  return true;
}

bool pool_builder::get_transient( const validator_stake_info& info,
                                  uint64_t seed, pub_key& res )
{
  if ( !find_transient_stake_address( keys_.program_,
                                      info.vote_account_address_,
                                      keys_.pool_, seed, res ) ) {
    return set_err_msg( "failed to derive transient stake address for " +
        info.vote_account_address_.enc_base58() );
  }
  return true;
}

bool pool_builder::get_ephemeral( uint64_t seed, pub_key& res )
{
  if ( !find_ephemeral_stake_address( keys_.program_, keys_.pool_,
                                      seed, res ) ) {
    return set_err_msg( "failed to derive ephemeral stake address" );
  }
  return true;
}

bool pool_builder::increase( instruction& ix,
                             const validator_stake_info& info,
                             uint64_t lamports )
{
  // new transient account for each base increase
  uint64_t seed = info.transient_seed_suffix_ + 1;
  pub_key stake, transient;
  if ( !get_stake( info, stake ) ||
       !get_transient( info, seed, transient ) ) {
    return false;
  }
  ix::increase_validator_stake( ix, keys_, info.vote_account_address_,
                                stake, transient, lamports, seed );
  return true;
}

bool pool_builder::decrease( instruction& ix,
                             const validator_stake_info& info,
                             uint64_t lamports )
{
  uint64_t seed = info.transient_seed_suffix_ + 1;
  pub_key stake, transient;
  if ( !get_stake( info, stake ) ||
       !get_transient( info, seed, transient ) ) {
    return false;
  }
  ix::decrease_validator_stake_with_reserve( ix, keys_, stake, transient,
                                             lamports, seed );
  return true;
}

bool pool_builder::increase_additional( instruction& ix,
                                        const validator_stake_info& info,
                                        uint64_t lamports,
                                        uint64_t ephemeral_seed )
{
  // merges into the existing transient account
  uint64_t seed = info.transient_seed_suffix_;
  pub_key stake, transient, ephemeral;
  if ( !get_stake( info, stake ) ||
       !get_transient( info, seed, transient ) ||
       !get_ephemeral( ephemeral_seed, ephemeral ) ) {
    return false;
  }
  ix::increase_additional_validator_stake( ix, keys_,
      info.vote_account_address_, stake, ephemeral, transient,
      lamports, seed, ephemeral_seed );
  return true;
}

bool pool_builder::decrease_additional( instruction& ix,
                                        const validator_stake_info& info,
                                        uint64_t lamports,
                                        uint64_t ephemeral_seed )
{
  uint64_t seed = info.transient_seed_suffix_;
  pub_key stake, transient, ephemeral;
  if ( !get_stake( info, stake ) ||
       !get_transient( info, seed, transient ) ||
       !get_ephemeral( ephemeral_seed, ephemeral ) ) {
    return false;
  }
  ix::decrease_additional_validator_stake( ix, keys_, stake, ephemeral,
      transient, lamports, seed, ephemeral_seed );
  return true;
}

bool pool_builder::update_validator_list( instruction& ix,
                                          const validator_vec_t& lst,
                                          unsigned start, unsigned num,
                                          bool no_merge )
{
  if ( start >= lst.size() ) {
    return set_err_msg( "validator list start index out of range" );
  }
  num = std::min( num, (unsigned)lst.size() - start );
  std::vector<pub_key> pairs( 2*num );
  for( unsigned i=0; i != num; ++i ) {
    const validator_stake_info& info = lst[start + i];
    if ( !get_stake( info, pairs[2*i] ) ||
         !get_transient( info, info.transient_seed_suffix_,
                         pairs[2*i+1] ) ) {
      return false;
    }
  }
  ix::update_validator_list_balance( ix, keys_, pairs.data(), num,
                                     start, no_merge );
  return true;
}

void pool_builder::update_pool_balance( instruction& ix )
{
  ix::update_stake_pool_balance( ix, keys_ );
}

void pool_builder::cleanup( instruction& ix )
{
  ix::cleanup_removed_validator_entries( ix, keys_ );
}
