#pragma once

#include <sp/error.hpp>
#include <sp/key_pair.hpp>
#include <sp/transaction.hpp>
#include <vector>

#define SP_STAKE_ACCOUNT_SIZE        200
#define SP_MAX_VALIDATORS_TO_UPDATE  5
#define SP_VALIDATOR_INFO_SIZE       73

namespace sp
{
  class bin_rdr;

  // well-known program and sysvar ids
  const pub_key& get_stake_pool_program();
  const pub_key& get_stake_program();
  const pub_key& get_system_program();
  const pub_key& get_sysvar_clock();
  const pub_key& get_sysvar_rent();
  const pub_key& get_sysvar_stake_history();
  const pub_key& get_stake_config();

  // stake pool program account types
  enum account_type
  {
    e_uninitialized_account = 0,
    e_stake_pool_account,
    e_validator_list_account
  };

  // fee as ratio of numerator/denominator
  struct fee
  {
    uint64_t denominator_;
    uint64_t numerator_;
  };

  struct lockup
  {
    int64_t  unix_timestamp_;
    uint64_t epoch_;
    pub_key  custodian_;
  };

  // decoded stake pool account
  class stake_pool_account : public error
  {
  public:
    stake_pool_account();

    bool init_from_buf( const char *buf, size_t len );

    uint8_t  account_type_;
    pub_key  manager_;
    pub_key  staker_;
    pub_key  stake_deposit_authority_;
    uint8_t  stake_withdraw_bump_seed_;
    pub_key  validator_list_;
    pub_key  reserve_stake_;
    pub_key  pool_mint_;
    pub_key  manager_fee_account_;
    pub_key  token_program_id_;
    uint64_t total_lamports_;
    uint64_t pool_token_supply_;
    uint64_t last_update_epoch_;
    lockup   lockup_;
    fee      epoch_fee_;
    bool     has_next_epoch_fee_;
    fee      next_epoch_fee_;
    bool     has_preferred_deposit_validator_;
    pub_key  preferred_deposit_validator_;
    bool     has_preferred_withdraw_validator_;
    pub_key  preferred_withdraw_validator_;
    fee      stake_deposit_fee_;
    fee      stake_withdrawal_fee_;
    bool     has_next_stake_withdrawal_fee_;
    fee      next_stake_withdrawal_fee_;
    uint8_t  stake_referral_fee_;
    bool     has_sol_deposit_authority_;
    pub_key  sol_deposit_authority_;
    fee      sol_deposit_fee_;
    uint8_t  sol_referral_fee_;
    bool     has_sol_withdraw_authority_;
    pub_key  sol_withdraw_authority_;
    fee      sol_withdrawal_fee_;
    bool     has_next_sol_withdrawal_fee_;
    fee      next_sol_withdrawal_fee_;
    uint64_t last_epoch_pool_token_supply_;
    uint64_t last_epoch_total_lamports_;

  private:
    bool get_fee( bin_rdr&, fee& );
    bool get_opt_fee( bin_rdr&, bool&, fee& );
    bool get_opt_key( bin_rdr&, bool&, pub_key& );
  };

  // status of validator stake in the pool
  enum validator_status
  {
    e_validator_active = 0,
    e_validator_deactivating_transient,
    e_validator_ready_for_removal,
    e_validator_unknown
  };

  const char *validator_status_to_str( validator_status );

  // validator list entry
  struct validator_stake_info
  {
    uint64_t         active_stake_lamports_;
    uint64_t         transient_stake_lamports_;
    uint64_t         last_update_epoch_;
    uint64_t         transient_seed_suffix_;
    uint32_t         validator_seed_suffix_;
    validator_status status_;
    pub_key          vote_account_address_;
  };

  typedef std::vector<validator_stake_info> validator_vec_t;

  // decoded validator list account
  class validator_list_account : public error
  {
  public:
    validator_list_account();

    bool init_from_buf( const char *buf, size_t len );

    uint32_t get_max_validators() const;
    unsigned get_num_validator() const;
    const validator_stake_info& get_validator( unsigned ) const;
    const validator_vec_t& get_validators() const;

    // index of validator by vote account (-1 if not found)
    int find( const pub_key& vote ) const;

  private:
    uint32_t        max_;
    validator_vec_t vec_;
  };

  // program-derived addresses
  bool find_withdraw_authority( const pub_key& program, const pub_key& pool,
                                pub_key& res );
  bool find_stake_address( const pub_key& program, const pub_key& vote,
                           const pub_key& pool, uint32_t seed,
                           pub_key& res );
  bool find_transient_stake_address( const pub_key& program,
                                     const pub_key& vote,
                                     const pub_key& pool, uint64_t seed,
                                     pub_key& res );
  bool find_ephemeral_stake_address( const pub_key& program,
                                     const pub_key& pool, uint64_t seed,
                                     pub_key& res );

  // addresses shared by all pool instructions
  struct pool_keys
  {
    pub_key program_;
    pub_key pool_;
    pub_key staker_;
    pub_key withdraw_auth_;
    pub_key validator_list_;
    pub_key reserve_;
    pub_key pool_mint_;
    pub_key manager_fee_;
    pub_key token_program_;
  };

  // raw stake pool program instructions
  namespace ix
  {
    void decrease_validator_stake( instruction&, const pool_keys&,
                                   const pub_key& validator_stake,
                                   const pub_key& transient,
                                   uint64_t lamports,
                                   uint64_t transient_seed );

    void increase_validator_stake( instruction&, const pool_keys&,
                                   const pub_key& vote,
                                   const pub_key& validator_stake,
                                   const pub_key& transient,
                                   uint64_t lamports,
                                   uint64_t transient_seed );

    void update_validator_list_balance( instruction&, const pool_keys&,
                                        const pub_key *stake_pairs,
                                        unsigned num_validator,
                                        uint32_t start_index,
                                        bool no_merge );

    void update_stake_pool_balance( instruction&, const pool_keys& );

    void cleanup_removed_validator_entries( instruction&,
                                            const pool_keys& );

    void increase_additional_validator_stake( instruction&,
                                              const pool_keys&,
                                              const pub_key& vote,
                                              const pub_key& validator_stake,
                                              const pub_key& ephemeral,
                                              const pub_key& transient,
                                              uint64_t lamports,
                                              uint64_t transient_seed,
                                              uint64_t ephemeral_seed );

    void decrease_additional_validator_stake( instruction&,
                                              const pool_keys&,
                                              const pub_key& validator_stake,
                                              const pub_key& ephemeral,
                                              const pub_key& transient,
                                              uint64_t lamports,
                                              uint64_t transient_seed,
                                              uint64_t ephemeral_seed );

    void decrease_validator_stake_with_reserve( instruction&,
                                                const pool_keys&,
                                                const pub_key& validator_stake,
                                                const pub_key& transient,
                                                uint64_t lamports,
                                                uint64_t transient_seed );
  }

  // builds stake pool instructions for one pool deriving all addresses
  class pool_builder : public error
  {
  public:
    pool_builder();

    // pool addresses from decoded pool account
    bool init( const pub_key& program, const pub_key& pool,
               const stake_pool_account& );
    const pool_keys& get_keys() const;

    // move lamports from reserve to validator
    bool increase( instruction&, const validator_stake_info&,
                   uint64_t lamports );

    // move lamports from validator back to reserve
    bool decrease( instruction&, const validator_stake_info&,
                   uint64_t lamports );

    // variants via ephemeral stake account while transient stake exists
    bool increase_additional( instruction&, const validator_stake_info&,
                              uint64_t lamports, uint64_t ephemeral_seed );
    bool decrease_additional( instruction&, const validator_stake_info&,
                              uint64_t lamports, uint64_t ephemeral_seed );

    // refresh balances of validators [start, start+num) in list
    bool update_validator_list( instruction&, const validator_vec_t&,
                                unsigned start, unsigned num,
                                bool no_merge );

    // refresh pool totals and drop removed validators
    void update_pool_balance( instruction& );
    void cleanup( instruction& );

  private:
    bool get_stake( const validator_stake_info&, pub_key& );
    bool get_transient( const validator_stake_info&, uint64_t seed,
                        pub_key& );
    bool get_ephemeral( uint64_t seed, pub_key& );

    pool_keys keys_;
  };

}
