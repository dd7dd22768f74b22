#pragma once

#include <sp/error.hpp>
#include <sp/key_pair.hpp>
#include <vector>

namespace sp
{

  // account referenced by an instruction
  struct account_meta
  {
    account_meta();
    account_meta( const pub_key&, bool is_signer, bool is_writable );
    pub_key key_;
    bool    is_signer_;
    bool    is_writable_;
  };

  // single program instruction
  class instruction
  {
  public:
    instruction();

    // invoked program
    void set_program( const pub_key& );
    const pub_key& get_program() const;

    // accounts in the order expected by the program
    void add_account( const pub_key&, bool is_signer, bool is_writable );
    unsigned get_num_account() const;
    const account_meta& get_account( unsigned ) const;

    // instruction data
    void set_data( const char *buf, size_t len );
    const char *get_data() const;
    size_t get_data_len() const;

  private:
    typedef std::vector<account_meta> meta_vec_t;
    typedef std::vector<char>         data_t;
    pub_key    pgm_;
    meta_vec_t accs_;
    data_t     data_;
  };

  // signed legacy transaction
  class transaction : public error
  {
  public:
    // maximum serialized transaction size (ipv6 mtu less headers)
    static const size_t max_size = 1232;

    transaction();

    // fee payer (first signer)
    void set_fee_payer( const key_pair * );

    // additional signing key
    void add_signer( const key_pair * );

    // recent block hash
    void set_block_hash( const hash& );

    // append instruction
    void add( const instruction& );
    unsigned get_num_instruction() const;

    // drop instructions and serialized state
    void clear();

    // compile message, sign and serialize
    bool build();

    // serialized transaction
    const char *get_data() const;
    size_t get_size() const;

    // fee payer signature (transaction id)
    const signature& get_signature() const;

    // compiled account keys and header
    unsigned get_num_key() const;
    const pub_key& get_key( unsigned ) const;
    unsigned get_num_signer() const;
    unsigned get_num_readonly_signed() const;
    unsigned get_num_readonly_unsigned() const;

  private:

    typedef std::vector<const key_pair*> kp_vec_t;
    typedef std::vector<instruction>     instr_vec_t;
    typedef std::vector<account_meta>    meta_vec_t;
    typedef std::vector<char>            buf_t;

    bool compile();
    int  find_key( const pub_key& ) const;
    void add_key( const pub_key&, bool is_signer, bool is_writable );

    const key_pair *payer_;
    kp_vec_t        kps_;
    hash            bhash_;
    instr_vec_t     ixs_;
    meta_vec_t      keys_;
    buf_t           buf_;
    signature       sig_;
    unsigned        nsign_;
    unsigned        nro_sign_;
    unsigned        nro_unsign_;
  };

}
