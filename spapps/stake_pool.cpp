#include <sp/manager.hpp>
#include <sp/log.hpp>

#include <unistd.h>
#include <signal.h>
#include <iostream>
#include <iomanip>

// stake pool command-line tool and rebalancing bot

using namespace sp;

static const std::string DEFAULT_RPC_HOST = "localhost";
static const std::string DEFAULT_KEY_FILE =
  std::string( getenv( "HOME" ) ? getenv( "HOME" ) : "." ) +
  "/.config/solana/id.json";

// interval between epoch checks in loop mode
static const int64_t EPOCH_POLL_INTERVAL = 60L*SP_NSECS_IN_SEC;

int usage()
{
  using namespace std;
  cerr << "usage: stake_pool" << endl;
  cerr << "  rebalance <pool_key> <retained_reserve_sol> [options]" << endl;
  cerr << "  show      <pool_key> [options]" << endl;
  cerr << "  update    <pool_key> [options]" << endl;
  cerr << "  increase  <pool_key> <vote_key> <lamports> [options]" << endl;
  cerr << "  decrease  <pool_key> <vote_key> <lamports> [options]" << endl;
  cerr << "  version" << endl;
  cerr << endl;

  cerr << "options include:" << endl;
  cerr << "  -r <rpc_host (default " << DEFAULT_RPC_HOST << ")>" << endl;
  cerr << "     Host name or IP address of solana rpc node in the form "
          "host_name[:rpc_port]\n" << endl;
  cerr << "  -k <staker key file (default " << DEFAULT_KEY_FILE << ")>"
       << endl;
  cerr << "     Json key pair file of the pool staker authority\n" << endl;
  cerr << "  -c <commitment_level (default confirmed)>" << endl;
  cerr << "     Options include processed, confirmed and finalized\n" << endl;
  cerr << "  -g <program_key>" << endl;
  cerr << "     Stake pool program id (default "
       << get_stake_pool_program().enc_base58() << ")\n" << endl;
  cerr << "  -m <lamports (default " << SP_MIN_INCREASE_LAMPORTS << ")>"
       << endl;
  cerr << "     Minimum stake increase worth submitting\n" << endl;
  cerr << "  -e <ephemeral_seed>" << endl;
  cerr << "     increase/decrease via ephemeral stake account while the "
          "validator has transient stake\n" << endl;
  cerr << "  -t <seconds (default 60)>" << endl;
  cerr << "     Time to wait for each transaction to be confirmed\n" << endl;
  cerr << "  -n" << endl;
  cerr << "     Dry run - plan and log actions without submitting\n" << endl;
  cerr << "  -l" << endl;
  cerr << "     Loop mode - rebalance once per epoch until interrupted\n"
       << endl;
  cerr << "  -d" << endl;
  cerr << "     Turn on debug logging\n" << endl;
  cerr << "  -h" << endl;
  cerr << "     Output this help text\n" << endl;
  return 1;
}

struct pool_arguments
{
  pool_arguments( int argc, char **argv );

  bool         invalid_    = false;
  std::string  rpc_host_   = DEFAULT_RPC_HOST;
  std::string  key_file_   = DEFAULT_KEY_FILE;
  commitment   cmt_        = commitment::e_confirmed;
  pub_key      pgm_        = get_stake_pool_program();
  uint64_t     min_inc_    = SP_MIN_INCREASE_LAMPORTS;
  bool         has_eph_    = false;
  uint64_t     eph_seed_   = 0;
  int64_t      timeout_    = 60L;
  bool         dry_run_    = false;
  bool         do_loop_    = false;
};

pool_arguments::pool_arguments( int argc, char **argv )
{
  int opt = 0;
  while ( (opt = ::getopt( argc, argv, "r:k:c:g:m:e:t:nldh" )) != -1 ) {
    switch (opt) {
      case 'r': rpc_host_ = optarg; break;
      case 'k': key_file_ = optarg; break;
      case 'c': cmt_ = str_to_commitment( optarg ); break;
      case 'g':
        if ( !pgm_.init_from_text( str( optarg ) ) ) {
          std::cerr << "stake_pool: invalid program key" << std::endl;
          invalid_ = true;
        }
        break;
      case 'm':
        if ( !str_to_num( optarg, min_inc_ ) ) {
          std::cerr << "stake_pool: invalid minimum increase" << std::endl;
          invalid_ = true;
        }
        break;
      case 'e':
        has_eph_ = true;
        if ( !str_to_num( optarg, eph_seed_ ) ) {
          std::cerr << "stake_pool: invalid ephemeral seed" << std::endl;
          invalid_ = true;
        }
        break;
      case 't': {
        uint64_t secs = 0;
        if ( !str_to_num( optarg, secs ) || secs == 0 ||
             secs > (uint64_t)( INT64_MAX / SP_NSECS_IN_SEC ) ) {
          std::cerr << "stake_pool: invalid confirmation timeout"
                    << std::endl;
          invalid_ = true;
        } else {
          timeout_ = (int64_t)secs;
        }
        break;
      }
      case 'n': dry_run_ = true; break;
      case 'l': do_loop_ = true; break;
      case 'd': log::set_level( SP_LOG_DBG_LVL ); break;
      default:
        usage();
        invalid_ = true;
    }
  }

  if ( cmt_ == commitment::e_unknown ) {
    std::cerr << "stake_pool: unknown commitment level" << std::endl;
    invalid_ = true;
    usage();
  }
}

bool do_run = true;

void sig_handle( int )
{
  do_run = false;
}

static bool get_key( const char *txt, pub_key& pk, const char *what )
{
  if ( !pk.init_from_text( str( txt ) ) ) {
    std::cerr << "stake_pool: invalid " << what << " key=" << txt
              << std::endl;
    return false;
  }
  return true;
}

static bool init_manager( manager& mgr, key_pair& kp,
                          const pool_arguments& args, bool need_key )
{
  if ( need_key ) {
    if ( !kp.init_from_file( args.key_file_ ) ) {
      std::cerr << "stake_pool: failed to read key file="
                << args.key_file_ << std::endl;
      return false;
    }
    mgr.set_staker( &kp );
  }
  mgr.set_rpc_host( args.rpc_host_ );
  mgr.set_commitment( args.cmt_ );
  mgr.set_program( args.pgm_ );
  mgr.set_min_increase( args.min_inc_ );
  mgr.set_dry_run( args.dry_run_ );
  mgr.set_confirm_timeout( args.timeout_ * SP_NSECS_IN_SEC );
  if ( !mgr.init() || !mgr.bootstrap() ) {
    std::cerr << "stake_pool: " << mgr.get_err_msg() << std::endl;
    return false;
  }
  return true;
}

static void print_results( const executor& exe )
{
  for( unsigned i=0; i != exe.get_num_result(); ++i ) {
    const action_result& res = exe.get_result( i );
    std::cout << std::left << std::setw( 10 )
              << action_status_to_str( res.status_ ) << ' '
              << std::setw( 10 ) << res.name_;
    if ( res.is_action_ ) {
      std::cout << ' ' << res.act_.vote_.enc_base58()
                << ' ' << lamports_to_str( res.act_.lamports_ );
    }
    if ( res.status_ != e_action_pending &&
         !res.err_.empty() ) {
      std::cout << ' ' << res.err_;
    }
    std::cout << std::endl;
  }
}

int on_rebalance( int argc, char **argv )
{
  if ( argc < 3 ) {
    return usage();
  }
  pub_key pool;
  if ( !get_key( argv[1], pool, "pool" ) ) {
    return 1;
  }
  uint64_t retained = 0;
  if ( !str_to_lamports( argv[2], retained ) ) {
    std::cerr << "stake_pool: invalid retained reserve amount" << std::endl;
    return 1;
  }
  argc -= 2;
  argv += 2;
  pool_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  key_pair kp;
  manager mgr;
  if ( !init_manager( mgr, kp, args, !args.dry_run_ ) ) {
    return 1;
  }
  signal( SIGINT, sig_handle );
  signal( SIGHUP, sig_handle );
  signal( SIGTERM, sig_handle );

  uint64_t last_epoch = UINT64_MAX;
  int rc = 0;
  do {
    // one pass per epoch in loop mode
    uint64_t epoch = 0;
    if ( args.do_loop_ && !mgr.get_epoch( epoch ) ) {
      SP_LOG_ERR( "failed to get epoch" )
        .add( "error", str( mgr.get_err_msg() ) )
        .end();
      mgr.reset_err();
    } else if ( !args.do_loop_ || epoch != last_epoch ) {
      executor exe;
      plan_stats stats;
      if ( mgr.rebalance( pool, retained, exe, stats ) ) {
        print_results( exe );
        last_epoch = epoch;
        rc = exe.get_num_status( e_action_confirmed ) ==
             exe.get_num_result() ? 0 : 1;
      } else {
        std::cerr << "stake_pool: " << mgr.get_err_msg() << std::endl;
        mgr.reset_err();
        rc = 1;
      }
    }
    int64_t ts = get_now();
    while( args.do_loop_ && do_run &&
           get_now() - ts < EPOCH_POLL_INTERVAL ) {
      mgr.poll();
    }
  } while( args.do_loop_ && do_run );
  return rc;
}

int on_show( int argc, char **argv )
{
  if ( argc < 2 ) {
    return usage();
  }
  pub_key pool;
  if ( !get_key( argv[1], pool, "pool" ) ) {
    return 1;
  }
  argc -= 1;
  argv += 1;
  pool_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  key_pair kp;
  manager mgr;
  pool_snapshot snap;
  if ( !init_manager( mgr, kp, args, false ) ||
       !mgr.read_snapshot( pool, snap ) ) {
    std::cerr << "stake_pool: " << mgr.get_err_msg() << std::endl;
    return 1;
  }
  const stake_pool_account& acc = snap.pool_;
  std::cout << "pool              " << pool.enc_base58() << std::endl;
  std::cout << "manager           " << acc.manager_.enc_base58() << std::endl;
  std::cout << "staker            " << acc.staker_.enc_base58() << std::endl;
  std::cout << "validator_list    " << acc.validator_list_.enc_base58()
            << std::endl;
  std::cout << "reserve_stake     " << acc.reserve_stake_.enc_base58()
            << std::endl;
  std::cout << "pool_mint         " << acc.pool_mint_.enc_base58()
            << std::endl;
  std::cout << "total             " << lamports_to_str( snap.total_lamports_ )
            << std::endl;
  std::cout << "reserve           "
            << lamports_to_str( snap.reserve_lamports_ ) << std::endl;
  std::cout << "pool_tokens       " << acc.pool_token_supply_ << std::endl;
  std::cout << "epoch_fee         " << acc.epoch_fee_.numerator_ << '/'
            << acc.epoch_fee_.denominator_ << std::endl;
  std::cout << "last_update_epoch " << acc.last_update_epoch_
            << " (current " << snap.epoch_ << ")" << std::endl;
  std::cout << "validators        " << snap.validators_.size() << std::endl;
  for( const validator_stake_info& v: snap.validators_ ) {
    std::cout << "  " << v.vote_account_address_.enc_base58()
              << " active=" << lamports_to_str( v.active_stake_lamports_ )
              << " transient="
              << lamports_to_str( v.transient_stake_lamports_ )
              << " status=" << validator_status_to_str( v.status_ )
              << " last_update_epoch=" << v.last_update_epoch_
              << std::endl;
  }
  return 0;
}

int on_update( int argc, char **argv )
{
  if ( argc < 2 ) {
    return usage();
  }
  pub_key pool;
  if ( !get_key( argv[1], pool, "pool" ) ) {
    return 1;
  }
  argc -= 1;
  argv += 1;
  pool_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  key_pair kp;
  manager mgr;
  pool_snapshot snap;
  bool is_updated = false;
  if ( !init_manager( mgr, kp, args, !args.dry_run_ ) ||
       !mgr.read_snapshot( pool, snap ) ||
       !mgr.update_pool( snap, is_updated ) ) {
    std::cerr << "stake_pool: " << mgr.get_err_msg() << std::endl;
    return 1;
  }
  if ( !is_updated ) {
    std::cout << "pool already updated for epoch " << snap.epoch_
              << std::endl;
  }
  return 0;
}

int on_move_stake( int argc, char **argv, action_type typ )
{
  if ( argc < 4 ) {
    return usage();
  }
  pub_key pool, vote;
  if ( !get_key( argv[1], pool, "pool" ) ||
       !get_key( argv[2], vote, "vote" ) ) {
    return 1;
  }
  uint64_t lamports = 0;
  if ( !str_to_num( argv[3], lamports ) || lamports == 0 ) {
    std::cerr << "stake_pool: invalid lamports amount" << std::endl;
    return 1;
  }
  argc -= 3;
  argv += 3;
  pool_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  key_pair kp;
  manager mgr;
  executor exe;
  rebalance_action act( typ, vote, lamports );
  act.has_ephemeral_ = args.has_eph_;
  act.ephemeral_seed_ = args.eph_seed_;
  if ( !init_manager( mgr, kp, args, true ) ||
       !mgr.move_stake( pool, act, exe ) ) {
    std::cerr << "stake_pool: " << mgr.get_err_msg() << std::endl;
    return 1;
  }
  print_results( exe );
  return exe.get_num_status( e_action_confirmed ) == 1 ? 0 : 1;
}

int main(int argc, char **argv)
{
  if ( argc < 2 ) {
    return usage();
  }
  --argc;
  ++argv;

  // set up signal handing
  signal( SIGPIPE, SIG_IGN );
  log::set_level( SP_LOG_INF_LVL );

  // dispatch by command
  std::string cmd( argv[0] );
  int rc = 0;
  if ( cmd == "rebalance" ) {
    rc = on_rebalance( argc, argv );
  } else if ( cmd == "show" ) {
    rc = on_show( argc, argv );
  } else if ( cmd == "update" ) {
    rc = on_update( argc, argv );
  } else if ( cmd == "increase" ) {
    rc = on_move_stake( argc, argv, e_increase );
  } else if ( cmd == "decrease" ) {
    rc = on_move_stake( argc, argv, e_decrease );
  } else if ( cmd == "version" ) {
    std::cout << "version: " << SP_VERSION << std::endl;
  } else {
    std::cerr << "stake_pool: unknown command" << std::endl;
    rc = usage();
  }
  log::flush();
  return rc;
}
