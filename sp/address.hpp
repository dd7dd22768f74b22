#pragma once

#include <sp/key_pair.hpp>

#define SP_MAX_SEEDS     16
#define SP_MAX_SEED_LEN  32

namespace sp
{

  // does the 32-byte encoding decompress to a valid ed25519 point
  bool is_on_curve( const hash& );

  // program-derived address from seeds (bump seed included by caller)
  // fails if the seeds are out of bounds or the result lies on the curve
  bool create_program_address( const str seeds[], unsigned num_seeds,
                               const pub_key& program, pub_key& res );

  // search bump seeds from 255 down for the first off-curve address
  bool find_program_address( const str seeds[], unsigned num_seeds,
                             const pub_key& program,
                             pub_key& res, uint8_t& bump );

  // sha256 of the concatenation of byte strings
  bool sha256( const str parts[], unsigned num_parts, hash& res );

}
