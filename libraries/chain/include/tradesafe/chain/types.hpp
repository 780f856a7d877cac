/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <stdint.h>
#include <array>
#include <deque>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fc/static_variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>
#include <fc/variant.hpp>
#include <fc/container/flat.hpp>
#include <fc/crypto/private_key.hpp>
#include <fc/crypto/public_key.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/io/raw.hpp>

#include <tradesafe/chain/name.hpp>

namespace tradesafe { namespace chain {
using std::deque;
using std::forward;
using std::make_pair;
using std::map;
using std::move;
using std::optional;
using std::pair;
using std::shared_ptr;
using std::string;
using std::to_string;
using std::unique_ptr;
using std::vector;

using fc::flat_map;
using fc::flat_set;
using fc::static_variant;
using fc::time_point;
using fc::time_point_sec;
using fc::variant;
using fc::variant_object;

using public_key_type  = fc::crypto::public_key;
using private_key_type = fc::crypto::private_key;

using action_name    = name;
using escrow_id_type = uint64_t;
using trade_id_type  = uint64_t;
using share_type     = uint64_t;
using symbol_id_type = uint32_t;
using counter_type   = uint64_t;

using hash_type      = fc::sha256;  ///< 32-byte content hash (evidence, explanations)
using bytes          = vector<char>;

}}  // namespace tradesafe::chain
