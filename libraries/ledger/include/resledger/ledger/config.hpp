#pragma once
#include <resledger/ledger/types.hpp>

namespace resledger::ledger::config {

  static constexpr auto system_account_name    { "resledger"_n };

  /// Requests lapse this many blocks after submission; 144 blocks is one day at the host's ten minute cadence.
  static constexpr block_num_type default_request_expiration_window = 144;

  static constexpr uint32_t   price_history_capacity       = 10;
  static constexpr uint32_t   max_resource_name_size       = 64;
  static constexpr uint32_t   max_request_purpose_size     = 256;

  /// per-operation amount cap used until update-parameters sets another one
  static constexpr share_type default_max_amount           = 1'000'000'000'000ull;
  /// highest amount cap update-parameters accepts
  static constexpr share_type max_amount_cap               = 1ull << 62;

  static constexpr uint64_t   default_state_size           = 64*1024*1024ll;

  static constexpr uint8_t    min_priority_tier            = 1;
  static constexpr uint8_t    max_priority_tier            = 5;

} // namespace resledger::ledger::config
