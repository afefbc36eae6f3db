#pragma once

#include <resledger/ledger/action.hpp>

namespace resledger::ledger {

   struct action_trace {
      action                     act;
      block_num_type             block_num = 0;
      int64_t                    revision = 0;      ///< database revision after the action
      std::optional<uint64_t>    return_value;      ///< request id for submitreq
   };

} // resledger::ledger
