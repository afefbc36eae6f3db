#pragma once
#include <resledger/ledger/types.hpp>
#include <resledger/ledger/config.hpp>

#include "multi_index_includes.hpp"

namespace resledger::ledger {

   /**
    * @class global_property_object
    * @brief Maintains global state information about the ledger switches and counters
    * @ingroup object
    * @ingroup implementation
    *
    * Exactly one row exists; it is created by the control plane when the indices are added.
    */
   class global_property_object : public chainbase::object<global_property_object_type, global_property_object>
   {
      OBJECT_CTOR(global_property_object)

         id_type        id;
         bool           initialized        = false;
         uint64_t       total_requests     = 0;   ///< also the source of the next request id
         bool           paused             = false;
         bool           maintenance        = false;
         share_type     max_amount         = config::default_max_amount;
         account_name   emergency_contact;
   };

   using global_property_multi_index = chainbase::shared_multi_index_container<
      global_property_object,
      indexed_by<
         ordered_unique<tag<by_id>,
            BOOST_MULTI_INDEX_MEMBER(global_property_object, global_property_object::id_type, id)
         >
      >
   >;

} // resledger::ledger

CHAINBASE_SET_INDEX_TYPE(resledger::ledger::global_property_object, resledger::ledger::global_property_multi_index)
