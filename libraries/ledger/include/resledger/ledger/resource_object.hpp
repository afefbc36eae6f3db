#pragma once
#include <resledger/ledger/types.hpp>

#include "multi_index_includes.hpp"

namespace resledger::ledger {

   /**
    *  A typed pool of allocatable units.
    *
    *  available_quantity never exceeds total_supply; the difference is the number of units of
    *  this type currently held in balances.
    */
   class resource_object : public chainbase::object<resource_object_type, resource_object> {
      OBJECT_CTOR(resource_object, (name))

         id_type            id;
         resource_type_id   resource_type = 0; //< resource_type should not be changed within a chainbase modifier lambda
         shared_string      name;
         share_type         total_supply = 0;
         share_type         available_quantity = 0;
         share_type         unit_price = 0;
         bool               locked = false;
         uint8_t            priority_floor = 1;
         share_type         min_allocation = 0;
         share_type         max_allocation = 0;
         uint64_t           price_updates = 0;   ///< sequence of the latest price_history_object
         block_num_type     last_price_update = 0;
         block_num_type     created_at = 0;

         share_type outstanding()const { return total_supply - available_quantity; }
   };

   struct by_resource_type;
   using resource_index = chainbase::shared_multi_index_container<
      resource_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<resource_object, resource_object::id_type, &resource_object::id>>,
         ordered_unique<tag<by_resource_type>, member<resource_object, resource_type_id, &resource_object::resource_type>>
      >
   >;

   /**
    *  One unit price set on a resource type. by_resource_sequence walks the prices of a type most
    *  recent first; at most config::price_history_capacity rows are kept per type.
    */
   class price_history_object : public chainbase::object<price_history_object_type, price_history_object> {
      OBJECT_CTOR(price_history_object)

         id_type            id;
         resource_type_id   resource_type = 0;
         uint64_t           sequence = 0;
         share_type         price = 0;
   };

   struct by_resource_sequence;
   using price_history_index = chainbase::shared_multi_index_container<
      price_history_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<price_history_object, price_history_object::id_type, &price_history_object::id>>,
         ordered_unique<tag<by_resource_sequence>,
            composite_key< price_history_object,
               member<price_history_object, resource_type_id, &price_history_object::resource_type>,
               member<price_history_object, uint64_t, &price_history_object::sequence>
            >,
            composite_key_compare< std::less<resource_type_id>, std::greater<uint64_t> >
         >
      >
   >;

} // resledger::ledger

CHAINBASE_SET_INDEX_TYPE(resledger::ledger::resource_object, resledger::ledger::resource_index)
CHAINBASE_SET_INDEX_TYPE(resledger::ledger::price_history_object, resledger::ledger::price_history_index)
