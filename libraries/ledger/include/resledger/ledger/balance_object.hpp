#pragma once
#include <resledger/ledger/types.hpp>

#include "multi_index_includes.hpp"

namespace resledger::ledger {

   /**
    * Allocated units of one resource type held by one actor. Rows are created on first credit
    * and kept at zero.
    */
   class balance_object : public chainbase::object<balance_object_type, balance_object> {
      OBJECT_CTOR(balance_object)

         id_type            id;
         account_name       owner;
         resource_type_id   resource_type = 0;
         share_type         amount = 0;
   };

   struct by_owner_resource;
   struct by_resource_owner;
   using balance_index = chainbase::shared_multi_index_container<
      balance_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<balance_object, balance_object::id_type, &balance_object::id>>,
         ordered_unique<tag<by_owner_resource>,
            composite_key< balance_object,
               member<balance_object, account_name, &balance_object::owner>,
               member<balance_object, resource_type_id, &balance_object::resource_type>
            >
         >,
         ordered_unique<tag<by_resource_owner>,
            composite_key< balance_object,
               member<balance_object, resource_type_id, &balance_object::resource_type>,
               member<balance_object, account_name, &balance_object::owner>
            >
         >
      >
   >;

} // resledger::ledger

CHAINBASE_SET_INDEX_TYPE(resledger::ledger::balance_object, resledger::ledger::balance_index)
