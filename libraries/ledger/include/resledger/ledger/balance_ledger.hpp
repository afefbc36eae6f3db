#pragma once
#include <resledger/ledger/types.hpp>
#include <resledger/ledger/balance_object.hpp>

namespace resledger::ledger {

   class control_plane;
   class access_resolver;
   class resource_registry;

   /**
    *  Per-actor, per-resource-type balances of allocated units.
    */
   class balance_ledger {
      public:
         balance_ledger( database& db, const control_plane& control, const access_resolver& access,
                         resource_registry& registry );

         void add_indices();

         void credit( account_name owner, resource_type_id type, share_type amount );
         void debit( account_name owner, resource_type_id type, share_type amount );

         void transfer( account_name from, account_name to, resource_type_id type, share_type amount );
         void return_allocated( account_name owner, resource_type_id type, share_type amount );

         share_type get_balance( account_name owner, resource_type_id type )const;
         share_type get_total_balance( account_name owner )const;
         /// sum of the balances held of one resource type, never more than its total supply
         share_type get_outstanding( resource_type_id type )const;

      private:
         database&                _db;
         const control_plane&     _control;
         const access_resolver&   _access;
         resource_registry&       _registry;
   };

} // resledger::ledger
