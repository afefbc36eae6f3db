#pragma once
#include <resledger/ledger/types.hpp>
#include <resledger/ledger/resource_object.hpp>

namespace resledger::ledger {

   class control_plane;

   struct resource_params {
      resource_type_id   resource_type = 0;
      string             name;
      share_type         total_supply = 0;
      share_type         unit_price = 0;
      share_type         min_allocation = 0;
      share_type         max_allocation = 0;
      uint8_t            priority_floor = 1;
   };

   /**
    *  Owns the resource pools and their price history.
    *
    *  Administrative operations check the caller against the control plane. debit_available
    *  and credit_available are used by the allocation engine and the balance ledger only.
    */
   class resource_registry {
      public:
         resource_registry( database& db, const control_plane& control );

         void add_indices();

         /// creates the pool, or updates it keeping the units already held in balances
         const resource_object& register_resource( account_name actor, const resource_params& params, block_num_type now );
         void update_price( account_name actor, resource_type_id type, share_type new_price, block_num_type now );
         void set_locked( account_name actor, resource_type_id type, bool locked );

         void debit_available( resource_type_id type, share_type amount );
         void credit_available( resource_type_id type, share_type amount );

         const resource_object* find_resource( resource_type_id type )const;
         const resource_object& get_resource( resource_type_id type )const;
         vector<share_type>     get_price_history( resource_type_id type )const;

      private:
         database&             _db;
         const control_plane&  _control;
   };

} // resledger::ledger
