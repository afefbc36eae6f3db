#pragma once
#include <resledger/ledger/types.hpp>
#include <resledger/ledger/global_property_object.hpp>

namespace resledger::ledger {

   /**
    *  Owns the global switches of the ledger: initialized, paused and maintenance flags, the
    *  request counter, the per-operation amount cap and the emergency contact. The other
    *  components consult it through the require_* guards.
    */
   class control_plane {
      public:
         control_plane( database& db, account_name admin );

         void add_indices();
         void initialize_database( share_type default_max_amount, account_name default_emergency_contact );

         void initialize( account_name actor, share_type max_amount, account_name emergency_contact );
         void update_parameters( account_name actor, share_type max_amount, account_name emergency_contact );
         void enter_maintenance( account_name actor );
         void exit_maintenance( account_name actor );
         void set_paused( account_name actor, bool paused );

         /// bumps the request counter and returns the new value
         uint64_t next_request_id();

         void require_admin( account_name actor )const;
         /// neither paused nor in maintenance
         void require_active()const;
         void require_not_paused()const;
         void require_within_cap( share_type amount, const char* what )const;

         bool is_admin( account_name actor )const { return actor == _admin; }
         account_name admin()const { return _admin; }

         const global_property_object& get_global_properties()const;

      private:
         static void require_valid_cap( share_type max_amount );

         database&      _db;
         account_name   _admin;
   };

} // resledger::ledger
