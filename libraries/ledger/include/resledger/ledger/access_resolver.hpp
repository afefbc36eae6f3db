#pragma once
#include <resledger/ledger/types.hpp>
#include <resledger/ledger/role_object.hpp>

namespace resledger::ledger {

   class control_plane;

   /**
    *  Maps an actor to its priority tier and eligibility. Actors without a role row are
    *  eligible users of tier 1.
    */
   class access_resolver {
      public:
         access_resolver( database& db, const control_plane& control );

         void add_indices();

         uint8_t   resolve_tier( account_name actor )const;
         bool      is_eligible( account_name actor )const;
         role_type get_role( account_name actor )const;

         void set_role( account_name actor, account_name account, role_type role );
         void set_blacklisted( account_name actor, account_name account, bool blacklisted );

      private:
         template<typename Modifier>
         void upsert( account_name account, Modifier&& m );

         database&             _db;
         const control_plane&  _control;
   };

} // resledger::ledger
