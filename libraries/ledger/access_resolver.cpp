#include <resledger/ledger/access_resolver.hpp>
#include <resledger/ledger/control_plane.hpp>
#include <resledger/ledger/ledger_log.hpp>
#include <resledger/ledger/exceptions.hpp>

namespace resledger::ledger {

   const char* to_string( role_type r ) {
      switch( r ) {
         case role_type::user:     return "user";
         case role_type::verified: return "verified";
         case role_type::business: return "business";
         case role_type::premium:  return "premium";
         case role_type::admin:    return "admin";
      }
      return "user";
   }

   access_resolver::access_resolver( database& db, const control_plane& control )
   :_db(db),_control(control)
   {}

   void access_resolver::add_indices() {
      _db.add_index<role_index>();
   }

   role_type access_resolver::get_role( account_name actor )const {
      const auto* r = _db.find<role_object, by_account>( actor );
      return r ? r->role : role_type::user;
   }

   uint8_t access_resolver::resolve_tier( account_name actor )const {
      return role_tier( get_role( actor ) );
   }

   bool access_resolver::is_eligible( account_name actor )const {
      const auto* r = _db.find<role_object, by_account>( actor );
      return !r || !r->blacklisted;
   }

   template<typename Modifier>
   void access_resolver::upsert( account_name account, Modifier&& m ) {
      const auto* r = _db.find<role_object, by_account>( account );
      if( r ) {
         _db.modify( *r, std::forward<Modifier>(m) );
      } else {
         _db.create<role_object>( [&]( auto& ro ) {
            ro.account = account;
            m( ro );
         });
      }
   }

   void access_resolver::set_role( account_name actor, account_name account, role_type role ) {
      _control.require_admin( actor );
      RESLEDGER_ASSERT( !account.empty(), unauthorized_access_exception, "role account must be set" );

      upsert( account, [&]( auto& ro ) {
         ro.role = role;
      });
      rl_dlog( ledger_log, "role of {} set to {} (tier {})", account, role, role_tier( role ) );
   }

   void access_resolver::set_blacklisted( account_name actor, account_name account, bool blacklisted ) {
      _control.require_admin( actor );
      RESLEDGER_ASSERT( !account.empty(), unauthorized_access_exception, "blacklist account must be set" );
      RESLEDGER_ASSERT( !blacklisted || !_control.is_admin( account ), unauthorized_access_exception,
                        "the ledger administrator cannot be blacklisted" );

      upsert( account, [&]( auto& ro ) {
         ro.blacklisted = blacklisted;
      });
      rl_dlog( ledger_log, "{} {}", account, blacklisted ? "blacklisted" : "removed from blacklist" );
   }

} // resledger::ledger
