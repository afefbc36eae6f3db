#include <resledger/ledger/control_plane.hpp>
#include <resledger/ledger/ledger_log.hpp>
#include <resledger/ledger/exceptions.hpp>

namespace resledger::ledger {

   control_plane::control_plane( database& db, account_name admin )
   :_db(db),_admin(admin)
   {
      RESLEDGER_ASSERT( !admin.empty(), action_validate_exception, "ledger administrator must be set" );
   }

   void control_plane::add_indices() {
      _db.add_index<global_property_multi_index>();
   }

   void control_plane::initialize_database( share_type default_max_amount, account_name default_emergency_contact ) {
      require_valid_cap( default_max_amount );
      if( _db.find<global_property_object>() ) return;

      _db.create<global_property_object>( [&]( auto& gpo ) {
         gpo.max_amount        = default_max_amount;
         gpo.emergency_contact = default_emergency_contact;
      });
   }

   const global_property_object& control_plane::get_global_properties()const {
      return _db.get<global_property_object>();
   }

   void control_plane::initialize( account_name actor, share_type max_amount, account_name emergency_contact ) {
      require_admin( actor );
      const auto& gpo = get_global_properties();
      RESLEDGER_ASSERT( !gpo.initialized, already_initialized_exception, "ledger was already initialized" );
      require_valid_cap( max_amount );

      // the request counter keeps counting so ids handed out before initialization stay unique
      _db.modify( gpo, [&]( auto& p ) {
         p.initialized       = true;
         p.paused            = false;
         p.maintenance       = false;
         p.max_amount        = max_amount;
         p.emergency_contact = emergency_contact;
      });
      rl_ilog( ledger_log, "ledger initialized by {}, amount cap {}, emergency contact {}", actor, max_amount, emergency_contact );
   }

   void control_plane::update_parameters( account_name actor, share_type max_amount, account_name emergency_contact ) {
      require_admin( actor );
      require_valid_cap( max_amount );

      _db.modify( get_global_properties(), [&]( auto& p ) {
         p.max_amount        = max_amount;
         p.emergency_contact = emergency_contact;
      });
      rl_dlog( ledger_log, "amount cap set to {}, emergency contact {}", max_amount, emergency_contact );
   }

   void control_plane::enter_maintenance( account_name actor ) {
      require_admin( actor );
      _db.modify( get_global_properties(), []( auto& p ) {
         p.maintenance = true;
         p.paused      = true;
      });
      rl_wlog( ledger_log, "ledger entered maintenance" );
   }

   void control_plane::exit_maintenance( account_name actor ) {
      require_admin( actor );
      _db.modify( get_global_properties(), []( auto& p ) {
         p.maintenance = false;
         p.paused      = false;
      });
      rl_ilog( ledger_log, "ledger left maintenance" );
   }

   void control_plane::set_paused( account_name actor, bool paused ) {
      require_admin( actor );
      _db.modify( get_global_properties(), [&]( auto& p ) {
         p.paused = paused;
      });
      rl_ilog( ledger_log, "ledger {}", paused ? "paused" : "resumed" );
   }

   uint64_t control_plane::next_request_id() {
      const auto& gpo = get_global_properties();
      _db.modify( gpo, []( auto& p ) {
         ++p.total_requests;
      });
      return gpo.total_requests;
   }

   void control_plane::require_valid_cap( share_type max_amount ) {
      RESLEDGER_ASSERT( max_amount > 0, invalid_resource_amount_exception, "amount cap must be positive" );
      RESLEDGER_ASSERT( max_amount <= config::max_amount_cap, invalid_resource_amount_exception,
                        "amount cap {} exceeds the largest cap {}", max_amount, config::max_amount_cap );
   }

   void control_plane::require_admin( account_name actor )const {
      RESLEDGER_ASSERT( actor == _admin, unauthorized_access_exception,
                        "{} is not the ledger administrator", actor );
   }

   void control_plane::require_active()const {
      const auto& gpo = get_global_properties();
      RESLEDGER_ASSERT( !gpo.maintenance, unauthorized_access_exception, "ledger is in maintenance" );
      RESLEDGER_ASSERT( !gpo.paused, unauthorized_access_exception, "ledger is paused" );
   }

   void control_plane::require_not_paused()const {
      RESLEDGER_ASSERT( !get_global_properties().paused, unauthorized_access_exception, "ledger is paused" );
   }

   void control_plane::require_within_cap( share_type amount, const char* what )const {
      RESLEDGER_ASSERT( amount > 0, invalid_resource_amount_exception, "{} must be positive", what );
      const auto cap = get_global_properties().max_amount;
      RESLEDGER_ASSERT( amount <= cap, invalid_resource_amount_exception,
                        "{} {} exceeds the amount cap {}", what, amount, cap );
   }

} // resledger::ledger
