#include <resledger/ledger/controller.hpp>
#include <resledger/ledger/apply_context.hpp>
#include <resledger/ledger/exceptions.hpp>
#include <resledger/ledger/ledger_log.hpp>
#include <resledger/ledger/resledger_contract.hpp>

#include <resledger/ledger/access_resolver.hpp>
#include <resledger/ledger/allocation_engine.hpp>
#include <resledger/ledger/balance_ledger.hpp>
#include <resledger/ledger/control_plane.hpp>
#include <resledger/ledger/resource_registry.hpp>

#include <boost/preprocessor/cat.hpp>

#include <map>

namespace resledger::ledger {

util::logger ledger_log;

struct controller_impl {
   controller&          self;
   controller::config   conf;
   database             db;
   control_plane        control;
   access_resolver      access;
   resource_registry    registry;
   balance_ledger       balances;
   allocation_engine    allocations;
   block_num_type       head_block_num;

   std::map<action_name, apply_handler> apply_handlers;

   controller_impl( const controller::config& cfg, controller& s )
   :self(s)
   ,conf(cfg)
   ,db( cfg.state_dir, database::read_write, cfg.state_size, false, cfg.db_map_mode )
   ,control( db, cfg.admin )
   ,access( db, control )
   ,registry( db, control )
   ,balances( db, control, access, registry )
   ,allocations( db, control, access, registry, balances, cfg.request_expiration_window )
   ,head_block_num( cfg.genesis_block_num )
   {
      // picks up the resledger_ledger logger when logging was configured before the controller
      util::logger::update( ledger_logger_name, ledger_log );

      control.add_indices();
      access.add_indices();
      registry.add_indices();
      balances.add_indices();
      allocations.add_indices();

      control.initialize_database( cfg.default_max_amount, cfg.default_emergency_contact );

#define SET_APP_HANDLER( action ) \
   set_apply_handler( action_name(#action), &BOOST_PP_CAT(apply_resledger_, action) )

   SET_APP_HANDLER( init );
   SET_APP_HANDLER( setparams );
   SET_APP_HANDLER( setmaint );
   SET_APP_HANDLER( clrmaint );
   SET_APP_HANDLER( setpaused );
   SET_APP_HANDLER( setrole );
   SET_APP_HANDLER( setblacklist );
   SET_APP_HANDLER( regresource );
   SET_APP_HANDLER( updateprice );
   SET_APP_HANDLER( lockres );
   SET_APP_HANDLER( unlockres );
   SET_APP_HANDLER( submitreq );
   SET_APP_HANDLER( approvereq );
   SET_APP_HANDLER( rejectreq );
   SET_APP_HANDLER( expirereq );
   SET_APP_HANDLER( transfer );
   SET_APP_HANDLER( returnalloc );
#undef SET_APP_HANDLER

      rl_ilog( ledger_log, "ledger controller started at block {}, administrator {}", head_block_num, conf.admin );
   }

   void set_apply_handler( action_name action, apply_handler v ) {
      apply_handlers[action] = std::move(v);
   }

   const apply_handler* find_apply_handler( action_name act )const {
      auto itr = apply_handlers.find( act );
      if( itr != apply_handlers.end() )
         return &itr->second;
      return nullptr;
   }

   action_trace push_action( const action& act ) {
      RESLEDGER_ASSERT( act.account == ledger::config::system_account_name, action_validate_exception,
                        "action {} is addressed to {}, not to {}", act.name, act.account, ledger::config::system_account_name );
      const auto* handler = find_apply_handler( act.name );
      RESLEDGER_ASSERT( handler != nullptr, unknown_action_exception, "no handler registered for action {}", act.name );

      auto session = db.start_undo_session( true );

      apply_context context( self, act );
      try {
         (*handler)( context );
      } catch( const util::exception& e ) {
         rl_dlog( ledger_log, "action {} failed at block {}: {}", act.name, head_block_num, e.to_detail_string() );
         throw;
      }

      session.squash();

      action_trace trace;
      trace.act          = act;
      trace.block_num    = head_block_num;
      trace.revision     = db.revision();
      trace.return_value = context.action_return_value;
      return trace;
   }
};

controller::controller( const config& cfg ) try
:my( std::make_unique<controller_impl>( cfg, *this ) )
{
} catch( const util::exception& ) {
   throw;
} catch( const std::exception& e ) {
   RESLEDGER_THROW( database_exception, "unable to open ledger state in {}: {}", cfg.state_dir.string(), e.what() );
}

controller::~controller() = default;

action_trace controller::push_action( const action& act ) {
   return my->push_action( act );
}

void controller::produce_block() {
   ++my->head_block_num;
   rl_tlog( ledger_log, "produced block {}", my->head_block_num );
}

void controller::produce_blocks( uint32_t n ) {
   for( uint32_t i = 0; i < n; ++i )
      produce_block();
}

block_num_type controller::head_block_num()const {
   return my->head_block_num;
}

const controller::config& controller::get_config()const {
   return my->conf;
}

const database& controller::db()const { return my->db; }
database&       controller::mutable_db() { return my->db; }

const control_plane&      controller::get_control_plane()const        { return my->control; }
control_plane&            controller::get_mutable_control_plane()     { return my->control; }
const access_resolver&    controller::get_access_resolver()const      { return my->access; }
access_resolver&          controller::get_mutable_access_resolver()   { return my->access; }
const resource_registry&  controller::get_resource_registry()const    { return my->registry; }
resource_registry&        controller::get_mutable_resource_registry() { return my->registry; }
const balance_ledger&     controller::get_balance_ledger()const       { return my->balances; }
balance_ledger&           controller::get_mutable_balance_ledger()    { return my->balances; }
const allocation_engine&  controller::get_allocation_engine()const    { return my->allocations; }
allocation_engine&        controller::get_mutable_allocation_engine() { return my->allocations; }

const apply_handler* controller::find_apply_handler( action_name act )const {
   return my->find_apply_handler( act );
}

const global_property_object& controller::get_global_properties()const {
   return my->control.get_global_properties();
}

const resource_object& controller::get_resource( resource_type_id type )const {
   return my->registry.get_resource( type );
}

const resource_object* controller::find_resource( resource_type_id type )const {
   return my->registry.find_resource( type );
}

vector<share_type> controller::get_price_history( resource_type_id type )const {
   return my->registry.get_price_history( type );
}

const request_object& controller::get_request( request_id_type id )const {
   return my->allocations.get_request( id );
}

request_status controller::get_request_status( request_id_type id )const {
   return my->allocations.effective_status( id, my->head_block_num );
}

uint64_t controller::get_pending_count()const {
   return my->allocations.pending_count( my->head_block_num );
}

share_type controller::get_balance( account_name owner, resource_type_id type )const {
   return my->balances.get_balance( owner, type );
}

share_type controller::get_total_balance( account_name owner )const {
   return my->balances.get_total_balance( owner );
}

uint8_t controller::get_tier( account_name actor )const {
   return my->access.resolve_tier( actor );
}

bool controller::is_eligible( account_name actor )const {
   return my->access.is_eligible( actor );
}

} // resledger::ledger
