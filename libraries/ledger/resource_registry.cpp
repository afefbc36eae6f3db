#include <resledger/ledger/resource_registry.hpp>
#include <resledger/ledger/config.hpp>
#include <resledger/ledger/control_plane.hpp>
#include <resledger/ledger/ledger_log.hpp>
#include <resledger/ledger/exceptions.hpp>

#include <boost/tuple/tuple.hpp>

namespace resledger::ledger {

   resource_registry::resource_registry( database& db, const control_plane& control )
   :_db(db),_control(control)
   {}

   void resource_registry::add_indices() {
      _db.add_index<resource_index>();
      _db.add_index<price_history_index>();
   }

   const resource_object* resource_registry::find_resource( resource_type_id type )const {
      return _db.find<resource_object, by_resource_type>( type );
   }

   const resource_object& resource_registry::get_resource( resource_type_id type )const {
      const auto* r = find_resource( type );
      RESLEDGER_ASSERT( r != nullptr, resource_type_not_found_exception, "resource type {} does not exist", type );
      return *r;
   }

   vector<share_type> resource_registry::get_price_history( resource_type_id type )const {
      get_resource( type );
      const auto& idx = _db.get_index<price_history_index, by_resource_sequence>();
      vector<share_type> prices;
      for( auto itr = idx.lower_bound( boost::make_tuple( type ) ); itr != idx.end() && itr->resource_type == type; ++itr ) {
         prices.push_back( itr->price );
      }
      return prices;
   }

   const resource_object& resource_registry::register_resource( account_name actor, const resource_params& params,
                                                                 block_num_type now ) {
      _control.require_admin( actor );

      RESLEDGER_ASSERT( !params.name.empty() && params.name.size() <= config::max_resource_name_size, invalid_text_exception,
                        "resource name must be 1 to {} bytes, got {}", config::max_resource_name_size, params.name.size() );
      _control.require_within_cap( params.total_supply, "total supply" );
      _control.require_within_cap( params.unit_price, "unit price" );
      RESLEDGER_ASSERT( params.priority_floor >= config::min_priority_tier && params.priority_floor <= config::max_priority_tier,
                        invalid_priority_level_exception, "priority floor {} is outside {}..{}",
                        params.priority_floor, config::min_priority_tier, config::max_priority_tier );
      RESLEDGER_ASSERT( params.min_allocation > 0, invalid_resource_amount_exception, "minimum allocation must be positive" );
      RESLEDGER_ASSERT( params.min_allocation <= params.max_allocation, invalid_resource_amount_exception,
                        "minimum allocation {} exceeds maximum allocation {}", params.min_allocation, params.max_allocation );

      auto assign = [&]( resource_object& r, share_type outstanding ) {
         r.name.assign( params.name.data(), params.name.size() );
         r.total_supply       = params.total_supply;
         r.available_quantity = params.total_supply - outstanding;
         r.unit_price         = params.unit_price;
         r.locked             = false;
         r.priority_floor     = params.priority_floor;
         r.min_allocation     = params.min_allocation;
         r.max_allocation     = params.max_allocation;
         r.last_price_update  = now;
      };

      if( const auto* existing = find_resource( params.resource_type ) ) {
         const share_type outstanding = existing->outstanding();
         RESLEDGER_ASSERT( params.total_supply >= outstanding, invalid_resource_amount_exception,
                           "total supply {} of resource type {} is below the {} units held in balances",
                           params.total_supply, params.resource_type, outstanding );
         _db.modify( *existing, [&]( auto& r ) {
            assign( r, outstanding );
         });
         rl_ilog( ledger_log, "resource type {} '{}' updated, supply {}, available {}",
                  params.resource_type, params.name, existing->total_supply, existing->available_quantity );
         return *existing;
      }

      const auto& res = _db.create<resource_object>( [&]( auto& r ) {
         r.resource_type = params.resource_type;
         r.created_at    = now;
         assign( r, 0 );
      });
      rl_ilog( ledger_log, "resource type {} '{}' registered, supply {}, price {}",
               params.resource_type, params.name, params.total_supply, params.unit_price );
      return res;
   }

   void resource_registry::update_price( account_name actor, resource_type_id type, share_type new_price, block_num_type now ) {
      _control.require_admin( actor );
      const auto& res = get_resource( type );
      _control.require_within_cap( new_price, "unit price" );

      const share_type old_price = res.unit_price;
      _db.modify( res, [&]( auto& r ) {
         r.unit_price        = new_price;
         r.last_price_update = now;
         ++r.price_updates;
      });
      _db.create<price_history_object>( [&]( auto& h ) {
         h.resource_type = type;
         h.sequence      = res.price_updates;
         h.price         = new_price;
      });

      // the index walks newest first, so everything past the capacity is the oldest
      const auto& idx = _db.get_index<price_history_index, by_resource_sequence>();
      auto itr = idx.lower_bound( boost::make_tuple( type ) );
      for( uint32_t kept = 0; itr != idx.end() && itr->resource_type == type && kept < config::price_history_capacity; ++kept )
         ++itr;
      while( itr != idx.end() && itr->resource_type == type ) {
         const auto& oldest = *itr;
         ++itr;
         _db.remove( oldest );
      }
      rl_dlog( ledger_log, "price of resource type {} changed from {} to {}", type, old_price, new_price );
   }

   void resource_registry::set_locked( account_name actor, resource_type_id type, bool locked ) {
      _control.require_admin( actor );
      const auto& res = get_resource( type );
      _db.modify( res, [&]( auto& r ) {
         r.locked = locked;
      });
      rl_ilog( ledger_log, "resource type {} {}", type, locked ? "locked" : "unlocked" );
   }

   void resource_registry::debit_available( resource_type_id type, share_type amount ) {
      const auto& res = get_resource( type );
      RESLEDGER_ASSERT( amount <= res.available_quantity, insufficient_resource_balance_exception,
                        "resource type {} has {} units available, {} requested", type, res.available_quantity, amount );
      _db.modify( res, [&]( auto& r ) {
         r.available_quantity -= amount;
      });
   }

   void resource_registry::credit_available( resource_type_id type, share_type amount ) {
      const auto& res = get_resource( type );
      RESLEDGER_ASSERT( amount <= res.outstanding(), invalid_resource_amount_exception,
                        "crediting {} units would raise resource type {} above its total supply {}",
                        amount, type, res.total_supply );
      _db.modify( res, [&]( auto& r ) {
         r.available_quantity += amount;
      });
   }

} // resledger::ledger
