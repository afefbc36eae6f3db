#include <resledger/ledger/balance_ledger.hpp>
#include <resledger/ledger/access_resolver.hpp>
#include <resledger/ledger/control_plane.hpp>
#include <resledger/ledger/resource_registry.hpp>
#include <resledger/ledger/ledger_log.hpp>
#include <resledger/ledger/exceptions.hpp>

#include <boost/tuple/tuple.hpp>

#include <limits>

namespace resledger::ledger {

   balance_ledger::balance_ledger( database& db, const control_plane& control, const access_resolver& access,
                                   resource_registry& registry )
   :_db(db),_control(control),_access(access),_registry(registry)
   {}

   void balance_ledger::add_indices() {
      _db.add_index<balance_index>();
   }

   share_type balance_ledger::get_balance( account_name owner, resource_type_id type )const {
      const auto* b = _db.find<balance_object, by_owner_resource>( boost::make_tuple( owner, type ) );
      return b ? b->amount : 0;
   }

   share_type balance_ledger::get_total_balance( account_name owner )const {
      const auto& idx = _db.get_index<balance_index, by_owner_resource>();
      share_type total = 0;
      for( auto itr = idx.lower_bound( boost::make_tuple( owner ) ); itr != idx.end() && itr->owner == owner; ++itr ) {
         RESLEDGER_ASSERT( itr->amount <= std::numeric_limits<share_type>::max() - total, invalid_resource_amount_exception,
                           "total balance of {} does not fit in {} bits", owner, std::numeric_limits<share_type>::digits );
         total += itr->amount;
      }
      return total;
   }

   share_type balance_ledger::get_outstanding( resource_type_id type )const {
      const auto& idx = _db.get_index<balance_index, by_resource_owner>();
      share_type total = 0;
      for( auto itr = idx.lower_bound( boost::make_tuple( type ) ); itr != idx.end() && itr->resource_type == type; ++itr ) {
         total += itr->amount;
      }
      return total;
   }

   void balance_ledger::credit( account_name owner, resource_type_id type, share_type amount ) {
      const auto* b = _db.find<balance_object, by_owner_resource>( boost::make_tuple( owner, type ) );
      if( b ) {
         _db.modify( *b, [&]( auto& bo ) {
            bo.amount += amount;
         });
      } else {
         _db.create<balance_object>( [&]( auto& bo ) {
            bo.owner         = owner;
            bo.resource_type = type;
            bo.amount        = amount;
         });
      }
   }

   void balance_ledger::debit( account_name owner, resource_type_id type, share_type amount ) {
      const auto* b = _db.find<balance_object, by_owner_resource>( boost::make_tuple( owner, type ) );
      const share_type held = b ? b->amount : 0;
      RESLEDGER_ASSERT( amount <= held, insufficient_resource_balance_exception,
                        "{} holds {} units of resource type {}, {} needed", owner, held, type, amount );
      if( amount == 0 ) return;
      _db.modify( *b, [&]( auto& bo ) {
         bo.amount -= amount;
      });
   }

   void balance_ledger::transfer( account_name from, account_name to, resource_type_id type, share_type amount ) {
      _control.require_not_paused();
      RESLEDGER_ASSERT( _access.is_eligible( from ), unauthorized_access_exception, "{} is not eligible to transfer", from );
      RESLEDGER_ASSERT( from != to, invalid_transfer_destination_exception, "cannot transfer to self" );
      RESLEDGER_ASSERT( !to.empty() && _access.is_eligible( to ), invalid_transfer_destination_exception,
                        "{} is not eligible to receive resources", to );

      const auto& res = _registry.get_resource( type );
      RESLEDGER_ASSERT( !res.locked, resource_locked_exception, "resource type {} is locked", type );
      _control.require_within_cap( amount, "transfer amount" );

      debit( from, type, amount );
      credit( to, type, amount );
      rl_dlog( ledger_log, "{} transferred {} units of resource type {} to {}", from, amount, type, to );
   }

   void balance_ledger::return_allocated( account_name owner, resource_type_id type, share_type amount ) {
      _registry.get_resource( type );
      RESLEDGER_ASSERT( amount > 0, invalid_resource_amount_exception, "return amount must be positive" );

      debit( owner, type, amount );
      _registry.credit_available( type, amount );
      rl_dlog( ledger_log, "{} returned {} units of resource type {}", owner, amount, type );
   }

} // resledger::ledger
