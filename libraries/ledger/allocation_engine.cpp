#include <resledger/ledger/allocation_engine.hpp>
#include <resledger/ledger/access_resolver.hpp>
#include <resledger/ledger/balance_ledger.hpp>
#include <resledger/ledger/config.hpp>
#include <resledger/ledger/control_plane.hpp>
#include <resledger/ledger/resource_registry.hpp>
#include <resledger/ledger/ledger_log.hpp>
#include <resledger/ledger/exceptions.hpp>

#include <boost/tuple/tuple.hpp>

namespace resledger::ledger {

   const char* to_string( request_status s ) {
      switch( s ) {
         case request_status::pending:  return "pending";
         case request_status::approved: return "approved";
         case request_status::rejected: return "rejected";
         case request_status::expired:  return "expired";
      }
      return "pending";
   }

   allocation_engine::allocation_engine( database& db, control_plane& control, const access_resolver& access,
                                         resource_registry& registry, balance_ledger& balances,
                                         block_num_type expiration_window )
   :_db(db),_control(control),_access(access),_registry(registry),_balances(balances)
   ,_expiration_window(expiration_window)
   {
      RESLEDGER_ASSERT( expiration_window > 0, action_validate_exception, "request expiration window must be positive" );
   }

   void allocation_engine::add_indices() {
      _db.add_index<request_index>();
   }

   const request_object* allocation_engine::find_request( request_id_type id )const {
      return _db.find<request_object, by_request_id>( id );
   }

   const request_object& allocation_engine::get_request( request_id_type id )const {
      const auto* r = find_request( id );
      RESLEDGER_ASSERT( r != nullptr, request_not_found_exception, "allocation request {} does not exist", id );
      return *r;
   }

   request_status allocation_engine::effective_status( request_id_type id, block_num_type now )const {
      return get_request( id ).effective_status( now );
   }

   uint64_t allocation_engine::pending_count( block_num_type now )const {
      // lapsed requests still stored as pending sort before now
      const auto& idx = _db.get_index<request_index, by_status>();
      return std::distance( idx.lower_bound( boost::make_tuple( request_status::pending, now ) ),
                            idx.upper_bound( boost::make_tuple( request_status::pending ) ) );
   }

   request_id_type allocation_engine::submit( account_name requester, resource_type_id type, share_type amount,
                                              const string& purpose, block_num_type now ) {
      _control.require_active();
      RESLEDGER_ASSERT( _access.is_eligible( requester ), unauthorized_access_exception,
                        "{} is not eligible to request resources", requester );
      RESLEDGER_ASSERT( purpose.size() <= config::max_request_purpose_size, invalid_text_exception,
                        "request purpose is limited to {} bytes, got {}", config::max_request_purpose_size, purpose.size() );

      const auto& res = _registry.get_resource( type );
      RESLEDGER_ASSERT( !res.locked, resource_locked_exception, "resource type {} is locked", type );
      _control.require_within_cap( amount, "requested amount" );
      RESLEDGER_ASSERT( amount >= res.min_allocation, invalid_resource_amount_exception,
                        "requested amount {} is below the minimum allocation {}", amount, res.min_allocation );
      RESLEDGER_ASSERT( amount <= res.max_allocation, resource_limit_exceeded_exception,
                        "requested amount {} exceeds the maximum allocation {}", amount, res.max_allocation );
      RESLEDGER_ASSERT( amount <= res.available_quantity, insufficient_resource_balance_exception,
                        "requested amount {} exceeds the {} units available", amount, res.available_quantity );

      const uint8_t tier = _access.resolve_tier( requester );
      RESLEDGER_ASSERT( tier >= res.priority_floor, unauthorized_access_exception,
                        "tier {} of {} is below the priority floor {} of resource type {}",
                        tier, requester, res.priority_floor, type );

      const request_id_type id = _control.next_request_id();
      _db.create<request_object>( [&]( auto& r ) {
         r.request_id    = id;
         r.requester     = requester;
         r.resource_type = type;
         r.amount        = amount;
         r.status        = request_status::pending;
         r.priority      = tier;
         r.submitted_at  = now;
         r.expires_at    = now + _expiration_window;
         r.purpose.assign( purpose.data(), purpose.size() );
      });

      rl_dlog( ledger_log, "request {} by {} for {} units of resource type {}, expires at block {}",
               id, requester, amount, type, now + _expiration_window );
      return id;
   }

   const request_object& allocation_engine::get_pending( request_id_type id, block_num_type now )const {
      const auto& req = get_request( id );
      RESLEDGER_ASSERT( req.status == request_status::pending, unauthorized_access_exception,
                        "request {} is already {}", id, req.status );
      RESLEDGER_ASSERT( !req.is_expired( now ), expired_request_exception,
                        "request {} expired at block {}", id, req.expires_at );
      return req;
   }

   void allocation_engine::approve( account_name actor, request_id_type id, block_num_type now ) {
      _control.require_admin( actor );
      const auto& req = get_pending( id, now );

      const auto& res = _registry.get_resource( req.resource_type );
      RESLEDGER_ASSERT( req.amount <= res.available_quantity, insufficient_resource_balance_exception,
                        "request {} needs {} units, resource type {} has {} available",
                        id, req.amount, req.resource_type, res.available_quantity );

      _registry.debit_available( req.resource_type, req.amount );
      _balances.credit( req.requester, req.resource_type, req.amount );
      _db.modify( req, []( auto& r ) {
         r.status = request_status::approved;
      });

      rl_ilog( ledger_log, "request {} approved, {} units of resource type {} allocated to {}",
               id, req.amount, req.resource_type, req.requester );
   }

   void allocation_engine::reject( account_name actor, request_id_type id, block_num_type now ) {
      _control.require_admin( actor );
      const auto& req = get_pending( id, now );

      _db.modify( req, []( auto& r ) {
         r.status = request_status::rejected;
      });
      rl_ilog( ledger_log, "request {} rejected", id );
   }

   void allocation_engine::expire( request_id_type id, block_num_type now ) {
      const auto& req = get_request( id );
      RESLEDGER_ASSERT( req.status == request_status::pending, unauthorized_access_exception,
                        "request {} is already {}", id, req.status );
      RESLEDGER_ASSERT( req.is_expired( now ), unauthorized_access_exception,
                        "request {} does not expire before block {}", id, req.expires_at + 1 );

      _db.modify( req, []( auto& r ) {
         r.status = request_status::expired;
      });
      rl_dlog( ledger_log, "request {} expired", id );
   }

} // resledger::ledger
