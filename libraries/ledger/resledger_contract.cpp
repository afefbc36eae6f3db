#include <resledger/ledger/resledger_contract.hpp>

#include <resledger/ledger/controller.hpp>
#include <resledger/ledger/apply_context.hpp>
#include <resledger/ledger/exceptions.hpp>
#include <resledger/ledger/ledger_log.hpp>

#include <resledger/ledger/access_resolver.hpp>
#include <resledger/ledger/allocation_engine.hpp>
#include <resledger/ledger/balance_ledger.hpp>
#include <resledger/ledger/control_plane.hpp>
#include <resledger/ledger/resource_registry.hpp>

namespace resledger::ledger {

/**
 *  Administrative actions do not name their actor in the payload, the first signer is checked
 *  against the ledger administrator by the component.
 */
static account_name signer_of( const apply_context& context ) {
   return context.get_action().first_authorizer();
}

void apply_resledger_init(apply_context& context) {
   auto act = context.get_action().data_as<init>();
   try {
      context.control.get_mutable_control_plane().initialize( signer_of(context), act.max_amount, act.emergency_contact );
   } RESLEDGER_CAPTURE_AND_RETHROW( "init by {}", signer_of(context) )
}

void apply_resledger_setparams(apply_context& context) {
   auto act = context.get_action().data_as<setparams>();
   try {
      context.control.get_mutable_control_plane().update_parameters( signer_of(context), act.max_amount, act.emergency_contact );
   } RESLEDGER_CAPTURE_AND_RETHROW( "setparams max_amount {}", act.max_amount )
}

void apply_resledger_setmaint(apply_context& context) {
   context.get_action().data_as<setmaint>();
   try {
      context.control.get_mutable_control_plane().enter_maintenance( signer_of(context) );
   } RESLEDGER_CAPTURE_AND_RETHROW( "setmaint by {}", signer_of(context) )
}

void apply_resledger_clrmaint(apply_context& context) {
   context.get_action().data_as<clrmaint>();
   try {
      context.control.get_mutable_control_plane().exit_maintenance( signer_of(context) );
   } RESLEDGER_CAPTURE_AND_RETHROW( "clrmaint by {}", signer_of(context) )
}

void apply_resledger_setpaused(apply_context& context) {
   auto act = context.get_action().data_as<setpaused>();
   try {
      context.control.get_mutable_control_plane().set_paused( signer_of(context), act.paused );
   } RESLEDGER_CAPTURE_AND_RETHROW( "setpaused {}", act.paused )
}

void apply_resledger_setrole(apply_context& context) {
   auto act = context.get_action().data_as<setrole>();
   try {
      context.control.get_mutable_access_resolver().set_role( signer_of(context), act.account, act.role );
   } RESLEDGER_CAPTURE_AND_RETHROW( "setrole {} {}", act.account, act.role )
}

void apply_resledger_setblacklist(apply_context& context) {
   auto act = context.get_action().data_as<setblacklist>();
   try {
      context.control.get_mutable_access_resolver().set_blacklisted( signer_of(context), act.account, act.blacklisted );
   } RESLEDGER_CAPTURE_AND_RETHROW( "setblacklist {} {}", act.account, act.blacklisted )
}

void apply_resledger_regresource(apply_context& context) {
   auto act = context.get_action().data_as<regresource>();
   try {
      resource_params params;
      params.resource_type  = act.resource_type;
      params.name           = std::move(act.name);
      params.total_supply   = act.total_supply;
      params.unit_price     = act.unit_price;
      params.min_allocation = act.min_allocation;
      params.max_allocation = act.max_allocation;
      params.priority_floor = act.priority_floor;

      context.control.get_mutable_resource_registry().register_resource( signer_of(context), params, context.head_block_num() );
   } RESLEDGER_CAPTURE_AND_RETHROW( "regresource {}", act.resource_type )
}

void apply_resledger_updateprice(apply_context& context) {
   auto act = context.get_action().data_as<updateprice>();
   try {
      context.control.get_mutable_resource_registry().update_price( signer_of(context), act.resource_type, act.new_price,
                                                                     context.head_block_num() );
   } RESLEDGER_CAPTURE_AND_RETHROW( "updateprice {} to {}", act.resource_type, act.new_price )
}

void apply_resledger_lockres(apply_context& context) {
   auto act = context.get_action().data_as<lockres>();
   try {
      context.control.get_mutable_resource_registry().set_locked( signer_of(context), act.resource_type, true );
   } RESLEDGER_CAPTURE_AND_RETHROW( "lockres {}", act.resource_type )
}

void apply_resledger_unlockres(apply_context& context) {
   auto act = context.get_action().data_as<unlockres>();
   try {
      context.control.get_mutable_resource_registry().set_locked( signer_of(context), act.resource_type, false );
   } RESLEDGER_CAPTURE_AND_RETHROW( "unlockres {}", act.resource_type )
}

void apply_resledger_submitreq(apply_context& context) {
   auto act = context.get_action().data_as<submitreq>();
   try {
      context.require_authorization( act.requester );

      const auto id = context.control.get_mutable_allocation_engine().submit( act.requester, act.resource_type, act.amount,
                                                                               act.purpose, context.head_block_num() );
      context.set_action_return_value( id );
   } RESLEDGER_CAPTURE_AND_RETHROW( "submitreq by {} for {} of resource type {}", act.requester, act.amount, act.resource_type )
}

void apply_resledger_approvereq(apply_context& context) {
   auto act = context.get_action().data_as<approvereq>();
   try {
      context.control.get_mutable_allocation_engine().approve( signer_of(context), act.request_id, context.head_block_num() );
   } RESLEDGER_CAPTURE_AND_RETHROW( "approvereq {}", act.request_id )
}

void apply_resledger_rejectreq(apply_context& context) {
   auto act = context.get_action().data_as<rejectreq>();
   try {
      context.control.get_mutable_allocation_engine().reject( signer_of(context), act.request_id, context.head_block_num() );
   } RESLEDGER_CAPTURE_AND_RETHROW( "rejectreq {}", act.request_id )
}

void apply_resledger_expirereq(apply_context& context) {
   auto act = context.get_action().data_as<expirereq>();
   try {
      context.control.get_mutable_allocation_engine().expire( act.request_id, context.head_block_num() );
   } RESLEDGER_CAPTURE_AND_RETHROW( "expirereq {}", act.request_id )
}

void apply_resledger_transfer(apply_context& context) {
   auto act = context.get_action().data_as<transfer>();
   try {
      context.require_authorization( act.from );

      context.control.get_mutable_balance_ledger().transfer( act.from, act.to, act.resource_type, act.amount );
   } RESLEDGER_CAPTURE_AND_RETHROW( "transfer {} of resource type {} from {} to {}", act.amount, act.resource_type, act.from, act.to )
}

void apply_resledger_returnalloc(apply_context& context) {
   auto act = context.get_action().data_as<returnalloc>();
   try {
      context.require_authorization( act.owner );

      context.control.get_mutable_balance_ledger().return_allocated( act.owner, act.resource_type, act.amount );
   } RESLEDGER_CAPTURE_AND_RETHROW( "returnalloc {} of resource type {} by {}", act.amount, act.resource_type, act.owner )
}

} // namespace resledger::ledger
