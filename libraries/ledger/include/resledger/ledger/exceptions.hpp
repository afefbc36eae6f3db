#pragma once

#include <resledger/util/exception.hpp>

namespace resledger::ledger {

   RESLEDGER_DECLARE_EXCEPTION( ledger_exception,
                                3000000, "ledger exception" )

      /**
       *  Errors surfaced to the caller of a ledger operation. Each one aborts the whole
       *  operation, the state database rolls back to where the operation started.
       */
      RESLEDGER_DECLARE_DERIVED_EXCEPTION( allocation_exception, ledger_exception,
                                           3100000, "allocation exception" )

         RESLEDGER_DECLARE_DERIVED_EXCEPTION( unauthorized_access_exception, allocation_exception,
                                              3100001, "Unauthorized access" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( invalid_resource_amount_exception, allocation_exception,
                                              3100002, "Invalid resource amount" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( insufficient_resource_balance_exception, allocation_exception,
                                              3100003, "Insufficient resource balance" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( resource_type_not_found_exception, allocation_exception,
                                              3100004, "Resource type not found" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( already_initialized_exception, allocation_exception,
                                              3100005, "Ledger already initialized" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( invalid_transfer_destination_exception, allocation_exception,
                                              3100006, "Invalid transfer destination" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( resource_limit_exceeded_exception, allocation_exception,
                                              3100007, "Resource limit exceeded" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( invalid_priority_level_exception, allocation_exception,
                                              3100008, "Invalid priority level" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( resource_locked_exception, allocation_exception,
                                              3100009, "Resource type is locked" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( expired_request_exception, allocation_exception,
                                              3100010, "Allocation request expired" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( request_not_found_exception, allocation_exception,
                                              3100011, "Allocation request not found" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( invalid_text_exception, allocation_exception,
                                              3100012, "Invalid text field" )

      RESLEDGER_DECLARE_DERIVED_EXCEPTION( action_exception, ledger_exception,
                                           3200000, "action exception" )

         RESLEDGER_DECLARE_DERIVED_EXCEPTION( action_validate_exception, action_exception,
                                              3200001, "action exceptions" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( unknown_action_exception, action_exception,
                                              3200002, "No apply handler registered for action" )
         RESLEDGER_DECLARE_DERIVED_EXCEPTION( missing_auth_exception, action_exception,
                                              3200003, "Missing required authority" )

      RESLEDGER_DECLARE_DERIVED_EXCEPTION( database_exception, ledger_exception,
                                           3300000, "database exception" )

      RESLEDGER_DECLARE_DERIVED_EXCEPTION( name_type_exception, ledger_exception,
                                           3400000, "Invalid name" )

} // resledger::ledger
