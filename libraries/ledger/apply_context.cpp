#include <resledger/ledger/apply_context.hpp>
#include <resledger/ledger/controller.hpp>
#include <resledger/ledger/exceptions.hpp>

namespace resledger::ledger {

apply_context::apply_context( controller& con, const action& a )
:control(con)
,act(&a)
{}

void apply_context::require_authorization( const account_name& account )const {
   RESLEDGER_ASSERT( has_authorization( account ), missing_auth_exception, "missing authority of {}", account );
}

bool apply_context::has_authorization( const account_name& account )const {
   for( const auto& auth : act->authorization )
      if( auth == account )
         return true;
   return false;
}

block_num_type apply_context::head_block_num()const {
   return control.head_block_num();
}

} // resledger::ledger
