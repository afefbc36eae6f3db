#pragma once

#include <resledger/ledger/types.hpp>
#include <resledger/ledger/contract_types.hpp>

namespace resledger::ledger {

   class apply_context;

   /**
    * @defgroup native_action_handlers Native Action Handlers
    */
   ///@{
   void apply_resledger_init(apply_context&);
   void apply_resledger_setparams(apply_context&);
   void apply_resledger_setmaint(apply_context&);
   void apply_resledger_clrmaint(apply_context&);
   void apply_resledger_setpaused(apply_context&);

   void apply_resledger_setrole(apply_context&);
   void apply_resledger_setblacklist(apply_context&);

   void apply_resledger_regresource(apply_context&);
   void apply_resledger_updateprice(apply_context&);
   void apply_resledger_lockres(apply_context&);
   void apply_resledger_unlockres(apply_context&);

   void apply_resledger_submitreq(apply_context&);
   void apply_resledger_approvereq(apply_context&);
   void apply_resledger_rejectreq(apply_context&);
   void apply_resledger_expirereq(apply_context&);

   void apply_resledger_transfer(apply_context&);
   void apply_resledger_returnalloc(apply_context&);
   ///@}  end action handlers

} /// namespace resledger::ledger
