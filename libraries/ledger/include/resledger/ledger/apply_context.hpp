#pragma once

#include <resledger/ledger/action.hpp>

namespace resledger::ledger {

class controller;

class apply_context {
   public:
      apply_context( controller& con, const action& a );

      const action& get_action()const { return *act; }

      /**
       * @brief Require @ref account to have signed the current action
       * @throws missing_auth_exception If no signer is @ref account
       */
      void require_authorization( const account_name& account )const;
      bool has_authorization( const account_name& account )const;

      /// block number the action executes in
      block_num_type head_block_num()const;

      void set_action_return_value( uint64_t v ) { action_return_value = v; }

   public:
      controller&               control;
      std::optional<uint64_t>   action_return_value;

   private:
      const action*             act = nullptr;
};

} // resledger::ledger
