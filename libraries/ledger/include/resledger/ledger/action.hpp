#pragma once

#include <resledger/ledger/contract_types.hpp>
#include <resledger/ledger/exceptions.hpp>

#include <variant>

namespace resledger::ledger {

   using action_payload = std::variant<init, setparams, setmaint, clrmaint, setpaused, setrole, setblacklist,
                                       regresource, updateprice, lockres, unlockres,
                                       submitreq, approvereq, rejectreq, expirereq,
                                       transfer, returnalloc>;

   /**
    *  An action is performed by an actor, aka an account. The accounts in authorization are the
    *  actors that signed it; the handler of the action decides which of them it requires.
    */
   struct action {
      account_name            account;
      action_name             name;
      vector<account_name>    authorization;
      action_payload          data;

      action(){}

      template<typename T>
      action( vector<account_name> auth, const T& value )
      :account(config::system_account_name)
      ,name(T::get_name())
      ,authorization(std::move(auth))
      ,data(value)
      {}

      template<typename T>
      T data_as()const {
         RESLEDGER_ASSERT( account == config::system_account_name, action_validate_exception,
                           "action account {} is not {}", account, config::system_account_name );
         RESLEDGER_ASSERT( name == T::get_name(), action_validate_exception,
                           "action name {} does not match payload {}", name, T::get_name() );
         const T* value = std::get_if<T>( &data );
         RESLEDGER_ASSERT( value != nullptr, action_validate_exception, "payload of action {} has the wrong type", name );
         return *value;
      }

      account_name first_authorizer()const {
         for( const auto& a : authorization )
            return a;
         return {};
      }
   };

} // resledger::ledger
