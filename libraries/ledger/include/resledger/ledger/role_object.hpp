#pragma once
#include <resledger/ledger/types.hpp>

#include "multi_index_includes.hpp"

namespace resledger::ledger {

   enum class role_type : uint8_t {
      user     = 0,
      verified = 1,
      business = 2,
      premium  = 3,
      admin    = 4
   };

   /// priority tier of a role, user is 1 and admin is 5
   constexpr uint8_t role_tier( role_type r ) {
      switch( r ) {
         case role_type::admin:    return 5;
         case role_type::premium:  return 4;
         case role_type::business: return 3;
         case role_type::verified: return 2;
         case role_type::user:     return 1;
      }
      return 1;
   }

   const char* to_string( role_type r );

   /**
    * Role and blacklist flag of one actor. An actor without a row is a non-blacklisted user.
    */
   class role_object : public chainbase::object<role_object_type, role_object> {
      OBJECT_CTOR(role_object)

         id_type        id;
         account_name   account; //< account should not be changed within a modifier lambda
         role_type      role        = role_type::user;
         bool           blacklisted = false;
   };

   struct by_account;
   using role_index = chainbase::shared_multi_index_container<
      role_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<role_object, role_object::id_type, &role_object::id>>,
         ordered_unique<tag<by_account>, member<role_object, account_name, &role_object::account>>
      >
   >;

} // resledger::ledger

CHAINBASE_SET_INDEX_TYPE(resledger::ledger::role_object, resledger::ledger::role_index)

template<>
struct fmt::formatter<resledger::ledger::role_type> : fmt::formatter<std::string_view> {
   template<typename FormatContext>
   auto format( resledger::ledger::role_type r, FormatContext& ctx ) const -> decltype(ctx.out()) {
      return fmt::formatter<std::string_view>::format( resledger::ledger::to_string( r ), ctx );
   }
};
