#pragma once
#include <resledger/ledger/types.hpp>

#include "multi_index_includes.hpp"

namespace resledger::ledger {

   enum class request_status : uint8_t {
      pending  = 0,
      approved = 1,
      rejected = 2,
      expired  = 3
   };

   const char* to_string( request_status s );

   class request_object : public chainbase::object<request_object_type, request_object> {
      OBJECT_CTOR(request_object, (purpose))

         id_type            id;
         request_id_type    request_id = 0;
         account_name       requester;
         resource_type_id   resource_type = 0;
         share_type         amount = 0;
         request_status     status = request_status::pending;
         uint8_t            priority = 1;         ///< requester tier when submitted
         block_num_type     submitted_at = 0;
         block_num_type     expires_at = 0;
         shared_string      purpose;

         /// a pending request lapses once the clock passes expires_at
         bool is_expired( block_num_type now )const {
            return status == request_status::pending && now > expires_at;
         }

         request_status effective_status( block_num_type now )const {
            return is_expired( now ) ? request_status::expired : status;
         }
   };

   struct by_request_id;
   struct by_status;
   using request_index = chainbase::shared_multi_index_container<
      request_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<request_object, request_object::id_type, &request_object::id>>,
         ordered_unique<tag<by_request_id>, member<request_object, request_id_type, &request_object::request_id>>,
         ordered_unique<tag<by_status>,
            composite_key< request_object,
               member<request_object, request_status, &request_object::status>,
               member<request_object, block_num_type, &request_object::expires_at>,
               member<request_object, request_id_type, &request_object::request_id>
            >
         >
      >
   >;

} // resledger::ledger

CHAINBASE_SET_INDEX_TYPE(resledger::ledger::request_object, resledger::ledger::request_index)

template<>
struct fmt::formatter<resledger::ledger::request_status> : fmt::formatter<std::string_view> {
   template<typename FormatContext>
   auto format( resledger::ledger::request_status s, FormatContext& ctx ) const -> decltype(ctx.out()) {
      return fmt::formatter<std::string_view>::format( resledger::ledger::to_string( s ), ctx );
   }
};
