#pragma once
#include <resledger/ledger/types.hpp>
#include <resledger/ledger/request_object.hpp>

namespace resledger::ledger {

   class control_plane;
   class access_resolver;
   class resource_registry;
   class balance_ledger;

   /**
    *  Owns the allocation request lifecycle:
    *
    *  @code
    *     submit -> pending -> approved | rejected | expired
    *  @endcode
    *
    *  Submission only validates against the pool; units move from the pool to the requester's
    *  balance on approval. A pending request whose expiration block has passed reads as expired
    *  before anyone calls expire().
    */
   class allocation_engine {
      public:
         allocation_engine( database& db, control_plane& control, const access_resolver& access,
                            resource_registry& registry, balance_ledger& balances,
                            block_num_type expiration_window );

         void add_indices();

         request_id_type submit( account_name requester, resource_type_id type, share_type amount,
                                 const string& purpose, block_num_type now );
         void approve( account_name actor, request_id_type id, block_num_type now );
         void reject( account_name actor, request_id_type id, block_num_type now );
         void expire( request_id_type id, block_num_type now );

         const request_object* find_request( request_id_type id )const;
         const request_object& get_request( request_id_type id )const;
         request_status        effective_status( request_id_type id, block_num_type now )const;
         /// number of requests still pending at block now, lapsed ones excluded
         uint64_t              pending_count( block_num_type now )const;

         block_num_type expiration_window()const { return _expiration_window; }

      private:
         const request_object& get_pending( request_id_type id, block_num_type now )const;

         database&                _db;
         control_plane&           _control;
         const access_resolver&   _access;
         resource_registry&       _registry;
         balance_ledger&          _balances;
         block_num_type           _expiration_window;
   };

} // resledger::ledger
