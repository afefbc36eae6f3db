#pragma once

#include <resledger/ledger/config.hpp>
#include <resledger/ledger/trace.hpp>
#include <resledger/ledger/request_object.hpp>
#include <resledger/ledger/resource_object.hpp>
#include <resledger/ledger/global_property_object.hpp>

#include <filesystem>
#include <functional>
#include <memory>

namespace resledger::ledger {

   class apply_context;
   class control_plane;
   class access_resolver;
   class resource_registry;
   class balance_ledger;
   class allocation_engine;
   struct controller_impl;

   using apply_handler = std::function<void(apply_context&)>;

   /**
    *  Owns the state database and the ledger components and applies actions to them one at a
    *  time. Every action runs in its own undo session; when the handler throws, the session is
    *  undone and the exception is rethrown to the caller.
    *
    *  The logical clock is the head block number, advanced by produce_block().
    */
   class controller {
      public:
         struct config {
            account_name     admin                      = ledger::config::system_account_name;
            block_num_type   request_expiration_window  = ledger::config::default_request_expiration_window;
            share_type       default_max_amount         = ledger::config::default_max_amount;
            account_name     default_emergency_contact;
            block_num_type   genesis_block_num          = 1;

            std::filesystem::path           state_dir   = "state";
            uint64_t                        state_size  = ledger::config::default_state_size;
            pinnable_mapped_file::map_mode  db_map_mode = pinnable_mapped_file::map_mode::mapped;
         };

         explicit controller( const config& cfg );
         ~controller();

         action_trace push_action( const action& act );

         void           produce_block();
         void           produce_blocks( uint32_t n );
         block_num_type head_block_num()const;

         const config&  get_config()const;

         const database&           db()const;
         database&                 mutable_db();

         const control_plane&      get_control_plane()const;
         control_plane&            get_mutable_control_plane();
         const access_resolver&    get_access_resolver()const;
         access_resolver&          get_mutable_access_resolver();
         const resource_registry&  get_resource_registry()const;
         resource_registry&        get_mutable_resource_registry();
         const balance_ledger&     get_balance_ledger()const;
         balance_ledger&           get_mutable_balance_ledger();
         const allocation_engine&  get_allocation_engine()const;
         allocation_engine&        get_mutable_allocation_engine();

         const apply_handler* find_apply_handler( action_name act )const;

         const global_property_object&  get_global_properties()const;
         const resource_object&         get_resource( resource_type_id type )const;
         const resource_object*         find_resource( resource_type_id type )const;
         vector<share_type>             get_price_history( resource_type_id type )const;
         const request_object&          get_request( request_id_type id )const;
         /// status of the request at the head block, a lapsed pending request reads as expired
         request_status                 get_request_status( request_id_type id )const;
         uint64_t                       get_pending_count()const;
         share_type                     get_balance( account_name owner, resource_type_id type )const;
         share_type                     get_total_balance( account_name owner )const;
         uint8_t                        get_tier( account_name actor )const;
         bool                           is_eligible( account_name actor )const;

      private:
         std::unique_ptr<controller_impl> my;
   };

} // resledger::ledger
