#pragma once
#include <hydra/chain/types.hpp>
#include <hydra/chain/database.hpp>

namespace hydra { namespace app {
   using namespace hydra::chain;

   /**
    *  Read only queries over the ledger.  Lookups of a single record return
    *  an empty optional when it does not exist; the agent based listings throw
    *  agent_not_found_exception when the wallet does not own an agent.
    */
   class database_api
   {
      public:
         database_api( hydra::chain::database& db );
         ~database_api();

         fc::variants                      get_objects( const vector<object_id_type>& ids )const;
         dynamic_global_property_object    get_dynamic_global_properties()const;

         optional<registry_object>         get_registry()const;
         optional<agent_object>            get_agent( const public_key_type& wallet )const;
         optional<agent_object>            get_agent_by_address( const address& agent_address )const;

         /** @return the direct children of the agent owned by wallet, in creation order */
         vector<agent_object>              get_children( const public_key_type& wallet )const;
         /** @return the parent of the agent owned by wallet, its parent and so on up to the root */
         vector<agent_object>              get_ancestors( const public_key_type& wallet )const;

         /** @return up to limit agents in creation order starting at start */
         vector<agent_object>              list_agents( agent_id_type start, uint32_t limit )const;
         uint64_t                          get_agent_count()const;

         share_type                        get_balance( const public_key_type& wallet )const;

         /** @return up to limit events in the order they were emitted starting at start */
         vector<event_history_object>      get_events( event_history_id_type start, uint32_t limit )const;

      private:
         hydra::chain::database&           _db;
   };

} }
