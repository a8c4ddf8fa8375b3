#pragma once
#include <hydra/chain/types.hpp>
#include <hydra/chain/address.hpp>
#include <hydra/db/object.hpp>
#include <hydra/db/generic_index.hpp>

namespace hydra { namespace chain {
   using hydra::db::abstract_object;
   using hydra::db::generic_index;
   using hydra::db::by_id;

   /**
    *  @brief a node in the agent hierarchy
    *
    *  Each wallet owns at most one agent.  Agents refer to their parent by
    *  address; a root agent has the null address as its parent.
    */
   class agent_object : public abstract_object<agent_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = agent_object_type;

         /** derived from wallet, see address::for_agent */
         address          agent_address;
         public_key_type  wallet;
         address          parent;
         string           name;
         string           specialization;

         share_type       total_earned;
         share_type       total_distributed_to_parent;
         share_type       children_count;

         /** 0 for the root, parent depth + 1 otherwise, never above HYDRA_MAX_DEPTH */
         uint8_t          depth = 0;
         uint16_t         revenue_share_bps = 0;
         /** once false, stays false */
         bool             is_active = true;
         /** unix seconds */
         int64_t          created_at = 0;

         bool             is_root()const { return parent.is_null(); }
   };

   struct by_wallet;
   struct by_address;
   struct by_parent;
   typedef multi_index_container<
      agent_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_wallet>, member< agent_object, public_key_type, &agent_object::wallet > >,
         ordered_unique< tag<by_address>, member< agent_object, address, &agent_object::agent_address > >,
         ordered_unique< tag<by_parent>,
            composite_key< agent_object,
               member< agent_object, address, &agent_object::parent >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > agent_multi_index_type;

   typedef generic_index<agent_object, agent_multi_index_type> agent_index;

}}

FC_REFLECT_DERIVED( hydra::chain::agent_object,
                    (hydra::db::object),
                    (agent_address)(wallet)(parent)(name)(specialization)
                    (total_earned)(total_distributed_to_parent)(children_count)
                    (depth)(revenue_share_bps)(is_active)(created_at) )
