#pragma once
#include <hydra/chain/types.hpp>
#include <hydra/chain/address.hpp>

namespace hydra { namespace chain {

   struct registry_initialized_event
   {
      public_key_type authority;
      int64_t         timestamp = 0;
   };

   struct agent_registered_event
   {
      address         agent;
      public_key_type wallet;
      /** always the null address */
      address         parent;
      string          name;
      string          specialization;
      uint8_t         depth = 0;
      int64_t         timestamp = 0;
   };

   struct agent_spawned_event
   {
      address         parent;
      address         child;
      public_key_type child_wallet;
      string          name;
      string          specialization;
      uint8_t         depth = 0;
      uint16_t        revenue_share_bps = 0;
      int64_t         timestamp = 0;
   };

   struct earning_recorded_event
   {
      address         agent;
      share_type      amount;
      share_type      total_earned;
      int64_t         timestamp = 0;
   };

   struct revenue_distributed_event
   {
      address         child;
      address         parent;
      share_type      amount;
      share_type      total_distributed;
      int64_t         timestamp = 0;
   };

   struct agent_deactivated_event
   {
      address         agent;
      public_key_type wallet;
      int64_t         timestamp = 0;
   };

   /** notifications emitted by successful operations, in the order they were applied */
   typedef fc::static_variant<
            registry_initialized_event,
            agent_registered_event,
            agent_spawned_event,
            earning_recorded_event,
            revenue_distributed_event,
            agent_deactivated_event
         > agent_event;

} } // hydra::chain

FC_REFLECT( hydra::chain::registry_initialized_event, (authority)(timestamp) )
FC_REFLECT( hydra::chain::agent_registered_event, (agent)(wallet)(parent)(name)(specialization)(depth)(timestamp) )
FC_REFLECT( hydra::chain::agent_spawned_event, (parent)(child)(child_wallet)(name)(specialization)(depth)(revenue_share_bps)(timestamp) )
FC_REFLECT( hydra::chain::earning_recorded_event, (agent)(amount)(total_earned)(timestamp) )
FC_REFLECT( hydra::chain::revenue_distributed_event, (child)(parent)(amount)(total_distributed)(timestamp) )
FC_REFLECT( hydra::chain::agent_deactivated_event, (agent)(wallet)(timestamp) )
