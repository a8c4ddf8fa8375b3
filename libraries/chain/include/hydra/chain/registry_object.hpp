#pragma once
#include <hydra/chain/types.hpp>
#include <hydra/chain/address.hpp>
#include <hydra/db/object.hpp>

namespace hydra { namespace chain {
   using hydra::db::abstract_object;

   /**
    *  @brief the singleton root of the ledger
    *
    *  Holds the key allowed to register the root agent and deactivate agents,
    *  along with running totals over every agent.  Always has instance 0.
    */
   class registry_object : public abstract_object<registry_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = registry_object_type;

         public_key_type  authority;
         address          registry_address;

         /** root plus every spawned agent; deactivation does not decrement */
         share_type       total_agents;
         /** sum of every amount ever passed to earning_record_operation */
         share_type       total_earnings;
         share_type       total_spawns;
   };

}}

FC_REFLECT_DERIVED( hydra::chain::registry_object, (hydra::db::object),
                    (authority)
                    (registry_address)
                    (total_agents)
                    (total_earnings)
                    (total_spawns) )
