#pragma once
#include <hydra/chain/types.hpp>
#include <hydra/db/object.hpp>

namespace hydra { namespace chain {
   using hydra::db::abstract_object;

   /**
    * @class dynamic_global_property_object
    * @brief Maintains global state information
    *
    * This is an implementation detail. The values here are updated every time a
    * transaction is applied.
    */
   class dynamic_global_property_object : public abstract_object<dynamic_global_property_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_dynamic_global_property_object_type;

         /** time of the most recently applied transaction */
         time_point_sec    time;
         /** number of transactions applied since genesis */
         uint64_t          transaction_count = 0;
   };
}}

FC_REFLECT_DERIVED( hydra::chain::dynamic_global_property_object, (hydra::db::object),
                    (time)
                    (transaction_count) )
