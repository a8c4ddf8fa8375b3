#pragma once
#include <hydra/chain/events.hpp>
#include <hydra/db/object.hpp>
#include <hydra/db/generic_index.hpp>

namespace hydra { namespace chain {
   using hydra::db::abstract_object;
   using hydra::db::generic_index;
   using hydra::db::by_id;

   /**
    *  Every event emitted by an applied operation is stored with the position
    *  of the operation that produced it.  Events are created inside the same
    *  undo session as the state change, so a failed transaction leaves no
    *  events behind.
    */
   class event_history_object : public abstract_object<event_history_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = event_history_object_type;

         agent_event    event;
         /** sequence number of the transaction in the ledger history */
         uint64_t       trx_in_history = 0;
         uint16_t       op_in_trx = 0;
         time_point_sec time;
   };

   typedef multi_index_container<
      event_history_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > event_history_multi_index_type;

   typedef generic_index<event_history_object, event_history_multi_index_type> event_history_index;

} } // hydra::chain

FC_REFLECT_DERIVED( hydra::chain::event_history_object, (hydra::db::object),
                    (event)(trx_in_history)(op_in_trx)(time) )
