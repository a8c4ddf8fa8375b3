#pragma once
#include <hydra/chain/evaluator.hpp>
#include <hydra/chain/transaction.hpp>
#include <hydra/chain/transaction_evaluation_state.hpp>
#include <hydra/chain/global_property_object.hpp>
#include <hydra/chain/registry_object.hpp>
#include <hydra/chain/agent_object.hpp>
#include <hydra/chain/wallet_balance_object.hpp>
#include <hydra/chain/event_history_object.hpp>
#include <hydra/chain/value_transfer.hpp>

#include <hydra/db/object_database.hpp>
#include <hydra/db/simple_index.hpp>
#include <fc/signals.hpp>

#include <fc/log/logger.hpp>

namespace hydra { namespace chain {
   using hydra::db::object_database;
   using hydra::db::abstract_object;
   using hydra::db::object;

   /** native value credited to wallets when a new ledger is created */
   typedef vector<std::pair<public_key_type, share_type>> genesis_allocation;

   /**
    *   @class database
    *   @brief tracks the registry, the agent hierarchy and wallet balances
    */
   class database : public object_database
   {
      public:
         database();
         ~database();

         enum validation_steps
         {
            skip_nothing                = 0x00,
            skip_transaction_signatures = 0x01  ///< used by trusted local callers and tests
         };

         /**
          * Loads the snapshot in data_dir, or creates a new ledger holding
          * initial_allocation if there is none.
          */
         void open( const fc::path& data_dir, const genesis_allocation& initial_allocation = genesis_allocation() );

         /**
          * @brief wipe Delete database from disk
          *
          * The in-memory state is reset and must be opened again before use.
          */
         void wipe( const fc::path& data_dir );
         void close();

         /**
          *  Applies every operation of trx; either all of them take effect or, if
          *  any throws, none of them do and the exception propagates.  The events
          *  emitted by the transaction are passed to applied_event after it commits.
          */
         processed_transaction push_transaction( const signed_transaction& trx, uint32_t skip = skip_nothing );

         /** evaluates trx against the current state and discards all of its effects */
         processed_transaction validate_transaction( const signed_transaction& trx, uint32_t skip = skip_nothing );

         const dynamic_global_property_object&  get_dynamic_global_properties()const;
         time_point_sec                         head_time()const;

         const registry_object&  get_registry()const;
         const registry_object*  find_registry()const;

         const agent_object&     get_agent( const public_key_type& wallet )const;
         const agent_object*     find_agent( const public_key_type& wallet )const;
         const agent_object&     get_agent_by_address( const address& agent_address )const;
         const agent_object*     find_agent_by_address( const address& agent_address )const;
         /** @return the agent whose parent is the null address, if one is registered */
         const agent_object*     find_root_agent()const;
         vector<const agent_object*> get_children( const address& parent )const;

         /// native value held by wallets
         /// @{
         share_type get_balance( const public_key_type& owner )const;
         void       deposit( const public_key_type& owner, share_type amount );
         /** @throws insufficient_balance_exception if owner holds less than amount */
         void       withdraw( const public_key_type& owner, share_type amount );
         /// @}

         value_transfer& get_value_transfer()const;
         /** replaces the mechanism used by revenue_distribute_operation to move value */
         void            set_value_transfer( const shared_ptr<value_transfer>& t );

         void initialize_evaluators();
         /// Reset the object graph in-memory
         void initialize_indexes();
         void init_genesis(const genesis_allocation& initial_allocation = genesis_allocation());

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

         /**
          *  Stores an event for the operation currently being applied.  It is
          *  undone together with the rest of the transaction on failure.
          */
         const event_history_object& push_event( const agent_event& e );

         /**
          *  This signal is emitted once for each event of a transaction after
          *  the transaction has been committed, in the order they were emitted.
          */
         fc::signal<void(const event_history_object&)> applied_event;

      private:
         processed_transaction apply_transaction( const signed_transaction& trx, uint32_t skip = skip_nothing );
         operation_result      apply_operation( transaction_evaluation_state& eval_state, const operation& op );
         void                  notify_applied_events();

         vector< unique_ptr<op_evaluator> >     _operation_evaluators;
         shared_ptr<value_transfer>             _value_transfer;

         vector<event_history_id_type>          _pending_events;
         uint64_t                               _current_trx_in_history = 0;
         uint16_t                               _current_op_in_trx = 0;
   };

} }
