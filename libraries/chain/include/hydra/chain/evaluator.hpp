#pragma once
#include <hydra/chain/operations.hpp>
#include <hydra/chain/events.hpp>

namespace hydra { namespace chain {

   class database;
   class transaction_evaluation_state;
   class registry_object;
   class agent_object;

   class generic_evaluator
   {
      public:
         virtual ~generic_evaluator(){}

         virtual int get_type()const = 0;
         virtual operation_result start_evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply  );

         /** @note derived classes should ASSUME that the default validation that is
          * indepenent of ledger state should be performed by op.validate() and should
          * not perform these extra checks.
          */
         virtual operation_result evaluate( const operation& op ) = 0;
         virtual operation_result apply( const operation& op ) = 0;

         database& db()const;

         void check_required_authorities(const operation& op);
   protected:
         /** throws unauthorized_authority_exception unless key is the registry authority */
         void verify_registry_authority( const registry_object& registry, const public_key_type& key )const;

         /** records an event for the operation being applied */
         void emit( const agent_event& e );

         transaction_evaluation_state*    trx_state = nullptr;
   };

   class op_evaluator
   {
      public:
         virtual ~op_evaluator(){}
         virtual operation_result evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply ) = 0;
   };

   template<typename T>
   class op_evaluator_impl : public op_evaluator
   {
      public:
         virtual operation_result evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply = true ) override
         {
             T eval;
             return eval.start_evaluate( eval_state, op, apply );
         }
   };

   template<typename DerivedEvaluator>
   class evaluator : public generic_evaluator
   {
      public:
         virtual int get_type()const { return operation::tag<typename DerivedEvaluator::operation_type>::value; }

         virtual operation_result evaluate( const operation& o ) final override
         {
            auto* eval = static_cast<DerivedEvaluator*>(this);
            const auto& op = o.get<typename DerivedEvaluator::operation_type>();
            return eval->do_evaluate( op );
         }
         virtual operation_result apply( const operation& o ) final override
         {
            auto* eval = static_cast<DerivedEvaluator*>(this);
            const auto& op = o.get<typename DerivedEvaluator::operation_type>();
            return eval->do_apply( op );
         }
   };
} }
