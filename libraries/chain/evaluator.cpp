#include <hydra/chain/database.hpp>
#include <hydra/chain/evaluator.hpp>
#include <hydra/chain/exceptions.hpp>
#include <hydra/chain/registry_object.hpp>
#include <hydra/chain/transaction_evaluation_state.hpp>

namespace hydra { namespace chain {
   database& generic_evaluator::db()const { return trx_state->db(); }

   operation_result generic_evaluator::start_evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply )
   {
      trx_state   = &eval_state;
      check_required_authorities(op);
      auto result = evaluate( op );

      if( apply ) result = this->apply( op );
      return result;
   }

   void generic_evaluator::check_required_authorities( const operation& op )
   {
      flat_set<public_key_type> auths;
      op.visit( operation_get_required_auths( auths ) );
      for( const auto& key : auths )
         HYDRA_ASSERT( trx_state->check_authority( key ), missing_signature_exception,
                       "Missing signature of ${key}", ("key",key) );
   }

   void generic_evaluator::verify_registry_authority( const registry_object& registry, const public_key_type& key )const
   {
      HYDRA_ASSERT( registry.authority == key, unauthorized_authority_exception,
                    "${key} is not the registry authority", ("key",key)("authority",registry.authority) );
   }

   void generic_evaluator::emit( const agent_event& e )
   {
      db().push_event( e );
   }

} } // hydra::chain
