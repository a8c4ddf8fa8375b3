#include <hydra/chain/revenue_evaluator.hpp>
#include <hydra/chain/database.hpp>
#include <hydra/chain/exceptions.hpp>

namespace hydra { namespace chain {

object_id_type revenue_distribute_evaluator::do_evaluate( const revenue_distribute_operation& op )
{ try {
   database& d = db();
   child = &d.get_agent( op.child_wallet );

   HYDRA_ASSERT( child->is_active, agent_inactive_exception,
                 "Agent ${a} is not active", ("a",child->agent_address) );
   HYDRA_ASSERT( !child->is_root(), no_parent_agent_exception,
                 "Agent ${a} is a root agent and has no parent", ("a",child->agent_address) );

   parent = &d.get_agent( op.parent_wallet );
   HYDRA_ASSERT( parent->agent_address == child->parent, parent_mismatch_exception,
                 "Wallet ${w} does not own the parent of ${a}",
                 ("w",op.parent_wallet)("a",child->agent_address)("parent",child->parent) );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type revenue_distribute_evaluator::do_apply( const revenue_distribute_operation& op )
{ try {
   database& d = db();
   auto total_distributed = child->total_distributed_to_parent + op.amount;

   // value moves before the ledger records it
   d.get_value_transfer().transfer( d, op.child_wallet, op.parent_wallet, op.amount );

   d.modify( *child, [&]( agent_object& a ) {
      a.total_distributed_to_parent = total_distributed;
   });

   revenue_distributed_event e;
   e.child             = child->agent_address;
   e.parent            = parent->agent_address;
   e.amount            = op.amount;
   e.total_distributed = total_distributed;
   e.timestamp         = d.head_time().sec_since_epoch();
   emit( e );

   return total_distributed;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // hydra::chain
