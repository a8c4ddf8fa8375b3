#include <hydra/chain/agent_evaluator.hpp>
#include <hydra/chain/database.hpp>
#include <hydra/chain/exceptions.hpp>

namespace hydra { namespace chain {

object_id_type agent_register_root_evaluator::do_evaluate( const agent_register_root_operation& op )
{ try {
   database& d = db();
   registry = &d.get_registry();
   verify_registry_authority( *registry, op.authority );

   HYDRA_ASSERT( d.find_agent( op.wallet ) == nullptr, agent_already_exists_exception,
                 "An agent is already registered for wallet ${w}", ("w",op.wallet) );
   HYDRA_ASSERT( d.find_root_agent() == nullptr, root_already_registered_exception,
                 "A root agent is already registered", ("root",d.find_root_agent()->wallet) );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type agent_register_root_evaluator::do_apply( const agent_register_root_operation& op )
{ try {
   database& d = db();
   auto total_agents = registry->total_agents + share_type(1);
   auto now = d.head_time().sec_since_epoch();

   const auto& agent = d.create<agent_object>( [&]( agent_object& a ) {
      a.agent_address     = address::for_agent( op.wallet );
      a.wallet            = op.wallet;
      a.name              = op.name;
      a.specialization    = op.specialization;
      a.depth             = 0;
      a.revenue_share_bps = 0;
      a.is_active         = true;
      a.created_at        = now;
   });

   d.modify( *registry, [&]( registry_object& r ) {
      r.total_agents = total_agents;
   });

   agent_registered_event e;
   e.agent          = agent.agent_address;
   e.wallet         = op.wallet;
   e.parent         = agent.parent;
   e.name           = op.name;
   e.specialization = op.specialization;
   e.depth          = 0;
   e.timestamp      = now;
   emit( e );

   return agent.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type agent_spawn_evaluator::do_evaluate( const agent_spawn_operation& op )
{ try {
   database& d = db();
   registry = &d.get_registry();
   parent = &d.get_agent( op.parent_wallet );

   HYDRA_ASSERT( parent->is_active, agent_inactive_exception,
                 "Parent agent ${a} is not active", ("a",parent->agent_address) );
   HYDRA_ASSERT( parent->depth < HYDRA_MAX_DEPTH, max_depth_reached_exception,
                 "Parent agent is at depth ${d}, children may not be deeper than ${max}",
                 ("d",parent->depth)("max",HYDRA_MAX_DEPTH) );
   HYDRA_ASSERT( d.find_agent( op.child_wallet ) == nullptr, agent_already_exists_exception,
                 "An agent is already registered for wallet ${w}", ("w",op.child_wallet) );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type agent_spawn_evaluator::do_apply( const agent_spawn_operation& op )
{ try {
   database& d = db();
   auto children_count = parent->children_count + share_type(1);
   auto total_agents   = registry->total_agents + share_type(1);
   auto total_spawns   = registry->total_spawns + share_type(1);
   uint8_t depth       = parent->depth + 1;
   auto now            = d.head_time().sec_since_epoch();
   auto parent_address = parent->agent_address;

   const auto& child = d.create<agent_object>( [&]( agent_object& a ) {
      a.agent_address     = address::for_agent( op.child_wallet );
      a.wallet            = op.child_wallet;
      a.parent            = parent_address;
      a.name              = op.name;
      a.specialization    = op.specialization;
      a.depth             = depth;
      a.revenue_share_bps = op.revenue_share_bps;
      a.is_active         = true;
      a.created_at        = now;
   });

   d.modify( *parent, [&]( agent_object& a ) {
      a.children_count = children_count;
   });
   d.modify( *registry, [&]( registry_object& r ) {
      r.total_agents = total_agents;
      r.total_spawns = total_spawns;
   });

   agent_spawned_event e;
   e.parent            = parent_address;
   e.child             = child.agent_address;
   e.child_wallet      = op.child_wallet;
   e.name              = op.name;
   e.specialization    = op.specialization;
   e.depth             = depth;
   e.revenue_share_bps = op.revenue_share_bps;
   e.timestamp         = now;
   emit( e );

   return child.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type earning_record_evaluator::do_evaluate( const earning_record_operation& op )
{ try {
   database& d = db();
   registry = &d.get_registry();
   agent = &d.get_agent( op.wallet );

   HYDRA_ASSERT( agent->is_active, agent_inactive_exception,
                 "Agent ${a} is not active", ("a",agent->agent_address) );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type earning_record_evaluator::do_apply( const earning_record_operation& op )
{ try {
   database& d = db();
   auto total_earned   = agent->total_earned + op.amount;
   auto total_earnings = registry->total_earnings + op.amount;

   d.modify( *agent, [&]( agent_object& a ) {
      a.total_earned = total_earned;
   });
   d.modify( *registry, [&]( registry_object& r ) {
      r.total_earnings = total_earnings;
   });

   earning_recorded_event e;
   e.agent        = agent->agent_address;
   e.amount       = op.amount;
   e.total_earned = total_earned;
   e.timestamp    = d.head_time().sec_since_epoch();
   emit( e );

   return total_earned;
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type agent_deactivate_evaluator::do_evaluate( const agent_deactivate_operation& op )
{ try {
   database& d = db();
   verify_registry_authority( d.get_registry(), op.authority );
   agent = &d.get_agent( op.wallet );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type agent_deactivate_evaluator::do_apply( const agent_deactivate_operation& op )
{ try {
   database& d = db();
   d.modify( *agent, [&]( agent_object& a ) {
      a.is_active = false;
   });

   agent_deactivated_event e;
   e.agent     = agent->agent_address;
   e.wallet    = agent->wallet;
   e.timestamp = d.head_time().sec_since_epoch();
   emit( e );

   return agent->id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // hydra::chain
