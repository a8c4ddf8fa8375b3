#pragma once
#include <hydra/chain/evaluator.hpp>

namespace hydra { namespace chain {

   class agent_register_root_evaluator : public evaluator<agent_register_root_evaluator>
   {
      public:
         typedef agent_register_root_operation operation_type;

         object_id_type do_evaluate( const agent_register_root_operation& o );
         object_id_type do_apply( const agent_register_root_operation& o );

         const registry_object* registry = nullptr;
   };

   class agent_spawn_evaluator : public evaluator<agent_spawn_evaluator>
   {
      public:
         typedef agent_spawn_operation operation_type;

         object_id_type do_evaluate( const agent_spawn_operation& o );
         object_id_type do_apply( const agent_spawn_operation& o );

         const registry_object* registry = nullptr;
         const agent_object*    parent   = nullptr;
   };

   class earning_record_evaluator : public evaluator<earning_record_evaluator>
   {
      public:
         typedef earning_record_operation operation_type;

         object_id_type do_evaluate( const earning_record_operation& o );
         share_type     do_apply( const earning_record_operation& o );

         const registry_object* registry = nullptr;
         const agent_object*    agent    = nullptr;
   };

   class agent_deactivate_evaluator : public evaluator<agent_deactivate_evaluator>
   {
      public:
         typedef agent_deactivate_operation operation_type;

         object_id_type do_evaluate( const agent_deactivate_operation& o );
         object_id_type do_apply( const agent_deactivate_operation& o );

         const agent_object*    agent    = nullptr;
   };

} } // hydra::chain
