#pragma once
#include <hydra/chain/evaluator.hpp>

namespace hydra { namespace chain {

   class revenue_distribute_evaluator : public evaluator<revenue_distribute_evaluator>
   {
      public:
         typedef revenue_distribute_operation operation_type;

         object_id_type do_evaluate( const revenue_distribute_operation& o );
         share_type     do_apply( const revenue_distribute_operation& o );

         const agent_object*    child  = nullptr;
         const agent_object*    parent = nullptr;
   };

} } // hydra::chain
