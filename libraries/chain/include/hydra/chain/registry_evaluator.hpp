#pragma once
#include <hydra/chain/evaluator.hpp>

namespace hydra { namespace chain {

   class registry_initialize_evaluator : public evaluator<registry_initialize_evaluator>
   {
      public:
         typedef registry_initialize_operation operation_type;

         object_id_type do_evaluate( const registry_initialize_operation& o );
         object_id_type do_apply( const registry_initialize_operation& o );
   };

} } // hydra::chain
