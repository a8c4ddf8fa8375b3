#include <hydra/chain/registry_evaluator.hpp>
#include <hydra/chain/database.hpp>
#include <hydra/chain/exceptions.hpp>

namespace hydra { namespace chain {

object_id_type registry_initialize_evaluator::do_evaluate( const registry_initialize_operation& op )
{ try {
   HYDRA_ASSERT( db().find_registry() == nullptr, registry_already_exists_exception,
                 "The registry has already been initialized", ("authority",op.authority) );
   return object_id_type();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type registry_initialize_evaluator::do_apply( const registry_initialize_operation& op )
{ try {
   database& d = db();
   const auto& registry = d.create<registry_object>( [&]( registry_object& r ) {
      r.authority        = op.authority;
      r.registry_address = address::for_registry();
   });

   registry_initialized_event e;
   e.authority = op.authority;
   e.timestamp = d.head_time().sec_since_epoch();
   emit( e );

   ilog( "registry initialized with authority ${a}", ("a",op.authority) );
   return registry.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // hydra::chain
