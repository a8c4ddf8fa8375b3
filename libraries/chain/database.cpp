#include <hydra/chain/database.hpp>
#include <hydra/chain/exceptions.hpp>
#include <hydra/chain/time.hpp>

#include <hydra/chain/registry_evaluator.hpp>
#include <hydra/chain/agent_evaluator.hpp>
#include <hydra/chain/revenue_evaluator.hpp>

#include <boost/tuple/tuple.hpp>

namespace hydra { namespace chain {

using hydra::db::primary_index;
using hydra::db::simple_index;

database::database()
{
   initialize_indexes();
   initialize_evaluators();
   _value_transfer = std::make_shared<native_balance_transfer>();
}

database::~database(){}

void database::close()
{
   object_database::close();
}

void database::wipe( const fc::path& data_dir )
{
   ilog("Wiping database in ${d}", ("d", data_dir));
   object_database::wipe( data_dir );
   initialize_indexes();
}

void database::open( const fc::path& data_dir, const genesis_allocation& initial_allocation )
{ try {
   ilog("Open database in ${d}", ("d", data_dir));
   object_database::open( data_dir );

   if( !find(dynamic_global_property_id_type()) )
      init_genesis(initial_allocation);
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<registry_initialize_evaluator>();
   register_evaluator<agent_register_root_evaluator>();
   register_evaluator<agent_spawn_evaluator>();
   register_evaluator<earning_record_evaluator>();
   register_evaluator<revenue_distribute_evaluator>();
   register_evaluator<agent_deactivate_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();

   //Protocol object indexes
   add_index< primary_index< simple_index< registry_object > > >();
   add_index< primary_index< agent_index > >();
   add_index< primary_index< event_history_index > >();

   //Implementation object indexes
   add_index< primary_index< simple_index< dynamic_global_property_object > > >();
   add_index< primary_index< wallet_balance_index > >();
}

void database::init_genesis( const genesis_allocation& initial_allocation )
{ try {
   _undo_db.disable();

   create<dynamic_global_property_object>( [&]( dynamic_global_property_object& p ) {
      p.time = fc::time_point_sec( now() );
   });

   for( const auto& handout : initial_allocation )
   {
      ilog( "genesis allocation of ${a} to ${k}", ("a",handout.second)("k",handout.first) );
      deposit( handout.first, handout.second );
   }

   _undo_db.enable();
} FC_CAPTURE_AND_RETHROW() }

const dynamic_global_property_object& database::get_dynamic_global_properties()const
{
   return get( dynamic_global_property_id_type() );
}

time_point_sec database::head_time()const
{
   return get_dynamic_global_properties().time;
}

const registry_object* database::find_registry()const
{
   return find( registry_id_type() );
}

const registry_object& database::get_registry()const
{
   const auto* registry = find_registry();
   HYDRA_ASSERT( registry != nullptr, registry_not_found_exception,
                 "The registry has not been initialized", ("id",registry_id_type()) );
   return *registry;
}

const agent_object* database::find_agent( const public_key_type& wallet )const
{
   const auto& by_wallet_idx = get_index_type<agent_index>().indices().get<by_wallet>();
   auto itr = by_wallet_idx.find( wallet );
   if( itr == by_wallet_idx.end() ) return nullptr;
   return &*itr;
}

const agent_object& database::get_agent( const public_key_type& wallet )const
{
   const auto* agent = find_agent( wallet );
   HYDRA_ASSERT( agent != nullptr, agent_not_found_exception,
                 "No agent is registered for wallet ${w}", ("w",wallet) );
   return *agent;
}

const agent_object* database::find_agent_by_address( const address& agent_address )const
{
   const auto& by_address_idx = get_index_type<agent_index>().indices().get<by_address>();
   auto itr = by_address_idx.find( agent_address );
   if( itr == by_address_idx.end() ) return nullptr;
   return &*itr;
}

const agent_object& database::get_agent_by_address( const address& agent_address )const
{
   const auto* agent = find_agent_by_address( agent_address );
   HYDRA_ASSERT( agent != nullptr, agent_not_found_exception,
                 "No agent has address ${a}", ("a",agent_address) );
   return *agent;
}

const agent_object* database::find_root_agent()const
{
   const auto& by_parent_idx = get_index_type<agent_index>().indices().get<by_parent>();
   auto itr = by_parent_idx.lower_bound( boost::make_tuple( address() ) );
   if( itr == by_parent_idx.end() || !itr->is_root() ) return nullptr;
   return &*itr;
}

vector<const agent_object*> database::get_children( const address& parent )const
{
   vector<const agent_object*> result;
   const auto& by_parent_idx = get_index_type<agent_index>().indices().get<by_parent>();
   auto range = by_parent_idx.equal_range( boost::make_tuple( parent ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( &*itr );
   return result;
}

share_type database::get_balance( const public_key_type& owner )const
{
   const auto& by_owner_idx = get_index_type<wallet_balance_index>().indices().get<by_owner>();
   auto itr = by_owner_idx.find( owner );
   if( itr == by_owner_idx.end() )
      return share_type(0);
   return itr->balance;
}

void database::deposit( const public_key_type& owner, share_type amount )
{ try {
   const auto& by_owner_idx = get_index_type<wallet_balance_index>().indices().get<by_owner>();
   auto itr = by_owner_idx.find( owner );
   if( itr == by_owner_idx.end() )
   {
      create<wallet_balance_object>( [&]( wallet_balance_object& b ) {
         b.owner   = owner;
         b.balance = amount;
      });
      return;
   }
   auto balance = itr->balance + amount;
   modify( *itr, [&]( wallet_balance_object& b ) {
      b.balance = balance;
   });
} FC_CAPTURE_AND_RETHROW( (owner)(amount) ) }

void database::withdraw( const public_key_type& owner, share_type amount )
{ try {
   const auto& by_owner_idx = get_index_type<wallet_balance_index>().indices().get<by_owner>();
   auto itr = by_owner_idx.find( owner );
   HYDRA_ASSERT( itr != by_owner_idx.end() && itr->balance >= amount, insufficient_balance_exception,
                 "Wallet ${w} holds ${b}, unable to withdraw ${a}",
                 ("w",owner)("b",get_balance(owner))("a",amount) );
   auto balance = itr->balance - amount;
   modify( *itr, [&]( wallet_balance_object& b ) {
      b.balance = balance;
   });
} FC_CAPTURE_AND_RETHROW( (owner)(amount) ) }

value_transfer& database::get_value_transfer()const
{
   FC_ASSERT( _value_transfer, "no value transfer mechanism installed" );
   return *_value_transfer;
}

void database::set_value_transfer( const shared_ptr<value_transfer>& t )
{
   FC_ASSERT( t, "value transfer mechanism may not be null" );
   _value_transfer = t;
}

const event_history_object& database::push_event( const agent_event& e )
{
   const auto& obj = create<event_history_object>( [&]( event_history_object& h ) {
      h.event          = e;
      h.trx_in_history = _current_trx_in_history;
      h.op_in_trx      = _current_op_in_trx;
      h.time           = head_time();
   });
   _pending_events.push_back( obj.id );
   return obj;
}

void database::notify_applied_events()
{
   auto events = std::move( _pending_events );
   _pending_events.clear();
   for( const auto& id : events )
      applied_event( get( id ) );
}

processed_transaction database::push_transaction( const signed_transaction& trx, uint32_t skip )
{ try {
   processed_transaction processed_trx;
   try {
      auto session = _undo_db.start_undo_session();
      processed_trx = apply_transaction( trx, skip );
      session.commit();
   } catch( const fc::exception& e ) {
      _pending_events.clear();
      wlog( "rejected transaction: ${e}", ("e",e.to_string()) );
      throw;
   }

   notify_applied_events();
   return processed_trx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

processed_transaction database::validate_transaction( const signed_transaction& trx, uint32_t skip )
{
   auto session = _undo_db.start_undo_session();
   auto processed_trx = apply_transaction( trx, skip );
   _pending_events.clear();
   return processed_trx;
}

processed_transaction database::apply_transaction( const signed_transaction& trx, uint32_t skip )
{ try {
   _pending_events.clear();
   trx.validate();

   transaction_evaluation_state eval_state( this, skip & skip_transaction_signatures );
   if( !(skip & skip_transaction_signatures) )
      eval_state.signed_by = trx.get_signature_keys();

   modify( get_dynamic_global_properties(), [&]( dynamic_global_property_object& p ) {
      p.time = fc::time_point_sec( now() );
      ++p.transaction_count;
   });
   _current_trx_in_history = get_dynamic_global_properties().transaction_count;
   _current_op_in_trx = 0;

   processed_transaction ptrx(trx);
   for( const auto& op : ptrx.operations )
   {
      eval_state.operation_results.emplace_back( apply_operation( eval_state, op ) );
      ++_current_op_in_trx;
   }
   ptrx.operation_results = std::move( eval_state.operation_results );

   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{
   FC_ASSERT( op.which() >= 0 && size_t(op.which()) < _operation_evaluators.size() && _operation_evaluators[op.which()],
              "No registered evaluator for this operation", ("which",op.which()) );
   return _operation_evaluators[op.which()]->evaluate( eval_state, op, true );
}

} } // hydra::chain
