#include <boost/test/unit_test.hpp>

#include <hydra/chain/database.hpp>
#include <hydra/chain/operations.hpp>
#include <hydra/chain/exceptions.hpp>
#include <hydra/chain/time.hpp>

#include <fc/crypto/digest.hpp>

#include "../common/database_fixture.hpp"

using namespace hydra::chain;
using namespace hydra::db;

BOOST_FIXTURE_TEST_SUITE( operation_tests, database_fixture )

BOOST_AUTO_TEST_CASE( initialize_registry_test )
{
   try {
      BOOST_CHECK( db.find_registry() == nullptr );

      const registry_object& registry = initialize_registry();
      BOOST_CHECK( registry.authority == authority_key );
      BOOST_CHECK( registry.registry_address == address::for_registry() );
      BOOST_CHECK_EQUAL( registry.total_agents.value, 0u );
      BOOST_CHECK_EQUAL( registry.total_earnings.value, 0u );
      BOOST_CHECK_EQUAL( registry.total_spawns.value, 0u );

      BOOST_REQUIRE_EQUAL( applied_events.size(), 1u );
      const auto& e = applied_events.back().event.get<registry_initialized_event>();
      BOOST_CHECK( e.authority == authority_key );
      BOOST_CHECK_EQUAL( e.timestamp, genesis_time.sec_since_epoch() );

      // a second initialization fails and leaves the first one intact
      ACTOR(mallory);
      registry_initialize_operation op;
      op.authority = mallory_key;
      trx.operations.push_back( op );
      trx.sign( mallory_private_key );
      BOOST_REQUIRE_THROW( PUSH_TX( trx, database::skip_nothing ), registry_already_exists_exception );
      BOOST_CHECK( db.get_registry().authority == authority_key );
      BOOST_CHECK_EQUAL( applied_events.size(), 1u );
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( initialize_requires_authority_signature )
{
   ACTOR(mallory);
   registry_initialize_operation op;
   op.authority = authority_key;
   trx.operations.push_back( op );
   trx.sign( mallory_private_key );
   BOOST_REQUIRE_THROW( PUSH_TX( trx, database::skip_nothing ), missing_signature_exception );
   BOOST_CHECK( db.find_registry() == nullptr );

   REQUIRE_THROW_WITH_VALUE( op, authority, public_key_type(), fc::assert_exception );
}

BOOST_AUTO_TEST_CASE( register_root_test )
{
   try {
      ACTOR(root);
      initialize_registry();
      fc::time_point_sec register_time = genesis_time + 60;
      advance_simulated_time_to( register_time );

      const agent_object& agent = register_root( root_key, "prime", "orchestration" );
      BOOST_CHECK( agent.wallet == root_key );
      BOOST_CHECK( agent.agent_address == address::for_agent( root_key ) );
      BOOST_CHECK( agent.parent.is_null() );
      BOOST_CHECK( agent.is_root() );
      BOOST_CHECK_EQUAL( agent.name, "prime" );
      BOOST_CHECK_EQUAL( agent.specialization, "orchestration" );
      BOOST_CHECK_EQUAL( agent.depth, 0 );
      BOOST_CHECK_EQUAL( agent.revenue_share_bps, 0 );
      BOOST_CHECK_EQUAL( agent.total_earned.value, 0u );
      BOOST_CHECK_EQUAL( agent.total_distributed_to_parent.value, 0u );
      BOOST_CHECK_EQUAL( agent.children_count.value, 0u );
      BOOST_CHECK( agent.is_active );
      BOOST_CHECK_EQUAL( agent.created_at, register_time.sec_since_epoch() );

      BOOST_CHECK_EQUAL( db.get_registry().total_agents.value, 1u );
      BOOST_CHECK_EQUAL( db.get_registry().total_spawns.value, 0u );
      BOOST_CHECK( db.find_root_agent() == &agent );

      const auto& e = applied_events.back().event.get<agent_registered_event>();
      BOOST_CHECK( e.agent == agent.agent_address );
      BOOST_CHECK( e.wallet == root_key );
      BOOST_CHECK( e.parent.is_null() );
      BOOST_CHECK_EQUAL( e.name, "prime" );
      BOOST_CHECK_EQUAL( e.specialization, "orchestration" );
      BOOST_CHECK_EQUAL( e.depth, 0 );
      BOOST_CHECK_EQUAL( e.timestamp, register_time.sec_since_epoch() );

      verify_ledger_invariants();
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( register_root_failures )
{
   ACTORS( (root)(other)(mallory) );

   agent_register_root_operation op;
   op.authority      = authority_key;
   op.wallet         = root_key;
   op.name           = "root";
   op.specialization = "orchestration";
   trx.operations.push_back( op );
   trx.sign( authority_private_key );
   BOOST_REQUIRE_THROW( PUSH_TX( trx, database::skip_nothing ), registry_not_found_exception );

   initialize_registry();

   // only the registry authority may register the root
   trx.clear();
   op.authority = mallory_key;
   trx.operations.push_back( op );
   trx.sign( mallory_private_key );
   BOOST_REQUIRE_THROW( PUSH_TX( trx, database::skip_nothing ), unauthorized_authority_exception );
   BOOST_CHECK( db.find_agent( root_key ) == nullptr );
   op.authority = authority_key;

   REQUIRE_THROW_WITH_VALUE( op, name, string( HYDRA_MAX_NAME_LENGTH + 1, 'r' ), name_too_long_exception );
   REQUIRE_THROW_WITH_VALUE( op, specialization, string( HYDRA_MAX_SPECIALIZATION_LENGTH + 1, 's' ), spec_too_long_exception );
   BOOST_CHECK_EQUAL( db.get_registry().total_agents.value, 0u );

   register_root( root_key );
   BOOST_REQUIRE_THROW( register_root( root_key ), agent_already_exists_exception );
   BOOST_REQUIRE_THROW( register_root( other_key ), root_already_registered_exception );
   BOOST_CHECK_EQUAL( db.get_registry().total_agents.value, 1u );
   verify_ledger_invariants();
}

BOOST_AUTO_TEST_CASE( spawn_child_test )
{
   try {
      ACTORS( (root)(analyst) );
      initialize_registry();
      register_root( root_key );
      fc::time_point_sec spawn_time = genesis_time + 3600;
      advance_simulated_time_to( spawn_time );

      const agent_object& child = spawn_agent( root_private_key, analyst_key, "analyst", "market-analysis", 2500 );
      const agent_object& root  = db.get_agent( root_key );

      BOOST_CHECK( child.wallet == analyst_key );
      BOOST_CHECK( child.agent_address == address::for_agent( analyst_key ) );
      BOOST_CHECK( child.parent == root.agent_address );
      BOOST_CHECK( !child.is_root() );
      BOOST_CHECK_EQUAL( child.name, "analyst" );
      BOOST_CHECK_EQUAL( child.specialization, "market-analysis" );
      BOOST_CHECK_EQUAL( child.depth, 1 );
      BOOST_CHECK_EQUAL( child.revenue_share_bps, 2500 );
      BOOST_CHECK_EQUAL( child.total_earned.value, 0u );
      BOOST_CHECK_EQUAL( child.children_count.value, 0u );
      BOOST_CHECK( child.is_active );
      BOOST_CHECK_EQUAL( child.created_at, spawn_time.sec_since_epoch() );

      BOOST_CHECK_EQUAL( root.children_count.value, 1u );
      BOOST_CHECK_EQUAL( db.get_registry().total_agents.value, 2u );
      BOOST_CHECK_EQUAL( db.get_registry().total_spawns.value, 1u );

      auto children = db.get_children( root.agent_address );
      BOOST_REQUIRE_EQUAL( children.size(), 1u );
      BOOST_CHECK( children.front() == &child );

      const auto& e = applied_events.back().event.get<agent_spawned_event>();
      BOOST_CHECK( e.parent == root.agent_address );
      BOOST_CHECK( e.child == child.agent_address );
      BOOST_CHECK( e.child_wallet == analyst_key );
      BOOST_CHECK_EQUAL( e.name, "analyst" );
      BOOST_CHECK_EQUAL( e.specialization, "market-analysis" );
      BOOST_CHECK_EQUAL( e.depth, 1 );
      BOOST_CHECK_EQUAL( e.revenue_share_bps, 2500 );
      BOOST_CHECK_EQUAL( e.timestamp, spawn_time.sec_since_epoch() );

      verify_ledger_invariants();
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( spawn_validation_failures )
{
   ACTORS( (root)(child) );
   initialize_registry();
   register_root( root_key );

   agent_spawn_operation op;
   op.parent_wallet     = root_key;
   op.child_wallet      = child_key;
   op.name              = "child";
   op.specialization    = "research";
   op.revenue_share_bps = 100;
   trx.operations.push_back( op );

   REQUIRE_THROW_WITH_VALUE( op, name, string( HYDRA_MAX_NAME_LENGTH + 1, 'c' ), name_too_long_exception );
   REQUIRE_THROW_WITH_VALUE( op, specialization, string( HYDRA_MAX_SPECIALIZATION_LENGTH + 1, 's' ), spec_too_long_exception );
   REQUIRE_THROW_WITH_VALUE( op, revenue_share_bps, HYDRA_MAX_REVENUE_SHARE_BPS + 1, invalid_revenue_share_exception );
   REQUIRE_THROW_WITH_VALUE( op, revenue_share_bps, std::numeric_limits<uint16_t>::max(), invalid_revenue_share_exception );

   // the parent wallet must sign
   trx.operations.back() = op;
   trx.sign( child_private_key );
   BOOST_REQUIRE_THROW( PUSH_TX( trx, database::skip_nothing ), missing_signature_exception );

   // a wallet without an agent cannot spawn
   ACTOR(stranger);
   op.parent_wallet = stranger_key;
   trx.clear();
   trx.operations.push_back( op );
   trx.sign( stranger_private_key );
   BOOST_REQUIRE_THROW( PUSH_TX( trx, database::skip_nothing ), agent_not_found_exception );

   BOOST_CHECK_EQUAL( db.get_registry().total_agents.value, 1u );
   BOOST_CHECK_EQUAL( db.get_agent( root_key ).children_count.value, 0u );

   // boundary values succeed
   spawn_agent( root_private_key, child_key, string( HYDRA_MAX_NAME_LENGTH, 'c' ),
                string( HYDRA_MAX_SPECIALIZATION_LENGTH, 's' ), HYDRA_MAX_REVENUE_SHARE_BPS );
   BOOST_CHECK_EQUAL( db.get_agent( child_key ).revenue_share_bps, HYDRA_MAX_REVENUE_SHARE_BPS );

   // the same wallet cannot back two agents
   BOOST_REQUIRE_THROW( spawn_agent( root_private_key, child_key, "again" ), agent_already_exists_exception );
   BOOST_REQUIRE_THROW( spawn_agent( root_private_key, root_key, "self" ), agent_already_exists_exception );
   verify_ledger_invariants();
}

BOOST_AUTO_TEST_CASE( spawn_depth_limit )
{
   try {
      ACTORS( (root)(a1)(a2)(a3)(a4)(a5)(a6) );
      initialize_registry();
      register_root( root_key );

      auto chain = spawn_chain( root_private_key, { a1_private_key, a2_private_key, a3_private_key,
                                                    a4_private_key, a5_private_key } );
      BOOST_REQUIRE_EQUAL( chain.size(), 5u );
      for( size_t i = 0; i < chain.size(); ++i )
         BOOST_CHECK_EQUAL( chain[i]->depth, i + 1 );
      BOOST_CHECK_EQUAL( chain.back()->depth, HYDRA_MAX_DEPTH );

      auto events_before = applied_events.size();
      BOOST_REQUIRE_THROW( spawn_agent( a5_private_key, a6_key, "too-deep" ), max_depth_reached_exception );
      BOOST_CHECK_EQUAL( applied_events.size(), events_before );
      BOOST_CHECK_EQUAL( db.get_index_type<event_history_index>().indices().size(), events_before );
      BOOST_CHECK( db.find_agent( a6_key ) == nullptr );
      BOOST_CHECK_EQUAL( db.get_agent( a5_key ).children_count.value, 0u );
      BOOST_CHECK_EQUAL( db.get_registry().total_agents.value, 6u );
      BOOST_CHECK_EQUAL( db.get_registry().total_spawns.value, 5u );

      // an agent above the limit may still spawn siblings of the deepest agent
      spawn_agent( a4_private_key, a6_key, "sibling" );
      BOOST_CHECK_EQUAL( db.get_agent( a6_key ).depth, HYDRA_MAX_DEPTH );
      BOOST_CHECK_EQUAL( db.get_agent( a4_key ).children_count.value, 2u );

      verify_ledger_invariants();
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( record_earning_test )
{
   try {
      ACTORS( (root)(worker) );
      initialize_registry();
      register_root( root_key );
      spawn_agent( root_private_key, worker_key, "worker" );

      BOOST_CHECK_EQUAL( record_earning( worker_private_key, 500 ).value, 500u );
      BOOST_CHECK_EQUAL( record_earning( worker_private_key, 250 ).value, 750u );
      BOOST_CHECK_EQUAL( record_earning( root_private_key, 40 ).value, 40u );

      BOOST_CHECK_EQUAL( db.get_agent( worker_key ).total_earned.value, 750u );
      BOOST_CHECK_EQUAL( db.get_agent( root_key ).total_earned.value, 40u );
      BOOST_CHECK_EQUAL( db.get_registry().total_earnings.value, 790u );

      const auto& e = applied_events.back().event.get<earning_recorded_event>();
      BOOST_CHECK( e.agent == address::for_agent( root_key ) );
      BOOST_CHECK_EQUAL( e.amount.value, 40u );
      BOOST_CHECK_EQUAL( e.total_earned.value, 40u );

      // earnings do not move value
      BOOST_CHECK_EQUAL( get_balance( worker_key ).value, 0u );
      verify_ledger_invariants();
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( record_earning_failures )
{
   ACTORS( (root)(worker)(stranger) );
   initialize_registry();
   register_root( root_key );
   spawn_agent( root_private_key, worker_key, "worker" );

   earning_record_operation op;
   op.wallet = worker_key;
   op.amount = 10;
   trx.operations.push_back( op );
   REQUIRE_THROW_WITH_VALUE( op, amount, 0, zero_amount_exception );

   // only the agent's own wallet may record its earnings
   trx.sign( root_private_key );
   BOOST_REQUIRE_THROW( PUSH_TX( trx, database::skip_nothing ), missing_signature_exception );

   BOOST_REQUIRE_THROW( record_earning( stranger_private_key, 10 ), agent_not_found_exception );

   record_earning( worker_private_key, std::numeric_limits<uint64_t>::max() - 5 );
   BOOST_REQUIRE_THROW( record_earning( worker_private_key, 6 ), fc::overflow_exception );
   BOOST_CHECK_EQUAL( db.get_agent( worker_key ).total_earned.value, std::numeric_limits<uint64_t>::max() - 5 );
   BOOST_CHECK_EQUAL( db.get_registry().total_earnings.value, std::numeric_limits<uint64_t>::max() - 5 );

   // the registry total overflows even though the agent's own total would not
   BOOST_REQUIRE_THROW( record_earning( root_private_key, 6 ), fc::overflow_exception );
   BOOST_CHECK_EQUAL( db.get_agent( root_key ).total_earned.value, 0u );
   BOOST_CHECK_EQUAL( db.get_registry().total_earnings.value, std::numeric_limits<uint64_t>::max() - 5 );

   deactivate( worker_key );
   auto events_before = applied_events.size();
   BOOST_REQUIRE_THROW( record_earning( worker_private_key, 1 ), agent_inactive_exception );
   BOOST_CHECK_EQUAL( db.get_agent( worker_key ).total_earned.value, std::numeric_limits<uint64_t>::max() - 5 );
   BOOST_CHECK_EQUAL( db.get_registry().total_earnings.value, std::numeric_limits<uint64_t>::max() - 5 );
   BOOST_CHECK_EQUAL( applied_events.size(), events_before );
   verify_ledger_invariants();
}

BOOST_AUTO_TEST_CASE( deactivate_agent_test )
{
   try {
      ACTORS( (root)(lead)(helper)(mallory) );
      initialize_registry();
      register_root( root_key );
      spawn_agent( root_private_key, lead_key, "lead" );
      spawn_agent( lead_private_key, helper_key, "helper" );
      record_earning( lead_private_key, 100 );

      deactivate( lead_key );
      const agent_object& lead = db.get_agent( lead_key );
      BOOST_CHECK( !lead.is_active );
      BOOST_CHECK_EQUAL( lead.total_earned.value, 100u );
      BOOST_CHECK_EQUAL( lead.children_count.value, 1u );

      const auto& e = applied_events.back().event.get<agent_deactivated_event>();
      BOOST_CHECK( e.agent == lead.agent_address );
      BOOST_CHECK( e.wallet == lead_key );
      BOOST_CHECK_EQUAL( e.timestamp, genesis_time.sec_since_epoch() );

      // descendants are not affected
      BOOST_CHECK( db.get_agent( helper_key ).is_active );
      record_earning( helper_private_key, 5 );

      BOOST_REQUIRE_THROW( spawn_agent( lead_private_key, mallory_key, "blocked" ), agent_inactive_exception );

      // deactivating again succeeds and emits another event
      auto events_before = applied_events.size();
      deactivate( lead_key );
      BOOST_CHECK_EQUAL( applied_events.size(), events_before + 1 );
      BOOST_CHECK( applied_events.back().event.get<agent_deactivated_event>().wallet == lead_key );
      BOOST_CHECK( !db.get_agent( lead_key ).is_active );

      // the root can be deactivated too
      deactivate( root_key );
      BOOST_CHECK( !db.get_agent( root_key ).is_active );
      BOOST_CHECK_EQUAL( db.get_registry().total_agents.value, 3u );
      verify_ledger_invariants();
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( deactivate_failures )
{
   ACTORS( (root)(mallory)(stranger) );
   initialize_registry();
   register_root( root_key );

   agent_deactivate_operation op;
   op.authority = mallory_key;
   op.wallet    = root_key;
   trx.operations.push_back( op );
   trx.sign( mallory_private_key );
   BOOST_REQUIRE_THROW( PUSH_TX( trx, database::skip_nothing ), unauthorized_authority_exception );

   // the agent itself cannot deactivate without the authority
   trx.clear();
   op.authority = authority_key;
   trx.operations.push_back( op );
   trx.sign( root_private_key );
   BOOST_REQUIRE_THROW( PUSH_TX( trx, database::skip_nothing ), missing_signature_exception );
   BOOST_CHECK( db.get_agent( root_key ).is_active );

   BOOST_REQUIRE_THROW( deactivate( stranger_key ), agent_not_found_exception );
}

BOOST_AUTO_TEST_CASE( operation_results_and_event_positions )
{
   ACTORS( (root)(child) );
   initialize_registry();
   register_root( root_key );

   agent_spawn_operation spawn;
   spawn.parent_wallet = root_key;
   spawn.child_wallet  = child_key;
   spawn.name          = "child";
   trx.operations.push_back( spawn );

   earning_record_operation earning;
   earning.wallet = child_key;
   earning.amount = 77;
   trx.operations.push_back( earning );
   trx.operations.push_back( earning );

   trx.sign( root_private_key );
   trx.sign( child_private_key );
   auto events_before = applied_events.size();
   auto ptrx = PUSH_TX( trx, database::skip_nothing );

   BOOST_REQUIRE_EQUAL( ptrx.operation_results.size(), 3u );
   BOOST_CHECK( ptrx.operation_results[0].get<object_id_type>() == db.get_agent( child_key ).id );
   BOOST_CHECK_EQUAL( ptrx.operation_results[1].get<share_type>().value, 77u );
   BOOST_CHECK_EQUAL( ptrx.operation_results[2].get<share_type>().value, 154u );

   BOOST_REQUIRE_EQUAL( applied_events.size(), events_before + 3 );
   for( uint16_t i = 0; i < 3; ++i )
   {
      const auto& e = applied_events[events_before + i];
      BOOST_CHECK_EQUAL( e.op_in_trx, i );
      BOOST_CHECK_EQUAL( e.trx_in_history, applied_events[events_before].trx_in_history );
   }
   BOOST_CHECK( applied_events[events_before].event.which() == agent_event::tag<agent_spawned_event>::value );
}

BOOST_AUTO_TEST_SUITE_END()
