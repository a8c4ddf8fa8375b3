#pragma once

#include <hydra/chain/database.hpp>
#include <hydra/chain/exceptions.hpp>
#include <hydra/chain/time.hpp>

#include <fc/filesystem.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>

using namespace hydra::db;

#define REQUIRE_OP_VALIDATION_SUCCESS( op, field, value ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   op.validate(); \
   op.field = temp; \
}
#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value, exception_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   BOOST_REQUIRE_THROW( op.validate(), exception_type ); \
   op.field = temp; \
}
///Shortcut to require an exception when processing a transaction with an operation containing an expected bad value
/// Uses require instead of check, because these transactions are expected to fail. If they don't, subsequent tests
/// may spuriously succeed or fail due to unexpected database state.
#define REQUIRE_THROW_WITH_VALUE(op, field, value, exception_type) \
{ \
   auto bak = op.field; \
   op.field = value; \
   trx.operations.back() = op; \
   op.field = bak; \
   BOOST_REQUIRE_THROW(db.push_transaction(trx, ~0), exception_type); \
}
///This allows consecutive test cases, i.e. a test on distribution can begin with the
/// database at the end state of the spawn test.
#define INVOKE(test) ((struct test*)this)->test_method(); trx = signed_transaction()

#define PUSH_TX( tx, skip_flags ) \
   _push_transaction( tx, skip_flags, __FILE__, __LINE__ )

#define ACTOR(name) \
   fc::ecc::private_key name ## _private_key = generate_private_key(BOOST_PP_STRINGIZE(name)); \
   public_key_type name ## _key = name ## _private_key.get_public_key();

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

namespace hydra { namespace chain {

struct database_fixture {
   fc::temp_directory data_dir;
   chain::database db;
   signed_transaction trx;
   fc::ecc::private_key authority_private_key = generate_private_key("authority");
   public_key_type authority_key = authority_private_key.get_public_key();
   fc::time_point_sec genesis_time = fc::time_point_sec( 1700000000 );

   /** every event passed to database::applied_event, in order */
   vector<event_history_object> applied_events;
   boost::signals2::scoped_connection event_connection;

   database_fixture();
   ~database_fixture();

   static fc::ecc::private_key generate_private_key( string seed );
   processed_transaction _push_transaction( const signed_transaction& tx, uint32_t skip_flags, const char* file, int line );

   /** pushes a transaction containing op signed by each of signers */
   processed_transaction push_operation( const operation& op, const vector<private_key_type>& signers );

   const registry_object& initialize_registry();
   const agent_object&    register_root( const public_key_type& wallet,
                                         const string& name = "root",
                                         const string& specialization = "orchestration" );
   const agent_object&    spawn_agent( const private_key_type& parent,
                                       const public_key_type& child_wallet,
                                       const string& name,
                                       const string& specialization = "research",
                                       uint16_t revenue_share_bps = 1000 );
   share_type             record_earning( const private_key_type& wallet, share_type amount );
   share_type             distribute( const private_key_type& child, const public_key_type& parent_wallet, share_type amount );
   void                   deactivate( const public_key_type& wallet );

   /** builds a chain of agents below root, one per key, each the child of the one before */
   vector<const agent_object*> spawn_chain( const private_key_type& root, const vector<private_key_type>& descendants );

   void       fund( const public_key_type& wallet, share_type amount );
   share_type get_balance( const public_key_type& wallet )const;
   uint64_t   agent_count()const;

   /** checks the counters and the tree structure against every stored agent */
   void verify_ledger_invariants()const;
};

} }
