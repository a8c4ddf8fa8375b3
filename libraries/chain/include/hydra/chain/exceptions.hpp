#pragma once
#include <fc/exception/exception.hpp>

#define HYDRA_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                        \
   if( !(expr) )                                                   \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );         \
   FC_MULTILINE_MACRO_END

namespace hydra { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000, "ledger exception" )

   /** thrown by operation::validate() before any state is read */
   FC_DECLARE_DERIVED_EXCEPTION( validation_exception,           hydra::chain::chain_exception, 3010000, "operation validation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( name_too_long_exception,        hydra::chain::validation_exception, 3010001, "agent name exceeds the maximum length" )
   FC_DECLARE_DERIVED_EXCEPTION( spec_too_long_exception,        hydra::chain::validation_exception, 3010002, "agent specialization exceeds the maximum length" )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_revenue_share_exception, hydra::chain::validation_exception, 3010003, "revenue share exceeds 10000 basis points" )
   FC_DECLARE_DERIVED_EXCEPTION( zero_amount_exception,          hydra::chain::validation_exception, 3010004, "amount must be greater than zero" )

   FC_DECLARE_DERIVED_EXCEPTION( authorization_exception,        hydra::chain::chain_exception, 3020000, "authorization exception" )
   FC_DECLARE_DERIVED_EXCEPTION( missing_signature_exception,    hydra::chain::authorization_exception, 3020001, "missing required signature" )
   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_authority_exception, hydra::chain::authorization_exception, 3020002, "signer is not the registry authority" )

   FC_DECLARE_DERIVED_EXCEPTION( state_exception,                hydra::chain::chain_exception, 3030000, "ledger state exception" )
   FC_DECLARE_DERIVED_EXCEPTION( agent_inactive_exception,       hydra::chain::state_exception, 3030001, "agent is not active" )
   FC_DECLARE_DERIVED_EXCEPTION( max_depth_reached_exception,    hydra::chain::state_exception, 3030002, "maximum hierarchy depth reached" )
   FC_DECLARE_DERIVED_EXCEPTION( no_parent_agent_exception,      hydra::chain::state_exception, 3030003, "root agent has no parent" )
   FC_DECLARE_DERIVED_EXCEPTION( registry_not_found_exception,   hydra::chain::state_exception, 3030004, "registry has not been initialized" )
   FC_DECLARE_DERIVED_EXCEPTION( registry_already_exists_exception, hydra::chain::state_exception, 3030005, "registry is already initialized" )
   FC_DECLARE_DERIVED_EXCEPTION( agent_not_found_exception,      hydra::chain::state_exception, 3030006, "no agent is registered for the wallet" )
   FC_DECLARE_DERIVED_EXCEPTION( agent_already_exists_exception, hydra::chain::state_exception, 3030007, "an agent is already registered for the wallet" )
   FC_DECLARE_DERIVED_EXCEPTION( parent_mismatch_exception,      hydra::chain::state_exception, 3030008, "wallet is not the parent of the agent" )
   FC_DECLARE_DERIVED_EXCEPTION( root_already_registered_exception, hydra::chain::state_exception, 3030009, "a root agent is already registered" )

   FC_DECLARE_DERIVED_EXCEPTION( transfer_exception,             hydra::chain::chain_exception, 3040000, "value transfer exception" )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance_exception, hydra::chain::transfer_exception, 3040001, "insufficient balance" )

} } // hydra::chain
