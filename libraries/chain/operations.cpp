#include <hydra/chain/operations.hpp>
#include <hydra/chain/exceptions.hpp>

namespace hydra { namespace chain {

void validate_agent_name( const string& name )
{
   HYDRA_ASSERT( name.size() <= HYDRA_MAX_NAME_LENGTH, name_too_long_exception,
                 "Agent name is ${len} bytes, at most ${max} are allowed",
                 ("len",name.size())("max",HYDRA_MAX_NAME_LENGTH) );
}

void validate_agent_specialization( const string& specialization )
{
   HYDRA_ASSERT( specialization.size() <= HYDRA_MAX_SPECIALIZATION_LENGTH, spec_too_long_exception,
                 "Agent specialization is ${len} bytes, at most ${max} are allowed",
                 ("len",specialization.size())("max",HYDRA_MAX_SPECIALIZATION_LENGTH) );
}

void registry_initialize_operation::get_required_auth( flat_set<public_key_type>& auth_set )const
{
   auth_set.insert(authority);
}

void registry_initialize_operation::validate()const
{
   FC_ASSERT( authority != public_key_type(), "registry authority must be a valid key" );
}

void agent_register_root_operation::get_required_auth( flat_set<public_key_type>& auth_set )const
{
   auth_set.insert(authority);
}

void agent_register_root_operation::validate()const
{
   validate_agent_name( name );
   validate_agent_specialization( specialization );
}

void agent_spawn_operation::get_required_auth( flat_set<public_key_type>& auth_set )const
{
   auth_set.insert(parent_wallet);
}

void agent_spawn_operation::validate()const
{
   validate_agent_name( name );
   validate_agent_specialization( specialization );
   HYDRA_ASSERT( revenue_share_bps <= HYDRA_MAX_REVENUE_SHARE_BPS, invalid_revenue_share_exception,
                 "Revenue share of ${bps} basis points exceeds ${max}",
                 ("bps",revenue_share_bps)("max",HYDRA_MAX_REVENUE_SHARE_BPS) );
}

void earning_record_operation::get_required_auth( flat_set<public_key_type>& auth_set )const
{
   auth_set.insert(wallet);
}

void earning_record_operation::validate()const
{
   HYDRA_ASSERT( amount.value > 0, zero_amount_exception, "Earning amount must be positive", ("amount",amount) );
}

void revenue_distribute_operation::get_required_auth( flat_set<public_key_type>& auth_set )const
{
   auth_set.insert(child_wallet);
}

void revenue_distribute_operation::validate()const
{
   HYDRA_ASSERT( amount.value > 0, zero_amount_exception, "Distribution amount must be positive", ("amount",amount) );
}

void agent_deactivate_operation::get_required_auth( flat_set<public_key_type>& auth_set )const
{
   auth_set.insert(authority);
}

void agent_deactivate_operation::validate()const
{
}

} } // hydra::chain
