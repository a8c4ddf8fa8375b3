#include <hydra/app/api.hpp>
#include <hydra/chain/exceptions.hpp>

namespace hydra { namespace app {

    database_api::database_api( hydra::chain::database& db ):_db(db){}

    database_api::~database_api(){}

    fc::variants database_api::get_objects( const vector<object_id_type>& ids )const
    {
       fc::variants result;
       result.reserve(ids.size());
       for( auto id : ids )
       {
          if( auto obj = _db.find_object(id) )
             result.push_back( obj->to_variant() );
          else
             result.push_back( fc::variant() );
       }
       return result;
    }

    dynamic_global_property_object database_api::get_dynamic_global_properties()const
    {
       return _db.get( dynamic_global_property_id_type() );
    }

    optional<registry_object> database_api::get_registry()const
    {
       if( auto registry = _db.find_registry() )
          return *registry;
       return optional<registry_object>();
    }

    optional<agent_object> database_api::get_agent( const public_key_type& wallet )const
    {
       if( auto agent = _db.find_agent( wallet ) )
          return *agent;
       return optional<agent_object>();
    }

    optional<agent_object> database_api::get_agent_by_address( const address& agent_address )const
    {
       if( auto agent = _db.find_agent_by_address( agent_address ) )
          return *agent;
       return optional<agent_object>();
    }

    vector<agent_object> database_api::get_children( const public_key_type& wallet )const
    {
       const auto& parent = _db.get_agent( wallet );
       vector<agent_object> result;
       for( const auto* child : _db.get_children( parent.agent_address ) )
          result.push_back( *child );
       return result;
    }

    vector<agent_object> database_api::get_ancestors( const public_key_type& wallet )const
    {
       vector<agent_object> result;
       const agent_object* current = &_db.get_agent( wallet );
       while( !current->is_root() )
       {
          current = &_db.get_agent_by_address( current->parent );
          result.push_back( *current );
       }
       return result;
    }

    vector<agent_object> database_api::list_agents( agent_id_type start, uint32_t limit )const
    {
       FC_ASSERT( limit <= HYDRA_MAX_QUERY_LIMIT, "limit may not exceed ${max}", ("max",HYDRA_MAX_QUERY_LIMIT) );
       const auto& agents_by_id = _db.get_index_type<agent_index>().indices().get<by_id>();
       vector<agent_object> result;
       for( auto itr = agents_by_id.lower_bound( object_id_type( start ) ); itr != agents_by_id.end() && result.size() < limit; ++itr )
          result.push_back( *itr );
       return result;
    }

    uint64_t database_api::get_agent_count()const
    {
       return _db.get_index_type<agent_index>().indices().size();
    }

    share_type database_api::get_balance( const public_key_type& wallet )const
    {
       return _db.get_balance( wallet );
    }

    vector<event_history_object> database_api::get_events( event_history_id_type start, uint32_t limit )const
    {
       FC_ASSERT( limit <= HYDRA_MAX_QUERY_LIMIT, "limit may not exceed ${max}", ("max",HYDRA_MAX_QUERY_LIMIT) );
       const auto& events_by_id = _db.get_index_type<event_history_index>().indices().get<by_id>();
       vector<event_history_object> result;
       for( auto itr = events_by_id.lower_bound( object_id_type( start ) ); itr != events_by_id.end() && result.size() < limit; ++itr )
          result.push_back( *itr );
       return result;
    }

} } // hydra::app
