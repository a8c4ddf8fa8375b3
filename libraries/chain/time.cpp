#include <hydra/chain/time.hpp>

#include <fc/log/logger.hpp>

namespace hydra { namespace chain {

static bool              simulated_time_enabled = false;
static fc::time_point    simulated_time;

fc::time_point now()
{
   if( simulated_time_enabled )
      return simulated_time;
   return fc::time_point::now();
}

void start_simulated_time( const fc::time_point sim_time )
{
   ilog( "starting simulated time at ${t}", ("t",sim_time) );
   simulated_time_enabled = true;
   simulated_time = sim_time;
}

void advance_simulated_time_to( const fc::time_point sim_time )
{
   FC_ASSERT( simulated_time_enabled, "simulated time is not running" );
   FC_ASSERT( sim_time >= simulated_time, "simulated time may not move backwards",
              ("current",simulated_time)("requested",sim_time) );
   simulated_time = sim_time;
}

void stop_simulated_time()
{
   simulated_time_enabled = false;
}

} } // hydra::chain
