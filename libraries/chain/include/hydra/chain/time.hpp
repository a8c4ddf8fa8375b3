#pragma once
#include <fc/time.hpp>

namespace hydra { namespace chain {

   /** wall clock time, or the simulated time while a simulation is running */
   fc::time_point now();

   void start_simulated_time( const fc::time_point sim_time );
   void advance_simulated_time_to( const fc::time_point sim_time );
   void stop_simulated_time();

} } // hydra::chain
