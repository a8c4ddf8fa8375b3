#include <hydra/app/application.hpp>

#include <boost/filesystem/path.hpp>

#include <fc/io/json.hpp>
#include <fc/filesystem.hpp>
#include <fc/log/logger.hpp>

namespace hydra { namespace app {
using chain::database;
using chain::event_history_object;
using chain::genesis_allocation;

namespace detail {

   class application_impl
   {
      public:
      application_impl()
         : _chain_db( std::make_shared<database>() )
      {
         _event_connection = _chain_db->applied_event.connect( [this]( const event_history_object& e ) {
            on_applied_event( e );
         });
      }

      void initialize( const fc::path& data_dir, const bpo::variables_map& options )
      { try {
         _data_dir = data_dir;
         if( options.count("genesis-json") )
         {
            fc::path genesis_file = options.at("genesis-json").as<boost::filesystem::path>();
            FC_ASSERT( fc::exists( genesis_file ), "genesis file does not exist", ("file",genesis_file) );
            _initial_allocation = fc::json::from_file( genesis_file ).as<genesis_allocation>();
            ilog( "loaded ${n} genesis allocations from ${f}", ("n",_initial_allocation.size())("f",genesis_file) );
         }
      } FC_CAPTURE_AND_RETHROW( (data_dir) ) }

      void startup()
      { try {
         _chain_db->open( _data_dir / "object_database", _initial_allocation );
         _started = true;
      } FC_CAPTURE_AND_RETHROW( (_data_dir) ) }

      void shutdown()
      {
         if( !_started ) return;
         _chain_db->close();
         _started = false;
      }

      void on_applied_event( const event_history_object& e )
      {
         dlog( "event ${id}: ${e}", ("id",e.id)("e",e.event) );
      }

      fc::path                                _data_dir;
      genesis_allocation                      _initial_allocation;
      std::shared_ptr<database>               _chain_db;
      boost::signals2::scoped_connection      _event_connection;
      bool                                    _started = false;
   };

}

application::application()
   : my( std::make_shared<detail::application_impl>() )
{
}

application::~application()
{
}

void application::set_program_options( bpo::options_description& command_line_options,
                                       bpo::options_description& configuration_file_options )const
{
   configuration_file_options.add_options()
         ("genesis-json", bpo::value<boost::filesystem::path>(), "File to read the initial wallet balances from, used only when no ledger exists yet")
         ;
   command_line_options.add( configuration_file_options );
}

void application::initialize( const fc::path& data_dir, const bpo::variables_map& options )
{
   my->initialize( data_dir, options );
}

void application::startup()
{
   my->startup();
}

void application::shutdown()
{
   my->shutdown();
}

std::shared_ptr<chain::database> application::chain_database()const
{
   return my->_chain_db;
}

} } // hydra::app
