#pragma once

#include <hydra/chain/database.hpp>

#include <boost/program_options.hpp>

namespace hydra { namespace app {
   namespace detail { class application_impl; }
   namespace bpo = boost::program_options;
   using std::string;

   /**
    *  Owns the ledger database of a node: reads the options that configure it,
    *  opens it from the data directory on startup and saves it on shutdown.
    */
   class application
   {
      public:
         application();
         ~application();

         void set_program_options( bpo::options_description& command_line_options,
                                   bpo::options_description& configuration_file_options )const;
         void initialize( const fc::path& data_dir, const bpo::variables_map& options );
         void startup();
         void shutdown();

         std::shared_ptr<chain::database> chain_database()const;

      private:
         std::shared_ptr<detail::application_impl> my;
   };

} }
