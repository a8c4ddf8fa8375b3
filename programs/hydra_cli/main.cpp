#include <hydra/app/application.hpp>
#include <hydra/app/api.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/io/json.hpp>
#include <fc/filesystem.hpp>

#include <boost/filesystem.hpp>

#include <iostream>
#include <fstream>

using namespace hydra;
namespace bpo = boost::program_options;

static chain::private_key_type key_for_seed( const std::string& seed )
{
   return chain::private_key_type::regenerate( fc::sha256::hash( seed ) );
}

static void print( const fc::variant& v )
{
   std::cout << fc::json::to_pretty_string( v ) << "\n";
}

static void write_default_config( const fc::path& data_dir, const bpo::options_description& cfg_options )
{
   ilog("Writing new config file at ${path}", ("path", data_dir/"config.ini"));
   if( !fc::exists(data_dir) )
      fc::create_directories(data_dir);

   std::ofstream out_cfg((data_dir / "config.ini").preferred_string());
   for( const boost::shared_ptr<bpo::option_description> od : cfg_options.options() )
   {
      if( !od->description().empty() )
         out_cfg << "# " << od->description() << "\n";
      boost::any store;
      if( !od->semantic()->apply_default(store) )
         out_cfg << "# " << od->long_name() << " = \n";
      else {
         auto example = od->format_parameter();
         if( example.empty() )
            // This is a boolean switch
            out_cfg << od->long_name() << " = " << "false\n";
         else {
            // The string is formatted "arg (=<interesting part>)"
            example.erase(0, 6);
            example.erase(example.length()-1);
            out_cfg << od->long_name() << " = " << example << "\n";
         }
      }
      out_cfg << "\n";
   }
}

int main(int argc, char** argv) {
   try {
      app::application node;
      bpo::options_description app_options("Hydra Agent Ledger");
      bpo::options_description cfg_options("Hydra Agent Ledger");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("data-dir,d", bpo::value<boost::filesystem::path>()->default_value("hydra_data_dir"), "Directory containing the ledger, configuration file, etc.")
            ("key-for-seed", bpo::value<std::string>(), "Print the public key derived from a seed and exit.")
            ("push", bpo::value<boost::filesystem::path>(), "Apply a transaction made of the JSON array of operations in this file. "
                                                            "Each operation is written as [which, {fields}].")
            ("sign-with", bpo::value<std::vector<std::string>>()->composing(), "Seed of a key that signs the pushed transaction, may be repeated.")
            ("dry-run", bpo::bool_switch()->default_value(false), "Evaluate the pushed transaction without applying it.")
            ("get-registry", "Print the registry.")
            ("get-agent", bpo::value<std::string>(), "Print the agent owned by a wallet key.")
            ("get-children", bpo::value<std::string>(), "Print the children of the agent owned by a wallet key.")
            ("get-ancestors", bpo::value<std::string>(), "Print the parents of the agent owned by a wallet key up to the root.")
            ("list-agents", bpo::value<uint32_t>()->implicit_value(HYDRA_DEFAULT_QUERY_LIMIT), "Print agents in creation order.")
            ("get-balance", bpo::value<std::string>(), "Print the native balance of a wallet key.")
            ("get-events", bpo::value<uint32_t>()->implicit_value(HYDRA_DEFAULT_QUERY_LIMIT), "Print events in the order they were emitted.")
            ;

      bpo::variables_map options;

      {
         bpo::options_description cli, cfg;
         node.set_program_options(cli, cfg);
         app_options.add(cli);
         cfg_options.add(cfg);
         bpo::store(bpo::parse_command_line(argc, argv, app_options), options);
      }

      if( options.count("help") )
      {
         std::cout << app_options << "\n";
         return 0;
      }

      if( options.count("key-for-seed") )
      {
         auto key = key_for_seed( options["key-for-seed"].as<std::string>() );
         std::cout << std::string( chain::public_key_type( key.get_public_key() ) ) << "\n";
         return 0;
      }

      fc::path data_dir;
      if( options.count("data-dir") )
      {
         data_dir = options["data-dir"].as<boost::filesystem::path>();
         if( data_dir.is_relative() )
            data_dir = fc::current_path() / data_dir;
      }

      if( fc::exists(data_dir / "config.ini") )
         bpo::store(bpo::parse_config_file<char>((data_dir / "config.ini").preferred_string().c_str(), cfg_options), options);
      else
         write_default_config( data_dir, cfg_options );

      bpo::notify(options);
      node.initialize(data_dir, options);
      node.startup();

      auto db = node.chain_database();
      app::database_api api( *db );
      int result = 0;

      try {
         if( options.count("push") )
         {
            fc::path trx_file = options["push"].as<boost::filesystem::path>();
            chain::signed_transaction trx;
            trx.operations = fc::json::from_file( trx_file ).as<std::vector<chain::operation>>();
            if( options.count("sign-with") )
               for( const auto& seed : options["sign-with"].as<std::vector<std::string>>() )
                  trx.sign( key_for_seed( seed ) );

            if( options["dry-run"].as<bool>() )
               print( fc::variant( db->validate_transaction( trx ) ) );
            else
               print( fc::variant( db->push_transaction( trx ) ) );
         }

         if( options.count("get-registry") )
            print( fc::variant( api.get_registry() ) );
         if( options.count("get-agent") )
            print( fc::variant( api.get_agent( chain::public_key_type( options["get-agent"].as<std::string>() ) ) ) );
         if( options.count("get-children") )
            print( fc::variant( api.get_children( chain::public_key_type( options["get-children"].as<std::string>() ) ) ) );
         if( options.count("get-ancestors") )
            print( fc::variant( api.get_ancestors( chain::public_key_type( options["get-ancestors"].as<std::string>() ) ) ) );
         if( options.count("list-agents") )
            print( fc::variant( api.list_agents( chain::agent_id_type(), options["list-agents"].as<uint32_t>() ) ) );
         if( options.count("get-balance") )
            print( fc::variant( api.get_balance( chain::public_key_type( options["get-balance"].as<std::string>() ) ) ) );
         if( options.count("get-events") )
            print( fc::variant( api.get_events( chain::event_history_id_type(), options["get-events"].as<uint32_t>() ) ) );
      } catch( const fc::exception& e ) {
         elog("Command failed:\n${e}", ("e", e.to_detail_string()));
         std::cerr << e.to_string() << "\n";
         result = 1;
      }

      node.shutdown();
      return result;
   } catch( const fc::exception& e ) {
      elog("Exiting with error:\n${e}", ("e", e.to_detail_string()));
      return 1;
   }
}
