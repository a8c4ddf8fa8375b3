#include <hydra/chain/address.hpp>

#include <fc/crypto/base58.hpp>

#include <cstring>

namespace hydra { namespace chain {

   address::address( const std::string& base58str )
   {
      FC_ASSERT( is_valid( base58str ), "invalid address", ("address",base58str) );
      std::vector<char> v = fc::from_base58( base58str.substr( std::strlen( HYDRA_ADDRESS_PREFIX ) ) );
      std::memcpy( (char*)addr._hash, v.data(), std::min<size_t>( v.size()-4, sizeof( addr ) ) );
   }

   address address::for_agent( const public_key_type& wallet )
   {
      fc::sha256::encoder enc;
      enc.write( HYDRA_AGENT_SEED, std::strlen( HYDRA_AGENT_SEED ) );
      enc.write( wallet.key_data.data, wallet.key_data.size() );
      address result;
      result.addr = fc::ripemd160::hash( enc.result() );
      return result;
   }

   address address::for_registry()
   {
      address result;
      result.addr = fc::ripemd160::hash( fc::sha256::hash( HYDRA_REGISTRY_SEED, std::strlen( HYDRA_REGISTRY_SEED ) ) );
      return result;
   }

   /**
    *  Validates checksum and length of base58 address
    *
    *  @return true if successful, throws an exception with reason if invalid.
    */
   bool address::is_valid( const std::string& base58str, const std::string& prefix )
   {
      const size_t prefix_len = prefix.size();
      if( base58str.size() <= prefix_len )
         return false;
      if( base58str.substr( 0, prefix_len ) != prefix )
         return false;
      std::vector<char> v;
      try
      {
         v = fc::from_base58( base58str.substr( prefix_len ) );
      }
      catch( const fc::parse_error_exception& )
      {
         return false;
      }

      if( v.size() != sizeof( fc::ripemd160 ) + 4 )
         return false;

      const fc::ripemd160 checksum = fc::ripemd160::hash( v.data(), v.size() - 4 );
      if( std::memcmp( v.data() + 20, (char*)checksum._hash, 4 ) != 0 )
         return false;

      return true;
   }

   address::operator std::string()const
   {
      fc::array<char,24> bin_addr;
      std::memcpy( (char*)&bin_addr, (char*)&addr, sizeof( addr ) );
      auto checksum = fc::ripemd160::hash( (char*)&addr, sizeof( addr ) );
      std::memcpy( ((char*)&bin_addr)+20, (char*)&checksum._hash[0], 4 );
      return HYDRA_ADDRESS_PREFIX + fc::to_base58( bin_addr.data, sizeof( bin_addr ) );
   }

} } // namespace hydra::chain

namespace fc
{
   void to_variant( const hydra::chain::address& var,  fc::variant& vo )
   {
      vo = std::string(var);
   }
   void from_variant( const fc::variant& var,  hydra::chain::address& vo )
   {
      vo = hydra::chain::address( var.as_string() );
   }
}
