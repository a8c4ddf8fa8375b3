#pragma once
#include <hydra/chain/types.hpp>

namespace hydra { namespace chain {

   /**
    *  @brief a deterministic 160 bit identifier for ledger records
    *
    *  Agent records are addressed by hashing HYDRA_AGENT_SEED with the owning
    *  wallet key; the registry is addressed by hashing HYDRA_REGISTRY_SEED.  The
    *  all-zero address is the sentinel used as the parent of a root agent.
    */
   struct address
   {
      address(){}
      explicit address( const std::string& base58str );

      static address for_agent( const public_key_type& wallet );
      static address for_registry();

      /** @return true if base58str is a well formed address with a valid checksum */
      static bool is_valid( const std::string& base58str, const std::string& prefix = HYDRA_ADDRESS_PREFIX );

      bool is_null()const { return addr == fc::ripemd160(); }

      explicit operator std::string()const;

      fc::ripemd160 addr;
   };

   inline bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
   inline bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
   inline bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

} } // hydra::chain

namespace fc
{
   void to_variant( const hydra::chain::address& var,  fc::variant& vo );
   void from_variant( const fc::variant& var,  hydra::chain::address& vo );
}

FC_REFLECT( hydra::chain::address, (addr) )
