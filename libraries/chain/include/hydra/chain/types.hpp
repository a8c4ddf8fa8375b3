#pragma once
#include <fc/container/flat_fwd.hpp>
#include <fc/container/flat.hpp>
#include <fc/io/varint.hpp>
#include <fc/io/raw_fwd.hpp>
#include <fc/crypto/elliptic.hpp>
#include <fc/crypto/ripemd160.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>

#include <memory>
#include <vector>
#include <map>

#include <hydra/chain/config.hpp>
#include <hydra/db/object_id.hpp>

namespace hydra { namespace chain {
   using namespace hydra::db;

   using                               std::map;
   using                               std::vector;
   using                               std::string;
   using                               std::shared_ptr;
   using                               std::unique_ptr;
   using                               std::pair;
   using                               std::make_pair;

   using                               fc::variant_object;
   using                               fc::variant;
   using                               fc::optional;
   using                               fc::time_point_sec;
   using                               fc::time_point;
   using                               fc::safe;
   using                               fc::flat_map;
   using                               fc::flat_set;
   using                               fc::static_variant;

   typedef fc::ecc::private_key        private_key_type;
   typedef fc::sha256                  digest_type;
   typedef fc::ecc::compact_signature  signature_type;

   /** every counter and amount in the ledger; arithmetic on it throws fc::overflow_exception instead of wrapping */
   typedef safe<uint64_t>              share_type;

   enum object_type
   {
      null_object_type,
      base_object_type,
      registry_object_type,
      agent_object_type,
      event_history_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

   enum impl_object_type
   {
      impl_dynamic_global_property_object_type,
      impl_wallet_balance_object_type
   };

   class registry_object;
   class agent_object;
   class event_history_object;
   class dynamic_global_property_object;
   class wallet_balance_object;

   typedef object_id< protocol_ids, registry_object_type,      registry_object>      registry_id_type;
   typedef object_id< protocol_ids, agent_object_type,         agent_object>         agent_id_type;
   typedef object_id< protocol_ids, event_history_object_type, event_history_object> event_history_id_type;

   typedef object_id< implementation_ids, impl_dynamic_global_property_object_type, dynamic_global_property_object> dynamic_global_property_id_type;
   typedef object_id< implementation_ids, impl_wallet_balance_object_type,          wallet_balance_object>          wallet_balance_id_type;

   /**
    *  A compressed secp256k1 public key.  Wallets are identified by their key;
    *  the text form is HYDRA_ADDRESS_PREFIX followed by base58 of the key and a
    *  ripemd160 checksum.
    */
   struct public_key_type
   {
       struct binary_key
       {
          binary_key():check(0){}
          uint32_t                 check;
          fc::ecc::public_key_data data;
       };

       fc::ecc::public_key_data key_data;

       public_key_type();
       public_key_type( const fc::ecc::public_key_data& data );
       public_key_type( const fc::ecc::public_key& pubkey );
       explicit public_key_type( const std::string& base58str );
       operator fc::ecc::public_key_data() const;
       operator fc::ecc::public_key() const;
       explicit operator std::string() const;
       friend bool operator == ( const public_key_type& p1, const fc::ecc::public_key& p2);
       friend bool operator == ( const public_key_type& p1, const public_key_type& p2);
       friend bool operator != ( const public_key_type& p1, const public_key_type& p2);
       friend bool operator <  ( const public_key_type& p1, const public_key_type& p2);
   };

} }  // hydra::chain

namespace fc
{
    void to_variant( const hydra::chain::public_key_type& var,  fc::variant& vo );
    void from_variant( const fc::variant& var,  hydra::chain::public_key_type& vo );
}

FC_REFLECT( hydra::chain::public_key_type, (key_data) )
FC_REFLECT( hydra::chain::public_key_type::binary_key, (data)(check) )

FC_REFLECT_ENUM( hydra::chain::object_type,
                 (null_object_type)
                 (base_object_type)
                 (registry_object_type)
                 (agent_object_type)
                 (event_history_object_type)
                 (OBJECT_TYPE_COUNT)
               )
FC_REFLECT_ENUM( hydra::chain::impl_object_type,
                 (impl_dynamic_global_property_object_type)
                 (impl_wallet_balance_object_type)
               )
