#pragma once
#include <hydra/chain/types.hpp>
#include <hydra/db/object.hpp>
#include <hydra/db/generic_index.hpp>

namespace hydra { namespace chain {
   using hydra::db::abstract_object;
   using hydra::db::generic_index;
   using hydra::db::by_id;

   /**
    *  @brief the native value held by a wallet
    *
    *  Wallets without an object have a balance of zero.
    */
   class wallet_balance_object : public abstract_object<wallet_balance_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_wallet_balance_object_type;

         public_key_type   owner;
         share_type        balance;
   };

   struct by_owner;
   typedef multi_index_container<
      wallet_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>, member< wallet_balance_object, public_key_type, &wallet_balance_object::owner > >
      >
   > wallet_balance_multi_index_type;

   typedef generic_index<wallet_balance_object, wallet_balance_multi_index_type> wallet_balance_index;

}}

FC_REFLECT_DERIVED( hydra::chain::wallet_balance_object,
                    (hydra::db::object),
                    (owner)(balance) )
