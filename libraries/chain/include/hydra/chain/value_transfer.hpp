#pragma once
#include <hydra/chain/types.hpp>

namespace hydra { namespace chain {
   class database;

   /**
    *  @brief moves native value between wallets on behalf of revenue_distribute_operation
    *
    *  Implementations must either move the full amount or throw without
    *  changing anything.  Any changes made through the database are covered
    *  by the undo session of the transaction.
    */
   class value_transfer
   {
      public:
         virtual ~value_transfer(){}
         virtual void transfer( database& db, const public_key_type& from, const public_key_type& to, share_type amount ) = 0;
   };

   /** moves value between wallet_balance_object records */
   class native_balance_transfer : public value_transfer
   {
      public:
         virtual void transfer( database& db, const public_key_type& from, const public_key_type& to, share_type amount ) override;
   };

} } // hydra::chain
