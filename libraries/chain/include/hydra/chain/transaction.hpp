#pragma once
#include <hydra/chain/types.hpp>
#include <hydra/chain/operations.hpp>

namespace hydra { namespace chain {

   /**
    *  All transactions are sets of operations that must be
    *  applied atomically.  If any operation fails, none of the
    *  changes made by earlier operations in the same transaction
    *  remain visible.
    */
   struct transaction
   {
      vector<operation>  operations;

      digest_type digest()const;
      void validate()const;

      /** the set of keys that must have signed for the transaction to be accepted */
      flat_set<public_key_type> get_required_signatures()const;
   };

   struct signed_transaction : public transaction
   {
      signed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      void sign( const private_key_type& key );

      /** removes all operations and signatures */
      void clear() { operations.clear(); signatures.clear(); }

      /** @return the keys recovered from signatures */
      flat_set<public_key_type> get_signature_keys()const;

      vector<signature_type> signatures;
   };

   /**
    *  The result of pushing a transaction: the transaction itself plus one
    *  operation_result for each operation, in the same order.
    */
   struct processed_transaction : public signed_transaction
   {
      processed_transaction( const signed_transaction& trx = signed_transaction() )
         : signed_transaction(trx){}

      vector<operation_result> operation_results;
   };

} }

FC_REFLECT( hydra::chain::transaction, (operations) )
FC_REFLECT_DERIVED( hydra::chain::signed_transaction, (hydra::chain::transaction), (signatures) )
FC_REFLECT_DERIVED( hydra::chain::processed_transaction, (hydra::chain::signed_transaction), (operation_results) )
