#pragma once
#include <hydra/chain/operations.hpp>

namespace hydra { namespace chain {
   class database;

   /**
    *  Place holder for state tracked while processing a
    *  transaction.  This class tracks which keys have signed
    *  the transaction and the results of the operations
    *  applied so far.
    */
   class transaction_evaluation_state
   {
      public:
         transaction_evaluation_state( database* db = nullptr, bool skip_authority_check = false )
         :_db(db),_skip_authority_check(skip_authority_check){}

         /** @return true if key signed the transaction or signature checks are disabled */
         bool check_authority( const public_key_type& key )const;

         database& db()const { FC_ASSERT( _db ); return *_db; }

         /** recovered from the signatures on the transaction */
         flat_set<public_key_type>  signed_by;

         vector<operation_result>   operation_results;

         database*                  _db = nullptr;
         bool                       _skip_authority_check = false;
   };
} } // namespace hydra::chain
