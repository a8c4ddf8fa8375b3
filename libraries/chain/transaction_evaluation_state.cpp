#include <hydra/chain/transaction_evaluation_state.hpp>

namespace hydra { namespace chain {

   bool transaction_evaluation_state::check_authority( const public_key_type& key )const
   {
      if( _skip_authority_check )
         return true;
      return signed_by.find( key ) != signed_by.end();
   }

} } // namespace hydra::chain
