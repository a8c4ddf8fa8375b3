#include <hydra/chain/value_transfer.hpp>
#include <hydra/chain/database.hpp>
#include <hydra/chain/exceptions.hpp>

namespace hydra { namespace chain {

void native_balance_transfer::transfer( database& db, const public_key_type& from, const public_key_type& to, share_type amount )
{ try {
   auto available = db.get_balance( from );
   HYDRA_ASSERT( available >= amount, insufficient_balance_exception,
                 "Insufficient balance: ${balance}, unable to transfer ${amount}",
                 ("balance",available)("amount",amount) );
   db.withdraw( from, amount );
   db.deposit( to, amount );
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

} } // hydra::chain
