#include <hydra/chain/transaction.hpp>
#include <fc/io/raw.hpp>

namespace hydra { namespace chain {

digest_type transaction::digest()const
{
   digest_type::encoder enc;
   fc::raw::pack( enc, *this );
   return enc.result();
}

void transaction::validate() const
{
   FC_ASSERT( operations.size() > 0, "A transaction must have at least one operation" );
   for( const auto& op : operations )
      op.visit(operation_validator());
}

flat_set<public_key_type> transaction::get_required_signatures()const
{
   flat_set<public_key_type> result;
   for( const auto& op : operations )
      op.visit( operation_get_required_auths( result ) );
   return result;
}

void signed_transaction::sign( const private_key_type& key )
{
   signatures.push_back( key.sign_compact( digest() ) );
}

flat_set<public_key_type> signed_transaction::get_signature_keys()const
{ try {
   auto d = digest();
   flat_set<public_key_type> result;
   for( const auto& sig : signatures )
      result.insert( public_key_type( fc::ecc::public_key( sig, d ) ) );
   return result;
} FC_CAPTURE_AND_RETHROW( (signatures) ) }

} } // hydra::chain
