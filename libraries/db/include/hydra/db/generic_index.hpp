#pragma once
#include <hydra/db/index.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace hydra { namespace db {

   using boost::multi_index_container;
   using namespace boost::multi_index;

   struct by_id;

   /**
    *  Stores objects in a boost::multi_index_container.  The first index of
    *  MultiIndexType must be an ordered_unique index tagged by_id on object::id.
    */
   template<typename ObjectType, typename MultiIndexType>
   class generic_index : public index
   {
      public:
         typedef MultiIndexType index_type;
         typedef ObjectType     object_type;

         virtual const object& create( const std::function<void(object&)>& constructor )override
         {
            ObjectType item;
            item.id = get_next_id();
            constructor( item );
            auto insert_result = _indices.insert( std::move(item) );
            FC_ASSERT( insert_result.second, "Could not create object, most likely a uniqueness constraint was violated" );
            use_next_id();
            return *insert_result.first;
         }

         virtual const object& insert( object&& obj )override
         {
            FC_ASSERT( nullptr != dynamic_cast<ObjectType*>(&obj) );
            auto insert_result = _indices.insert( std::move( static_cast<ObjectType&>(obj) ) );
            FC_ASSERT( insert_result.second, "Could not insert object, most likely a uniqueness constraint was violated" );
            return *insert_result.first;
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& m )override
         {
            const auto& current = static_cast<const ObjectType&>( obj );
            ObjectType updated( current );
            m( updated );
            auto ok = _indices.replace( _indices.iterator_to( current ), std::move(updated) );
            FC_ASSERT( ok, "Could not modify object, most likely a uniqueness constraint was violated" );
         }

         virtual void remove( const object& obj )override
         {
            _indices.erase( _indices.iterator_to( static_cast<const ObjectType&>(obj) ) );
         }

         virtual const object* find( object_id_type id )const override
         {
            auto itr = _indices.find( id );
            if( itr == _indices.end() ) return nullptr;
            return &*itr;
         }

         virtual size_t size()const override { return _indices.size(); }

         virtual void inspect_all_objects( std::function<void(const object&)> inspector )const override
         {
            try {
               for( const auto& ptr : _indices )
                  inspector( ptr );
            } FC_CAPTURE_AND_RETHROW()
         }

         const index_type& indices()const { return _indices; }

      private:
         index_type _indices;
   };

} } // hydra::db
