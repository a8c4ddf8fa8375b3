#pragma once
#include <hydra/db/index.hpp>

#include <vector>

namespace hydra { namespace db {

   /**
    *  Stores objects in a vector indexed by instance.  Suitable for
    *  singletons and small tables that are only looked up by id.
    */
   template<typename T>
   class simple_index : public index
   {
      public:
         typedef T object_type;

         virtual const object&  create( const std::function<void(object&)>& constructor )override
         {
             auto id = get_next_id();
             auto instance = id.instance();
             if( instance >= _objects.size() ) _objects.resize( instance + 1 );
             _objects[instance].reset(new T);
             _objects[instance]->id = id;
             constructor( *_objects[instance] );
             use_next_id();
             return *_objects[instance];
         }

         virtual const object& insert( object&& obj )override
         {
            auto instance = obj.id.instance();
            FC_ASSERT( obj.id.space() == T::space_id && obj.id.type() == T::type_id );
            if( instance >= _objects.size() ) _objects.resize( instance + 1 );
            FC_ASSERT( !_objects[instance], "Could not insert object, id is in use", ("id",obj.id) );
            _objects[instance].reset( new T( std::move( static_cast<T&>(obj) ) ) );
            return *_objects[instance];
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& m )override
         {
            FC_ASSERT( obj.id.instance() < _objects.size() && _objects[obj.id.instance()] );
            T updated( static_cast<const T&>(obj) );
            m( updated );
            *_objects[obj.id.instance()] = std::move( updated );
         }

         virtual void remove( const object& obj )override
         {
            const auto instance = obj.id.instance();
            FC_ASSERT( instance < _objects.size() );
            if( instance == _objects.size() - 1 )
               _objects.pop_back();
            else
               _objects[instance].reset();
         }

         virtual const object* find( object_id_type id )const override
         {
            FC_ASSERT( id.space() == T::space_id && id.type() == T::type_id );
            const auto instance = id.instance();
            if( instance >= _objects.size() ) return nullptr;
            return _objects[instance].get();
         }

         virtual size_t size()const override
         {
            size_t count = 0;
            for( const auto& ptr : _objects )
               if( ptr ) ++count;
            return count;
         }

         virtual void inspect_all_objects( std::function<void(const object&)> inspector )const override
         {
            try {
               for( const auto& ptr : _objects )
                  if( ptr ) inspector( *ptr );
            } FC_CAPTURE_AND_RETHROW()
         }

      private:
         std::vector< unique_ptr<T> > _objects;
   };

} } // hydra::db
