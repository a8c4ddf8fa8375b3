#pragma once
#include <hydra/db/object.hpp>

#include <functional>

namespace hydra { namespace db {

   class index
   {
      public:
         virtual ~index(){}

         virtual uint8_t object_space_id()const = 0;
         virtual uint8_t object_type_id()const = 0;

         /**
          * The id that will be assigned to the next object created in this index.
          * Ids are never reused except when an undo session rolls back the
          * creation of an object.
          */
         virtual object_id_type get_next_id()const = 0;
         virtual void           use_next_id() = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /**
          * Builds a new object and assigns it the next available ID and then
          * initializes it with constructor and lastly inserts it into the index.
          */
         virtual const object&  create( const std::function<void(object&)>& constructor ) = 0;

         /**
          * Inserts an object that already carries its id, used when undoing a
          * removal and when loading a snapshot.
          */
         virtual const object&  insert( object&& obj ) = 0;

         /** deserializes an object from its variant form and inserts it */
         virtual const object&  load( const fc::variant& obj ) = 0;

         /**
          * The modifier works on a copy of the object; the index is only
          * updated if the modifier returns normally.
          */
         virtual void           modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void           remove( const object& obj ) = 0;

         virtual const object*  find( object_id_type id )const = 0;
         const object&          get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object", ("id",id) );
            return *maybe_found;
         }

         virtual size_t         size()const = 0;
         virtual void           inspect_all_objects( std::function<void(const object&)> inspector )const = 0;
   };

   /**
    *  Adds the space/type identity and the id sequence to a storage
    *  index such as simple_index or generic_index.
    */
   template<typename DerivedIndex>
   class primary_index : public DerivedIndex
   {
      public:
         typedef typename DerivedIndex::object_type object_type;

         primary_index()
         :_next_id( object_type::space_id, object_type::type_id, 0 ){}

         virtual uint8_t object_space_id()const override
         { return object_type::space_id; }

         virtual uint8_t object_type_id()const override
         { return object_type::type_id; }

         virtual object_id_type get_next_id()const override              { return _next_id; }
         virtual void           use_next_id()override                    { ++_next_id.number; }
         virtual void           set_next_id( object_id_type id )override { _next_id = id; }

         virtual const object&  load( const fc::variant& obj )override
         {
            object_type result;
            fc::from_variant( obj, result );
            FC_ASSERT( result.id.space() == object_type::space_id && result.id.type() == object_type::type_id,
                       "object does not belong to this index", ("id",result.id) );
            return DerivedIndex::insert( std::move(result) );
         }

      private:
         object_id_type _next_id;
   };

} } // hydra::db
