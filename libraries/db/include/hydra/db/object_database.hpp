#pragma once
#include <hydra/db/object.hpp>
#include <hydra/db/index.hpp>
#include <hydra/db/undo_database.hpp>

#include <fc/filesystem.hpp>
#include <fc/log/logger.hpp>

#include <vector>

namespace hydra { namespace db {

   /**
    *   @class object_database
    *   @brief maintains a set of indexed objects that can be modified with multi-level rollback support
    *
    *   All objects are kept in memory.  open() restores them from a JSON snapshot in the
    *   data directory and flush() writes that snapshot back.  open() requires every
    *   registered index to be empty.
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database();

         void reset_indexes();

         void open( const fc::path& data_dir );
         /** saves the current objects to the snapshot file in the data directory */
         void flush();
         void wipe( const fc::path& data_dir );
         void close();

         undo_database::session start_undo_session() { return _undo_db.start_undo_session(); }

         template<typename T, typename F>
         const T& create( F&& constructor )
         {
            auto& idx = get_mutable_index<T>();
            const object& result = idx.create( [&]( object& o )
            {
               constructor( static_cast<T&>(o) );
            });
            _undo_db.on_create( result );
            return static_cast<const T&>( result );
         }

         ///These methods are used to retrieve indexes on the object_database. All public index accessors are const-access only.
         /// @{
         template<typename IndexType>
         const IndexType& get_index_type()const {
            static_assert( std::is_base_of<index,IndexType>::value, "Type must be an index type" );
            return static_cast<const IndexType&>( get_index( IndexType::object_type::space_id, IndexType::object_type::type_id ) );
         }
         template<typename T>
         const index&  get_index()const { return get_index(T::space_id,T::type_id); }
         const index&  get_index(uint8_t space_id, uint8_t type_id)const;
         /// @}

         const object& get_object( object_id_type id )const;
         const object* find_object( object_id_type id )const;

         /// These methods are mutators of the object_database. You must use these methods to make changes to the object_database,
         /// in order to maintain proper undo history.
         ///@{
         const object& insert( object&& obj ) { return get_mutable_index(obj.id).insert( std::move(obj) ); }
         void          remove( const object& obj );
         void          modify( const object& obj, const std::function<void(object&)>& m );

         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& m ) {
            modify( static_cast<const object&>(obj),
                    std::function<void(object&)>( [&]( object& o ){ m( static_cast<T&>(o) ); } ) );
         }
         ///@}

         template<typename T>
         const T* find( object_id_type id )const
         {
            const object* obj = find_object( id );
            FC_ASSERT( !obj || nullptr != dynamic_cast<const T*>(obj) );
            return static_cast<const T*>(obj);
         }

         template<uint8_t SpaceID, uint8_t TypeID, typename T>
         const T* find( object_id<SpaceID,TypeID,T> id )const { return find<T>(id); }

         template<typename T>
         const T& get( object_id_type id )const
         {
            const object& obj = get_object( id );
            FC_ASSERT( nullptr != dynamic_cast<const T*>(&obj) );
            return static_cast<const T&>(obj);
         }

         template<uint8_t SpaceID, uint8_t TypeID, typename T>
         const T& get( object_id<SpaceID,TypeID,T> id )const { return get<T>(id); }

         template<typename IndexType>
         IndexType* add_index()
         {
            typedef typename IndexType::object_type ObjectType;
            unique_ptr<index> idx( new IndexType() );
            auto result = static_cast<IndexType*>( idx.get() );
            _index[ObjectType::space_id][ObjectType::type_id] = std::move(idx);
            return result;
         }

      protected:
         template<typename T>
         index& get_mutable_index() { return get_mutable_index(T::space_id,T::type_id); }
         index& get_mutable_index( object_id_type id ) { return get_mutable_index(id.space(),id.type()); }
         index& get_mutable_index( uint8_t space_id, uint8_t type_id );

         undo_database                                   _undo_db;

      private:
         friend class undo_database;

         fc::path snapshot_file()const { return _data_dir / "objects.json"; }

         fc::path                                        _data_dir;
         std::vector< std::vector< unique_ptr<index> > > _index;
   };

} } // hydra::db
