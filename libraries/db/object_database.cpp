#include <hydra/db/object_database.hpp>

#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>

namespace hydra { namespace db {

object_database::object_database()
:_undo_db(*this)
{
   _index.resize(255);
   _undo_db.enable();
}

object_database::~object_database(){}

void object_database::reset_indexes()
{
   _index.clear();
   _index.resize(255);
}

void object_database::close()
{
   flush();
}

const object* object_database::find_object( object_id_type id )const
{
   return get_index(id.space(),id.type()).find( id );
}

const object& object_database::get_object( object_id_type id )const
{
   return get_index(id.space(),id.type()).get( id );
}

const index& object_database::get_index(uint8_t space_id, uint8_t type_id)const
{
   FC_ASSERT( _index.size() > space_id, "", ("space_id",space_id)("type_id",type_id)("index.size",_index.size()) );
   FC_ASSERT( _index[space_id].size() > type_id, "", ("space_id",space_id)("type_id",type_id)("index[space_id].size",_index[space_id].size()) );
   const auto& tmp = _index[space_id][type_id];
   FC_ASSERT( tmp, "no index registered", ("space_id",space_id)("type_id",type_id) );
   return *tmp;
}

index& object_database::get_mutable_index(uint8_t space_id, uint8_t type_id)
{
   FC_ASSERT( _index.size() > space_id, "", ("space_id",space_id)("type_id",type_id)("index.size",_index.size()) );
   FC_ASSERT( _index[space_id].size() > type_id , "", ("space_id",space_id)("type_id",type_id)("index[space_id].size",_index[space_id].size()) );
   const auto& idx = _index[space_id][type_id];
   FC_ASSERT( idx, "no index registered", ("space_id",space_id)("type_id",type_id) );
   return *idx;
}

void object_database::modify( const object& obj, const std::function<void(object&)>& m )
{
   _undo_db.on_modify( obj );
   get_mutable_index( obj.id ).modify( obj, m );
}

void object_database::remove( const object& obj )
{
   _undo_db.on_remove( obj );
   get_mutable_index( obj.id ).remove( obj );
}

void object_database::flush()
{ try {
   if( _data_dir == fc::path() ) return;
   if( !fc::exists( _data_dir ) ) fc::create_directories( _data_dir );

   fc::variants indexes;
   for( const auto& space : _index )
   {
      for( const auto& idx : space )
      {
         if( !idx ) continue;
         fc::variants objects;
         objects.reserve( idx->size() );
         idx->inspect_all_objects( [&]( const object& o ) { objects.push_back( o.to_variant() ); } );
         indexes.push_back( fc::mutable_variant_object( "space", idx->object_space_id() )
                                                      ( "type", idx->object_type_id() )
                                                      ( "next_id", idx->get_next_id() )
                                                      ( "objects", objects ) );
      }
   }
   fc::json::save_to_file( indexes, snapshot_file() );
   ilog( "saved object database snapshot to ${f}", ("f",snapshot_file()) );
} FC_CAPTURE_AND_RETHROW( (_data_dir) ) }

void object_database::wipe( const fc::path& data_dir )
{
   ilog("Wiping object_database.");
   fc::remove_all( data_dir );
   _data_dir = fc::path();
   reset_indexes();
}

void object_database::open( const fc::path& data_dir )
{ try {
   for( const auto& space : _index )
      for( const auto& idx : space )
         FC_ASSERT( !idx || idx->size() == 0, "object database already holds objects, wipe it before opening again",
                    ("space",idx->object_space_id())("type",idx->object_type_id())("size",idx->size()) );

   _data_dir = data_dir;
   if( !fc::exists( snapshot_file() ) )
   {
      ilog( "no object database snapshot at ${f}", ("f",snapshot_file()) );
      return;
   }

   auto snapshot = fc::json::from_file( snapshot_file() );
   for( const auto& entry : snapshot.get_array() )
   {
      const auto& idx_obj = entry.get_object();
      auto& idx = get_mutable_index( uint8_t( idx_obj["space"].as_uint64() ), uint8_t( idx_obj["type"].as_uint64() ) );
      for( const auto& obj : idx_obj["objects"].get_array() )
         idx.load( obj );
      idx.set_next_id( idx_obj["next_id"].as<object_id_type>() );
   }
   ilog( "loaded object database snapshot from ${f}", ("f",snapshot_file()) );
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

} } // hydra::db
