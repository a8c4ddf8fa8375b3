#pragma once
#include <hydra/db/object.hpp>
#include <fc/log/logger.hpp>

#include <deque>
#include <map>
#include <set>
#include <unordered_map>

namespace hydra { namespace db {

   class object_database;

   /**
    *  Tracks the changes made to an object_database so that they can be
    *  rolled back.  Every call to start_undo_session() pushes a new state on the
    *  stack; the returned session undoes it when destroyed unless it was
    *  committed or merged into the session below it.
    */
   class undo_database
   {
      public:
         undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session() { if( _apply_undo ) _db.undo(); }
               /** makes the changes permanent */
               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }
               /** hands the changes to the enclosing session */
               void merge()  { if( _apply_undo ) _db.merge();  _apply_undo = false; }

            private:
               friend class undo_database;
               session( const session& ) = delete;
               session& operator=( const session& ) = delete;
               session( undo_database& db, bool apply_undo ):_db(db),_apply_undo(apply_undo){}
               undo_database& _db;
               bool _apply_undo = true;
         };

         void    disable();
         void    enable();
         bool    enabled()const { return !_disabled; }
         size_t  size()const    { return _stack.size(); }

         session start_undo_session();
         void on_create( const object& obj );
         void on_modify( const object& obj );
         void on_remove( const object& obj );

      private:
         void undo();
         void merge();
         void commit();

         struct undo_state
         {
            std::unordered_map<object_id_type, unique_ptr<object> > old_values;
            std::map<uint16_t, object_id_type>                     old_index_next_ids;
            std::set<object_id_type>                                new_ids;
            std::unordered_map<object_id_type, unique_ptr<object> > removed;
         };

         bool                   _disabled = false;
         std::deque<undo_state> _stack;
         object_database&       _db;
   };

} } // hydra::db
