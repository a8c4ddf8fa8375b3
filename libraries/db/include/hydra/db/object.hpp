#pragma once
#include <hydra/db/object_id.hpp>
#include <fc/variant.hpp>

#include <memory>

namespace hydra { namespace db {
   using std::unique_ptr;
   using fc::variant;

   /**
    *  @brief base for all database objects
    *
    *  The object is the fundamental building block of the database and
    *  is the level upon which undo operations are performed.  Objects
    *  are assigned a unique and sequential object ID by the database within
    *  the space and type defined by the derived class.
    *
    *  All objects must be serializable via FC_REFLECT() and their content must be
    *  faithfully restored.  Objects should refer to each other by ID or by a
    *  stable key and stay cheap to copy, because every modification made inside an
    *  undo session copies the previous value.
    *
    *  @note Do not use multiple inheritance with object because the code assumes
    *  a static_cast will work between object and derived types.
    */
   class object
   {
      public:
         object(){}
         virtual ~object(){}

         static const uint8_t space_id = 0;
         static const uint8_t type_id  = 0;

         // serialized
         object_id_type          id;

         /// these methods are implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual unique_ptr<object> clone()const = 0;
         virtual void               move_from( object& obj ) = 0;
         virtual variant            to_variant()const  = 0;
   };

   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         virtual unique_ptr<object> clone()const
         {
            return unique_ptr<object>(new DerivedClass( *static_cast<const DerivedClass*>(this) ));
         }

         virtual void    move_from( object& obj )
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
         virtual variant to_variant()const { return variant( static_cast<const DerivedClass&>(*this) ); }
   };

} } // hydra::db

FC_REFLECT( hydra::db::object, (id) )
