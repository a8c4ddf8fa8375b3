#pragma once
#include <hydra/chain/types.hpp>
#include <hydra/chain/address.hpp>

namespace hydra { namespace chain {

   /**
    *  The result of applying an operation: the id of the object it created or
    *  touched, or the new running total it produced.
    */
   typedef fc::static_variant<object_id_type,share_type> operation_result;

   /**
    *  @brief creates the registry and installs its authority
    *
    *  May only succeed once per database.
    */
   struct registry_initialize_operation
   {
      public_key_type authority;

      void get_required_auth( flat_set<public_key_type>& auth_set )const;
      void validate()const;
   };

   /**
    *  @brief registers the agent at the top of the hierarchy
    *
    *  Only the registry authority may register the root.  The wallet does not
    *  have to sign.
    */
   struct agent_register_root_operation
   {
      public_key_type authority;
      public_key_type wallet;
      string          name;
      string          specialization;

      void get_required_auth( flat_set<public_key_type>& auth_set )const;
      void validate()const;
   };

   /**
    *  @brief creates a child agent one level below the agent owned by parent_wallet
    *
    *  The parent wallet pays for and signs the operation.
    */
   struct agent_spawn_operation
   {
      public_key_type parent_wallet;
      public_key_type child_wallet;
      string          name;
      string          specialization;
      /** basis points of earnings the child is expected to pass up, descriptive only */
      uint16_t        revenue_share_bps = 0;

      void get_required_auth( flat_set<public_key_type>& auth_set )const;
      void validate()const;
   };

   /**
    *  @brief adds amount to the lifetime earnings of the agent owned by wallet
    *
    *  This is pure bookkeeping; no value moves.
    */
   struct earning_record_operation
   {
      public_key_type wallet;
      share_type      amount;

      void get_required_auth( flat_set<public_key_type>& auth_set )const;
      void validate()const;
   };

   /**
    *  @brief moves amount of native value from the child wallet to its parent's wallet
    *
    *  The transfer happens before the child's ledger is updated; if either
    *  step fails the whole operation has no effect.
    */
   struct revenue_distribute_operation
   {
      public_key_type child_wallet;
      public_key_type parent_wallet;
      share_type      amount;

      void get_required_auth( flat_set<public_key_type>& auth_set )const;
      void validate()const;
   };

   /**
    *  @brief permanently marks an agent inactive
    *
    *  Only the registry authority may deactivate agents.  Descendants are not
    *  affected.
    */
   struct agent_deactivate_operation
   {
      public_key_type authority;
      public_key_type wallet;

      void get_required_auth( flat_set<public_key_type>& auth_set )const;
      void validate()const;
   };

   typedef fc::static_variant<
            registry_initialize_operation,
            agent_register_root_operation,
            agent_spawn_operation,
            earning_record_operation,
            revenue_distribute_operation,
            agent_deactivate_operation
         > operation;

   /**
     * @brief Used to find the keys which must sign off on operations in a polymorphic manner
     */
   struct operation_get_required_auths
   {
      flat_set<public_key_type>& auth_set;
      operation_get_required_auths( flat_set<public_key_type>& auth_set )
         : auth_set(auth_set)
      {}
      typedef void result_type;
      template<typename T>
      void operator()(const T& v)const { v.get_required_auth(auth_set); }
   };

   /**
    * @brief Used to validate operations in a polymorphic manner
    */
   struct operation_validator
   {
      typedef void result_type;
      template<typename T>
      void operator()( const T& v )const { v.validate(); }
   };

   void validate_agent_name( const string& name );
   void validate_agent_specialization( const string& specialization );

} } // hydra::chain

FC_REFLECT( hydra::chain::registry_initialize_operation, (authority) )
FC_REFLECT( hydra::chain::agent_register_root_operation, (authority)(wallet)(name)(specialization) )
FC_REFLECT( hydra::chain::agent_spawn_operation,
            (parent_wallet)(child_wallet)(name)(specialization)(revenue_share_bps) )
FC_REFLECT( hydra::chain::earning_record_operation, (wallet)(amount) )
FC_REFLECT( hydra::chain::revenue_distribute_operation, (child_wallet)(parent_wallet)(amount) )
FC_REFLECT( hydra::chain::agent_deactivate_operation, (authority)(wallet) )
