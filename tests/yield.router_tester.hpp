#pragma once

#include <boost/test/unit_test.hpp>
#include <eosio/chain/abi_serializer.hpp>
#include <eosio/chain/exceptions.hpp>
#include <eosio/testing/tester.hpp>

#include <fc/variant_object.hpp>

#include <set>

#include "contracts.hpp"

using namespace eosio::chain;
using namespace eosio::testing;
using namespace fc;
using namespace std;

using mvo = fc::mutable_variant_object;

// make -j $(nproc) && ./tests/unit_test "--run_test=yield_router_distribute_tests" "--report_level=detailed" "--color_output"

/**
 * Chain with the router, the registry, a custody token and a scripted beneficiary contract deployed.
 *
 * The router custody holds "4,YLD" issued by `yield.token` through the `vault` account, which is also
 * the authorized caller reporting shares. Fees go to `fee.sink`, protocol fees to `protocol`.
 * `alt.token` runs the same token code and issues its own "4,YLD", a separate asset for the router.
 */
class yield_router_tester : public tester {
public:
   const name router       = "yield.router"_n;
   const name registry     = "yield.reg"_n;
   const name token        = "yield.token"_n;
   const name alt_token    = "alt.token"_n;
   const name benef        = "benef.tester"_n;
   const name vault        = "vault"_n;
   const name fee_sink     = "fee.sink"_n;
   const name protocol     = "protocol"_n;
   const name fee_admin    = "fee.admin"_n;
   const name caller_admin = "caller.admin"_n;
   const name emerg_admin  = "emerg.admin"_n;
   const name alice        = "alice"_n;
   const name bob          = "bob"_n;
   const name carol        = "carol"_n;
   const name dave         = "dave"_n;
   const name ngo_alpha    = "ngo.alpha"_n;
   const name ngo_beta     = "ngo.beta"_n;
   const name ngo_gamma    = "ngo.gamma"_n;

   static constexpr uint16_t default_fee_bps          = 100;
   static constexpr uint16_t default_max_fee_bps      = 1000;
   static constexpr uint16_t default_protocol_fee_bps = 250;

   abi_serializer router_ser;
   abi_serializer registry_ser;
   abi_serializer token_ser;
   abi_serializer benef_ser;

   explicit yield_router_tester( bool initialize = true ) {
      produce_blocks( 2 );

      create_accounts( { router, registry, token, alt_token, benef, vault, fee_sink, protocol, fee_admin, caller_admin, emerg_admin,
                         alice, bob, carol, dave, ngo_alpha, ngo_beta, ngo_gamma } );
      produce_blocks( 2 );

      set_code( router, contracts::router_wasm() );
      set_abi( router, contracts::router_abi().data() );
      set_code( registry, contracts::registry_wasm() );
      set_abi( registry, contracts::registry_abi().data() );
      set_code( token, contracts::util::token_tester_wasm() );
      set_abi( token, contracts::util::token_tester_abi().data() );
      set_code( alt_token, contracts::util::token_tester_wasm() );
      set_abi( alt_token, contracts::util::token_tester_abi().data() );
      set_code( benef, contracts::util::benef_tester_wasm() );
      set_abi( benef, contracts::util::benef_tester_abi().data() );
      produce_blocks();

      load_abi( router, router_ser );
      load_abi( registry, registry_ser );
      load_abi( token, token_ser );
      load_abi( benef, benef_ser );

      BOOST_REQUIRE_EQUAL( success(), push_action( token, token, "create"_n, mvo()
         ("issuer", token)
         ("maximum_supply", yld(10000000000000ll)) ) );
      BOOST_REQUIRE_EQUAL( success(), push_action( alt_token, alt_token, "create"_n, mvo()
         ("issuer", alt_token)
         ("maximum_supply", yld(10000000000000ll)) ) );
      BOOST_REQUIRE_EQUAL( success(), push_action( registry, registry, "setrouter"_n, mvo()("router", router) ) );

      if( initialize ) {
         BOOST_REQUIRE_EQUAL( success(), init( registry, fee_sink, protocol,
                                               default_fee_bps, default_max_fee_bps, default_protocol_fee_bps ) );
         BOOST_REQUIRE_EQUAL( success(), setroles( fee_admin, caller_admin, emerg_admin ) );
         BOOST_REQUIRE_EQUAL( success(), setauth( caller_admin, vault, true ) );
      }
      produce_blocks();
   }

   void load_abi( const name& account, abi_serializer& ser ) {
      const auto& accnt = control->db().get<account_object,by_name>( account );
      abi_def abi;
      BOOST_REQUIRE_EQUAL( abi_serializer::to_abi(accnt.abi, abi), true );
      ser.set_abi( std::move(abi), abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   abi_serializer& serializer_for( const name& code ) {
      if( code == router )   return router_ser;
      if( code == registry ) return registry_ser;
      if( code == token || code == alt_token ) return token_ser;
      BOOST_REQUIRE( code == benef );
      return benef_ser;
   }

   static symbol yld_symbol() { return symbol(4, "YLD"); }

   static asset yld( int64_t units ) { return asset(units, yld_symbol()); }

   fc::variant yld_token() const {
      return mvo()("sym", "4,YLD")("contract", token);
   }

   fc::variant yld_extended( int64_t units ) const {
      return yld_extended( units, token );
   }

   static fc::variant yld_extended( int64_t units, const name& contract ) {
      return mvo()("quantity", yld(units))("contract", contract);
   }

   bytes action_data( const name& code, const action_name& act_name, const variant_object& data ) {
      auto& ser = serializer_for( code );
      return ser.variant_to_binary( ser.get_action_type(act_name), data, abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   action_result push_action( const name& code, const name& signer, const action_name& act_name, const variant_object& data ) {
      action act;
      act.account = code;
      act.name    = act_name;
      act.data    = action_data( code, act_name, data );

      return base_tester::push_action( std::move(act), signer.to_uint64_t() );
   }

   // pushes a signed transaction and keeps its trace; throws when the action fails
   transaction_trace_ptr push_traced( const name& code, const name& signer, const action_name& act_name, const variant_object& data ) {
      signed_transaction trx;
      trx.actions.emplace_back( vector<permission_level>{ { signer, config::active_name } }, code, act_name,
                                action_data( code, act_name, data ) );
      set_transaction_headers( trx );
      trx.sign( get_private_key( signer, "active" ), control->get_chain_id() );
      return push_transaction( trx );
   }

   // `logdistrib` entries executed by the router itself, in execution order
   vector<fc::variant> distribution_log( const transaction_trace_ptr& trace ) {
      vector<fc::variant> entries;
      for( const auto& at : trace->action_traces ) {
         if( at.receiver != router || at.act.account != router || at.act.name != "logdistrib"_n )
            continue;
         entries.push_back( router_ser.binary_to_variant( "logdistrib", at.act.data,
                                                          abi_serializer::create_yield_function(abi_serializer_max_time) ) );
      }
      return entries;
   }

   // runs a router query in a read-only transaction and decodes its return value
   fc::variant query( const action_name& act_name, const variant_object& data = mvo() ) {
      action act;
      act.account = router;
      act.name    = act_name;
      act.data    = router_ser.variant_to_binary( router_ser.get_action_type(act_name), data, abi_serializer::create_yield_function(abi_serializer_max_time) );

      signed_transaction trx;
      trx.actions.emplace_back( std::move(act) );
      set_transaction_headers( trx );
      auto trace = push_transaction( trx, fc::time_point::maximum(), DEFAULT_BILLED_CPU_TIME_US,
                                     false, transaction_metadata::trx_type::read_only );

      BOOST_REQUIRE( !trace->action_traces.empty() );
      const auto& retval = trace->action_traces[0].return_value;
      return router_ser.binary_to_variant( router_ser.get_action_result_type(act_name), retval,
                                           abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   fc::variant get_row( const name& code, const name& scope, const name& table, uint64_t key, const string& type ) {
      vector<char> data = get_row_by_account( code, scope, table, name(key) );
      return data.empty() ? fc::variant() : serializer_for(code).binary_to_variant( type, data, abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   // router actions

   action_result init( const name& registry_account, const name& fee_recipient, const name& treasury,
                       uint16_t fee_bps, uint16_t max_fee_bps, uint16_t protocol_fee_bps ) {
      return push_action( router, router, "init"_n, mvo()
         ("registry", registry_account)
         ("fee_recipient", fee_recipient)
         ("protocol_treasury", treasury)
         ("fee_bps", fee_bps)
         ("max_fee_bps", max_fee_bps)
         ("protocol_fee_bps", protocol_fee_bps) );
   }

   action_result setroles( const name& new_fee_admin, const name& new_caller_admin, const name& new_emerg_admin ) {
      return push_action( router, router, "setroles"_n, mvo()
         ("fee_admin", new_fee_admin)
         ("caller_admin", new_caller_admin)
         ("emergency_admin", new_emerg_admin) );
   }

   action_result updatefee( const name& signer, const name& fee_recipient, uint16_t fee_bps ) {
      return push_action( router, signer, "updatefee"_n, mvo()("fee_recipient", fee_recipient)("fee_bps", fee_bps) );
   }

   action_result settreasury( const name& signer, const name& treasury ) {
      return push_action( router, signer, "settreasury"_n, mvo()("treasury", treasury) );
   }

   action_result setsplits( const name& signer, const vector<uint8_t>& splits ) {
      fc::variants values;
      for( auto pct : splits )
         values.emplace_back( uint64_t(pct) );
      return push_action( router, signer, "setsplits"_n, mvo()("splits", values) );
   }

   action_result setauth( const name& signer, const name& caller, bool authorized ) {
      return push_action( router, signer, "setauth"_n, mvo()("caller", caller)("authorized", authorized) );
   }

   action_result pause( const name& signer ) {
      return push_action( router, signer, "pause"_n, mvo() );
   }

   action_result unpause( const name& signer ) {
      return push_action( router, signer, "unpause"_n, mvo() );
   }

   action_result emergencywd( const name& signer, const name& to, int64_t units, const string& memo ) {
      return push_action( router, signer, "emergencywd"_n, mvo()
         ("to", to)
         ("quantity", yld_extended(units))
         ("memo", memo) );
   }

   action_result setpref( const name& stakeholder, const name& beneficiary, uint8_t split_pct ) {
      return push_action( router, stakeholder, "setpref"_n, mvo()
         ("stakeholder", stakeholder)
         ("beneficiary", beneficiary)
         ("split_pct", split_pct) );
   }

   action_result setshares( const name& caller, const name& stakeholder, uint64_t shares ) {
      return push_action( router, caller, "setshares"_n, mvo()
         ("caller", caller)
         ("stakeholder", stakeholder)
         ("token", yld_token())
         ("shares", shares) );
   }

   action_result distsingle( const name& caller, int64_t units ) {
      return push_action( router, caller, "distsingle"_n, mvo()("caller", caller)("yield", yld_extended(units)) );
   }

   action_result distequal( const name& caller, int64_t units, const vector<name>& beneficiaries ) {
      return push_action( router, caller, "distequal"_n, mvo()
         ("caller", caller)
         ("yield", yld_extended(units))
         ("beneficiaries", beneficiaries) );
   }

   action_result distribute( const name& caller, int64_t units ) {
      return push_action( router, caller, "distribute"_n, mvo()("caller", caller)("yield", yld_extended(units)) );
   }

   // registry actions

   action_result approve( const name& beneficiary ) {
      return push_action( registry, registry, "approve"_n, mvo()("beneficiary", beneficiary) );
   }

   action_result revoke( const name& beneficiary ) {
      return push_action( registry, registry, "revoke"_n, mvo()("beneficiary", beneficiary) );
   }

   action_result setdefault( const name& beneficiary ) {
      return push_action( registry, registry, "setdefault"_n, mvo()("beneficiary", beneficiary) );
   }

   action_result recordrcpt( const name& signer, const name& beneficiary, int64_t units ) {
      return push_action( registry, signer, "recordrcpt"_n, mvo()
         ("beneficiary", beneficiary)
         ("quantity", yld_extended(units)) );
   }

   // token and beneficiary contract

   action_result transfer( const name& from, const name& to, int64_t units, const string& memo = "" ) {
      return push_action( token, from, "transfer"_n, mvo()
         ("from", from)
         ("to", to)
         ("quantity", yld(units))
         ("memo", memo) );
   }

   action_result setmode( const name& mode ) {
      return push_action( benef, benef, "setmode"_n, mvo()("mode", mode)("router", router) );
   }

   // issues `units` to the vault and moves them into router custody
   void fund_router( int64_t units ) {
      fund_router( units, token );
   }

   void fund_router( int64_t units, const name& contract ) {
      BOOST_REQUIRE_EQUAL( success(), push_action( contract, contract, "issue"_n, mvo()
         ("to", vault)
         ("quantity", yld(units))
         ("memo", "") ) );
      BOOST_REQUIRE_EQUAL( success(), push_action( contract, vault, "transfer"_n, mvo()
         ("from", vault)
         ("to", router)
         ("quantity", yld(units))
         ("memo", "harvest") ) );
   }

   // tables

   int64_t balance( const name& owner ) {
      return balance( owner, token );
   }

   int64_t balance( const name& owner, const name& contract ) {
      auto row = get_row( contract, owner, "accounts"_n, yld_symbol().to_symbol_code().value, "account" );
      return row.is_null() ? 0 : row["balance"].as<asset>().get_amount();
   }

   fc::variant get_config() {
      return get_row( router, router, "config"_n, "config"_n.to_uint64_t(), "router_config" );
   }

   fc::variant get_state() {
      return get_row( router, router, "state"_n, "state"_n.to_uint64_t(), "router_state" );
   }

   fc::variant get_pool( uint64_t id = 0 ) {
      return get_row( router, router, "pools"_n, id, "pool_info" );
   }

   fc::variant get_share_entry( const name& stakeholder, uint64_t pool_id = 0 ) {
      return get_row( router, name(pool_id), "shares"_n, stakeholder.to_uint64_t(), "share_entry" );
   }

   fc::variant get_member( uint64_t slot, uint64_t pool_id = 0 ) {
      return get_row( router, name(pool_id), "members"_n, slot, "member_slot" );
   }

   fc::variant get_pref( const name& stakeholder ) {
      return get_row( router, router, "prefs"_n, stakeholder.to_uint64_t(), "allocation_pref" );
   }

   fc::variant get_beneficiary( const name& beneficiary ) {
      return get_row( registry, registry, "benefs"_n, beneficiary.to_uint64_t(), "beneficiary_info" );
   }

   int64_t received( const name& beneficiary ) {
      return received( beneficiary, token );
   }

   // receipt rows are numbered from zero in the order the tokens were first received
   int64_t received( const name& beneficiary, const name& contract ) {
      for( uint64_t id = 0; ; ++id ) {
         auto row = get_row( registry, beneficiary, "receipts"_n, id, "receipt_total" );
         if( row.is_null() )
            return 0;
         if( row["total"]["contract"].as<name>() == contract )
            return row["total"]["quantity"].as<asset>().get_amount();
      }
   }

   uint64_t total_distributions() {
      auto state = get_state();
      return state.is_null() ? 0 : state["total_distributions"].as_uint64();
   }

   int64_t pool_amount( const string& field ) {
      auto pool = get_pool();
      return pool.is_null() ? 0 : pool[field].as<asset>().get_amount();
   }

   /**
    * Walks the active index of a pool and checks it against the share entries: slots are dense,
    * every member has a nonzero entry pointing back at its slot, and the shares add up to the total.
    */
   void check_active_index( uint64_t pool_id = 0 ) {
      auto pool = get_pool( pool_id );
      BOOST_REQUIRE( !pool.is_null() );
      const uint64_t members = pool["members"].as_uint64();

      uint64_t sum = 0;
      std::set<name> seen;
      for( uint64_t slot = 0; slot < members; ++slot ) {
         auto member = get_member( slot, pool_id );
         BOOST_REQUIRE( !member.is_null() );
         const name stakeholder = member["stakeholder"].as<name>();
         BOOST_REQUIRE( seen.insert(stakeholder).second );

         auto entry = get_share_entry( stakeholder, pool_id );
         BOOST_REQUIRE( !entry.is_null() );
         BOOST_REQUIRE_EQUAL( entry["slot"].as_uint64(), slot );
         BOOST_REQUIRE( entry["shares"].as_uint64() > 0 );
         sum += entry["shares"].as_uint64();
      }
      BOOST_REQUIRE( get_member( members, pool_id ).is_null() );
      BOOST_REQUIRE_EQUAL( sum, pool["total_shares"].as_uint64() );
   }
};
