#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <string>

namespace yield_contracts::testing::test_contracts::token_tester {

using eosio::asset;
using eosio::check;
using eosio::name;
using eosio::symbol;

/**
 * @brief Token holding the custody balance in unit tests
 *
 * @details Keeps the `accounts` and `stat` table layouts of `eosio.token`, which is all the router
 * depends on, and notifies both parties of every transfer.
 */
class [[eosio::contract("token_tester")]] token : public eosio::contract {
public:
   using eosio::contract::contract;

   [[eosio::action]]
   void create(const name& issuer, const asset& maximum_supply);

   [[eosio::action]]
   void issue(const name& to, const asset& quantity, const std::string& memo);

   [[eosio::action]]
   void transfer(const name& from, const name& to, const asset& quantity, const std::string& memo);

private:
   struct [[eosio::table]] account {
      asset balance;

      uint64_t primary_key() const { return balance.symbol.code().raw(); }
   };

   struct [[eosio::table]] currency_stats {
      asset supply;
      asset max_supply;
      name  issuer;

      uint64_t primary_key() const { return supply.symbol.code().raw(); }
   };

   typedef eosio::multi_index<"accounts"_n, account>    accounts;
   typedef eosio::multi_index<"stat"_n, currency_stats> stats;

   void sub_balance(const name& owner, const asset& value);
   void add_balance(const name& owner, const asset& value, const name& ram_payer);
};

} // namespace yield_contracts::testing::test_contracts::token_tester
