#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <string>

namespace yield_contracts::testing::test_contracts::benef_tester {

using eosio::asset;
using eosio::check;
using eosio::name;

/**
 * @brief Beneficiary account with code, used to misbehave on incoming transfers
 *
 * @details `accept` takes the transfer, `reject` fails it and `reenter` calls back into the router's
 * proportional distribution from inside the notification, forwarding what it just received.
 */
class [[eosio::contract("benef_tester")]] beneficiary : public eosio::contract {
public:
   using eosio::contract::contract;

   static constexpr name accept_mode  = "accept"_n;
   static constexpr name reject_mode  = "reject"_n;
   static constexpr name reenter_mode = "reenter"_n;

   [[eosio::action]]
   void setmode(const name& mode, const name& router);

   [[eosio::on_notify("*::transfer")]]
   void on_transfer(const name& from, const name& to, const asset& quantity, const std::string& memo);

private:
   struct [[eosio::table]] behavior {
      name mode = accept_mode;
      name router;
   };

   using behavior_singleton = eosio::singleton<"behavior"_n, behavior>;
};

} // namespace yield_contracts::testing::test_contracts::benef_tester
