#include <benef_tester/benef_tester.hpp>

#include <eosio/action.hpp>

namespace yield_contracts::testing::test_contracts::benef_tester {

void beneficiary::setmode(const name& mode, const name& router)
{
   require_auth(get_self());
   check(mode == accept_mode || mode == reject_mode || mode == reenter_mode, "unknown mode");

   behavior_singleton behaviors(get_self(), get_self().value);
   behaviors.set(behavior{mode, router}, get_self());
}

void beneficiary::on_transfer(const name& from, const name& to, const asset& quantity, const std::string& memo)
{
   if (to != get_self())
      return;

   behavior_singleton behaviors(get_self(), get_self().value);
   const behavior     current = behaviors.get_or_default(behavior{});

   if (current.mode == reject_mode) {
      check(false, "beneficiary rejected transfer");
   } else if (current.mode == reenter_mode) {
      const eosio::extended_asset yield(quantity, get_first_receiver());
      eosio::action(eosio::permission_level{get_self(), "active"_n}, current.router, "distribute"_n,
                    std::make_tuple(get_self(), yield))
         .send();
   }
}

} // namespace yield_contracts::testing::test_contracts::benef_tester
