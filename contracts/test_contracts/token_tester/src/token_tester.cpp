#include <token_tester/token_tester.hpp>

namespace yield_contracts::testing::test_contracts::token_tester {

void token::create(const name& issuer, const asset& maximum_supply)
{
   require_auth(get_self());
   check(maximum_supply.is_valid(), "invalid supply");
   check(maximum_supply.amount > 0, "max-supply must be positive");

   stats statstable(get_self(), maximum_supply.symbol.code().raw());
   check(statstable.find(maximum_supply.symbol.code().raw()) == statstable.end(), "token with symbol already exists");

   statstable.emplace(get_self(), [&](auto& s) {
      s.supply.symbol = maximum_supply.symbol;
      s.max_supply    = maximum_supply;
      s.issuer        = issuer;
   });
}

void token::issue(const name& to, const asset& quantity, const std::string& memo)
{
   check(quantity.is_valid(), "invalid quantity");
   check(quantity.amount > 0, "must issue positive quantity");

   stats       statstable(get_self(), quantity.symbol.code().raw());
   const auto& st = statstable.get(quantity.symbol.code().raw(), "token with symbol does not exist");
   require_auth(st.issuer);
   check(quantity.symbol == st.supply.symbol, "symbol precision mismatch");
   check(quantity.amount <= st.max_supply.amount - st.supply.amount, "quantity exceeds available supply");

   statstable.modify(st, eosio::same_payer, [&](auto& s) { s.supply += quantity; });

   add_balance(to, quantity, st.issuer);
}

void token::transfer(const name& from, const name& to, const asset& quantity, const std::string& memo)
{
   check(from != to, "cannot transfer to self");
   require_auth(from);
   check(is_account(to), "to account does not exist");

   stats       statstable(get_self(), quantity.symbol.code().raw());
   const auto& st = statstable.get(quantity.symbol.code().raw(), "token with symbol does not exist");

   require_recipient(from);
   require_recipient(to);

   check(quantity.is_valid(), "invalid quantity");
   check(quantity.amount > 0, "must transfer positive quantity");
   check(quantity.symbol == st.supply.symbol, "symbol precision mismatch");
   check(memo.size() <= 256, "memo has more than 256 bytes");

   sub_balance(from, quantity);
   add_balance(to, quantity, from);
}

void token::sub_balance(const name& owner, const asset& value)
{
   accounts    from_acnts(get_self(), owner.value);
   const auto& from = from_acnts.get(value.symbol.code().raw(), "no balance object found");
   check(from.balance.amount >= value.amount, "overdrawn balance");

   from_acnts.modify(from, owner, [&](auto& a) { a.balance -= value; });
}

void token::add_balance(const name& owner, const asset& value, const name& ram_payer)
{
   accounts to_acnts(get_self(), owner.value);
   auto     to = to_acnts.find(value.symbol.code().raw());
   if (to == to_acnts.end()) {
      to_acnts.emplace(ram_payer, [&](auto& a) { a.balance = value; });
   } else {
      to_acnts.modify(to, eosio::same_payer, [&](auto& a) { a.balance += value; });
   }
}

} // namespace yield_contracts::testing::test_contracts::token_tester
