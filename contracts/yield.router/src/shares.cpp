#include <yield.router/yield.router.hpp>

namespace yieldrouter {

    pools_table::const_iterator router_contract::find_pool( const extended_symbol& token ) const {
        auto idx = _pools.get_index<"bytoken"_n>();
        auto itr = idx.find(token_key(token));
        if(itr == idx.end())
            return _pools.end();
        return _pools.iterator_to(*itr);
    }

    pools_table::const_iterator router_contract::find_or_create_pool( const extended_symbol& token ) {
        check(token.get_symbol().is_valid(), "invalid symbol");
        auto itr = find_pool(token);
        if(itr != _pools.end())
            return itr;

        return _pools.emplace(get_self(), [&]( auto& row ) {
            row.id                  = _pools.available_primary_key();
            row.token               = token;
            row.total_donated       = asset(0, token.get_symbol());
            row.total_fee_collected = asset(0, token.get_symbol());
            row.total_protocol_fees = asset(0, token.get_symbol());
        });
    }

    void router_contract::remove_member( members_table& members, shares_table& shares, uint64_t slot, uint64_t last ) {
        const auto& vacated = members.get(slot, "active index corrupted");
        if(slot != last) {
            // move the last member into the vacated slot
            const auto& tail  = members.get(last, "active index corrupted");
            const name  moved = tail.stakeholder;
            shares.modify(shares.get(moved.value, "active index corrupted"), same_payer, [&]( auto& row ) {
                row.slot = slot;
            });
            members.modify(vacated, same_payer, [&]( auto& row ) {
                row.stakeholder = moved;
            });
            members.erase(tail);
        } else {
            members.erase(vacated);
        }
    }

    void router_contract::setshares( const name& caller, const name& stakeholder, const extended_symbol& token, uint64_t shares ) {
        enter(caller);
        check(is_account(stakeholder), "stakeholder must be an existing account");

        auto pool = find_or_create_pool(token);
        shares_table  entries(get_self(), pool->id);
        members_table members(get_self(), pool->id);

        auto itr = entries.find(stakeholder.value);
        const uint64_t old_shares = itr == entries.end() ? 0 : itr->shares;

        uint64_t total = pool->total_shares;
        if(shares >= old_shares) {
            const uint64_t delta = shares - old_shares;
            check(total + delta >= total, "total shares overflow");
            total += delta;
        } else {
            const uint64_t delta = old_shares - shares;
            check(total >= delta, "total shares underflow");
            total -= delta;
        }

        uint64_t count = pool->members;
        if(old_shares == 0 && shares > 0) {
            // a stakeholder without shares has no entry, so it cannot already be a member
            check(itr == entries.end(), "active index corrupted");
            members.emplace(get_self(), [&]( auto& row ) {
                row.slot        = count;
                row.stakeholder = stakeholder;
            });
            entries.emplace(get_self(), [&]( auto& row ) {
                row.stakeholder = stakeholder;
                row.shares      = shares;
                row.slot        = count;
            });
            ++count;
        } else if(old_shares > 0 && shares == 0) {
            remove_member(members, entries, itr->slot, count - 1);
            entries.erase(itr);
            --count;
        } else if(shares != old_shares) {
            entries.modify(itr, same_payer, [&]( auto& row ) {
                row.shares = shares;
            });
        }

        _pools.modify(pool, same_payer, [&]( auto& row ) {
            row.total_shares = total;
            row.members      = count;
        });

        logshares_action logshares_act{ get_self(), { get_self(), active_permission } };
        logshares_act.send( stakeholder, token, shares, total );
    }

    uint64_t router_contract::getshares( const name& stakeholder, const extended_symbol& token ) {
        auto pool = find_pool(token);
        if(pool == _pools.end())
            return 0;

        shares_table entries(get_self(), pool->id);
        auto itr = entries.find(stakeholder.value);
        return itr == entries.end() ? 0 : itr->shares;
    }

    pool_stats router_contract::getstats( const extended_symbol& token ) {
        pool_stats stats;
        stats.total_distributions = _state.total_distributions;

        auto pool = find_pool(token);
        if(pool == _pools.end()) {
            stats.total_donated       = asset(0, token.get_symbol());
            stats.total_fee_collected = asset(0, token.get_symbol());
            stats.total_protocol_fees = asset(0, token.get_symbol());
            return stats;
        }

        stats.total_shares        = pool->total_shares;
        stats.members             = pool->members;
        stats.total_donated       = pool->total_donated;
        stats.total_fee_collected = pool->total_fee_collected;
        stats.total_protocol_fees = pool->total_protocol_fees;
        return stats;
    }

} // ns yieldrouter
