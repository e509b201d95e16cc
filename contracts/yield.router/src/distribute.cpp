#include <yield.router/yield.router.hpp>

#include <map>
#include <set>

namespace yieldrouter {

    pools_table::const_iterator router_contract::open_pass( const name& caller, const extended_asset& yield ) {
        enter(caller);
        check(yield.quantity.is_valid(), "invalid quantity");
        check(yield.quantity.amount > 0, "quantity must be positive");

        auto pool = find_or_create_pool(yield.get_extended_symbol());
        check(custody_balance(pool->token) >= yield.quantity, "insufficient custody balance");

        _state.locked = true;
        save_state();
        return pool;
    }

    void router_contract::close_pass() {
        save_state();

        // queued behind every transfer of the pass, so callbacks from recipients still see the lock
        unlock_action unlock_act{ get_self(), { get_self(), active_permission } };
        unlock_act.send();
    }

    uint64_t router_contract::next_distribution() {
        return ++_state.total_distributions;
    }

    void router_contract::pay_beneficiary( const name& beneficiary, const extended_asset& amount, const asset& fee,
                                           uint64_t distribution, const std::string& memo ) {
        send_transfer(beneficiary, amount, memo);

        registry_contract::recordrcpt_action recordrcpt_act{ _config.registry, { get_self(), active_permission } };
        recordrcpt_act.send( beneficiary, amount );

        logdistrib_action logdistrib_act{ get_self(), { get_self(), active_permission } };
        logdistrib_act.send( beneficiary, amount, fee, distribution );
    }

    // the fee entry reports the fee as both the amount moved and the fee withheld
    void router_contract::pay_fee( const extended_asset& fee, uint64_t distribution ) {
        send_transfer(_config.fee_recipient, fee, "distribution fee");

        logdistrib_action logdistrib_act{ get_self(), { get_self(), active_permission } };
        logdistrib_act.send( _config.fee_recipient, fee, fee.quantity, distribution );
    }

    void router_contract::pay_single( pools_table::const_iterator pool, const extended_asset& yield, const name& beneficiary ) {
        const auto split = allocation::split_fee(yield.quantity.amount, _config.fee_bps);
        const asset fee(split.fee, yield.quantity.symbol);
        const asset net(split.net, yield.quantity.symbol);
        const uint64_t distribution = next_distribution();

        if(fee.amount > 0)
            pay_fee(extended_asset(fee, yield.contract), distribution);
        if(net.amount > 0)
            pay_beneficiary(beneficiary, extended_asset(net, yield.contract), fee, distribution, "yield distribution");

        _pools.modify(pool, same_payer, [&]( auto& row ) {
            row.total_donated       += net;
            row.total_fee_collected += fee;
        });
    }

    void router_contract::pay_fee_recipient( pools_table::const_iterator pool, const extended_asset& yield ) {
        const auto split = allocation::split_fee(yield.quantity.amount, _config.fee_bps);

        send_transfer(_config.fee_recipient, yield, "undeliverable yield");

        logdistrib_action logdistrib_act{ get_self(), { get_self(), active_permission } };
        logdistrib_act.send( _config.fee_recipient, yield, asset(split.fee, yield.quantity.symbol), next_distribution() );

        _pools.modify(pool, same_payer, [&]( auto& row ) {
            row.total_fee_collected += yield.quantity;
        });
    }

    void router_contract::distsingle( const name& caller, const extended_asset& yield ) {
        auto pool = open_pass(caller, yield);

        const name beneficiary = registry_contract::get_default(_config.registry);
        check(beneficiary != name{}, "no beneficiary configured");
        check(beneficiary_approved(beneficiary), "beneficiary is not approved");

        pay_single(pool, yield, beneficiary);
        close_pass();
    }

    void router_contract::distequal( const name& caller, const extended_asset& yield, const std::vector<name>& beneficiaries ) {
        auto pool = open_pass(caller, yield);
        check(!beneficiaries.empty(), "beneficiary list is empty");
        check(beneficiaries.size() <= max_equal_split, "too many beneficiaries");

        std::set<name> seen;
        for( const auto& beneficiary : beneficiaries ) {
            check(seen.insert(beneficiary).second, "duplicate beneficiary");
            check(beneficiary_approved(beneficiary), "beneficiary is not approved");
        }

        const auto split = allocation::split_fee(yield.quantity.amount, _config.fee_bps);
        const auto parts = allocation::equal_parts(split.net, beneficiaries.size());
        const symbol sym = yield.quantity.symbol;

        // the fee shares the first beneficiary's number, or counts alone when the net is zero
        const uint64_t first = next_distribution();
        if(split.fee > 0)
            pay_fee(extended_asset(asset(split.fee, sym), yield.contract), first);

        int64_t donated = 0;
        for( size_t i = 0; i < beneficiaries.size(); ++i ) {
            if(parts[i] == 0)
                continue;
            pay_beneficiary(beneficiaries[i], extended_asset(asset(parts[i], sym), yield.contract), asset(0, sym),
                            donated == 0 ? first : next_distribution(), "yield distribution");
            donated += parts[i];
        }

        _pools.modify(pool, same_payer, [&]( auto& row ) {
            row.total_donated       += asset(donated, sym);
            row.total_fee_collected += asset(split.fee, sym);
        });
        close_pass();
    }

    void router_contract::distribute( const name& caller, const extended_asset& yield ) {
        auto pool = open_pass(caller, yield);

        if(pool->total_shares == 0) {
            const name beneficiary = registry_contract::get_default(_config.registry);
            if(beneficiary_approved(beneficiary))
                pay_single(pool, yield, beneficiary);
            else
                pay_fee_recipient(pool, yield);
            close_pass();
            return;
        }

        const symbol sym = yield.quantity.symbol;
        members_table members(get_self(), pool->id);
        shares_table  entries(get_self(), pool->id);
        prefs_table   prefs(get_self(), get_self().value);

        std::map<name, bool>    approved;
        std::map<name, int64_t> donations;
        int64_t protocol_total = 0;
        int64_t treasury_total = 0;

        for( auto member = members.begin(); member != members.end(); ++member ) {
            const auto& entry = entries.get(member->stakeholder.value, "active index corrupted");
            const int64_t user_yield = allocation::pro_rata(yield.quantity.amount, entry.shares, pool->total_shares);
            if(user_yield == 0)
                continue;

            name    beneficiary;
            uint8_t split_pct = 0;
            auto pitr = prefs.find(member->stakeholder.value);
            if(pitr != prefs.end()) {
                auto cached = approved.find(pitr->beneficiary);
                if(cached == approved.end())
                    cached = approved.emplace(pitr->beneficiary, beneficiary_approved(pitr->beneficiary)).first;
                if(cached->second) {
                    beneficiary = pitr->beneficiary;
                    split_pct   = pitr->split_pct;
                }
            }

            const auto alloc = allocation::allocate(user_yield, _config.protocol_fee_bps, split_pct, beneficiary != name{});
            protocol_total += alloc.protocol;
            treasury_total += alloc.treasury;
            if(alloc.beneficiary > 0)
                donations[beneficiary] += alloc.beneficiary;

            logalloc_action logalloc_act{ get_self(), { get_self(), active_permission } };
            logalloc_act.send( member->stakeholder, beneficiary, extended_asset(asset(user_yield, sym), yield.contract),
                               asset(alloc.protocol, sym), asset(alloc.beneficiary, sym), asset(alloc.treasury, sym) );
        }

        // every stakeholder floored to zero: nothing moves and the pass is not counted
        if(protocol_total == 0 && treasury_total == 0 && donations.empty()) {
            close_pass();
            return;
        }

        // one pass, one distribution number for all of its transfers
        const uint64_t distribution = next_distribution();
        const asset    no_fee(0, sym);
        logdistrib_action logdistrib_act{ get_self(), { get_self(), active_permission } };

        if(protocol_total > 0) {
            const extended_asset amount(asset(protocol_total, sym), yield.contract);
            send_transfer(_config.protocol_treasury, amount, "protocol fee");
            logdistrib_act.send( _config.protocol_treasury, amount, no_fee, distribution );
        }

        int64_t donated = 0;
        for( const auto& [beneficiary, amount] : donations ) {
            pay_beneficiary(beneficiary, extended_asset(asset(amount, sym), yield.contract), no_fee, distribution, "yield distribution");
            donated += amount;
        }

        if(treasury_total > 0) {
            const extended_asset amount(asset(treasury_total, sym), yield.contract);
            send_transfer(_config.fee_recipient, amount, "treasury share");
            logdistrib_act.send( _config.fee_recipient, amount, no_fee, distribution );
        }

        _pools.modify(pool, same_payer, [&]( auto& row ) {
            row.total_donated       += asset(donated, sym);
            row.total_fee_collected += asset(treasury_total, sym);
            row.total_protocol_fees += asset(protocol_total, sym);
        });
        close_pass();
    }

    dist_result router_contract::calcdist( const asset& quantity ) {
        require_initialized();
        check(quantity.is_valid(), "invalid quantity");
        check(quantity.amount >= 0, "quantity must not be negative");

        const auto split = allocation::split_fee(quantity.amount, _config.fee_bps);
        return dist_result{ asset(split.net, quantity.symbol), asset(split.fee, quantity.symbol) };
    }

} // ns yieldrouter
