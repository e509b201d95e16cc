#include <yield.router/yield.router.hpp>

#include <algorithm>

namespace yieldrouter {

    void router_contract::setpref( const name& stakeholder, const name& beneficiary, uint8_t split_pct ) {
        require_initialized();
        assert_not_paused();
        assert_unlocked();
        require_auth(stakeholder);

        check(beneficiary_approved(beneficiary), "beneficiary is not approved");
        const auto& options = _config.split_options;
        check(std::find(options.begin(), options.end(), split_pct) != options.end(), "invalid split percent");

        prefs_table prefs(get_self(), get_self().value);
        auto itr = prefs.find(stakeholder.value);
        if(itr == prefs.end()) {
            prefs.emplace(stakeholder, [&]( auto& row ) {
                row.stakeholder = stakeholder;
                row.beneficiary = beneficiary;
                row.split_pct   = split_pct;
                row.updated_at  = time_point_sec(eosio::current_time_point());
            });
        } else {
            prefs.modify(itr, stakeholder, [&]( auto& row ) {
                row.beneficiary = beneficiary;
                row.split_pct   = split_pct;
                row.updated_at  = time_point_sec(eosio::current_time_point());
            });
        }

        logpref_action logpref_act{ get_self(), { get_self(), active_permission } };
        logpref_act.send( stakeholder, beneficiary, split_pct );
    }

    allocation_pref router_contract::getpref( const name& stakeholder ) {
        prefs_table prefs(get_self(), get_self().value);
        auto itr = prefs.find(stakeholder.value);
        return itr == prefs.end() ? allocation_pref{} : *itr;
    }

} // ns yieldrouter
