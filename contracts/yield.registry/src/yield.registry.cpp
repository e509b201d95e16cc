#include <yield.registry/yield.registry.hpp>

namespace yieldregistry {

    registry_contract::registry_contract( name s, name code, datastream<const char*> ds )
    :contract(s,code,ds),
    _state_singleton(get_self(), get_self().value),
    _benefs(get_self(), get_self().value)
    {
        _state = _state_singleton.exists() ? _state_singleton.get() : registry_state{};
    }

    void registry_contract::setrouter(const name& router) {
        require_auth(get_self());
        check(is_account(router), "router account does not exist");

        _state.router = router;
        _state_singleton.set( _state, get_self() );
    }

    void registry_contract::approve(const name& beneficiary) {
        require_auth(get_self());
        check(is_account(beneficiary), "beneficiary account does not exist");

        auto itr = _benefs.find(beneficiary.value);
        if(itr == _benefs.end()) {
            _benefs.emplace(get_self(), [&]( auto& row ) {
                row.account  = beneficiary;
                row.approved = true;
            });
        } else {
            check(!itr->approved, "beneficiary already approved");
            _benefs.modify(itr, same_payer, [&]( auto& row ) {
                row.approved = true;
            });
        }
    }

    void registry_contract::revoke(const name& beneficiary) {
        require_auth(get_self());

        const auto& row = _benefs.get(beneficiary.value, "beneficiary not found");
        check(row.approved, "beneficiary already revoked");
        _benefs.modify(row, same_payer, [&]( auto& r ) {
            r.approved = false;
        });

        if(_state.default_beneficiary == beneficiary) {
            _state.default_beneficiary = name{};
            _state_singleton.set( _state, get_self() );
        }
    }

    void registry_contract::setdefault(const name& beneficiary) {
        require_auth(get_self());
        if(beneficiary != name{})
            check(is_approved(get_self(), beneficiary), "beneficiary is not approved");

        _state.default_beneficiary = beneficiary;
        _state_singleton.set( _state, get_self() );
    }

    void registry_contract::recordrcpt(const name& beneficiary, const extended_asset& quantity) {
        check(_state.router != name{}, "router not configured");
        require_auth(_state.router);
        check(quantity.quantity.is_valid(), "invalid quantity");
        check(quantity.quantity.amount > 0, "quantity must be positive");

        const auto& row = _benefs.get(beneficiary.value, "beneficiary not found");
        _benefs.modify(row, same_payer, [&]( auto& r ) {
            r.receipts    += 1;
            r.last_receipt = time_point_sec(eosio::current_time_point());
        });

        receipts_table receipts(get_self(), beneficiary.value);
        auto by_token = receipts.get_index<"bytoken"_n>();
        auto ritr = by_token.find(token_key(quantity.get_extended_symbol()));
        if(ritr == by_token.end()) {
            receipts.emplace(get_self(), [&]( auto& r ) {
                r.id    = receipts.available_primary_key();
                r.total = quantity;
            });
        } else {
            check(ritr->total.quantity.symbol == quantity.quantity.symbol, "symbol precision mismatch");
            by_token.modify(ritr, same_payer, [&]( auto& r ) {
                r.total += quantity;
            });
        }
    }

} // ns yieldregistry
