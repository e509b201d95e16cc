#include <yield.router/yield.router.hpp>

#include <algorithm>

namespace yieldrouter {

    router_contract::router_contract( name s, name code, datastream<const char*> ds )
    :contract(s,code,ds),
    _config_singleton(get_self(), get_self().value),
    _state_singleton(get_self(), get_self().value),
    _pools(get_self(), get_self().value)
    {
        _config = _config_singleton.exists() ? _config_singleton.get() : router_config{};
        _state = _state_singleton.exists() ? _state_singleton.get() : router_state{};
    }

    void router_contract::require_initialized() const {
        check(_config_singleton.exists(), "router is not initialized");
    }

    void router_contract::assert_unlocked() const {
        check(!_state.locked, "reentrant call");
    }

    void router_contract::assert_not_paused() const {
        check(!_state.paused, "system is paused");
    }

    void router_contract::enter( const name& caller ) {
        require_initialized();
        assert_not_paused();
        assert_unlocked();
        require_auth(caller);

        callers_table callers(get_self(), get_self().value);
        check(callers.find(caller.value) != callers.end(), "caller is not authorized");
    }

    void router_contract::save_state() {
        _state_singleton.set( _state, get_self() );
    }

    bool router_contract::beneficiary_approved( const name& beneficiary ) const {
        return beneficiary != name{} && registry_contract::is_approved(_config.registry, beneficiary);
    }

    asset router_contract::custody_balance( const extended_symbol& token ) const {
        token_accounts accounts(token.get_contract(), get_self().value);
        auto itr = accounts.find(token.get_symbol().code().raw());
        if(itr == accounts.end())
            return asset(0, token.get_symbol());
        check(itr->balance.symbol == token.get_symbol(), "symbol precision mismatch");
        return itr->balance;
    }

    void router_contract::send_transfer( const name& to, const extended_asset& quantity, const std::string& memo ) {
        eosio::action(eosio::permission_level{get_self(), active_permission}, quantity.contract, "transfer"_n,
                      std::make_tuple(get_self(), to, quantity.quantity, memo))
            .send();
    }

    void router_contract::init( const name& registry, const name& fee_recipient, const name& protocol_treasury,
                                uint16_t fee_bps, uint16_t max_fee_bps, uint16_t protocol_fee_bps ) {
        require_auth(get_self());
        check(!_config_singleton.exists(), "router already initialized");
        check(is_account(registry), "registry must be an existing account");
        check(is_account(fee_recipient), "fee recipient must be an existing account");
        check(is_account(protocol_treasury), "treasury must be an existing account");
        check(max_fee_bps <= max_bps, "maximum fee exceeds 100%");
        check(fee_bps <= max_fee_bps, "fee exceeds maximum");
        check(protocol_fee_bps <= max_bps, "protocol fee exceeds 100%");

        _config.registry          = registry;
        _config.fee_recipient     = fee_recipient;
        _config.fee_bps           = fee_bps;
        _config.max_fee_bps       = max_fee_bps;
        _config.protocol_treasury = protocol_treasury;
        _config.protocol_fee_bps  = protocol_fee_bps;
        _config.split_options     = { 50, 75, 100 };
        _config.fee_admin         = get_self();
        _config.caller_admin      = get_self();
        _config.emergency_admin   = get_self();
        _config_singleton.set( _config, get_self() );

        save_state();
    }

    void router_contract::setroles( const name& fee_admin, const name& caller_admin, const name& emergency_admin ) {
        require_auth(get_self());
        require_initialized();
        assert_not_paused();
        assert_unlocked();
        check(is_account(fee_admin), "fee admin must be an existing account");
        check(is_account(caller_admin), "caller admin must be an existing account");
        check(is_account(emergency_admin), "emergency admin must be an existing account");

        _config.fee_admin       = fee_admin;
        _config.caller_admin    = caller_admin;
        _config.emergency_admin = emergency_admin;
        _config_singleton.set( _config, get_self() );
    }

    void router_contract::updatefee( const name& fee_recipient, uint16_t fee_bps ) {
        require_initialized();
        require_auth(_config.fee_admin);
        assert_not_paused();
        assert_unlocked();
        check(is_account(fee_recipient), "fee recipient must be an existing account");
        check(fee_bps <= _config.max_fee_bps, "fee exceeds maximum");

        const name     old_recipient = _config.fee_recipient;
        const uint16_t old_bps       = _config.fee_bps;
        _config.fee_recipient = fee_recipient;
        _config.fee_bps       = fee_bps;
        _config_singleton.set( _config, get_self() );

        logfeecfg_action logfeecfg_act{ get_self(), { get_self(), active_permission } };
        logfeecfg_act.send( old_recipient, fee_recipient, old_bps, fee_bps );
    }

    void router_contract::settreasury( const name& treasury ) {
        require_initialized();
        require_auth(_config.fee_admin);
        assert_not_paused();
        assert_unlocked();
        check(is_account(treasury), "treasury must be an existing account");

        const name old_treasury = _config.protocol_treasury;
        _config.protocol_treasury = treasury;
        _config_singleton.set( _config, get_self() );

        logtreasury_action logtreasury_act{ get_self(), { get_self(), active_permission } };
        logtreasury_act.send( old_treasury, treasury );
    }

    void router_contract::setsplits( const std::vector<uint8_t>& splits ) {
        require_initialized();
        require_auth(_config.fee_admin);
        assert_not_paused();
        assert_unlocked();
        check(!splits.empty(), "split options cannot be empty");

        std::vector<uint8_t> sorted = splits;
        std::sort(sorted.begin(), sorted.end());
        for( size_t i = 0; i < sorted.size(); ++i ) {
            check(0 < sorted[i] && sorted[i] <= allocation::max_split_pct, "invalid split percent");
            check(i == 0 || sorted[i] != sorted[i - 1], "duplicate split percent");
        }

        _config.split_options = sorted;
        _config_singleton.set( _config, get_self() );
    }

    void router_contract::setauth( const name& caller, bool authorized ) {
        require_initialized();
        require_auth(_config.caller_admin);
        assert_not_paused();
        assert_unlocked();

        callers_table callers(get_self(), get_self().value);
        auto itr = callers.find(caller.value);
        if( authorized ) {
            check(is_account(caller), "caller must be an existing account");
            check(itr == callers.end(), "caller already authorized");
            callers.emplace(get_self(), [&]( auto& row ) {
                row.account = caller;
            });
        } else {
            check(itr != callers.end(), "caller not found");
            callers.erase(itr);
        }

        logauth_action logauth_act{ get_self(), { get_self(), active_permission } };
        logauth_act.send( caller, authorized );
    }

    void router_contract::pause() {
        require_initialized();
        require_auth(_config.emergency_admin);
        assert_unlocked();
        check(!_state.paused, "already paused");

        _state.paused = true;
        save_state();

        logpause_action logpause_act{ get_self(), { get_self(), active_permission } };
        logpause_act.send( true );
    }

    void router_contract::unpause() {
        require_initialized();
        require_auth(_config.emergency_admin);
        assert_unlocked();
        check(_state.paused, "not paused");

        _state.paused = false;
        save_state();

        logpause_action logpause_act{ get_self(), { get_self(), active_permission } };
        logpause_act.send( false );
    }

    void router_contract::emergencywd( const name& to, const extended_asset& quantity, const std::string& memo ) {
        require_initialized();
        require_auth(_config.emergency_admin);
        assert_unlocked();
        check(is_account(to), "to account does not exist");
        check(to != get_self(), "cannot withdraw to self");
        check(quantity.quantity.is_valid(), "invalid quantity");
        check(quantity.quantity.amount > 0, "quantity must be positive");
        check(memo.size() <= max_memo_size, "memo has more than 256 bytes");
        check(custody_balance(quantity.get_extended_symbol()) >= quantity.quantity, "insufficient custody balance");

        send_transfer(to, quantity, memo);

        logemergwd_action logemergwd_act{ get_self(), { get_self(), active_permission } };
        logemergwd_act.send( to, quantity, memo );
    }

    void router_contract::unlock() {
        require_auth(get_self());
        check(_state.locked, "no distribution in progress");

        _state.locked = false;
        save_state();
    }

    fee_config router_contract::getfeecfg() {
        require_initialized();
        return fee_config{ _config.fee_recipient, _config.fee_bps, _config.max_fee_bps,
                           _config.protocol_treasury, _config.protocol_fee_bps };
    }

    bool router_contract::isauthorized( const name& caller ) {
        callers_table callers(get_self(), get_self().value);
        return callers.find(caller.value) != callers.end();
    }

    void router_contract::logpref( const name& stakeholder, const name& beneficiary, uint8_t split_pct ) {
        require_auth(get_self());
        require_recipient(stakeholder);
    }

    void router_contract::logshares( const name& stakeholder, const extended_symbol& token, uint64_t shares, uint64_t total_shares ) {
        require_auth(get_self());
        require_recipient(stakeholder);
    }

    void router_contract::logfeecfg( const name& old_recipient, const name& new_recipient, uint16_t old_bps, uint16_t new_bps ) {
        require_auth(get_self());
    }

    void router_contract::logtreasury( const name& old_treasury, const name& new_treasury ) {
        require_auth(get_self());
    }

    void router_contract::logauth( const name& caller, bool authorized ) {
        require_auth(get_self());
        require_recipient(caller);
    }

    void router_contract::logpause( bool paused ) {
        require_auth(get_self());
    }

    void router_contract::logalloc( const name& stakeholder, const name& beneficiary, const extended_asset& yield,
                                    const asset& protocol, const asset& donated, const asset& treasury ) {
        require_auth(get_self());
        require_recipient(stakeholder);
    }

    void router_contract::logdistrib( const name& recipient, const extended_asset& amount, const asset& fee, uint64_t distribution ) {
        require_auth(get_self());
        require_recipient(recipient);
    }

    void router_contract::logemergwd( const name& to, const extended_asset& quantity, const std::string& memo ) {
        require_auth(get_self());
        require_recipient(to);
    }

} // ns yieldrouter
