#pragma once

#include <eosio/asset.hpp>
#include <eosio/contract.hpp>
#include <eosio/eosio.hpp>
#include <eosio/name.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <yield.router/allocation.hpp>
#include <yield.registry/yield.registry.hpp>

#include <string>
#include <vector>

namespace yieldrouter {
    using eosio::asset;
    using eosio::check;
    using eosio::const_mem_fun;
    using eosio::contract;
    using eosio::datastream;
    using eosio::extended_asset;
    using eosio::extended_symbol;
    using eosio::indexed_by;
    using eosio::name;
    using eosio::same_payer;
    using eosio::symbol;
    using eosio::time_point_sec;
    using yieldregistry::registry_contract;

    static constexpr name     active_permission = "active"_n;
    static constexpr uint16_t max_bps           = allocation::bps_precision;
    static constexpr size_t   max_equal_split   = 50;
    static constexpr size_t   max_memo_size     = 256;

    inline uint128_t token_key( const extended_symbol& token ) {
        return (uint128_t(token.get_contract().value) << 64) | token.get_symbol().raw();
    }

    struct [[eosio::table("config"), eosio::contract("yield.router")]] router_config {
        name                    registry;               // beneficiary registry contract
        name                    fee_recipient;          // fee sink, also the fallback treasury
        uint16_t                fee_bps = 0;
        uint16_t                max_fee_bps = 0;        // fixed at init
        name                    protocol_treasury;
        uint16_t                protocol_fee_bps = 0;   // fixed at init
        std::vector<uint8_t>    split_options;          // accepted `split_pct` values
        name                    fee_admin;
        name                    caller_admin;
        name                    emergency_admin;

        EOSLIB_SERIALIZE (router_config, (registry)(fee_recipient)(fee_bps)(max_fee_bps)(protocol_treasury)
                                         (protocol_fee_bps)(split_options)(fee_admin)(caller_admin)(emergency_admin))
    };

    using config_singleton = eosio::singleton< "config"_n, router_config >;

    struct [[eosio::table("state"), eosio::contract("yield.router")]] router_state {
        bool        paused = false;
        bool        locked = false;             // set for the duration of a distribution pass
        uint64_t    total_distributions = 0;

        EOSLIB_SERIALIZE (router_state, (paused)(locked)(total_distributions))
    };

    using state_singleton = eosio::singleton< "state"_n, router_state >;

    /**
     * One row per distributable asset. Holds the share total, the size of the active index
     * and the cumulative distribution counters, which only ever grow.
     */
    struct [[eosio::table("pools"), eosio::contract("yield.router")]] pool_info {
        uint64_t            id;
        extended_symbol     token;
        uint64_t            total_shares = 0;
        uint64_t            members = 0;
        asset               total_donated;
        asset               total_fee_collected;
        asset               total_protocol_fees;

        uint64_t    primary_key() const { return id; }
        uint128_t   by_token() const { return token_key(token); }
    };
    using pools_table = eosio::multi_index< "pools"_n, pool_info,
                            indexed_by<"bytoken"_n, const_mem_fun<pool_info, uint128_t, &pool_info::by_token>>
                        >;

    // scope: pool id. A row exists iff the stakeholder's share balance is nonzero.
    struct [[eosio::table("shares"), eosio::contract("yield.router")]] share_entry {
        name        stakeholder;
        uint64_t    shares = 0;
        uint64_t    slot = 0;       // position in `members`

        uint64_t    primary_key() const { return stakeholder.value; }
    };
    using shares_table = eosio::multi_index< "shares"_n, share_entry >;

    // scope: pool id. Dense active index, slots 0..members-1, swap-and-pop removal.
    struct [[eosio::table("members"), eosio::contract("yield.router")]] member_slot {
        uint64_t    slot;
        name        stakeholder;

        uint64_t    primary_key() const { return slot; }
    };
    using members_table = eosio::multi_index< "members"_n, member_slot >;

    struct [[eosio::table("prefs"), eosio::contract("yield.router")]] allocation_pref {
        name            stakeholder;
        name            beneficiary;
        uint8_t         split_pct = 0;
        time_point_sec  updated_at;

        uint64_t    primary_key() const { return stakeholder.value; }
    };
    using prefs_table = eosio::multi_index< "prefs"_n, allocation_pref >;

    struct [[eosio::table("callers"), eosio::contract("yield.router")]] authorized_caller {
        name        account;

        uint64_t    primary_key() const { return account.value; }
    };
    using callers_table = eosio::multi_index< "callers"_n, authorized_caller >;

    // `accounts` table of an eosio.token compatible contract, scoped by owner
    struct token_account {
        asset       balance;

        uint64_t    primary_key() const { return balance.symbol.code().raw(); }
    };
    using token_accounts = eosio::multi_index< "accounts"_n, token_account >;

    struct dist_result {
        asset       net;
        asset       fee;

        EOSLIB_SERIALIZE (dist_result, (net)(fee))
    };

    struct pool_stats {
        uint64_t    total_shares = 0;
        uint64_t    members = 0;
        asset       total_donated;
        asset       total_fee_collected;
        asset       total_protocol_fees;
        uint64_t    total_distributions = 0;

        EOSLIB_SERIALIZE (pool_stats, (total_shares)(members)(total_donated)(total_fee_collected)
                                      (total_protocol_fees)(total_distributions))
    };

    struct fee_config {
        name        fee_recipient;
        uint16_t    fee_bps = 0;
        uint16_t    max_fee_bps = 0;
        name        protocol_treasury;
        uint16_t    protocol_fee_bps = 0;

        EOSLIB_SERIALIZE (fee_config, (fee_recipient)(fee_bps)(max_fee_bps)(protocol_treasury)(protocol_fee_bps))
    };

    /**
     * The `yield.router` contract splits yield held in its custody between stakeholders' chosen
     * beneficiaries, a fallback treasury and a protocol fee sink.
     *
     * Custody callers report share balances per asset with `setshares` and hand over yield with one of
     * the three distribution actions. Stakeholders pick a beneficiary and the percentage of their net
     * yield it receives with `setpref`. Every payment is an inline transfer on the asset's token
     * contract, so a failed transfer reverts the whole pass. While a pass is in flight the `locked`
     * flag rejects every mutating action; the pass clears it with a trailing inline `unlock`.
     */
    class [[eosio::contract("yield.router")]] router_contract : public contract {
        using contract::contract;

        public:
            router_contract( name s, name code, datastream<const char*> ds );

            /**
             * Initialize the router.
             *
             * @param registry - beneficiary registry contract,
             * @param fee_recipient - receives fees and treasury routed yield,
             * @param protocol_treasury - receives the protocol fee,
             * @param fee_bps - fee rate of single and equal split distributions,
             * @param max_fee_bps - ceiling for `fee_bps`, cannot be changed later,
             * @param protocol_fee_bps - protocol fee rate of proportional distributions, cannot be changed later.
             *
             * @pre router was not initialized before
             * @post accepted split percentages are 50, 75 and 100, every admin role is the contract account
             */
            [[eosio::action]]
            void init( const name& registry, const name& fee_recipient, const name& protocol_treasury,
                       uint16_t fee_bps, uint16_t max_fee_bps, uint16_t protocol_fee_bps );

            /**
             * Assign the admin roles. Only the contract account can do this.
             */
            [[eosio::action]]
            void setroles( const name& fee_admin, const name& caller_admin, const name& emergency_admin );

            /**
             * Change the fee recipient and fee rate together.
             *
             * @pre authority of the fee admin
             * @pre `fee_bps` does not exceed `max_fee_bps`
             */
            [[eosio::action]]
            void updatefee( const name& fee_recipient, uint16_t fee_bps );

            /**
             * Change the protocol treasury. Requires the fee admin.
             */
            [[eosio::action]]
            void settreasury( const name& treasury );

            /**
             * Replace the set of accepted split percentages. Requires the fee admin.
             */
            [[eosio::action]]
            void setsplits( const std::vector<uint8_t>& splits );

            /**
             * Grant or revoke permission to call `setshares` and the distribution actions.
             * Requires the caller admin.
             */
            [[eosio::action]]
            void setauth( const name& caller, bool authorized );

            [[eosio::action]]
            void pause();

            [[eosio::action]]
            void unpause();

            /**
             * Move tokens out of custody when they cannot be distributed. Works while paused.
             *
             * @pre authority of the emergency admin
             */
            [[eosio::action]]
            void emergencywd( const name& to, const extended_asset& quantity, const std::string& memo );

            /**
             * Set the calling stakeholder's beneficiary and the percentage of net yield it receives.
             *
             * @pre `beneficiary` is approved in the registry
             * @pre `split_pct` is one of the accepted split percentages
             */
            [[eosio::action]]
            void setpref( const name& stakeholder, const name& beneficiary, uint8_t split_pct );

            /**
             * Report the share balance of `stakeholder` for `token`. Maintains the per asset total and
             * active index. Setting the current value again changes nothing.
             *
             * @pre `caller` is an authorized caller
             */
            [[eosio::action]]
            void setshares( const name& caller, const name& stakeholder, const extended_symbol& token, uint64_t shares );

            /**
             * Pay `yield` less the fee to the registry's default beneficiary.
             */
            [[eosio::action]]
            void distsingle( const name& caller, const extended_asset& yield );

            /**
             * Pay `yield` less the fee in equal parts to `beneficiaries`. The remainder of the
             * integer division goes to the first beneficiary.
             */
            [[eosio::action]]
            void distequal( const name& caller, const extended_asset& yield, const std::vector<name>& beneficiaries );

            /**
             * Proportional distribution: every stakeholder in the active index gets
             * floor(yield * shares / total_shares), split into protocol fee, beneficiary and treasury
             * parts by its preference. With no shares outstanding it behaves like `distsingle`,
             * except that a missing or unapproved default beneficiary routes the yield to the fee
             * recipient. Truncation dust stays in custody, and a pass in which every stakeholder's
             * part truncates to zero moves nothing and is not counted.
             */
            [[eosio::action]]
            void distribute( const name& caller, const extended_asset& yield );

            // closes the distribution pass opened by the action that sent it
            [[eosio::action]]
            void unlock();

            // read-only queries
            [[eosio::action]]
            allocation_pref getpref( const name& stakeholder );

            [[eosio::action]]
            uint64_t getshares( const name& stakeholder, const extended_symbol& token );

            [[eosio::action]]
            dist_result calcdist( const asset& quantity );

            [[eosio::action]]
            pool_stats getstats( const extended_symbol& token );

            [[eosio::action]]
            fee_config getfeecfg();

            [[eosio::action]]
            bool isauthorized( const name& caller );

            // audit log, sent inline by the router to itself
            [[eosio::action]]
            void logpref( const name& stakeholder, const name& beneficiary, uint8_t split_pct );

            [[eosio::action]]
            void logshares( const name& stakeholder, const extended_symbol& token, uint64_t shares, uint64_t total_shares );

            [[eosio::action]]
            void logfeecfg( const name& old_recipient, const name& new_recipient, uint16_t old_bps, uint16_t new_bps );

            [[eosio::action]]
            void logtreasury( const name& old_treasury, const name& new_treasury );

            [[eosio::action]]
            void logauth( const name& caller, bool authorized );

            [[eosio::action]]
            void logpause( bool paused );

            /**
             * Per stakeholder result of a proportional pass.
             *
             * @param stakeholder - the share holder,
             * @param beneficiary - resolved beneficiary, empty when the net yield went to the treasury,
             * @param yield - the stakeholder's pro rata part of the pass,
             * @param protocol - protocol fee part,
             * @param donated - beneficiary part,
             * @param treasury - treasury part.
             */
            [[eosio::action]]
            void logalloc( const name& stakeholder, const name& beneficiary, const extended_asset& yield,
                           const asset& protocol, const asset& donated, const asset& treasury );

            /**
             * One record per outgoing distribution transfer.
             *
             * @param recipient - receiver of the transfer,
             * @param amount - amount transferred,
             * @param fee - fee withheld on behalf of this transfer,
             * @param distribution - running distribution counter.
             */
            [[eosio::action]]
            void logdistrib( const name& recipient, const extended_asset& amount, const asset& fee, uint64_t distribution );

            [[eosio::action]]
            void logemergwd( const name& to, const extended_asset& quantity, const std::string& memo );

            using unlock_action      = eosio::action_wrapper<"unlock"_n, &router_contract::unlock>;
            using logpref_action     = eosio::action_wrapper<"logpref"_n, &router_contract::logpref>;
            using logshares_action   = eosio::action_wrapper<"logshares"_n, &router_contract::logshares>;
            using logfeecfg_action   = eosio::action_wrapper<"logfeecfg"_n, &router_contract::logfeecfg>;
            using logtreasury_action = eosio::action_wrapper<"logtreasury"_n, &router_contract::logtreasury>;
            using logauth_action     = eosio::action_wrapper<"logauth"_n, &router_contract::logauth>;
            using logpause_action    = eosio::action_wrapper<"logpause"_n, &router_contract::logpause>;
            using logalloc_action    = eosio::action_wrapper<"logalloc"_n, &router_contract::logalloc>;
            using logdistrib_action  = eosio::action_wrapper<"logdistrib"_n, &router_contract::logdistrib>;
            using logemergwd_action  = eosio::action_wrapper<"logemergwd"_n, &router_contract::logemergwd>;

        private:
            config_singleton    _config_singleton;
            router_config       _config;
            state_singleton     _state_singleton;
            router_state        _state;
            pools_table         _pools;

            // defined in yield.router.cpp
            void require_initialized() const;
            void assert_unlocked() const;
            void assert_not_paused() const;
            void enter( const name& caller );
            void save_state();
            bool beneficiary_approved( const name& beneficiary ) const;
            asset custody_balance( const extended_symbol& token ) const;
            void send_transfer( const name& to, const extended_asset& quantity, const std::string& memo );

            // defined in shares.cpp
            pools_table::const_iterator find_pool( const extended_symbol& token ) const;
            pools_table::const_iterator find_or_create_pool( const extended_symbol& token );
            void remove_member( members_table& members, shares_table& shares, uint64_t slot, uint64_t last );

            // defined in distribute.cpp
            pools_table::const_iterator open_pass( const name& caller, const extended_asset& yield );
            void close_pass();
            uint64_t next_distribution();
            void pay_beneficiary( const name& beneficiary, const extended_asset& amount, const asset& fee,
                                  uint64_t distribution, const std::string& memo );
            void pay_fee( const extended_asset& fee, uint64_t distribution );
            void pay_single( pools_table::const_iterator pool, const extended_asset& yield, const name& beneficiary );
            void pay_fee_recipient( pools_table::const_iterator pool, const extended_asset& yield );

    }; // router_contract

} // ns yieldrouter
