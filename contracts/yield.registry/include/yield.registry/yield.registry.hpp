#pragma once

#include <eosio/asset.hpp>
#include <eosio/contract.hpp>
#include <eosio/eosio.hpp>
#include <eosio/name.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>

namespace yieldregistry {
    using eosio::check;
    using eosio::contract;
    using eosio::extended_asset;
    using eosio::name;
    using eosio::datastream;
    using eosio::time_point_sec;
    using eosio::same_payer;

    struct [[eosio::table("state"), eosio::contract("yield.registry")]] registry_state {
        name    router;                 // only account allowed to record receipts
        name    default_beneficiary;    // beneficiary used by single-recipient distributions

        EOSLIB_SERIALIZE (registry_state, (router)(default_beneficiary))
    };

    using registry_state_singleton = eosio::singleton< "state"_n, registry_state >;

    struct [[eosio::table("benefs"), eosio::contract("yield.registry")]] beneficiary_info {
        name            account;
        bool            approved = false;
        uint64_t        receipts = 0;       // number of recorded receipts
        time_point_sec  last_receipt;

        uint64_t    primary_key() const { return account.value; }
    };
    using beneficiaries_table = eosio::multi_index<"benefs"_n, beneficiary_info>;

    // token contract in the high 64 bits, symbol code in the low ones
    inline uint128_t token_key( const eosio::extended_symbol& token ) {
        return (uint128_t(token.get_contract().value) << 64) | token.get_symbol().code().raw();
    }

    /**
     * Cumulative amount received by a beneficiary in one token, scoped by beneficiary.
     * The same symbol issued by two token contracts is kept in two rows.
     */
    struct [[eosio::table("receipts"), eosio::contract("yield.registry")]] receipt_total {
        uint64_t        id;
        extended_asset  total;

        uint64_t    primary_key() const { return id; }
        uint128_t   by_token() const { return token_key(total.get_extended_symbol()); }
    };
    using receipts_table = eosio::multi_index<"receipts"_n, receipt_total,
        eosio::indexed_by<"bytoken"_n, eosio::const_mem_fun<receipt_total, uint128_t, &receipt_total::by_token>>
    >;

    /**
     * Registry of beneficiaries that stakeholders may direct their yield to. Approval is
     * granted and revoked by the registry account; the configured router reports every
     * payment it makes so that cumulative totals can be audited per beneficiary.
     **/
    class [[eosio::contract("yield.registry")]] registry_contract : public contract {
        using contract::contract;

        public:
            registry_contract( name s, name code, datastream<const char*> ds );

            /**
             * Set the router account allowed to call `recordrcpt`.
             *
             * @pre router account exists
             * */
            [[eosio::action]]
            void setrouter(const name& router);

            /**
             * Approve a beneficiary. Approving an already approved account fails.
             *
             * @pre `beneficiary` account exists
             * */
            [[eosio::action]]
            void approve(const name& beneficiary);

            /**
             * Revoke approval. Cumulative totals are kept. Revoking the default beneficiary
             * also clears the default.
             * */
            [[eosio::action]]
            void revoke(const name& beneficiary);

            /**
             * Set the default beneficiary. An empty name clears it.
             *
             * @pre `beneficiary` is approved
             * */
            [[eosio::action]]
            void setdefault(const name& beneficiary);

            /**
             * Bookkeeping hook called by the router after each successful payment.
             *
             * @pre authority of the configured router
             * @pre `quantity` is positive
             * */
            [[eosio::action]]
            void recordrcpt(const name& beneficiary, const extended_asset& quantity);

            using recordrcpt_action = eosio::action_wrapper<"recordrcpt"_n, &registry_contract::recordrcpt>;

            static bool is_approved( const name& registry, const name& beneficiary ) {
                beneficiaries_table benefs( registry, registry.value );
                auto itr = benefs.find( beneficiary.value );
                return itr != benefs.end() && itr->approved;
            }

            // Returns the default beneficiary or an empty name if none is set
            static name get_default( const name& registry ) {
                registry_state_singleton state( registry, registry.value );
                return state.exists() ? state.get().default_beneficiary : name{};
            }

        private:
            registry_state_singleton _state_singleton;
            registry_state           _state;
            beneficiaries_table      _benefs;

    }; // registry_contract

} // ns yieldregistry
