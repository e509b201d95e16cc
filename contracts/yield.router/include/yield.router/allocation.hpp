#pragma once

#include <eosio/eosio.hpp>

#include <vector>

/**
 * Fee and split arithmetic shared by every distribution mode. All divisions truncate;
 * callers rely on `net + fee == amount` and `protocol + beneficiary + treasury == user yield`
 * holding exactly, so truncation residue only ever appears in `pro_rata`.
 */
namespace yieldrouter::allocation {

   static constexpr int64_t  bps_precision = 10000; // 100.00%
   static constexpr uint8_t  max_split_pct = 100;

   struct fee_split {
      int64_t  net = 0;
      int64_t  fee = 0;
   };

   struct user_allocation {
      int64_t  protocol    = 0;
      int64_t  beneficiary = 0;
      int64_t  treasury    = 0;
   };

   inline fee_split split_fee( int64_t amount, uint16_t fee_bps ) {
      fee_split result;
      result.fee = int64_t( int128_t(amount) * fee_bps / bps_precision );
      result.net = amount - result.fee;
      return result;
   }

   // floor(total * part / whole); 0 when `whole` is 0
   inline int64_t pro_rata( int64_t total, uint64_t part, uint64_t whole ) {
      if( whole == 0 )
         return 0;
      return int64_t( uint128_t(total) * part / whole );
   }

   /**
    * Split one stakeholder's yield. Without a usable beneficiary the whole net amount is
    * routed to the treasury.
    */
   inline user_allocation allocate( int64_t user_yield, uint16_t protocol_fee_bps, uint8_t split_pct, bool has_beneficiary ) {
      user_allocation result;
      const fee_split protocol = split_fee( user_yield, protocol_fee_bps );
      result.protocol = protocol.fee;
      if( has_beneficiary ) {
         result.beneficiary = int64_t( int128_t(protocol.net) * split_pct / max_split_pct );
      }
      result.treasury = protocol.net - result.beneficiary;
      return result;
   }

   // `count` equal parts of `net`; the truncation remainder goes to the first part
   inline std::vector<int64_t> equal_parts( int64_t net, size_t count ) {
      std::vector<int64_t> parts;
      if( count == 0 )
         return parts;
      const int64_t each = net / int64_t(count);
      parts.assign( count, each );
      parts[0] += net - each * int64_t(count);
      return parts;
   }

} // namespace yieldrouter::allocation
