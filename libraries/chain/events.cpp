/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/events.hpp>

namespace tradesafe { namespace chain {

namespace internal {

struct header_visitor : public fc::visitor<const event_header&> {
    template <typename T>
    const event_header&
    operator()(const T& ev) const {
        return ev;
    }
};

}  // namespace internal

const event_header&
get_event_header(const escrow_event& ev) {
    return ev.visit(internal::header_visitor());
}

const char*
get_event_name(const escrow_event& ev) {
    static const char* names[] = {
        "EscrowCreated",
        "FundsDeposited",
        "FiatMarkedPaid",
        "EscrowReleased",
        "EscrowCancelled",
        "DisputeOpened",
        "DisputeResponseSubmitted",
        "DisputeResolved",
        "DisputeDefaultJudgment"
    };
    return names[ev.which()];
}

}}  // namespace tradesafe::chain
