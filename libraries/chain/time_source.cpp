/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/time_source.hpp>
#include <tradesafe/chain/exceptions.hpp>

namespace tradesafe { namespace chain {

fc::time_point_sec
system_time_source::now() const {
    return fc::time_point_sec(fc::time_point::now());
}

manual_time_source::manual_time_source(fc::time_point_sec start)
    : now_(start) {}

void
manual_time_source::set(fc::time_point_sec t) {
    TRADESAFE_ASSERT(t >= now_, misc_exception, "Clock cannot move backwards");
    now_ = t;
}

void
manual_time_source::advance(const fc::microseconds& delta) {
    TRADESAFE_ASSERT(delta.count() >= 0, misc_exception, "Clock cannot move backwards");
    now_ = now_ + delta;
}

}}  // namespace tradesafe::chain
