/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <fc/time.hpp>

namespace tradesafe { namespace chain {

/**
 * Trusted clock consulted by every deadline check
 */
class time_source {
public:
    virtual ~time_source() = default;

public:
    virtual fc::time_point_sec now() const = 0;
};

class system_time_source : public time_source {
public:
    fc::time_point_sec now() const override;
};

/**
 * Clock that only moves when told to
 */
class manual_time_source : public time_source {
public:
    explicit manual_time_source(fc::time_point_sec start);

public:
    fc::time_point_sec now() const override { return now_; }

    void set(fc::time_point_sec t);
    void advance(const fc::microseconds& delta);

private:
    fc::time_point_sec now_;
};

}}  // namespace tradesafe::chain
