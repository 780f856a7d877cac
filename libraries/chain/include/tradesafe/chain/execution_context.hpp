/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once

#include <type_traits>
#include <boost/noncopyable.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/chain/types.hpp>

namespace tradesafe { namespace chain {

template<typename T>
using add_clr_t = typename std::add_const<typename std::add_lvalue_reference<T>::type>::type;

class execution_context : boost::noncopyable {
public:
    virtual ~execution_context() {}

    virtual int index_of(name act) const = 0;
    virtual std::string get_acttype_name(name act) const = 0;
    virtual std::vector<name> get_actions() const = 0;
};

}}  // namespace tradesafe::chain
