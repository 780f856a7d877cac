/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once

#include <algorithm>
#include <array>
#include <functional>
#include <string>
#include <type_traits>

#include <boost/hana.hpp>

#include <tradesafe/chain/execution_context.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/chain/types.hpp>
#include <tradesafe/chain/contracts/types.hpp>

namespace hana = boost::hana;

namespace tradesafe { namespace chain {

/**
 * Compile-time registry of action types, indexed by sorted action name
 */
template<typename ... ACTTYPE>
class execution_context_impl : public execution_context {
public:
    execution_context_impl() {
        act_names_arr_ = hana::unpack(act_names_, [](auto ...i) {
            return std::array<uint64_t, sizeof...(i)>{{i...}};
        });

        hana::for_each(act_types_, [&](auto& act) {
            using ty = typename decltype(+act)::type;

            auto i = index_of(ty::get_action_name());
            type_names_[i] = ty::get_type_name();
        });
    }

    ~execution_context_impl() override {}

public:
    int
    index_of(name act) const override {
        auto& arr = act_names_arr_;
        auto it   = std::lower_bound(std::cbegin(arr), std::cend(arr), act.value);
        TRADESAFE_ASSERT(it != std::cend(arr) && *it == act.value, unknown_action_exception, "Unknown action: ${act}", ("act", act));

        return std::distance(std::cbegin(arr), it);
    }

    std::string
    get_acttype_name(name act) const override {
        return type_names_[index_of(act)];
    }

    std::vector<name>
    get_actions() const override {
        auto acts = std::vector<name>();
        acts.reserve(act_names_arr_.size());

        for(auto v : act_names_arr_) {
            acts.emplace_back(name(v));
        }
        return acts;
    }

    template <template<uint64_t> typename Invoker, typename RType, typename ... Args>
    RType
    invoke(int actindex, Args&&... args) const {
        using opt_type = std::conditional_t<std::is_void<RType>::value, int, RType>;

        auto fn = [&](auto i) -> std::optional<opt_type> {
            auto name = act_names_[i];
            auto acts = hana::filter(act_types_,
                [&](auto& t) { return hana::equal(name, hana::ulong_c<decltype(+t)::type::get_action_name().value>); });

            static_assert(hana::length(acts)() == hana::size_c<1>(), "each action name maps to exactly one type");

            auto result = std::optional<opt_type>();
            hana::for_each(acts, [&](auto v) {
                using ty = typename decltype(+v)::type;

                constexpr auto n = ty::get_action_name().value;
                if constexpr (std::is_void<RType>::value) {
                    Invoker<n>::template invoke<ty>(std::forward<Args>(args)...);
                    result = 1;
                }
                else {
                    result = Invoker<n>::template invoke<ty>(std::forward<Args>(args)...);
                }
            });

            return result;
        };

        auto range  = hana::make_range(hana::int_c<0>, hana::length(act_names_));
        auto result = std::optional<opt_type>();
        hana::for_each(range, [&](auto i) {
            if(i() == actindex) {
                result = fn(i);
            }
        });

        TRADESAFE_ASSERT(result.has_value(), unknown_action_exception, "Invalid action index: ${act}", ("act", actindex));
        if constexpr (!std::is_void<RType>::value) {
            return *result;
        }
    }

private:
    static constexpr auto act_types_ = hana::make_tuple(hana::type_c<ACTTYPE>...);
    static constexpr auto act_names_ = hana::sort(hana::unique(hana::transform(act_types_, [](auto& a) { return hana::ulong_c<decltype(+a)::type::get_action_name().value>; })));

private:
    std::array<uint64_t, hana::length(act_names_)>    act_names_arr_;
    std::array<std::string, hana::length(act_names_)> type_names_;
};

using escrow_execution_context = execution_context_impl<
                                     contracts::createescrow,
                                     contracts::fundescrow,
                                     contracts::markfiatpaid,
                                     contracts::updseqaddr,
                                     contracts::releaseesc,
                                     contracts::cancelescrow,
                                     contracts::autocancel,
                                     contracts::initbuyerbond,
                                     contracts::initsellerbnd,
                                     contracts::opendispute,
                                     contracts::respdispute,
                                     contracts::defaultjudge,
                                     contracts::resolvedisp,
                                     contracts::closeescrow,
                                     contracts::transferft
                                 >;

}}  // namespace tradesafe::chain
