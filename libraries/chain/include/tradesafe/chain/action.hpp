/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <any>
#include <type_traits>
#include <tradesafe/chain/types.hpp>
#include <tradesafe/chain/exceptions.hpp>

namespace tradesafe { namespace chain {

class apply_context;

/**
 * One operation submitted by an authenticated party
 */
struct action {
public:
    action_name     name;
    public_key_type signer;
    bytes           data;

public:
    action() : index_(-1) {}

    // don't copy cache_ when in copy ctor.
    action(const action& lhs)
        : name(lhs.name)
        , signer(lhs.signer)
        , data(lhs.data)
        , index_(lhs.index_)
        , cache_() {}

    action(action&& lhs) noexcept = default;

    action& operator=(const action& lhs) {
        if(this != &lhs) { // self-assignment check expected
            name   = lhs.name;
            signer = lhs.signer;
            data   = lhs.data;
            index_ = lhs.index_;
            cache_.reset();
        }
        return *this;
    }

    action& operator=(action&& lhs) noexcept {
        if(this != &lhs) { // self-assignment check expected
            name   = lhs.name;
            signer = std::move(lhs.signer);
            data   = std::move(lhs.data);
            index_ = lhs.index_;
            cache_ = std::move(lhs.cache_);
        }
        return *this;
    }

public:
    template<typename T>
    action(const public_key_type& signer, const T& value)
        : name(T::get_action_name())
        , signer(signer)
        , data(fc::raw::pack(value))
        , index_(-1)
        , cache_(std::make_any<T>(value)) {}

    action(const action_name name, const public_key_type& signer, const bytes& data)
        : name(name)
        , signer(signer)
        , data(data)
        , index_(-1) {}

    template<typename T>
    void
    set_data(const T& value) {
        data   = fc::raw::pack(value);
        cache_ = std::make_any<T>(value);
    }

    // if T is a reference, will return the reference to the internal cache value
    // Otherwise if T is a value type, will return new copy. 
    template <typename T>
    T
    data_as() const {
        if(!cache_.has_value()) {
            using raw_type = std::remove_const_t<std::remove_reference_t<T>>;
            TRADESAFE_ASSERT(name == raw_type::get_action_name(), action_type_exception, "action name is not consistent with action struct");
            try {
                cache_ = std::make_any<raw_type>(fc::raw::unpack<raw_type>(data));
            }
            TRADESAFE_CAPTURE_AND_RETHROW(action_type_exception, (name));
        }
        // no need to check name here, `any_cast` will throws exception if types don't match
        return std::any_cast<T>(cache_);
    }

private:
    mutable int      index_;
    mutable std::any cache_;

private:
    friend class apply_context;
};

}}  // namespace tradesafe::chain

FC_REFLECT(tradesafe::chain::action, (name)(signer)(data));
