/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/asset.hpp>
#include <tradesafe/utilities/safemath.hpp>
#include <fc/reflect/variant.hpp>

namespace tradesafe { namespace chain {

symbol
symbol::from_string(const string& from) {
    try {
        auto s = fc::trim(from);

        // Find comma in order to split precision and symbol id
        auto c = s.find(',');
        TRADESAFE_ASSERT(c != string::npos, symbol_type_exception, "Symbol's precision and id should be separated with comma");
        TRADESAFE_ASSERT(s.substr(c + 1, 2) == "S#", symbol_type_exception, "Symbol id should start with S#");

        auto p  = std::stoul(s.substr(0, c));
        auto id = std::stoul(s.substr(c + 3));
        TRADESAFE_ASSERT(p <= max_precision, symbol_type_exception, "Exceed max precision");
        TRADESAFE_ASSERT(id <= std::numeric_limits<uint32_t>::max(), symbol_type_exception, "Exceed max symbol id allowed");

        return symbol(p, id);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(symbol_type_exception, (from));
}

string
symbol::to_string() const {
    auto str = fc::to_string(precision());
    str.append(",S#");
    str.append(fc::to_string(id()));
    return str;
}

asset&
asset::operator+=(const asset& o) {
    TRADESAFE_ASSERT(sym() == o.sym(), asset_type_exception, "addition between two different asset is not allowed");

    auto r = share_type();
    TRADESAFE_ASSERT2(safemath::add(amount_, o.amount(), r), math_overflow_exception,
        "Operations resulted in overflow: {} + {}", amount_, o.amount());
    amount_ = r;
    return *this;
}

asset&
asset::operator-=(const asset& o) {
    TRADESAFE_ASSERT(sym() == o.sym(), asset_type_exception, "subtraction between two different asset is not allowed");

    auto r = share_type();
    TRADESAFE_ASSERT2(safemath::sub(amount_, o.amount(), r), math_overflow_exception,
        "Operations resulted in underflow: {} - {}", amount_, o.amount());
    amount_ = r;
    return *this;
}

string
asset::to_string() const {
    auto str = fc::to_string(amount_);

    if(precision() >= str.size()) {
        auto zeros = precision() - str.size();
        str.insert(0, "0.");
        str.insert(2, zeros, '0');
    }
    else if(precision() > 0) {
        str.insert(str.size() - precision(), 1, '.');
    }

    // special for symbol id with 0(aka. native symbol)
    if(sym_.id() > 0) {
        str.append(" S#");
        str.append(fc::to_string(sym_.id()));
    }
    return str;
}

asset
asset::from_string(const string& from) {
    try {
        string s = fc::trim(from);

        auto amount_str = s;
        auto sym_id     = (symbol_id_type)EMPTY_SYM_ID;

        // Find space in order to split amount and symbol
        auto space_pos = s.find(' ');
        if(space_pos != string::npos) {
            TRADESAFE_ASSERT(s.substr(space_pos + 1, 2) == "S#", asset_type_exception, "Symbol id should start with S#");
            amount_str = s.substr(0, space_pos);
            sym_id     = fc::to_uint64(s.substr(space_pos + 3));
        }
        TRADESAFE_ASSERT(!amount_str.empty() && amount_str[0] != '-', asset_type_exception, "Asset amount cannot be negative");

        // Ensure that if decimal point is used (.), decimal fraction is specified
        auto dot_pos   = amount_str.find('.');
        auto precision = 0u;
        if(dot_pos != string::npos) {
            TRADESAFE_ASSERT((dot_pos != amount_str.size() - 1), asset_type_exception,
                       "Missing decimal fraction after decimal point");
            precision = amount_str.size() - dot_pos - 1;
            amount_str.erase(dot_pos, 1);
        }

        auto amount = fc::to_uint64(amount_str);
        return asset(amount, symbol(precision, sym_id));
    }
    TRADESAFE_CAPTURE_AND_RETHROW(asset_type_exception, (from));
}

}}  // namespace tradesafe::chain
