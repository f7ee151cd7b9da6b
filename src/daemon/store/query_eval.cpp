#include "store/query_eval.hpp"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace {

// -1, 0, 1, or nullopt when the two values are not comparable.
std::optional<int> compare_values(const json& a, const json& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_number_integer() && b.is_number_integer()) {
            auto x = a.get<int64_t>();
            auto y = b.get<int64_t>();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        auto x = a.get<double>();
        auto y = b.get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        auto c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (a.is_boolean() && b.is_boolean()) {
        return static_cast<int>(a.get<bool>()) - static_cast<int>(b.get<bool>());
    }
    return std::nullopt;
}

// Sort rank of a JSON type: values of different types order by rank.
int type_rank(const json& v) {
    if (v.is_number()) return 0;
    if (v.is_string()) return 1;
    if (v.is_boolean()) return 2;
    return 3;
}

// Total order over field values for sorting.
int order_values(const json& a, const json& b) {
    int ra = type_rank(a);
    int rb = type_rank(b);
    if (ra != rb) return ra < rb ? -1 : 1;
    return compare_values(a, b).value_or(0);
}

} // namespace

bool predicate_matches(const json& fields, const Predicate& pred) {
    auto it = fields.find(pred.field);
    if (it == fields.end()) return false;

    auto cmp = compare_values(*it, pred.value);
    if (!cmp) return false;

    switch (pred.op) {
        case PredicateOp::Equal: return *cmp == 0;
        case PredicateOp::GreaterOrEqual: return *cmp >= 0;
    }
    return false;
}

bool query_matches(const Record& record, const Query& query) {
    if (record.type != query.type) return false;
    return std::ranges::all_of(query.predicates, [&](const Predicate& p) {
        return predicate_matches(record.fields, p);
    });
}

bool sorts_before(const Record& a, const Record& b, const Query& query) {
    if (!query.sort_field.empty()) {
        auto ia = a.fields.find(query.sort_field);
        auto ib = b.fields.find(query.sort_field);
        bool has_a = ia != a.fields.end();
        bool has_b = ib != b.fields.end();

        if (has_a && !has_b) return true;
        if (!has_a && has_b) return false;
        if (has_a && has_b) {
            int cmp = order_values(*ia, *ib);
            if (cmp != 0) return query.descending ? cmp > 0 : cmp < 0;
        }
    }
    return a.id < b.id;
}

bool is_valid_field_name(std::string_view name) {
    if (name.empty()) return false;
    return std::ranges::all_of(name, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}
