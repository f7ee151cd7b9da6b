#pragma once

#include "store/record_store.hpp"

#include <nlohmann/json.hpp>
#include <string_view>

// In-process evaluation of Query predicates, used by stores without a query
// engine of their own.

// Numbers compare numerically, strings lexicographically. Mixed or missing
// values never satisfy a range predicate.
bool predicate_matches(const nlohmann::json& fields, const Predicate& pred);
bool query_matches(const Record& record, const Query& query);

// Strict weak ordering on the query's sort field; records lacking the field
// sort last, ties broken by id. Values of different JSON types order
// numbers before strings before booleans before anything else.
bool sorts_before(const Record& a, const Record& b, const Query& query);

// Field names end up in SQL and URLs; only [A-Za-z0-9_] is accepted.
bool is_valid_field_name(std::string_view name);
