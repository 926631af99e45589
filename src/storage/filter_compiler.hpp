#pragma once

#include "storage/database.hpp"
#include "storage/filters.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace blockstore::storage {

/**
 * A SQL boolean expression with its positional parameters, in order.
 */
struct SqlFragment {
    std::string sql;
    std::vector<SqlValue> params;

    [[nodiscard]] bool empty() const noexcept { return sql.empty(); }
};

/**
 * FilterCompiler - Translates filter ASTs into SQL fragments against one
 * aliased `blocks` row (e.g. "b" for the block itself, "p" for its
 * joined parent).
 *
 * Property predicates only compare a JSON target whose json_type() fits
 * the comparison value: booleans match true/false, numbers match integer
 * or real, strings match text. A filter on 5 matches JSON 5 and 5.0 but
 * never "5". NotEquals keeps present targets of another type; a missing
 * key or JSON null matches no predicate.
 */
class FilterCompiler {
public:
    explicit FilterCompiler(std::string alias) : alias_(std::move(alias)) {}

    /**
     * Conjunction of the clause's constraints; empty when it has none.
     */
    [[nodiscard]] SqlFragment compile(const WhereClause& where) const;

    [[nodiscard]] SqlFragment compile(const FilterExpression& expression) const;

    [[nodiscard]] SqlFragment compile(const PropertyFilter& filter) const;

    /**
     * SQLite JSON path for segments below a root column, e.g.
     * {"data", "tags", "0"} -> $."data"."tags"[0]
     */
    [[nodiscard]] static std::string json_path(const std::vector<std::string>& segments);

    [[nodiscard]] static std::string_view column_name(JsonRoot root);

private:
    [[nodiscard]] std::string column(std::string_view name) const;

    std::string alias_;
};

/**
 * Join `parts` with " AND ", skipping empty fragments.
 */
[[nodiscard]] SqlFragment conjunction(const std::vector<SqlFragment>& parts);

} // namespace blockstore::storage
