#pragma once

#include "core/block_types.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace blockstore::storage {

/**
 * WhereClause - Structural constraints on a block row. Every non-empty
 * list is AND'ed with the others; a list of several values is a
 * membership test.
 */
struct WhereClause {
    std::vector<blocks::BlockType> types;
    std::vector<Uuid> parent_ids;
    std::vector<Uuid> root_ids;
    std::vector<Uuid> workspace_ids;

    [[nodiscard]] bool empty() const noexcept {
        return types.empty() && parent_ids.empty() && root_ids.empty() && workspace_ids.empty();
    }
};

// Comparison value. The alternative decides the SQL type the JSON target
// is cast to: bool and int64_t -> INTEGER, double -> REAL, string -> TEXT.
using FilterScalar = std::variant<bool, int64_t, double, std::string>;
using FilterList = std::vector<FilterScalar>;
using FilterValue = std::variant<bool, int64_t, double, std::string, FilterList>;

enum class FilterOperator { Equals, NotEquals, In, Contains };

enum class LogicalOperator { And, Or, Not };

// Column a property path addresses.
enum class JsonRoot { Properties, Content, Metadata };

/**
 * PropertyFilter - Typed predicate over a JSON path into a block's
 * properties, content or metadata.
 *
 * Paths are dotted: "content.data.category", "properties.groups.0",
 * "metadata.source". A path without a recognized root prefix addresses
 * properties. Purely numeric segments index arrays.
 */
class PropertyFilter {
public:
    /**
     * Validate and build a filter. Fails with ErrorKind::InvalidFilter on
     * an empty path, a scalar `In` value, an empty or mixed `In` list, or
     * a non-string `Contains` value.
     */
    [[nodiscard]] static Result<PropertyFilter, Error> make(
        std::string_view path,
        FilterValue value,
        FilterOperator op = FilterOperator::Equals);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] JsonRoot root() const noexcept { return root_; }
    [[nodiscard]] const std::vector<std::string>& segments() const noexcept { return segments_; }
    [[nodiscard]] const FilterValue& value() const noexcept { return value_; }
    [[nodiscard]] FilterOperator op() const noexcept { return op_; }

private:
    PropertyFilter(std::string path, JsonRoot root, std::vector<std::string> segments,
                   FilterValue value, FilterOperator op)
        : path_(std::move(path)), root_(root), segments_(std::move(segments)),
          value_(std::move(value)), op_(op) {}

    std::string path_;
    JsonRoot root_;
    std::vector<std::string> segments_;  // below the root column
    FilterValue value_;
    FilterOperator op_;
};

class FilterExpression;

/**
 * BooleanFilter - AND / OR over two or more expressions, or NOT over
 * exactly one.
 */
class BooleanFilter {
public:
    [[nodiscard]] static Result<BooleanFilter, Error> make(
        LogicalOperator op,
        std::vector<FilterExpression> operands);

    [[nodiscard]] LogicalOperator op() const noexcept { return op_; }
    [[nodiscard]] const std::vector<FilterExpression>& operands() const noexcept { return operands_; }

private:
    BooleanFilter(LogicalOperator op, std::vector<FilterExpression> operands);

    LogicalOperator op_;
    std::vector<FilterExpression> operands_;
};

/**
 * FilterExpression - Immutable node of the filter AST: either a
 * PropertyFilter leaf or a BooleanFilter. Cheap to copy; nodes are shared.
 */
class FilterExpression {
public:
    FilterExpression(PropertyFilter filter);
    FilterExpression(BooleanFilter filter);

    [[nodiscard]] const PropertyFilter* as_property() const noexcept;
    [[nodiscard]] const BooleanFilter* as_boolean() const noexcept;

private:
    using Node = std::variant<PropertyFilter, BooleanFilter>;
    std::shared_ptr<const Node> node_;
};

/**
 * Constraints evaluated against a block's parent row (single hop).
 */
struct ParentFilter {
    std::optional<WhereClause> where;
    std::optional<FilterExpression> filter;
};

/**
 * Constraints evaluated against a block's root row.
 */
struct RootFilter {
    std::optional<WhereClause> where;
    std::optional<FilterExpression> filter;
};

/**
 * BlockQuery - Everything BlockRepository::query accepts.
 */
struct BlockQuery {
    WhereClause where;
    std::optional<FilterExpression> property_filter;
    std::optional<ParentFilter> parent;
    std::optional<RootFilter> root;
    std::optional<size_t> limit;
    bool include_trashed{false};
};

} // namespace blockstore::storage
