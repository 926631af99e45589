#include "storage/filters.hpp"

#include <algorithm>
#include <cctype>

namespace blockstore::storage {

namespace {

Error invalid(std::string message) {
    return Error{ErrorKind::InvalidFilter, std::move(message)};
}

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        auto dot = path.find('.', start);
        if (dot == std::string_view::npos) dot = path.size();
        auto segment = path.substr(start, dot - start);
        if (!segment.empty()) {
            segments.emplace_back(segment);
        }
        start = dot + 1;
    }
    return segments;
}

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

const char* scalar_kind(const FilterScalar& value) {
    switch (value.index()) {
        case 0: return "bool";
        case 1: return "int";
        case 2: return "float";
        default: return "string";
    }
}

// Every element must have the first element's type, except that ints
// are accepted (and widened) in a float list.
Result<FilterList, Error> normalize_list(FilterList values) {
    if (values.empty()) {
        return Result<FilterList, Error>::err(
            invalid("PropertyFilter with operator 'in' requires at least one value"));
    }
    const bool floats = std::holds_alternative<double>(values.front());
    for (auto& value : values) {
        if (floats && std::holds_alternative<int64_t>(value)) {
            value = static_cast<double>(std::get<int64_t>(value));
            continue;
        }
        if (value.index() != values.front().index()) {
            return Result<FilterList, Error>::err(invalid(
                std::string("PropertyFilter 'in' list mixes ") + scalar_kind(values.front()) +
                " and " + scalar_kind(value) + " values"));
        }
    }
    return Result<FilterList, Error>::ok(std::move(values));
}

} // anonymous namespace

Result<PropertyFilter, Error> PropertyFilter::make(
    std::string_view path,
    FilterValue value,
    FilterOperator op
) {
    if (is_blank(path)) {
        return Result<PropertyFilter, Error>::err(invalid("PropertyFilter.path cannot be empty"));
    }

    auto segments = split_path(path);
    if (segments.empty()) {
        return Result<PropertyFilter, Error>::err(invalid("JSON path cannot be empty"));
    }
    for (const auto& segment : segments) {
        if (segment.find('"') != std::string::npos) {
            return Result<PropertyFilter, Error>::err(
                invalid("JSON path segment may not contain '\"': " + segment));
        }
    }

    JsonRoot root = JsonRoot::Properties;
    if (segments.front() == "properties") {
        segments.erase(segments.begin());
    } else if (segments.front() == "content") {
        root = JsonRoot::Content;
        segments.erase(segments.begin());
    } else if (segments.front() == "metadata") {
        root = JsonRoot::Metadata;
        segments.erase(segments.begin());
    }

    auto* list = std::get_if<FilterList>(&value);
    switch (op) {
        case FilterOperator::In: {
            if (!list) {
                return Result<PropertyFilter, Error>::err(
                    invalid("PropertyFilter with operator 'in' expects a list value"));
            }
            auto normalized = normalize_list(std::move(*list));
            if (normalized.is_err()) {
                return Result<PropertyFilter, Error>::err(normalized.unwrap_err());
            }
            value = std::move(normalized).unwrap();
            break;
        }
        case FilterOperator::Contains:
            if (!std::holds_alternative<std::string>(value)) {
                return Result<PropertyFilter, Error>::err(
                    invalid("PropertyFilter with operator 'contains' expects a string value"));
            }
            break;
        case FilterOperator::Equals:
        case FilterOperator::NotEquals:
            if (list) {
                return Result<PropertyFilter, Error>::err(
                    invalid("PropertyFilter equality expects a scalar value"));
            }
            break;
    }

    return Result<PropertyFilter, Error>::ok(
        PropertyFilter(std::string(path), root, std::move(segments), std::move(value), op));
}

BooleanFilter::BooleanFilter(LogicalOperator op, std::vector<FilterExpression> operands)
    : op_(op), operands_(std::move(operands)) {}

Result<BooleanFilter, Error> BooleanFilter::make(
    LogicalOperator op,
    std::vector<FilterExpression> operands
) {
    if (operands.empty()) {
        return Result<BooleanFilter, Error>::err(
            invalid("BooleanFilter requires at least one operand"));
    }
    if (op == LogicalOperator::Not && operands.size() != 1) {
        return Result<BooleanFilter, Error>::err(invalid("NOT requires exactly one operand"));
    }
    if (op != LogicalOperator::Not && operands.size() < 2) {
        return Result<BooleanFilter, Error>::err(invalid(
            std::string(op == LogicalOperator::And ? "AND" : "OR") +
            " requires two or more operands"));
    }
    return Result<BooleanFilter, Error>::ok(BooleanFilter(op, std::move(operands)));
}

FilterExpression::FilterExpression(PropertyFilter filter)
    : node_(std::make_shared<Node>(std::move(filter))) {}

FilterExpression::FilterExpression(BooleanFilter filter)
    : node_(std::make_shared<Node>(std::move(filter))) {}

const PropertyFilter* FilterExpression::as_property() const noexcept {
    return std::get_if<PropertyFilter>(node_.get());
}

const BooleanFilter* FilterExpression::as_boolean() const noexcept {
    return std::get_if<BooleanFilter>(node_.get());
}

} // namespace blockstore::storage
