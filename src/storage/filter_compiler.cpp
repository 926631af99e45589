#include "storage/filter_compiler.hpp"

#include <algorithm>
#include <cctype>

namespace blockstore::storage {

namespace {

bool is_index(const std::string& segment) {
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

// json_type() names a target must have to compare against `value`.
const char* json_types(const FilterScalar& value) {
    return std::visit([](const auto& v) -> const char* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return "('true', 'false')";
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            return "('integer', 'real')";
        } else {
            return "('text')";
        }
    }, value);
}

SqlValue to_sql(const FilterScalar& value) {
    return std::visit([](const auto& v) -> SqlValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return int64_t{v ? 1 : 0};
        } else {
            return v;
        }
    }, value);
}

std::optional<FilterScalar> as_scalar(const FilterValue& value) {
    return std::visit([](const auto& v) -> std::optional<FilterScalar> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, FilterList>) {
            return std::nullopt;
        } else {
            return FilterScalar{v};
        }
    }, value);
}

template<typename T>
void append_membership(
    SqlFragment& out,
    const std::string& column,
    const std::vector<T>& values,
    SqlValue (*convert)(const T&)
) {
    if (values.size() == 1) {
        out.sql = column + " = ?";
        out.params.push_back(convert(values.front()));
        return;
    }
    out.sql = column + " IN (";
    for (size_t i = 0; i < values.size(); ++i) {
        out.sql += i == 0 ? "?" : ", ?";
        out.params.push_back(convert(values[i]));
    }
    out.sql += ")";
}

SqlValue uuid_value(const Uuid& id) {
    return id.to_string();
}

SqlValue type_value(const blocks::BlockType& type) {
    return std::string(blocks::type_name(type));
}

} // anonymous namespace

std::string_view FilterCompiler::column_name(JsonRoot root) {
    switch (root) {
        case JsonRoot::Properties: return "properties";
        case JsonRoot::Content: return "content";
        case JsonRoot::Metadata: return "metadata";
    }
    return "properties";
}

std::string FilterCompiler::json_path(const std::vector<std::string>& segments) {
    std::string path = "$";
    for (const auto& segment : segments) {
        if (is_index(segment)) {
            path += "[" + segment + "]";
        } else {
            path += ".\"" + segment + "\"";
        }
    }
    return path;
}

std::string FilterCompiler::column(std::string_view name) const {
    return alias_ + "." + std::string(name);
}

SqlFragment FilterCompiler::compile(const WhereClause& where) const {
    std::vector<SqlFragment> parts;
    if (!where.types.empty()) {
        SqlFragment part;
        append_membership(part, column("type"), where.types, type_value);
        parts.push_back(std::move(part));
    }
    if (!where.parent_ids.empty()) {
        SqlFragment part;
        append_membership(part, column("parent_id"), where.parent_ids, uuid_value);
        parts.push_back(std::move(part));
    }
    if (!where.root_ids.empty()) {
        SqlFragment part;
        append_membership(part, column("root_id"), where.root_ids, uuid_value);
        parts.push_back(std::move(part));
    }
    if (!where.workspace_ids.empty()) {
        SqlFragment part;
        append_membership(part, column("workspace_id"), where.workspace_ids, uuid_value);
        parts.push_back(std::move(part));
    }
    return conjunction(parts);
}

SqlFragment FilterCompiler::compile(const PropertyFilter& filter) const {
    SqlFragment out;
    const std::string target = column(column_name(filter.root()));
    const std::string path = json_path(filter.segments());

    // NULL unless the JSON value has one of `types`.
    auto typed = [&](const char* types) {
        out.params.emplace_back(path);
        out.params.emplace_back(path);
        return "CASE WHEN json_type(" + target + ", ?) IN " + types +
               " THEN json_extract(" + target + ", ?) END";
    };

    switch (filter.op()) {
        case FilterOperator::Equals: {
            // make() guarantees a scalar here
            auto scalar = *as_scalar(filter.value());
            out.sql = typed(json_types(scalar)) + " = ?";
            out.params.push_back(to_sql(scalar));
            break;
        }
        case FilterOperator::NotEquals: {
            auto scalar = *as_scalar(filter.value());
            out.params.emplace_back(path);
            out.sql = "json_type(" + target + ", ?) <> 'null' AND " +
                      typed(json_types(scalar)) + " IS NOT ?";
            out.params.push_back(to_sql(scalar));
            break;
        }
        case FilterOperator::In: {
            const auto& values = std::get<FilterList>(filter.value());
            out.sql = typed(json_types(values.front())) + " IN (";
            for (size_t i = 0; i < values.size(); ++i) {
                out.sql += i == 0 ? "?" : ", ?";
                out.params.push_back(to_sql(values[i]));
            }
            out.sql += ")";
            break;
        }
        case FilterOperator::Contains:
            out.sql = "instr(" + typed("('text')") + ", ?) > 0";
            out.params.emplace_back(std::get<std::string>(filter.value()));
            break;
    }
    return out;
}

SqlFragment FilterCompiler::compile(const FilterExpression& expression) const {
    if (const auto* property = expression.as_property()) {
        return compile(*property);
    }

    const auto& boolean = *expression.as_boolean();
    std::vector<SqlFragment> operands;
    operands.reserve(boolean.operands().size());
    for (const auto& operand : boolean.operands()) {
        operands.push_back(compile(operand));
    }

    SqlFragment out;
    if (boolean.op() == LogicalOperator::Not) {
        out.sql = "NOT (" + operands.front().sql + ")";
        out.params = std::move(operands.front().params);
        return out;
    }

    const char* joiner = boolean.op() == LogicalOperator::And ? " AND " : " OR ";
    out.sql = "(";
    for (size_t i = 0; i < operands.size(); ++i) {
        if (i > 0) out.sql += joiner;
        out.sql += "(" + operands[i].sql + ")";
        out.params.insert(out.params.end(),
                          std::make_move_iterator(operands[i].params.begin()),
                          std::make_move_iterator(operands[i].params.end()));
    }
    out.sql += ")";
    return out;
}

SqlFragment conjunction(const std::vector<SqlFragment>& parts) {
    SqlFragment out;
    for (const auto& part : parts) {
        if (part.empty()) continue;
        if (!out.sql.empty()) out.sql += " AND ";
        out.sql += "(" + part.sql + ")";
        out.params.insert(out.params.end(), part.params.begin(), part.params.end());
    }
    return out;
}

} // namespace blockstore::storage
