#include <catch2/catch_test_macros.hpp>
#include "storage/filter_compiler.hpp"
#include "storage/filters.hpp"

using namespace blockstore;
using namespace blockstore::blocks;
using namespace blockstore::storage;

namespace {

PropertyFilter property(std::string_view path, FilterValue value,
                        FilterOperator op = FilterOperator::Equals) {
    return PropertyFilter::make(path, std::move(value), op).unwrap();
}

} // anonymous namespace

TEST_CASE("PropertyFilter validation", "[filters]") {
    SECTION("path routing") {
        auto bare = property("category", std::string{"Preventive"});
        REQUIRE(bare.root() == JsonRoot::Properties);
        REQUIRE(bare.segments() == std::vector<std::string>{"category"});

        auto content = property("content.data.category", std::string{"Detective"});
        REQUIRE(content.root() == JsonRoot::Content);
        REQUIRE(content.segments() == std::vector<std::string>{"data", "category"});

        auto metadata = property("metadata.source", std::string{"pdf"});
        REQUIRE(metadata.root() == JsonRoot::Metadata);
        REQUIRE(metadata.path() == "metadata.source");
    }

    SECTION("empty paths") {
        for (auto path : {"", "   ", "..", "properties"}) {
            auto result = PropertyFilter::make(path, int64_t{1});
            INFO(path);
            if (std::string_view(path) == "properties") {
                // Addresses the whole properties object.
                REQUIRE(result.is_ok());
                REQUIRE(result.unwrap().segments().empty());
            } else {
                REQUIRE(result.is_err());
                REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidFilter);
            }
        }
    }

    SECTION("quotes in a segment") {
        auto result = PropertyFilter::make("a\".b", std::string{"x"});
        REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidFilter);
    }

    SECTION("operator 'in' needs a non-empty homogeneous list") {
        REQUIRE(PropertyFilter::make("level", int64_t{1}, FilterOperator::In).is_err());
        REQUIRE(PropertyFilter::make("level", FilterList{}, FilterOperator::In).is_err());

        auto mixed = PropertyFilter::make(
            "level", FilterList{int64_t{1}, std::string{"2"}}, FilterOperator::In);
        REQUIRE(mixed.is_err());
        REQUIRE(mixed.unwrap_err().message == "PropertyFilter 'in' list mixes int and string values");
    }

    SECTION("ints widen inside a float list") {
        auto filter = property("score", FilterList{0.5, int64_t{2}}, FilterOperator::In);
        const auto& values = std::get<FilterList>(filter.value());
        REQUIRE(std::holds_alternative<double>(values[1]));
        REQUIRE(std::get<double>(values[1]) == 2.0);
    }

    SECTION("contains takes a string") {
        REQUIRE(PropertyFilter::make("title", int64_t{3}, FilterOperator::Contains).is_err());
        REQUIRE(PropertyFilter::make("title", std::string{"rep"}, FilterOperator::Contains).is_ok());
    }

    SECTION("equality rejects lists") {
        auto result = PropertyFilter::make("level", FilterList{int64_t{1}});
        REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidFilter);
    }
}

TEST_CASE("BooleanFilter arity", "[filters]") {
    FilterExpression a = property("a", int64_t{1});
    FilterExpression b = property("b", int64_t{2});

    REQUIRE(BooleanFilter::make(LogicalOperator::And, {}).is_err());
    REQUIRE(BooleanFilter::make(LogicalOperator::And, {a}).is_err());
    REQUIRE(BooleanFilter::make(LogicalOperator::Or, {a, b}).is_ok());
    REQUIRE(BooleanFilter::make(LogicalOperator::Not, {a, b}).is_err());
    REQUIRE(BooleanFilter::make(LogicalOperator::Not, {a}).is_ok());
}

TEST_CASE("JSON paths", "[filters]") {
    REQUIRE(FilterCompiler::json_path({"data", "tags", "0"}) == "$.\"data\".\"tags\"[0]");
    REQUIRE(FilterCompiler::json_path({"odd key"}) == "$.\"odd key\"");
    REQUIRE(FilterCompiler::json_path({}) == "$");
}

TEST_CASE("Compiling property filters", "[filters]") {
    FilterCompiler compiler("b");

    SECTION("typed equality") {
        auto fragment = compiler.compile(property("content.data.category", std::string{"Preventive"}));
        REQUIRE(fragment.sql ==
                "CASE WHEN json_type(b.content, ?) IN ('text') "
                "THEN json_extract(b.content, ?) END = ?");
        REQUIRE(fragment.params.size() == 3);
        REQUIRE(std::get<std::string>(fragment.params[0]) == "$.\"data\".\"category\"");
        REQUIRE(std::get<std::string>(fragment.params[1]) == "$.\"data\".\"category\"");
        REQUIRE(std::get<std::string>(fragment.params[2]) == "Preventive");
    }

    SECTION("booleans only match JSON true and false") {
        auto fragment = compiler.compile(property("metadata.reviewed", true, FilterOperator::NotEquals));
        REQUIRE(fragment.sql ==
                "json_type(b.metadata, ?) <> 'null' AND "
                "CASE WHEN json_type(b.metadata, ?) IN ('true', 'false') "
                "THEN json_extract(b.metadata, ?) END IS NOT ?");
        REQUIRE(fragment.params.size() == 4);
        REQUIRE(std::get<int64_t>(fragment.params[3]) == 1);
    }

    SECTION("membership") {
        auto fragment = compiler.compile(
            property("level", FilterList{int64_t{1}, int64_t{2}}, FilterOperator::In));
        REQUIRE(fragment.sql ==
                "CASE WHEN json_type(b.properties, ?) IN ('integer', 'real') "
                "THEN json_extract(b.properties, ?) END IN (?, ?)");
        REQUIRE(fragment.params.size() == 4);
    }

    SECTION("substring on text targets") {
        auto fragment = compiler.compile(property("title", std::string{"plan"}, FilterOperator::Contains));
        REQUIRE(fragment.sql ==
                "instr(CASE WHEN json_type(b.properties, ?) IN ('text') "
                "THEN json_extract(b.properties, ?) END, ?) > 0");
        REQUIRE(std::get<std::string>(fragment.params[2]) == "plan");
    }

    SECTION("floats share the numeric gate") {
        auto fragment = compiler.compile(property("score", 0.25));
        REQUIRE(fragment.sql ==
                "CASE WHEN json_type(b.properties, ?) IN ('integer', 'real') "
                "THEN json_extract(b.properties, ?) END = ?");
        REQUIRE(std::get<double>(fragment.params[2]) == 0.25);
    }
}

TEST_CASE("Compiling boolean filters", "[filters]") {
    FilterCompiler compiler("p");
    FilterExpression a = property("a", int64_t{1});
    FilterExpression b = property("b", int64_t{2});

    auto either = BooleanFilter::make(LogicalOperator::Or, {a, b}).unwrap();
    auto negated = BooleanFilter::make(LogicalOperator::Not, {either}).unwrap();

    const std::string numeric = "json_type(p.properties, ?) IN ('integer', 'real') "
                                "THEN json_extract(p.properties, ?) END = ?";
    auto fragment = compiler.compile(FilterExpression(negated));
    REQUIRE(fragment.sql ==
            "NOT (((CASE WHEN " + numeric + ") OR (CASE WHEN " + numeric + ")))");
    REQUIRE(fragment.params.size() == 6);
    REQUIRE(std::get<std::string>(fragment.params[3]) == "$.\"b\"");
    REQUIRE(std::get<int64_t>(fragment.params[5]) == 2);
}

TEST_CASE("Compiling where clauses", "[filters]") {
    FilterCompiler compiler("b");

    SECTION("empty clause") {
        REQUIRE(compiler.compile(WhereClause{}).empty());
    }

    SECTION("single values use equality, several use IN") {
        auto root = Uuid::generate();
        WhereClause where{
            .types = {BlockType::Heading, BlockType::Paragraph},
            .root_ids = {root},
        };
        auto fragment = compiler.compile(where);
        REQUIRE(fragment.sql == "(b.type IN (?, ?)) AND (b.root_id = ?)");
        REQUIRE(std::get<std::string>(fragment.params[0]) == "heading");
        REQUIRE(std::get<std::string>(fragment.params[2]) == root.to_string());
    }

    SECTION("conjunction skips empty parts") {
        auto joined = conjunction({SqlFragment{}, SqlFragment{"x = ?", {int64_t{1}}}, SqlFragment{}});
        REQUIRE(joined.sql == "(x = ?)");
        REQUIRE(joined.params.size() == 1);
    }
}
