#include <catch2/catch_test_macros.hpp>
#include "storage/block_repository.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"

#include <algorithm>
#include <set>

using namespace blockstore;
using namespace blockstore::storage;
using namespace blockstore::blocks;

namespace {

Database open_database() {
    auto db = Database::open_memory().unwrap();
    initialize_database(db).unwrap();
    return db;
}

Block record(const Uuid& parent, const Uuid& root, const std::string& category) {
    auto block = create(Uuid::generate(), BlockType::Record, parent, root);
    return with_content(block, Content{.data = QJsonObject{{"category", QString::fromStdString(category)}}});
}

std::set<Uuid> ids_of(const std::vector<Block>& blocks) {
    std::set<Uuid> ids;
    for (const auto& block : blocks) ids.insert(block.id);
    return ids;
}

PropertyFilter property(std::string_view path, FilterValue value,
                        FilterOperator op = FilterOperator::Equals) {
    return PropertyFilter::make(path, std::move(value), op).unwrap();
}

} // anonymous namespace

TEST_CASE("Querying blocks", "[integration][query]") {
    auto db = open_database();
    BlockRepository repo(db);

    auto workspace = Uuid::generate();
    auto dataset = with_workspace(
        create_root(Uuid::generate(), BlockType::Dataset, DatasetProps{.dataset_type = "controls"}),
        workspace);
    auto preventive = record(dataset.id, dataset.id, "Preventive");
    auto detective_a = record(dataset.id, dataset.id, "Detective");
    auto detective_b = record(dataset.id, dataset.id, "Detective");
    dataset = with_children(dataset, {preventive.id, detective_a.id, detective_b.id});

    auto doc = create_root(Uuid::generate(), BlockType::Document,
                           DocumentProps{.title = "Annual plan", .category = "finance"});
    auto heading = create(Uuid::generate(), BlockType::Heading, doc.id, doc.id, HeadingProps{.level = 1});
    auto para = with_metadata(create(Uuid::generate(), BlockType::Paragraph, heading.id, doc.id),
                              QJsonObject{{"reviewed", true}, {"score", 0.75}});
    auto tagged = with_metadata(create(Uuid::generate(), BlockType::Paragraph, heading.id, doc.id),
                                QJsonObject{{"reviewed", false}, {"tags", QJsonArray{"draft", "q3"}}});
    heading = with_children(heading, {para.id, tagged.id});
    doc = with_children(doc, {heading.id});

    repo.upsert({dataset, preventive, detective_a, detective_b, doc, heading, para, tagged}).unwrap();

    SECTION("content path equality") {
        BlockQuery query;
        query.where.types = {BlockType::Record};
        query.property_filter = property("content.data.category", std::string{"Detective"});

        auto found = repo.query(query).unwrap();
        REQUIRE(ids_of(found) == std::set<Uuid>{detective_a.id, detective_b.id});
    }

    SECTION("not equals and membership") {
        BlockQuery query;
        query.where.root_ids = {dataset.id};
        query.property_filter =
            property("content.data.category", std::string{"Detective"}, FilterOperator::NotEquals);
        REQUIRE(ids_of(repo.query(query).unwrap()) == std::set<Uuid>{preventive.id});

        query.property_filter = property(
            "content.data.category",
            FilterList{std::string{"Preventive"}, std::string{"Corrective"}},
            FilterOperator::In);
        REQUIRE(ids_of(repo.query(query).unwrap()) == std::set<Uuid>{preventive.id});
    }

    SECTION("boolean composition") {
        FilterExpression reviewed = property("metadata.reviewed", true);
        FilterExpression draft = property("metadata.tags.0", std::string{"draft"});

        BlockQuery query;
        query.where.parent_ids = {heading.id};
        query.property_filter = BooleanFilter::make(LogicalOperator::Or, {reviewed, draft}).unwrap();
        REQUIRE(repo.query(query).unwrap().size() == 2);

        query.property_filter = BooleanFilter::make(LogicalOperator::Not, {reviewed}).unwrap();
        auto rest = repo.query(query).unwrap();
        REQUIRE(ids_of(rest) == std::set<Uuid>{tagged.id});
    }

    SECTION("numeric and substring predicates") {
        BlockQuery query;
        query.property_filter = property("metadata.score", 0.75);
        REQUIRE(ids_of(repo.query(query).unwrap()) == std::set<Uuid>{para.id});

        query.property_filter = property("title", std::string{"plan"}, FilterOperator::Contains);
        REQUIRE(ids_of(repo.query(query).unwrap()) == std::set<Uuid>{doc.id});

        query.property_filter = property("level", int64_t{1});
        query.where.types = {BlockType::Heading};
        REQUIRE(ids_of(repo.query(query).unwrap()) == std::set<Uuid>{heading.id});
    }

    SECTION("parent filter") {
        BlockQuery query;
        query.parent = ParentFilter{
            .where = WhereClause{.types = {BlockType::Heading}},
            .filter = property("level", int64_t{1}),
        };
        REQUIRE(ids_of(repo.query(query).unwrap()) == std::set<Uuid>{para.id, tagged.id});
    }

    SECTION("root filter") {
        BlockQuery query;
        query.where.types = {BlockType::Paragraph, BlockType::Record};
        query.root = RootFilter{.filter = property("category", std::string{"finance"})};
        REQUIRE(ids_of(repo.query(query).unwrap()) == std::set<Uuid>{para.id, tagged.id});

        query.root = RootFilter{.where = WhereClause{.workspace_ids = {workspace}}};
        REQUIRE(repo.query(query).unwrap().size() == 3);
    }

    SECTION("workspace and limit") {
        BlockQuery query;
        query.where.workspace_ids = {workspace};
        REQUIRE(ids_of(repo.query(query).unwrap()) == std::set<Uuid>{dataset.id});

        BlockQuery limited;
        limited.where.root_ids = {dataset.id};
        limited.limit = 2;
        REQUIRE(repo.query(limited).unwrap().size() == 2);
    }

    SECTION("an empty query returns every visible block") {
        REQUIRE(repo.query(BlockQuery{}).unwrap().size() == 8);
    }
}

TEST_CASE("Typed predicates skip targets of another JSON type", "[integration][query]") {
    auto db = open_database();
    BlockRepository repo(db);

    auto doc = create_root(Uuid::generate(), BlockType::Document, DocumentProps{.title = "Scores"});
    auto numeric = with_metadata(create(Uuid::generate(), BlockType::Paragraph, doc.id, doc.id),
                                 QJsonObject{{"score", 0}, {"reviewed", false}, {"label", "0"}});
    auto textual = with_metadata(create(Uuid::generate(), BlockType::Paragraph, doc.id, doc.id),
                                 QJsonObject{{"score", "n/a"}, {"reviewed", "true"}, {"label", 0}});
    auto bare = create(Uuid::generate(), BlockType::Paragraph, doc.id, doc.id);
    doc = with_children(doc, {numeric.id, textual.id, bare.id});
    repo.upsert({doc, numeric, textual, bare}).unwrap();

    auto matching = [&](FilterExpression filter) {
        BlockQuery query;
        query.where.parent_ids = {doc.id};
        query.property_filter = std::move(filter);
        return ids_of(repo.query(query).unwrap());
    };

    SECTION("numbers and booleans never match strings") {
        REQUIRE(matching(property("metadata.score", 0.0)) == std::set<Uuid>{numeric.id});
        REQUIRE(matching(property("metadata.score", int64_t{0})) == std::set<Uuid>{numeric.id});
        REQUIRE(matching(property("metadata.reviewed", false)) == std::set<Uuid>{numeric.id});
        REQUIRE(matching(property("metadata.reviewed", true)).empty());
        REQUIRE(matching(property("metadata.score", FilterList{int64_t{0}, int64_t{1}},
                                  FilterOperator::In)) == std::set<Uuid>{numeric.id});
    }

    SECTION("strings never match numbers") {
        REQUIRE(matching(property("metadata.label", std::string{"0"})) == std::set<Uuid>{numeric.id});
        REQUIRE(matching(property("metadata.label", int64_t{0})) == std::set<Uuid>{textual.id});
        REQUIRE(matching(property("metadata.label", std::string{"0"}, FilterOperator::Contains)) ==
                std::set<Uuid>{numeric.id});
        REQUIRE(matching(property("metadata.score", std::string{"n/"}, FilterOperator::Contains)) ==
                std::set<Uuid>{textual.id});
    }

    SECTION("not equals keeps present targets of another type") {
        REQUIRE(matching(property("metadata.score", int64_t{0}, FilterOperator::NotEquals)) ==
                std::set<Uuid>{textual.id});
        REQUIRE(matching(property("metadata.score", 1.5, FilterOperator::NotEquals)) ==
                std::set<Uuid>{numeric.id, textual.id});
        REQUIRE(matching(property("metadata.reviewed", true, FilterOperator::NotEquals)) ==
                std::set<Uuid>{numeric.id, textual.id});
    }
}
