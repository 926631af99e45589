#include <catch2/catch_test_macros.hpp>
#include "storage/block_repository.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/relationship_repository.hpp"

using namespace blockstore;
using namespace blockstore::storage;
using namespace blockstore::blocks;

namespace {

Database open_database() {
    auto db = Database::open_memory().unwrap();
    initialize_database(db).unwrap();
    return db;
}

Block document(const std::string& title) {
    return create_root(Uuid::generate(), BlockType::Document, DocumentProps{.title = title});
}

} // anonymous namespace

TEST_CASE("Relationships", "[integration][relationships]") {
    auto db = open_database();
    BlockRepository blocks(db);
    RelationshipRepository relationships(db);

    auto a = document("A");
    auto b = document("B");
    auto c = document("C");
    blocks.upsert({a, b, c}).unwrap();

    auto supports = make_relationship(a.id, b.id, "supports", QJsonObject{{"weight", 2}});
    supports.workspace_id = Uuid::generate();
    supports.created_by = Uuid::generate();

    SECTION("round trip") {
        REQUIRE(relationships.upsert({supports}).is_ok());

        auto found = relationships.get(a.id, Direction::Outgoing).unwrap();
        REQUIRE(found.size() == 1);
        REQUIRE(found.front() == supports);
    }

    SECTION("upserting the same key twice keeps one row") {
        REQUIRE(relationships.upsert({supports}).is_ok());

        auto again = make_relationship(a.id, b.id, "supports", QJsonObject{{"weight", 5}});
        REQUIRE(relationships.upsert({again}).is_ok());

        auto found = relationships.get(a.id, Direction::Outgoing).unwrap();
        REQUIRE(found.size() == 1);
        REQUIRE(found.front().id == supports.id);
        REQUIRE(found.front().version == 1);
        REQUIRE(found.front().metadata.value("weight").toInt() == 5);

        REQUIRE(relationships.upsert({supports}).is_ok());
        REQUIRE(relationships.get(a.id, Direction::Outgoing).unwrap().front().version == 2);
    }

    SECTION("endpoints must exist") {
        auto dangling = make_relationship(a.id, Uuid::generate(), "supports");
        auto result = relationships.upsert({supports, dangling});
        REQUIRE(result.unwrap_err().kind == ErrorKind::NotFound);
        REQUIRE(relationships.get(a.id).unwrap().empty());
    }

    SECTION("directions") {
        auto cites = make_relationship(c.id, a.id, "cites");
        REQUIRE(relationships.upsert({supports, cites}).is_ok());

        REQUIRE(relationships.get(a.id).unwrap().size() == 2);
        REQUIRE(relationships.get(a.id, Direction::Outgoing).unwrap().front().rel_type == "supports");
        REQUIRE(relationships.get(a.id, Direction::Incoming).unwrap().front().rel_type == "cites");
        REQUIRE(relationships.get(b.id, Direction::Outgoing).unwrap().empty());
    }

    SECTION("edges to trashed blocks are hidden") {
        REQUIRE(relationships.upsert({supports}).is_ok());
        blocks.set_in_trash({b.id}, true).unwrap();

        REQUIRE(relationships.get(a.id).unwrap().empty());
        REQUIRE(relationships.get(a.id, Direction::All, true).unwrap().size() == 1);
    }

    SECTION("delete by key") {
        REQUIRE(relationships.upsert({supports}).is_ok());

        REQUIRE(relationships.remove({key_of(supports)}).unwrap());
        REQUIRE_FALSE(relationships.remove({key_of(supports)}).unwrap());
        REQUIRE_FALSE(relationships.remove({}).unwrap());
        REQUIRE(relationships.get(a.id).unwrap().empty());
    }

    SECTION("hard-deleting an endpoint removes the edge") {
        REQUIRE(relationships.upsert({supports}).is_ok());

        blocks.upsert({with_text(b, "still here")}).unwrap();
        REQUIRE(relationships.get(a.id).unwrap().size() == 1);

        blocks.remove({b.id}).unwrap();
        REQUIRE(relationships.get(a.id, Direction::All, true).unwrap().empty());
    }
}
