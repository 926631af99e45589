#include <catch2/catch_test_macros.hpp>
#include "core/block_types.hpp"

#include <QJsonArray>
#include <QJsonObject>

using namespace blockstore;
using namespace blockstore::blocks;

TEST_CASE("Block type names", "[blocks]") {
    for (auto type : ALL_BLOCK_TYPES) {
        REQUIRE(parse_type(type_name(type)) == type);
    }
    REQUIRE(type_name(BlockType::PageGroup) == "page_group");
    REQUIRE(type_name(BlockType::DerivedContentContainer) == "derived_content_container");
    REQUIRE_FALSE(parse_type("synced").has_value());
    REQUIRE_FALSE(parse_type("").has_value());
}

TEST_CASE("Properties registry", "[blocks]") {
    SECTION("defaults match their type") {
        for (auto type : ALL_BLOCK_TYPES) {
            REQUIRE(properties_match(type, default_properties(type)));
        }
    }

    SECTION("types share schemas where they should") {
        REQUIRE(properties_match(BlockType::Record, PlainProps{}));
        REQUIRE(properties_match(BlockType::Table, GroupedProps{}));
        REQUIRE_FALSE(properties_match(BlockType::Heading, PlainProps{}));
        REQUIRE_FALSE(properties_match(BlockType::Code, GroupedProps{}));
    }
}

TEST_CASE("Properties decoding", "[blocks]") {
    SECTION("heading defaults to level 2") {
        auto props = properties_from_json(BlockType::Heading, QJsonObject{});
        REQUIRE(props.is_ok());
        REQUIRE(std::get<HeadingProps>(props.unwrap()).level == 2);
    }

    SECTION("heading level out of range") {
        auto props = properties_from_json(BlockType::Heading, QJsonObject{{"level", 7}});
        REQUIRE(props.is_err());
        REQUIRE(props.unwrap_err().kind == ErrorKind::Validation);
        REQUIRE(props.unwrap_err().message == "heading.properties.level: expected integer in [1, 6]");
    }

    SECTION("non-integral level") {
        auto props = properties_from_json(BlockType::Heading, QJsonObject{{"level", 1.5}});
        REQUIRE(props.is_err());
    }

    SECTION("page group requires a page number") {
        REQUIRE(properties_from_json(BlockType::PageGroup, QJsonObject{}).is_err());
        REQUIRE(properties_from_json(BlockType::PageGroup, QJsonObject{{"page_number", 0}}).is_err());

        auto props = properties_from_json(BlockType::PageGroup, QJsonObject{{"page_number", 3}});
        REQUIRE(std::get<PageGroupProps>(props.unwrap()).page_number == 3);
    }

    SECTION("workspace requires a title") {
        auto props = properties_from_json(BlockType::Workspace, QJsonObject{{"title", 5}});
        REQUIRE(props.is_err());
        REQUIRE(props.unwrap_err().message == "workspace.properties.title: expected string (required)");
    }

    SECTION("the first malformed field is reported") {
        auto props = properties_from_json(
            BlockType::Code, QJsonObject{{"language", 3}, {"groups", "nope"}, {"theme", "dark"}});
        REQUIRE(props.is_err());
        REQUIRE(props.unwrap_err().message == "code.properties.language: expected string");

        auto bad_groups = properties_from_json(BlockType::Code, QJsonObject{{"groups", "nope"}});
        REQUIRE(bad_groups.unwrap_err().message == "code.properties.groups: expected array of uuid");
    }

    SECTION("unread fields are kept as extras") {
        auto props = properties_from_json(
            BlockType::Code, QJsonObject{{"language", "cpp"}, {"theme", "dark"}});
        const auto& code = std::get<CodeProps>(props.unwrap());
        REQUIRE(code.language == std::optional<std::string>{"cpp"});
        REQUIRE(code.extra == QJsonObject{{"theme", "dark"}});
    }

    SECTION("group index kind") {
        auto chunk = properties_from_json(BlockType::GroupIndex,
                                          QJsonObject{{"group_index_type", "chunk"}});
        REQUIRE(std::get<GroupIndexProps>(chunk.unwrap()).group_index_type == GroupIndexKind::Chunk);
        REQUIRE(properties_from_json(BlockType::GroupIndex,
                                     QJsonObject{{"group_index_type", "row"}}).is_err());
    }

    SECTION("groups must be uuids") {
        auto group = Uuid::generate();
        auto ok = properties_from_json(
            BlockType::Quote,
            QJsonObject{{"groups", QJsonArray{QString::fromStdString(group.to_string())}}});
        REQUIRE(std::get<GroupedProps>(ok.unwrap()).groups == std::vector<Uuid>{group});

        auto bad = properties_from_json(BlockType::Quote, QJsonObject{{"groups", QJsonArray{"nope"}}});
        REQUIRE(bad.is_err());
        REQUIRE(bad.unwrap_err().message == "quote.properties.groups: expected array of uuid");
    }

    SECTION("unknown keys survive a round trip") {
        QJsonObject json{{"title", "Q3 report"}, {"status", "draft"}, {"rank", 4}};
        auto props = properties_from_json(BlockType::Document, json).unwrap();

        const auto& doc = std::get<DocumentProps>(props);
        REQUIRE(doc.title == "Q3 report");
        REQUIRE_FALSE(doc.category.has_value());
        REQUIRE(doc.extra.value("status").toString() == "draft");
        REQUIRE(properties_to_json(props) == json);
    }
}

TEST_CASE("Properties encoding prefers known fields", "[blocks]") {
    CodeProps code{.language = "cpp", .extra = QJsonObject{{"language", "rust"}, {"theme", "dark"}}};
    auto json = properties_to_json(code);

    REQUIRE(json.value("language").toString() == "cpp");
    REQUIRE(json.value("theme").toString() == "dark");
    REQUIRE(json.value("groups").toArray().isEmpty());
}

TEST_CASE("Content JSON", "[blocks]") {
    auto canonical = Uuid::generate();
    Content content{
        .plain_text = "hello",
        .data = QJsonObject{{"category", "Preventive"}},
        .synced_from = canonical,
    };

    auto json = content_to_json(content);
    REQUIRE_FALSE(json.contains("object"));

    auto decoded = content_from_json(json);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap() == content);

    SECTION("malformed fields are rejected") {
        REQUIRE(content_from_json(QJsonObject{{"plain_text", 3}}).is_err());
        REQUIRE(content_from_json(QJsonObject{{"synced_from", "xyz"}}).is_err());
        REQUIRE(content_from_json(QJsonObject{{"data", QJsonArray{}}}).is_err());
    }
}

TEST_CASE("Block validation", "[blocks]") {
    auto root = create_root(Uuid::generate(), BlockType::Document, DocumentProps{.title = "Doc"});
    REQUIRE(validate(root).is_ok());

    SECTION("properties must match the type") {
        auto block = root;
        block.properties = HeadingProps{};
        auto result = validate(block);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Validation);
    }

    SECTION("heading level") {
        auto heading = create(Uuid::generate(), BlockType::Heading, root.id, root.id,
                              HeadingProps{.level = 0});
        REQUIRE(validate(heading).unwrap_err().kind == ErrorKind::Validation);
    }

    SECTION("self reference") {
        auto self_parent = with_parent(root, root.id);
        REQUIRE(validate(self_parent).unwrap_err().kind == ErrorKind::InvalidChildren);

        auto self_child = with_children(root, {root.id});
        REQUIRE(validate(self_child).unwrap_err().kind == ErrorKind::InvalidChildren);
    }

    SECTION("duplicate children") {
        auto child = Uuid::generate();
        auto block = with_children(root, {child, Uuid::generate(), child});
        REQUIRE(validate(block).unwrap_err().kind == ErrorKind::InvalidChildren);
    }
}

TEST_CASE("Block builders", "[blocks]") {
    auto root_id = Uuid::generate();
    auto block = create(Uuid::generate(), BlockType::Paragraph, root_id, root_id);

    REQUIRE(block.version == 0);
    REQUIRE_FALSE(block.in_trash);
    REQUIRE(block.created_time == block.last_edited_time);
    REQUIRE(std::holds_alternative<PlainProps>(block.properties));
    REQUIRE_FALSE(block.is_root());

    SECTION("with_text keeps other content") {
        auto canonical = Uuid::generate();
        auto synced = with_content(block, Content{.synced_from = canonical});
        auto texted = with_text(synced, "Hello");

        REQUIRE(plain_text(texted) == "Hello");
        REQUIRE(texted.content->synced_from == canonical);
        REQUIRE(plain_text(block).empty());
        REQUIRE(texted.last_edited_time >= block.last_edited_time);
    }

    SECTION("children lookup") {
        auto a = Uuid::generate();
        auto b = Uuid::generate();
        auto parent = with_children(block, {a, b});

        REQUIRE(parent.has_child(b));
        REQUIRE(parent.child_index(b) == 1);
        REQUIRE_FALSE(parent.child_index(Uuid::generate()).has_value());
    }

    SECTION("edited_by sets the creator once") {
        auto alice = Uuid::generate();
        auto bob = Uuid::generate();
        auto edited = edited_by(edited_by(block, alice), bob);

        REQUIRE(edited.created_by == alice);
        REQUIRE(edited.last_edited_by == bob);
    }

    SECTION("with_workspace and with_metadata") {
        auto ws = Uuid::generate();
        auto updated = with_metadata(with_workspace(block, ws), QJsonObject{{"source", "pdf"}});

        REQUIRE(updated.workspace_id == ws);
        REQUIRE(updated.metadata.value("source").toString() == "pdf");
        REQUIRE(updated.id == block.id);
    }
}
