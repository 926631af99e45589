#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <QJsonArray>
#include <QJsonObject>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace blockstore::blocks {

/**
 * BlockType - Closed set of block kinds. The string form is the
 * persisted `type` column value.
 */
enum class BlockType {
    Workspace,
    Collection,
    Document,
    Dataset,
    DerivedContentContainer,
    Heading,
    Paragraph,
    BulletedListItem,
    NumberedListItem,
    Record,
    Quote,
    Code,
    Table,
    Html,
    Object,
    GroupIndex,
    PageGroup,
    ChunkGroup,
    SystemContainer,
    Unsupported
};

inline constexpr std::array<BlockType, 20> ALL_BLOCK_TYPES = {
    BlockType::Workspace, BlockType::Collection, BlockType::Document,
    BlockType::Dataset, BlockType::DerivedContentContainer, BlockType::Heading,
    BlockType::Paragraph, BlockType::BulletedListItem, BlockType::NumberedListItem,
    BlockType::Record, BlockType::Quote, BlockType::Code, BlockType::Table,
    BlockType::Html, BlockType::Object, BlockType::GroupIndex, BlockType::PageGroup,
    BlockType::ChunkGroup, BlockType::SystemContainer, BlockType::Unsupported,
};

[[nodiscard]] constexpr std::string_view type_name(BlockType type) {
    switch (type) {
        case BlockType::Workspace: return "workspace";
        case BlockType::Collection: return "collection";
        case BlockType::Document: return "document";
        case BlockType::Dataset: return "dataset";
        case BlockType::DerivedContentContainer: return "derived_content_container";
        case BlockType::Heading: return "heading";
        case BlockType::Paragraph: return "paragraph";
        case BlockType::BulletedListItem: return "bulleted_list_item";
        case BlockType::NumberedListItem: return "numbered_list_item";
        case BlockType::Record: return "record";
        case BlockType::Quote: return "quote";
        case BlockType::Code: return "code";
        case BlockType::Table: return "table";
        case BlockType::Html: return "html";
        case BlockType::Object: return "object";
        case BlockType::GroupIndex: return "group_index";
        case BlockType::PageGroup: return "page_group";
        case BlockType::ChunkGroup: return "chunk_group";
        case BlockType::SystemContainer: return "system_container";
        case BlockType::Unsupported: return "unsupported";
    }
    return "unsupported";
}

[[nodiscard]] std::optional<BlockType> parse_type(std::string_view name);

// ============================================================================
// Typed properties
//
// One struct per properties schema. Keys that a schema does not know are
// kept in `extra` so that open properties survive a round trip.
// ============================================================================

// paragraph, bulleted_list_item, numbered_list_item, record, unsupported
struct PlainProps {
    QJsonObject extra;

    bool operator==(const PlainProps&) const = default;
};

struct WorkspaceProps {
    std::string title;
    QJsonObject extra;

    bool operator==(const WorkspaceProps&) const = default;
};

struct CollectionProps {
    std::string title;
    QJsonObject extra;

    bool operator==(const CollectionProps&) const = default;
};

struct DocumentProps {
    std::optional<std::string> title;
    std::optional<std::string> category;
    QJsonObject extra;

    bool operator==(const DocumentProps&) const = default;
};

struct DatasetProps {
    std::optional<std::string> dataset_type;
    QJsonObject extra;

    bool operator==(const DatasetProps&) const = default;
};

struct DerivedContentContainerProps {
    std::string category;
    QJsonObject extra;

    bool operator==(const DerivedContentContainerProps&) const = default;
};

struct HeadingProps {
    int level{2};  // 1..6
    QJsonObject extra;

    bool operator==(const HeadingProps&) const = default;
};

// quote, table, html
struct GroupedProps {
    std::vector<Uuid> groups;
    QJsonObject extra;

    bool operator==(const GroupedProps&) const = default;
};

struct CodeProps {
    std::optional<std::string> language;
    std::vector<Uuid> groups;
    QJsonObject extra;

    bool operator==(const CodeProps&) const = default;
};

struct ObjectProps {
    std::optional<std::string> category;
    std::vector<Uuid> groups;
    QJsonObject extra;

    bool operator==(const ObjectProps&) const = default;
};

enum class GroupIndexKind { Page, Chunk };

struct GroupIndexProps {
    GroupIndexKind group_index_type{GroupIndexKind::Page};
    QJsonObject extra;

    bool operator==(const GroupIndexProps&) const = default;
};

struct PageGroupProps {
    int page_number{1};  // >= 1
    QJsonObject extra;

    bool operator==(const PageGroupProps&) const = default;
};

struct ChunkGroupProps {
    std::optional<std::string> title;
    QJsonObject extra;

    bool operator==(const ChunkGroupProps&) const = default;
};

struct SystemContainerProps {
    std::string category;
    QJsonObject extra;

    bool operator==(const SystemContainerProps&) const = default;
};

using BlockProperties = std::variant<
    PlainProps,
    WorkspaceProps,
    CollectionProps,
    DocumentProps,
    DatasetProps,
    DerivedContentContainerProps,
    HeadingProps,
    GroupedProps,
    CodeProps,
    ObjectProps,
    GroupIndexProps,
    PageGroupProps,
    ChunkGroupProps,
    SystemContainerProps
>;

/**
 * Default-constructed properties of the schema registered for `type`.
 */
[[nodiscard]] BlockProperties default_properties(BlockType type);

/**
 * True if `props` holds the schema registered for `type`.
 */
[[nodiscard]] bool properties_match(BlockType type, const BlockProperties& props);

/**
 * Serialize properties to the JSON object stored in the `properties` column.
 */
[[nodiscard]] QJsonObject properties_to_json(const BlockProperties& props);

/**
 * Decode the `properties` column for a block of the given type using the
 * schema registry. Fails with ErrorKind::Validation on a schema mismatch.
 */
[[nodiscard]] Result<BlockProperties, Error> properties_from_json(
    BlockType type,
    const QJsonObject& json);

// ============================================================================
// Content
// ============================================================================

/**
 * Content - Optional unstructured payload of a block.
 */
struct Content {
    std::optional<std::string> plain_text;
    std::optional<QJsonObject> object;
    std::optional<QJsonObject> data;     // tabular / record data
    std::optional<Uuid> synced_from;     // canonical block for synced content

    bool operator==(const Content&) const = default;
};

[[nodiscard]] QJsonObject content_to_json(const Content& content);
[[nodiscard]] Result<Content, Error> content_from_json(const QJsonObject& json);

[[nodiscard]] QJsonArray uuids_to_json(const std::vector<Uuid>& ids);
[[nodiscard]] Result<std::vector<Uuid>, Error> uuids_from_json(const QJsonArray& array);

// ============================================================================
// Block
// ============================================================================

/**
 * Block - An immutable snapshot of one node of a document tree.
 *
 * Structural changes go through the repository, which writes a new
 * row version; content changes produce a new value through the with_*
 * builders below and are persisted with upsert.
 */
struct Block {
    Uuid id;
    BlockType type{BlockType::Paragraph};
    std::optional<Uuid> parent_id;
    Uuid root_id;
    std::vector<Uuid> children_ids;
    std::optional<Uuid> workspace_id;
    bool in_trash{false};
    int64_t version{0};
    Timestamp created_time;
    Timestamp last_edited_time;
    std::optional<Uuid> created_by;
    std::optional<Uuid> last_edited_by;
    BlockProperties properties;
    QJsonObject metadata;
    std::optional<Content> content;
    std::optional<int> properties_version;

    [[nodiscard]] bool is_root() const noexcept { return !parent_id.has_value(); }

    [[nodiscard]] bool has_child(const Uuid& child) const;

    /**
     * Position of `child` in children_ids, or nullopt.
     */
    [[nodiscard]] std::optional<size_t> child_index(const Uuid& child) const;

    bool operator==(const Block&) const = default;
};

/**
 * Check that a block's payload matches its type schema and that its own
 * structural fields are self-consistent (no duplicate or self children).
 */
[[nodiscard]] Result<void, Error> validate(const Block& block);

/**
 * Plain text of the block's content, or an empty string.
 */
[[nodiscard]] std::string plain_text(const Block& block);

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Create a new block with default properties for its type.
 */
[[nodiscard]] Block create(
    Uuid id,
    BlockType type,
    std::optional<Uuid> parent_id,
    Uuid root_id
);

/**
 * Create a new block with explicit properties.
 */
[[nodiscard]] Block create(
    Uuid id,
    BlockType type,
    std::optional<Uuid> parent_id,
    Uuid root_id,
    BlockProperties properties
);

/**
 * Create a self-anchored root (root_id == id, no parent).
 */
[[nodiscard]] Block create_root(Uuid id, BlockType type, BlockProperties properties);

[[nodiscard]] Block with_children(Block block, std::vector<Uuid> children_ids);
[[nodiscard]] Block with_parent(Block block, std::optional<Uuid> parent_id);
[[nodiscard]] Block with_content(Block block, std::optional<Content> content);
[[nodiscard]] Block with_text(Block block, std::string text);
[[nodiscard]] Block with_properties(Block block, BlockProperties properties);
[[nodiscard]] Block with_metadata(Block block, QJsonObject metadata);
[[nodiscard]] Block with_workspace(Block block, std::optional<Uuid> workspace_id);
[[nodiscard]] Block edited_by(Block block, Uuid actor);

} // namespace blockstore::blocks
