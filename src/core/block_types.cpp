#include "core/block_types.hpp"

#include <QJsonValue>
#include <QString>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <unordered_set>

namespace blockstore::blocks {

namespace {

template<typename T, typename... Ts>
constexpr size_t alternative_index(const std::variant<Ts...>*) {
    constexpr bool matches[] = {std::is_same_v<T, Ts>...};
    for (size_t i = 0; i < sizeof...(Ts); ++i) {
        if (matches[i]) return i;
    }
    return sizeof...(Ts);
}

template<typename T>
constexpr size_t index_of = alternative_index<T>(static_cast<const BlockProperties*>(nullptr));

QString qkey(std::string_view key) {
    return QString::fromUtf8(key.data(), static_cast<qsizetype>(key.size()));
}

using PropsResult = Result<BlockProperties, Error>;

/**
 * Reads known fields out of a properties object. Every field read is
 * removed from the remainder, which becomes the `extra` bag.
 *
 * A field of the wrong shape reads as empty and records an error; only the
 * first one is kept and reported by finish().
 */
class FieldReader {
public:
    FieldReader(BlockType type, const QJsonObject& json) : type_(type), rest_(json) {}

    std::optional<std::string> optional_string(std::string_view key) {
        auto value = take(key);
        if (value.isUndefined() || value.isNull()) {
            return std::nullopt;
        }
        if (!value.isString()) {
            fail(key, "string");
            return std::nullopt;
        }
        return value.toString().toStdString();
    }

    std::string required_string(std::string_view key) {
        auto value = take(key);
        if (!value.isString()) {
            fail(key, "string (required)");
            return {};
        }
        return value.toString().toStdString();
    }

    std::optional<int64_t> optional_int(std::string_view key) {
        auto value = take(key);
        if (value.isUndefined() || value.isNull()) {
            return std::nullopt;
        }
        double number = value.toDouble();
        if (!value.isDouble() || std::floor(number) != number) {
            fail(key, "integer");
            return std::nullopt;
        }
        return static_cast<int64_t>(number);
    }

    std::vector<Uuid> uuid_list(std::string_view key) {
        auto value = take(key);
        if (value.isUndefined() || value.isNull()) {
            return {};
        }
        if (!value.isArray()) {
            fail(key, "array of uuid");
            return {};
        }
        auto ids = uuids_from_json(value.toArray());
        if (ids.is_err()) {
            fail(key, "array of uuid");
            return {};
        }
        return std::move(ids).unwrap();
    }

    void fail(std::string_view key, std::string_view expected) {
        if (error_) return;
        error_ = Error{ErrorKind::Validation,
                       std::string(type_name(type_)) + ".properties." + std::string(key) +
                       ": expected " + std::string(expected)};
    }

    [[nodiscard]] bool failed() const noexcept { return error_.has_value(); }

    /**
     * The decoded struct with the unread fields as `extra`, or the first
     * recorded error.
     */
    template<typename Props>
    PropsResult finish(Props props) const {
        if (error_) {
            return PropsResult::err(*error_);
        }
        props.extra = rest_;
        return PropsResult::ok(std::move(props));
    }

private:
    QJsonValue take(std::string_view key) {
        auto k = qkey(key);
        auto value = rest_.value(k);
        rest_.remove(k);
        return value;
    }

    BlockType type_;
    QJsonObject rest_;
    std::optional<Error> error_;
};

PropsResult decode_plain(BlockType, const QJsonObject& json) {
    return PropsResult::ok(PlainProps{.extra = json});
}

PropsResult decode_workspace(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    return r.finish(WorkspaceProps{.title = r.required_string("title")});
}

PropsResult decode_collection(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    return r.finish(CollectionProps{.title = r.required_string("title")});
}

PropsResult decode_document(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    DocumentProps props;
    props.title = r.optional_string("title");
    props.category = r.optional_string("category");
    return r.finish(std::move(props));
}

PropsResult decode_dataset(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    return r.finish(DatasetProps{.dataset_type = r.optional_string("dataset_type")});
}

PropsResult decode_derived(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    return r.finish(DerivedContentContainerProps{.category = r.required_string("category")});
}

PropsResult decode_heading(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    auto level = r.optional_int("level").value_or(2);
    if (!r.failed() && (level < 1 || level > 6)) {
        r.fail("level", "integer in [1, 6]");
    }
    return r.finish(HeadingProps{.level = static_cast<int>(level)});
}

PropsResult decode_grouped(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    return r.finish(GroupedProps{.groups = r.uuid_list("groups")});
}

PropsResult decode_code(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    CodeProps props;
    props.language = r.optional_string("language");
    props.groups = r.uuid_list("groups");
    return r.finish(std::move(props));
}

PropsResult decode_object(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    ObjectProps props;
    props.category = r.optional_string("category");
    props.groups = r.uuid_list("groups");
    return r.finish(std::move(props));
}

PropsResult decode_group_index(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    auto kind = r.required_string("group_index_type");
    GroupIndexProps props;
    if (kind == "page") {
        props.group_index_type = GroupIndexKind::Page;
    } else if (kind == "chunk") {
        props.group_index_type = GroupIndexKind::Chunk;
    } else {
        r.fail("group_index_type", "\"page\" or \"chunk\"");
    }
    return r.finish(std::move(props));
}

PropsResult decode_page_group(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    auto page_number = r.optional_int("page_number");
    if (!page_number || *page_number < 1) {
        r.fail("page_number", "integer >= 1 (required)");
    }
    return r.finish(PageGroupProps{.page_number = static_cast<int>(page_number.value_or(1))});
}

PropsResult decode_chunk_group(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    return r.finish(ChunkGroupProps{.title = r.optional_string("title")});
}

PropsResult decode_system_container(BlockType type, const QJsonObject& json) {
    FieldReader r(type, json);
    return r.finish(SystemContainerProps{.category = r.required_string("category")});
}

using Decoder = PropsResult (*)(BlockType, const QJsonObject&);
using Factory = BlockProperties (*)();

/**
 * One row of the type -> properties schema dispatch table.
 */
struct RegistryEntry {
    BlockType type;
    size_t variant_index;
    Decoder decode;
    Factory make_default;
};

template<typename Props>
constexpr RegistryEntry entry(BlockType type, Decoder decode) {
    return RegistryEntry{type, index_of<Props>, decode, []() -> BlockProperties { return Props{}; }};
}

// Ordered like BlockType so that lookup is an index.
constexpr std::array<RegistryEntry, ALL_BLOCK_TYPES.size()> REGISTRY = {{
    entry<WorkspaceProps>(BlockType::Workspace, decode_workspace),
    entry<CollectionProps>(BlockType::Collection, decode_collection),
    entry<DocumentProps>(BlockType::Document, decode_document),
    entry<DatasetProps>(BlockType::Dataset, decode_dataset),
    entry<DerivedContentContainerProps>(BlockType::DerivedContentContainer, decode_derived),
    entry<HeadingProps>(BlockType::Heading, decode_heading),
    entry<PlainProps>(BlockType::Paragraph, decode_plain),
    entry<PlainProps>(BlockType::BulletedListItem, decode_plain),
    entry<PlainProps>(BlockType::NumberedListItem, decode_plain),
    entry<PlainProps>(BlockType::Record, decode_plain),
    entry<GroupedProps>(BlockType::Quote, decode_grouped),
    entry<CodeProps>(BlockType::Code, decode_code),
    entry<GroupedProps>(BlockType::Table, decode_grouped),
    entry<GroupedProps>(BlockType::Html, decode_grouped),
    entry<ObjectProps>(BlockType::Object, decode_object),
    entry<GroupIndexProps>(BlockType::GroupIndex, decode_group_index),
    entry<PageGroupProps>(BlockType::PageGroup, decode_page_group),
    entry<ChunkGroupProps>(BlockType::ChunkGroup, decode_chunk_group),
    entry<SystemContainerProps>(BlockType::SystemContainer, decode_system_container),
    entry<PlainProps>(BlockType::Unsupported, decode_plain),
}};

constexpr bool registry_is_ordered() {
    for (size_t i = 0; i < REGISTRY.size(); ++i) {
        if (REGISTRY[i].type != ALL_BLOCK_TYPES[i]) return false;
        if (static_cast<size_t>(REGISTRY[i].type) != i) return false;
    }
    return true;
}
static_assert(registry_is_ordered(), "REGISTRY must follow BlockType order");

const RegistryEntry& lookup(BlockType type) {
    return REGISTRY[static_cast<size_t>(type)];
}

void put_optional(QJsonObject& json, const char* key, const std::optional<std::string>& value) {
    if (value) {
        json.insert(QLatin1String(key), QString::fromStdString(*value));
    }
}

QJsonObject encode(const PlainProps&) { return {}; }

QJsonObject encode(const WorkspaceProps& p) {
    return QJsonObject{{QStringLiteral("title"), QString::fromStdString(p.title)}};
}

QJsonObject encode(const CollectionProps& p) {
    return QJsonObject{{QStringLiteral("title"), QString::fromStdString(p.title)}};
}

QJsonObject encode(const DocumentProps& p) {
    QJsonObject json;
    put_optional(json, "title", p.title);
    put_optional(json, "category", p.category);
    return json;
}

QJsonObject encode(const DatasetProps& p) {
    QJsonObject json;
    put_optional(json, "dataset_type", p.dataset_type);
    return json;
}

QJsonObject encode(const DerivedContentContainerProps& p) {
    return QJsonObject{{QStringLiteral("category"), QString::fromStdString(p.category)}};
}

QJsonObject encode(const HeadingProps& p) {
    return QJsonObject{{QStringLiteral("level"), p.level}};
}

QJsonObject encode(const GroupedProps& p) {
    return QJsonObject{{QStringLiteral("groups"), uuids_to_json(p.groups)}};
}

QJsonObject encode(const CodeProps& p) {
    QJsonObject json{{QStringLiteral("groups"), uuids_to_json(p.groups)}};
    put_optional(json, "language", p.language);
    return json;
}

QJsonObject encode(const ObjectProps& p) {
    QJsonObject json{{QStringLiteral("groups"), uuids_to_json(p.groups)}};
    put_optional(json, "category", p.category);
    return json;
}

QJsonObject encode(const GroupIndexProps& p) {
    return QJsonObject{{QStringLiteral("group_index_type"),
                        p.group_index_type == GroupIndexKind::Page ? QStringLiteral("page")
                                                                   : QStringLiteral("chunk")}};
}

QJsonObject encode(const PageGroupProps& p) {
    return QJsonObject{{QStringLiteral("page_number"), p.page_number}};
}

QJsonObject encode(const ChunkGroupProps& p) {
    QJsonObject json;
    put_optional(json, "title", p.title);
    return json;
}

QJsonObject encode(const SystemContainerProps& p) {
    return QJsonObject{{QStringLiteral("category"), QString::fromStdString(p.category)}};
}

} // anonymous namespace

std::optional<BlockType> parse_type(std::string_view name) {
    for (auto type : ALL_BLOCK_TYPES) {
        if (type_name(type) == name) return type;
    }
    return std::nullopt;
}

BlockProperties default_properties(BlockType type) {
    return lookup(type).make_default();
}

bool properties_match(BlockType type, const BlockProperties& props) {
    return lookup(type).variant_index == props.index();
}

QJsonObject properties_to_json(const BlockProperties& props) {
    return std::visit([](const auto& p) -> QJsonObject {
        // Known fields win over same-named keys in the extra bag.
        QJsonObject json = p.extra;
        const QJsonObject known = encode(p);
        for (auto it = known.begin(); it != known.end(); ++it) {
            json.insert(it.key(), it.value());
        }
        return json;
    }, props);
}

Result<BlockProperties, Error> properties_from_json(BlockType type, const QJsonObject& json) {
    return lookup(type).decode(type, json);
}

// ============================================================================
// Content
// ============================================================================

QJsonObject content_to_json(const Content& content) {
    QJsonObject json;
    if (content.plain_text) {
        json.insert(QStringLiteral("plain_text"), QString::fromStdString(*content.plain_text));
    }
    if (content.object) {
        json.insert(QStringLiteral("object"), *content.object);
    }
    if (content.data) {
        json.insert(QStringLiteral("data"), *content.data);
    }
    if (content.synced_from) {
        json.insert(QStringLiteral("synced_from"),
                    QString::fromStdString(content.synced_from->to_string()));
    }
    return json;
}

Result<Content, Error> content_from_json(const QJsonObject& json) {
    Content content;

    auto text = json.value(QStringLiteral("plain_text"));
    if (text.isString()) {
        content.plain_text = text.toString().toStdString();
    } else if (!text.isUndefined() && !text.isNull()) {
        return fail<Content>(ErrorKind::Validation, "content.plain_text: expected string");
    }

    auto object = json.value(QStringLiteral("object"));
    if (object.isObject()) {
        content.object = object.toObject();
    } else if (!object.isUndefined() && !object.isNull()) {
        return fail<Content>(ErrorKind::Validation, "content.object: expected object");
    }

    auto data = json.value(QStringLiteral("data"));
    if (data.isObject()) {
        content.data = data.toObject();
    } else if (!data.isUndefined() && !data.isNull()) {
        return fail<Content>(ErrorKind::Validation, "content.data: expected object");
    }

    auto synced = json.value(QStringLiteral("synced_from"));
    if (synced.isString()) {
        content.synced_from = Uuid::parse(synced.toString().toStdString());
        if (!content.synced_from) {
            return fail<Content>(ErrorKind::Validation, "content.synced_from: expected uuid");
        }
    } else if (!synced.isUndefined() && !synced.isNull()) {
        return fail<Content>(ErrorKind::Validation, "content.synced_from: expected uuid");
    }

    return Result<Content, Error>::ok(std::move(content));
}

QJsonArray uuids_to_json(const std::vector<Uuid>& ids) {
    QJsonArray array;
    for (const auto& id : ids) {
        array.append(QString::fromStdString(id.to_string()));
    }
    return array;
}

Result<std::vector<Uuid>, Error> uuids_from_json(const QJsonArray& array) {
    std::vector<Uuid> ids;
    ids.reserve(static_cast<size_t>(array.size()));
    for (const auto& value : array) {
        auto parsed = value.isString() ? Uuid::parse(value.toString().toStdString())
                                       : std::nullopt;
        if (!parsed) {
            return fail<std::vector<Uuid>>(ErrorKind::Validation, "expected an array of uuid strings");
        }
        ids.push_back(*parsed);
    }
    return Result<std::vector<Uuid>, Error>::ok(std::move(ids));
}

// ============================================================================
// Block
// ============================================================================

bool Block::has_child(const Uuid& child) const {
    return std::find(children_ids.begin(), children_ids.end(), child) != children_ids.end();
}

std::optional<size_t> Block::child_index(const Uuid& child) const {
    auto it = std::find(children_ids.begin(), children_ids.end(), child);
    if (it == children_ids.end()) return std::nullopt;
    return static_cast<size_t>(it - children_ids.begin());
}

Result<void, Error> validate(const Block& block) {
    const auto id = block.id.to_string();

    if (!properties_match(block.type, block.properties)) {
        return fail(ErrorKind::Validation,
                    "Block " + id + ": properties do not match type " +
                    std::string(type_name(block.type)));
    }
    if (const auto* heading = std::get_if<HeadingProps>(&block.properties)) {
        if (heading->level < 1 || heading->level > 6) {
            return fail(ErrorKind::Validation, "Block " + id + ": heading level must be in [1, 6]");
        }
    }
    if (const auto* group = std::get_if<PageGroupProps>(&block.properties)) {
        if (group->page_number < 1) {
            return fail(ErrorKind::Validation, "Block " + id + ": page_number must be >= 1");
        }
    }
    if (block.parent_id && *block.parent_id == block.id) {
        return fail(ErrorKind::InvalidChildren, "Block " + id + " cannot be its own parent");
    }

    std::unordered_set<Uuid> seen;
    for (const auto& child : block.children_ids) {
        if (child == block.id) {
            return fail(ErrorKind::InvalidChildren, "Block " + id + " lists itself as a child");
        }
        if (!seen.insert(child).second) {
            return fail(ErrorKind::InvalidChildren,
                        "Block " + id + " lists child " + child.to_string() + " twice");
        }
    }
    return Result<void, Error>::ok();
}

std::string plain_text(const Block& block) {
    if (block.content && block.content->plain_text) {
        return *block.content->plain_text;
    }
    return {};
}

Block create(Uuid id, BlockType type, std::optional<Uuid> parent_id, Uuid root_id) {
    return create(id, type, parent_id, root_id, default_properties(type));
}

Block create(
    Uuid id,
    BlockType type,
    std::optional<Uuid> parent_id,
    Uuid root_id,
    BlockProperties properties
) {
    auto now = Timestamp::now();
    return Block{
        .id = id,
        .type = type,
        .parent_id = parent_id,
        .root_id = root_id,
        .created_time = now,
        .last_edited_time = now,
        .properties = std::move(properties),
    };
}

Block create_root(Uuid id, BlockType type, BlockProperties properties) {
    return create(id, type, std::nullopt, id, std::move(properties));
}

Block with_children(Block block, std::vector<Uuid> children_ids) {
    block.children_ids = std::move(children_ids);
    block.last_edited_time = Timestamp::now();
    return block;
}

Block with_parent(Block block, std::optional<Uuid> parent_id) {
    block.parent_id = parent_id;
    block.last_edited_time = Timestamp::now();
    return block;
}

Block with_content(Block block, std::optional<Content> content) {
    block.content = std::move(content);
    block.last_edited_time = Timestamp::now();
    return block;
}

Block with_text(Block block, std::string text) {
    Content content = block.content.value_or(Content{});
    content.plain_text = std::move(text);
    return with_content(std::move(block), std::move(content));
}

Block with_properties(Block block, BlockProperties properties) {
    block.properties = std::move(properties);
    block.last_edited_time = Timestamp::now();
    return block;
}

Block with_metadata(Block block, QJsonObject metadata) {
    block.metadata = std::move(metadata);
    block.last_edited_time = Timestamp::now();
    return block;
}

Block with_workspace(Block block, std::optional<Uuid> workspace_id) {
    block.workspace_id = workspace_id;
    block.last_edited_time = Timestamp::now();
    return block;
}

Block edited_by(Block block, Uuid actor) {
    if (!block.created_by) {
        block.created_by = actor;
    }
    block.last_edited_by = actor;
    block.last_edited_time = Timestamp::now();
    return block;
}

} // namespace blockstore::blocks
