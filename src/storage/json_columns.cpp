#include "storage/json_columns.hpp"
#include "core/block_types.hpp"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace blockstore::storage {

namespace {

Result<QJsonDocument, Error> parse_json(const std::string& text, const char* column) {
    QJsonParseError error{};
    auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(text), &error);
    if (error.error != QJsonParseError::NoError) {
        return fail<QJsonDocument>(ErrorKind::Storage,
            std::string("Malformed JSON in column ") + column + ": " +
            error.errorString().toStdString());
    }
    return Result<QJsonDocument, Error>::ok(std::move(doc));
}

} // anonymous namespace

std::string json_text(const QJsonObject& object) {
    return QJsonDocument(object).toJson(QJsonDocument::Compact).toStdString();
}

std::string json_text(const QJsonArray& array) {
    return QJsonDocument(array).toJson(QJsonDocument::Compact).toStdString();
}

Result<QJsonObject, Error> parse_object(const std::string& text, const char* column) {
    auto doc = parse_json(text, column);
    if (doc.is_err()) {
        return Result<QJsonObject, Error>::err(doc.unwrap_err());
    }
    if (!doc.unwrap().isObject()) {
        return fail<QJsonObject>(ErrorKind::Storage,
                                 std::string("Column ") + column + " does not hold a JSON object");
    }
    return Result<QJsonObject, Error>::ok(doc.unwrap().object());
}

Result<std::vector<Uuid>, Error> parse_uuid_array(const std::string& text) {
    auto doc = parse_json(text, "children_ids");
    if (doc.is_err()) {
        return Result<std::vector<Uuid>, Error>::err(doc.unwrap_err());
    }
    if (!doc.unwrap().isArray()) {
        return fail<std::vector<Uuid>>(ErrorKind::Storage,
                                       "Column children_ids does not hold a JSON array");
    }
    return blocks::uuids_from_json(doc.unwrap().array());
}

SqlValue optional_uuid(const std::optional<Uuid>& id) {
    return id ? SqlValue{id->to_string()} : SqlValue{nullptr};
}

} // namespace blockstore::storage
