#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QJsonArray>
#include <QJsonObject>

#include <optional>
#include <string>
#include <vector>

namespace blockstore::storage {

// Column codecs shared by the repositories. JSON columns hold compact
// text; uuid columns hold the canonical string form or NULL.

[[nodiscard]] std::string json_text(const QJsonObject& object);
[[nodiscard]] std::string json_text(const QJsonArray& array);

/**
 * Parse a column that must hold a JSON object. Malformed text is an
 * ErrorKind::Storage error naming the column.
 */
[[nodiscard]] Result<QJsonObject, Error> parse_object(const std::string& text, const char* column);

/**
 * Parse a children_ids column.
 */
[[nodiscard]] Result<std::vector<Uuid>, Error> parse_uuid_array(const std::string& text);

[[nodiscard]] SqlValue optional_uuid(const std::optional<Uuid>& id);

} // namespace blockstore::storage
