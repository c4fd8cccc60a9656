#pragma once

#include "database.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace xcvr_compat
{

enum class LoadErrorKind
{
    // The dataset could not be read at all.
    Unavailable,
    // The dataset was read but does not have the expected structure.
    Malformed,
};

struct LoadError
{
    LoadErrorKind kind;
    std::string message;
};

// A schema which is not valid JSON Schema, or a document which does not match
// it, is reported as Malformed.
std::expected<Database, LoadError> parseDatabase(
    std::istream& stream, const std::optional<nlohmann::json>& schema);

class DatasetLoader
{
  public:
    // When schemaPath is set the document is validated against it before
    // its rows are parsed.
    explicit DatasetLoader(
        std::filesystem::path databasePath,
        std::optional<std::filesystem::path> schemaPath = std::nullopt);

    std::expected<Snapshot, LoadError> load() const;

    const std::filesystem::path& path() const
    {
        return databasePath;
    }

  private:
    std::expected<std::optional<nlohmann::json>, LoadError> loadSchema() const;

    std::filesystem::path databasePath;
    std::optional<std::filesystem::path> schemaPath;
};

} // namespace xcvr_compat
