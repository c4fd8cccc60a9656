#include "loader.hpp"

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>
#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace xcvr_compat
{

// Builds a valijson schema, which throws on documents that are valid JSON but
// not a valid schema.
static bool parseSchema(const nlohmann::json& schemaFile,
                        valijson::Schema& schema)
{
    try
    {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schemaAdapter(schemaFile);
        parser.populateSchema(schemaAdapter, schema);
    }
    catch (const std::exception& e)
    {
        lg2::error("Illegal schema: {ERROR}", "ERROR", e.what());
        return false;
    }
    return true;
}

// validates a given input with a given json schema.
static bool validateJson(const valijson::Schema& schema,
                         const nlohmann::json& input)
{
    try
    {
        valijson::Validator validator;
        valijson::adapters::NlohmannJsonAdapter targetAdapter(input);
        return validator.validate(schema, targetAdapter, nullptr);
    }
    catch (const std::exception& e)
    {
        lg2::error("Schema validation failed: {ERROR}", "ERROR", e.what());
        return false;
    }
}

std::expected<Database, LoadError> parseDatabase(
    std::istream& stream, const std::optional<nlohmann::json>& schema)
{
    auto data = nlohmann::json::parse(stream, nullptr, false, true);
    if (data.is_discarded())
    {
        return std::unexpected(
            LoadError{LoadErrorKind::Malformed, "syntax error in database"});
    }

    if (schema)
    {
        valijson::Schema parsedSchema;
        if (!parseSchema(*schema, parsedSchema))
        {
            return std::unexpected(
                LoadError{LoadErrorKind::Malformed, "illegal schema file"});
        }
        if (!validateJson(parsedSchema, data))
        {
            return std::unexpected(
                LoadError{LoadErrorKind::Malformed,
                          "database does not match its schema"});
        }
    }

    try
    {
        return Database::fromJson(data);
    }
    catch (const std::invalid_argument& e)
    {
        return std::unexpected(LoadError{LoadErrorKind::Malformed, e.what()});
    }
}

DatasetLoader::DatasetLoader(std::filesystem::path databasePath,
                             std::optional<std::filesystem::path> schemaPath) :
    databasePath(std::move(databasePath)), schemaPath(std::move(schemaPath))
{}

std::expected<std::optional<nlohmann::json>, LoadError>
    DatasetLoader::loadSchema() const
{
    if (!schemaPath)
    {
        return std::nullopt;
    }

    std::error_code ec;
    std::ifstream schemaStream;
    if (std::filesystem::is_regular_file(*schemaPath, ec))
    {
        schemaStream.open(*schemaPath);
    }
    if (!schemaStream.is_open() || !schemaStream.good())
    {
        lg2::error("Cannot open schema file {PATH}", "PATH",
                   schemaPath->string());
        return std::unexpected(LoadError{LoadErrorKind::Unavailable,
                                         "cannot open schema file"});
    }

    auto schema = nlohmann::json::parse(schemaStream, nullptr, false, true);
    if (schema.is_discarded())
    {
        lg2::error("Illegal schema file detected: {PATH}", "PATH",
                   schemaPath->string());
        return std::unexpected(
            LoadError{LoadErrorKind::Malformed, "illegal schema file"});
    }
    return std::optional<nlohmann::json>(std::move(schema));
}

std::expected<Snapshot, LoadError> DatasetLoader::load() const
{
    const auto start = std::chrono::steady_clock::now();

    auto schema = loadSchema();
    if (!schema)
    {
        return std::unexpected(schema.error());
    }

    // a directory opens as a stream but cannot be read
    std::error_code ec;
    std::ifstream jsonStream;
    if (std::filesystem::is_regular_file(databasePath, ec))
    {
        jsonStream.open(databasePath);
    }
    if (!jsonStream.is_open() || !jsonStream.good())
    {
        lg2::error("unable to open {PATH}", "PATH", databasePath.string());
        return std::unexpected(
            LoadError{LoadErrorKind::Unavailable,
                      "unable to open " + databasePath.string()});
    }

    auto db = parseDatabase(jsonStream, *schema);
    if (!db)
    {
        lg2::error("Error loading {PATH}: {ERROR}", "PATH",
                   databasePath.string(), "ERROR", db.error().message);
        return std::unexpected(db.error());
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count();

    lg2::info(
        "Loaded {NPRODUCTS} products, {NCOMPAT} compatibility entries and {NBAYS} switch bays from {PATH} in {MILLIS}ms",
        "NPRODUCTS", db->products.size(), "NCOMPAT", db->compatibility.size(),
        "NBAYS", db->switchBays.size(), "PATH", databasePath.string(), "MILLIS",
        duration);

    return std::make_shared<const Database>(std::move(*db));
}

} // namespace xcvr_compat
