#include "database.hpp"

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace xcvr_compat
{

static const nlohmann::json::array_t& getRelation(
    const nlohmann::json::object_t& document, const char* name)
{
    auto findRelation = document.find(name);
    if (findRelation == document.end())
    {
        throw std::invalid_argument(
            std::string("relation '") + name + "' not found");
    }

    const auto* array =
        findRelation->second.get_ptr<const nlohmann::json::array_t*>();
    if (array == nullptr)
    {
        throw std::invalid_argument(
            std::string("relation '") + name + "' is not an array");
    }
    return *array;
}

template <typename Record>
static std::vector<Record> parseRelation(const nlohmann::json::array_t& rows)
{
    std::vector<Record> records;
    records.reserve(rows.size());
    for (const nlohmann::json& row : rows)
    {
        records.emplace_back(Record::fromJson(row));
    }
    return records;
}

Database Database::fromJson(const nlohmann::json& document)
{
    const auto* obj = document.get_ptr<const nlohmann::json::object_t*>();
    if (obj == nullptr)
    {
        throw std::invalid_argument("database document is not an object");
    }

    Database db;
    db.products = parseRelation<Product>(getRelation(*obj, relations::products));
    db.compatibility = parseRelation<CompatibilityEntry>(
        getRelation(*obj, relations::compatibility));
    db.switchBays = parseRelation<SwitchBayEntry>(
        getRelation(*obj, relations::switchBays));

    lg2::debug(
        "Parsed {NPRODUCTS} products, {NCOMPAT} compatibility entries and {NBAYS} switch bays",
        "NPRODUCTS", db.products.size(), "NCOMPAT", db.compatibility.size(),
        "NBAYS", db.switchBays.size());

    return db;
}

nlohmann::json Database::toJson() const
{
    nlohmann::json::object_t res;

    res[relations::products] = nlohmann::json::array_t();
    for (const auto& product : products)
    {
        res[relations::products].push_back(product.toJson());
    }

    res[relations::compatibility] = nlohmann::json::array_t();
    for (const auto& entry : compatibility)
    {
        res[relations::compatibility].push_back(entry.toJson());
    }

    res[relations::switchBays] = nlohmann::json::array_t();
    for (const auto& entry : switchBays)
    {
        res[relations::switchBays].push_back(entry.toJson());
    }

    return res;
}

SnapshotStore::SnapshotStore(Snapshot initial) : snapshot(std::move(initial))
{}

Snapshot SnapshotStore::current() const
{
    return snapshot.load();
}

Snapshot SnapshotStore::replace(Snapshot next)
{
    return snapshot.exchange(std::move(next));
}

} // namespace xcvr_compat
