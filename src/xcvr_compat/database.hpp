#pragma once

#include "records.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <vector>

namespace xcvr_compat
{

// Names of the three relations in the dataset document.
namespace relations
{
constexpr const char* products = "products";
constexpr const char* compatibility = "compatibility";
constexpr const char* switchBays = "switchBays";
} // namespace relations

struct Database
{
    // Throws std::invalid_argument if the document is not an object holding
    // the three relation arrays. Rows inside the arrays are parsed
    // leniently, see records.hpp.
    static Database fromJson(const nlohmann::json& document);

    nlohmann::json toJson() const;

    std::vector<Product> products;
    std::vector<CompatibilityEntry> compatibility;
    std::vector<SwitchBayEntry> switchBays;
};

using Snapshot = std::shared_ptr<const Database>;

// Holds the snapshot served to queries. A reload replaces the whole
// Database at once; a query that already took a snapshot keeps using it.
class SnapshotStore
{
  public:
    SnapshotStore() = default;
    explicit SnapshotStore(Snapshot initial);

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    Snapshot current() const;

    // Returns the snapshot which was replaced.
    Snapshot replace(Snapshot next);

  private:
    std::atomic<Snapshot> snapshot;
};

} // namespace xcvr_compat
