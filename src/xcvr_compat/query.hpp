#pragma once

#include "database.hpp"
#include "loader.hpp"
#include "resolver.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xcvr_compat
{

struct NotSearched
{};

struct NoMatch
{
    std::string term;
};

struct Matches
{
    std::string term;
    std::vector<ResultGroup> groups;
};

struct Failed
{
    std::string message;
};

struct DataUnavailable
{
    std::string message;
};

using QueryOutcome =
    std::variant<NotSearched, NoMatch, Matches, Failed, DataUnavailable>;

using Resolver =
    std::function<std::vector<ResultGroup>(const Database*, std::string_view)>;

constexpr const char* searchFailedMessage =
    "An error occurred while searching. Please check the data format of the database.";

// Runs one query. A std::exception thrown by the resolver is reported as
// Failed; anything else thrown propagates to the caller.
QueryOutcome runQuery(const Snapshot& snapshot, std::string_view rawQuery,
                      const Resolver& resolver = resolve);

class CompatChecker
{
  public:
    explicit CompatChecker(DatasetLoader loader);

    // Loads the dataset and swaps it in. On failure the previously loaded
    // snapshot, if any, stays in service.
    bool reload();

    QueryOutcome search(std::string_view rawQuery);

    const QueryOutcome& lastOutcome() const
    {
        return outcome;
    }

    const std::optional<LoadError>& loadError() const
    {
        return lastLoadError;
    }

    Snapshot snapshot() const
    {
        return store.current();
    }

  private:
    DatasetLoader loader;
    SnapshotStore store;
    std::optional<LoadError> lastLoadError;
    QueryOutcome outcome;
};

} // namespace xcvr_compat
