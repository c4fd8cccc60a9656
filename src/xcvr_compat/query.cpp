#include "query.hpp"

#include "../utils.hpp"

#include <phosphor-logging/lg2.hpp>

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace xcvr_compat
{

static constexpr const char* dataUnavailablePrefix =
    "Could not load compatibility data";

QueryOutcome runQuery(const Snapshot& snapshot, std::string_view rawQuery,
                      const Resolver& resolver)
{
    if (!snapshot)
    {
        return DataUnavailable{std::string(dataUnavailablePrefix) + "."};
    }

    std::string term = canonicalKey(rawQuery);
    if (term.empty())
    {
        return NoMatch{};
    }

    try
    {
        std::vector<ResultGroup> groups = resolver(snapshot.get(), term);
        if (groups.empty())
        {
            return NoMatch{std::move(term)};
        }
        return Matches{std::move(term), std::move(groups)};
    }
    catch (const std::exception& e)
    {
        lg2::error("Error while searching for {TERM}: {ERROR}", "TERM", term,
                   "ERROR", e.what());
        return Failed{searchFailedMessage};
    }
}

CompatChecker::CompatChecker(DatasetLoader loader) : loader(std::move(loader))
{}

bool CompatChecker::reload()
{
    auto loaded = loader.load();
    if (!loaded)
    {
        lastLoadError = loaded.error();
        if (store.current())
        {
            lg2::error("Reload of {PATH} failed, keeping the current dataset",
                       "PATH", loader.path().string());
        }
        return false;
    }

    lastLoadError.reset();
    store.replace(std::move(*loaded));
    return true;
}

QueryOutcome CompatChecker::search(std::string_view rawQuery)
{
    Snapshot current = store.current();
    if (!current && lastLoadError)
    {
        outcome = DataUnavailable{std::string(dataUnavailablePrefix) + ": " +
                                  lastLoadError->message};
    }
    else
    {
        outcome = runQuery(current, rawQuery);
    }
    return outcome;
}

} // namespace xcvr_compat
