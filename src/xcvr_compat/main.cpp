// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright OpenBMC Authors

#include "query.hpp"
#include "render.hpp"

#include <CLI/CLI.hpp>
#include <phosphor-logging/lg2.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace xcvr_compat;

static int exitCode(const QueryOutcome& outcome)
{
    if (std::holds_alternative<Failed>(outcome) ||
        std::holds_alternative<DataUnavailable>(outcome))
    {
        return 1;
    }
    return 0;
}

static int report(const QueryOutcome& outcome, bool json)
{
    if (json)
    {
        std::cout << toJson(outcome).dump(4) << "\n";
    }
    else
    {
        renderText(outcome, std::cout);
    }
    return exitCode(outcome);
}

int main(int argc, char** argv)
{
    CLI::App app{"Find the transceivers compatible with a switch model"};

    std::filesystem::path databasePath(XCVR_COMPAT_DATA_DIR "database.json");
    std::filesystem::path schemaPath(XCVR_COMPAT_DATA_DIR
                                     "schemas/compat_database.json");
    bool noValidate = !ENABLE_RUNTIME_VALIDATE_JSON;
    bool json = false;
    std::vector<std::string> models;

    app.add_option("-d,--database", databasePath, "Compatibility database");
    app.add_option("-s,--schema", schemaPath, "Schema of the database");
    app.add_flag("--no-validate", noValidate,
                 "Skip schema validation of the database");
    app.add_flag("-j,--json", json, "Print results as JSON");
    app.add_option("models", models,
                   "Switch models to look up, read from stdin when omitted");

    CLI11_PARSE(app, argc, argv);

    std::optional<std::filesystem::path> schema;
    if (!noValidate)
    {
        schema = schemaPath;
    }

    CompatChecker checker(DatasetLoader(databasePath, schema));
    if (!checker.reload())
    {
        lg2::error("No compatibility data available from {PATH}", "PATH",
                   databasePath.string());
    }

    int rc = 0;
    if (!models.empty())
    {
        for (const auto& model : models)
        {
            rc |= report(checker.search(model), json);
        }
        return rc;
    }

    std::string line;
    while (std::getline(std::cin, line))
    {
        rc |= report(checker.search(line), json);
    }
    return rc;
}
