/**
 * @file OrionApp.hpp
 * @brief Command line front end of Orion.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/AppServices.hpp"

namespace orion::app {

/**
 * @struct CommandLine
 * @brief Parsed arguments: the command, its positional arguments and its --options.
 */
struct CommandLine {
    std::string command;
    std::vector<std::string> positionals;
    std::map<std::string, std::string> options; ///< "--graph ID" is stored as {"graph", "ID"}
    std::vector<std::string> flags;             ///< Options without a value, e.g. "reset".

    bool hasFlag(const std::string& name) const;
    std::string option(const std::string& name, const std::string& fallback = "") const;

    /** @throws domain::ValidationError on a dangling option. */
    static CommandLine Parse(int argc, char** argv);
};

/**
 * @class OrionApp
 * @brief Orchestrates the application lifecycle: composition, one command, shutdown.
 *
 * Results are printed to stdout as JSON. Diagnostics of every component are
 * routed to stderr while a command runs.
 */
class OrionApp {
public:
    /**
     * @brief Runs the command given on the command line.
     * @return 0 on success, 1 on a graph or storage failure, 2 on invalid input.
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Builds every service rooted at the given directory.
     * @throws domain::StorageError if the stored graphs cannot be loaded.
     */
    void Init(const std::string& root);

    /** @brief Waits for background work and reports tasks that failed. */
    void Shutdown();

    nlohmann::json Dispatch(const CommandLine& cmd);

    nlohmann::json CmdGraphs();
    nlohmann::json CmdCreateGraph(const CommandLine& cmd);
    nlohmann::json CmdDeleteGraph(const CommandLine& cmd);
    nlohmann::json CmdResetGraph(const CommandLine& cmd);
    nlohmann::json CmdIngest(const CommandLine& cmd);
    nlohmann::json CmdShow(const CommandLine& cmd);
    nlohmann::json CmdItems(const CommandLine& cmd);
    nlohmann::json CmdProject(const CommandLine& cmd);
    nlohmann::json CmdClusters(const CommandLine& cmd);
    nlohmann::json CmdSearch(const CommandLine& cmd);
    nlohmann::json CmdDeleteTopic(const CommandLine& cmd);
    nlohmann::json CmdDeleteItem(const CommandLine& cmd);
    nlohmann::json CmdSettings(const CommandLine& cmd);

    std::string graphOf(const CommandLine& cmd) const;

    application::AppServices m_services;
    std::string m_root;
};

} // namespace orion::app
