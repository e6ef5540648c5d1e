// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file filelog-tail/main.cpp
 * @brief Follows a set of log files and prints every new record
 *
 * Usage examples:
 *   - Follow files matching a pattern:     filelog-tail -i '/var/log/app/*.log'
 *   - Use a JSON configuration:            filelog-tail -c tail.json
 *   - Resume across restarts:              filelog-tail -c tail.json -s /var/lib/filelog
 *   - Print what is there and exit:        filelog-tail -i 'logs/*.log' --start-at beginning --once
 *
 * Every record is printed as "path: record". The path is colored when stdout is a terminal.
 * SIGINT and SIGTERM stop the tool after the cycle in flight, saving a final checkpoint.
 */

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <filelog/filelog.h>
#include <filelog-internal/ConfigParser.hpp>
#include <filelog-internal/Exception.hpp>
#include <filelog-internal/FileFinder.hpp>
#include <filelog-internal/Manager.hpp>
#include <filelog-internal/Persister.hpp>

namespace
{
    std::sig_atomic_t volatile g_exit_requested = 0;

    void signal_handler(int)
    {
        g_exit_requested = 1;
    }

    bool isTerminal() noexcept
    {
        return ::isatty(::fileno(stdout)) != 0;
    }

    std::string readConfigFile(std::string const& path)
    {
        auto ifs = std::ifstream{path};
        if (!ifs.is_open())
        {
            throw std::runtime_error("Failed to open configuration file: " + path);
        }
        return std::string{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};
    }
}

int main(int argc, char** argv)
{
    auto app = CLI::App{"filelog-tail"};

    auto version = ::filelogVersionType{};
    ::filelogGetVersion(&version);
    app.set_version_flag("--version", version.full);

    auto configFile = std::string{};
    app.add_option("-c,--config", configFile, "JSON configuration file")->check(CLI::ExistingFile);

    auto include = std::vector<std::string>{};
    app.add_option("-i,--include", include, "Glob pattern of the files to follow, overrides the configuration");

    auto stateDirectory = std::string{};
    app.add_option("-s,--state-dir", stateDirectory, "Directory that keeps the read positions across restarts");

    auto startAt = std::string{};
    app.add_option("--start-at", startAt, "Where to start reading files that are found at startup")
        ->check(CLI::IsMember({"beginning", "end"}));

    auto once = app.add_flag("--once", "Run a single poll cycle and exit");

    CLI11_PARSE(app, argc, argv);

    try
    {
        auto config = filelog::lib::ConfigParser{configFile.empty() ? std::string{} : readConfigFile(configFile)}.config();
        if (!include.empty())
        {
            config.include = include;
        }
        if (!startAt.empty())
        {
            config.reader.startAt = (startAt == "beginning") ? filelog::lib::StartAt::Beginning : filelog::lib::StartAt::End;
        }

        auto persister = std::shared_ptr<filelog::lib::Persister>{};
        if (stateDirectory.empty())
        {
            persister = std::make_shared<filelog::lib::MemoryPersister>();
        }
        else
        {
            persister = std::make_shared<filelog::lib::DirectoryPersister>(stateDirectory);
        }

        auto const colored = isTerminal();
        auto finder = std::make_unique<filelog::lib::GlobFileFinder>(config.include, config.exclude);
        auto manager = filelog::lib::Manager{std::move(config),
            std::move(finder),
            persister,
            [colored](filelog::lib::Record&& record)
            {
                if (colored)
                {
                    fmt::print("{}: {}\n", fmt::format(fmt::fg(fmt::color::cyan), "{}", record.attributes->path), record.body);
                }
                else
                {
                    fmt::print("{}: {}\n", record.attributes->path, record.body);
                }
            }};

        if (once->count() > 0)
        {
            manager.loadCheckpoint();
            manager.poll();
            manager.saveCheckpoint();
            return EXIT_SUCCESS;
        }

        std::signal(SIGINT, &signal_handler);
        std::signal(SIGTERM, &signal_handler);

        manager.start();
        while (!g_exit_requested)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
        manager.stop();
    }
    catch (filelog::lib::Exception const& e)
    {
        std::cerr << "ERROR: " << ::filelogStatusToString(e.status()) << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (std::exception const& e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
