// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Manager.hpp
 * @brief Poll loop and reconciliation of discovered files against tracked readers
 *
 * The Manager owns the set of tracked Readers. Once per poll cycle it:
 *
 * 1. Discovers candidate paths through the FileFinder
 * 2. Selects at most maxConcurrentFiles of them; the others are deferred to a later
 *    cycle. Paths that were served least recently come first, then the most recently
 *    modified ones, then the path order.
 * 3. Opens every selected path and computes its Fingerprint. An open Reader whose path
 *    still names the same file lends its handle, every other open Reader is closed first,
 *    so at most maxConcurrentFiles handles are open at any point of the cycle
 * 4. Collapses duplicates: same device/inode, or non-empty fingerprints where one is a
 *    prefix of the other. The longest fingerprint wins.
 * 5. Matches every candidate against the tracked Readers:
 *
 *      candidate fingerprint starts with the tracked one   ----> compatible
 *      and the tracked offset <= candidate size                  (empty tracked fingerprint:
 *                                                                 only through the same file key)
 *
 *    Ties between compatible Readers are broken by exact fingerprint equality, then by
 *    the same file key, then by the same path.
 *
 *      same path and same open file  -> the tracked Reader continues
 *      otherwise                     -> ReaderFactory::copy() onto the new handle
 *      no compatible Reader          -> ReaderFactory::newReader(); start_at applies to
 *                                       the first cycle only, later files are read from
 *                                       the beginning
 *      tracked Reader not matched    -> closed, evicted after lostFileRetentionCycles
 *                                       cycles (deferred paths and paths that failed
 *                                       to open do not age)
 *
 * 6. Drains every open Reader on a pool of workerCount threads. Consumer calls are
 *    serialized.
 * 7. Saves the tracked Readers through the Persister.
 *
 * Thread-safety:
 * - poll() and the accessors may be called from any thread; cycles are serialized
 * - start() / stop() must not be called concurrently with each other
 * - The record consumer runs inside a cycle and must not call back into its Manager;
 *   such calls throw Exception (FILELOG_ERR_INVALID_STATE)
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "filelog-internal/FileFinder.hpp"
#include "filelog-internal/Fingerprint.hpp"
#include "filelog-internal/ManagerConfig.hpp"
#include "filelog-internal/Persister.hpp"
#include "filelog-internal/Reader.hpp"
#include "filelog-internal/ReaderFactory.hpp"

namespace filelog::lib
{
    /** Copy of the state of one tracked Reader. */
    struct TrackedFileInfo
    {
        std::string path;
        Fingerprint fingerprint;
        std::uint64_t offset;
        bool open;
        std::size_t missedCycles;
    };

    class Manager
    {
    public:
        /**
         * @param config Validated before anything else
         * @param finder Path discovery
         * @param persister Checkpoint store
         * @param consumer Receives every record, one call at a time
         * @throws Exception (FILELOG_ERR_CONFIGURATION) if the configuration is invalid or
         *         no Reader can be built from it
         */
        Manager(ManagerConfig config, std::unique_ptr<FileFinder> finder, std::shared_ptr<Persister> persister, RecordConsumer consumer);

        /** Stops the poll thread if it is running. */
        ~Manager();

        Manager(Manager const&) = delete;
        Manager& operator=(Manager const&) = delete;

        /**
         * Load the checkpoint and start the poll thread. The first cycle runs immediately,
         * the following ones every pollInterval.
         * @throws Exception (FILELOG_ERR_INVALID_STATE) if already running
         */
        void start();

        /**
         * Cancel the cycle in flight, join the poll thread, close every file and save a
         * final checkpoint. No-op if not running.
         */
        void stop();

        /** Run one poll cycle on the calling thread. */
        void poll(std::stop_token stop = {});

        /**
         * Replace the tracked Readers with the ones stored in the Persister.
         * A missing checkpoint leaves the Manager empty; a malformed one is logged and
         * ignored.
         */
        void loadCheckpoint();

        /**
         * Store the tracked Readers in the Persister.
         * @throws IoException if the Persister fails
         */
        void saveCheckpoint();

        [[nodiscard]]
        std::vector<TrackedFileInfo> trackedFiles() const;

        [[nodiscard]]
        std::size_t openFileCount() const;

        [[nodiscard]]
        ReaderFactory const& factory() const noexcept;

    private:
        struct TrackedFile
        {
            std::unique_ptr<Reader> reader;
            std::size_t missedCycles;
        };

        struct Candidate;

        /** Poll thread entry point. */
        void run(std::stop_token stop);

        std::vector<std::filesystem::path> selectPaths(std::vector<std::filesystem::path> const& discovered);
        std::vector<Candidate> openCandidates(std::vector<std::filesystem::path> const& paths, std::vector<std::filesystem::path>& failed);

        /**
         * Match candidates against the tracked Readers.
         * @param retained Paths that are still discovered but were not opened this cycle
         *                 (deferred or failed); their tracked entries do not age.
         */
        void reconcile(std::vector<Candidate>&& candidates, std::set<std::string>&& retained);
        void readAll(std::stop_token stop);
        void saveCheckpointLocked();

        ManagerConfig _config;
        ReaderFactory _factory;
        std::unique_ptr<FileFinder> _finder;
        std::shared_ptr<Persister> _persister;
        RecordConsumer _consumer;

        /** Serializes poll cycles and guards the tracked state. */
        mutable std::mutex _cycleMutex;
        std::vector<TrackedFile> _tracked;
        bool _firstCycle;
        std::uint64_t _cycle;
        /** Cycle in which each discovered path was last selected. */
        std::map<std::string, std::uint64_t> _lastSelected;

        /** Serializes calls of the consumer across workers. */
        std::mutex _consumerMutex;

        std::thread _pollThread;
        std::stop_source _stopSource;
        std::mutex _waitMutex;
        std::condition_variable_any _wakeUp;
    };
}
