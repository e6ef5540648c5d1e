// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "filelog-internal/Manager.hpp"
#include <algorithm>
#include <atomic>
#include <iterator>
#include <optional>
#include <set>
#include <system_error>
#include <tuple>
#include <utility>
#include <fmt/ranges.h>
#include "filelog-internal/Checkpoint.hpp"
#include "filelog-internal/Exception.hpp"
#include "filelog-internal/Logging.hpp"

namespace filelog::lib
{
    struct Manager::Candidate
    {
        std::filesystem::path path;
        File file;
        Fingerprint fingerprint;
        FileKey key;
        std::uint64_t size;
        /** Open tracked Reader whose handle was used instead of opening the path again. */
        std::optional<std::size_t> tracked;
    };

    namespace
    {
        /** Manager whose consumer is running on this thread. */
        thread_local Manager const* t_consumingManager = nullptr;

        class ConsumerScope
        {
        public:
            explicit ConsumerScope(Manager const* manager) noexcept
                : _previous{std::exchange(t_consumingManager, manager)}
            {}

            ~ConsumerScope()
            {
                t_consumingManager = _previous;
            }

            ConsumerScope(ConsumerScope const&) = delete;
            ConsumerScope& operator=(ConsumerScope const&) = delete;

        private:
            Manager const* _previous;
        };

        void requireOutsideConsumer(Manager const* manager, char const* operation)
        {
            if (t_consumingManager == manager)
            {
                throw Exception::invalidState("Manager::{} can not be called from the record consumer.", operation);
            }
        }

        /** Rank of a compatible tracked Reader: fingerprint equality, then file key, then path. */
        int matchScore(Reader const& reader, Fingerprint const& fingerprint, FileKey const& key, std::string const& path)
        {
            auto score = 0;
            if (*reader.fingerprint() == fingerprint)
            {
                score += 4;
            }
            if (reader.attributes().key && (*reader.attributes().key == key))
            {
                score += 2;
            }
            if (reader.attributes().path == path)
            {
                score += 1;
            }
            return score;
        }

        bool isCompatible(Reader const& reader, Fingerprint const& fingerprint, FileKey const& key, std::uint64_t size)
        {
            auto const& tracked = reader.fingerprint();
            if (!tracked)
            {
                return false;
            }
            // Data behind the tracked offset is gone: whatever is there now is another file.
            if (reader.offset() > size)
            {
                return false;
            }
            if (tracked->empty())
            {
                return reader.attributes().key && (*reader.attributes().key == key);
            }
            return fingerprint.startsWith(*tracked);
        }

        bool isDuplicate(Fingerprint const& lhsFingerprint, FileKey const& lhsKey, Fingerprint const& rhsFingerprint, FileKey const& rhsKey)
        {
            if (lhsKey == rhsKey)
            {
                return true;
            }
            if (lhsFingerprint.empty() || rhsFingerprint.empty())
            {
                return false;
            }
            return lhsFingerprint.startsWith(rhsFingerprint) || rhsFingerprint.startsWith(lhsFingerprint);
        }
    }

    Manager::Manager(ManagerConfig config, std::unique_ptr<FileFinder> finder, std::shared_ptr<Persister> persister, RecordConsumer consumer)
        : _config{std::move(config)}
        , _factory{_config.reader}
        , _finder{std::move(finder)}
        , _persister{std::move(persister)}
        , _consumer{std::move(consumer)}
        , _tracked{}
        , _firstCycle{true}
        , _cycle{0}
        , _lastSelected{}
    {
        initializeLogging();
        validateConfig(_config);

        if (!_finder || !_persister || !_consumer)
        {
            throw Exception::invalidArgument("Manager requires a file finder, a persister and a consumer.");
        }

        // Fails with a configuration error if the splitter or the encoding can not be built.
        (void)_factory.unsafeReader();
        FILELOG_DEBUG("Configuration verified. encoding={} fingerprint_size={}", _config.reader.encoding.name, _config.reader.fingerprintSize);
    }

    Manager::~Manager()
    {
        stop();
    }

    void Manager::start()
    {
        requireOutsideConsumer(this, "start");
        if (_pollThread.joinable())
        {
            throw Exception::invalidState("Manager is already running.");
        }

        loadCheckpoint();
        _stopSource = std::stop_source{};
        _pollThread = std::thread{&Manager::run, this, _stopSource.get_token()};
        FILELOG_INFO("Manager started. include={} poll_interval_ms={}", fmt::join(_config.include, ","), _config.pollInterval.count());
    }

    void Manager::stop()
    {
        requireOutsideConsumer(this, "stop");
        if (!_pollThread.joinable())
        {
            return;
        }

        _stopSource.request_stop();
        _pollThread.join();

        auto const lock = std::lock_guard{_cycleMutex};
        for (auto& tracked : _tracked)
        {
            tracked.reader->close();
        }

        try
        {
            saveCheckpointLocked();
        }
        catch (Exception const& e)
        {
            FILELOG_ERROR("Failed to save the final checkpoint. error={}", e.what());
        }
        FILELOG_INFO("Manager stopped. tracked_files={}", _tracked.size());
    }

    void Manager::run(std::stop_token stop)
    {
        while (!stop.stop_requested())
        {
            try
            {
                poll(stop);
            }
            catch (std::exception const& e)
            {
                // poll() handles per-file and per-cycle failures itself.
                FILELOG_CRITICAL("Unexpected failure in poll cycle. error={}", e.what());
            }

            auto lock = std::unique_lock{_waitMutex};
            _wakeUp.wait_for(lock, stop, _config.pollInterval, []() { return false; });
        }
    }

    void Manager::poll(std::stop_token stop)
    {
        requireOutsideConsumer(this, "poll");
        auto const lock = std::lock_guard{_cycleMutex};
        ++_cycle;

        auto discovered = std::vector<std::filesystem::path>{};
        try
        {
            discovered = _finder->findFiles();
            std::ranges::sort(discovered);
            auto const duplicates = std::ranges::unique(discovered);
            discovered.erase(duplicates.begin(), duplicates.end());
        }
        catch (std::exception const& e)
        {
            // Tracked files do not age on a failed discovery.
            FILELOG_ERROR("File discovery failed. error={}", e.what());
            return;
        }

        auto const selected = selectPaths(discovered);
        auto deferred = std::vector<std::filesystem::path>{};
        std::ranges::set_difference(discovered, selected, std::back_inserter(deferred));
        if (!deferred.empty())
        {
            FILELOG_DEBUG("Deferring files over the handle limit. deferred={} max_concurrent_files={}", deferred.size(), _config.maxConcurrentFiles);
        }

        auto failed = std::vector<std::filesystem::path>{};
        auto candidates = openCandidates(selected, failed);

        // Files that are still discovered keep their age, whether they were deferred or failed to open.
        auto retained = std::set<std::string>{};
        for (auto const& path : deferred)
        {
            retained.insert(path.string());
        }
        for (auto const& path : failed)
        {
            retained.insert(path.string());
        }
        reconcile(std::move(candidates), std::move(retained));
        _firstCycle = false;

        readAll(stop);

        try
        {
            saveCheckpointLocked();
        }
        catch (Exception const& e)
        {
            FILELOG_ERROR("Failed to save checkpoint. error={}", e.what());
        }
    }

    std::vector<std::filesystem::path> Manager::selectPaths(std::vector<std::filesystem::path> const& discovered)
    {
        auto selected = discovered;

        // Forget paths that are no longer discovered.
        std::erase_if(_lastSelected,
            [&](auto const& item) { return !std::ranges::binary_search(selected, std::filesystem::path{item.first}); });

        if (selected.size() > _config.maxConcurrentFiles)
        {
            struct Priority
            {
                std::uint64_t lastSelected;
                std::filesystem::file_time_type modified;
                std::filesystem::path path;
            };

            auto priorities = std::vector<Priority>{};
            priorities.reserve(selected.size());
            for (auto const& path : selected)
            {
                auto ec = std::error_code{};
                auto modified = std::filesystem::last_write_time(path, ec);
                if (ec)
                {
                    modified = std::filesystem::file_time_type::min();
                }
                auto const it = _lastSelected.find(path.string());
                priorities.push_back(Priority{(it == _lastSelected.end()) ? 0 : it->second, modified, path});
            }

            std::ranges::sort(priorities,
                [](Priority const& lhs, Priority const& rhs)
                {
                    return std::tie(lhs.lastSelected, rhs.modified, lhs.path) < std::tie(rhs.lastSelected, lhs.modified, rhs.path);
                });
            priorities.resize(_config.maxConcurrentFiles);

            selected.clear();
            for (auto const& priority : priorities)
            {
                selected.push_back(priority.path);
            }
            std::ranges::sort(selected);
        }

        for (auto const& path : selected)
        {
            _lastSelected[path.string()] = _cycle;
        }
        return selected;
    }

    std::vector<Manager::Candidate> Manager::openCandidates(std::vector<std::filesystem::path> const& paths, std::vector<std::filesystem::path>& failed)
    {
        // An open Reader whose path still names its file lends its handle to the candidate,
        // every other open Reader is closed before anything is opened. This keeps the number
        // of open handles at or below paths.size() throughout the cycle.
        auto reusable = std::map<std::string, std::size_t>{};
        for (auto i = std::size_t{0}; i < _tracked.size(); ++i)
        {
            auto& reader = *_tracked[i].reader;
            if (!reader.isOpen())
            {
                continue;
            }

            auto const& attributes = reader.attributes();
            auto reuse = false;
            if (attributes.key && !reusable.contains(attributes.path) && std::ranges::binary_search(paths, std::filesystem::path{attributes.path}))
            {
                try
                {
                    reuse = (File::keyAt(attributes.path) == *attributes.key);
                }
                catch (Exception const& e)
                {
                    FILELOG_TRACE("File no longer at its path. path={} error={}", attributes.path, e.what());
                }
            }

            if (reuse)
            {
                reusable.emplace(attributes.path, i);
            }
            else
            {
                reader.close();
            }
        }

        auto candidates = std::vector<Candidate>{};
        for (auto const& path : paths)
        {
            try
            {
                if (auto const it = reusable.find(path.string()); it != reusable.end())
                {
                    auto const& file = _tracked[it->second].reader->file();
                    auto fingerprint = _factory.newFingerprint(file);
                    auto const key = file.key();
                    auto const size = file.size();
                    candidates.push_back(Candidate{path, File{}, std::move(fingerprint), key, size, it->second});
                    continue;
                }

                auto file = File::open(path);
                auto fingerprint = _factory.newFingerprint(file);
                auto const key = file.key();
                auto const size = file.size();
                candidates.push_back(Candidate{path, std::move(file), std::move(fingerprint), key, size, std::nullopt});
            }
            catch (Exception const& e)
            {
                FILELOG_WARN("Failed to open file, retrying next cycle. path={} error={}", path.string(), e.what());
                failed.push_back(path);
            }
        }

        // Collapse candidates that are the same logical file, keeping the longest fingerprint.
        auto unique = std::vector<Candidate>{};
        for (auto& candidate : candidates)
        {
            auto const it = std::ranges::find_if(unique,
                [&](Candidate const& kept) { return isDuplicate(kept.fingerprint, kept.key, candidate.fingerprint, candidate.key); });
            if (it == unique.end())
            {
                unique.push_back(std::move(candidate));
            }
            else
            {
                FILELOG_DEBUG("Skipping duplicate file. path={} duplicate_of={}", candidate.path.string(), it->path.string());
                if (candidate.fingerprint.size() > it->fingerprint.size())
                {
                    *it = std::move(candidate);
                }
            }
        }
        return unique;
    }

    void Manager::reconcile(std::vector<Candidate>&& candidates, std::set<std::string>&& retained)
    {
        auto claimed = std::vector<bool>(_tracked.size(), false);
        auto reserved = std::vector<bool>(_tracked.size(), false);
        for (auto const& candidate : candidates)
        {
            if (candidate.tracked)
            {
                reserved[*candidate.tracked] = true;
            }
        }

        auto next = std::vector<TrackedFile>{};
        next.reserve(candidates.size() + _tracked.size());

        for (auto& candidate : candidates)
        {
            auto const path = candidate.path.string();

            auto best = std::optional<std::size_t>{};
            if (candidate.tracked && isCompatible(*_tracked[*candidate.tracked].reader, candidate.fingerprint, candidate.key, candidate.size))
            {
                best = candidate.tracked;
            }
            else
            {
                if (candidate.tracked)
                {
                    // Same file, but its content no longer continues what was read.
                    _tracked[*candidate.tracked].reader->close();
                    reserved[*candidate.tracked] = false;
                }

                auto bestScore = -1;
                for (auto i = std::size_t{0}; i < _tracked.size(); ++i)
                {
                    if (claimed[i] || reserved[i] || !isCompatible(*_tracked[i].reader, candidate.fingerprint, candidate.key, candidate.size))
                    {
                        continue;
                    }
                    auto const score = matchScore(*_tracked[i].reader, candidate.fingerprint, candidate.key, path);
                    if (score > bestScore)
                    {
                        best = i;
                        bestScore = score;
                    }
                }
            }

            try
            {
                if (!best)
                {
                    if (!candidate.file)
                    {
                        candidate.file = File::open(candidate.path);
                    }
                    auto const startAt = _firstCycle ? _config.reader.startAt : StartAt::Beginning;
                    auto reader = _factory.newReader(std::move(candidate.file), std::move(candidate.fingerprint), startAt);
                    FILELOG_DEBUG("New file. path={} offset={}", path, reader->offset());
                    next.push_back(TrackedFile{std::move(reader), 0});
                    continue;
                }

                auto& tracked = _tracked[*best];
                claimed[*best] = true;

                auto const& attributes = tracked.reader->attributes();
                if (tracked.reader->isOpen() && (attributes.path == path) && attributes.key && (*attributes.key == candidate.key))
                {
                    FILELOG_TRACE("Continuing reader. path={} offset={}", path, tracked.reader->offset());
                    next.push_back(TrackedFile{std::move(tracked.reader), 0});
                    continue;
                }

                if (!candidate.file)
                {
                    candidate.file = File::open(candidate.path);
                }
                auto reader = _factory.copy(*tracked.reader, std::move(candidate.file));
                FILELOG_DEBUG("Continuing file on a new handle. path={} previous_path={} offset={}", path, attributes.path, reader->offset());
                tracked.reader->close();
                next.push_back(TrackedFile{std::move(reader), 0});
                tracked.reader.reset();
            }
            catch (Exception const& e)
            {
                FILELOG_WARN("Failed to create reader, retrying next cycle. path={} error={}", path, e.what());
                retained.insert(path);
                if (best && _tracked[*best].reader)
                {
                    // Keep the previous state so that nothing is read twice once the file recovers.
                    _tracked[*best].reader->close();
                    next.push_back(std::move(_tracked[*best]));
                }
            }
        }

        for (auto i = std::size_t{0}; i < _tracked.size(); ++i)
        {
            if (claimed[i])
            {
                continue;
            }

            auto& tracked = _tracked[i];
            tracked.reader->close();
            if (!retained.contains(tracked.reader->attributes().path))
            {
                ++tracked.missedCycles;
            }

            if (tracked.missedCycles > _config.lostFileRetentionCycles)
            {
                FILELOG_INFO("Forgetting file. path={} offset={}", tracked.reader->attributes().path, tracked.reader->offset());
                continue;
            }
            next.push_back(std::move(tracked));
        }

        _tracked = std::move(next);
    }

    void Manager::readAll(std::stop_token stop)
    {
        auto readers = std::vector<Reader*>{};
        for (auto& tracked : _tracked)
        {
            if (tracked.reader->isOpen())
            {
                readers.push_back(tracked.reader.get());
            }
        }
        if (readers.empty())
        {
            return;
        }

        auto const consumer = RecordConsumer{[this](Record&& record)
            {
                auto const lock = std::lock_guard{_consumerMutex};
                auto const scope = ConsumerScope{this};
                _consumer(std::move(record));
            }};

        auto nextIndex = std::atomic<std::size_t>{0};
        auto const worker = [&]()
        {
            while (!stop.stop_requested())
            {
                auto const index = nextIndex.fetch_add(1);
                if (index >= readers.size())
                {
                    return;
                }

                auto& reader = *readers[index];
                try
                {
                    auto const count = reader.readToEnd(consumer, stop);
                    FILELOG_TRACE("Read file. path={} records={} offset={}", reader.attributes().path, count, reader.offset());
                }
                catch (std::exception const& e)
                {
                    FILELOG_WARN("Failed to read file, retrying next cycle. path={} offset={} error={}", reader.attributes().path, reader.offset(), e.what());
                }
            }
        };

        auto const workerCount = std::min(_config.workerCount, readers.size());
        if (workerCount <= 1)
        {
            worker();
            return;
        }

        auto workers = std::vector<std::thread>{};
        workers.reserve(workerCount);
        for (auto i = std::size_t{0}; i < workerCount; ++i)
        {
            workers.emplace_back(worker);
        }
        for (auto& thread : workers)
        {
            thread.join();
        }
    }

    void Manager::loadCheckpoint()
    {
        requireOutsideConsumer(this, "loadCheckpoint");
        auto const lock = std::lock_guard{_cycleMutex};

        auto text = std::optional<std::string>{};
        try
        {
            text = _persister->get(CHECKPOINT_KEY);
        }
        catch (Exception const& e)
        {
            FILELOG_ERROR("Failed to load checkpoint, starting without one. error={}", e.what());
            return;
        }
        if (!text)
        {
            FILELOG_INFO("No checkpoint found, starting without one.");
            return;
        }

        try
        {
            auto tracked = std::vector<TrackedFile>{};
            for (auto& entry : decodeCheckpoint(*text))
            {
                tracked.push_back(TrackedFile{_factory.restore(std::move(entry.fingerprint), entry.offset, std::move(entry.attributes)), 0});
            }
            _tracked = std::move(tracked);
            FILELOG_INFO("Restored checkpoint. tracked_files={}", _tracked.size());
        }
        catch (Exception const& e)
        {
            FILELOG_WARN("Ignoring malformed checkpoint. error={}", e.what());
        }
    }

    void Manager::saveCheckpoint()
    {
        requireOutsideConsumer(this, "saveCheckpoint");
        auto const lock = std::lock_guard{_cycleMutex};
        saveCheckpointLocked();
    }

    void Manager::saveCheckpointLocked()
    {
        auto entries = std::vector<CheckpointEntry>{};
        entries.reserve(_tracked.size());
        for (auto const& tracked : _tracked)
        {
            if (tracked.reader->fingerprint())
            {
                entries.push_back(CheckpointEntry{tracked.reader->fingerprint()->copy(), tracked.reader->offset(), tracked.reader->attributes()});
            }
        }
        _persister->set(CHECKPOINT_KEY, encodeCheckpoint(entries));
    }

    std::vector<TrackedFileInfo> Manager::trackedFiles() const
    {
        requireOutsideConsumer(this, "trackedFiles");
        auto const lock = std::lock_guard{_cycleMutex};

        auto result = std::vector<TrackedFileInfo>{};
        result.reserve(_tracked.size());
        for (auto const& tracked : _tracked)
        {
            auto const& reader = *tracked.reader;
            result.push_back(TrackedFileInfo{reader.attributes().path,
                reader.fingerprint() ? reader.fingerprint()->copy() : Fingerprint{},
                reader.offset(),
                reader.isOpen(),
                tracked.missedCycles});
        }
        return result;
    }

    std::size_t Manager::openFileCount() const
    {
        requireOutsideConsumer(this, "openFileCount");
        auto const lock = std::lock_guard{_cycleMutex};
        return static_cast<std::size_t>(std::ranges::count_if(_tracked, [](TrackedFile const& tracked) { return tracked.reader->isOpen(); }));
    }

    ReaderFactory const& Manager::factory() const noexcept
    {
        return _factory;
    }
}
