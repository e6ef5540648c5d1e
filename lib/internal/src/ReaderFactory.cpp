// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "filelog-internal/ReaderFactory.hpp"
#include <utility>
#include "filelog-internal/Exception.hpp"
#include "filelog-internal/Logging.hpp"

namespace filelog::lib
{
    ReaderFactory::ReaderFactory(ReaderFactoryConfig config)
        : _config{std::move(config)}
    {}

    std::unique_ptr<Reader> ReaderFactory::newReader(File&& file, Fingerprint fingerprint) const
    {
        return newReader(std::move(file), std::move(fingerprint), _config.startAt);
    }

    std::unique_ptr<Reader> ReaderFactory::newReader(File&& file, Fingerprint fingerprint, StartAt startAt) const
    {
        auto options = ReaderOptions{};
        options.file = std::move(file);
        options.fingerprint = std::move(fingerprint);
        options.startAtEnd = (startAt == StartAt::End);
        return build(std::move(options));
    }

    std::unique_ptr<Reader> ReaderFactory::newReader(File&& file) const
    {
        auto options = ReaderOptions{};
        options.file = std::move(file);
        options.startAtEnd = (_config.startAt == StartAt::End);
        return build(std::move(options));
    }

    std::unique_ptr<Reader> ReaderFactory::copy(Reader const& old, File&& newFile) const
    {
        auto options = ReaderOptions{};
        options.file = std::move(newFile);
        if (old.fingerprint())
        {
            options.fingerprint = old.fingerprint()->copy();
        }
        options.offset = old.offset();
        options.splitFunc = old.splitFunc();
        return build(std::move(options));
    }

    std::unique_ptr<Reader> ReaderFactory::unsafeReader() const
    {
        return build(ReaderOptions{});
    }

    std::unique_ptr<Reader> ReaderFactory::restore(Fingerprint fingerprint, std::uint64_t offset, FileAttributes attributes) const
    {
        auto options = ReaderOptions{};
        options.fingerprint = std::move(fingerprint);
        options.offset = offset;
        options.attributes = std::move(attributes);
        return build(std::move(options));
    }

    Fingerprint ReaderFactory::newFingerprint(File const& file) const
    {
        return Fingerprint::compute(file, _config.fingerprintSize);
    }

    std::unique_ptr<Reader> ReaderFactory::build(ReaderOptions&& options) const
    {
        auto encoding = buildEncoding(_config.encoding);
        auto splitFunc = options.splitFunc ? std::move(options.splitFunc) : buildSplitFunc(_config.splitter, *encoding);

        auto attributes = FileAttributes{};
        if (options.attributes)
        {
            attributes = std::move(*options.attributes);
        }
        else if (options.file)
        {
            try
            {
                attributes = resolveFileAttributes(options.file.path());
            }
            catch (Exception const& e)
            {
                FILELOG_WARN("Failed to resolve file attributes. path={} error={}", options.file.path().string(), e.what());
                attributes = unresolvedFileAttributes(options.file.path());
            }
        }

        if (options.file)
        {
            attributes.key = options.file.key();
        }

        auto fingerprint = std::move(options.fingerprint);
        if (!fingerprint && options.file)
        {
            fingerprint = newFingerprint(options.file);
        }

        auto const hasFile = options.file.isOpen();
        auto reader = std::unique_ptr<Reader>{new Reader{std::move(options.file),
            std::move(fingerprint),
            options.offset,
            _config.fingerprintSize,
            _config.maxLogSize,
            std::move(splitFunc),
            std::move(encoding),
            std::move(attributes)}};

        if (hasFile && options.startAtEnd)
        {
            reader->offsetToEnd();
        }

        FILELOG_DEBUG("Built reader. path={} offset={} fingerprint_size={}",
            reader->attributes().path,
            reader->offset(),
            reader->fingerprint() ? reader->fingerprint()->size() : 0);
        return reader;
    }

    ReaderFactoryConfig const& ReaderFactory::config() const noexcept
    {
        return _config;
    }
}
