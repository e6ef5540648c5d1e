// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ReaderFactory.hpp
 * @brief Construction of Readers from one shared configuration
 *
 * The factory holds only immutable configuration, so it can be shared by every thread
 * that needs to build Readers. All per-reader parameters are collected in a
 * ReaderOptions value that is consumed by exactly one build() call.
 *
 * CONSTRUCTION PATHS:
 * - newReader(file, fingerprint): file seen for the first time, fingerprint supplied
 * - newReader(file): same, the factory computes the fingerprint itself
 * - copy(old, file): continue an existing Reader on a new handle (rotation, reopen)
 * - restore(fingerprint, offset, attributes): detached Reader rebuilt from a checkpoint
 * - unsafeReader(): no file, no fingerprint; only used to verify the configuration
 *
 * BUILD STEPS (build()):
 * 1. Encoding, then split function unless one is supplied (ConfigurationError aborts)
 * 2. File attributes, resolved from the path of the file; failure is only logged
 * 3. Offset moved to the end of the file when requested (IoException aborts)
 * 4. Fingerprint computed from the file when none is supplied (IoException aborts)
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include "filelog-internal/Encoding.hpp"
#include "filelog-internal/File.hpp"
#include "filelog-internal/FileAttributes.hpp"
#include "filelog-internal/Fingerprint.hpp"
#include "filelog-internal/Reader.hpp"
#include "filelog-internal/Splitter.hpp"

namespace filelog::lib
{
    /** Where a Reader for a file seen for the first time starts reading. */
    enum class StartAt
    {
        Beginning,
        End
    };

    struct ReaderFactoryConfig
    {
        /** Maximum number of leading bytes captured in a Fingerprint. */
        std::size_t fingerprintSize = 1000;
        /** Records longer than this are split. */
        std::size_t maxLogSize = 1024 * 1024;
        StartAt startAt = StartAt::End;
        SplitterConfig splitter;
        EncodingConfig encoding;
    };

    /** Parameters of a single build() call. */
    struct ReaderOptions
    {
        /** Detached for restored and unsafe readers. */
        File file;
        /** Computed from the file when absent. */
        std::optional<Fingerprint> fingerprint;
        std::uint64_t offset = 0;
        /** Built from the splitter configuration when empty. */
        SplitFunc splitFunc;
        /** Used as-is instead of resolving them from the file path. */
        std::optional<FileAttributes> attributes;
        /** Move the offset to the end of the file after opening. */
        bool startAtEnd = false;
    };

    class ReaderFactory
    {
    public:
        explicit ReaderFactory(ReaderFactoryConfig config);

        /**
         * Reader for a file seen for the first time, using the configured start position.
         * @throws Exception (FILELOG_ERR_CONFIGURATION), IoException
         */
        [[nodiscard]]
        std::unique_ptr<Reader> newReader(File&& file, Fingerprint fingerprint) const;

        /**
         * Reader for a file seen for the first time with an explicit start position.
         * @throws Exception (FILELOG_ERR_CONFIGURATION), IoException
         */
        [[nodiscard]]
        std::unique_ptr<Reader> newReader(File&& file, Fingerprint fingerprint, StartAt startAt) const;

        /**
         * Reader for a file seen for the first time; the fingerprint is computed here.
         * @throws Exception (FILELOG_ERR_CONFIGURATION), IoException
         */
        [[nodiscard]]
        std::unique_ptr<Reader> newReader(File&& file) const;

        /**
         * Continue an existing Reader on a new handle: fingerprint copied, offset carried
         * over verbatim, split function reused. Never moves the offset to the end.
         * @throws Exception (FILELOG_ERR_CONFIGURATION), IoException
         */
        [[nodiscard]]
        std::unique_ptr<Reader> copy(Reader const& old, File&& newFile) const;

        /**
         * Reader without file and fingerprint. Building it validates the configuration.
         * @throws Exception (FILELOG_ERR_CONFIGURATION)
         */
        [[nodiscard]]
        std::unique_ptr<Reader> unsafeReader() const;

        /**
         * Detached Reader rebuilt from a checkpoint entry.
         * @throws Exception (FILELOG_ERR_CONFIGURATION)
         */
        [[nodiscard]]
        std::unique_ptr<Reader> restore(Fingerprint fingerprint, std::uint64_t offset, FileAttributes attributes) const;

        /** @throws IoException if the file cannot be read */
        [[nodiscard]]
        Fingerprint newFingerprint(File const& file) const;

        /** Build a Reader from explicit options. */
        [[nodiscard]]
        std::unique_ptr<Reader> build(ReaderOptions&& options) const;

        [[nodiscard]]
        ReaderFactoryConfig const& config() const noexcept;

    private:
        ReaderFactoryConfig _config;
    };
}
