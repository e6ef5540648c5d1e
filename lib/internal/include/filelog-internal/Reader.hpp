// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Reader.hpp
 * @brief Read cursor of one log file
 *
 * A Reader owns the open File of one logical log file together with everything needed
 * to turn its bytes into records: the committed offset, the Fingerprint identifying the
 * file, the resolved FileAttributes, the split function and the encoding.
 *
 * LIFECYCLE:
 * 1. Built by ReaderFactory (newReader / copy / restore / unsafeReader)
 * 2. Driven by the Manager once per poll cycle through readToEnd()
 * 3. Closed when the file disappears from discovery, is superseded by a clone or the
 *    handle budget is exceeded; a closed Reader keeps its fingerprint and offset so it
 *    can be continued later with ReaderFactory::copy()
 *
 * OFFSET SEMANTICS:
 * - offset() is the position of the first byte not yet turned into a record
 * - It only moves forward, and never beyond the size of the file observed by the read
 * - Bytes of an incomplete trailing record are buffered but not committed; the buffer is
 *   dropped at the end of every sequence and re-read on the next one
 *
 * Thread-safety:
 * - A Reader is used by one thread at a time. The Manager hands each open Reader to
 *   exactly one worker per cycle.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include "filelog-internal/Encoding.hpp"
#include "filelog-internal/File.hpp"
#include "filelog-internal/FileAttributes.hpp"
#include "filelog-internal/Fingerprint.hpp"
#include "filelog-internal/Splitter.hpp"

namespace filelog::lib
{
    /** One decoded log record. */
    struct Record
    {
        /** Decoded record text, delimiter excluded. */
        std::string body;
        /** Offset of the first byte of the record in the file. */
        std::uint64_t offset;
        /** Attributes of the file the record was read from. */
        std::shared_ptr<FileAttributes const> attributes;
    };

    /** Synchronous downstream sink. The Reader blocks until the call returns. */
    using RecordConsumer = std::function<void(Record&&)>;

    class ReaderFactory;

    class Reader
    {
    public:
        Reader(Reader const&) = delete;
        Reader& operator=(Reader const&) = delete;

        /**
         * Produce the next record between the current offset and the end of the file.
         *
         * The offset moves past the record (and its delimiter) before it is returned.
         * Records longer than the maximum log size are cut at that size.
         *
         * @return The record, or std::nullopt once the end of the file is reached. A later
         *         call continues with whatever has been appended since.
         * @throws Exception (FILELOG_ERR_DECODE) if the encoding rejects the record bytes;
         *         the offset has already moved past them
         * @throws IoException if the file cannot be read; the offset is unchanged
         * @throws Exception (FILELOG_ERR_INVALID_STATE) if the Reader has no open file
         */
        std::optional<Record> next();

        /**
         * Deliver every complete record up to the end of the file to the consumer.
         *
         * The offset of a record is committed only after the consumer returned. Records the
         * encoding rejects are logged and skipped. A stop request is honored between records.
         *
         * @return The number of records delivered
         * @throws IoException if the file cannot be read
         * @throws Exception (FILELOG_ERR_INVALID_STATE) if the Reader has no open file
         * @throws whatever the consumer throws; the offset then stays before that record
         */
        std::size_t readToEnd(RecordConsumer const& consumer, std::stop_token stop = {});

        /**
         * Move the offset to the current end of the file without reading.
         * @throws IoException if the size cannot be determined
         * @throws Exception (FILELOG_ERR_INVALID_STATE) if the Reader has no open file
         */
        void offsetToEnd();

        /** Close the file. Fingerprint and offset are kept. Safe to call repeatedly. */
        void close() noexcept;

        [[nodiscard]]
        bool isOpen() const noexcept;

        /** The open file. Detached handle for closed, restored and unsafe readers. */
        [[nodiscard]]
        File const& file() const noexcept;

        /** Absent only for the unsafe reader. */
        [[nodiscard]]
        std::optional<Fingerprint> const& fingerprint() const noexcept;

        [[nodiscard]]
        std::uint64_t offset() const noexcept;

        [[nodiscard]]
        FileAttributes const& attributes() const noexcept;

        [[nodiscard]]
        SplitFunc const& splitFunc() const noexcept;

        [[nodiscard]]
        Encoding const& encoding() const noexcept;

    private:
        friend class ReaderFactory;

        Reader(File file, std::optional<Fingerprint> fingerprint, std::uint64_t offset, std::size_t fingerprintSize, std::size_t maxLogSize,
            SplitFunc splitFunc, std::shared_ptr<Encoding const> encoding, FileAttributes attributes);

        /** Read the next chunk into the buffer. Returns false at end of file. */
        bool fill();

        /** Drop buffered bytes that are not committed yet. */
        void resetBuffer() noexcept;

        File _file;
        std::optional<Fingerprint> _fingerprint;
        std::uint64_t _offset;
        std::size_t _fingerprintSize;
        std::size_t _maxLogSize;
        SplitFunc _splitFunc;
        std::shared_ptr<Encoding const> _encoding;
        std::shared_ptr<FileAttributes const> _attributes;

        /** Bytes from _offset onwards that are read but not consumed yet. */
        std::vector<std::uint8_t> _buffer;
        bool _eof;
    };
}
