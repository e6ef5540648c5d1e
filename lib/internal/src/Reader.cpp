// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "filelog-internal/Reader.hpp"
#include <algorithm>
#include <utility>
#include "filelog-internal/Exception.hpp"
#include "filelog-internal/Logging.hpp"

namespace filelog::lib
{
    namespace
    {
        constexpr auto const READ_CHUNK_SIZE = std::size_t{16 * 1024};
    }

    Reader::Reader(File file, std::optional<Fingerprint> fingerprint, std::uint64_t offset, std::size_t fingerprintSize, std::size_t maxLogSize,
        SplitFunc splitFunc, std::shared_ptr<Encoding const> encoding, FileAttributes attributes)
        : _file{std::move(file)}
        , _fingerprint{std::move(fingerprint)}
        , _offset{offset}
        , _fingerprintSize{fingerprintSize}
        , _maxLogSize{maxLogSize}
        , _splitFunc{std::move(splitFunc)}
        , _encoding{std::move(encoding)}
        , _attributes{std::make_shared<FileAttributes>(std::move(attributes))}
        , _buffer{}
        , _eof{false}
    {}

    std::optional<Record> Reader::next()
    {
        if (!_file)
        {
            throw Exception::invalidState("Cannot read from a reader without an open file. path={}", _attributes->path);
        }

        // A forced split must not cut a multi byte newline unit in half.
        auto const unit = std::max<std::size_t>(_encoding->newline().size(), 1);
        auto const forcedLength = std::max(_maxLogSize - (_maxLogSize % unit), unit);

        while (true)
        {
            if (!_buffer.empty())
            {
                auto const view = std::span<std::uint8_t const>{_buffer}.first(std::min(_buffer.size(), _maxLogSize));
                auto token = _splitFunc(view, _eof && (view.size() == _buffer.size()));
                if (!token && (view.size() >= _maxLogSize))
                {
                    token = Token{forcedLength, forcedLength};
                }

                if (token && (token->advance > 0))
                {
                    auto const advance = std::min(token->advance, _buffer.size());
                    auto const length = std::min(token->length, advance);
                    auto const recordOffset = _offset;

                    auto bytes = std::vector<std::uint8_t>{_buffer.begin(), _buffer.begin() + length};
                    _buffer.erase(_buffer.begin(), _buffer.begin() + advance);
                    _offset += advance;

                    if (length == 0)
                    {
                        continue;
                    }

                    FILELOG_TRACE("Split record. path={} offset={} length={}", _attributes->path, recordOffset, length);
                    return Record{_encoding->decode(bytes), recordOffset, _attributes};
                }
            }

            if (_eof)
            {
                // End of the sequence, an incomplete trailing record is re-read next time.
                resetBuffer();
                return std::nullopt;
            }

            if (!fill())
            {
                _eof = true;
            }
        }
    }

    std::size_t Reader::readToEnd(RecordConsumer const& consumer, std::stop_token stop)
    {
        auto delivered = std::size_t{0};
        while (!stop.stop_requested())
        {
            auto const committed = _offset;
            auto record = std::optional<Record>{};
            try
            {
                record = next();
            }
            catch (Exception const& e)
            {
                if (e.status() != FILELOG_ERR_DECODE)
                {
                    throw;
                }
                FILELOG_WARN("Skipping record that failed to decode. path={} offset={} error={}", _attributes->path, committed, e.what());
                continue;
            }

            if (!record)
            {
                break;
            }

            auto const recordOffset = record->offset;
            try
            {
                consumer(std::move(*record));
            }
            catch (std::exception const&)
            {
                _offset = recordOffset;
                resetBuffer();
                throw;
            }
            ++delivered;
        }

        if (stop.stop_requested())
        {
            resetBuffer();
        }
        return delivered;
    }

    void Reader::offsetToEnd()
    {
        if (!_file)
        {
            throw Exception::invalidState("Cannot seek a reader without an open file. path={}", _attributes->path);
        }
        _offset = _file.size();
        resetBuffer();
    }

    void Reader::close() noexcept
    {
        _file.close();
        resetBuffer();
    }

    bool Reader::isOpen() const noexcept
    {
        return _file.isOpen();
    }

    File const& Reader::file() const noexcept
    {
        return _file;
    }

    std::optional<Fingerprint> const& Reader::fingerprint() const noexcept
    {
        return _fingerprint;
    }

    std::uint64_t Reader::offset() const noexcept
    {
        return _offset;
    }

    FileAttributes const& Reader::attributes() const noexcept
    {
        return *_attributes;
    }

    SplitFunc const& Reader::splitFunc() const noexcept
    {
        return _splitFunc;
    }

    Encoding const& Reader::encoding() const noexcept
    {
        return *_encoding;
    }

    bool Reader::fill()
    {
        auto const position = _offset + _buffer.size();
        auto const previousSize = _buffer.size();
        _buffer.resize(previousSize + READ_CHUNK_SIZE);

        auto n = std::size_t{0};
        try
        {
            n = _file.readAt(position, std::span<std::uint8_t>{_buffer}.subspan(previousSize));
        }
        catch (IoException const&)
        {
            resetBuffer();
            throw;
        }
        _buffer.resize(previousSize + n);

        if (n == 0)
        {
            return false;
        }

        if (_fingerprint)
        {
            _fingerprint->extend(position, std::span<std::uint8_t const>{_buffer}.subspan(previousSize), _fingerprintSize);
        }
        return true;
    }

    void Reader::resetBuffer() noexcept
    {
        _buffer.clear();
        _eof = false;
    }
}
