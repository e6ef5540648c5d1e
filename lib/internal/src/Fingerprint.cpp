// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "filelog-internal/Fingerprint.hpp"
#include <algorithm>
#include <iterator>
#include <utility>
#include <fmt/format.h>
#include "filelog-internal/Exception.hpp"

namespace filelog::lib
{
    namespace
    {
        int hexValue(char c) noexcept
        {
            if ((c >= '0') && (c <= '9'))
            {
                return c - '0';
            }
            if ((c >= 'a') && (c <= 'f'))
            {
                return c - 'a' + 10;
            }
            if ((c >= 'A') && (c <= 'F'))
            {
                return c - 'A' + 10;
            }
            return -1;
        }
    }

    Fingerprint::Fingerprint(std::vector<std::uint8_t> firstBytes)
        : _firstBytes{std::move(firstBytes)}
    {}

    Fingerprint Fingerprint::compute(File const& file, std::size_t maxSize)
    {
        auto buffer = std::vector<std::uint8_t>(maxSize);
        auto const n = file.readAt(0, buffer);
        buffer.resize(n);
        return Fingerprint{std::move(buffer)};
    }

    Fingerprint Fingerprint::copy() const
    {
        return Fingerprint{_firstBytes};
    }

    bool Fingerprint::startsWith(Fingerprint const& prefix) const noexcept
    {
        if (prefix._firstBytes.size() > _firstBytes.size())
        {
            return false;
        }
        return std::equal(prefix._firstBytes.begin(), prefix._firstBytes.end(), _firstBytes.begin());
    }

    void Fingerprint::extend(std::uint64_t position, std::span<std::uint8_t const> bytes, std::size_t maxSize)
    {
        auto const current = _firstBytes.size();
        if ((current >= maxSize) || (position > current) || (position + bytes.size() <= current))
        {
            return;
        }

        // Skip the part of the chunk the fingerprint already covers.
        auto const skip = static_cast<std::size_t>(current - position);
        auto const count = std::min(bytes.size() - skip, maxSize - current);
        _firstBytes.insert(_firstBytes.end(), bytes.begin() + skip, bytes.begin() + skip + count);
    }

    bool Fingerprint::empty() const noexcept
    {
        return _firstBytes.empty();
    }

    std::size_t Fingerprint::size() const noexcept
    {
        return _firstBytes.size();
    }

    std::vector<std::uint8_t> const& Fingerprint::bytes() const noexcept
    {
        return _firstBytes;
    }

    std::string Fingerprint::toHex() const
    {
        auto result = std::string{};
        result.reserve(_firstBytes.size() * 2);
        for (auto const b : _firstBytes)
        {
            fmt::format_to(std::back_inserter(result), "{:02x}", b);
        }
        return result;
    }

    Fingerprint Fingerprint::fromHex(std::string const& hex)
    {
        if ((hex.size() % 2) != 0)
        {
            throw Exception::invalidArgument("Hex fingerprint has an odd length of {}.", hex.size());
        }

        auto bytes = std::vector<std::uint8_t>{};
        bytes.reserve(hex.size() / 2);
        for (auto i = std::size_t{0}; i < hex.size(); i += 2)
        {
            auto const hi = hexValue(hex[i]);
            auto const lo = hexValue(hex[i + 1]);
            if ((hi < 0) || (lo < 0))
            {
                throw Exception::invalidArgument("Invalid hex digit in fingerprint at position {}.", i);
            }
            bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
        return Fingerprint{std::move(bytes)};
    }
}
