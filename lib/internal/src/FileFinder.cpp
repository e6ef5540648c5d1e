// SPDX-FileCopyrightText: 2025 Contributors to the filelog project.
// SPDX-License-Identifier: Apache-2.0

#include "filelog-internal/FileFinder.hpp"
#include <algorithm>
#include <system_error>
#include <utility>
#include <fnmatch.h>
#include <glob.h>
#include "filelog-internal/Logging.hpp"

namespace filelog::lib
{
    namespace
    {
        /** glob_t owner, released with globfree(). */
        class GlobResult
        {
        public:
            GlobResult() noexcept
                : _glob{}
            {}

            ~GlobResult()
            {
                ::globfree(&_glob);
            }

            GlobResult(GlobResult const&) = delete;
            GlobResult& operator=(GlobResult const&) = delete;

            ::glob_t* get() noexcept
            {
                return &_glob;
            }

        private:
            ::glob_t _glob;
        };

        bool isExcluded(std::string const& path, std::vector<std::string> const& exclude)
        {
            return std::ranges::any_of(exclude, [&](std::string const& pattern) { return ::fnmatch(pattern.c_str(), path.c_str(), 0) == 0; });
        }
    }

    FileFinder::~FileFinder() = default;

    GlobFileFinder::GlobFileFinder(std::vector<std::string> include, std::vector<std::string> exclude)
        : _include{std::move(include)}
        , _exclude{std::move(exclude)}
    {}

    std::vector<std::filesystem::path> GlobFileFinder::findFiles() const
    {
        auto result = std::vector<std::filesystem::path>{};

        for (auto const& pattern : _include)
        {
            auto matches = GlobResult{};
            auto const ret = ::glob(pattern.c_str(), 0, nullptr, matches.get());
            if (ret == GLOB_NOMATCH)
            {
                FILELOG_TRACE("No files match pattern. pattern={}", pattern);
                continue;
            }
            if (ret != 0)
            {
                FILELOG_WARN("Failed to expand pattern. pattern={} code={}", pattern, ret);
                continue;
            }

            for (auto i = std::size_t{0}; i < matches.get()->gl_pathc; ++i)
            {
                auto const path = std::string{matches.get()->gl_pathv[i]};
                if (isExcluded(path, _exclude))
                {
                    continue;
                }

                auto ec = std::error_code{};
                if (!std::filesystem::is_regular_file(path, ec))
                {
                    continue;
                }
                result.emplace_back(path);
            }
        }

        std::ranges::sort(result);
        auto const duplicates = std::ranges::unique(result);
        result.erase(duplicates.begin(), duplicates.end());
        return result;
    }
}
