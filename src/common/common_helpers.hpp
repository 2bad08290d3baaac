//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_COMMON_HELPERS_HPP_INCLUDED
#define ZFSX_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace zfsx
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

inline bool isAsciiSpace(const char ch) noexcept
{
    return (ch == ' ') || (ch == '\t') || (ch == '\r') || (ch == '\n') || (ch == '\v') || (ch == '\f');
}

/// Returns a copy of the string without leading and trailing ASCII whitespace.
///
inline std::string trimWhitespace(const std::string& str)
{
    const auto first = std::find_if_not(str.begin(), str.end(), isAsciiSpace);
    const auto last  = std::find_if_not(str.rbegin(), str.rend(), isAsciiSpace).base();
    return (first < last) ? std::string{first, last} : std::string{};
}

inline bool startsWith(const std::string& str, const std::string& prefix) noexcept
{
    return (str.size() >= prefix.size()) && (0 == str.compare(0, prefix.size(), prefix));
}

inline std::string toLowerAscii(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](const unsigned char ch) {
        //
        return static_cast<char>(std::tolower(ch));
    });
    return str;
}

/// Splits the path by `/` and drops empty segments (so `//a///b/` gives `{"a", "b"}`).
///
inline std::vector<std::string> splitCleanPath(const std::string& path)
{
    std::vector<std::string> segments;
    std::size_t              begin = 0;
    while (begin <= path.size())
    {
        auto end = path.find('/', begin);
        if (end == std::string::npos)
        {
            end = path.size();
        }
        if (end > begin)
        {
            segments.emplace_back(path.substr(begin, end - begin));
        }
        begin = end + 1;
    }
    return segments;
}

}  // namespace common
}  // namespace zfsx

#endif  // ZFSX_COMMON_HELPERS_HPP_INCLUDED
