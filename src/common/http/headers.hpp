//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_COMMON_HTTP_HEADERS_HPP_INCLUDED
#define ZFSX_COMMON_HTTP_HEADERS_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace zfsx
{
namespace common
{
namespace http
{

/// Ordered list of HTTP header fields with case-insensitive name lookup.
///
class Headers final
{
public:
    using Field = std::pair<std::string, std::string>;

    static bool namesEqual(const std::string& lhs, const std::string& rhs) noexcept
    {
        return (lhs.size() == rhs.size()) &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](const unsigned char l, const unsigned char r) {
                   //
                   return std::tolower(l) == std::tolower(r);
               });
    }

    /// Whether the string can be sent as a field value as is (no control characters except HTAB).
    ///
    static bool isValidValue(const std::string& value) noexcept
    {
        return std::none_of(value.begin(), value.end(), [](const unsigned char ch) {
            //
            return ((ch < 0x20) && (ch != '\t')) || (ch == 0x7F);  // NOLINT(*-magic-numbers)
        });
    }

    /// Appends a field (even if a field with the same name exists).
    ///
    void add(std::string name, std::string value)
    {
        fields_.emplace_back(std::move(name), std::move(value));
    }

    /// Replaces value of the first field with the same name, or appends a new field.
    ///
    void set(const std::string& name, std::string value)
    {
        const auto it = findField(name);
        if (it != fields_.end())
        {
            it->second = std::move(value);
            return;
        }
        fields_.emplace_back(name, std::move(value));
    }

    /// Gets value of the first field with the given name (if any).
    ///
    cetl::optional<std::string> find(const std::string& name) const
    {
        const auto it = std::find_if(fields_.begin(), fields_.end(), [&name](const Field& field) {
            //
            return namesEqual(field.first, name);
        });
        if (it == fields_.end())
        {
            return cetl::nullopt;
        }
        return it->second;
    }

    bool contains(const std::string& name) const
    {
        return find(name).has_value();
    }

    std::size_t size() const noexcept
    {
        return fields_.size();
    }

    std::vector<Field>::const_iterator begin() const noexcept
    {
        return fields_.begin();
    }

    std::vector<Field>::const_iterator end() const noexcept
    {
        return fields_.end();
    }

private:
    std::vector<Field>::iterator findField(const std::string& name)
    {
        return std::find_if(fields_.begin(), fields_.end(), [&name](const Field& field) {
            //
            return namesEqual(field.first, name);
        });
    }

    std::vector<Field> fields_;

};  // Headers

}  // namespace http
}  // namespace common
}  // namespace zfsx

#endif  // ZFSX_COMMON_HTTP_HEADERS_HPP_INCLUDED
