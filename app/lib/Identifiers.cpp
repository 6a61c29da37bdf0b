/*
 * Interned identifier pool
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Identifiers.hpp"

#include <mutex>
#include <unordered_set>

namespace {

struct InternPool {
    std::mutex mutex;
    // Node-based set: element addresses stay valid across rehashing.
    std::unordered_set<std::string> strings;
};

InternPool& pool()
{
    static InternPool instance;
    return instance;
}

} // namespace

InternedString::InternedString()
    : value_(intern(std::string()))
{}

InternedString::InternedString(const std::string& value)
    : value_(intern(value))
{}

InternedString::InternedString(const char* value)
    : value_(intern(value ? std::string(value) : std::string()))
{}

const std::string* InternedString::intern(const std::string& value)
{
    auto& p = pool();
    std::lock_guard<std::mutex> lock(p.mutex);
    return &*p.strings.insert(value).first;
}
