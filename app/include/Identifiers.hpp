/*
 * Interned identifier types for models and providers
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef IDENTIFIERS_HPP
#define IDENTIFIERS_HPP

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>

/**
 * Immutable string stored once in a process-wide pool.
 *
 * Copies are a single pointer copy. Two interned strings with the same
 * text always share the same storage, so equality is a pointer compare.
 */
class InternedString {
public:
    InternedString();
    InternedString(const std::string& value);   // NOLINT(google-explicit-constructor)
    InternedString(const char* value);          // NOLINT(google-explicit-constructor)

    const std::string& str() const { return *value_; }
    const char* c_str() const { return value_->c_str(); }
    bool empty() const { return value_->empty(); }

    friend bool operator==(const InternedString& a, const InternedString& b) { return a.value_ == b.value_; }
    friend bool operator!=(const InternedString& a, const InternedString& b) { return a.value_ != b.value_; }
    friend bool operator<(const InternedString& a, const InternedString& b) { return *a.value_ < *b.value_; }

private:
    static const std::string* intern(const std::string& value);

    const std::string* value_;
};

/**
 * Strongly typed wrapper so a model id can't be passed where a provider id is expected
 */
template <typename Tag>
class TypedId {
public:
    TypedId() = default;
    explicit TypedId(InternedString value) : value_(std::move(value)) {}
    explicit TypedId(const std::string& value) : value_(value) {}
    explicit TypedId(const char* value) : value_(value) {}

    const std::string& str() const { return value_.str(); }
    bool empty() const { return value_.empty(); }

    friend bool operator==(const TypedId& a, const TypedId& b) { return a.value_ == b.value_; }
    friend bool operator!=(const TypedId& a, const TypedId& b) { return a.value_ != b.value_; }
    friend bool operator<(const TypedId& a, const TypedId& b) { return a.value_ < b.value_; }
    friend bool operator>(const TypedId& a, const TypedId& b) { return b.value_ < a.value_; }

    friend std::ostream& operator<<(std::ostream& os, const TypedId& id) { return os << id.str(); }

private:
    InternedString value_;
};

struct ModelIdTag {};
struct ModelNameTag {};
struct ProviderIdTag {};
struct ProviderNameTag {};

using ModelId = TypedId<ModelIdTag>;
using ModelName = TypedId<ModelNameTag>;
using ProviderId = TypedId<ProviderIdTag>;
using ProviderName = TypedId<ProviderNameTag>;

namespace std {

template <typename Tag>
struct hash<TypedId<Tag>> {
    size_t operator()(const TypedId<Tag>& id) const noexcept
    {
        return hash<string>()(id.str());
    }
};

} // namespace std

#endif // IDENTIFIERS_HPP
