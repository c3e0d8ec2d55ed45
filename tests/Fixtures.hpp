/**
 * @file Fixtures.hpp
 * @brief Typed records shared by the patch tests
 */

#ifndef PATHPATCH_TESTS_FIXTURES_HPP
#define PATHPATCH_TESTS_FIXTURES_HPP

#include "pathpatch/Value.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fixtures {

using pathpatch::Value;

struct Address {
    std::string street;
    std::string city;
};

struct Profile {
    int age = 0;
    std::optional<Address> address;
};

struct User {
    int id = 0;
    std::string name;
    Profile profile;
    std::vector<std::string> tags;
    std::optional<std::map<std::string, std::string>> metadata;
    std::optional<std::int64_t> last_login;  ///< Seconds since the epoch
    std::optional<std::string> website;
};

inline bool operator==(const Address& a, const Address& b) {
    return a.street == b.street && a.city == b.city;
}

inline bool operator==(const Profile& a, const Profile& b) {
    return a.age == b.age && a.address == b.address;
}

inline bool operator==(const User& a, const User& b) {
    return a.id == b.id && a.name == b.name && a.profile == b.profile &&
           a.tags == b.tags && a.metadata == b.metadata &&
           a.last_login == b.last_login && a.website == b.website;
}

// ============================================================================
// nlohmann::json codec
// ============================================================================

template <typename T>
Value optional_to_json(const std::optional<T>& opt) {
    return opt ? Value(*opt) : Value(nullptr);
}

template <typename T>
void optional_from_json(const Value& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
    } else {
        out = it->template get<T>();
    }
}

inline void to_json(Value& j, const Address& a) {
    j = Value{{"street", a.street}, {"city", a.city}};
}

inline void from_json(const Value& j, Address& a) {
    j.at("street").get_to(a.street);
    j.at("city").get_to(a.city);
}

inline void to_json(Value& j, const Profile& p) {
    j = Value{{"age", p.age}, {"address", optional_to_json(p.address)}};
}

inline void from_json(const Value& j, Profile& p) {
    j.at("age").get_to(p.age);
    optional_from_json(j, "address", p.address);
}

inline void to_json(Value& j, const User& u) {
    j = Value{
        {"id", u.id},
        {"name", u.name},
        {"profile", u.profile},
        {"tags", u.tags},
        {"metadata", optional_to_json(u.metadata)},
        {"last_login", optional_to_json(u.last_login)},
        {"website", optional_to_json(u.website)}
    };
}

inline void from_json(const Value& j, User& u) {
    j.at("id").get_to(u.id);
    j.at("name").get_to(u.name);
    j.at("profile").get_to(u.profile);
    j.at("tags").get_to(u.tags);
    optional_from_json(j, "metadata", u.metadata);
    optional_from_json(j, "last_login", u.last_login);
    optional_from_json(j, "website", u.website);
}

// ============================================================================
// Fixture values
// ============================================================================

/// 2023-11-14T22:13:20Z
constexpr std::int64_t kLastLogin = 1700000000;

inline User user() {
    User u;
    u.id = 42;
    u.name = "Taylor";
    u.profile.age = 34;
    u.profile.address = Address{"1 Infinite Loop", "Cupertino"};
    u.tags = {"swift", "ios"};
    u.metadata = std::map<std::string, std::string>{{"role", "admin"}};
    u.last_login = kLastLogin;
    u.website = "https://example.com";
    return u;
}

} // namespace fixtures

#endif // PATHPATCH_TESTS_FIXTURES_HPP
