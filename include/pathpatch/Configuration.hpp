/**
 * @file Configuration.hpp
 * @brief Record <-> document codec used by the patch functions
 */

#ifndef PATHPATCH_CONFIGURATION_HPP
#define PATHPATCH_CONFIGURATION_HPP

#include "pathpatch/Value.hpp"
#include <functional>

namespace pathpatch {

/**
 * @brief Encoder/decoder pair for a record type
 *
 * The default configuration converts through nlohmann::json's ADL hooks,
 * i.e. the record type provides to_json() and from_json() in its own
 * namespace. Custom strategies (date formats, renamed fields, ...) are
 * supplied by replacing either function. Both functions report failure by
 * throwing; the patch functions turn that into encoding_failed or
 * decoding_failed.
 *
 * Example:
 * ```cpp
 * auto config = Configuration<User>::defaults();
 * config.decoder = [](const Value& v) { return parse_user_with_iso_dates(v); };
 * auto patched = patch(user, {{"last_login", "2024-01-01T12:34:56Z"}}, config);
 * ```
 */
template <typename Record>
struct Configuration {
    using Encoder = std::function<Value(const Record&)>;
    using Decoder = std::function<Record(const Value&)>;

    Encoder encoder = [](const Record& record) { return Value(record); };
    Decoder decoder = [](const Value& document) { return document.template get<Record>(); };

    /**
     * @brief Shared default configuration
     *
     * Immutable after first use; safe to share between threads.
     */
    static const Configuration& defaults() {
        static const Configuration instance;
        return instance;
    }
};

} // namespace pathpatch

#endif // PATHPATCH_CONFIGURATION_HPP
