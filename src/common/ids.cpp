#include "common/ids.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>

#include <stdexcept>

namespace tsync {

namespace {

constexpr std::string_view kUrnPrefix = "urn:uuid:";

} // namespace

std::optional<boost::uuids::uuid> parse_uuid(std::string_view text) {
    if (text.substr(0, kUrnPrefix.size()) == kUrnPrefix) {
        text.remove_prefix(kUrnPrefix.size());
    }
    try {
        return boost::uuids::string_generator{}(text.begin(), text.end());
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

VersionId new_version_id() {
    // random_generator draws from getrandom()/urandom; one per thread avoids
    // sharing its state between workers.
    thread_local boost::uuids::random_generator gen;
    return gen();
}

std::string to_bytes(const boost::uuids::uuid& id) {
    return std::string(reinterpret_cast<const char*>(id.data), id.size());
}

std::optional<boost::uuids::uuid> from_bytes(std::string_view bytes) {
    boost::uuids::uuid id{};
    if (bytes.size() != id.size()) {
        return std::nullopt;
    }
    std::copy(bytes.begin(), bytes.end(), reinterpret_cast<char*>(id.data));
    return id;
}

} // namespace tsync
