#pragma once

#include <boost/uuid/uuid.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace tangram {
namespace model {

/**
 * 128-bit random piece identifier (RFC 4122 version 4), backed by
 * boost::uuids::uuid.
 */
class PieceId {
public:
    PieceId();
    explicit PieceId(const boost::uuids::uuid& uuid) : uuid_(uuid) {}

    static PieceId generate();

    // Lowercase 8-4-4-4-12 form. Accepts upper case on input.
    std::string toString() const;
    static std::optional<PieceId> fromString(const std::string& text);

    bool isNil() const { return uuid_.is_nil(); }
    const boost::uuids::uuid& uuid() const { return uuid_; }

    bool operator==(const PieceId& other) const { return uuid_ == other.uuid_; }
    bool operator!=(const PieceId& other) const { return !(*this == other); }

private:
    boost::uuids::uuid uuid_;
};

}  // namespace model
}  // namespace tangram

namespace std {
    template<>
    struct hash<tangram::model::PieceId> {
        size_t operator()(const tangram::model::PieceId& id) const {
            return boost::uuids::hash_value(id.uuid());
        }
    };
}
