#include "tangram/model/PieceId.h"
#include "tangram/utils/Log.h"

#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

namespace tangram {
namespace model {

PieceId::PieceId() : uuid_(boost::uuids::nil_uuid()) {}

PieceId PieceId::generate() {
    thread_local boost::uuids::random_generator generator;
    return PieceId(generator());
}

std::string PieceId::toString() const {
    return boost::uuids::to_string(uuid_);
}

std::optional<PieceId> PieceId::fromString(const std::string& text) {
    // string_generator also takes braced and dashless forms; only the
    // canonical 36-character layout is a valid persisted id
    if (text.size() != 36 || text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
        return std::nullopt;
    }

    try {
        boost::uuids::string_generator parse;
        return PieceId(parse(text));
    } catch (const std::runtime_error& e) {
        SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "PieceId: cannot parse '%s': %s", text.c_str(), e.what());
        return std::nullopt;
    }
}

}  // namespace model
}  // namespace tangram
