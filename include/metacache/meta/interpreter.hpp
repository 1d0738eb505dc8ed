#ifndef METACACHE_META_INTERPRETER_HPP
#define METACACHE_META_INTERPRETER_HPP

#include <optional>

#include "metacache/meta/types.hpp"

namespace metacache::meta {

class ResponseInterpreter {
   public:
    // nullopt for the family's "success, no data" statuses, the first record
    // when one was returned. Throws ProtocolError otherwise (ConflictError
    // for EX on md).
    [[nodiscard]] static std::optional<MetaValue> interpret(CommandFamily family,
                                                            const MetaResponse& response);

    [[nodiscard]] static bool is_empty_success(CommandFamily family, Status status) noexcept;
};

}  // namespace metacache::meta

#endif
