#pragma once

#include <cstdint>
#include <limits>

namespace sqlmemo {

// ============================================================================
// Statement Classification
// ============================================================================

enum class CommandType : uint8_t {
    UNKNOWN,
    SELECT,
    INSERT,
    UPDATE,
    DELETE,
    FLUSH
};

// How the statement is sent to the database. CALLABLE statements may
// return values through OUT / INOUT parameters.
enum class StatementType : uint8_t {
    STATEMENT,
    PREPARED,
    CALLABLE
};

enum class ParameterMode : uint8_t {
    IN,
    OUT,
    INOUT
};

// Lifetime of the session-local memo
enum class LocalCacheScope : uint8_t {
    SESSION,        // Kept until commit / rollback / close / write
    STATEMENT       // Dropped when the outermost query returns
};

// Shape a nested select result is converted to before being assigned
enum class TargetType : uint8_t {
    OBJECT,
    LIST
};

// Bitmask classification, one AND per membership test
namespace cmd_mask {
    inline constexpr uint8_t bit(CommandType t) noexcept {
        return static_cast<uint8_t>(1u << static_cast<int>(t));
    }
    inline constexpr uint8_t kWrite =
        bit(CommandType::INSERT) | bit(CommandType::UPDATE) | bit(CommandType::DELETE);
    [[nodiscard]] inline constexpr bool test(CommandType t, uint8_t mask) noexcept {
        return (mask & bit(t)) != 0;
    }
}

[[nodiscard]] inline const char* command_type_to_string(CommandType t) {
    switch (t) {
        case CommandType::SELECT: return "SELECT";
        case CommandType::INSERT: return "INSERT";
        case CommandType::UPDATE: return "UPDATE";
        case CommandType::DELETE: return "DELETE";
        case CommandType::FLUSH:  return "FLUSH";
        default:                  return "UNKNOWN";
    }
}

[[nodiscard]] inline const char* local_cache_scope_to_string(LocalCacheScope s) {
    return s == LocalCacheScope::STATEMENT ? "statement" : "session";
}

// ============================================================================
// Row Bounds (in-memory pagination)
// ============================================================================

struct RowBounds {
    static constexpr int64_t NO_ROW_OFFSET = 0;
    static constexpr int64_t NO_ROW_LIMIT = std::numeric_limits<int32_t>::max();

    int64_t offset = NO_ROW_OFFSET;
    int64_t limit = NO_ROW_LIMIT;

    [[nodiscard]] bool is_default() const {
        return offset == NO_ROW_OFFSET && limit == NO_ROW_LIMIT;
    }
};

} // namespace sqlmemo
