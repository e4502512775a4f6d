#include "errors.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

static std::string collision_message(const std::vector<std::string>& duplicates) {
    return fmt::format("Bad job config; duplicate names found: {}",
                       fmt::join(duplicates, ", "));
}

CollisionError::CollisionError(std::vector<std::string> duplicates)
    : MinsubError(collision_message(duplicates)), duplicates_(std::move(duplicates)) {}
